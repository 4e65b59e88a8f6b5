//
//   PlistTree Property List (plist) data model and serialization library.
//
//   Copyright (c) 2011 Animetrics Inc. (marc@animetrics.com)
//   
//   Permission is hereby granted, free of charge, to any person obtaining a copy
//   of this software and associated documentation files (the "Software"), to deal
//   in the Software without restriction, including without limitation the rights
//   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
//   copies of the Software, and to permit persons to whom the Software is
//   furnished to do so, subject to the following conditions:
//   
//   The above copyright notice and this permission notice shall be included in
//   all copies or substantial portions of the Software.
//   
//   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
//   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
//   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
//   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
//   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
//   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
//   THE SOFTWARE.

#include "PlistTreeItem.hpp"

#include "PlistTreeError.hpp"
#include "PlistTreeValue.hpp"

namespace PlistTree {

bool Borrow::isValid() const {
  std::shared_ptr<uint64_t> generation = _generation.lock();
  return generation && *generation == _snapshot;
}

void Borrow::check() const {
  std::shared_ptr<uint64_t> generation = _generation.lock();
  if (!generation)
    throw BoundsError("Plist: borrowed element outlived its container");
  if (*generation != _snapshot)
    throw BoundsError(
        "Plist: borrowed element used after its container was modified");
}

BorrowTracker::BorrowTracker() : _generation(std::make_shared<uint64_t>(0)) {}

BorrowTracker::BorrowTracker(const BorrowTracker&)
    : _generation(std::make_shared<uint64_t>(0)) {}

BorrowTracker::BorrowTracker(BorrowTracker&& other)
    : _generation(std::move(other._generation)) {
  other._generation = std::make_shared<uint64_t>(0);
}

BorrowTracker& BorrowTracker::operator=(const BorrowTracker&) {
  // the owner's elements are being replaced by copies
  invalidate();
  return *this;
}

BorrowTracker& BorrowTracker::operator=(BorrowTracker&& other) {
  if (this != &other) {
    _generation = std::move(other._generation);
    other._generation = std::make_shared<uint64_t>(0);
  }
  return *this;
}

const Value& Item::value() const {
  _borrow.check();
  return *_value;
}

Value Item::clone() const {
  return value().clone();
}

Value& ItemMut::value() const {
  _borrow.check();
  return *_value;
}

Value ItemMut::clone() const {
  return value().clone();
}

} // namespace PlistTree
