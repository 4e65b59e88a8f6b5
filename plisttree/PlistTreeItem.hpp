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

#ifndef __PLISTTREE_ITEM_H__
#define __PLISTTREE_ITEM_H__

#include <boost/cstdint.hpp>

#include <memory>

namespace PlistTree {

class Value;

// A snapshot of a container's generation. Stale once the container is
// structurally mutated or destroyed.
class Borrow {
 public:
  Borrow() : _snapshot(0) {}

  bool isValid() const;

  // Throws BoundsError when stale.
  void check() const;

 private:
  friend class BorrowTracker;
  Borrow(const std::shared_ptr<uint64_t>& generation)
      : _generation(generation), _snapshot(*generation) {}

  std::weak_ptr<uint64_t> _generation;
  uint64_t _snapshot;
};

// Owned by each container. Copies get their own counter, moves carry the
// counter along with the elements they own.
class BorrowTracker {
 public:
  BorrowTracker();
  BorrowTracker(const BorrowTracker& other);
  BorrowTracker(BorrowTracker&& other);
  BorrowTracker& operator=(const BorrowTracker& other);
  BorrowTracker& operator=(BorrowTracker&& other);

  // Call on every structural mutation.
  void invalidate() { ++*_generation; }

  Borrow borrow() const { return Borrow(_generation); }

 private:
  std::shared_ptr<uint64_t> _generation;
};

// Read-only handle to a container element.
class Item {
 public:
  const Value& value() const;
  const Value& operator*() const { return value(); }
  const Value* operator->() const { return &value(); }

  bool isValid() const { return _borrow.isValid(); }

  // Detaches a deep copy that outlives the container.
  Value clone() const;

 private:
  friend class Array;
  friend class Dictionary;
  Item(const Value* value, const Borrow& borrow)
      : _value(value), _borrow(borrow) {}

  const Value* _value;
  Borrow _borrow;
};

// Mutable handle to a container element. Assigning through it replaces the
// element in place; the container's other handles stay valid unless the
// replaced element was itself a container they pointed into.
class ItemMut {
 public:
  Value& value() const;
  Value& operator*() const { return value(); }
  Value* operator->() const { return &value(); }

  bool isValid() const { return _borrow.isValid(); }

  Value clone() const;

 private:
  friend class Array;
  friend class Dictionary;
  ItemMut(Value* value, const Borrow& borrow)
      : _value(value), _borrow(borrow) {}

  Value* _value;
  Borrow _borrow;
};
}

#endif
