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

#include "PlistTreeArray.hpp"

#include <sstream>
#include <utility>

#include "PlistTree.hpp"

namespace PlistTree {

static void checkIndex(std::size_t index, std::size_t limit, const char* op) {
  if (index >= limit) {
    std::stringstream ss;
    ss << "Plist: array " << op << " index " << index << " out of bounds";
    throw BoundsError(ss.str());
  }
}

Array::iterator::reference Array::iterator::operator*() const {
  _borrow.check();
  return *_it;
}

Array::iterator& Array::iterator::operator++() {
  _borrow.check();
  ++_it;
  return *this;
}

Array::iterator Array::iterator::operator++(int) {
  iterator previous(*this);
  ++*this;
  return previous;
}

Array::const_iterator::reference Array::const_iterator::operator*() const {
  _borrow.check();
  return *_it;
}

Array::const_iterator& Array::const_iterator::operator++() {
  _borrow.check();
  ++_it;
  return *this;
}

Array::const_iterator Array::const_iterator::operator++(int) {
  const_iterator previous(*this);
  ++*this;
  return previous;
}

Array::Array() {}

Array::Array(std::initializer_list<Value> values)
    : _values(values.begin(), values.end()) {}

Array::Array(const Array& other) : _values(other._values) {}

Array::Array(Array&& other)
    : _values(std::move(other._values)), _tracker(std::move(other._tracker)) {}

Array& Array::operator=(const Array& other) {
  if (this != &other) {
    storage_type values(other._values);
    _values.swap(values);
    _tracker.invalidate();
  }
  return *this;
}

Array& Array::operator=(Array&& other) {
  if (this != &other) {
    _values = std::move(other._values);
    _tracker = std::move(other._tracker);
  }
  return *this;
}

// Nested containers are unlinked and destroyed one level at a time, so a
// deep tree does not recurse.
Array::~Array() {
  std::vector<Value> pending;
  releaseNested(pending);
  Value::releaseAll(pending);
}

void Array::releaseNested(std::vector<Value>& pending) {
  for (storage_type::iterator it = _values.begin(); it != _values.end(); ++it) {
    const Array* array = it->asArray();
    const Dictionary* dictionary = it->asDictionary();
    if ((array && !array->empty()) || (dictionary && !dictionary->empty()))
      pending.push_back(std::move(*it));
  }
}

boost::optional<Item> Array::get(std::size_t index) const {
  if (index >= _values.size())
    return boost::none;
  return Item(&_values[index], _tracker.borrow());
}

boost::optional<ItemMut> Array::getMut(std::size_t index) {
  if (index >= _values.size())
    return boost::none;
  return ItemMut(&_values[index], _tracker.borrow());
}

void Array::append(Value value) {
  _values.push_back(std::move(value));
  _tracker.invalidate();
}

void Array::insert(std::size_t index, Value value) {
  checkIndex(index, _values.size() + 1, "insert");
  _values.insert(_values.begin() + index, std::move(value));
  _tracker.invalidate();
}

Value Array::remove(std::size_t index) {
  checkIndex(index, _values.size(), "remove");
  Value removed(std::move(_values[index]));
  _values.erase(_values.begin() + index);
  _tracker.invalidate();
  return removed;
}

Value Array::set(std::size_t index, Value value) {
  checkIndex(index, _values.size(), "set");
  Value previous(std::move(_values[index]));
  _values[index] = std::move(value);
  _tracker.invalidate();
  return previous;
}

void Array::clear() {
  _values.clear();
  _tracker.invalidate();
}

Array::iterator Array::begin() {
  return iterator(_values.begin(), _tracker.borrow());
}

Array::iterator Array::end() {
  return iterator(_values.end(), _tracker.borrow());
}

Array::const_iterator Array::begin() const {
  return const_iterator(_values.begin(), _tracker.borrow());
}

Array::const_iterator Array::end() const {
  return const_iterator(_values.end(), _tracker.borrow());
}

std::vector<Value> Array::toVector() const {
  return std::vector<Value>(_values.begin(), _values.end());
}

data_type Array::toBinary() const {
  return encodeBinary(*this);
}

std::string Array::toXML() const {
  return encodeXML(*this);
}

bool Array::operator==(const Array& rhs) const {
  if (_values.size() != rhs._values.size())
    return false;
  Value::pair_stack pending;
  for (std::size_t i = 0; i < _values.size(); ++i)
    pending.push_back(std::make_pair(&_values[i], &rhs._values[i]));
  return Value::equalTrees(pending);
}

} // namespace PlistTree
