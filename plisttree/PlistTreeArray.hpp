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

#ifndef __PLISTTREE_ARRAY_H__
#define __PLISTTREE_ARRAY_H__

#include <boost/container/vector.hpp>
#include <boost/optional.hpp>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

#include "PlistTreeItem.hpp"
#include "PlistTreeValue.hpp"

namespace PlistTree {

class Array {
 public:
  typedef boost::container::vector<Value> storage_type;

  class const_iterator;

  // Forward iterators that fail with BoundsError once the array has been
  // structurally modified. Assigning to an element through an iterator is
  // not a structural modification.
  class iterator {
   public:
    typedef std::forward_iterator_tag iterator_category;
    typedef Value value_type;
    typedef std::ptrdiff_t difference_type;
    typedef Value* pointer;
    typedef Value& reference;

    iterator() {}

    reference operator*() const;
    pointer operator->() const { return &**this; }
    iterator& operator++();
    iterator operator++(int);

    bool operator==(const iterator& rhs) const { return _it == rhs._it; }
    bool operator!=(const iterator& rhs) const { return _it != rhs._it; }

   private:
    friend class Array;
    friend class const_iterator;
    iterator(storage_type::iterator it, const Borrow& borrow)
        : _it(it), _borrow(borrow) {}

    storage_type::iterator _it;
    Borrow _borrow;
  };

  class const_iterator {
   public:
    typedef std::forward_iterator_tag iterator_category;
    typedef Value value_type;
    typedef std::ptrdiff_t difference_type;
    typedef const Value* pointer;
    typedef const Value& reference;

    const_iterator() {}
    const_iterator(const iterator& it) : _it(it._it), _borrow(it._borrow) {}

    reference operator*() const;
    pointer operator->() const { return &**this; }
    const_iterator& operator++();
    const_iterator operator++(int);

    bool operator==(const const_iterator& rhs) const { return _it == rhs._it; }
    bool operator!=(const const_iterator& rhs) const { return _it != rhs._it; }

   private:
    friend class Array;
    const_iterator(storage_type::const_iterator it, const Borrow& borrow)
        : _it(it), _borrow(borrow) {}

    storage_type::const_iterator _it;
    Borrow _borrow;
  };

  Array();
  Array(std::initializer_list<Value> values);
  Array(const Array& other);
  Array(Array&& other);
  Array& operator=(const Array& other);
  Array& operator=(Array&& other);
  ~Array();

  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  // none when index >= size()
  boost::optional<Item> get(std::size_t index) const;
  boost::optional<ItemMut> getMut(std::size_t index);

  void append(Value value);

  // BoundsError when index > size()
  void insert(std::size_t index, Value value);

  // BoundsError when index >= size(). Later elements shift down by one.
  Value remove(std::size_t index);

  // Replaces an element and returns the previous one. BoundsError when
  // index >= size().
  Value set(std::size_t index, Value value);

  void clear();

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;

  // Deep copies of every element.
  std::vector<Value> toVector() const;

  Array clone() const { return Array(*this); }

  data_type toBinary() const;
  std::string toXML() const;

  bool operator==(const Array& rhs) const;
  bool operator!=(const Array& rhs) const { return !(*this == rhs); }

 private:
  friend class Value;

  // Moves every non-empty container element into pending.
  void releaseNested(std::vector<Value>& pending);

  storage_type _values;
  BorrowTracker _tracker;
};
}

#endif
