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

#ifndef __PLISTTREE_DICTIONARY_H__
#define __PLISTTREE_DICTIONARY_H__

#include <boost/container/vector.hpp>
#include <boost/optional.hpp>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "PlistTreeItem.hpp"
#include "PlistTreeValue.hpp"

namespace PlistTree {

// Unique string keys in insertion order. Re-inserting a key replaces its
// value where it stands.
class Dictionary {
 public:
  typedef std::pair<std::string, Value> entry_type;
  typedef boost::container::vector<entry_type> storage_type;

  class const_iterator;

  // Yields the key read-only and the value by reference. Editing a value
  // keeps the iterator valid; inserting or removing a key does not.
  class iterator {
   public:
    // the reference is a proxy pair
    typedef std::input_iterator_tag iterator_category;
    typedef entry_type value_type;
    typedef std::ptrdiff_t difference_type;
    typedef std::pair<const std::string&, Value&> reference;

    class pointer {
     public:
      explicit pointer(const reference& entry) : _entry(entry) {}
      const reference* operator->() const { return &_entry; }

     private:
      reference _entry;
    };

    iterator() {}

    reference operator*() const;
    pointer operator->() const { return pointer(**this); }
    iterator& operator++();
    iterator operator++(int);

    bool operator==(const iterator& rhs) const { return _it == rhs._it; }
    bool operator!=(const iterator& rhs) const { return _it != rhs._it; }

   private:
    friend class Dictionary;
    friend class const_iterator;
    iterator(storage_type::iterator it, const Borrow& borrow)
        : _it(it), _borrow(borrow) {}

    storage_type::iterator _it;
    Borrow _borrow;
  };

  class const_iterator {
   public:
    typedef std::forward_iterator_tag iterator_category;
    typedef entry_type value_type;
    typedef std::ptrdiff_t difference_type;
    typedef const entry_type* pointer;
    typedef const entry_type& reference;

    const_iterator() {}
    const_iterator(const iterator& it) : _it(it._it), _borrow(it._borrow) {}

    reference operator*() const;
    pointer operator->() const { return &**this; }
    const_iterator& operator++();
    const_iterator operator++(int);

    bool operator==(const const_iterator& rhs) const { return _it == rhs._it; }
    bool operator!=(const const_iterator& rhs) const { return _it != rhs._it; }

   private:
    friend class Dictionary;
    const_iterator(storage_type::const_iterator it, const Borrow& borrow)
        : _it(it), _borrow(borrow) {}

    storage_type::const_iterator _it;
    Borrow _borrow;
  };

  Dictionary();
  Dictionary(std::initializer_list<entry_type> entries);
  Dictionary(const Dictionary& other);
  Dictionary(Dictionary&& other);
  Dictionary& operator=(const Dictionary& other);
  Dictionary& operator=(Dictionary&& other);
  ~Dictionary();

  std::size_t size() const { return _entries.size(); }
  bool empty() const { return _entries.empty(); }
  bool containsKey(const std::string& key) const {
    return _index.find(key) != _index.end();
  }

  boost::optional<Item> get(const std::string& key) const;
  boost::optional<ItemMut> getMut(const std::string& key);

  // Returns the replaced value when the key was already present.
  boost::optional<Value> insert(const std::string& key, Value value);

  boost::optional<Value> remove(const std::string& key);

  // Copies every pair of other into this dictionary, replacing values of
  // keys present in both.
  void merge(const Dictionary& other);

  void clear();

  std::vector<std::string> keys() const;

  // Deep copies of every entry, in order.
  std::vector<entry_type> toVector() const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;

  Dictionary clone() const { return Dictionary(*this); }

  data_type toBinary() const;
  std::string toXML() const;

  // Order of entries does not matter.
  bool operator==(const Dictionary& rhs) const;
  bool operator!=(const Dictionary& rhs) const { return !(*this == rhs); }

 private:
  friend class Value;

  void reindexFrom(std::size_t position);
  // Moves every non-empty container value into pending.
  void releaseNested(std::vector<Value>& pending);

  storage_type _entries;
  // key -> position in _entries
  std::map<std::string, std::size_t> _index;
  BorrowTracker _tracker;
};
}

#endif
