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

#include "PlistTreeDictionary.hpp"

#include <utility>

#include "PlistTree.hpp"

namespace PlistTree {

Dictionary::iterator::reference Dictionary::iterator::operator*() const {
  _borrow.check();
  return reference(_it->first, _it->second);
}

Dictionary::iterator& Dictionary::iterator::operator++() {
  _borrow.check();
  ++_it;
  return *this;
}

Dictionary::iterator Dictionary::iterator::operator++(int) {
  iterator previous(*this);
  ++*this;
  return previous;
}

Dictionary::const_iterator::reference Dictionary::const_iterator::operator*()
    const {
  _borrow.check();
  return *_it;
}

Dictionary::const_iterator& Dictionary::const_iterator::operator++() {
  _borrow.check();
  ++_it;
  return *this;
}

Dictionary::const_iterator Dictionary::const_iterator::operator++(int) {
  const_iterator previous(*this);
  ++*this;
  return previous;
}

Dictionary::Dictionary() {}

Dictionary::Dictionary(std::initializer_list<entry_type> entries) {
  for (std::initializer_list<entry_type>::const_iterator it = entries.begin();
       it != entries.end();
       ++it)
    insert(it->first, it->second);
}

Dictionary::Dictionary(const Dictionary& other)
    : _entries(other._entries), _index(other._index) {}

Dictionary::Dictionary(Dictionary&& other)
    : _entries(std::move(other._entries)),
      _index(std::move(other._index)),
      _tracker(std::move(other._tracker)) {
  other._index.clear();
}

Dictionary& Dictionary::operator=(const Dictionary& other) {
  if (this != &other) {
    storage_type entries(other._entries);
    std::map<std::string, std::size_t> index(other._index);
    _entries.swap(entries);
    _index.swap(index);
    _tracker.invalidate();
  }
  return *this;
}

Dictionary& Dictionary::operator=(Dictionary&& other) {
  if (this != &other) {
    _entries = std::move(other._entries);
    _index = std::move(other._index);
    _tracker = std::move(other._tracker);
    other._index.clear();
  }
  return *this;
}

Dictionary::~Dictionary() {
  std::vector<Value> pending;
  releaseNested(pending);
  Value::releaseAll(pending);
}

boost::optional<Item> Dictionary::get(const std::string& key) const {
  std::map<std::string, std::size_t>::const_iterator found = _index.find(key);
  if (found == _index.end())
    return boost::none;
  return Item(&_entries[found->second].second, _tracker.borrow());
}

boost::optional<ItemMut> Dictionary::getMut(const std::string& key) {
  std::map<std::string, std::size_t>::const_iterator found = _index.find(key);
  if (found == _index.end())
    return boost::none;
  return ItemMut(&_entries[found->second].second, _tracker.borrow());
}

boost::optional<Value> Dictionary::insert(const std::string& key,
                                          Value value) {
  std::map<std::string, std::size_t>::const_iterator found = _index.find(key);
  if (found != _index.end()) {
    Value& slot = _entries[found->second].second;
    boost::optional<Value> previous(std::move(slot));
    slot = std::move(value);
    _tracker.invalidate();
    return previous;
  }

  _entries.push_back(entry_type(key, std::move(value)));
  try {
    _index[key] = _entries.size() - 1;
  } catch (...) {
    _entries.pop_back();
    throw;
  }
  _tracker.invalidate();
  return boost::none;
}

boost::optional<Value> Dictionary::remove(const std::string& key) {
  std::map<std::string, std::size_t>::iterator found = _index.find(key);
  if (found == _index.end())
    return boost::none;

  std::size_t position = found->second;
  boost::optional<Value> removed(std::move(_entries[position].second));
  _entries.erase(_entries.begin() + position);
  _index.erase(found);
  reindexFrom(position);
  _tracker.invalidate();
  return removed;
}

void Dictionary::merge(const Dictionary& other) {
  if (this == &other)
    return;
  Dictionary merged(*this);
  for (storage_type::const_iterator it = other._entries.begin();
       it != other._entries.end();
       ++it)
    merged.insert(it->first, it->second);
  _entries.swap(merged._entries);
  _index.swap(merged._index);
  _tracker.invalidate();
}

void Dictionary::clear() {
  _entries.clear();
  _index.clear();
  _tracker.invalidate();
}

std::vector<std::string> Dictionary::keys() const {
  std::vector<std::string> result;
  result.reserve(_entries.size());
  for (storage_type::const_iterator it = _entries.begin(); it != _entries.end();
       ++it)
    result.push_back(it->first);
  return result;
}

std::vector<Dictionary::entry_type> Dictionary::toVector() const {
  return std::vector<entry_type>(_entries.begin(), _entries.end());
}

Dictionary::iterator Dictionary::begin() {
  return iterator(_entries.begin(), _tracker.borrow());
}

Dictionary::iterator Dictionary::end() {
  return iterator(_entries.end(), _tracker.borrow());
}

Dictionary::const_iterator Dictionary::begin() const {
  return const_iterator(_entries.begin(), _tracker.borrow());
}

Dictionary::const_iterator Dictionary::end() const {
  return const_iterator(_entries.end(), _tracker.borrow());
}

data_type Dictionary::toBinary() const {
  return encodeBinary(*this);
}

std::string Dictionary::toXML() const {
  return encodeXML(*this);
}

bool Dictionary::operator==(const Dictionary& rhs) const {
  if (_entries.size() != rhs._entries.size())
    return false;
  Value::pair_stack pending;
  for (storage_type::const_iterator it = _entries.begin(); it != _entries.end();
       ++it) {
    std::map<std::string, std::size_t>::const_iterator found =
        rhs._index.find(it->first);
    if (found == rhs._index.end())
      return false;
    pending.push_back(
        std::make_pair(&it->second, &rhs._entries[found->second].second));
  }
  return Value::equalTrees(pending);
}

void Dictionary::reindexFrom(std::size_t position) {
  for (std::size_t i = position; i < _entries.size(); ++i)
    _index[_entries[i].first] = i;
}

void Dictionary::releaseNested(std::vector<Value>& pending) {
  for (storage_type::iterator it = _entries.begin(); it != _entries.end();
       ++it) {
    const Array* array = it->second.asArray();
    const Dictionary* dictionary = it->second.asDictionary();
    if ((array && !array->empty()) || (dictionary && !dictionary->empty()))
      pending.push_back(std::move(it->second));
  }
}

} // namespace PlistTree
