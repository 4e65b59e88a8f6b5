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

#ifndef __PLISTTREE_BUILD_H__
#define __PLISTTREE_BUILD_H__

#include <string>
#include <type_traits>
#include <utility>

#include "PlistTreeArray.hpp"
#include "PlistTreeDictionary.hpp"
#include "PlistTreeValue.hpp"

namespace PlistTree {

namespace detail {

inline void appendAll(Array&) {}

template <typename T, typename... Rest>
void appendAll(Array& array, T&& first, Rest&&... rest) {
  static_assert(std::is_constructible<Value, T&&>::value,
                "makeArray: argument type has no plist value conversion");
  array.append(Value(std::forward<T>(first)));
  appendAll(array, std::forward<Rest>(rest)...);
}

inline void insertAll(Dictionary&) {}

template <typename K, typename V, typename... Rest>
void insertAll(Dictionary& dictionary, K&& key, V&& value, Rest&&... rest) {
  static_assert(std::is_convertible<K&&, std::string>::value,
                "makeDictionary: keys must be strings");
  static_assert(std::is_constructible<Value, V&&>::value,
                "makeDictionary: value type has no plist value conversion");
  dictionary.insert(std::string(std::forward<K>(key)),
                    Value(std::forward<V>(value)));
  insertAll(dictionary, std::forward<Rest>(rest)...);
}
}

// makeArray(1, "two", 3.0, makeDictionary("k", true))
template <typename... Args>
Array makeArray(Args&&... args) {
  Array array;
  detail::appendAll(array, std::forward<Args>(args)...);
  return array;
}

// makeDictionary("key", value, "other key", otherValue, ...). A repeated
// key keeps its first position and its last value.
template <typename... Args>
Dictionary makeDictionary(Args&&... args) {
  static_assert(sizeof...(Args) % 2 == 0,
                "makeDictionary: expects key, value pairs");
  Dictionary dictionary;
  detail::insertAll(dictionary, std::forward<Args>(args)...);
  return dictionary;
}
}

#endif
