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

#include "PlistTreeValue.hpp"

#include <map>
#include <sstream>
#include <utility>

#include "PlistTree.hpp"

namespace PlistTree {

namespace {

struct KindVisitor : public boost::static_visitor<Kind> {
  Kind operator()(const Null&) const { return Kind::Null; }
  Kind operator()(bool) const { return Kind::Boolean; }
  Kind operator()(const Integer&) const { return Kind::Integer; }
  Kind operator()(double) const { return Kind::Real; }
  Kind operator()(const std::string&) const { return Kind::String; }
  Kind operator()(const data_type&) const { return Kind::Data; }
  Kind operator()(const Date&) const { return Kind::Date; }
  Kind operator()(const Uid&) const { return Kind::Uid; }
  Kind operator()(const Array&) const { return Kind::Array; }
  Kind operator()(const Dictionary&) const { return Kind::Dictionary; }
};

template <typename T>
boost::optional<T> takePayload(Value::storage_type& storage) {
  T* payload = boost::get<T>(&storage);
  if (!payload)
    return boost::none;
  boost::optional<T> result(std::move(*payload));
  storage = Null();
  return result;
}
}

Value::Value() : _storage(Null()) {}

Value::Value(bool value) : _storage(value) {}

Value::Value(double value) : _storage(value) {}

Value::Value(const char* value) : _storage(std::string(value ? value : "")) {}

Value::Value(char* value) : _storage(std::string(value ? value : "")) {}

Value::Value(const std::string& value) : _storage(value) {}

Value::Value(std::string&& value) : _storage(std::move(value)) {}

Value::Value(const data_type& value) : _storage(value) {}

Value::Value(data_type&& value) : _storage(std::move(value)) {}

Value::Value(const Integer& value) : _storage(value) {}

Value::Value(const Date& value) : _storage(value) {}

Value::Value(const std::chrono::system_clock::time_point& value)
    : _storage(Date(value)) {}

Value::Value(const Uid& value) : _storage(value) {}

Value::Value(const Array& value) : _storage(value) {}

Value::Value(Array&& value) : _storage(std::move(value)) {}

Value::Value(const Dictionary& value) : _storage(value) {}

Value::Value(Dictionary&& value) : _storage(std::move(value)) {}

Value::Value(const Value& other) : _storage(other._storage) {}

Value::Value(Value&& other) : _storage(std::move(other._storage)) {}

Value& Value::operator=(const Value& other) {
  if (this != &other) {
    // copy first, so that assigning a descendant of this value works
    storage_type copy(other._storage);
    _storage = std::move(copy);
  }
  return *this;
}

Value& Value::operator=(Value&& other) {
  if (this != &other) {
    storage_type moved(std::move(other._storage));
    _storage = std::move(moved);
  }
  return *this;
}

Value::~Value() {}

const char* kindName(Kind kind) {
  switch (kind) {
  case Kind::Null:
    return "Null";
  case Kind::Boolean:
    return "Boolean";
  case Kind::Integer:
    return "Integer";
  case Kind::Real:
    return "Real";
  case Kind::String:
    return "String";
  case Kind::Data:
    return "Data";
  case Kind::Date:
    return "Date";
  case Kind::Uid:
    return "Uid";
  case Kind::Array:
    return "Array";
  case Kind::Dictionary:
    return "Dictionary";
  }
  return "Unknown";
}

std::string Integer::toString() const {
  std::stringstream ss;
  if (_unsigned)
    ss << _bits;
  else
    ss << signedValue();
  return ss.str();
}

Kind Value::kind() const {
  return boost::apply_visitor(KindVisitor(), _storage);
}

const bool* Value::asBoolean() const {
  return boost::get<bool>(&_storage);
}

bool* Value::asBoolean() {
  return boost::get<bool>(&_storage);
}

const Integer* Value::asInteger() const {
  return boost::get<Integer>(&_storage);
}

Integer* Value::asInteger() {
  return boost::get<Integer>(&_storage);
}

const double* Value::asReal() const {
  return boost::get<double>(&_storage);
}

double* Value::asReal() {
  return boost::get<double>(&_storage);
}

const std::string* Value::asString() const {
  return boost::get<std::string>(&_storage);
}

std::string* Value::asString() {
  return boost::get<std::string>(&_storage);
}

const data_type* Value::asData() const {
  return boost::get<data_type>(&_storage);
}

data_type* Value::asData() {
  return boost::get<data_type>(&_storage);
}

const Date* Value::asDate() const {
  return boost::get<Date>(&_storage);
}

Date* Value::asDate() {
  return boost::get<Date>(&_storage);
}

const Uid* Value::asUid() const {
  return boost::get<Uid>(&_storage);
}

Uid* Value::asUid() {
  return boost::get<Uid>(&_storage);
}

const Array* Value::asArray() const {
  return boost::get<Array>(&_storage);
}

Array* Value::asArray() {
  return boost::get<Array>(&_storage);
}

const Dictionary* Value::asDictionary() const {
  return boost::get<Dictionary>(&_storage);
}

Dictionary* Value::asDictionary() {
  return boost::get<Dictionary>(&_storage);
}

boost::optional<bool> Value::intoBoolean() {
  return takePayload<bool>(_storage);
}

boost::optional<Integer> Value::intoInteger() {
  return takePayload<Integer>(_storage);
}

boost::optional<double> Value::intoReal() {
  return takePayload<double>(_storage);
}

boost::optional<std::string> Value::intoString() {
  return takePayload<std::string>(_storage);
}

boost::optional<data_type> Value::intoData() {
  return takePayload<data_type>(_storage);
}

boost::optional<Date> Value::intoDate() {
  return takePayload<Date>(_storage);
}

boost::optional<Uid> Value::intoUid() {
  return takePayload<Uid>(_storage);
}

boost::optional<Array> Value::intoArray() {
  return takePayload<Array>(_storage);
}

boost::optional<Dictionary> Value::intoDictionary() {
  return takePayload<Dictionary>(_storage);
}

data_type Value::toBinary() const {
  return encodeBinary(*this);
}

std::string Value::toXML() const {
  return encodeXML(*this);
}

bool Value::operator==(const Value& rhs) const {
  pair_stack pending(1, std::make_pair(this, &rhs));
  return equalTrees(pending);
}

bool Value::equalTrees(pair_stack& pending) {
  while (!pending.empty()) {
    const Value& lhs = *pending.back().first;
    const Value& rhs = *pending.back().second;
    pending.pop_back();

    if (lhs.kind() != rhs.kind())
      return false;

    if (const Array* array = lhs.asArray()) {
      const Array& other = *rhs.asArray();
      if (array->size() != other.size())
        return false;
      for (std::size_t i = 0; i < array->size(); ++i)
        pending.push_back(
            std::make_pair(&array->_values[i], &other._values[i]));
    } else if (const Dictionary* dictionary = lhs.asDictionary()) {
      const Dictionary& other = *rhs.asDictionary();
      if (dictionary->size() != other.size())
        return false;
      for (Dictionary::storage_type::const_iterator it =
               dictionary->_entries.begin();
           it != dictionary->_entries.end();
           ++it) {
        std::map<std::string, std::size_t>::const_iterator found =
            other._index.find(it->first);
        if (found == other._index.end())
          return false;
        pending.push_back(
            std::make_pair(&it->second, &other._entries[found->second].second));
      }
    } else if (!(lhs._storage == rhs._storage)) {
      return false;
    }
  }
  return true;
}

void Value::releaseAll(std::vector<Value>& pending) {
  while (!pending.empty()) {
    Value node(std::move(pending.back()));
    pending.pop_back();
    if (Array* array = node.asArray())
      array->releaseNested(pending);
    else if (Dictionary* dictionary = node.asDictionary())
      dictionary->releaseNested(pending);
  }
}

} // namespace PlistTree
