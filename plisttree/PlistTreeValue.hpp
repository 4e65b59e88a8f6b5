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

#ifndef __PLISTTREE_VALUE_H__
#define __PLISTTREE_VALUE_H__

#include <boost/optional.hpp>
#include <boost/type_traits/is_integral.hpp>
#include <boost/type_traits/is_same.hpp>
#include <boost/type_traits/is_signed.hpp>
#include <boost/utility/enable_if.hpp>
#include <boost/variant.hpp>

#include <chrono>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "PlistTreeError.hpp"
#include "PlistTreeTypes.hpp"

namespace PlistTree {

// A single plist node. Containers own their children, so a Value owns the
// whole tree below it; copies are deep.
class Value {
 public:
  typedef boost::variant<Null,
                         bool,
                         Integer,
                         double,
                         std::string,
                         data_type,
                         Date,
                         Uid,
                         boost::recursive_wrapper<Array>,
                         boost::recursive_wrapper<Dictionary> > storage_type;

  Value();
  Value(bool value);
  template <typename T>
  Value(T value,
        typename boost::enable_if_c<boost::is_integral<T>::value &&
                                    !boost::is_same<T, bool>::value>::type* = 0)
      : Value(boost::is_signed<T>::value
                  ? Integer(static_cast<int64_t>(value))
                  : Integer::fromUnsigned(static_cast<uint64_t>(value))) {}
  Value(double value);
  Value(const char* value);
  Value(char* value);
  // other pointers would silently become booleans
  template <typename T>
  Value(T* value) = delete;
  Value(const std::string& value);
  Value(std::string&& value);
  Value(const data_type& value);
  Value(data_type&& value);
  Value(const Integer& value);
  Value(const Date& value);
  Value(const std::chrono::system_clock::time_point& value);
  Value(const Uid& value);
  Value(const Array& value);
  Value(Array&& value);
  Value(const Dictionary& value);
  Value(Dictionary&& value);

  Value(const Value& other);
  Value(Value&& other);
  Value& operator=(const Value& other);
  Value& operator=(Value&& other);
  ~Value();

  Kind kind() const;
  bool isNull() const { return kind() == Kind::Null; }

  const bool* asBoolean() const;
  bool* asBoolean();
  const Integer* asInteger() const;
  Integer* asInteger();
  const double* asReal() const;
  double* asReal();
  const std::string* asString() const;
  std::string* asString();
  const data_type* asData() const;
  data_type* asData();
  const Date* asDate() const;
  Date* asDate();
  const Uid* asUid() const;
  Uid* asUid();
  const Array* asArray() const;
  Array* asArray();
  const Dictionary* asDictionary() const;
  Dictionary* asDictionary();

  // Move the payload out and leave Null behind. On a kind mismatch the
  // value is left untouched and none is returned.
  boost::optional<bool> intoBoolean();
  boost::optional<Integer> intoInteger();
  boost::optional<double> intoReal();
  boost::optional<std::string> intoString();
  boost::optional<data_type> intoData();
  boost::optional<Date> intoDate();
  boost::optional<Uid> intoUid();
  boost::optional<Array> intoArray();
  boost::optional<Dictionary> intoDictionary();

  // Payload of kind T, or ConversionError.
  template <typename T>
  const T& get() const {
    const T* payload = payloadOf(static_cast<const T*>(0));
    if (!payload)
      throw ConversionError(std::string("Plist: cannot read ") +
                            kindName(kind()) + " value as another kind");
    return *payload;
  }

  // Moves the payload of kind T out, leaving Null, or throws
  // ConversionError and leaves the value untouched.
  template <typename T>
  T take() {
    T* payload = payloadOf(static_cast<T*>(0));
    if (!payload)
      throw ConversionError(std::string("Plist: cannot take ") +
                            kindName(kind()) + " value as another kind");
    T result(std::move(*payload));
    *this = Value();
    return result;
  }

  Value clone() const { return Value(*this); }

  // Shorthands for encodeBinary / encodeXML.
  data_type toBinary() const;
  std::string toXML() const;

  // Renders according to cleanDebug().
  std::string debugString() const;

  const storage_type& storage() const { return _storage; }

  bool operator==(const Value& rhs) const;
  bool operator!=(const Value& rhs) const { return !(*this == rhs); }

 private:
  friend class Array;
  friend class Dictionary;

  typedef std::vector<std::pair<const Value*, const Value*> > pair_stack;

  // Deep comparison of every pair, using pending as an explicit stack
  // instead of recursing.
  static bool equalTrees(pair_stack& pending);

  // Destroys the containers in pending without recursing into them.
  static void releaseAll(std::vector<Value>& pending);

  const bool* payloadOf(const bool*) const { return asBoolean(); }
  const Integer* payloadOf(const Integer*) const { return asInteger(); }
  const double* payloadOf(const double*) const { return asReal(); }
  const std::string* payloadOf(const std::string*) const { return asString(); }
  const data_type* payloadOf(const data_type*) const { return asData(); }
  const Date* payloadOf(const Date*) const { return asDate(); }
  const Uid* payloadOf(const Uid*) const { return asUid(); }
  const Array* payloadOf(const Array*) const { return asArray(); }
  const Dictionary* payloadOf(const Dictionary*) const {
    return asDictionary();
  }
  bool* payloadOf(bool*) { return asBoolean(); }
  Integer* payloadOf(Integer*) { return asInteger(); }
  double* payloadOf(double*) { return asReal(); }
  std::string* payloadOf(std::string*) { return asString(); }
  data_type* payloadOf(data_type*) { return asData(); }
  Date* payloadOf(Date*) { return asDate(); }
  Uid* payloadOf(Uid*) { return asUid(); }
  Array* payloadOf(Array*) { return asArray(); }
  Dictionary* payloadOf(Dictionary*) { return asDictionary(); }

  storage_type _storage;
};

std::ostream& operator<<(std::ostream& stream, const Value& value);
}

#endif
