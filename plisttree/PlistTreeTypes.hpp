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

#ifndef __PLISTTREE_TYPES_H__
#define __PLISTTREE_TYPES_H__

#include <boost/cstdint.hpp>

#include <limits>
#include <string>
#include <vector>

#include "PlistTreeDate.hpp"

namespace PlistTree {

enum class Kind {
  Null,
  Boolean,
  Integer,
  Real,
  String,
  Data,
  Date,
  Uid,
  Array,
  Dictionary
};

const char* kindName(Kind kind);

enum class Format { Binary, XML };

// Plist value types and their corresponding c++ types

class Integer;
class Uid;
class Array;
class Dictionary;

typedef bool boolean_type;
typedef Integer integer_type;
typedef double real_type;
typedef std::string string_type;
typedef std::vector<unsigned char> data_type;
typedef Date date_type;
typedef Uid uid_type;
typedef Array array_type;
typedef Dictionary dictionary_type;

// Placeholder payload of a Value that holds nothing.
struct Null {
  bool operator==(const Null&) const { return true; }
  bool operator!=(const Null&) const { return false; }
};

// A plist integer: any int64_t, or an unsigned value above INT64_MAX.
// The unsigned flag is set only for values that need it, so equal numbers
// always compare equal.
class Integer {
 public:
  Integer() : _bits(0), _unsigned(false) {}
  explicit Integer(int64_t value)
      : _bits(static_cast<uint64_t>(value)), _unsigned(false) {}

  static Integer fromUnsigned(uint64_t value) {
    Integer result;
    result._bits = value;
    result._unsigned =
        value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return result;
  }

  int64_t signedValue() const { return static_cast<int64_t>(_bits); }
  uint64_t unsignedValue() const { return _bits; }
  bool isUnsigned() const { return _unsigned; }
  bool isNegative() const { return !_unsigned && signedValue() < 0; }

  void setSigned(int64_t value) { *this = Integer(value); }
  void setUnsigned(uint64_t value) { *this = fromUnsigned(value); }

  std::string toString() const;

  bool operator==(const Integer& rhs) const {
    return _bits == rhs._bits && _unsigned == rhs._unsigned;
  }
  bool operator!=(const Integer& rhs) const { return !(*this == rhs); }

 private:
  uint64_t _bits;
  bool _unsigned;
};

// An object reference from NSKeyedArchiver archives.
class Uid {
 public:
  Uid() : _value(0) {}
  explicit Uid(uint64_t value) : _value(value) {}

  uint64_t get() const { return _value; }
  void set(uint64_t value) { _value = value; }

  bool operator==(const Uid& rhs) const { return _value == rhs._value; }
  bool operator!=(const Uid& rhs) const { return _value != rhs._value; }

 private:
  uint64_t _value;
};
}

#endif
