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

#ifndef __PLISTTREE_DATE_H__
#define __PLISTTREE_DATE_H__

#include <chrono>
#include <cstdint>
#include <string>

namespace PlistTree {

// A point in time with microsecond resolution, stored relative to the Apple
// epoch (2001-01-01T00:00:00Z) which both plist encodings use. Dates range
// over the years 1400 to 9999. Beyond about 270 years from the epoch the
// resolution is that of a double counting seconds, so a value set from
// microseconds reads back rounded to it.
class Date {
 public:
  Date() : _micros(0) {}
  Date(const std::chrono::system_clock::time_point& timePoint);

  // All setters throw Error for a time that is not finite or falls outside
  // the supported years.
  static Date fromAppleEpoch(double seconds);
  static Date fromEpoch(double seconds);
  static Date fromMicroseconds(int64_t appleEpochMicros);

  void setTimeFromAppleEpoch(double seconds);
  void setTimeFromEpoch(double seconds);

  // Accepts "YYYY-MM-DDTHH:MM:SSZ" with an optional ".f" fraction of up to
  // six digits before the Z. Throws Error on anything else.
  void setTimeFromXMLConvention(const std::string& timeString);

  double timeAsAppleEpoch() const;
  double timeAsEpoch() const;
  int64_t microseconds() const { return _micros; }
  // Throws Error when the system clock cannot represent the date.
  std::chrono::system_clock::time_point timePoint() const;

  // The fraction is written only when it is non-zero.
  std::string timeAsXMLConvention() const;

  bool operator==(const Date& rhs) const { return _micros == rhs._micros; }
  bool operator!=(const Date& rhs) const { return _micros != rhs._micros; }
  bool operator<(const Date& rhs) const { return _micros < rhs._micros; }
  bool operator>(const Date& rhs) const { return _micros > rhs._micros; }

 private:
  int64_t _micros;
};
}

#endif
