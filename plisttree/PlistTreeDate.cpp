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

#include "PlistTreeDate.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cmath>
#include <cstdio>
#include <stdexcept>

#include "PlistTreeConfig.hpp"
#include "PlistTreeError.hpp"

namespace PlistTree {

static const int64_t microsPerSecond = 1000000;

static const boost::posix_time::ptime& appleEpoch() {
  static const boost::posix_time::ptime epoch(
      boost::gregorian::date(2001, boost::gregorian::Jan, 1));
  return epoch;
}

static double microsToSeconds(int64_t micros) {
  int64_t whole = micros / microsPerSecond;
  int64_t fraction = micros % microsPerSecond;
  return static_cast<double>(whole) +
         static_cast<double>(fraction) / microsPerSecond;
}

static int64_t secondsToMicros(double seconds) {
  if (!std::isfinite(seconds))
    throw Error("Plist: date is not a finite number of seconds");
  // far outside the calendar, and small enough not to overflow below
  if (std::fabs(seconds) >= 1e12)
    throw Error("Plist: date outside the calendar range");
  double whole = std::trunc(seconds);
  return static_cast<int64_t>(whole) * microsPerSecond +
         std::llround((seconds - whole) * microsPerSecond);
}

static void checkRange(int64_t micros) {
  if (micros < config::dateMinMicros || micros > config::dateMaxMicros)
    throw Error("Plist: date outside the calendar range");
}

// Far from the epoch a double cannot tell neighbouring microseconds apart.
// Dates hold the value the binary encoding's double carries, so that
// timeAsAppleEpoch() and fromAppleEpoch() are exact inverses.
static int64_t canonicalMicros(int64_t micros) {
  checkRange(micros);
  int64_t canonical = secondsToMicros(microsToSeconds(micros));
  checkRange(canonical);
  return canonical;
}

Date::Date(const std::chrono::system_clock::time_point& timePoint) {
  int64_t sinceUnix = std::chrono::duration_cast<std::chrono::microseconds>(
                          timePoint.time_since_epoch()).count();
  _micros = canonicalMicros(sinceUnix -
                            config::appleEpochOffset * microsPerSecond);
}

Date Date::fromAppleEpoch(double seconds) {
  Date date;
  date.setTimeFromAppleEpoch(seconds);
  return date;
}

Date Date::fromEpoch(double seconds) {
  Date date;
  date.setTimeFromEpoch(seconds);
  return date;
}

Date Date::fromMicroseconds(int64_t appleEpochMicros) {
  Date date;
  date._micros = canonicalMicros(appleEpochMicros);
  return date;
}

void Date::setTimeFromAppleEpoch(double seconds) {
  _micros = canonicalMicros(secondsToMicros(seconds));
}

void Date::setTimeFromEpoch(double seconds) {
  setTimeFromAppleEpoch(seconds - config::appleEpochOffset);
}

double Date::timeAsAppleEpoch() const {
  return microsToSeconds(_micros);
}

double Date::timeAsEpoch() const {
  return timeAsAppleEpoch() + config::appleEpochOffset;
}

std::chrono::system_clock::time_point Date::timePoint() const {
  typedef std::chrono::system_clock::duration clock_duration;
  std::chrono::microseconds sinceUnix(
      _micros + config::appleEpochOffset * microsPerSecond);
  std::chrono::microseconds limit =
      std::chrono::duration_cast<std::chrono::microseconds>(
          clock_duration::max());
  if (sinceUnix >= limit || sinceUnix <= -limit)
    throw Error("Plist: date outside the system clock range");
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          sinceUnix));
}

std::string Date::timeAsXMLConvention() const {
  using namespace boost::posix_time;

  int64_t fraction = _micros % microsPerSecond;
  int64_t wholeMicros = _micros - fraction;
  if (fraction < 0) {
    fraction += microsPerSecond;
    wholeMicros -= microsPerSecond;
  }

  boost::gregorian::date day;
  time_duration clock;
  try {
    ptime time =
        appleEpoch() + seconds(static_cast<long>(wholeMicros / microsPerSecond));
    if (time.is_special())
      throw std::out_of_range("not a point in time");
    day = time.date();
    clock = time.time_of_day();
  } catch (const std::out_of_range& e) {
    throw Error(std::string("Plist: date outside the calendar range: ") +
                e.what());
  }

  char buffer[48];
  int length = std::snprintf(buffer,
                             sizeof(buffer),
                             "%04d-%02d-%02dT%02d:%02d:%02d",
                             static_cast<int>(day.year()),
                             static_cast<int>(day.month()),
                             static_cast<int>(day.day()),
                             static_cast<int>(clock.hours()),
                             static_cast<int>(clock.minutes()),
                             static_cast<int>(clock.seconds()));
  std::string result(buffer, length);

  if (fraction != 0) {
    std::snprintf(buffer, sizeof(buffer), ".%06d", static_cast<int>(fraction));
    result += buffer;
    // trailing zeros carry no information
    while (result[result.size() - 1] == '0')
      result.erase(result.size() - 1);
  }

  return result + "Z";
}

void Date::setTimeFromXMLConvention(const std::string& timeString) {
  using namespace boost::posix_time;

  int year, month, day, hour, minute, second;
  int consumed = 0;
  if (std::sscanf(timeString.c_str(),
                  "%4d-%2d-%2dT%2d:%2d:%2d%n",
                  &year,
                  &month,
                  &day,
                  &hour,
                  &minute,
                  &second,
                  &consumed) != 6 ||
      consumed != 19)
    throw Error("Plist: invalid date '" + timeString + "'");

  std::size_t pos = 19;
  int64_t fraction = 0;
  if (pos < timeString.size() && timeString[pos] == '.') {
    ++pos;
    int64_t scale = microsPerSecond;
    std::size_t digits = 0;
    while (pos < timeString.size() && timeString[pos] >= '0' &&
           timeString[pos] <= '9') {
      if (digits < 6) {
        scale /= 10;
        fraction += (timeString[pos] - '0') * scale;
      }
      ++digits;
      ++pos;
    }
    if (digits == 0)
      throw Error("Plist: invalid date fraction '" + timeString + "'");
  }
  if (pos < timeString.size() && timeString[pos] == 'Z')
    ++pos;
  if (pos != timeString.size())
    throw Error("Plist: trailing characters in date '" + timeString + "'");

  if (hour > 23 || minute > 59 || second > 60)
    throw Error("Plist: invalid time of day '" + timeString + "'");

  try {
    ptime time(boost::gregorian::date(year, month, day),
               hours(hour) + minutes(minute) + seconds(second));
    _micros = canonicalMicros((time - appleEpoch()).total_microseconds() +
                              fraction);
  } catch (const std::out_of_range& e) {
    throw Error("Plist: invalid date '" + timeString + "': " + e.what());
  }
}

} // namespace PlistTree
