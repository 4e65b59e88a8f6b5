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

#ifndef __PLISTTREE_ERROR_H__
#define __PLISTTREE_ERROR_H__

#include <stdexcept>
#include <string>

namespace PlistTree {

class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Typed extraction of a payload from a Value of another kind.
class ConversionError : public Error {
 public:
  using Error::Error;
};

// Index out of range, or a borrowed handle used after its container was
// structurally mutated or destroyed.
class BoundsError : public Error {
 public:
  using Error::Error;
};

class DecodeError : public Error {
 public:
  enum Reason { Malformed, UnsupportedVersion, Truncated };

  DecodeError(Reason reason, const std::string& what);

  Reason reason() const { return _reason; }

 private:
  Reason _reason;
};

const char* reasonName(DecodeError::Reason reason);

class EncodeError : public Error {
 public:
  using Error::Error;
};

// File system failure. errorNumber() is the errno observed at the failing
// call, 0 when the stream library did not set one.
class IoError : public Error {
 public:
  IoError(const std::string& path, int errorNumber, const std::string& what);

  const std::string& path() const { return _path; }
  int errorNumber() const { return _errorNumber; }

 private:
  std::string _path;
  int _errorNumber;
};
}

#endif
