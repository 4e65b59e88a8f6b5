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

#include "PlistTreeError.hpp"

#include <cstring>

namespace PlistTree {

DecodeError::DecodeError(Reason reason, const std::string& what)
    : Error(std::string("Plist: ") + reasonName(reason) + ": " + what),
      _reason(reason) {}

const char* reasonName(DecodeError::Reason reason) {
  switch (reason) {
  case DecodeError::Malformed:
    return "malformed document";
  case DecodeError::UnsupportedVersion:
    return "unsupported version";
  case DecodeError::Truncated:
    return "truncated document";
  }
  return "decode error";
}

static std::string ioMessage(const std::string& path,
                             int errorNumber,
                             const std::string& what) {
  std::string message = "Plist: " + what + " '" + path + "'";
  if (errorNumber != 0)
    message += std::string(": ") + std::strerror(errorNumber);
  return message;
}

IoError::IoError(const std::string& path,
                 int errorNumber,
                 const std::string& what)
    : Error(ioMessage(path, errorNumber, what)),
      _path(path),
      _errorNumber(errorNumber) {}

} // namespace PlistTree
