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

#include "PlistTree.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace PlistTree {

Format detectFormat(const char* byteArray, int64_t size) {
  // infer plist type from header.  If it has the bplist magic as first
  // bytes, then it's a binary plist.  Otherwise, assume it's XML
  if (byteArray && size >= (int64_t)config::binaryMagicSize &&
      std::memcmp(byteArray, config::binaryMagic, config::binaryMagicSize) == 0)
    return Format::Binary;
  return Format::XML;
}

Value readPlist(const char* byteArray, int64_t size) {
  if (!byteArray || size <= 0) {
    log(LogLevel::Warn, "readPlist", "empty plist data");
    throw DecodeError(DecodeError::Truncated, "empty plist data");
  }

  if (detectFormat(byteArray, size) == Format::Binary)
    return decodeBinary(byteArray, size);
  return decodeXML(byteArray, size);
}

Value readPlist(std::istream& stream) {
  std::string buffer((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
  if (stream.bad())
    throw Error("Plist: failed reading plist from stream");
  return readPlist(buffer.data(), static_cast<int64_t>(buffer.size()));
}

Value loadFile(const std::string& filename) {
  std::ifstream stream(filename.c_str(), std::ios::binary);
  if (!stream) {
    IoError error(filename, errno, "cannot open for reading");
    log(LogLevel::Error, "loadFile", error.what());
    throw error;
  }

  std::string buffer((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
  if (stream.bad()) {
    IoError error(filename, errno, "read failed");
    log(LogLevel::Error, "loadFile", error.what());
    throw error;
  }

  std::stringstream ss;
  ss << "read " << buffer.size() << " bytes from " << filename;
  log(LogLevel::Info, "loadFile", ss.str());
  return readPlist(buffer.data(), static_cast<int64_t>(buffer.size()));
}

void saveFile(const std::string& filename,
              const Value& message,
              Format format) {
  std::string contents;
  if (format == Format::Binary) {
    data_type plist = encodeBinary(message);
    contents.assign(plist.begin(), plist.end());
  } else {
    contents = encodeXML(message);
  }

  std::string tempName = filename + config::saveTempSuffix;
  {
    std::ofstream stream(tempName.c_str(),
                         std::ios::binary | std::ios::out | std::ios::trunc);
    if (!stream) {
      IoError error(filename, errno, "cannot open " + tempName + " for writing");
      log(LogLevel::Error, "saveFile", error.what());
      throw error;
    }

    stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    stream.flush();
    if (!stream) {
      int errorNumber = errno;
      stream.close();
      std::remove(tempName.c_str());
      IoError error(filename, errorNumber, "write to " + tempName + " failed");
      log(LogLevel::Error, "saveFile", error.what());
      throw error;
    }
  }

  if (std::rename(tempName.c_str(), filename.c_str()) != 0) {
    int errorNumber = errno;
    std::remove(tempName.c_str());
    IoError error(filename, errorNumber, "cannot replace with " + tempName);
    log(LogLevel::Error, "saveFile", error.what());
    throw error;
  }

  std::stringstream ss;
  ss << "wrote " << contents.size() << " bytes to " << filename;
  log(LogLevel::Info, "saveFile", ss.str());
}

} // namespace PlistTree
