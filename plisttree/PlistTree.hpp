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

#ifndef __PLISTTREE_H__
#define __PLISTTREE_H__

#include <boost/cstdint.hpp>

#include <iosfwd>
#include <string>
#include <vector>

#include "PlistTreeArray.hpp"
#include "PlistTreeBuild.hpp"
#include "PlistTreeConfig.hpp"
#include "PlistTreeDate.hpp"
#include "PlistTreeDictionary.hpp"
#include "PlistTreeError.hpp"
#include "PlistTreeItem.hpp"
#include "PlistTreeLog.hpp"
#include "PlistTreeTypes.hpp"
#include "PlistTreeValue.hpp"

namespace PlistTree {

// Public read methods. Decoding is all or nothing: on failure a DecodeError
// is thrown and no partial tree escapes.

Value decodeBinary(const char* byteArray, int64_t size);
Value decodeBinary(const data_type& bytes);
Value decodeXML(const char* text, int64_t size);
Value decodeXML(const std::string& text);

// Plist type (binary or xml) automatically detected: a "bplist" prefix is
// binary, anything else is read as XML.
Format detectFormat(const char* byteArray, int64_t size);
Value readPlist(const char* byteArray, int64_t size);
Value readPlist(std::istream& stream);
template <typename T>
T readPlist(const char* byteArray, int64_t size);

// Public write methods. Any value except Null can be the root.

data_type encodeBinary(const Value& message);
data_type encodeBinary(const Array& message);
data_type encodeBinary(const Dictionary& message);
std::string encodeXML(const Value& message);
std::string encodeXML(const Array& message);
std::string encodeXML(const Dictionary& message);

void writePlistBinary(std::ostream& stream, const Value& message);
void writePlistXML(std::ostream& stream, const Value& message);

// File helpers. saveFile encodes before touching the file system and
// replaces the target through a temporary file and a rename.
Value loadFile(const std::string& filename);
template <typename T>
T loadFile(const std::string& filename);
void saveFile(const std::string& filename, const Value& message, Format format);
}

template <typename T>
T PlistTree::readPlist(const char* byteArray, int64_t size) {
  Value message = readPlist(byteArray, size);
  return message.take<T>();
}

template <typename T>
T PlistTree::loadFile(const std::string& filename) {
  Value message = loadFile(filename);
  return message.take<T>();
}

#endif
