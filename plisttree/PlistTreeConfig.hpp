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

#ifndef __PLISTTREE_CONFIG_H__
#define __PLISTTREE_CONFIG_H__

#include <cstddef>
#include <cstdint>

namespace PlistTree {
namespace config {

// binary format
const char binaryMagic[] = "bplist";
const std::size_t binaryMagicSize = 6;
const char binaryVersion[] = "00";
const std::size_t binaryHeaderSize = 8;
const std::size_t binaryTrailerSize = 32;

// xml format
const char xmlDoctype[] =
    "plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\"";
const char xmlVersion[] = "1.0";
const char xmlIndent[] = "\t";
const char uidKey[] = "CF$UID";

// seconds between 1970-01-01 and 2001-01-01
const int64_t appleEpochOffset = 978307200;

// Dates span 1400-01-01T00:00:00Z to the last instant of 9999 that a double
// count of seconds holds, in microseconds from the Apple epoch.
const int64_t dateMinMicros = -18965750400LL * 1000000;
const int64_t dateMaxMicros = 252423993599LL * 1000000 + 999969;

// Containers nest at most this deep in decoded and encoded documents.
const unsigned maxDepth = 512;

// A binary document may expand to at most this many nodes per input byte
// through shared references, and never less than decodeBudgetFloor nodes.
const uint64_t decodeExpansion = 32;
const uint64_t decodeBudgetFloor = 1 << 16;

const char saveTempSuffix[] = ".tmp";
}

// Diagnostic rendering of values. Clean mode (the default) prints semantic
// values, raw mode prints each node's kind and stored representation.
// Has no effect on equality or encoding.
void setCleanDebug(bool enabled);
bool cleanDebug();
}

#endif
