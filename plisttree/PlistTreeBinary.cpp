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

#include <boost/locale/encoding_utf.hpp>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <map>
#include <ostream>
#include <sstream>

namespace PlistTree {

struct PlistHelperData {
 public:
  // binary reader data
  const unsigned char* _bytes;
  uint64_t _size;
  std::vector<uint64_t> _offsetTable;
  uint64_t _offsetTableOffset;
  unsigned _offsetByteSize;
  unsigned _objRefSize;
  uint64_t _objectCount;
  uint64_t _topObject;

  // containers on the path from the top object, to reject cycles
  std::vector<bool> _visiting;
  unsigned _depth;
  // nodes built so far, bounded by _decodeBudget
  uint64_t _decodedObjects;
  uint64_t _decodeBudget;
};

struct PlistWriterObject {
  // complete record for leaves, empty for containers
  data_type _record;
  // 0xA0 or 0xD0 for containers
  unsigned char _containerMarker;
  std::vector<uint64_t> _refs;
};

struct PlistWriterData {
  PlistWriterData() : _depth(0) {}

  std::vector<PlistWriterObject> _objects;
  // leaf record -> object index
  std::map<data_type, uint64_t> _uniqueLeaves;
  // containers open on the path being written
  unsigned _depth;
};

// helper functions

static uint64_t bytesToInt(const unsigned char* bytes, unsigned size);
static void appendInt(data_type& out, uint64_t value, unsigned size);
static unsigned bytesNeeded(uint64_t value);

// binary parsing

static void parseTrailer(PlistHelperData& d);
static void parseOffsetTable(PlistHelperData& d);
static void requireBytes(const PlistHelperData& d,
                         uint64_t position,
                         uint64_t count);
static Value parseBinary(PlistHelperData& d, uint64_t objRef);
static Array parseBinaryArray(PlistHelperData& d, uint64_t objRef);
static Dictionary parseBinaryDictionary(PlistHelperData& d, uint64_t objRef);
static std::vector<uint64_t> getRefsForContainers(const PlistHelperData& d,
                                                  uint64_t objRef,
                                                  uint64_t& count);
static Integer parseBinaryInt(const PlistHelperData& d,
                              uint64_t headerPosition,
                              unsigned& intByteCount);
static double parseBinaryReal(const PlistHelperData& d, uint64_t headerPosition);
static Date parseBinaryDate(const PlistHelperData& d, uint64_t headerPosition);
static bool parseBinaryBool(const PlistHelperData& d, uint64_t headerPosition);
static std::string parseBinaryString(const PlistHelperData& d,
                                     uint64_t headerPosition);
static std::string parseBinaryUnicode(const PlistHelperData& d,
                                      uint64_t headerPosition);
static data_type parseBinaryByteArray(const PlistHelperData& d,
                                      uint64_t headerPosition);
static Uid parseBinaryUid(const PlistHelperData& d, uint64_t headerPosition);
static uint64_t getCount(const PlistHelperData& d,
                         uint64_t bytePosition,
                         unsigned char headerByte,
                         uint64_t& startOffset);

// binary writing

static uint64_t writeObject(PlistWriterData& w, const Value& value);
static uint64_t writeArray(PlistWriterData& w, const Array& array);
static uint64_t writeDictionary(PlistWriterData& w,
                                const Dictionary& dictionary);
static uint64_t writeLeaf(PlistWriterData& w, const data_type& record);
static void enterContainer(PlistWriterData& w);
static void appendHeader(data_type& out, unsigned char marker, uint64_t count);
static data_type integerRecord(const Integer& value);
static data_type realRecord(double value);
static data_type dateRecord(const Date& date);
static data_type dataRecord(const data_type& data);
static data_type stringRecord(const std::string& text);
static data_type uidRecord(const Uid& uid);
static data_type serialize(const PlistWriterData& w);

static DecodeError malformed(const std::string& what) {
  return DecodeError(DecodeError::Malformed, what);
}

} // namespace PlistTree

namespace PlistTree {

Value decodeBinary(const char* byteArrayTemp, int64_t size) {
  using namespace std;
  const unsigned char* byteArray = (const unsigned char*)byteArrayTemp;

  try {
    if (!byteArray || size <= 0)
      throw DecodeError(DecodeError::Truncated, "empty binary plist");

    uint64_t usize = static_cast<uint64_t>(size);
    uint64_t magicCompared = min<uint64_t>(usize, config::binaryMagicSize);
    if (memcmp(byteArray, config::binaryMagic, magicCompared) != 0)
      throw malformed("missing bplist header");
    if (usize < config::binaryHeaderSize)
      throw DecodeError(DecodeError::Truncated, "incomplete bplist header");
    if (memcmp(byteArray + config::binaryMagicSize, config::binaryVersion, 2) !=
        0)
      throw DecodeError(DecodeError::UnsupportedVersion,
                        "bplist version '" +
                            string((const char*)byteArray +
                                       config::binaryMagicSize,
                                   2) +
                            "'");

    PlistHelperData d;
    d._bytes = byteArray;
    d._size = usize;
    d._depth = 0;
    d._decodedObjects = 0;
    d._decodeBudget = usize > UINT64_MAX / config::decodeExpansion
                          ? UINT64_MAX
                          : max(config::decodeBudgetFloor,
                                usize * config::decodeExpansion);
    parseTrailer(d);
    parseOffsetTable(d);
    d._visiting.assign(d._objectCount, false);

    Value message = parseBinary(d, d._topObject);

    stringstream ss;
    ss << d._decodedObjects << " objects from " << usize << " bytes";
    log(LogLevel::Debug, "decodeBinary", ss.str());
    return message;
  } catch (const DecodeError& e) {
    log(LogLevel::Warn, "decodeBinary", e.what());
    throw;
  }
}

Value decodeBinary(const data_type& bytes) {
  return decodeBinary(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<int64_t>(bytes.size()));
}

static void parseTrailer(PlistHelperData& d) {
  if (d._size < config::binaryHeaderSize + config::binaryTrailerSize)
    throw DecodeError(DecodeError::Truncated, "no room for the trailer");

  const unsigned char* trailer =
      d._bytes + d._size - config::binaryTrailerSize;
  d._offsetByteSize = trailer[6];
  d._objRefSize = trailer[7];
  d._objectCount = bytesToInt(trailer + 8, 8);
  d._topObject = bytesToInt(trailer + 16, 8);
  d._offsetTableOffset = bytesToInt(trailer + 24, 8);

  // Checks that only a cut-off document can fail come first, so that the
  // garbage a truncated tail leaves in the trailer reports as Truncated.
  uint64_t tableSpace = d._size - config::binaryTrailerSize;
  if (d._offsetTableOffset > tableSpace)
    throw DecodeError(DecodeError::Truncated,
                      "offset table starts past the end of the data");
  tableSpace -= d._offsetTableOffset;
  if (d._objectCount > tableSpace)
    throw DecodeError(DecodeError::Truncated,
                      "offset table runs past the end of the data");

  if (d._offsetByteSize < 1 || d._offsetByteSize > 8)
    throw malformed("invalid offset size in trailer");
  if (d._objRefSize < 1 || d._objRefSize > 8)
    throw malformed("invalid object reference size in trailer");
  if (d._objectCount * d._offsetByteSize > tableSpace)
    throw DecodeError(DecodeError::Truncated,
                      "offset table runs past the end of the data");
  if (d._objectCount == 0)
    throw malformed("no objects");
  if (d._topObject >= d._objectCount)
    throw malformed("top object out of range");
  if (d._offsetTableOffset < config::binaryHeaderSize)
    throw malformed("offset table overlaps the header");
}

static void parseOffsetTable(PlistHelperData& d) {
  d._offsetTable.reserve(d._objectCount);
  const unsigned char* entry = d._bytes + d._offsetTableOffset;
  for (uint64_t i = 0; i < d._objectCount; ++i, entry += d._offsetByteSize) {
    uint64_t offset = bytesToInt(entry, d._offsetByteSize);
    if (offset < config::binaryHeaderSize || offset >= d._offsetTableOffset)
      throw malformed("object offset outside the object table");
    d._offsetTable.push_back(offset);
  }
}

static void requireBytes(const PlistHelperData& d,
                         uint64_t position,
                         uint64_t count) {
  if (position > d._offsetTableOffset ||
      count > d._offsetTableOffset - position)
    throw DecodeError(DecodeError::Truncated,
                      "object runs past the object table");
}

static Value parseBinary(PlistHelperData& d, uint64_t objRef) {
  if (objRef >= d._objectCount)
    throw malformed("object reference out of range");

  uint64_t position = d._offsetTable[objRef];
  unsigned char header = d._bytes[position];
  if (++d._decodedObjects > d._decodeBudget)
    throw malformed("shared references expand past the size of the document");

  switch (header & 0xF0) {
  case 0x00: {
    return parseBinaryBool(d, position);
  }
  case 0x10: {
    unsigned intByteCount;
    return parseBinaryInt(d, position, intByteCount);
  }
  case 0x20: {
    return parseBinaryReal(d, position);
  }
  case 0x30: {
    return parseBinaryDate(d, position);
  }
  case 0x40: {
    return parseBinaryByteArray(d, position);
  }
  case 0x50: {
    return parseBinaryString(d, position);
  }
  case 0x60: {
    return parseBinaryUnicode(d, position);
  }
  case 0x80: {
    return parseBinaryUid(d, position);
  }
  case 0xA0: {
    return parseBinaryArray(d, objRef);
  }
  case 0xD0: {
    return parseBinaryDictionary(d, objRef);
  }
  }

  std::stringstream ss;
  ss << "unsupported object type 0x" << std::hex << (int)header;
  throw malformed(ss.str());
}

static std::vector<uint64_t> getRefsForContainers(const PlistHelperData& d,
                                                  uint64_t objRef,
                                                  uint64_t& count) {
  uint64_t position = d._offsetTable[objRef];
  unsigned char header = d._bytes[position];
  uint64_t refStartPosition;
  count = getCount(d, position, header, refStartPosition);
  refStartPosition += position;

  uint64_t refCount = count;
  if ((header & 0xF0) == 0xD0) {
    if (count > UINT64_MAX / 2)
      throw malformed("dictionary size out of range");
    refCount = count * 2;
  }
  if (refCount > (d._offsetTableOffset - refStartPosition) / d._objRefSize)
    throw DecodeError(DecodeError::Truncated,
                      "container references run past the object table");
  requireBytes(d, refStartPosition, refCount * d._objRefSize);

  std::vector<uint64_t> refs;
  refs.reserve(refCount);
  const unsigned char* ref = d._bytes + refStartPosition;
  for (uint64_t i = 0; i < refCount; ++i, ref += d._objRefSize)
    refs.push_back(bytesToInt(ref, d._objRefSize));

  return refs;
}

static Array parseBinaryArray(PlistHelperData& d, uint64_t objRef) {
  if (d._visiting[objRef])
    throw malformed("array contains itself");
  if (++d._depth > config::maxDepth)
    throw malformed("containers nested too deeply");
  d._visiting[objRef] = true;

  uint64_t count;
  std::vector<uint64_t> refs = getRefsForContainers(d, objRef, count);

  Array array;
  for (uint64_t i = 0; i < count; ++i)
    array.append(parseBinary(d, refs[i]));

  d._visiting[objRef] = false;
  --d._depth;
  return array;
}

static Dictionary parseBinaryDictionary(PlistHelperData& d, uint64_t objRef) {
  if (d._visiting[objRef])
    throw malformed("dictionary contains itself");
  if (++d._depth > config::maxDepth)
    throw malformed("containers nested too deeply");
  d._visiting[objRef] = true;

  uint64_t count;
  std::vector<uint64_t> refs = getRefsForContainers(d, objRef, count);

  Dictionary dict;
  for (uint64_t i = 0; i < count; ++i) {
    Value keyValue = parseBinary(d, refs[i]);
    const std::string* key = keyValue.asString();
    if (!key)
      throw malformed("dictionary key is not a string");
    dict.insert(*key, parseBinary(d, refs[i + count]));
  }

  d._visiting[objRef] = false;
  --d._depth;
  return dict;
}

static std::string parseBinaryString(const PlistHelperData& d,
                                     uint64_t headerPosition) {
  unsigned char headerByte = d._bytes[headerPosition];
  uint64_t charStartPosition;
  uint64_t charCount =
      getCount(d, headerPosition, headerByte, charStartPosition);
  charStartPosition += headerPosition;
  requireBytes(d, charStartPosition, charCount);

  // ASCII strings; bytes above 0x7F are taken as Latin-1
  std::string buffer;
  buffer.reserve(charCount);
  const unsigned char* chars = d._bytes + charStartPosition;
  for (uint64_t i = 0; i < charCount; ++i) {
    unsigned char c = chars[i];
    if (c < 0x80) {
      buffer += static_cast<char>(c);
    } else {
      buffer += static_cast<char>(0xC0 | (c >> 6));
      buffer += static_cast<char>(0x80 | (c & 0x3F));
    }
  }
  return buffer;
}

static std::string parseBinaryUnicode(const PlistHelperData& d,
                                      uint64_t headerPosition) {
  unsigned char headerByte = d._bytes[headerPosition];
  uint64_t charStartPosition;
  uint64_t charCount =
      getCount(d, headerPosition, headerByte, charStartPosition);
  charStartPosition += headerPosition;
  if (charCount > UINT64_MAX / 2)
    throw malformed("string length out of range");
  requireBytes(d, charStartPosition, charCount * 2);

  std::u16string u16chars;
  u16chars.reserve(charCount);
  const unsigned char* chars = d._bytes + charStartPosition;
  for (uint64_t i = 0; i < charCount; ++i)
    u16chars += static_cast<char16_t>(bytesToInt(chars + 2 * i, 2));

  try {
    return boost::locale::conv::utf_to_utf<char>(u16chars,
                                                 boost::locale::conv::stop);
  } catch (const boost::locale::conv::conversion_error&) {
    throw malformed("invalid UTF-16 string");
  }
}

static Integer parseBinaryInt(const PlistHelperData& d,
                              uint64_t headerPosition,
                              unsigned& intByteCount) {
  unsigned char header = d._bytes[headerPosition];
  if ((header & 0xF0) != 0x10)
    throw malformed("integer expected");
  unsigned power = header & 0x0F;
  if (power > 4)
    throw malformed("integer wider than 16 bytes");
  intByteCount = 1u << power;
  requireBytes(d, headerPosition + 1, intByteCount);

  const unsigned char* bytes = d._bytes + headerPosition + 1;
  if (intByteCount < 8)
    return Integer(static_cast<int64_t>(bytesToInt(bytes, intByteCount)));
  if (intByteCount == 8)
    return Integer(static_cast<int64_t>(bytesToInt(bytes, 8)));

  uint64_t high = bytesToInt(bytes, 8);
  uint64_t low = bytesToInt(bytes + 8, 8);
  if (high == 0)
    return Integer::fromUnsigned(low);
  if (high == UINT64_MAX && (low >> 63) == 1)
    return Integer(static_cast<int64_t>(low));
  throw malformed("integer does not fit in 64 bits");
}

static double parseBinaryReal(const PlistHelperData& d,
                              uint64_t headerPosition) {
  unsigned char header = d._bytes[headerPosition];
  if (header == 0x22) {
    requireBytes(d, headerPosition + 1, 4);
    uint32_t bits =
        static_cast<uint32_t>(bytesToInt(d._bytes + headerPosition + 1, 4));
    float result;
    std::memcpy(&result, &bits, sizeof(result));
    return result;
  }
  if (header == 0x23) {
    requireBytes(d, headerPosition + 1, 8);
    uint64_t bits = bytesToInt(d._bytes + headerPosition + 1, 8);
    double result;
    std::memcpy(&result, &bits, sizeof(result));
    return result;
  }
  throw malformed("unsupported real width");
}

static bool parseBinaryBool(const PlistHelperData& d, uint64_t headerPosition) {
  unsigned char header = d._bytes[headerPosition];
  if (header == 0x09)
    return true;
  if (header == 0x08)
    return false;
  if (header == 0x00)
    throw malformed("null object");
  if (header == 0x0F)
    throw malformed("fill byte in place of an object");

  std::stringstream ss;
  ss << "unknown header 0x" << std::hex << (int)header;
  throw malformed(ss.str());
}

static Date parseBinaryDate(const PlistHelperData& d, uint64_t headerPosition) {
  // date always an 8 byte float starting after full byte header
  if (d._bytes[headerPosition] != 0x33)
    throw malformed("unsupported date width");
  requireBytes(d, headerPosition + 1, 8);
  uint64_t bits = bytesToInt(d._bytes + headerPosition + 1, 8);
  double seconds;
  std::memcpy(&seconds, &bits, sizeof(seconds));

  // Date is stored as Apple Epoch and big endian.
  try {
    return Date::fromAppleEpoch(seconds);
  } catch (const Error& e) {
    throw malformed(e.what());
  }
}

static data_type parseBinaryByteArray(const PlistHelperData& d,
                                      uint64_t headerPosition) {
  unsigned char headerByte = d._bytes[headerPosition];
  uint64_t byteStartPosition;
  uint64_t byteCount =
      getCount(d, headerPosition, headerByte, byteStartPosition);
  byteStartPosition += headerPosition;
  requireBytes(d, byteStartPosition, byteCount);

  const unsigned char* start = d._bytes + byteStartPosition;
  return data_type(start, start + byteCount);
}

static Uid parseBinaryUid(const PlistHelperData& d, uint64_t headerPosition) {
  unsigned byteCount = (d._bytes[headerPosition] & 0x0F) + 1;
  if (byteCount > 8)
    throw malformed("uid wider than 8 bytes");
  requireBytes(d, headerPosition + 1, byteCount);
  return Uid(bytesToInt(d._bytes + headerPosition + 1, byteCount));
}

static uint64_t getCount(const PlistHelperData& d,
                         uint64_t bytePosition,
                         unsigned char headerByte,
                         uint64_t& startOffset) {
  unsigned char headerByteTrail = headerByte & 0xf;
  if (headerByteTrail < 15) {
    startOffset = 1;
    return headerByteTrail;
  }

  requireBytes(d, bytePosition + 1, 1);
  unsigned intByteCount;
  Integer count = parseBinaryInt(d, bytePosition + 1, intByteCount);
  if (count.isNegative())
    throw malformed("negative length");
  startOffset = 2 + intByteCount;
  return count.unsignedValue();
}

} // namespace PlistTree

namespace PlistTree {

namespace {

struct WriteVisitor : public boost::static_visitor<uint64_t> {
  explicit WriteVisitor(PlistWriterData& w) : _w(w) {}

  uint64_t operator()(const Null&) const {
    throw EncodeError("Plist: a null value cannot be encoded");
  }
  uint64_t operator()(bool value) const {
    return writeLeaf(_w, data_type(1, value ? 0x09 : 0x08));
  }
  uint64_t operator()(const Integer& value) const {
    return writeLeaf(_w, integerRecord(value));
  }
  uint64_t operator()(double value) const {
    return writeLeaf(_w, realRecord(value));
  }
  uint64_t operator()(const std::string& value) const {
    return writeLeaf(_w, stringRecord(value));
  }
  uint64_t operator()(const data_type& value) const {
    return writeLeaf(_w, dataRecord(value));
  }
  uint64_t operator()(const Date& value) const {
    return writeLeaf(_w, dateRecord(value));
  }
  uint64_t operator()(const Uid& value) const {
    return writeLeaf(_w, uidRecord(value));
  }
  uint64_t operator()(const Array& value) const {
    return writeArray(_w, value);
  }
  uint64_t operator()(const Dictionary& value) const {
    return writeDictionary(_w, value);
  }

  PlistWriterData& _w;
};
}

static uint64_t writeObject(PlistWriterData& w, const Value& value) {
  return boost::apply_visitor(WriteVisitor(w), value.storage());
}

static void enterContainer(PlistWriterData& w) {
  if (++w._depth > config::maxDepth)
    throw EncodeError("Plist: containers nested too deeply");
}

static uint64_t writeArray(PlistWriterData& w, const Array& array) {
  enterContainer(w);
  uint64_t id = w._objects.size();
  w._objects.push_back(PlistWriterObject());
  w._objects[id]._containerMarker = 0xA0;

  std::vector<uint64_t> refs;
  refs.reserve(array.size());
  for (Array::const_iterator it = array.begin(); it != array.end(); ++it)
    refs.push_back(writeObject(w, *it));

  w._objects[id]._refs.swap(refs);
  --w._depth;
  return id;
}

static uint64_t writeDictionary(PlistWriterData& w,
                                const Dictionary& dictionary) {
  enterContainer(w);
  uint64_t id = w._objects.size();
  w._objects.push_back(PlistWriterObject());
  w._objects[id]._containerMarker = 0xD0;

  // all key references first, then all value references
  std::vector<uint64_t> keyRefs;
  std::vector<uint64_t> valueRefs;
  keyRefs.reserve(dictionary.size());
  valueRefs.reserve(dictionary.size());
  for (Dictionary::const_iterator it = dictionary.begin();
       it != dictionary.end();
       ++it) {
    keyRefs.push_back(writeLeaf(w, stringRecord(it->first)));
    valueRefs.push_back(writeObject(w, it->second));
  }
  keyRefs.insert(keyRefs.end(), valueRefs.begin(), valueRefs.end());

  w._objects[id]._refs.swap(keyRefs);
  --w._depth;
  return id;
}

static uint64_t writeLeaf(PlistWriterData& w, const data_type& record) {
  std::map<data_type, uint64_t>::const_iterator found =
      w._uniqueLeaves.find(record);
  if (found != w._uniqueLeaves.end())
    return found->second;

  uint64_t id = w._objects.size();
  w._objects.push_back(PlistWriterObject());
  w._objects[id]._record = record;
  w._objects[id]._containerMarker = 0;
  w._uniqueLeaves[record] = id;
  return id;
}

static void appendHeader(data_type& out, unsigned char marker, uint64_t count) {
  if (count < 15) {
    out.push_back(marker | static_cast<unsigned char>(count));
    return;
  }
  out.push_back(marker | 0x0F);
  data_type countRecord = integerRecord(Integer::fromUnsigned(count));
  out.insert(out.end(), countRecord.begin(), countRecord.end());
}

static data_type integerRecord(const Integer& value) {
  data_type record;
  if (value.isUnsigned()) {
    record.push_back(0x14);
    appendInt(record, 0, 8);
    appendInt(record, value.unsignedValue(), 8);
    return record;
  }

  // 1, 2 and 4 byte integers are unsigned; negatives always take 8 bytes
  int64_t v = value.signedValue();
  if (v < 0 || v > 0xFFFFFFFFLL) {
    record.push_back(0x13);
    appendInt(record, static_cast<uint64_t>(v), 8);
  } else if (v > 0xFFFF) {
    record.push_back(0x12);
    appendInt(record, static_cast<uint64_t>(v), 4);
  } else if (v > 0xFF) {
    record.push_back(0x11);
    appendInt(record, static_cast<uint64_t>(v), 2);
  } else {
    record.push_back(0x10);
    appendInt(record, static_cast<uint64_t>(v), 1);
  }
  return record;
}

static data_type realRecord(double value) {
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  data_type record(1, 0x23);
  appendInt(record, bits, 8);
  return record;
}

static data_type dateRecord(const Date& date) {
  double seconds = date.timeAsAppleEpoch();
  uint64_t bits;
  std::memcpy(&bits, &seconds, sizeof(bits));
  data_type record(1, 0x33);
  appendInt(record, bits, 8);
  return record;
}

static data_type dataRecord(const data_type& data) {
  data_type record;
  appendHeader(record, 0x40, data.size());
  record.insert(record.end(), data.begin(), data.end());
  return record;
}

static data_type stringRecord(const std::string& text) {
  data_type record;

  bool ascii = true;
  for (std::string::const_iterator it = text.begin(); it != text.end(); ++it)
    if (static_cast<unsigned char>(*it) >= 0x80) {
      ascii = false;
      break;
    }

  if (ascii) {
    appendHeader(record, 0x50, text.size());
    record.insert(record.end(), text.begin(), text.end());
    return record;
  }

  std::u16string u16chars;
  try {
    u16chars = boost::locale::conv::utf_to_utf<char16_t>(
        text, boost::locale::conv::stop);
  } catch (const boost::locale::conv::conversion_error&) {
    throw EncodeError("Plist: string is not valid UTF-8");
  }

  appendHeader(record, 0x60, u16chars.size());
  for (std::u16string::const_iterator it = u16chars.begin();
       it != u16chars.end();
       ++it)
    appendInt(record, static_cast<uint16_t>(*it), 2);
  return record;
}

static data_type uidRecord(const Uid& uid) {
  unsigned size = bytesNeeded(uid.get());
  data_type record(1, static_cast<unsigned char>(0x80 | (size - 1)));
  appendInt(record, uid.get(), size);
  return record;
}

static data_type serialize(const PlistWriterData& w) {
  uint64_t objectCount = w._objects.size();
  unsigned objRefSize = bytesNeeded(objectCount - 1);

  data_type plist(config::binaryMagic,
                  config::binaryMagic + config::binaryMagicSize);
  plist.insert(plist.end(), config::binaryVersion, config::binaryVersion + 2);

  std::vector<uint64_t> offsets;
  offsets.reserve(objectCount);
  for (std::vector<PlistWriterObject>::const_iterator it = w._objects.begin();
       it != w._objects.end();
       ++it) {
    offsets.push_back(plist.size());
    if (!it->_containerMarker) {
      plist.insert(plist.end(), it->_record.begin(), it->_record.end());
      continue;
    }
    uint64_t count = it->_refs.size();
    if (it->_containerMarker == 0xD0)
      count /= 2;
    appendHeader(plist, it->_containerMarker, count);
    for (std::vector<uint64_t>::const_iterator ref = it->_refs.begin();
         ref != it->_refs.end();
         ++ref)
      appendInt(plist, *ref, objRefSize);
  }

  uint64_t offsetTableOffset = plist.size();
  unsigned offsetByteSize = bytesNeeded(offsetTableOffset);
  for (std::vector<uint64_t>::const_iterator it = offsets.begin();
       it != offsets.end();
       ++it)
    appendInt(plist, *it, offsetByteSize);

  // trailer: 5 unused bytes, sort version, two sizes, three 8 byte fields
  appendInt(plist, 0, 6);
  plist.push_back(static_cast<unsigned char>(offsetByteSize));
  plist.push_back(static_cast<unsigned char>(objRefSize));
  appendInt(plist, objectCount, 8);
  appendInt(plist, 0, 8);
  appendInt(plist, offsetTableOffset, 8);

  return plist;
}

template <typename Node>
static data_type writeBinaryDocument(const Node& message,
                                     uint64_t (*writeTop)(PlistWriterData&,
                                                          const Node&)) {
  try {
    PlistWriterData w;
    writeTop(w, message);
    data_type plist = serialize(w);

    std::stringstream ss;
    ss << w._objects.size() << " objects in " << plist.size() << " bytes";
    log(LogLevel::Debug, "encodeBinary", ss.str());
    return plist;
  } catch (const EncodeError& e) {
    log(LogLevel::Warn, "encodeBinary", e.what());
    throw;
  }
}

data_type encodeBinary(const Value& message) {
  return writeBinaryDocument(message, writeObject);
}

data_type encodeBinary(const Array& message) {
  return writeBinaryDocument(message, writeArray);
}

data_type encodeBinary(const Dictionary& message) {
  return writeBinaryDocument(message, writeDictionary);
}

void writePlistBinary(std::ostream& stream, const Value& message) {
  data_type plist = encodeBinary(message);
  stream.write(reinterpret_cast<const char*>(plist.data()),
               static_cast<std::streamsize>(plist.size()));
  if (!stream)
    throw Error("Plist: failed writing binary plist to stream");
}

static uint64_t bytesToInt(const unsigned char* bytes, unsigned size) {
  uint64_t result = 0;
  for (unsigned n = 0; n < size; n++)
    result = (result << 8) + bytes[n];
  return result;
}

static void appendInt(data_type& out, uint64_t value, unsigned size) {
  for (unsigned n = size; n > 0; --n)
    out.push_back(static_cast<unsigned char>((value >> (8 * (n - 1))) & 0xff));
}

static unsigned bytesNeeded(uint64_t value) {
  if (value <= 0xFF)
    return 1;
  if (value <= 0xFFFF)
    return 2;
  if (value <= 0xFFFFFFFFULL)
    return 4;
  return 8;
}

} // namespace PlistTree
