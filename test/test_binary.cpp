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

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <sstream>
#include <string>

#include "PlistTree.hpp"

using namespace PlistTree;

namespace {

void appendBigEndian(data_type& out, uint64_t value, int size) {
  for (int n = size - 1; n >= 0; --n)
    out.push_back(static_cast<unsigned char>(value >> (8 * n)));
}

// A bplist00 document with one byte offsets and object references.
data_type handBuilt(const data_type& objects,
                    const data_type& offsets,
                    uint64_t objectCount,
                    uint64_t topObject = 0,
                    unsigned char offsetSize = 1,
                    unsigned char refSize = 1) {
  data_type plist{'b', 'p', 'l', 'i', 's', 't', '0', '0'};
  plist.insert(plist.end(), objects.begin(), objects.end());
  uint64_t offsetTableOffset = plist.size();
  plist.insert(plist.end(), offsets.begin(), offsets.end());
  appendBigEndian(plist, 0, 6);
  plist.push_back(offsetSize);
  plist.push_back(refSize);
  appendBigEndian(plist, objectCount, 8);
  appendBigEndian(plist, topObject, 8);
  appendBigEndian(plist, offsetTableOffset, 8);
  return plist;
}

uint64_t trailerObjectCount(const data_type& plist) {
  uint64_t count = 0;
  for (std::size_t i = plist.size() - 24; i < plist.size() - 16; ++i)
    count = (count << 8) | plist[i];
  return count;
}

DecodeError::Reason decodeFailure(const data_type& plist) {
  try {
    decodeBinary(plist);
  } catch (const DecodeError& e) {
    return e.reason();
  }
  ADD_FAILURE() << "decoding succeeded";
  return DecodeError::Malformed;
}

// Arrays nested depth deep around a true, with two byte offsets and
// references.
data_type nestedArrays(unsigned depth) {
  data_type objects;
  data_type offsets;
  for (unsigned i = 0; i < depth; ++i) {
    appendBigEndian(offsets, 8 + objects.size(), 2);
    objects.push_back(0xa1);
    appendBigEndian(objects, i + 1, 2);
  }
  appendBigEndian(offsets, 8 + objects.size(), 2);
  objects.push_back(0x09);
  return handBuilt(objects, offsets, depth + 1, 0, 2, 2);
}

// Each of levels arrays holds the next one twice, so the decoded tree has
// 2^(levels + 1) - 1 nodes.
data_type sharedLevels(unsigned levels) {
  data_type objects;
  data_type offsets;
  for (unsigned i = 0; i < levels; ++i) {
    offsets.push_back(static_cast<unsigned char>(8 + objects.size()));
    objects.push_back(0xa2);
    objects.push_back(static_cast<unsigned char>(i + 1));
    objects.push_back(static_cast<unsigned char>(i + 1));
  }
  offsets.push_back(static_cast<unsigned char>(8 + objects.size()));
  objects.push_back(0x09);
  return handBuilt(objects, offsets, levels + 1);
}

Value nestedValue(unsigned depth) {
  Value value(makeArray(true));
  for (unsigned i = 1; i < depth; ++i) {
    Array wrapper;
    wrapper.append(std::move(value));
    value = Value(std::move(wrapper));
  }
  return value;
}

Value everyKind() {
  return Value(makeDictionary(
      "bool", true,
      "false", false,
      "small", 7,
      "negative", -123456789,
      "wide", static_cast<int64_t>(1) << 40,
      "huge", std::numeric_limits<uint64_t>::max(),
      "real", 3.141592653589793,
      "ascii", "plain text",
      "unicode", "gr\xc3\xbc\xc3\x9f dich \xe2\x98\x83 \xf0\x9f\x98\x80",
      "empty string", "",
      "data", data_type{0, 1, 2, 254, 255},
      "date", Date::fromMicroseconds(-1234567),
      "uid", Uid(70000),
      "array", makeArray(1, "two", makeArray(), makeDictionary()),
      "nested", makeDictionary("deeper", makeDictionary("deepest", makeArray(
                                                            makeArray(true))))));
}
}

TEST(BinaryTest, MatchesReferenceEncoderForSimpleDocuments) {
  data_type trueDocument{0x62, 0x70, 0x6c, 0x69, 0x73, 0x74, 0x30, 0x30, 0x09,
                         0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x01,
                         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00,
                         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                         0x00, 0x00, 0x00, 0x00, 0x00, 0x09};
  EXPECT_EQ(trueDocument, encodeBinary(Value(true)));

  // the repeated integer is stored once
  data_type arrayDocument{
      0x62, 0x70, 0x6c, 0x69, 0x73, 0x74, 0x30, 0x30, 0xa3, 0x01, 0x02,
      0x01, 0x10, 0x01, 0x51, 0x61, 0x08, 0x0c, 0x0e, 0x00, 0x00, 0x00,
      0x00, 0x00, 0x00, 0x01, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
      0x00, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10};
  EXPECT_EQ(arrayDocument, encodeBinary(Value(makeArray(1, "a", 1))));

  data_type unicodeDocument{
      0x62, 0x70, 0x6c, 0x69, 0x73, 0x74, 0x30, 0x30, 0x64, 0x00,
      0x63, 0x00, 0x61, 0x00, 0x66, 0x00, 0xe9, 0x08, 0x00, 0x00,
      0x00, 0x00, 0x00, 0x00, 0x01, 0x01, 0x00, 0x00, 0x00, 0x00,
      0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x11};
  EXPECT_EQ(unicodeDocument, encodeBinary(Value("caf\xc3\xa9")));
  EXPECT_EQ(Value("caf\xc3\xa9"), decodeBinary(unicodeDocument));
}

TEST(BinaryTest, RoundTripsEveryKind) {
  Value original = everyKind();
  EXPECT_EQ(original, decodeBinary(encodeBinary(original)));
}

TEST(BinaryTest, RoundTripsLeafRoots) {
  Value leaves[] = {Value(false), Value(-1), Value(0.5), Value("leaf"),
                    Value(data_type()), Value(Date()), Value(Uid(0))};
  for (std::size_t i = 0; i < sizeof(leaves) / sizeof(leaves[0]); ++i)
    EXPECT_EQ(leaves[i], decodeBinary(encodeBinary(leaves[i])))
        << kindName(leaves[i].kind());
}

TEST(BinaryTest, RoundTripsEmptyContainers) {
  Value array = decodeBinary(Array().toBinary());
  ASSERT_EQ(Kind::Array, array.kind());
  EXPECT_EQ(0u, array.get<Array>().size());

  Value dict = decodeBinary(Dictionary().toBinary());
  ASSERT_EQ(Kind::Dictionary, dict.kind());
  EXPECT_EQ(0u, dict.get<Dictionary>().size());
}

TEST(BinaryTest, RoundTripsDeepNesting) {
  Value value(makeArray("bottom"));
  for (int depth = 0; depth < 200; ++depth)
    value = depth % 2 ? Value(makeArray(value)) : Value(makeDictionary("k", value));
  EXPECT_EQ(value, decodeBinary(encodeBinary(value)));
}

TEST(BinaryTest, NestingIsLimited) {
  Value deepest = decodeBinary(nestedArrays(config::maxDepth));
  EXPECT_EQ(nestedValue(config::maxDepth), deepest);
  EXPECT_EQ(deepest, decodeBinary(encodeBinary(deepest)));

  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(nestedArrays(config::maxDepth + 1)));
  EXPECT_EQ(DecodeError::Malformed, decodeFailure(nestedArrays(600)));

  Value tooDeep = nestedValue(config::maxDepth + 1);
  EXPECT_THROW(encodeBinary(tooDeep), EncodeError);
  EXPECT_THROW(encodeBinary(tooDeep.get<Array>()), EncodeError);
  EXPECT_THROW(encodeBinary(makeDictionary("k", tooDeep)), EncodeError);
}

TEST(BinaryTest, DistantDatesRoundTrip) {
  Date dates[] = {Date::fromMicroseconds(9007199254740993LL),
                  Date::fromMicroseconds(config::dateMinMicros),
                  Date::fromMicroseconds(config::dateMaxMicros),
                  Date::fromMicroseconds(config::dateMaxMicros - 100)};
  for (std::size_t i = 0; i < sizeof(dates) / sizeof(dates[0]); ++i) {
    Value decoded = decodeBinary(encodeBinary(Value(dates[i])));
    EXPECT_EQ(dates[i].microseconds(), decoded.get<Date>().microseconds());
  }
}

TEST(BinaryTest, DateOutsideTheCalendarIsMalformed) {
  double seconds = 4e11;
  uint64_t bits;
  std::memcpy(&bits, &seconds, sizeof(bits));
  data_type record{0x33};
  appendBigEndian(record, bits, 8);
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt(record, {0x08}, 1)));
}

TEST(BinaryTest, IntegerWidths) {
  EXPECT_EQ(0x10, encodeBinary(Value(255))[8]);
  EXPECT_EQ(0x11, encodeBinary(Value(256))[8]);
  EXPECT_EQ(0x12, encodeBinary(Value(65536))[8]);
  EXPECT_EQ(0x13, encodeBinary(Value(static_cast<int64_t>(1) << 32))[8]);
  EXPECT_EQ(0x13, encodeBinary(Value(-1))[8]);

  data_type huge = encodeBinary(Value(std::numeric_limits<uint64_t>::max()));
  EXPECT_EQ(0x14, huge[8]);
  EXPECT_EQ(0x00, huge[9]);
  EXPECT_EQ(0xff, huge[24]);

  int64_t samples[] = {0,
                       255,
                       256,
                       65535,
                       65536,
                       4294967295LL,
                       4294967296LL,
                       -1,
                       std::numeric_limits<int64_t>::min(),
                       std::numeric_limits<int64_t>::max()};
  for (std::size_t i = 0; i < sizeof(samples) / sizeof(samples[0]); ++i)
    EXPECT_EQ(Value(samples[i]), decodeBinary(encodeBinary(Value(samples[i]))))
        << samples[i];

  Value unsignedValue(std::numeric_limits<uint64_t>::max() - 5);
  EXPECT_EQ(unsignedValue, decodeBinary(encodeBinary(unsignedValue)));
}

TEST(BinaryTest, LongCountsUseAnIntegerRecord) {
  Array array;
  for (int i = 0; i < 15; ++i)
    array.append(i);
  data_type plist = array.toBinary();
  EXPECT_EQ(0xaf, plist[8]);
  EXPECT_EQ(0x10, plist[9]);
  EXPECT_EQ(0x0f, plist[10]);
  EXPECT_EQ(Value(array), decodeBinary(plist));

  Value text(std::string(300, 'x'));
  EXPECT_EQ(text, decodeBinary(encodeBinary(text)));
}

TEST(BinaryTest, RepeatedLeavesAreStoredOnce) {
  Array array;
  for (int i = 0; i < 100; ++i)
    array.append("same");
  data_type plist = array.toBinary();
  EXPECT_EQ(2u, trailerObjectCount(plist));
  EXPECT_EQ(Value(array), decodeBinary(plist));

  // keys and equal string values share a record
  Dictionary dict{{"name", "name"}};
  EXPECT_EQ(2u, trailerObjectCount(dict.toBinary()));
}

TEST(BinaryTest, ManyObjectsWidenReferences) {
  Array array;
  for (int i = 0; i < 1000; ++i)
    array.append(i);
  data_type plist = array.toBinary();
  EXPECT_EQ(1001u, trailerObjectCount(plist));
  EXPECT_EQ(2, plist[plist.size() - 25]);
  EXPECT_EQ(Value(array), decodeBinary(plist));
}

TEST(BinaryTest, SpecialReals) {
  Value nan = decodeBinary(encodeBinary(
      Value(std::numeric_limits<double>::quiet_NaN())));
  ASSERT_EQ(Kind::Real, nan.kind());
  EXPECT_TRUE(std::isnan(nan.get<double>()));

  Value infinity(-std::numeric_limits<double>::infinity());
  EXPECT_EQ(infinity, decodeBinary(encodeBinary(infinity)));
}

TEST(BinaryTest, DecodesSinglePrecisionReals) {
  data_type plist = handBuilt({0x22, 0x40, 0x20, 0x00, 0x00}, {0x08}, 1);
  EXPECT_EQ(Value(2.5), decodeBinary(plist));
}

TEST(BinaryTest, DecodesLatin1AsciiRecords) {
  data_type plist = handBuilt({0x51, 0xe9}, {0x08}, 1);
  EXPECT_EQ(Value("\xc3\xa9"), decodeBinary(plist));
}

TEST(BinaryTest, UidRecords) {
  data_type plist = encodeBinary(Value(Uid(7)));
  EXPECT_EQ(0x80, plist[8]);
  EXPECT_EQ(0x07, plist[9]);

  data_type wide = handBuilt({0x81, 0x01, 0x00}, {0x08}, 1);
  EXPECT_EQ(Value(Uid(256)), decodeBinary(wide));
}

TEST(BinaryTest, NullCannotBeEncoded) {
  EXPECT_THROW(encodeBinary(Value()), EncodeError);

  Array array{1, Value()};
  EXPECT_THROW(array.toBinary(), EncodeError);
}

TEST(BinaryTest, InvalidUtf8CannotBeEncoded) {
  EXPECT_THROW(encodeBinary(Value("bad \xff byte")), EncodeError);
}

TEST(BinaryTest, TruncatedDocuments) {
  data_type plist = encodeBinary(everyKind());

  data_type headerOnly(plist.begin(), plist.begin() + 20);
  EXPECT_EQ(DecodeError::Truncated, decodeFailure(headerOnly));

  data_type lastByteMissing(plist.begin(), plist.end() - 1);
  EXPECT_EQ(DecodeError::Truncated, decodeFailure(lastByteMissing));

  data_type bodyCut(plist);
  bodyCut.erase(bodyCut.begin() + 10, bodyCut.begin() + 40);
  EXPECT_EQ(DecodeError::Truncated, decodeFailure(bodyCut));

  EXPECT_EQ(DecodeError::Truncated, decodeFailure(data_type{'b', 'p', 'l'}));
  EXPECT_EQ(DecodeError::Truncated,
            decodeFailure(data_type{'b', 'p', 'l', 'i', 's', 't', '0', '0'}));
  EXPECT_EQ(DecodeError::Truncated, decodeFailure(data_type()));
}

TEST(BinaryTest, ObjectRunningIntoTheOffsetTableIsTruncated) {
  // a five character string with only two characters present
  data_type plist = handBuilt({0x55, 'a', 'b'}, {0x08}, 1);
  EXPECT_EQ(DecodeError::Truncated, decodeFailure(plist));
}

TEST(BinaryTest, UnsupportedVersion) {
  data_type plist = encodeBinary(Value(1));
  plist[6] = '1';
  plist[7] = '5';
  EXPECT_EQ(DecodeError::UnsupportedVersion, decodeFailure(plist));
}

TEST(BinaryTest, MalformedDocuments) {
  std::string notPlist(64, 'x');
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(data_type(notPlist.begin(), notPlist.end())));

  // null and fill records
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0x00}, {0x08}, 1)));
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0x0f}, {0x08}, 1)));

  // unknown object type
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0x70}, {0x08}, 1)));

  // an array that contains itself
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0xa1, 0x00}, {0x08}, 1)));

  // a dictionary keyed by an integer
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(
                handBuilt({0xd1, 0x01, 0x01, 0x10, 0x05}, {0x08, 0x0b}, 2)));

  // reference past the last object
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0xa1, 0x05}, {0x08}, 1)));

  // offset pointing into the header
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0x09}, {0x02}, 1)));

  // top object out of range, zero width references
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0x09}, {0x08}, 1, 1)));
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0x09}, {0x08}, 1, 0, 1, 0)));

  // lone UTF-16 surrogate
  EXPECT_EQ(DecodeError::Malformed,
            decodeFailure(handBuilt({0x61, 0xd8, 0x00}, {0x08}, 1)));
}

TEST(BinaryTest, SharedSubtreesAreNotCycles) {
  // both elements reference the same empty array
  data_type plist = handBuilt({0xa2, 0x01, 0x01, 0xa0}, {0x08, 0x0b}, 2);
  EXPECT_EQ(Value(makeArray(makeArray(), makeArray())), decodeBinary(plist));
}

TEST(BinaryTest, SharedReferencesCannotExpandWithoutBound) {
  Value small = decodeBinary(sharedLevels(10));
  EXPECT_EQ(2u, small.get<Array>().size());

  // 2^27 - 1 nodes from a document of under 150 bytes
  data_type bomb = sharedLevels(26);
  EXPECT_GT(200u, bomb.size());
  EXPECT_EQ(DecodeError::Malformed, decodeFailure(bomb));
}

TEST(BinaryTest, StreamsAndAutoDetection) {
  Value original = everyKind();
  std::stringstream stream;
  writePlistBinary(stream, original);

  std::string bytes = stream.str();
  EXPECT_EQ(Format::Binary,
            detectFormat(bytes.data(), static_cast<int64_t>(bytes.size())));
  EXPECT_EQ(original, readPlist(stream));
  EXPECT_EQ(original.get<Dictionary>(),
            readPlist<Dictionary>(bytes.data(),
                                  static_cast<int64_t>(bytes.size())));
  EXPECT_THROW(
      readPlist<Array>(bytes.data(), static_cast<int64_t>(bytes.size())),
      ConversionError);
}
