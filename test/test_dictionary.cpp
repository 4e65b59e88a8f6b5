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

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "PlistTree.hpp"

using namespace PlistTree;

TEST(DictionaryTest, StartsEmpty) {
  Dictionary dict;
  EXPECT_EQ(0u, dict.size());
  EXPECT_TRUE(dict.empty());
  EXPECT_FALSE(dict.get("missing"));
  EXPECT_FALSE(dict.containsKey("missing"));
  EXPECT_FALSE(dict.remove("missing"));
}

TEST(DictionaryTest, InsertNewKeysAppends) {
  Dictionary dict;
  EXPECT_FALSE(dict.insert("b", 1));
  EXPECT_FALSE(dict.insert("a", 2));
  EXPECT_FALSE(dict.insert("c", 3));

  std::vector<std::string> expected;
  expected.push_back("b");
  expected.push_back("a");
  expected.push_back("c");
  EXPECT_EQ(expected, dict.keys());
  EXPECT_TRUE(dict.containsKey("a"));
}

TEST(DictionaryTest, ReinsertReplacesInPlace) {
  Dictionary dict{{"first", 1}, {"second", 2}, {"third", 3}};
  boost::optional<Value> previous = dict.insert("second", "two");
  ASSERT_TRUE(previous);
  EXPECT_EQ(Value(2), *previous);

  EXPECT_EQ(3u, dict.size());
  std::vector<std::string> keys = dict.keys();
  EXPECT_EQ("second", keys[1]);
  EXPECT_EQ(Value("two"), dict.get("second")->value());
}

TEST(DictionaryTest, LengthCountsDistinctKeys) {
  Dictionary dict;
  std::set<std::string> distinct;
  const char* keys[] = {"a", "b", "a", "c", "b", "b", "d", "a"};
  for (int i = 0; i < 8; ++i) {
    std::size_t before = dict.size();
    bool existed = dict.containsKey(keys[i]);
    dict.insert(keys[i], i);
    distinct.insert(keys[i]);
    EXPECT_EQ(distinct.size(), dict.size());
    if (existed)
      EXPECT_EQ(before, dict.size());
  }
  EXPECT_EQ(Value(7), dict.get("a")->value());
}

TEST(DictionaryTest, RemoveKeepsOrderOfOthers) {
  Dictionary dict{{"a", 1}, {"b", 2}, {"c", 3}, {"d", 4}};
  boost::optional<Value> removed = dict.remove("b");
  ASSERT_TRUE(removed);
  EXPECT_EQ(Value(2), *removed);
  EXPECT_FALSE(dict.containsKey("b"));

  std::vector<std::string> keys = dict.keys();
  ASSERT_EQ(3u, keys.size());
  EXPECT_EQ("a", keys[0]);
  EXPECT_EQ("c", keys[1]);
  EXPECT_EQ("d", keys[2]);

  // lookups still find the entries that moved
  EXPECT_EQ(Value(3), dict.get("c")->value());
  EXPECT_EQ(Value(4), dict.get("d")->value());
}

TEST(DictionaryTest, IterationFollowsInsertionOrder) {
  Dictionary dict{{"z", 1}, {"y", 2}, {"x", 3}};
  for (int pass = 0; pass < 2; ++pass) {
    std::string order;
    int64_t sum = 0;
    for (Dictionary::const_iterator it = dict.begin(); it != dict.end(); ++it) {
      order += it->first;
      sum += it->second.get<Integer>().signedValue();
    }
    EXPECT_EQ("zyx", order);
    EXPECT_EQ(6, sum);
  }
}

TEST(DictionaryTest, MutationInvalidatesItems) {
  Dictionary dict{{"a", 1}};
  boost::optional<Item> item = dict.get("a");
  ASSERT_TRUE(item);

  dict.insert("b", 2);
  EXPECT_THROW(item->value(), BoundsError);

  item = dict.get("a");
  dict.insert("a", 3);
  EXPECT_THROW(item->value(), BoundsError);

  item = dict.get("a");
  dict.remove("b");
  EXPECT_THROW(item->value(), BoundsError);

  item = dict.get("a");
  dict.clear();
  EXPECT_THROW(item->value(), BoundsError);
}

TEST(DictionaryTest, MutationInvalidatesIterators) {
  Dictionary dict{{"a", 1}, {"b", 2}};
  Dictionary::const_iterator it = dict.begin();
  dict.insert("c", 3);
  EXPECT_THROW(*it, BoundsError);
}

TEST(DictionaryTest, MutableIterationEditsValues) {
  Dictionary dict{{"a", 1}, {"b", 2}};
  for (Dictionary::iterator it = dict.begin(); it != dict.end(); ++it)
    it->second = it->first + "!";
  EXPECT_EQ(Value("a!"), dict.get("a")->value());
  EXPECT_EQ(Value("b!"), dict.get("b")->value());

  boost::optional<Item> item = dict.get("b");
  Dictionary::iterator it = dict.begin();
  (*it).second = 5;
  EXPECT_EQ("a", (*it).first);
  ++it;
  EXPECT_EQ("b", it->first);
  EXPECT_TRUE(item->isValid());
  EXPECT_EQ(Value(5), dict.get("a")->value());

  dict.remove("a");
  EXPECT_THROW(*it, BoundsError);
  EXPECT_THROW(++it, BoundsError);
}

TEST(DictionaryTest, ToVectorCopiesEntriesInOrder) {
  Dictionary dict{{"z", 1}, {"a", makeArray(2)}};
  std::vector<std::pair<std::string, Value> > entries = dict.toVector();
  ASSERT_EQ(2u, entries.size());
  EXPECT_EQ("z", entries[0].first);
  EXPECT_EQ(Value(1), entries[0].second);
  EXPECT_EQ("a", entries[1].first);
  EXPECT_EQ(Value(makeArray(2)), entries[1].second);

  entries[1].second.asArray()->append(3);
  EXPECT_EQ(1u, dict.get("a")->value().get<Array>().size());
}

TEST(DictionaryTest, FailedLookupDoesNotInvalidate) {
  Dictionary dict{{"a", 1}};
  boost::optional<Item> item = dict.get("a");
  EXPECT_FALSE(dict.remove("missing"));
  EXPECT_FALSE(dict.get("missing"));
  EXPECT_TRUE(item->isValid());
}

TEST(DictionaryTest, MutableItem) {
  Dictionary dict{{"list", Array{1}}};
  boost::optional<ItemMut> item = dict.getMut("list");
  ASSERT_TRUE(item);
  item->value().asArray()->append(2);
  EXPECT_EQ(Value(Array{1, 2}), dict.get("list")->value());
}

TEST(DictionaryTest, MergeOverwritesSharedKeys) {
  Dictionary dict{{"a", 1}, {"b", 2}};
  Dictionary other{{"b", "two"}, {"c", 3}};
  dict.merge(other);

  EXPECT_EQ((Dictionary{{"a", 1}, {"b", "two"}, {"c", 3}}), dict);
  std::vector<std::string> keys = dict.keys();
  EXPECT_EQ("a", keys[0]);
  EXPECT_EQ("b", keys[1]);
  EXPECT_EQ("c", keys[2]);
  EXPECT_EQ(2u, other.size());

  dict.merge(dict);
  EXPECT_EQ(3u, dict.size());
}

TEST(DictionaryTest, CopyAndMove) {
  Dictionary original{{"k", "v"}};
  Dictionary copy(original);
  copy.insert("k2", "v2");
  EXPECT_EQ(1u, original.size());

  boost::optional<Item> item = original.get("k");
  Dictionary moved(std::move(original));
  EXPECT_TRUE(item->isValid());
  EXPECT_EQ(Value("v"), moved.get("k")->value());

  Dictionary clone = moved.clone();
  EXPECT_EQ(moved, clone);
}

TEST(DictionaryTest, EncodesThroughItsOwnShorthands) {
  Dictionary dict{{"key", "value"}};
  EXPECT_EQ(encodeBinary(Value(dict)), dict.toBinary());
  EXPECT_EQ(encodeXML(Value(dict)), dict.toXML());
}
