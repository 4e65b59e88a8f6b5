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

#include <string>
#include <vector>

#include "PlistTree.hpp"

using namespace PlistTree;

TEST(ArrayTest, StartsEmpty) {
  Array array;
  EXPECT_EQ(0u, array.size());
  EXPECT_TRUE(array.empty());
  EXPECT_FALSE(array.get(0));
  EXPECT_TRUE(array.begin() == array.end());
}

TEST(ArrayTest, AppendAndGet) {
  Array array;
  array.append(1);
  array.append("two");
  array.append(3.0);

  ASSERT_EQ(3u, array.size());
  EXPECT_EQ(Value(1), array.get(0)->value());
  EXPECT_EQ("two", array.get(1)->value().get<std::string>());
  EXPECT_EQ(Kind::Real, (*array.get(2))->kind());
  EXPECT_FALSE(array.get(3));
}

TEST(ArrayTest, InsertBounds) {
  Array array{1, 3};
  array.insert(1, 2);
  array.insert(3, 4);
  EXPECT_EQ((Array{1, 2, 3, 4}), array);
  EXPECT_THROW(array.insert(5, 5), BoundsError);
  EXPECT_EQ(4u, array.size());
}

TEST(ArrayTest, RemoveShiftsLaterElementsDown) {
  Array array{"a", "b", "c", "d", "e"};
  Value removed = array.remove(1);
  EXPECT_EQ(Value("b"), removed);

  ASSERT_EQ(4u, array.size());
  EXPECT_EQ(Value("a"), array.get(0)->value());
  EXPECT_EQ(Value("c"), array.get(1)->value());
  EXPECT_EQ(Value("d"), array.get(2)->value());
  EXPECT_EQ(Value("e"), array.get(3)->value());

  EXPECT_THROW(array.remove(4), BoundsError);
  EXPECT_EQ(4u, array.size());
}

TEST(ArrayTest, SetReturnsPreviousElement) {
  Array array{1, 2};
  Value previous = array.set(0, "one");
  EXPECT_EQ(Value(1), previous);
  EXPECT_EQ((Array{"one", 2}), array);
  EXPECT_THROW(array.set(2, 3), BoundsError);
}

TEST(ArrayTest, IterationIsOrderedAndRestartable) {
  Array array{1, 2, 3};
  for (int pass = 0; pass < 2; ++pass) {
    int64_t expected = 1;
    for (Array::const_iterator it = array.begin(); it != array.end(); ++it)
      EXPECT_EQ(expected++, it->get<Integer>().signedValue());
    EXPECT_EQ(4, expected);
  }
}

TEST(ArrayTest, MutationInvalidatesItems) {
  Array array{1, 2};
  boost::optional<Item> item = array.get(0);
  ASSERT_TRUE(item);
  EXPECT_TRUE(item->isValid());

  array.append(3);
  EXPECT_FALSE(item->isValid());
  EXPECT_THROW(item->value(), BoundsError);
  EXPECT_THROW(item->clone(), BoundsError);

  // a fresh handle sees the current contents
  EXPECT_EQ(Value(1), array.get(0)->value());
}

TEST(ArrayTest, EveryStructuralMutationInvalidates) {
  Array array{1, 2, 3};

  boost::optional<Item> item = array.get(0);
  array.insert(0, 0);
  EXPECT_THROW(item->value(), BoundsError);

  item = array.get(0);
  array.remove(0);
  EXPECT_THROW(item->value(), BoundsError);

  item = array.get(0);
  array.set(0, 10);
  EXPECT_THROW(item->value(), BoundsError);

  item = array.get(0);
  array.clear();
  EXPECT_THROW(item->value(), BoundsError);
}

TEST(ArrayTest, MutationInvalidatesIterators) {
  Array array{1, 2, 3};
  Array::const_iterator it = array.begin();
  array.remove(2);
  EXPECT_THROW(*it, BoundsError);
  EXPECT_THROW(++it, BoundsError);
}

TEST(ArrayTest, MutableIterationEditsInPlace) {
  Array array{1, 2, 3};
  for (Array::iterator it = array.begin(); it != array.end(); ++it)
    *it = it->get<Integer>().signedValue() * 10;
  EXPECT_EQ((Array{10, 20, 30}), array);

  // writing through an iterator keeps handles valid
  boost::optional<Item> item = array.get(2);
  Array::iterator it = array.begin();
  it->asInteger()->setSigned(7);
  ++it;
  *it = "text";
  EXPECT_TRUE(item->isValid());
  EXPECT_EQ(Value("text"), *it);
  EXPECT_EQ(Value(7), array.get(0)->value());
}

TEST(ArrayTest, MutationInvalidatesMutableIterators) {
  Array array{1, 2, 3};
  Array::iterator it = array.begin();
  array.append(4);
  EXPECT_THROW(*it, BoundsError);
  EXPECT_THROW(++it, BoundsError);

  Array::const_iterator converted = array.begin();
  array.clear();
  EXPECT_THROW(*converted, BoundsError);
}

TEST(ArrayTest, DestroyedArrayInvalidatesItems) {
  boost::optional<Item> item;
  {
    Array array{"short lived"};
    item = array.get(0);
    EXPECT_EQ("short lived", item->value().get<std::string>());
  }
  EXPECT_FALSE(item->isValid());
  EXPECT_THROW(item->value(), BoundsError);
}

TEST(ArrayTest, ClonedItemOutlivesArray) {
  Value detached;
  {
    Array array{Value(makeArray("nested", 1))};
    detached = array.get(0)->clone();
  }
  EXPECT_EQ(Value(makeArray("nested", 1)), detached);
}

TEST(ArrayTest, MutableItemEditsInPlace) {
  Array array{1, 2};
  boost::optional<ItemMut> item = array.getMut(1);
  ASSERT_TRUE(item);
  item->value() = "two";
  EXPECT_EQ(Value("two"), array.get(1)->value());

  // editing an element is not a structural change of this array
  EXPECT_TRUE(item->isValid());
  array.remove(0);
  EXPECT_THROW(item->value(), BoundsError);
}

TEST(ArrayTest, CopiesAreIndependent) {
  Array original{1, 2};
  boost::optional<Item> item = original.get(0);
  Array copy(original);
  copy.append(3);
  EXPECT_EQ(2u, original.size());
  EXPECT_TRUE(item->isValid());

  Array clone = original.clone();
  EXPECT_EQ(original, clone);

  copy = original;
  EXPECT_EQ(original, copy);
}

TEST(ArrayTest, MoveKeepsItemsValid) {
  Array source{"kept"};
  boost::optional<Item> item = source.get(0);
  Array target(std::move(source));
  EXPECT_TRUE(item->isValid());
  EXPECT_EQ("kept", item->value().get<std::string>());
}

TEST(ArrayTest, ToVectorCopiesElements) {
  Array array{1, "x"};
  std::vector<Value> values = array.toVector();
  ASSERT_EQ(2u, values.size());
  values[0] = 5;
  EXPECT_EQ(Value(1), array.get(0)->value());
}

TEST(ArrayTest, EncodesThroughItsOwnShorthands) {
  Array array{1, "a", 1};
  EXPECT_EQ(encodeBinary(Value(array)), array.toBinary());
  EXPECT_EQ(encodeXML(Value(array)), array.toXML());
}
