/* MIT License
 *
 * Copyright (c) 2025 Andrew D Smith
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <lru_tracker.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace mediaq;  // NOLINT

TEST(lru_tracker_test, put_and_get) {
  lru_tracker<std::string, int> t(2);
  t.put("a", 1);
  t.put("b", 2);
  EXPECT_EQ(t.size(), 2);
  EXPECT_TRUE(t.full());
  EXPECT_EQ(t.get("a"), 1);
  EXPECT_FALSE(t.get("z"));
}

TEST(lru_tracker_test, evicts_least_recently_used) {
  lru_tracker<std::string, int> t(2);
  t.put("a", 1);
  t.put("b", 2);
  // touching "a" makes "b" the oldest
  EXPECT_TRUE(t.get("a"));
  t.put("c", 3);
  EXPECT_TRUE(t.contains("a"));
  EXPECT_FALSE(t.contains("b"));
  EXPECT_TRUE(t.contains("c"));
}

TEST(lru_tracker_test, peek_does_not_touch) {
  lru_tracker<std::string, int> t(2);
  t.put("a", 1);
  t.put("b", 2);
  EXPECT_EQ(t.peek("a"), 1);
  t.put("c", 3);
  EXPECT_FALSE(t.contains("a"));
}

TEST(lru_tracker_test, replace_and_erase) {
  lru_tracker<std::string, int> t(2);
  t.put("a", 1);
  t.put("a", 10);
  EXPECT_EQ(t.size(), 1);
  EXPECT_EQ(t.peek("a"), 10);
  EXPECT_TRUE(t.erase("a"));
  EXPECT_FALSE(t.erase("a"));
  t.put("x", 1);
  t.clear();
  EXPECT_EQ(t.size(), 0);
}
