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

#include <metadata_cache.hpp>

#include <download.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace mediaq;  // NOLINT

TEST(metadata_cache_test, hit_and_miss_counts) {
  metadata_cache cache;
  EXPECT_FALSE(cache.get("https://youtu.be/a"));
  cache.put("https://youtu.be/a", {"Song", "Band"});
  const auto m = cache.get("https://youtu.be/a");
  ASSERT_TRUE(m);
  EXPECT_EQ(*m, (media_metadata{"Song", "Band"}));
  EXPECT_EQ(cache.hits(), 1);
  EXPECT_EQ(cache.misses(), 1);
  EXPECT_EQ(cache.size(), 1);
}

TEST(metadata_cache_test, expired_entries_are_dropped) {
  metadata_cache cache(metadata_cache::default_capacity,
                       std::chrono::seconds{0});
  cache.put("u", {"t", "a"});
  EXPECT_FALSE(cache.get("u"));
  EXPECT_EQ(cache.size(), 0);
}

TEST(metadata_cache_test, capacity_bound) {
  metadata_cache cache(2);
  cache.put("a", {"1", ""});
  cache.put("b", {"2", ""});
  cache.put("c", {"3", ""});
  EXPECT_EQ(cache.size(), 2);
  EXPECT_FALSE(cache.get("a"));
  EXPECT_TRUE(cache.get("c"));
}

TEST(metadata_cache_test, concurrent_access) {
  metadata_cache cache(64);
  std::vector<std::jthread> threads;
  for (auto i = 0; i < 4; ++i)
    threads.emplace_back([&cache, i] {
      for (auto j = 0; j < 100; ++j) {
        const auto url = std::to_string((i * 100 + j) % 80);
        cache.put(url, {url, ""});
        [[maybe_unused]] const auto m = cache.get(url);
      }
    });
  threads.clear();
  EXPECT_LE(cache.size(), 64);
  EXPECT_EQ(cache.hits() + cache.misses(), 400);
}
