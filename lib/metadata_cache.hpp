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

#ifndef LIB_METADATA_CACHE_HPP_
#define LIB_METADATA_CACHE_HPP_

#include "download.hpp"
#include "lru_tracker.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace mediaq {

/// Title and artist by URL, so that repeated requests for the same media do
/// not each spawn the extractor. Entries expire after `ttl`; the least
/// recently used entry goes first when the cache is full.
class metadata_cache {
public:
  using clock = std::chrono::steady_clock;
  static constexpr std::size_t default_capacity{1024};
  static constexpr auto default_ttl = std::chrono::hours{24};

  explicit metadata_cache(
    const std::size_t capacity = default_capacity,
    const std::chrono::seconds ttl = default_ttl) :
    ttl{ttl}, entries{capacity} {}

  // clang-format off
  metadata_cache(const metadata_cache &) = delete;
  auto operator=(const metadata_cache &) -> metadata_cache & = delete;
  // clang-format on

  [[nodiscard]] auto
  get(const std::string &url) -> std::optional<media_metadata>;

  auto
  put(const std::string &url, const media_metadata &m) -> void;

  [[nodiscard]] auto
  size() const -> std::size_t;

  [[nodiscard]] auto
  hits() const -> std::uint64_t {
    std::lock_guard lck{mtx};
    return n_hits;
  }

  [[nodiscard]] auto
  misses() const -> std::uint64_t {
    std::lock_guard lck{mtx};
    return n_misses;
  }

private:
  struct entry {
    media_metadata metadata;
    clock::time_point cached_at{};
  };

  mutable std::mutex mtx;
  std::chrono::seconds ttl{};
  lru_tracker<std::string, entry> entries;
  std::uint64_t n_hits{};
  std::uint64_t n_misses{};
};

}  // namespace mediaq

#endif  // LIB_METADATA_CACHE_HPP_
