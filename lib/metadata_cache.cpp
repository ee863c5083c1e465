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

#include "metadata_cache.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace mediaq {

[[nodiscard]] auto
metadata_cache::get(const std::string &url) -> std::optional<media_metadata> {
  std::lock_guard lck{mtx};
  const auto e = entries.get(url);
  if (!e) {
    ++n_misses;
    return std::nullopt;
  }
  if (clock::now() - e->cached_at >= ttl) {
    entries.erase(url);
    ++n_misses;
    return std::nullopt;
  }
  ++n_hits;
  return e->metadata;
}

auto
metadata_cache::put(const std::string &url, const media_metadata &m) -> void {
  std::lock_guard lck{mtx};
  entries.put(url, {m, clock::now()});
}

[[nodiscard]] auto
metadata_cache::size() const -> std::size_t {
  std::lock_guard lck{mtx};
  return entries.size();
}

}  // namespace mediaq
