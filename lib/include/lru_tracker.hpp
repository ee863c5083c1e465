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

#ifndef LIB_INCLUDE_LRU_TRACKER_HPP_
#define LIB_INCLUDE_LRU_TRACKER_HPP_

#include <cassert>
#include <cstddef>
#include <iterator>  // for std::cend, std::size
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace mediaq {

/// Least-recently-used map from keys to values. Not thread safe; owners
/// provide their own locking.
template <typename K, typename V> class lru_tracker {
public:
  explicit lru_tracker(const std::size_t capacity) : capacity{capacity} {
    assert(capacity > 0);
  }

  [[nodiscard]] auto
  size() const noexcept -> std::size_t {
    return std::size(the_map);
  }

  [[nodiscard]] auto
  full() const noexcept -> bool {
    return size() >= capacity;
  }

  [[nodiscard]] auto
  contains(const K &k) const noexcept -> bool {
    return the_map.contains(k);
  }

  /// Value for `k` without changing recency
  [[nodiscard]] auto
  peek(const K &k) const -> std::optional<V> {
    const auto itr = the_map.find(k);
    if (itr == std::cend(the_map))
      return std::nullopt;
    return itr->second->second;
  }

  /// Value for `k`, marking it most recently used
  [[nodiscard]] auto
  get(const K &k) -> std::optional<V> {
    const auto itr = the_map.find(k);
    if (itr == std::cend(the_map))
      return std::nullopt;
    move_to_front(itr);
    return itr->second->second;
  }

  /// Insert or replace, evicting the least recently used entry if needed
  auto
  put(const K &k, V v) -> void {
    const auto itr = the_map.find(k);
    if (itr != std::cend(the_map)) {
      itr->second->second = std::move(v);
      move_to_front(itr);
      return;
    }
    if (full())
      pop();
    the_list.emplace_front(k, std::move(v));
    the_map.emplace(k, std::begin(the_list));
  }

  auto
  erase(const K &k) -> bool {
    const auto itr = the_map.find(k);
    if (itr == std::cend(the_map))
      return false;
    the_list.erase(itr->second);
    the_map.erase(itr);
    return true;
  }

  auto
  clear() noexcept -> void {
    the_map.clear();
    the_list.clear();
  }

private:
  using list_type = std::list<std::pair<K, V>>;

  auto
  move_to_front(typename std::unordered_map<
                K, typename list_type::iterator>::iterator itr) -> void {
    // splice keeps the node, so the iterator stored in the map stays valid
    the_list.splice(std::begin(the_list), the_list, itr->second);
  }

  auto
  pop() -> void {
    the_map.erase(the_list.back().first);
    the_list.pop_back();
  }

  list_type the_list;
  std::unordered_map<K, typename list_type::iterator> the_map;
  std::size_t capacity{};
};

}  // namespace mediaq

#endif  // LIB_INCLUDE_LRU_TRACKER_HPP_
