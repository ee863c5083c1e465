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

#ifndef LIB_INCLUDE_RING_BUFFER_HPP_
#define LIB_INCLUDE_RING_BUFFER_HPP_

#include <cassert>
#include <cstddef>  // for std::size_t
#include <string>
#include <utility>  // for std::move
#include <vector>

namespace mediaq {

/// Keeps the most recent `capacity` elements; used to hold the tail of a
/// subprocess diagnostic stream without unbounded growth.
template <typename T> struct ring_buffer {
  explicit ring_buffer(const std::size_t capacity) :
    capacity{capacity}, buf(capacity) {
    assert(capacity > 0);
  }

  // clang-format off
  auto push_back(const T &t) {buf[counter++ % capacity] = t;}
  auto push_back(T &&t) {buf[counter++ % capacity] = std::move(t);}
  [[nodiscard]] auto
  size() const {return counter < capacity ? counter : capacity;}
  [[nodiscard]] auto
  empty() const {return counter == 0;}
  [[nodiscard]] auto
  full() const {return counter >= capacity;}
  [[nodiscard]] auto
  total_pushed() const {return counter;}
  auto clear() {counter = 0;}
  // clang-format on

  /// Oldest retained element
  [[nodiscard]] auto
  front() const -> const T & {
    return buf[counter < capacity ? 0 : counter % capacity];
  }

  /// Most recently pushed element
  [[nodiscard]] auto
  back() const -> const T & {
    return buf[(counter - 1) % capacity];
  }

  /// Retained elements, oldest first
  [[nodiscard]] auto
  to_vector() const -> std::vector<T> {
    std::vector<T> r;
    r.reserve(size());
    const auto first = counter < capacity ? 0 : counter - capacity;
    for (auto i = first; i < counter; ++i)
      r.push_back(buf[i % capacity]);
    return r;
  }

  std::size_t capacity{};
  std::size_t counter{};
  std::vector<T> buf;
};

/// Join retained lines, oldest first, with newlines
[[nodiscard]] inline auto
join_lines(const ring_buffer<std::string> &rb) -> std::string {
  std::string r;
  bool first{true};
  for (const auto &line : rb.to_vector()) {
    if (!first)
      r += '\n';
    r += line;
    first = false;
  }
  return r;
}

}  // namespace mediaq

#endif  // LIB_INCLUDE_RING_BUFFER_HPP_
