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

#ifndef LIB_SOURCE_REGISTRY_HPP_
#define LIB_SOURCE_REGISTRY_HPP_

#include "source_backend.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mediaq {

/// Ordered list of backends. Resolution picks the first backend that claims
/// a URL, so narrow backends must be added before catch-all ones.
class source_registry {
public:
  source_registry() = default;

  // clang-format off
  source_registry(const source_registry &) = delete;
  auto operator=(const source_registry &) -> source_registry & = delete;
  // clang-format on

  auto
  add(std::shared_ptr<const source_backend> backend) -> void;

  /// Remove by name; returns true if a backend was removed
  auto
  remove(const std::string_view name) -> bool;

  [[nodiscard]] auto
  resolve(const std::string &url) const
    -> std::shared_ptr<const source_backend>;

  /// Same as resolve but reports a missing backend as an error
  [[nodiscard]] auto
  resolve(const std::string &url, std::error_code &error) const
    -> std::shared_ptr<const source_backend>;

  [[nodiscard]] auto
  names() const -> std::vector<std::string>;

  [[nodiscard]] auto
  size() const -> std::size_t;

private:
  mutable std::shared_mutex mtx;
  std::vector<std::shared_ptr<const source_backend>> backends;
};

}  // namespace mediaq

#endif  // LIB_SOURCE_REGISTRY_HPP_
