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

#include "source_registry.hpp"

#include "logger.hpp"
#include "source_backend.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mediaq {

auto
source_registry::add(std::shared_ptr<const source_backend> backend) -> void {
  const std::string name{backend->name()};
  std::size_t position{};
  {
    std::unique_lock lck{mtx};
    position = std::size(backends);
    backends.push_back(std::move(backend));
  }
  logger::instance().debug("Registered backend {} at position {}", name,
                           position);
}

auto
source_registry::remove(const std::string_view name) -> bool {
  std::unique_lock lck{mtx};
  const auto n_removed = std::erase_if(
    backends, [&](const auto &b) { return b->name() == name; });
  return n_removed > 0;
}

[[nodiscard]] auto
source_registry::resolve(const std::string &url) const
  -> std::shared_ptr<const source_backend> {
  std::shared_lock lck{mtx};
  const auto itr = std::ranges::find_if(
    backends, [&](const auto &b) { return b->supports(url); });
  return itr == std::cend(backends) ? nullptr : *itr;
}

[[nodiscard]] auto
source_registry::resolve(const std::string &url, std::error_code &error) const
  -> std::shared_ptr<const source_backend> {
  auto backend = resolve(url);
  if (backend == nullptr) {
    logger::instance().warning("No backend for url: {}", url);
    error = source_error_code::no_backend_for_url;
  }
  return backend;
}

[[nodiscard]] auto
source_registry::names() const -> std::vector<std::string> {
  std::shared_lock lck{mtx};
  std::vector<std::string> r;
  std::ranges::transform(backends, std::back_inserter(r), [](const auto &b) {
    return std::string(b->name());
  });
  return r;
}

[[nodiscard]] auto
source_registry::size() const -> std::size_t {
  std::shared_lock lck{mtx};
  return std::size(backends);
}

}  // namespace mediaq
