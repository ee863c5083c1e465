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

#ifndef LIB_SOURCE_BACKEND_HPP_
#define LIB_SOURCE_BACKEND_HPP_

#include "download.hpp"
#include "source_progress.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace mediaq {

/// A unit that can fetch one class of URLs. Implementations must keep
/// `supports` free of I/O so that resolving a URL stays cheap.
class source_backend {
public:
  virtual ~source_backend() = default;

  [[nodiscard]] virtual auto
  name() const -> std::string_view = 0;

  [[nodiscard]] virtual auto
  supports(const std::string &url) const -> bool = 0;

  [[nodiscard]] virtual auto
  metadata(const std::string &url,
           std::error_code &error) const -> media_metadata = 0;

  /// Best-effort estimate; nothing on any failure
  [[nodiscard]] virtual auto
  estimate_size(const std::string &url) const
    -> std::optional<std::uint64_t> = 0;

  /// Best-effort; false when uncertain
  [[nodiscard]] virtual auto
  is_livestream(const std::string &url) const -> bool = 0;

  [[nodiscard]] virtual auto
  download(const download_request &request, progress_channel &progress,
           std::error_code &error) const -> download_output = 0;
};

}  // namespace mediaq

/// @brief Enum for error codes related to backends and their resolution
enum class source_error_code : std::uint8_t {
  ok = 0,
  no_backend_for_url = 1,
  unsupported_url = 2,
  empty_title = 3,
  output_file_missing = 4,
  file_too_large = 5,
};

template <>
struct std::is_error_code_enum<source_error_code> : public std::true_type {};

struct source_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "source";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "no backend for url"s;
    case 2: return "unsupported url"s;
    case 3: return "empty title"s;
    case 4: return "output file missing"s;
    case 5: return "file too large"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(source_error_code e) -> std::error_code {
  static auto category = source_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_SOURCE_BACKEND_HPP_
