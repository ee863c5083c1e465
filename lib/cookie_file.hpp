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

#ifndef LIB_COOKIE_FILE_HPP_
#define LIB_COOKIE_FILE_HPP_

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace mediaq {

/// True if `text` has a Netscape cookie file header and at least one
/// cookie line (seven tab-separated fields)
[[nodiscard]] auto
is_netscape_cookie_text(const std::string_view text) -> bool;

/// Check that the file at `path` is a readable Netscape cookie file
auto
validate_cookie_file(const std::string &path,
                     std::error_code &error) noexcept -> void;

/// Replace the cookie file with `contents` after validating them. The new
/// contents are written beside the file and renamed over it, so readers
/// never see a partial file.
auto
replace_cookie_file(const std::string &path, const std::string &contents,
                    std::error_code &error) noexcept -> void;

#ifndef MEDIAQ_NOEXCEPT
inline auto
replace_cookie_file(const std::string &path,
                    const std::string &contents) -> void {
  std::error_code error;
  replace_cookie_file(path, contents, error);
  if (error)
    throw std::system_error(error, std::format("[cookie file: {}]", path));
}
#endif

}  // namespace mediaq

/// @brief Enum for error codes related to cookie files
enum class cookie_file_error_code : std::uint8_t {
  ok = 0,
  read_failed = 1,
  invalid_format = 2,
  write_failed = 3,
};

template <>
struct std::is_error_code_enum<cookie_file_error_code> : public std::true_type {
};

struct cookie_file_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "cookie_file";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "failed to read cookie file"s;
    case 2: return "not a Netscape cookie file"s;
    case 3: return "failed to write cookie file"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(cookie_file_error_code e) -> std::error_code {
  static auto category = cookie_file_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_COOKIE_FILE_HPP_
