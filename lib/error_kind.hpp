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

#ifndef LIB_ERROR_KIND_HPP_
#define LIB_ERROR_KIND_HPP_

#include <boost/describe.hpp>  // for BOOST_DESCRIBE_ENUM

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace mediaq {

/// @brief Classified failure of an extraction attempt. Every failed attempt
/// maps to exactly one of these; value 0 is reserved so that the enum can
/// be carried in a std::error_code.
enum class error_kind : std::uint8_t {
  ok = 0,
  network_error = 1,
  invalid_cookies = 2,
  bot_detection = 3,
  video_unavailable = 4,
  fragment_error = 5,
  postprocessing_error = 6,
  disk_space_error = 7,
  unknown = 8,
};

// clang-format off
BOOST_DESCRIBE_ENUM(
  error_kind,
  ok,
  network_error,
  invalid_cookies,
  bot_detection,
  video_unavailable,
  fragment_error,
  postprocessing_error,
  disk_space_error,
  unknown
)
// clang-format on

/// Map raw diagnostic text from the extractor to an error kind. Total and
/// free of side effects; matching is case-insensitive.
[[nodiscard]] auto
classify_error(const std::string_view text) -> error_kind;

/// True if changing the egress path (proxy) could plausibly fix the
/// failure. Cookie failures are never proxy related.
[[nodiscard]] auto
is_proxy_related(const error_kind kind, const std::string_view text) -> bool;

/// Message suitable for showing to the requesting user
[[nodiscard]] auto
user_message(const error_kind kind) -> std::string;

/// Whether this kind of failure needs operator attention
[[nodiscard]] auto
should_notify_admin(const error_kind kind) noexcept -> bool;

/// Operator-facing remediation steps
[[nodiscard]] auto
fix_recommendations(const error_kind kind) -> std::vector<std::string>;

/// Text safe to show a user: raw extractor diagnostics are replaced by the
/// message for their kind, other text is trimmed and passed through
[[nodiscard]] auto
sanitize_error_message(const std::string_view text) -> std::string;

[[nodiscard]] auto
to_name(const error_kind kind) -> std::string_view;

}  // namespace mediaq

template <>
struct std::is_error_code_enum<mediaq::error_kind> : public std::true_type {};

namespace mediaq {

struct error_kind_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "error_kind";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "network error"s;
    case 2: return "invalid cookies"s;
    case 3: return "bot detection"s;
    case 4: return "video unavailable"s;
    case 5: return "fragment error"s;
    case 6: return "postprocessing error"s;
    case 7: return "disk space error"s;
    case 8: return "unknown error"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(error_kind e) -> std::error_code {
  static auto category = error_kind_category{};
  return std::error_code(std::to_underlying(e), category);
}

/// Recover the kind from an error code; any code outside this category
/// counts as unknown.
[[nodiscard]] inline auto
to_error_kind(const std::error_code &ec) -> error_kind {
  if (!ec)
    return error_kind::ok;
  if (ec.category() == make_error_code(error_kind::ok).category())
    return static_cast<error_kind>(ec.value());
  return error_kind::unknown;
}

}  // namespace mediaq

template <>
struct std::formatter<mediaq::error_kind> : std::formatter<std::string> {
  auto
  format(const mediaq::error_kind &k, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}", mediaq::to_name(k));
  }
};

#endif  // LIB_ERROR_KIND_HPP_
