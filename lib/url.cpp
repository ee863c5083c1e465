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

#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mediaq {

[[nodiscard]] static inline auto
to_lower(std::string s) -> std::string {
  std::ranges::for_each(s, [](auto &c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return s;
}

[[nodiscard]] auto
parse_url(const std::string_view url) -> std::optional<url_parts> {
  using std::string_view_literals::operator""sv;
  static constexpr auto scheme_sep = "://"sv;

  const auto scheme_end = url.find(scheme_sep);
  if (scheme_end == std::string_view::npos)
    return std::nullopt;

  url_parts u;
  u.scheme = to_lower(std::string(url.substr(0, scheme_end)));
  if (u.scheme != "http" && u.scheme != "https")
    return std::nullopt;

  const auto rest = url.substr(scheme_end + std::size(scheme_sep));
  const auto authority_end = rest.find_first_of("/?#");
  auto authority = rest.substr(0, authority_end);

  // drop any user:password@
  if (const auto at = authority.rfind('@'); at != std::string_view::npos)
    authority = authority.substr(at + 1);

  const auto colon = authority.find(':');
  u.host = to_lower(std::string(authority.substr(0, colon)));
  if (u.host.empty())
    return std::nullopt;
  if (colon != std::string_view::npos) {
    u.port = std::string(authority.substr(colon + 1));
    if (u.port.empty() || !std::ranges::all_of(u.port, [](const auto c) {
          return std::isdigit(static_cast<unsigned char>(c));
        }))
      return std::nullopt;
  }
  else
    u.port = u.is_https() ? "443" : "80";

  if (authority_end == std::string_view::npos)
    u.target = "/";
  else {
    auto tail = rest.substr(authority_end);
    if (const auto hash = tail.find('#'); hash != std::string_view::npos)
      tail = tail.substr(0, hash);
    u.target = std::string(tail);
    if (u.target.empty() || u.target.front() != '/')
      u.target.insert(0, "/");
  }
  u.path = u.target.substr(0, u.target.find('?'));
  return u;
}

[[nodiscard]] auto
path_extension(const std::string_view path) -> std::string {
  const auto slash = path.rfind('/');
  const auto segment =
    slash == std::string_view::npos ? path : path.substr(slash + 1);
  const auto dot = segment.rfind('.');
  if (dot == std::string_view::npos || dot + 1 == std::size(segment))
    return {};
  return to_lower(std::string(segment.substr(dot + 1)));
}

[[nodiscard]] auto
percent_decode(const std::string_view s) -> std::string {
  const auto hex_value = [](const char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };
  std::string r;
  r.reserve(std::size(s));
  for (std::size_t i = 0; i < std::size(s); ++i) {
    if (s[i] == '%' && i + 2 < std::size(s) && hex_value(s[i + 1]) >= 0 &&
        hex_value(s[i + 2]) >= 0) {
      r += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
      i += 2;
    }
    else
      r += s[i];
  }
  return r;
}

[[nodiscard]] auto
percent_encode(const std::string_view s) -> std::string {
  static constexpr auto hex_digits = "0123456789ABCDEF";
  std::string r;
  r.reserve(std::size(s));
  for (const auto c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u) || c == '-' || c == '.' || c == '_' || c == '~')
      r += c;
    else {
      r += '%';
      r += hex_digits[u >> 4];
      r += hex_digits[u & 0xF];
    }
  }
  return r;
}

[[nodiscard]] auto
host_matches(const std::string_view host,
             const std::string_view domain) -> bool {
  if (host == domain)
    return true;
  return std::size(host) > std::size(domain) && host.ends_with(domain) &&
         host[std::size(host) - std::size(domain) - 1] == '.';
}

}  // namespace mediaq
