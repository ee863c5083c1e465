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

#ifndef LIB_URL_HPP_
#define LIB_URL_HPP_

#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace mediaq {

/// The parts of an http(s) URL needed to route and fetch it
struct url_parts {
  std::string scheme;  // lower case
  std::string host;    // lower case, no port
  std::string port;    // explicit, or the scheme default
  std::string target;  // path and query, always starts with '/'
  std::string path;    // path only

  [[nodiscard]] auto
  is_https() const -> bool {
    return scheme == "https";
  }

  [[nodiscard]] auto
  tostring() const -> std::string {
    return std::format("{}://{}:{}{}", scheme, host, port, target);
  }
};

/// Parse an http or https URL; nothing for other schemes or malformed text
[[nodiscard]] auto
parse_url(const std::string_view url) -> std::optional<url_parts>;

/// Lower-case extension (without dot) of the last path segment, or empty
[[nodiscard]] auto
path_extension(const std::string_view path) -> std::string;

/// Decode %XX escapes; malformed escapes are kept as they are
[[nodiscard]] auto
percent_decode(const std::string_view s) -> std::string;

/// Escape everything but unreserved characters (RFC 3986) as %XX
[[nodiscard]] auto
percent_encode(const std::string_view s) -> std::string;

/// True if `host` equals `domain` or is a subdomain of it
[[nodiscard]] auto
host_matches(const std::string_view host,
             const std::string_view domain) -> bool;

}  // namespace mediaq

#endif  // LIB_URL_HPP_
