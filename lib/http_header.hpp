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

#ifndef LIB_HTTP_HEADER_HPP_
#define LIB_HTTP_HEADER_HPP_

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace mediaq {

struct http_header {
  std::string status_line;         // HTTP/1.1 206 Partial Content
  std::string status_code;         // 206
  std::string last_modified;       // last-modified: Sun, 02 Feb 2025 ...
  std::uint64_t content_length{};  // content-length: 117607180
  std::string content_type;        // content-type: audio/mpeg
  std::optional<std::uint64_t> content_range_total;  // bytes 0-99/1234
  std::string filename;  // content-disposition: attachment; filename="a.mp3"
  std::string location;  // location: https://...
  bool chunked{};        // transfer-encoding: chunked

  http_header() = default;
  explicit http_header(const std::string &header_block);

  /// Numeric status, or 0 if the status line was not understood
  [[nodiscard]] auto
  status() const -> int;

  [[nodiscard]] auto
  is_success() const -> bool {
    const auto s = status();
    return s >= 200 && s < 300;
  }

  [[nodiscard]] auto
  is_redirect() const -> bool {
    const auto s = status();
    return s >= 300 && s < 400 && !location.empty();
  }

  [[nodiscard]] auto
  tostring() const -> std::string;
};

/// Join the chunks of a body sent with chunked transfer encoding; nothing
/// if a chunk size is malformed or a chunk is cut short
[[nodiscard]] auto
decode_chunked_body(const std::string_view body) -> std::optional<std::string>;

}  // namespace mediaq

#endif  // LIB_HTTP_HEADER_HPP_
