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

#ifndef LIB_HTTP_CLIENT_HPP_
#define LIB_HTTP_CLIENT_HPP_

#include "http_header.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace mediaq {

struct download_progress;

struct http_request_options {
  static constexpr auto default_timeout = std::chrono::seconds{30};
  static constexpr std::uint32_t max_redirects{5};

  /// Inactivity timeout: reset every time bytes arrive
  std::chrono::microseconds timeout{default_timeout};
  /// Resume from this byte offset using a Range request
  std::uint64_t offset{};
  std::optional<std::uint64_t> max_file_size;
  download_progress *progress{};
  /// GET if empty; a redirect always continues with GET
  std::string method;
  std::string body;
  /// Sent after the default request headers
  std::vector<std::pair<std::string, std::string>> headers;
};

/// GET `url` into `outfile`, following redirects. When `offset` is set and
/// the server answers 206 the body is appended; a 200 rewrites the file. A
/// final non-2xx status is reported as http_error_code::bad_status and the
/// header is still returned so the caller can inspect the status.
[[nodiscard]] auto
download_http(const std::string &url, const std::string &outfile,
              const http_request_options &options,
              std::error_code &error) -> http_header;

/// Send the request described by `options` (usually a POST with a body) and
/// return the response body. The body is staged in `scratch_file`, which is
/// removed before returning.
[[nodiscard]] auto
request_text_http(const std::string &url, const std::string &scratch_file,
                  const http_request_options &options,
                  std::error_code &error) -> std::string;

/// HEAD request for `url`, following redirects
[[nodiscard]] auto
download_header_http(const std::string &url,
                     const std::chrono::microseconds timeout,
                     std::error_code &error) -> http_header;

}  // namespace mediaq

#endif  // LIB_HTTP_CLIENT_HPP_
