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

#ifndef LIB_HTTP_SOURCE_HPP_
#define LIB_HTTP_SOURCE_HPP_

#include "download.hpp"
#include "source_backend.hpp"
#include "source_progress.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mediaq {

using std::literals::string_view_literals::operator""sv;

/// Fetches direct links to media files over plain http(s)
class http_source : public source_backend {
public:
  static constexpr auto default_timeout = std::chrono::seconds{30};

  static constexpr auto media_extensions = std::array{
    // clang-format off
    "mp3"sv, "mp4"sv, "wav"sv, "flac"sv, "ogg"sv, "m4a"sv,
    "webm"sv, "avi"sv, "mkv"sv, "aac"sv, "opus"sv,
    // clang-format on
  };

  explicit http_source(
    const std::chrono::seconds timeout = default_timeout) : timeout{timeout} {}

  [[nodiscard]] auto
  name() const -> std::string_view override {
    return "http";
  }

  [[nodiscard]] auto
  supports(const std::string &url) const -> bool override;

  [[nodiscard]] auto
  metadata(const std::string &url,
           std::error_code &error) const -> media_metadata override;

  [[nodiscard]] auto
  estimate_size(const std::string &url) const
    -> std::optional<std::uint64_t> override;

  [[nodiscard]] auto
  is_livestream(const std::string &) const -> bool override {
    return false;
  }

  [[nodiscard]] auto
  download(const download_request &request, progress_channel &progress,
           std::error_code &error) const -> download_output override;

private:
  std::chrono::seconds timeout{default_timeout};
};

}  // namespace mediaq

#endif  // LIB_HTTP_SOURCE_HPP_
