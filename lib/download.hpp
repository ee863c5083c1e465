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

#ifndef LIB_DOWNLOAD_HPP_
#define LIB_DOWNLOAD_HPP_

#include "download_task.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace mediaq {

struct media_metadata {
  std::string title;
  std::string artist;

  auto
  operator==(const media_metadata &) const -> bool = default;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(media_metadata, title, artist)
};

/// What a backend is asked to fetch
struct download_request {
  std::string url;
  std::string output_path;
  std::string format;
  std::optional<std::string> audio_bitrate;
  std::optional<std::string> video_quality;
  std::optional<std::uint64_t> max_file_size;
  std::optional<time_range> range;

  [[nodiscard]] auto
  is_audio() const -> bool {
    return format == "mp3";
  }
};

/// Extra files produced by multi-item posts
struct additional_file {
  std::string file_path;
  std::string mime_type;
  std::optional<std::uint32_t> duration_secs;
};

/// What a backend actually wrote; `file_path` can differ from the requested
/// path (e.g., the extension was chosen by the extractor)
struct download_output {
  std::string file_path;
  std::optional<std::uint32_t> duration_secs;
  std::uint64_t file_size{};
  std::string mime_hint;
  std::vector<additional_file> additional_files;
  /// Why a failed download failed, in the backend's own words (extractor
  /// stderr, HTTP status); not for showing to users
  std::string diagnostic;
};

/// Build the backend request for a task, writing into `output_dir`
[[nodiscard]] auto
make_download_request(const download_task &task, const std::string &output_dir,
                      const std::optional<std::uint64_t> max_file_size)
  -> download_request;

/// MIME type for a media file extension (without dot); empty if unknown
[[nodiscard]] auto
mime_type_for_extension(const std::string &ext) -> std::string;

/// The file the extractor actually wrote: the exact path if it exists,
/// otherwise the most recently written file in the same directory whose
/// name starts with the requested stem. Empty if none.
[[nodiscard]] auto
find_actual_downloaded_file(const std::string &requested_path) -> std::string;

/// Remove the output path and any partial files left by an interrupted
/// attempt (.part, .ytdl, .temp and fragment files sharing the stem).
/// Returns the number of files removed.
auto
cleanup_partial_download(const std::string &output_path,
                         std::error_code &error) noexcept -> std::uint32_t;

auto
to_json(nlohmann::json &j, const additional_file &f) -> void;

auto
to_json(nlohmann::json &j, const download_output &o) -> void;

}  // namespace mediaq

template <>
struct std::formatter<mediaq::download_request> : std::formatter<std::string> {
  auto
  format(const mediaq::download_request &x, auto &ctx) const {
    return std::formatter<std::string>::format(
      std::format("{} -> {} [{}]", x.url, x.output_path, x.format), ctx);
  }
};

#endif  // LIB_DOWNLOAD_HPP_
