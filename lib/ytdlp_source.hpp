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

#ifndef LIB_YTDLP_SOURCE_HPP_
#define LIB_YTDLP_SOURCE_HPP_

#include "download.hpp"
#include "fallback_engine.hpp"
#include "proxy_config.hpp"
#include "source_backend.hpp"
#include "source_progress.hpp"
#include "tier_config.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mediaq {

class credential_refresher;
class metadata_cache;

using std::literals::string_view_literals::operator""sv;

struct ytdlp_config {
  static constexpr auto default_ytdlp_path = "yt-dlp";
  static constexpr auto default_ffprobe_path = "ffprobe";
  static constexpr auto default_timeout = std::chrono::seconds{240};
  static constexpr auto default_query_timeout = std::chrono::seconds{30};
  static constexpr auto default_refresh_timeout = std::chrono::seconds{20};
  // filesize_approx tends to undershoot the merged output
  static constexpr double size_overhead{1.15};

  std::string ytdlp_path{default_ytdlp_path};
  std::string ffprobe_path{default_ffprobe_path};
  std::chrono::seconds timeout{default_timeout};
  std::chrono::seconds query_timeout{default_query_timeout};
  std::chrono::seconds refresh_timeout{default_refresh_timeout};
  std::chrono::milliseconds refresh_settle{
    fallback_engine::default_refresh_settle};
  extractor_settings extractor;
  proxy_chain proxies{std::nullopt};
};

/// Runs the real extractor as a child process, feeding its progress lines
/// into the attempt's progress
class ytdlp_attempt_runner : public attempt_runner {
public:
  ytdlp_attempt_runner(const std::string &ytdlp_path,
                       const std::chrono::seconds timeout) :
    ytdlp_path{ytdlp_path}, timeout{timeout} {}

  [[nodiscard]] auto
  run(const tier_config &tier, const std::optional<proxy_config> &proxy,
      download_progress &progress) -> attempt_result override;

private:
  std::string ytdlp_path;
  std::chrono::seconds timeout{};
};

/// Backend for the sites the extractor understands, with escalation
/// through the fallback engine
class ytdlp_source : public source_backend {
public:
  static constexpr auto known_domains = std::array{
    // clang-format off
    "youtube.com"sv, "youtu.be"sv, "music.youtube.com"sv,
    "soundcloud.com"sv, "vimeo.com"sv, "tiktok.com"sv, "instagram.com"sv,
    "twitter.com"sv, "x.com"sv, "facebook.com"sv, "twitch.tv"sv,
    "dailymotion.com"sv, "bandcamp.com"sv, "reddit.com"sv,
    "bilibili.com"sv, "nicovideo.jp"sv, "rutube.ru"sv, "ok.ru"sv,
    "vk.com"sv, "clips.twitch.tv"sv,
    // clang-format on
  };

  // direct files and archives are left to other backends
  static constexpr auto excluded_extensions = std::array{
    // clang-format off
    "mp3"sv, "mp4"sv, "wav"sv, "flac"sv, "ogg"sv, "m4a"sv,
    "webm"sv, "avi"sv, "mkv"sv, "zip"sv, "rar"sv, "pdf"sv,
    // clang-format on
  };

  /// `runner` may be null, in which case the real extractor is used
  ytdlp_source(const ytdlp_config &config,
               std::shared_ptr<metadata_cache> cache,
               std::shared_ptr<credential_refresher> refresher,
               std::shared_ptr<attempt_runner> runner = nullptr);

  [[nodiscard]] auto
  name() const -> std::string_view override {
    return "ytdlp";
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
  is_livestream(const std::string &url) const -> bool override;

  [[nodiscard]] auto
  download(const download_request &request, progress_channel &progress,
           std::error_code &error) const -> download_output override;

private:
  [[nodiscard]] auto
  query_args(const std::vector<std::string> &prints,
             const std::string &url) const -> std::vector<std::string>;

  ytdlp_config config;
  std::shared_ptr<metadata_cache> cache;
  std::shared_ptr<credential_refresher> refresher;
  std::shared_ptr<attempt_runner> runner;
};

/// Duration in whole seconds as reported by ffprobe; nothing if ffprobe
/// fails or the file has no duration
[[nodiscard]] auto
read_media_duration(const std::string &ffprobe_path, const std::string &path,
                    const std::chrono::seconds timeout)
  -> std::optional<std::uint32_t>;

/// MIME type of the extractor output for a request
[[nodiscard]] auto
ytdlp_output_mime(const download_request &request) -> std::string;

}  // namespace mediaq

#endif  // LIB_YTDLP_SOURCE_HPP_
