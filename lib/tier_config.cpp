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

#include "tier_config.hpp"

#include "download.hpp"
#include "proxy_config.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaq {

[[nodiscard]] static auto
minimal_base_args(const download_request &request)
  -> std::vector<std::string> {
  // clang-format off
  return {
    "-o", request.output_path,
    "--newline",
    "--force-overwrites",
    "--no-playlist",
    "--concurrent-fragments", "1",
    "--fragment-retries", "10",
    "--socket-timeout", "30",
    "--http-chunk-size", "2097152",
  };
  // clang-format on
}

[[nodiscard]] static auto
full_base_args(const download_request &request) -> std::vector<std::string> {
  auto args = minimal_base_args(request);
  // clang-format off
  args.insert(std::cend(args), {
    "--sleep-requests", "2",
    "--sleep-interval", "3",
    "--max-sleep-interval", "10",
    "--limit-rate", "5M",
    "--retry-sleep", "http:exp=1:30",
    "--retry-sleep", "fragment:exp=1:30",
    "--retries", "15",
  });
  // clang-format on
  return args;
}

/// Arguments selecting what is downloaded and how it is converted
[[nodiscard]] static auto
media_args(const download_request &request, const extractor_settings &settings,
           const bool with_thumbnail) -> std::vector<std::string> {
  if (is_subtitle_format(request.format)) {
    // clang-format off
    return {
      "--write-subs",
      "--write-auto-subs",
      "--sub-lang", extractor_settings::subtitle_languages,
      "--sub-format", "srt",
      "--convert-subs", "srt",
      "--skip-download",
    };
    // clang-format on
  }
  if (request.is_audio()) {
    const auto bitrate = request.audio_bitrate.value_or(settings.audio_bitrate);
    std::vector<std::string> args{
      "--extract-audio", "--audio-format", "mp3", "--audio-quality", "0",
      "--add-metadata",
    };
    if (with_thumbnail)
      args.emplace_back("--embed-thumbnail");
    args.emplace_back("--postprocessor-args");
    args.emplace_back(
      std::format("ffmpeg:-acodec libmp3lame -b:a {}", bitrate));
    return args;
  }
  const auto height =
    request.video_quality ? parse_video_height(*request.video_quality)
                          : std::nullopt;
  // clang-format off
  return {
    "--format", build_telegram_safe_format(height),
    "--merge-output-format", "mp4",
    "--postprocessor-args", "Merger:-movflags +faststart",
  };
  // clang-format on
}

[[nodiscard]] static auto
range_args(const download_request &request) -> std::vector<std::string> {
  if (!request.range)
    return {};
  return {
    "--download-sections",
    std::format("*{}-{}", request.range->start, request.range->end),
    "--force-keyframes-at-cuts",
  };
}

[[nodiscard]] static auto
auth_args(const extractor_settings &settings) -> std::vector<std::string> {
  std::vector<std::string> args{
    "--extractor-args",
    std::format("youtubepot-bgutilhttp:base_url={}", settings.pot_provider_url),
  };
  switch (settings.auth_mode()) {
  case auth_mode_t::cookies_file:
    args.insert(std::cend(args), {"--cookies", settings.cookies_file});
    break;
  case auth_mode_t::cookies_from_browser:
    args.insert(std::cend(args),
                {"--cookies-from-browser", settings.cookies_from_browser});
    break;
  case auth_mode_t::none:
    break;
  }
  args.insert(std::cend(args),
              {"--extractor-args", "youtube:player_client=default"});
  return args;
}

[[nodiscard]] auto
tier_config::to_arguments(const std::optional<proxy_config> &proxy) const
  -> std::vector<std::string> {
  std::vector<std::string> args;
  args.reserve(std::size(base_args) + std::size(auth_args) +
               std::size(extra_flags) + 3);
  std::ranges::copy(base_args, std::back_inserter(args));
  std::ranges::copy(auth_args, std::back_inserter(args));
  std::ranges::copy(extra_flags, std::back_inserter(args));
  if (proxy) {
    args.emplace_back("--proxy");
    args.push_back(proxy->url);
  }
  args.push_back(url);
  return args;
}

[[nodiscard]] auto
build_tier_configs(const download_request &request,
                   const extractor_settings &settings)
  -> std::array<tier_config, n_tiers> {
  const auto ranges = range_args(request);
  const auto append = [](auto &dst, const auto &src) {
    std::ranges::copy(src, std::back_inserter(dst));
  };

  tier_config t1;
  t1.tier = tier_t::unauthenticated;
  t1.url = request.url;
  t1.base_args = full_base_args(request);
  append(t1.base_args, media_args(request, settings, true));
  append(t1.base_args, ranges);
  t1.extra_flags = {
    // clang-format off
    "--extractor-args", "youtube:player_client=default;formats=missing_pot",
    "--js-runtimes", "deno",
    "--no-check-certificate",
    // clang-format on
  };

  tier_config t2;
  t2.tier = tier_t::authenticated;
  t2.url = request.url;
  t2.base_args = minimal_base_args(request);
  append(t2.base_args, media_args(request, settings, true));
  append(t2.base_args, ranges);
  t2.auth_mode = settings.auth_mode();
  t2.auth_args = auth_args(settings);

  tier_config t3;
  t3.tier = tier_t::no_postprocessing;
  t3.url = request.url;
  t3.base_args = minimal_base_args(request);
  append(t3.base_args, media_args(request, settings, false));
  append(t3.base_args, ranges);
  t3.auth_mode = t2.auth_mode;
  t3.auth_args = t2.auth_args;
  t3.extra_flags = {"--fixup", "never"};

  return {t1, t2, t3};
}

[[nodiscard]] auto
build_telegram_safe_format(const std::optional<std::uint32_t> height)
  -> std::string {
  std::vector<std::uint32_t> heights{1080, 720, 480, 360, 240};
  if (height) {
    std::erase(heights, *height);
    heights.insert(std::cbegin(heights), *height);
  }
  std::vector<std::string> parts;
  for (const auto h : heights) {
    parts.push_back(
      std::format("bv*[height<={}][vcodec^=avc1]+ba[acodec^=mp4a]", h));
    parts.push_back(
      std::format("bv*[height<={}][vcodec^=avc1][ext=mp4]+ba[ext=m4a]", h));
  }
  parts.emplace_back("bestvideo[ext=mp4]+bestaudio[ext=m4a]");
  parts.emplace_back("best[ext=mp4]");
  parts.emplace_back("best");

  std::string r;
  for (const auto &p : parts) {
    if (!r.empty())
      r += '/';
    r += p;
  }
  return r;
}

[[nodiscard]] auto
parse_video_height(std::string_view quality) -> std::optional<std::uint32_t> {
  if (quality.ends_with('p'))
    quality.remove_suffix(1);
  std::uint32_t h{};
  const auto last = quality.data() + std::size(quality);
  const auto [ptr, ec] = std::from_chars(quality.data(), last, h);
  if (ec != std::errc{} || ptr != last || h == 0)
    return std::nullopt;
  return h;
}

[[nodiscard]] auto
is_subtitle_format(const std::string_view format) -> bool {
  return format == "srt" || format == "txt";
}

}  // namespace mediaq
