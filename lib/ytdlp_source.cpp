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

#include "ytdlp_source.hpp"

#include "credential_refresher.hpp"
#include "download.hpp"
#include "download_progress.hpp"
#include "error_kind.hpp"
#include "fallback_engine.hpp"
#include "format_error_code.hpp"
#include "logger.hpp"
#include "metadata_cache.hpp"
#include "progress_parser.hpp"
#include "subprocess.hpp"
#include "tier_config.hpp"
#include "url.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mediaq {

[[nodiscard]] static inline auto
trim_view(std::string_view s) -> std::string_view {
  const auto is_space = [](const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  };
  while (!s.empty() && is_space(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))
    s.remove_suffix(1);
  return s;
}

[[nodiscard]] static auto
split_lines(const std::string &text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  for (const auto line : text | std::views::split('\n'))
    lines.emplace_back(trim_view(std::string_view(line.begin(), line.end())));
  return lines;
}

/// The extractor prints "NA" for fields it does not know
[[nodiscard]] static inline auto
is_missing_field(const std::string_view s) -> bool {
  return s.empty() || s == "NA" || s == "None";
}

[[nodiscard]] auto
ytdlp_attempt_runner::run(const tier_config &tier,
                          const std::optional<proxy_config> &proxy,
                          download_progress &progress) -> attempt_result {
  auto &lgr = logger::instance();
  std::vector<std::string> command{ytdlp_path};
  std::ranges::copy(tier.to_arguments(proxy), std::back_inserter(command));

  const auto on_line = [&](const std::string_view line, const bool) {
    if (const auto p = parse_progress(line); p)
      progress.update(*p);
  };

  std::error_code error;
  const auto res = run_subprocess(
    command, std::chrono::duration_cast<std::chrono::milliseconds>(timeout),
    on_line, error);

  attempt_result r;
  if (error == subprocess_error_code::timeout) {
    r.timed_out = true;
    r.diagnostic = std::format("{} timed out after {}\n{}", ytdlp_path,
                               timeout, res.diagnostic());
    return r;
  }
  if (error) {
    r.diagnostic = std::format("failed to run {}: {}", ytdlp_path, error);
    lgr.error("{}", r.diagnostic);
    return r;
  }
  r.success = res.exit_status == 0;
  if (!r.success)
    r.diagnostic = res.diagnostic();
  return r;
}

ytdlp_source::ytdlp_source(const ytdlp_config &config,
                           std::shared_ptr<metadata_cache> cache,
                           std::shared_ptr<credential_refresher> refresher,
                           std::shared_ptr<attempt_runner> runner) :
  config{config}, cache{std::move(cache)}, refresher{std::move(refresher)},
  runner{std::move(runner)} {
  if (this->runner == nullptr)
    this->runner = std::make_shared<ytdlp_attempt_runner>(config.ytdlp_path,
                                                          config.timeout);
  if (this->config.proxies.empty() || this->config.proxies.back())
    this->config.proxies.emplace_back(std::nullopt);
}

[[nodiscard]] auto
ytdlp_source::supports(const std::string &url) const -> bool {
  const auto u = parse_url(url);
  if (!u)
    return false;
  const auto known = std::ranges::any_of(known_domains, [&](const auto d) {
    return host_matches(u->host, d);
  });
  if (known)
    return true;
  const auto ext = path_extension(u->path);
  return std::ranges::find(excluded_extensions, ext) ==
         std::cend(excluded_extensions);
}

[[nodiscard]] auto
ytdlp_source::query_args(const std::vector<std::string> &prints,
                         const std::string &url) const
  -> std::vector<std::string> {
  std::vector<std::string> args{config.ytdlp_path};
  for (const auto &p : prints) {
    args.emplace_back("--print");
    args.push_back(p);
  }
  args.insert(std::cend(args), {"--no-playlist", "--skip-download"});
  const auto &ex = config.extractor;
  if (ex.auth_mode() == auth_mode_t::cookies_file)
    args.insert(std::cend(args), {"--cookies", ex.cookies_file});
  else if (ex.auth_mode() == auth_mode_t::cookies_from_browser)
    args.insert(std::cend(args),
                {"--cookies-from-browser", ex.cookies_from_browser});
  if (const auto &first = config.proxies.front(); first)
    args.insert(std::cend(args), {"--proxy", first->url});
  args.insert(std::cend(args), {"--no-check-certificate", url});
  return args;
}

[[nodiscard]] auto
ytdlp_source::metadata(const std::string &url,
                       std::error_code &error) const -> media_metadata {
  auto &lgr = logger::instance();
  if (cache != nullptr) {
    if (auto m = cache->get(url); m) {
      lgr.debug("Metadata cache hit: {}", url);
      return *m;
    }
  }

  const auto command =
    query_args({"%(title)s", "%(artist)s", "%(uploader)s"}, url);
  std::error_code run_error;
  const auto res = run_subprocess(
    command,
    std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout),
    nullptr, run_error);
  if (run_error || res.exit_status != 0) {
    const auto kind = run_error == subprocess_error_code::timeout
                        ? error_kind::unknown
                        : classify_error(res.diagnostic());
    lgr.warning("Metadata lookup failed for {}: {}", url, kind);
    error = kind;
    return {};
  }

  const auto lines = split_lines(res.stdout_text);
  const auto field = [&](const std::size_t i) -> std::string {
    return i < std::size(lines) && !is_missing_field(lines[i]) ? lines[i]
                                                               : std::string{};
  };
  media_metadata m{field(0), field(1)};
  if (m.title.empty()) {
    lgr.warning("Empty title for {}", url);
    error = source_error_code::empty_title;
    return {};
  }
  if (m.artist.empty())
    m.artist = field(2);

  if (cache != nullptr)
    cache->put(url, m);
  return m;
}

[[nodiscard]] auto
ytdlp_source::estimate_size(const std::string &url) const
  -> std::optional<std::uint64_t> {
  const auto command = query_args({"%(filesize_approx)s"}, url);
  std::error_code error;
  const auto res = run_subprocess(
    command,
    std::chrono::duration_cast<std::chrono::milliseconds>(config.query_timeout),
    nullptr, error);
  if (error || res.exit_status != 0)
    return std::nullopt;
  const auto lines = split_lines(res.stdout_text);
  if (lines.empty() || is_missing_field(lines.front()))
    return std::nullopt;
  const auto &s = lines.front();
  double approx{};
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + std::size(s),
                                         approx);
  if (ec != std::errc{} || approx <= 0.0)
    return std::nullopt;
  return static_cast<std::uint64_t>(
    std::llround(approx * ytdlp_config::size_overhead));
}

[[nodiscard]] auto
ytdlp_source::is_livestream(const std::string &url) const -> bool {
  auto &lgr = logger::instance();
  const auto command = query_args({"%(is_live)s"}, url);
  std::error_code error;
  const auto res = run_subprocess(
    command,
    std::chrono::duration_cast<std::chrono::milliseconds>(config.query_timeout),
    nullptr, error);
  if (error) {
    lgr.debug("Livestream check failed for {}: {}", url, error);
    return false;
  }
  if (res.exit_status != 0) {
    const bool live = res.stderr_tail.find("live") != std::string::npos;
    if (live)
      lgr.warning("URL appears to be a livestream: {}", url);
    return live;
  }
  const auto lines = split_lines(res.stdout_text);
  const bool live =
    !lines.empty() && (lines.front() == "True" || lines.front() == "true" ||
                       lines.front() == "1");
  if (live)
    lgr.warning("URL is a livestream: {}", url);
  return live;
}

[[nodiscard]] auto
read_media_duration(const std::string &ffprobe_path, const std::string &path,
                    const std::chrono::seconds timeout)
  -> std::optional<std::uint32_t> {
  // clang-format off
  const std::vector<std::string> command{
    ffprobe_path,
    "-v", "error",
    "-show_entries", "format=duration",
    "-of", "default=noprint_wrappers=1:nokey=1",
    path,
  };
  // clang-format on
  std::error_code error;
  const auto res = run_subprocess(
    command, std::chrono::duration_cast<std::chrono::milliseconds>(timeout),
    nullptr, error);
  if (error || res.exit_status != 0)
    return std::nullopt;
  const auto s = std::string(trim_view(res.stdout_text));
  double secs{};
  const auto [ptr, ec] =
    std::from_chars(s.data(), s.data() + std::size(s), secs);
  if (ec != std::errc{} || secs < 0.0)
    return std::nullopt;
  return static_cast<std::uint32_t>(std::llround(secs));
}

[[nodiscard]] auto
ytdlp_output_mime(const download_request &request) -> std::string {
  if (request.format == "srt")
    return "application/x-subrip";
  if (request.format == "txt")
    return "text/plain";
  return request.is_audio() ? "audio/mpeg" : "video/mp4";
}

[[nodiscard]] auto
ytdlp_source::download(const download_request &request,
                       progress_channel &progress,
                       std::error_code &error) const -> download_output {
  auto &lgr = logger::instance();

  const auto tiers = build_tier_configs(request, config.extractor);
  fallback_engine engine(*runner, refresher.get(), config.refresh_timeout,
                         config.refresh_settle);
  const auto result = engine.run(request, tiers, config.proxies, progress);
  download_output out;
  if (result.error) {
    error = result.error;
    out.diagnostic = result.diagnostic;
    return out;
  }

  out.file_path = find_actual_downloaded_file(request.output_path);
  if (out.file_path.empty()) {
    lgr.error("Extractor reported success but no file for {}",
              request.output_path);
    error = source_error_code::output_file_missing;
    return {};
  }
  if (out.file_path != request.output_path)
    lgr.info("Extractor wrote {} instead of {}", out.file_path,
             request.output_path);

  out.file_size = std::filesystem::file_size(out.file_path, error);
  if (error) {
    error = source_error_code::output_file_missing;
    return {};
  }
  if (request.max_file_size && out.file_size > *request.max_file_size) {
    lgr.warning("File too large: {} ({} > {} bytes)", out.file_path,
                out.file_size, *request.max_file_size);
    std::error_code remove_error;
    std::filesystem::remove(out.file_path, remove_error);
    error = source_error_code::file_too_large;
    return {};
  }
  out.mime_hint = ytdlp_output_mime(request);
  if (!is_subtitle_format(request.format))
    out.duration_secs = read_media_duration(
      config.ffprobe_path, out.file_path, config.query_timeout);
  return out;
}

}  // namespace mediaq
