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

#include "command_fetch.hpp"

static constexpr auto about = R"(
download one url
)";

static constexpr auto description = R"(
Download a single url the same way the service does for a queued task: the
url is matched to a backend, and for sites handled by the extractor the
download escalates through the tiers and the configured proxies as
failures require. Progress is printed to stderr and a JSON description of
the result to stdout. With --info nothing is downloaded; the title, artist,
size estimate and whether the url is a live stream are printed instead.
)";

static constexpr auto examples = R"(
Examples:

mediaq fetch -o downloads -f mp3 https://www.youtube.com/watch?v=xyz
mediaq fetch -c ~/.config/mediaq/mediaq.json -f mp4 -q 720 https://vimeo.com/123
mediaq fetch --info https://soundcloud.com/artist/track
)";

#include "cli_common.hpp"
#include "bot_config.hpp"
#include "download.hpp"
#include "download_server.hpp"
#include "download_task.hpp"
#include "logger.hpp"
#include "metadata_cache.hpp"
#include "source_backend.hpp"
#include "source_progress.hpp"
#include "source_registry.hpp"

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

[[nodiscard]] static auto
print_info(const mediaq::source_backend &backend,
           const std::string &url) -> int {
  static constexpr auto n_indent = 4;
  std::error_code error;
  const auto meta = backend.metadata(url, error);
  if (error) {
    std::println(std::cerr, "Failed to get metadata: {}", error);
    return EXIT_FAILURE;
  }
  nlohmann::json data{
    // clang-format off
    {"backend", backend.name()},
    {"title", meta.title},
    {"artist", meta.artist},
    {"is_livestream", backend.is_livestream(url)},
    // clang-format on
  };
  if (const auto sz = backend.estimate_size(url); sz)
    data["estimated_size"] = *sz;
  std::println("{}", data.dump(n_indent));
  return EXIT_SUCCESS;
}

auto
command_fetch_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto log_level_default = mediaq::log_level_t::warning;
  static constexpr auto command = "fetch";
  static const auto usage =
    std::format("Usage: mediaq {} [options] url", rstrip(command));
  static const auto about_msg =
    std::format("mediaq {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  std::string url;
  std::string config_file;
  std::string output_dir{"."};
  std::string format{"mp3"};
  std::string quality;
  std::string bitrate;
  std::string start;
  std::string end;
  std::string ytdlp_path;
  std::string cookies_file;
  std::uint64_t max_file_size{};
  bool info_only{false};
  bool quiet{false};
  mediaq::log_level_t log_level{log_level_default};

  CLI::App app{about_msg};
  argv = app.ensure_utf8(argv);
  setup_app(app, usage, description_msg, argc);
  // clang-format off
  app.add_option("url", url, "url to download")->required();
  app.add_option("-c,--config-file", config_file,
                 "read configuration from this file")
    ->check(CLI::ExistingFile);
  app.add_option("-o,--output-dir", output_dir, "directory for the file")
    ->capture_default_str();
  app.add_option("-f,--format", format, "output format (mp3, mp4, srt, txt)")
    ->capture_default_str();
  app.add_option("-q,--quality", quality, "video height, e.g., 720");
  app.add_option("-b,--bitrate", bitrate, "audio bitrate, e.g., 192k");
  app.add_option("--start", start, "clip start, e.g., 00:01:00");
  app.add_option("--end", end, "clip end, e.g., 00:02:30");
  app.add_option("--ytdlp-path", ytdlp_path, "extractor executable");
  app.add_option("--cookies-file", cookies_file,
                 "cookies file in Netscape format")
    ->check(CLI::ExistingFile);
  app.add_option("--max-file-size", max_file_size,
                 "largest file to keep in bytes");
  app.add_flag("--info", info_only, "print metadata only");
  app.add_flag("--quiet", quiet, "do not print progress");
  app.add_option("-v,--log-level", log_level,
                 std::format("log level {}", mediaq::log_level_help_str))
    ->option_text(std::format("[{}]", log_level_default))
    ->transform(CLI::CheckedTransformer(mediaq::str_to_level, CLI::ignore_case));
  // clang-format on

  if (argc < 2) {
    std::println("{}", app.help());
    return EXIT_SUCCESS;
  }
  CLI11_PARSE(app, argc, argv);

  auto &lgr =
    mediaq::logger::instance(mediaq::shared_from_cerr(), command, log_level);
  if (!lgr) {
    std::println(std::cerr, "Failure initializing logging: {}.",
                 lgr.get_status());
    return EXIT_FAILURE;
  }

  std::error_code error;
  auto cfg = config_file.empty() ? mediaq::bot_config::make_default()
                                 : mediaq::bot_config::read(config_file, error);
  if (error) {
    lgr.error("Failed to read config file {}: {}", config_file, error);
    return EXIT_FAILURE;
  }
  if (!ytdlp_path.empty())
    cfg.ytdlp_path = ytdlp_path;
  if (!cookies_file.empty()) {
    cfg.cookies_file = cookies_file;
    cfg.cookies_from_browser.clear();
  }
  if (max_file_size > 0)
    cfg.max_file_size = max_file_size;

  const auto registry = mediaq::make_default_registry(
    cfg, std::make_shared<mediaq::metadata_cache>(), nullptr);
  const auto backend = registry->resolve(url, error);
  if (error) {
    std::println(std::cerr, "No backend for {}: {}", url, error);
    return EXIT_FAILURE;
  }
  lgr.info("Using backend {} for {}", backend->name(), url);

  if (info_only)
    return print_info(*backend, url);

  auto task = mediaq::make_download_task(url, 0, format, format == "mp4", "");
  if (!quality.empty())
    task.video_quality = quality;
  task.audio_bitrate = bitrate.empty() ? cfg.default_audio_bitrate : bitrate;
  if (!start.empty() || !end.empty())
    task.range = mediaq::time_range{start, end};

  std::filesystem::create_directories(output_dir, error);
  if (error) {
    lgr.error("Failed to create directory {}: {}", output_dir, error);
    return EXIT_FAILURE;
  }
  const auto request = mediaq::make_download_request(
    task, output_dir,
    cfg.max_file_size > 0 ? std::optional{cfg.max_file_size} : std::nullopt);

  mediaq::progress_channel progress;
  std::jthread printer([&] {
    static constexpr auto wait = std::chrono::milliseconds{100};
    while (!progress.is_closed() || progress.size() > 0)
      if (const auto p = progress.receive_for(wait); p && !quiet)
        std::println(std::cerr, "{}", *p);
  });

  const auto output = backend->download(request, progress, error);
  progress.close();
  printer.join();

  if (error) {
    const auto kind = mediaq::to_error_kind(error);
    std::println(std::cerr, "Download failed: {}", error);
    std::println(std::cerr, "{}", mediaq::user_message(kind));
    return EXIT_FAILURE;
  }

  static constexpr auto n_indent = 4;
  const nlohmann::json data = output;
  std::println("{}", data.dump(n_indent));
  return EXIT_SUCCESS;
}
