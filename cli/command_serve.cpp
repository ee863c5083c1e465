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

#include "command_serve.hpp"

static constexpr auto about = R"(
run the download service
)";

static constexpr auto description = R"(
Start the download service: a priority queue with a pool of workers. Tasks
are submitted as one JSON document per line on standard input, for example
{"url": "https://youtu.be/xyz", "chat_id": 42, "format": "mp3", "plan":
"premium"}, and one JSON document per line is written to standard output
for each accepted or rejected task, progress update, result and credential
refresh request. A refresh request is answered with a line like
{"refresh_response": {"id": 3, "ok": true, "cookies": "..."}} where the
optional cookies replace the configured cookies file. Tasks that were still
queued or running when the service last stopped are recovered from the queue
directory at startup. The service stops on SIGINT or SIGTERM, or when
standard input is closed and all queued work is finished. Logs go to the
log file if one is configured, otherwise to stderr.
)";

static constexpr auto examples = R"(
Examples:

mediaq serve -c ~/.config/mediaq/mediaq.json
mediaq serve -d downloads -q queue -w 4 < tasks.jsonl
)";

#include "cli_common.hpp"
#include "bot_config.hpp"
#include "credential_refresher.hpp"
#include "download_server.hpp"
#include "environment_utilities.hpp"
#include "logger.hpp"
#include "metadata_cache.hpp"

#include "CLI/CLI.hpp"

#include <config.h>

#include <unistd.h>  // for STDIN_FILENO

#include <cstdlib>  // for EXIT_FAILURE, EXIT_SUCCESS
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>  // std::make_shared
#include <print>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>  // for std::remove_cvref_t
#include <vector>

auto
command_serve_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto command = "serve";
  static const auto usage =
    std::format("Usage: mediaq {} [options]", rstrip(command));
  static const auto about_msg =
    std::format("mediaq {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  mediaq::bot_config cfg;
  std::string config_file;

  CLI::App app{about_msg};
  argv = app.ensure_utf8(argv);
  setup_app(app, usage, description_msg, argc);
  // clang-format off
  app.add_option("-c,--config-file", config_file,
                 "read configuration from this file")
    ->check(CLI::ExistingFile);
  app.add_option("-d,--download-dir", cfg.download_dir,
                 "directory for downloaded files");
  app.add_option("-q,--mirror-dir", cfg.mirror_dir,
                 "directory for the durable copy of the queue");
  app.add_option("-w,--n-workers", cfg.n_workers, "number of workers")
    ->check(CLI::Range(1, mediaq::bot_config::max_n_workers));
  app.add_option("--ytdlp-path", cfg.ytdlp_path, "extractor executable");
  app.add_option("--cookies-file", cfg.cookies_file,
                 "cookies file in Netscape format");
  app.add_option("-v,--log-level", cfg.log_level,
                 std::format("log level {}", mediaq::log_level_help_str))
    ->option_text(std::format("[{}]", mediaq::log_level_t::info))
    ->transform(CLI::CheckedTransformer(mediaq::str_to_level, CLI::ignore_case));
  app.add_option("-l,--log-file", cfg.log_file, "log file name");
  // clang-format on
  CLI11_PARSE(app, argc, argv);

  // Values given on the command line take precedence over the config
  // file; anything still unset gets its default.
  std::error_code error;
  if (!config_file.empty()) {
    // make any assigned paths absolute so that subsequent composition with
    // the config_dir will not change a relative path given on the command
    // line.
    cfg.make_paths_absolute();
    cfg.read_config_file_no_overwrite(config_file, error);
    if (error) {
      std::println(std::cerr, "Failed to read config file {}: {}",
                   config_file, error);
      return EXIT_FAILURE;
    }
    if (cfg.config_dir.empty())
      cfg.config_dir =
        std::filesystem::path(config_file).parent_path().string();
  }
  const auto defaults = mediaq::bot_config::make_default();
  const auto fill = [](auto &value, const auto &from) {
    if (value == std::remove_cvref_t<decltype(value)>{})
      value = from;
  };
  fill(cfg.download_dir, defaults.download_dir);
  fill(cfg.mirror_dir, defaults.mirror_dir);
  fill(cfg.n_workers, defaults.n_workers);
  fill(cfg.max_queue_size, defaults.max_queue_size);
  fill(cfg.queue_max_age_secs, defaults.queue_max_age_secs);
  fill(cfg.check_interval_ms, defaults.check_interval_ms);
  fill(cfg.ytdlp_path, defaults.ytdlp_path);
  fill(cfg.ytdlp_timeout_secs, defaults.ytdlp_timeout_secs);
  fill(cfg.pot_provider_url, defaults.pot_provider_url);
  fill(cfg.refresh_timeout_secs, defaults.refresh_timeout_secs);
  fill(cfg.max_concurrent_processing, defaults.max_concurrent_processing);
  fill(cfg.default_audio_bitrate, defaults.default_audio_bitrate);
  if (config_file.empty())
    cfg.inter_download_delay_ms = defaults.inter_download_delay_ms;

  std::shared_ptr<std::ostream> log_file =
    cfg.log_file.empty()
      ? mediaq::shared_from_cerr()
      : std::make_shared<std::ofstream>(cfg.get_log_file(), std::ios::app);

  auto &lgr = mediaq::logger::instance(log_file, command, cfg.log_level);
  if (!lgr) {
    std::println(std::cerr, "Failure initializing logging: {}.",
                 lgr.get_status());
    return EXIT_FAILURE;
  }

  const bool cfg_is_valid = cfg.validate(error);
  if (!cfg_is_valid || error) {
    lgr.error("Invalid configuration: {}", error);
    return EXIT_FAILURE;
  }

  const auto chain = cfg.get_proxy_chain();
  std::vector<std::tuple<std::string, std::string>> args_to_log{
    // clang-format off
    {"Config file", config_file},
    {"VERSION", VERSION},
    {"Download dir", cfg.get_download_dir()},
    {"Queue dir", cfg.get_mirror_dir()},
    {"Log file", cfg.get_log_file()},
    {"Log level", std::format("{}", cfg.log_level)},
    {"N workers", std::format("{}", cfg.n_workers)},
    {"Max queue size", std::format("{}", cfg.max_queue_size)},
    {"Queue max age", std::format("{}s", cfg.queue_max_age_secs)},
    {"Extractor", cfg.ytdlp_path},
    {"Extractor timeout", std::format("{}s", cfg.ytdlp_timeout_secs)},
    {"Cookies", cfg.cookies_file.empty() ? cfg.cookies_from_browser
                                         : cfg.cookies_file},
    {"Proxy chain", std::format("{} entries", std::size(chain))},
    {"Max processing", std::format("{}", cfg.max_concurrent_processing)},
    // clang-format on
  };
  mediaq::log_args<mediaq::log_level_t::info>(args_to_log);
  for (const auto &proxy : chain)
    lgr.info("Proxy: {}", mediaq::proxy_label(proxy));

  const auto refresher = std::make_shared<mediaq::refresh_signal>();
  const auto registry = mediaq::make_default_registry(
    cfg, std::make_shared<mediaq::metadata_cache>(), refresher);

  mediaq::download_server s(cfg, registry, refresher, std::cout, STDIN_FILENO,
                            error);
  if (error) {
    lgr.error("Failure initializing server: {}", error);
    return EXIT_FAILURE;
  }
  s.run();

  return EXIT_SUCCESS;
}
