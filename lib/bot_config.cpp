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

#include "bot_config.hpp"

#include "environment_utilities.hpp"
#include "proxy_config.hpp"
#include "queue_worker.hpp"
#include "tier_config.hpp"
#include "ytdlp_source.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>  // for getenv
#include <filesystem>
#include <fstream>
#include <iterator>  // for std::size
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>  // for std::remove_cvref_t

namespace mediaq {

[[nodiscard]] auto
bot_config::make_default() -> bot_config {
  bot_config cfg;
  cfg.download_dir = default_download_dir;
  cfg.mirror_dir = default_mirror_dir;
  cfg.log_level = log_level_t::info;
  cfg.n_workers = default_n_workers;
  cfg.max_queue_size = default_max_queue_size;
  cfg.queue_max_age_secs = default_queue_max_age_secs;
  cfg.check_interval_ms = default_check_interval_ms;
  cfg.inter_download_delay_ms = default_inter_download_delay_ms;
  cfg.ytdlp_path = default_ytdlp_path;
  cfg.ytdlp_timeout_secs = default_ytdlp_timeout_secs;
  cfg.pot_provider_url = default_pot_provider_url;
  cfg.refresh_timeout_secs = default_refresh_timeout_secs;
  cfg.max_concurrent_processing = default_max_concurrent_processing;
  cfg.default_audio_bitrate = default_bitrate;
  cfg.max_retries = default_max_retries;
  cfg.record_max_age_secs = default_record_max_age_secs;
  cfg.instagram_doc_id = default_instagram_doc_id;
  return cfg;
}

auto
bot_config::make_paths_absolute() noexcept -> void {
  namespace fs = std::filesystem;
  // errors in absolute are for std::bad_alloc
  std::error_code ignored_error;
  if (!config_dir.empty())
    config_dir = fs::absolute(config_dir, ignored_error).string();
  if (!download_dir.empty())
    download_dir = fs::absolute(get_download_dir(), ignored_error).string();
  if (!mirror_dir.empty())
    mirror_dir = fs::absolute(get_mirror_dir(), ignored_error).string();
  if (!log_file.empty())
    log_file = fs::absolute(get_log_file(), ignored_error).string();
  if (!cookies_file.empty())
    cookies_file = fs::absolute(cookies_file, ignored_error).string();
}

[[nodiscard]] auto
bot_config::get_default_config_dir(std::error_code &error) -> std::string {
  static const auto config_dir_rhs = std::filesystem::path(".config/mediaq");
  const auto env_home = std::getenv("HOME");
  if (!env_home) {
    error = std::make_error_code(std::errc{errno});
    return {};
  }
  const std::filesystem::path config_dir = env_home / config_dir_rhs;
  return config_dir;
}

[[nodiscard]] auto
bot_config::get_config_file(const std::string &config_dir) noexcept
  -> std::string {
  return (std::filesystem::path(config_dir) / bot_config_filename_default)
    .lexically_normal();
}

/// Relative paths are relative to the config directory
[[nodiscard]] auto
bot_config::get_download_dir() const noexcept -> std::string {
  return (std::filesystem::path(config_dir) / download_dir).lexically_normal();
}

[[nodiscard]] auto
bot_config::get_mirror_dir() const noexcept -> std::string {
  return (std::filesystem::path(config_dir) / mirror_dir).lexically_normal();
}

[[nodiscard]] auto
bot_config::get_log_file() const noexcept -> std::string {
  if (log_file.empty())
    return {};
  return (std::filesystem::path(config_dir) / log_file).lexically_normal();
}

[[nodiscard]] auto
bot_config::read(const std::string &config_file,
                 std::error_code &error) noexcept -> bot_config {
  std::ifstream in(config_file);
  if (!in) {
    error = bot_config_error_code::failed_to_read_config_file;
    return {};
  }
  const nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
  if (data.is_discarded()) {
    error = bot_config_error_code::failed_to_parse_config_file;
    return {};
  }
  bot_config config;
  try {
    config = data;
  }
  catch (const nlohmann::json::exception &) {
    error = bot_config_error_code::invalid_config_file;
    return {};
  }
  return config;
}

auto
bot_config::read_config_file_no_overwrite(
  const std::string &config_file, std::error_code &error) noexcept -> void {
  const auto tmp = bot_config::read(config_file, error);
  if (error)
    return;

  const auto fill = [](auto &value, const auto &from) {
    if (value == std::remove_cvref_t<decltype(value)>{})
      value = from;
  };
  fill(config_dir, tmp.config_dir);
  fill(download_dir, tmp.download_dir);
  fill(mirror_dir, tmp.mirror_dir);
  fill(log_file, tmp.log_file);
  fill(n_workers, tmp.n_workers);
  fill(max_queue_size, tmp.max_queue_size);
  fill(queue_max_age_secs, tmp.queue_max_age_secs);
  fill(check_interval_ms, tmp.check_interval_ms);
  fill(inter_download_delay_ms, tmp.inter_download_delay_ms);
  fill(ytdlp_path, tmp.ytdlp_path);
  fill(ytdlp_timeout_secs, tmp.ytdlp_timeout_secs);
  fill(cookies_file, tmp.cookies_file);
  fill(cookies_from_browser, tmp.cookies_from_browser);
  fill(pot_provider_url, tmp.pot_provider_url);
  fill(proxies, tmp.proxies);
  fill(refresh_timeout_secs, tmp.refresh_timeout_secs);
  fill(max_file_size, tmp.max_file_size);
  fill(max_concurrent_processing, tmp.max_concurrent_processing);
  fill(default_audio_bitrate, tmp.default_audio_bitrate);
  fill(max_retries, tmp.max_retries);
  fill(record_max_age_secs, tmp.record_max_age_secs);
  fill(instagram_doc_id, tmp.instagram_doc_id);
}

[[nodiscard]] auto
bot_config::tostring() const -> std::string {
  static constexpr auto n_indent = 4;
  nlohmann::json data = *this;
  return data.dump(n_indent);
}

[[nodiscard]] auto
bot_config::write(const std::string &config_file) const -> std::error_code {
  std::ofstream out(config_file);
  if (!out)
    return bot_config_error_code::error_writing_config_file;
  const std::string payload = tostring();
  out.write(payload.data(), static_cast<std::streamsize>(std::size(payload)));
  if (!out)
    return bot_config_error_code::error_writing_config_file;
  return {};
}

[[nodiscard]] auto
bot_config::validate(std::error_code &error) const noexcept -> bool {
  const auto invalid = [&] {
    error = bot_config_error_code::invalid_config_information;
    return false;
  };

  if (download_dir.empty() || mirror_dir.empty())
    return invalid();

  if (n_workers == 0 || n_workers > max_n_workers)
    return invalid();

  if (max_queue_size == 0 || queue_max_age_secs == 0)
    return invalid();

  if (check_interval_ms == 0)
    return invalid();

  if (ytdlp_path.empty() || ytdlp_timeout_secs == 0)
    return invalid();

  if (refresh_timeout_secs == 0 || max_concurrent_processing == 0)
    return invalid();

  if (!cookies_file.empty() && !cookies_from_browser.empty())
    return invalid();

  const auto has_no_url = [](const auto &p) { return p.url.empty(); };
  if (std::ranges::any_of(proxies, has_no_url))
    return invalid();

  return true;
}

[[nodiscard]] auto
bot_config::get_proxy_chain() const -> proxy_chain {
  return make_proxy_chain(proxies, get_env(env_proxy_variable));
}

[[nodiscard]] auto
bot_config::get_instagram_doc_id() const -> std::string {
  if (auto from_env = get_env(env_instagram_doc_id_variable);
      !from_env.empty())
    return from_env;
  return instagram_doc_id.empty() ? default_instagram_doc_id
                                  : instagram_doc_id;
}

[[nodiscard]] auto
bot_config::get_ytdlp_config() const -> ytdlp_config {
  ytdlp_config cfg;
  cfg.ytdlp_path = ytdlp_path;
  cfg.timeout = std::chrono::seconds{ytdlp_timeout_secs};
  cfg.refresh_timeout = std::chrono::seconds{refresh_timeout_secs};
  cfg.extractor.cookies_file = cookies_file;
  cfg.extractor.cookies_from_browser = cookies_from_browser;
  if (!pot_provider_url.empty())
    cfg.extractor.pot_provider_url = pot_provider_url;
  if (!default_audio_bitrate.empty())
    cfg.extractor.audio_bitrate = default_audio_bitrate;
  cfg.proxies = get_proxy_chain();
  return cfg;
}

[[nodiscard]] auto
bot_config::get_worker_settings() const -> worker_settings {
  worker_settings s;
  s.n_workers = n_workers;
  s.check_interval = std::chrono::milliseconds{check_interval_ms};
  s.inter_download_delay = std::chrono::milliseconds{inter_download_delay_ms};
  s.download_dir = get_download_dir();
  if (max_file_size > 0)
    s.max_file_size = max_file_size;
  return s;
}

}  // namespace mediaq
