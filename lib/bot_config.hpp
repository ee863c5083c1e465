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

#ifndef LIB_BOT_CONFIG_HPP_
#define LIB_BOT_CONFIG_HPP_

#include "logger.hpp"  // IWYU pragma: keep
#include "proxy_config.hpp"

#include "nlohmann/json.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace mediaq {

// clang-format off
NLOHMANN_JSON_SERIALIZE_ENUM(log_level_t, {
    {log_level_t::debug, "debug"},
    {log_level_t::info, "info"},
    {log_level_t::warning, "warning"},
    {log_level_t::error, "error"},
    {log_level_t::critical, "critical"},
  })
// clang-format on

struct worker_settings;
struct ytdlp_config;

struct bot_config {
  static constexpr auto max_n_workers = 64;
  static constexpr auto default_n_workers = 2;
  static constexpr auto default_max_queue_size = 1000;
  static constexpr auto default_queue_max_age_secs = 3600;
  static constexpr auto default_check_interval_ms = 100;
  static constexpr auto default_inter_download_delay_ms = 3000;
  static constexpr auto default_ytdlp_path = "yt-dlp";
  static constexpr auto default_ytdlp_timeout_secs = 240;
  static constexpr auto default_refresh_timeout_secs = 20;
  static constexpr auto default_max_concurrent_processing = 2;
  static constexpr auto default_max_retries = 3;
  static constexpr auto default_record_max_age_secs = 7 * 24 * 3600;
  static constexpr auto default_bitrate = "320k";
  static constexpr auto default_pot_provider_url = "http://127.0.0.1:4416";
  static constexpr auto default_download_dir = "downloads";
  static constexpr auto default_mirror_dir = "queue";
  static constexpr auto bot_config_filename_default = "mediaq.json";
  static constexpr auto default_instagram_doc_id = "8845758582119845";
  static constexpr auto env_proxy_variable = "WARP_PROXY";
  static constexpr auto env_instagram_doc_id_variable = "INSTAGRAM_DOC_ID";

  std::string config_dir;
  std::string download_dir;
  std::string mirror_dir;
  std::string log_file;
  log_level_t log_level{log_level_t::info};
  std::uint32_t n_workers{};
  std::uint32_t max_queue_size{};
  std::uint32_t queue_max_age_secs{};
  std::uint32_t check_interval_ms{};
  std::uint32_t inter_download_delay_ms{};
  std::string ytdlp_path;
  std::uint32_t ytdlp_timeout_secs{};
  std::string cookies_file;
  std::string cookies_from_browser;
  std::string pot_provider_url;
  std::vector<proxy_config> proxies;
  std::uint32_t refresh_timeout_secs{};
  std::uint64_t max_file_size{};
  std::uint32_t max_concurrent_processing{};
  std::string default_audio_bitrate;
  /// Failed tasks are offered for retry until they have failed this often
  std::uint32_t max_retries{};
  /// Finished mirror records older than this are removed; 0 keeps them
  std::uint32_t record_max_age_secs{};
  /// Query id of the Instagram post lookup; Instagram rotates it every few
  /// weeks
  std::string instagram_doc_id;

  /// A config with every default set
  [[nodiscard]] static auto
  make_default() -> bot_config;

  /// Get the path to the download directory
  [[nodiscard]] auto
  get_download_dir() const noexcept -> std::string;

  /// Get the path to the queue mirror directory
  [[nodiscard]] auto
  get_mirror_dir() const noexcept -> std::string;

  [[nodiscard]] auto
  get_log_file() const noexcept -> std::string;

  /// Initialize any empty values by reading the config file
  auto
  read_config_file_no_overwrite(const std::string &config_file,
                                std::error_code &error) noexcept -> void;

  [[nodiscard]] static auto
  read(const std::string &config_file,
       std::error_code &error) noexcept -> bot_config;

#ifndef MEDIAQ_NOEXCEPT
  /// Overload of the read function that throws system_error exceptions to
  /// serve in an API
  [[nodiscard]] static auto
  read(const std::string &config_file) -> bot_config {
    std::error_code error;
    const auto obj = read(config_file, error);
    if (error) {
      const auto message = std::format("[config_file: {}]", config_file);
      throw std::system_error(error, message);
    }
    return obj;
  }
#endif

  [[nodiscard]] auto
  write(const std::string &config_file) const -> std::error_code;

  [[nodiscard]] static auto
  get_default_config_dir(std::error_code &error) -> std::string;

  [[nodiscard]] static auto
  get_config_file(const std::string &config_dir) noexcept -> std::string;

  [[nodiscard]] auto
  tostring() const -> std::string;

  auto
  make_paths_absolute() noexcept -> void;

  /// Validate the values before using them to start anything
  [[nodiscard]] auto
  validate(std::error_code &error) const noexcept -> bool;

  /// The proxy chain: the proxy in WARP_PROXY (if any), the configured
  /// proxies, then the direct connection
  [[nodiscard]] auto
  get_proxy_chain() const -> proxy_chain;

  [[nodiscard]] auto
  get_ytdlp_config() const -> ytdlp_config;

  /// INSTAGRAM_DOC_ID if set, else the configured id, else the default
  [[nodiscard]] auto
  get_instagram_doc_id() const -> std::string;

  [[nodiscard]] auto
  get_worker_settings() const -> worker_settings;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
    bot_config, config_dir, download_dir, mirror_dir, log_file, log_level,
    n_workers, max_queue_size, queue_max_age_secs, check_interval_ms,
    inter_download_delay_ms, ytdlp_path, ytdlp_timeout_secs, cookies_file,
    cookies_from_browser, pot_provider_url, proxies, refresh_timeout_secs,
    max_file_size, max_concurrent_processing, default_audio_bitrate,
    max_retries, record_max_age_secs, instagram_doc_id)
};

}  // namespace mediaq

/// @brief Enum for error codes related to the bot configuration
enum class bot_config_error_code : std::uint8_t {
  ok = 0,
  error_writing_config_file = 1,
  invalid_config_information = 2,
  failed_to_read_config_file = 3,
  failed_to_parse_config_file = 4,
  invalid_config_file = 5,
};

template <>
struct std::is_error_code_enum<bot_config_error_code> : public std::true_type {
};

struct bot_config_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "bot_config";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "error writing config file"s;
    case 2: return "invalid config information"s;
    case 3: return "failed to read config file"s;
    case 4: return "failed to parse config file"s;
    case 5: return "invalid config file"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(bot_config_error_code e) -> std::error_code {
  static auto category = bot_config_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_BOT_CONFIG_HPP_
