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

#ifndef LIB_TIER_CONFIG_HPP_
#define LIB_TIER_CONFIG_HPP_

#include "download.hpp"
#include "proxy_config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaq {

/// Escalation level of an extraction attempt
enum class tier_t : std::uint8_t {
  unauthenticated = 1,  // no stored credentials, modern client emulation
  authenticated = 2,    // stored session and integrity token provider
  no_postprocessing = 3,  // authenticated, container fixups disabled
};

static constexpr auto n_tiers = 3;

enum class auth_mode_t : std::uint8_t {
  none,
  cookies_file,
  cookies_from_browser,
};

/// Settings of the extractor that shape its arguments
struct extractor_settings {
  static constexpr auto default_pot_provider_url = "http://127.0.0.1:4416";
  static constexpr auto default_audio_bitrate = "320k";
  static constexpr auto subtitle_languages = "en,ru";

  std::string cookies_file;
  std::string cookies_from_browser;
  std::string pot_provider_url{default_pot_provider_url};
  std::string audio_bitrate{default_audio_bitrate};

  [[nodiscard]] auto
  auth_mode() const -> auth_mode_t {
    if (!cookies_file.empty())
      return auth_mode_t::cookies_file;
    if (!cookies_from_browser.empty())
      return auth_mode_t::cookies_from_browser;
    return auth_mode_t::none;
  }
};

/// Everything needed to build the argument vector for one tier
struct tier_config {
  tier_t tier{tier_t::unauthenticated};
  std::string url;
  std::vector<std::string> base_args;
  auth_mode_t auth_mode{auth_mode_t::none};
  std::vector<std::string> auth_args;
  std::vector<std::string> extra_flags;

  /// Arguments for the extractor (not including the program itself)
  [[nodiscard]] auto
  to_arguments(const std::optional<proxy_config> &proxy) const
    -> std::vector<std::string>;
};

/// All three tiers for one request, built once per task
[[nodiscard]] auto
build_tier_configs(const download_request &request,
                   const extractor_settings &settings)
  -> std::array<tier_config, n_tiers>;

/// Format selector preferring H.264 and AAC (playable inline by chat
/// clients) at the requested height, then lower heights, then anything
[[nodiscard]] auto
build_telegram_safe_format(const std::optional<std::uint32_t> height)
  -> std::string;

/// "720p" gives 720; "best" and anything unparsable give nothing
[[nodiscard]] auto
parse_video_height(const std::string_view quality)
  -> std::optional<std::uint32_t>;

[[nodiscard]] auto
is_subtitle_format(const std::string_view format) -> bool;

[[nodiscard]] constexpr auto
tier_index(const tier_t t) -> std::size_t {
  return static_cast<std::size_t>(t) - 1;
}

}  // namespace mediaq

template <>
struct std::formatter<mediaq::tier_t> : std::formatter<std::string> {
  auto
  format(const mediaq::tier_t &t, auto &ctx) const {
    return std::formatter<std::string>::format(
      std::format("tier {}", static_cast<int>(t)), ctx);
  }
};

#endif  // LIB_TIER_CONFIG_HPP_
