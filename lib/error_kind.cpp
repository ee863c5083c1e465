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

#include "error_kind.hpp"

#include <boost/describe.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>  // for std::unreachable
#include <vector>

namespace mediaq {

using std::literals::string_view_literals::operator""sv;

// Signatures are matched against lowercased text, in the order of the
// groups below; the first group with a match decides the kind.

// clang-format off
static constexpr auto bot_challenge_signatures = std::array{
  "sign in to confirm you're not a bot"sv,
  "sign in to confirm you’re not a bot"sv,
  "confirm you're not a bot"sv,
  "confirm you’re not a bot"sv,
};

static constexpr auto invalid_cookies_signatures = std::array{
  "cookies are no longer valid"sv,
  "cookies have likely been rotated"sv,
  "please sign in"sv,
  "use --cookies-from-browser"sv,
  "use --cookies for the authentication"sv,
  "the provided youtube account cookies are no longer valid"sv,
};

static constexpr auto fragment_failure_signatures = std::array{
  "http error 403"sv,
  "retrying fragment"sv,
  "fragment not found"sv,
  "skipping fragment"sv,
};

static constexpr auto bot_detection_signatures = std::array{
  "bot detection"sv,
  "http error 403"sv,
  "unable to extract"sv,
  "signature extraction failed"sv,
};

static constexpr auto unavailable_signatures = std::array{
  "private video"sv,
  "video unavailable"sv,
  "this video is not available"sv,
  "video is private"sv,
  "video has been removed"sv,
  "this video does not exist"sv,
  "video is not available"sv,
};

static constexpr auto network_signatures = std::array{
  "timeout"sv,
  "connection"sv,
  "network"sv,
  "socket"sv,
  "dns"sv,
  "failed to connect"sv,
};

static constexpr auto postprocessing_signatures = std::array{
  "postprocessing"sv,
  "conversion failed"sv,
  "fixupm3u8"sv,
  "ffmpeg"sv,
  "merger"sv,
  "error fixing"sv,
};

static constexpr auto disk_space_signatures = std::array{
  "no space left"sv,
  "disk quota"sv,
  "not enough space"sv,
  "insufficient disk space"sv,
  "enospc"sv,
  "no free space"sv,
  "disk full"sv,
};

static constexpr auto proxy_signatures = std::array{
  "proxy"sv,
  "tunnel"sv,
  "socks"sv,
  "407"sv,
  "forbidden"sv,
  "403"sv,
  "timed out"sv,
  "timeout"sv,
  "dns"sv,
  "connection refused"sv,
  "connection reset"sv,
};

static constexpr auto extractor_noise_signatures = std::array{
  "yt-dlp"sv,
  "youtube-dl"sv,
  "http error 403"sv,
  "fragment"sv,
  "signature extraction"sv,
  "bot detection"sv,
  "stderr"sv,
  "stdout"sv,
  "[download]"sv,
  "warning: [youtube]"sv,
  "error: [youtube]"sv,
  "downloaded file is empty"sv,
  "unable to download"sv,
  "confirm you're not a bot"sv,
  "confirm you’re not a bot"sv,
};
// clang-format on

[[nodiscard]] static inline auto
to_lower(const std::string_view s) -> std::string {
  std::string r(s);
  std::ranges::for_each(r, [](auto &c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return r;
}

[[nodiscard]] static inline auto
contains_any(const std::string_view text,
             std::ranges::input_range auto &&signatures) -> bool {
  return std::ranges::any_of(signatures, [&](const std::string_view sig) {
    return text.find(sig) != std::string_view::npos;
  });
}

[[nodiscard]] auto
classify_error(const std::string_view text) -> error_kind {
  const auto lower = to_lower(text);
  if (contains_any(lower, bot_challenge_signatures))
    return error_kind::bot_detection;
  if (contains_any(lower, invalid_cookies_signatures))
    return error_kind::invalid_cookies;
  if (lower.find("fragment") != std::string::npos &&
      contains_any(lower, fragment_failure_signatures))
    return error_kind::fragment_error;
  if (contains_any(lower, bot_detection_signatures))
    return error_kind::bot_detection;
  if (contains_any(lower, unavailable_signatures))
    return error_kind::video_unavailable;
  if (contains_any(lower, network_signatures))
    return error_kind::network_error;
  if (contains_any(lower, postprocessing_signatures))
    return error_kind::postprocessing_error;
  if (contains_any(lower, disk_space_signatures))
    return error_kind::disk_space_error;
  return error_kind::unknown;
}

[[nodiscard]] auto
is_proxy_related(const error_kind kind, const std::string_view text) -> bool {
  if (kind == error_kind::invalid_cookies)
    return false;
  if (kind == error_kind::bot_detection || kind == error_kind::network_error)
    return true;
  return contains_any(to_lower(text), proxy_signatures);
}

[[nodiscard]] auto
user_message(const error_kind kind) -> std::string {
  switch (kind) {
  case error_kind::ok:
    return {};
  case error_kind::invalid_cookies:
    return "Temporary issue with the site.\n\n"
           "Try a different video or retry later.";
  case error_kind::bot_detection:
    return "The site blocked the request.\n\n"
           "Try a different video or retry later.";
  case error_kind::video_unavailable:
    return "Video unavailable.\n\n"
           "It may be private, deleted, or blocked in your region.";
  case error_kind::network_error:
    return "Network problem.\n\nTry again in a minute.";
  case error_kind::fragment_error:
    return "Temporary issue while downloading video.\n\nPlease retry.";
  case error_kind::postprocessing_error:
    return "Video processing error.\n\nPlease retry.";
  case error_kind::disk_space_error:
    return "Server is overloaded.\n\nTry again later.";
  case error_kind::unknown:
    return "Failed to download video.\n\nCheck that the link is correct.";
  }
  std::unreachable();
}

[[nodiscard]] auto
should_notify_admin(const error_kind kind) noexcept -> bool {
  switch (kind) {
  case error_kind::invalid_cookies:
  case error_kind::bot_detection:
  case error_kind::disk_space_error:
  case error_kind::unknown:
    return true;
  default:
    return false;
  }
}

[[nodiscard]] auto
fix_recommendations(const error_kind kind) -> std::vector<std::string> {
  switch (kind) {
  case error_kind::ok:
    return {};
  case error_kind::invalid_cookies:
    return {
      "cookies are outdated or were rotated by the browser",
      "export fresh cookies in Netscape format and set cookies_file",
      "or set cookies_from_browser to a browser logged in to the site",
    };
  case error_kind::bot_detection:
    return {
      "the site detected automated requests from this address",
      "refresh cookies from the browser",
      "update yt-dlp and check the PO token provider",
      "add or rotate proxies",
    };
  case error_kind::video_unavailable:
    return {"no action required"};
  case error_kind::network_error:
    return {
      "check the network connection and proxy health",
      "increase timeouts if the problem persists",
    };
  case error_kind::fragment_error:
    return {
      "fragments are retried by yt-dlp; usually transient",
      "if frequent: check the network and update yt-dlp",
    };
  case error_kind::postprocessing_error:
    return {
      "post-processing (ffmpeg) failed; a retry without fixups is automatic",
      "check the ffmpeg version, disk space and write permissions",
    };
  case error_kind::disk_space_error:
    return {
      "downloads fail until space is freed",
      "check the download directory and temporary directory usage",
    };
  case error_kind::unknown:
    return {
      "check the log for the extractor diagnostic",
      "make sure yt-dlp is up to date",
    };
  }
  std::unreachable();
}

[[nodiscard]] auto
sanitize_error_message(const std::string_view text) -> std::string {
  const auto not_space = [](const unsigned char c) { return !std::isspace(c); };
  const auto b = std::ranges::find_if(text, not_space);
  const auto e = std::ranges::find_if(text | std::views::reverse, not_space);
  if (b == std::cend(text))
    return "Failed to download video.\n\nPlease try again later.";
  const std::string_view trimmed(b, e.base());
  if (contains_any(to_lower(trimmed), extractor_noise_signatures))
    return user_message(classify_error(trimmed));
  return std::string(trimmed);
}

[[nodiscard]] auto
to_name(const error_kind kind) -> std::string_view {
  return boost::describe::enum_to_string(kind, "unknown");
}

}  // namespace mediaq
