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

#ifndef LIB_INSTAGRAM_SOURCE_HPP_
#define LIB_INSTAGRAM_SOURCE_HPP_

#include "download.hpp"
#include "source_backend.hpp"
#include "source_progress.hpp"

#include "nlohmann/json.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace mediaq {

using std::literals::string_view_literals::operator""sv;

/// One photo or video of a post; a carousel has several
struct instagram_item {
  bool is_video{};
  std::string video_url;
  std::string display_url;
  std::optional<double> video_duration;

  /// The URL to fetch, or empty if the post did not give one
  [[nodiscard]] auto
  media_url() const -> const std::string & {
    return is_video ? video_url : display_url;
  }

  [[nodiscard]] auto
  mime_type() const -> std::string_view {
    return is_video ? "video/mp4"sv : "image/jpeg"sv;
  }

  [[nodiscard]] auto
  extension() const -> std::string_view {
    return is_video ? "mp4"sv : "jpg"sv;
  }
};

/// The parts of a post that matter for a download
struct instagram_media {
  std::vector<instagram_item> items;
  std::string caption;
  std::string username;
};

/// Shortcode of a post, reel or tv URL on instagram.com; nothing for
/// profiles and other hosts
[[nodiscard]] auto
extract_instagram_shortcode(const std::string &url)
  -> std::optional<std::string>;

/// Read a post out of a GraphQL response
[[nodiscard]] auto
parse_instagram_media(const nlohmann::json &response,
                      std::error_code &error) -> instagram_media;

/// First caption line (at most 100 characters) or a generic title
[[nodiscard]] auto
instagram_title(const instagram_media &media) -> std::string;

/// Path for carousel item `index` (0-based) next to the primary output:
/// "dir/stem_carousel_<index+1>.<ext>"
[[nodiscard]] auto
carousel_item_path(const std::string &output_path, const std::size_t index,
                   const std::string_view ext) -> std::string;

/// Allows at most `limit` acquisitions in any window of length `window`
class sliding_window_limiter {
public:
  using clock = std::chrono::steady_clock;

  sliding_window_limiter(const std::size_t limit,
                         const std::chrono::seconds window) :
    limit{limit}, window{window} {}

  /// False if the window is full; otherwise the slot is taken
  [[nodiscard]] auto
  try_acquire(const clock::time_point now = clock::now()) -> bool;

private:
  std::size_t limit{};
  std::chrono::seconds window{};
  std::deque<clock::time_point> taken;
  std::mutex mtx;
};

/// Fetches posts and reels through Instagram's web GraphQL endpoint.
/// Anything that goes wrong with the lookup hands the request to the
/// fallback backend when one is given.
class instagram_source : public source_backend {
public:
  static constexpr auto graphql_endpoint =
    "https://www.instagram.com/api/graphql";
  static constexpr auto app_id = "936619743392459";
  static constexpr auto lsd_token = "AVqbxe3J_YA";
  static constexpr auto asbd_id = "129477";
  // Instagram allows about 200 per hour from one address
  static constexpr std::size_t max_requests_per_hour{180};
  static constexpr auto default_timeout = std::chrono::seconds{30};
  static constexpr auto max_title_size = 100;

  static constexpr auto content_types = std::array{
    "p"sv,
    "reel"sv,
    "reels"sv,
    "tv"sv,
  };

  /// `fallback` may be null, in which case lookup failures are reported
  instagram_source(const std::string &doc_id,
                   std::shared_ptr<source_backend> fallback,
                   const std::chrono::seconds timeout = default_timeout,
                   const std::string &endpoint = graphql_endpoint) :
    doc_id{doc_id}, endpoint{endpoint}, fallback{std::move(fallback)},
    timeout{timeout} {}

  [[nodiscard]] auto
  name() const -> std::string_view override {
    return "instagram";
  }

  [[nodiscard]] auto
  supports(const std::string &url) const -> bool override {
    return extract_instagram_shortcode(url).has_value();
  }

  [[nodiscard]] auto
  metadata(const std::string &url,
           std::error_code &error) const -> media_metadata override;

  /// The lookup does not report sizes
  [[nodiscard]] auto
  estimate_size(const std::string &) const
    -> std::optional<std::uint64_t> override {
    return std::nullopt;
  }

  [[nodiscard]] auto
  is_livestream(const std::string &) const -> bool override {
    return false;
  }

  /// The first item lands at the requested path (with the extension of its
  /// type); the rest of a carousel go to `additional_files`
  [[nodiscard]] auto
  download(const download_request &request, progress_channel &progress,
           std::error_code &error) const -> download_output override;

  /// POST the lookup for `shortcode` and parse the answer
  [[nodiscard]] auto
  fetch_media(const std::string &shortcode,
              std::error_code &error) const -> instagram_media;

  /// Request body for the lookup of `shortcode`
  [[nodiscard]] auto
  make_query(const std::string &shortcode) const -> std::string;

private:
  [[nodiscard]] auto
  download_items(const instagram_media &media,
                 const download_request &request, progress_channel &progress,
                 std::error_code &error) const -> download_output;

  std::string doc_id;
  std::string endpoint;
  std::shared_ptr<source_backend> fallback;
  std::chrono::seconds timeout{default_timeout};
  mutable sliding_window_limiter limiter{max_requests_per_hour,
                                         std::chrono::hours{1}};
};

}  // namespace mediaq

/// @brief Enum for error codes from Instagram post lookups
enum class instagram_error_code : std::uint8_t {
  ok = 0,
  not_a_post_url = 1,
  rate_limited = 2,
  invalid_response = 3,
  doc_id_expired = 4,
  login_required = 5,
  post_not_found = 6,
  no_media_in_post = 7,
};

template <>
struct std::is_error_code_enum<instagram_error_code> : public std::true_type {
};

struct instagram_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "instagram";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "not a post url"s;
    case 2: return "rate limited"s;
    case 3: return "invalid response"s;
    case 4: return "doc_id may be expired"s;
    case 5: return "private account or login required"s;
    case 6: return "post not found or media unavailable"s;
    case 7: return "no media in post"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(instagram_error_code e) -> std::error_code {
  static auto category = instagram_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_INSTAGRAM_SOURCE_HPP_
