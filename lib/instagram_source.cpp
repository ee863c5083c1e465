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

#include "instagram_source.hpp"

#include "download.hpp"
#include "download_progress.hpp"
#include "environment_utilities.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "url.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iterator>
#include <mutex>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace mediaq {

[[nodiscard]] auto
extract_instagram_shortcode(const std::string &url)
  -> std::optional<std::string> {
  const auto u = parse_url(url);
  if (!u || (u->host != "instagram.com" && u->host != "www.instagram.com"))
    return std::nullopt;

  std::vector<std::string> segments;
  for (const auto part : u->path | std::views::split('/'))
    if (!part.empty())
      segments.emplace_back(std::cbegin(part), std::cend(part));

  const auto is_content_type = [](const std::string &s) {
    const auto &types = instagram_source::content_types;
    return std::ranges::find(types, std::string_view{s}) != std::cend(types);
  };
  // /reel/<code>/ or /<username>/reel/<code>/
  if (std::size(segments) >= 2 && is_content_type(segments[0]))
    return segments[1];
  if (std::size(segments) >= 3 && is_content_type(segments[1]))
    return segments[2];
  return std::nullopt;
}

[[nodiscard]] static auto
string_at(const nlohmann::json &j, const std::string &pointer) -> std::string {
  const nlohmann::json::json_pointer ptr{pointer};
  if (!j.contains(ptr))
    return {};
  const auto &value = j.at(ptr);
  return value.is_string() ? value.get<std::string>() : std::string{};
}

[[nodiscard]] static auto
read_item(const nlohmann::json &node) -> instagram_item {
  instagram_item item;
  if (const auto it = node.find("is_video");
      it != std::cend(node) && it->is_boolean())
    item.is_video = it->get<bool>();
  item.video_url = string_at(node, "/video_url");
  item.display_url = string_at(node, "/display_url");
  if (const auto it = node.find("video_duration");
      it != std::cend(node) && it->is_number())
    item.video_duration = it->get<double>();
  return item;
}

[[nodiscard]] static auto
find_media_node(const nlohmann::json &response) -> const nlohmann::json * {
  static constexpr auto keys = std::array{
    "/data/xdt_shortcode_media",
    "/data/shortcode_media",
  };
  for (const auto key : keys) {
    const nlohmann::json::json_pointer ptr{key};
    if (response.contains(ptr) && response.at(ptr).is_object())
      return &response.at(ptr);
  }
  return nullptr;
}

[[nodiscard]] auto
parse_instagram_media(const nlohmann::json &response,
                      std::error_code &error) -> instagram_media {
  if (!response.is_object()) {
    error = instagram_error_code::invalid_response;
    return {};
  }
  try {
    const auto message = string_at(response, "/message");
    if (message.contains("useragent mismatch") || message.contains("doc_id")) {
      error = instagram_error_code::doc_id_expired;
      return {};
    }

    const auto media_node = find_media_node(response);
    if (media_node == nullptr) {
      const bool needs_login = message.contains("checkpoint_required") ||
                               message.contains("login_required");
      error = needs_login ? instagram_error_code::login_required
                          : instagram_error_code::post_not_found;
      return {};
    }
    const auto &node = *media_node;

    instagram_media media;
    media.caption = string_at(node, "/edge_media_to_caption/edges/0/node/text");
    media.username = string_at(node, "/owner/username");
    if (media.username.empty())
      media.username = "instagram";

    const nlohmann::json::json_pointer sidecar{
      "/edge_sidecar_to_children/edges"};
    if (node.contains(sidecar) && node.at(sidecar).is_array()) {
      for (const auto &edge : node.at(sidecar))
        if (edge.is_object() && edge.contains("node") &&
            edge["node"].is_object())
          media.items.push_back(read_item(edge["node"]));
    }
    else
      media.items.push_back(read_item(node));

    if (media.items.empty()) {
      error = instagram_error_code::no_media_in_post;
      return {};
    }
    return media;
  }
  catch (const nlohmann::json::exception &e) {
    logger::instance().debug("Unexpected Instagram response: {}", e.what());
    error = instagram_error_code::invalid_response;
    return {};
  }
}

[[nodiscard]] auto
instagram_title(const instagram_media &media) -> std::string {
  static constexpr std::size_t max_size = instagram_source::max_title_size;
  if (media.caption.empty())
    return std::format("Instagram post by @{}", media.username);
  const auto first_line = media.caption.substr(0, media.caption.find('\n'));
  if (std::size(first_line) <= max_size)
    return first_line;
  // do not split a multi-byte character
  auto cut = max_size - 3;
  const auto is_continuation = [&](const std::size_t i) {
    return (static_cast<unsigned char>(first_line[i]) & 0xC0) == 0x80;
  };
  while (cut > 0 && is_continuation(cut))
    --cut;
  return first_line.substr(0, cut) + "...";
}

[[nodiscard]] auto
carousel_item_path(const std::string &output_path, const std::size_t index,
                   const std::string_view ext) -> std::string {
  const std::filesystem::path p{output_path};
  const auto name =
    std::format("{}_carousel_{}.{}", p.stem().string(), index + 1, ext);
  return (p.parent_path() / name).string();
}

[[nodiscard]] auto
sliding_window_limiter::try_acquire(const clock::time_point now) -> bool {
  std::scoped_lock lock{mtx};
  while (!taken.empty() && taken.front() <= now - window)
    taken.pop_front();
  if (std::size(taken) >= limit)
    return false;
  taken.push_back(now);
  return true;
}

[[nodiscard]] auto
instagram_source::make_query(const std::string &shortcode) const
  -> std::string {
  const auto variables = nlohmann::json{{"shortcode", shortcode}}.dump();
  return std::format("doc_id={}&variables={}&lsd={}", percent_encode(doc_id),
                     percent_encode(variables), lsd_token);
}

[[nodiscard]] auto
instagram_source::fetch_media(const std::string &shortcode,
                              std::error_code &error) const
  -> instagram_media {
  auto &lgr = logger::instance();
  if (!limiter.try_acquire()) {
    lgr.warning("Instagram lookups exceed {} per hour; skipping {}",
                max_requests_per_hour, shortcode);
    error = instagram_error_code::rate_limited;
    return {};
  }

  http_request_options options;
  options.timeout = timeout;
  options.method = "POST";
  options.body = make_query(shortcode);
  // clang-format off
  options.headers = {
    {"X-IG-App-ID", app_id},
    {"X-FB-LSD", lsd_token},
    {"X-ASBD-ID", asbd_id},
    {"X-Requested-With", "XMLHttpRequest"},
    {"Content-Type", "application/x-www-form-urlencoded"},
    {"Referer", "https://www.instagram.com/"},
    {"Origin", "https://www.instagram.com"},
  };
  // clang-format on

  const auto tmp_dir = std::filesystem::temp_directory_path(error);
  if (error)
    return {};
  const auto scratch =
    (tmp_dir / std::format("mediaq-{}.json", generate_uuid())).string();

  lgr.debug("Instagram lookup of {} via {}", shortcode, endpoint);
  const auto text = request_text_http(endpoint, scratch, options, error);
  if (error) {
    lgr.warning("Instagram lookup of {} failed: {}", shortcode, error);
    return {};
  }

  const auto response = nlohmann::json::parse(text, nullptr, false);
  if (response.is_discarded()) {
    static constexpr std::size_t max_shown = 500;
    lgr.error("Instagram lookup of {} returned non-JSON: {}", shortcode,
              text.substr(0, max_shown));
    error = instagram_error_code::invalid_response;
    return {};
  }
  auto media = parse_instagram_media(response, error);
  if (error) {
    lgr.warning("Instagram lookup of {} failed: {}", shortcode, error);
    return {};
  }
  lgr.debug("Instagram post {} by @{} has {} items", shortcode,
            media.username, std::size(media.items));
  return media;
}

[[nodiscard]] auto
instagram_source::metadata(const std::string &url,
                           std::error_code &error) const -> media_metadata {
  const auto shortcode = extract_instagram_shortcode(url);
  if (!shortcode) {
    error = instagram_error_code::not_a_post_url;
    return {};
  }
  std::error_code lookup_error;
  const auto media = fetch_media(*shortcode, lookup_error);
  if (!lookup_error)
    return {instagram_title(media), std::format("@{}", media.username)};
  if (!fallback) {
    error = lookup_error;
    return {};
  }
  logger::instance().info("Metadata for {} from {} instead", url,
                          fallback->name());
  return fallback->metadata(url, error);
}

[[nodiscard]] auto
instagram_source::download(const download_request &request,
                           progress_channel &progress,
                           std::error_code &error) const -> download_output {
  auto &lgr = logger::instance();
  const auto shortcode = extract_instagram_shortcode(request.url);
  if (!shortcode) {
    error = instagram_error_code::not_a_post_url;
    return {};
  }

  std::error_code lookup_error;
  const auto media = fetch_media(*shortcode, lookup_error);
  if (!lookup_error && media.items.front().media_url().empty())
    lookup_error = instagram_error_code::no_media_in_post;
  if (!lookup_error)
    return download_items(media, request, progress, error);

  if (!fallback) {
    error = lookup_error;
    download_output failed;
    failed.diagnostic = std::format("instagram post {}: {}", *shortcode,
                                    lookup_error.message());
    return failed;
  }
  lgr.warning("Instagram lookup of {} failed ({}); downloading with {}",
              *shortcode, lookup_error, fallback->name());
  return fallback->download(request, progress, error);
}

[[nodiscard]] auto
instagram_source::download_items(const instagram_media &media,
                                 const download_request &request,
                                 progress_channel &progress,
                                 std::error_code &error) const
  -> download_output {
  namespace fs = std::filesystem;
  auto &lgr = logger::instance();

  const auto duration_of =
    [](const instagram_item &item) -> std::optional<std::uint32_t> {
    if (!item.is_video || !item.video_duration || *item.video_duration < 0)
      return std::nullopt;
    return static_cast<std::uint32_t>(*item.video_duration);
  };

  const auto &primary = media.items.front();
  const auto primary_path =
    fs::path{request.output_path}
      .replace_extension(std::string{primary.extension()})
      .string();

  download_progress dp{&progress};
  http_request_options options;
  options.timeout = timeout;
  options.max_file_size = request.max_file_size;
  options.progress = &dp;

  const auto header =
    download_http(primary.media_url(), primary_path, options, error);
  if (error) {
    lgr.warning("Instagram media download failed {}: {} (status {})",
                request.url, error, header.status_code);
    std::error_code remove_error;
    fs::remove(primary_path, remove_error);
    download_output failed;
    failed.diagnostic = std::format("{}: {} (status {})", primary.media_url(),
                                    error.message(), header.status_code);
    return failed;
  }

  download_output out;
  out.file_path = primary_path;
  out.file_size = fs::file_size(out.file_path, error);
  if (error) {
    error = source_error_code::output_file_missing;
    return {};
  }
  out.mime_hint = std::string{primary.mime_type()};
  out.duration_secs = duration_of(primary);

  // a carousel item that fails is skipped; the post is still delivered
  for (std::size_t i = 1; i < std::size(media.items); ++i) {
    const auto &item = media.items[i];
    if (item.media_url().empty())
      continue;
    const auto item_path =
      carousel_item_path(request.output_path, i, item.extension());
    http_request_options item_options;
    item_options.timeout = timeout;
    item_options.max_file_size = request.max_file_size;
    std::error_code item_error;
    const auto item_header =
      download_http(item.media_url(), item_path, item_options, item_error);
    if (item_error) {
      lgr.warning("Carousel item {} of {} failed: {} (status {})", i + 1,
                  request.url, item_error, item_header.status_code);
      std::error_code remove_error;
      fs::remove(item_path, remove_error);
      continue;
    }
    out.additional_files.push_back(
      {item_path, std::string{item.mime_type()}, duration_of(item)});
  }

  lgr.info("Instagram download complete {} ({} bytes, {} more items)",
           out.file_path, out.file_size, std::size(out.additional_files));
  return out;
}

}  // namespace mediaq
