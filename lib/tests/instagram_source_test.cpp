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

#include <instagram_source.hpp>

#include <download.hpp>
#include <http_error_code.hpp>
#include <logger.hpp>
#include <source_backend.hpp>
#include <source_progress.hpp>

#include "unit_test_utils.hpp"

#include "nlohmann/json.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>

using namespace mediaq;  // NOLINT

namespace {

// nothing listens on the discard port; connecting fails at once
constexpr auto unreachable_endpoint = "http://127.0.0.1:9/api/graphql";

class recording_backend : public source_backend {
public:
  [[nodiscard]] auto
  name() const -> std::string_view override {
    return "recording";
  }

  [[nodiscard]] auto
  supports(const std::string &) const -> bool override {
    return true;
  }

  [[nodiscard]] auto
  metadata(const std::string &, std::error_code &) const
    -> media_metadata override {
    ++n_metadata;
    return {"from fallback", "someone"};
  }

  [[nodiscard]] auto
  estimate_size(const std::string &) const
    -> std::optional<std::uint64_t> override {
    return std::nullopt;
  }

  [[nodiscard]] auto
  is_livestream(const std::string &) const -> bool override {
    return false;
  }

  [[nodiscard]] auto
  download(const download_request &request, progress_channel &,
           std::error_code &) const -> download_output override {
    ++n_downloads;
    download_output out;
    out.file_path = request.output_path;
    out.file_size = 10;
    out.mime_hint = "video/mp4";
    return out;
  }

  mutable int n_metadata{};
  mutable int n_downloads{};
};

const auto single_video = R"json({
  "data": {
    "xdt_shortcode_media": {
      "is_video": true,
      "video_url": "https://cdn.example.com/v.mp4",
      "display_url": "https://cdn.example.com/v.jpg",
      "video_duration": 14.6,
      "owner": {"username": "natgeo"},
      "edge_media_to_caption": {
        "edges": [{"node": {"text": "Whales at dawn\nsecond line"}}]
      }
    }
  },
  "status": "ok"
})json";

const auto carousel = R"json({
  "data": {
    "shortcode_media": {
      "is_video": false,
      "display_url": "https://cdn.example.com/cover.jpg",
      "owner": {"username": "someone"},
      "edge_media_to_caption": {"edges": []},
      "edge_sidecar_to_children": {
        "edges": [
          {"node": {"is_video": false,
                    "display_url": "https://cdn.example.com/1.jpg"}},
          {"node": {"is_video": true,
                    "video_url": "https://cdn.example.com/2.mp4",
                    "display_url": "https://cdn.example.com/2.jpg",
                    "video_duration": null}},
          {"node": {"is_video": false, "display_url": null}}
        ]
      }
    }
  }
})json";

}  // namespace

class instagram_source_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    fallback = std::make_shared<recording_backend>();
  }

  std::shared_ptr<recording_backend> fallback;
};

TEST(instagram_source_test, shortcode_from_post_urls) {
  EXPECT_EQ(extract_instagram_shortcode("https://www.instagram.com/reel/ABC/"),
            "ABC");
  EXPECT_EQ(extract_instagram_shortcode("https://instagram.com/p/XyZ_1-2"),
            "XyZ_1-2");
  EXPECT_EQ(extract_instagram_shortcode("https://www.instagram.com/reels/R1"),
            "R1");
  EXPECT_EQ(extract_instagram_shortcode("https://www.instagram.com/tv/T1/"),
            "T1");
  EXPECT_EQ(extract_instagram_shortcode(
              "https://www.instagram.com/natgeo/reel/C1x/?igsh=abc"),
            "C1x");
  EXPECT_EQ(extract_instagram_shortcode(
              "https://WWW.Instagram.com/p/Q9/?utm_source=ig_web"),
            "Q9");
}

TEST(instagram_source_test, no_shortcode_for_other_urls) {
  EXPECT_FALSE(extract_instagram_shortcode("https://www.instagram.com/"));
  EXPECT_FALSE(extract_instagram_shortcode("https://www.instagram.com/natgeo"));
  EXPECT_FALSE(
    extract_instagram_shortcode("https://www.instagram.com/explore/tags/x"));
  EXPECT_FALSE(extract_instagram_shortcode("https://www.instagram.com/p/"));
  EXPECT_FALSE(extract_instagram_shortcode("https://example.com/p/ABC/"));
  EXPECT_FALSE(
    extract_instagram_shortcode("https://instagram.com.evil.net/p/ABC/"));
  EXPECT_FALSE(extract_instagram_shortcode("https://m.instagram.com/p/ABC/"));
  EXPECT_FALSE(extract_instagram_shortcode("not a url"));
}

TEST_F(instagram_source_mock, supports_posts_only) {
  const instagram_source source("1", fallback);
  EXPECT_EQ(source.name(), "instagram");
  EXPECT_TRUE(source.supports("https://www.instagram.com/reel/ABC/"));
  EXPECT_TRUE(source.supports("https://instagram.com/someone/p/ABC"));
  EXPECT_FALSE(source.supports("https://www.instagram.com/someone/"));
  EXPECT_FALSE(source.supports("https://www.youtube.com/watch?v=abc"));
  EXPECT_FALSE(source.is_livestream("https://www.instagram.com/reel/ABC/"));
  EXPECT_FALSE(source.estimate_size("https://www.instagram.com/reel/ABC/"));
}

TEST_F(instagram_source_mock, parse_single_video) {
  std::error_code error;
  const auto media =
    parse_instagram_media(nlohmann::json::parse(single_video), error);
  ASSERT_FALSE(error) << error;
  ASSERT_EQ(std::size(media.items), 1u);
  const auto &item = media.items[0];
  EXPECT_TRUE(item.is_video);
  EXPECT_EQ(item.media_url(), "https://cdn.example.com/v.mp4");
  EXPECT_EQ(item.mime_type(), "video/mp4");
  EXPECT_EQ(item.extension(), "mp4");
  ASSERT_TRUE(item.video_duration);
  EXPECT_DOUBLE_EQ(*item.video_duration, 14.6);
  EXPECT_EQ(media.username, "natgeo");
  EXPECT_EQ(media.caption, "Whales at dawn\nsecond line");
  EXPECT_EQ(instagram_title(media), "Whales at dawn");
}

TEST_F(instagram_source_mock, parse_carousel_items) {
  std::error_code error;
  const auto media =
    parse_instagram_media(nlohmann::json::parse(carousel), error);
  ASSERT_FALSE(error) << error;
  ASSERT_EQ(std::size(media.items), 3u);
  EXPECT_FALSE(media.items[0].is_video);
  EXPECT_EQ(media.items[0].media_url(), "https://cdn.example.com/1.jpg");
  EXPECT_EQ(media.items[0].mime_type(), "image/jpeg");
  EXPECT_TRUE(media.items[1].is_video);
  EXPECT_EQ(media.items[1].media_url(), "https://cdn.example.com/2.mp4");
  EXPECT_FALSE(media.items[1].video_duration);
  // an item without a usable URL is kept but has nothing to fetch
  EXPECT_TRUE(media.items[2].media_url().empty());
  EXPECT_TRUE(media.caption.empty());
  EXPECT_EQ(instagram_title(media), "Instagram post by @someone");
}

TEST_F(instagram_source_mock, parse_error_responses) {
  const auto kind_of = [](const std::string &text) {
    std::error_code error;
    std::ignore = parse_instagram_media(nlohmann::json::parse(text), error);
    return error;
  };
  EXPECT_EQ(kind_of(R"({"message": "useragent mismatch"})"),
            instagram_error_code::doc_id_expired);
  EXPECT_EQ(kind_of(R"({"message": "unknown doc_id 123"})"),
            instagram_error_code::doc_id_expired);
  EXPECT_EQ(kind_of(R"({"message": "login_required", "status": "fail"})"),
            instagram_error_code::login_required);
  EXPECT_EQ(kind_of(R"({"data": {"xdt_shortcode_media": null}})"),
            instagram_error_code::post_not_found);
  EXPECT_EQ(kind_of(R"([1, 2, 3])"), instagram_error_code::invalid_response);
  EXPECT_EQ(kind_of(R"({"data": {"xdt_shortcode_media": {
              "edge_sidecar_to_children": {"edges": []}}}})"),
            instagram_error_code::no_media_in_post);
}

TEST(instagram_source_test, title_from_long_caption) {
  instagram_media media;
  media.username = "u";
  media.caption = std::string(150, 'a');
  const auto title = instagram_title(media);
  EXPECT_EQ(std::size(title), 100u);
  EXPECT_TRUE(title.ends_with("..."));

  // "\xc3\xa9" is one character; the cut must not fall inside it
  media.caption = std::string(96, 'b') + "\xc3\xa9" + std::string(10, 'c');
  const auto utf8_title = instagram_title(media);
  EXPECT_EQ(utf8_title, std::string(96, 'b') + "...");

  media.caption = "short";
  EXPECT_EQ(instagram_title(media), "short");
}

TEST(instagram_source_test, carousel_paths_beside_output) {
  EXPECT_EQ(carousel_item_path("/dl/task1.mp4", 1, "jpg"),
            "/dl/task1_carousel_2.jpg");
  EXPECT_EQ(carousel_item_path("/dl/task1.mp4", 4, "mp4"),
            "/dl/task1_carousel_5.mp4");
}

TEST(instagram_source_test, rate_limiter_window) {
  using namespace std::chrono_literals;  // NOLINT
  sliding_window_limiter limiter(3, std::chrono::hours{1});
  const auto t0 = sliding_window_limiter::clock::now();
  EXPECT_TRUE(limiter.try_acquire(t0));
  EXPECT_TRUE(limiter.try_acquire(t0 + 1min));
  EXPECT_TRUE(limiter.try_acquire(t0 + 2min));
  EXPECT_FALSE(limiter.try_acquire(t0 + 3min));
  EXPECT_FALSE(limiter.try_acquire(t0 + 59min));
  // the first slot has left the window
  EXPECT_TRUE(limiter.try_acquire(t0 + 60min));
  EXPECT_FALSE(limiter.try_acquire(t0 + 60min));
  EXPECT_TRUE(limiter.try_acquire(t0 + 62min));
}

TEST_F(instagram_source_mock, query_body) {
  const instagram_source source("8845758582119845", fallback);
  EXPECT_EQ(source.make_query("C1x"),
            "doc_id=8845758582119845"
            "&variables=%7B%22shortcode%22%3A%22C1x%22%7D"
            "&lsd=AVqbxe3J_YA");
}

TEST_F(instagram_source_mock, lookup_failure_uses_fallback) {
  const instagram_source source("1", fallback, std::chrono::seconds{2},
                                unreachable_endpoint);
  std::error_code error;
  const auto m =
    source.metadata("https://www.instagram.com/reel/ABC/", error);
  EXPECT_FALSE(error) << error;
  EXPECT_EQ(m.title, "from fallback");
  EXPECT_EQ(fallback->n_metadata, 1);

  download_request req;
  req.url = "https://www.instagram.com/reel/ABC/";
  req.output_path = generate_temp_filename("instagram_source", ".mp4");
  progress_channel progress;
  const auto out = source.download(req, progress, error);
  EXPECT_FALSE(error) << error;
  EXPECT_EQ(fallback->n_downloads, 1);
  EXPECT_EQ(out.file_path, req.output_path);
}

TEST_F(instagram_source_mock, lookup_failure_without_fallback) {
  const instagram_source source("1", nullptr, std::chrono::seconds{2},
                                unreachable_endpoint);
  download_request req;
  req.url = "https://www.instagram.com/p/ABC/";
  req.output_path = generate_temp_filename("instagram_source", ".mp4");
  progress_channel progress;
  std::error_code error;
  const auto out = source.download(req, progress, error);
  EXPECT_EQ(error, http_error_code::connect_failed);
  EXPECT_TRUE(out.file_path.empty());
  EXPECT_TRUE(out.diagnostic.starts_with("instagram post ABC:"));

  error.clear();
  std::ignore = source.metadata(req.url, error);
  EXPECT_EQ(error, http_error_code::connect_failed);
}

TEST_F(instagram_source_mock, download_rejects_non_post_url) {
  const instagram_source source("1", fallback);
  download_request req;
  req.url = "https://www.instagram.com/someone/";
  progress_channel progress;
  std::error_code error;
  const auto out = source.download(req, progress, error);
  EXPECT_EQ(error, instagram_error_code::not_a_post_url);
  EXPECT_EQ(fallback->n_downloads, 0);
  EXPECT_TRUE(out.file_path.empty());
}
