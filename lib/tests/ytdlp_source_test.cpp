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

#include <ytdlp_source.hpp>

#include <download.hpp>
#include <download_progress.hpp>
#include <error_kind.hpp>
#include <fallback_engine.hpp>
#include <logger.hpp>
#include <metadata_cache.hpp>
#include <proxy_config.hpp>
#include <source_backend.hpp>
#include <source_progress.hpp>
#include <tier_config.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

using namespace mediaq;  // NOLINT

namespace {

/// Writes `n_bytes` to the path given after "-o", or fails with `diagnostic`
class file_writing_runner : public attempt_runner {
public:
  explicit file_writing_runner(const std::uint64_t n_bytes,
                               const std::string &diagnostic = {}) :
    n_bytes{n_bytes}, diagnostic{diagnostic} {}

  [[nodiscard]] auto
  run(const tier_config &tier, const std::optional<proxy_config> &,
      download_progress &) -> attempt_result override {
    ++n_runs;
    if (!diagnostic.empty())
      return {false, false, diagnostic};
    const auto itr = std::ranges::find(tier.base_args, "-o");
    if (itr == std::cend(tier.base_args) ||
        std::next(itr) == std::cend(tier.base_args))
      return {false, false, "no output path"};
    if (n_bytes > 0) {
      std::ofstream out(*std::next(itr), std::ios::binary);
      out << std::string(n_bytes, 'x');
    }
    return {true, false, {}};
  }

  std::uint32_t n_runs{};

private:
  std::uint64_t n_bytes{};
  std::string diagnostic;
};

}  // namespace

class ytdlp_source_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    directory = generate_unique_dir_name();
    std::error_code error;
    std::filesystem::create_directories(directory, error);
    ASSERT_FALSE(error);
    config.ytdlp_path = (std::filesystem::path{directory} / "yt-dlp").string();
    config.ffprobe_path =
      (std::filesystem::path{directory} / "ffprobe").string();
    config.timeout = std::chrono::seconds{10};
    config.query_timeout = std::chrono::seconds{10};
    config.refresh_settle = std::chrono::milliseconds{0};
    ASSERT_TRUE(write_executable_script(config.ffprobe_path, "echo 12.6\n"));
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    remove_directories(directory, error);
  }

  [[nodiscard]] auto
  make_request(const std::string &format) const -> download_request {
    download_request req;
    req.url = "https://www.youtube.com/watch?v=abc";
    req.output_path =
      (std::filesystem::path{directory} / ("task." + format)).string();
    req.format = format;
    return req;
  }

  std::string directory;
  ytdlp_config config;
};

TEST(ytdlp_source_test, supports_known_and_generic_pages) {
  const ytdlp_source source({}, nullptr, nullptr);
  EXPECT_EQ(source.name(), "ytdlp");
  EXPECT_TRUE(source.supports("https://www.youtube.com/watch?v=abc"));
  EXPECT_TRUE(source.supports("https://youtu.be/abc"));
  EXPECT_TRUE(source.supports("https://m.soundcloud.com/artist/track"));
  EXPECT_TRUE(source.supports("https://some-site.example/watch/123"));
  EXPECT_FALSE(source.supports("https://cdn.example.com/file.mp3"));
  EXPECT_FALSE(source.supports("https://cdn.example.com/archive.zip"));
  EXPECT_FALSE(source.supports("ftp://www.youtube.com/watch?v=abc"));
}

TEST(ytdlp_source_test, output_mime_by_format) {
  download_request req;
  req.format = "mp3";
  EXPECT_EQ(ytdlp_output_mime(req), "audio/mpeg");
  req.format = "mp4";
  EXPECT_EQ(ytdlp_output_mime(req), "video/mp4");
  req.format = "srt";
  EXPECT_EQ(ytdlp_output_mime(req), "application/x-subrip");
  req.format = "txt";
  EXPECT_EQ(ytdlp_output_mime(req), "text/plain");
}

TEST_F(ytdlp_source_mock, metadata_falls_back_to_uploader) {
  ASSERT_TRUE(write_executable_script(
    config.ytdlp_path, "printf 'My Song\\nNA\\nThe Uploader\\n'\n"));
  auto cache = std::make_shared<metadata_cache>();
  const ytdlp_source source(config, cache, nullptr);
  std::error_code error;
  const auto m = source.metadata("https://youtu.be/abc", error);
  EXPECT_FALSE(error);
  EXPECT_EQ(m.title, "My Song");
  EXPECT_EQ(m.artist, "The Uploader");
  EXPECT_EQ(cache->size(), 1u);
}

TEST_F(ytdlp_source_mock, metadata_served_from_cache) {
  auto cache = std::make_shared<metadata_cache>();
  cache->put("https://youtu.be/abc", {"Cached", "Artist"});
  // the extractor would fail if it were run
  ASSERT_TRUE(write_executable_script(config.ytdlp_path, "exit 1\n"));
  const ytdlp_source source(config, cache, nullptr);
  std::error_code error;
  const auto m = source.metadata("https://youtu.be/abc", error);
  EXPECT_FALSE(error);
  EXPECT_EQ(m.title, "Cached");
  EXPECT_EQ(cache->hits(), 1u);
}

TEST_F(ytdlp_source_mock, metadata_empty_title) {
  ASSERT_TRUE(
    write_executable_script(config.ytdlp_path, "printf 'NA\\nNA\\nNA\\n'\n"));
  auto cache = std::make_shared<metadata_cache>();
  const ytdlp_source source(config, cache, nullptr);
  std::error_code error;
  std::ignore = source.metadata("https://youtu.be/abc", error);
  EXPECT_EQ(error, source_error_code::empty_title);
  EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ytdlp_source_mock, metadata_failure_is_classified) {
  ASSERT_TRUE(write_executable_script(
    config.ytdlp_path, "echo 'ERROR: [youtube] abc: Video unavailable' >&2\n"
                       "exit 1\n"));
  const ytdlp_source source(config, nullptr, nullptr);
  std::error_code error;
  std::ignore = source.metadata("https://youtu.be/abc", error);
  EXPECT_EQ(error, error_kind::video_unavailable);
}

TEST_F(ytdlp_source_mock, estimate_size_adds_overhead) {
  ASSERT_TRUE(write_executable_script(config.ytdlp_path, "echo 1000\n"));
  const ytdlp_source source(config, nullptr, nullptr);
  const auto size = source.estimate_size("https://youtu.be/abc");
  ASSERT_TRUE(size.has_value());
  EXPECT_EQ(*size, 1150u);
}

TEST_F(ytdlp_source_mock, estimate_size_unknown) {
  ASSERT_TRUE(write_executable_script(config.ytdlp_path, "echo NA\n"));
  const ytdlp_source source(config, nullptr, nullptr);
  EXPECT_FALSE(source.estimate_size("https://youtu.be/abc").has_value());
}

TEST_F(ytdlp_source_mock, is_livestream_success) {
  ASSERT_TRUE(write_executable_script(config.ytdlp_path, "echo True\n"));
  const ytdlp_source live(config, nullptr, nullptr);
  EXPECT_TRUE(live.is_livestream("https://youtu.be/abc"));

  ASSERT_TRUE(write_executable_script(config.ytdlp_path, "echo False\n"));
  const ytdlp_source not_live(config, nullptr, nullptr);
  EXPECT_FALSE(not_live.is_livestream("https://youtu.be/abc"));
}

TEST_F(ytdlp_source_mock, is_livestream_false_when_extractor_missing) {
  config.ytdlp_path = (std::filesystem::path{directory} / "absent").string();
  const ytdlp_source source(config, nullptr, nullptr);
  EXPECT_FALSE(source.is_livestream("https://youtu.be/abc"));
}

TEST_F(ytdlp_source_mock, download_success) {
  auto runner = std::make_shared<file_writing_runner>(100);
  const ytdlp_source source(config, nullptr, nullptr, runner);
  const auto req = make_request("mp3");
  progress_channel progress;
  std::error_code error;
  const auto out = source.download(req, progress, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(out.file_path, req.output_path);
  EXPECT_EQ(out.file_size, 100u);
  EXPECT_EQ(out.mime_hint, "audio/mpeg");
  EXPECT_EQ(out.duration_secs, 13u);
  EXPECT_EQ(runner->n_runs, 1u);
}

TEST_F(ytdlp_source_mock, download_subtitles_skip_duration) {
  auto runner = std::make_shared<file_writing_runner>(10);
  const ytdlp_source source(config, nullptr, nullptr, runner);
  progress_channel progress;
  std::error_code error;
  const auto out = source.download(make_request("srt"), progress, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(out.mime_hint, "application/x-subrip");
  EXPECT_FALSE(out.duration_secs.has_value());
}

TEST_F(ytdlp_source_mock, download_too_large_removes_file) {
  auto runner = std::make_shared<file_writing_runner>(100);
  const ytdlp_source source(config, nullptr, nullptr, runner);
  auto req = make_request("mp4");
  req.max_file_size = 50;
  progress_channel progress;
  std::error_code error;
  std::ignore = source.download(req, progress, error);
  EXPECT_EQ(error, source_error_code::file_too_large);
  EXPECT_FALSE(std::filesystem::exists(req.output_path));
}

TEST_F(ytdlp_source_mock, download_success_without_file) {
  auto runner = std::make_shared<file_writing_runner>(0);
  const ytdlp_source source(config, nullptr, nullptr, runner);
  progress_channel progress;
  std::error_code error;
  std::ignore = source.download(make_request("mp4"), progress, error);
  EXPECT_EQ(error, source_error_code::output_file_missing);
}

TEST_F(ytdlp_source_mock, download_failure_reports_kind) {
  auto runner = std::make_shared<file_writing_runner>(
    0, "ERROR: [youtube] abc: Private video");
  const ytdlp_source source(config, nullptr, nullptr, runner);
  progress_channel progress;
  std::error_code error;
  const auto out = source.download(make_request("mp4"), progress, error);
  EXPECT_EQ(to_error_kind(error), error_kind::video_unavailable);
  EXPECT_EQ(out.diagnostic, "ERROR: [youtube] abc: Private video");
  EXPECT_TRUE(out.file_path.empty());
  // unavailable content is never retried at another tier
  EXPECT_EQ(runner->n_runs, 1u);
}

TEST_F(ytdlp_source_mock, attempt_runner_reports_exit_status) {
  ASSERT_TRUE(write_executable_script(
    config.ytdlp_path, "echo '[download]  50.0% of 10.00MiB at 1.00MiB/s "
                       "ETA 00:05'\necho 'ERROR: network is down' >&2\n"
                       "exit 1\n"));
  ytdlp_attempt_runner runner(config.ytdlp_path, config.timeout);
  const auto tiers = build_tier_configs(make_request("mp4"), {});
  progress_channel channel;
  download_progress progress{&channel};
  const auto res = runner.run(tiers[0], std::nullopt, progress);
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.timed_out);
  EXPECT_NE(res.diagnostic.find("network is down"), std::string::npos);
}
