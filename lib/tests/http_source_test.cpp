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

#include <http_source.hpp>

#include <download.hpp>
#include <logger.hpp>
#include <source_backend.hpp>
#include <source_progress.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <system_error>
#include <tuple>

using namespace mediaq;  // NOLINT

class http_source_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
  }

  http_source source;
};

TEST_F(http_source_mock, supports_direct_media_links) {
  EXPECT_EQ(source.name(), "http");
  EXPECT_TRUE(source.supports("https://cdn.example.com/music/song.mp3"));
  EXPECT_TRUE(source.supports("http://example.com/v/clip.MP4?token=abc"));
  EXPECT_TRUE(source.supports("https://example.com/a/b/c.opus#t=10"));
}

TEST_F(http_source_mock, rejects_pages_and_other_schemes) {
  EXPECT_FALSE(source.supports("https://www.youtube.com/watch?v=abc"));
  EXPECT_FALSE(source.supports("https://example.com/"));
  EXPECT_FALSE(source.supports("https://example.com/file.exe"));
  EXPECT_FALSE(source.supports("ftp://example.com/song.mp3"));
  EXPECT_FALSE(source.supports("not a url"));
}

TEST_F(http_source_mock, metadata_from_filename) {
  std::error_code error;
  const auto m =
    source.metadata("https://cdn.example.com/My%20Song.mp3?x=1", error);
  EXPECT_FALSE(error);
  EXPECT_EQ(m.title, "My Song");
  EXPECT_TRUE(m.artist.empty());
}

TEST_F(http_source_mock, metadata_bad_url) {
  std::error_code error;
  std::ignore = source.metadata("ftp://example.com/a.mp3", error);
  EXPECT_EQ(error, source_error_code::unsupported_url);
}

TEST_F(http_source_mock, never_a_livestream) {
  EXPECT_FALSE(source.is_livestream("https://cdn.example.com/live.mp4"));
}

TEST_F(http_source_mock, download_rejects_unsupported_url) {
  download_request req;
  req.url = "https://www.youtube.com/watch?v=abc";
  req.output_path = generate_temp_filename("http_source", ".mp4");
  progress_channel progress;
  std::error_code error;
  const auto out = source.download(req, progress, error);
  EXPECT_EQ(error, source_error_code::unsupported_url);
  EXPECT_TRUE(out.file_path.empty());
}
