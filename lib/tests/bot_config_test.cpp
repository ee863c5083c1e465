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

#include <bot_config.hpp>

#include <logger.hpp>
#include <proxy_config.hpp>
#include <queue_worker.hpp>
#include <ytdlp_source.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>  // for setenv, unsetenv
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>

using namespace mediaq;  // NOLINT
using std::string_literals::operator""s;

class bot_config_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    unsetenv(bot_config::env_proxy_variable);
    unsetenv(bot_config::env_instagram_doc_id_variable);
    config_file = generate_temp_filename("bot_config", ".json");
    const std::string payload = R"config({
    "config_dir": "a_bot_config_dir",
    "download_dir": "my_downloads",
    "mirror_dir": "my_queue",
    "log_file": "",
    "log_level": "debug",
    "n_workers": 3,
    "max_queue_size": 50,
    "queue_max_age_secs": 600,
    "check_interval_ms": 100,
    "inter_download_delay_ms": 0,
    "ytdlp_path": "/usr/local/bin/yt-dlp",
    "ytdlp_timeout_secs": 120,
    "cookies_file": "cookies.txt",
    "proxies": [
        {"name": "residential", "url": "http://user:pw@proxy.example:8080"}
    ],
    "refresh_timeout_secs": 20,
    "max_file_size": 52428800,
    "max_concurrent_processing": 2,
    "default_audio_bitrate": "192k"
}
)config";
    std::ofstream out(config_file);
    if (!out)
      throw std::runtime_error("failed to open config file to write mock");
    const auto sz = static_cast<std::streamsize>(std::size(payload));
    out.write(payload.data(), sz);
  }

  auto
  TearDown() -> void override {
    unsetenv(bot_config::env_proxy_variable);
    unsetenv(bot_config::env_instagram_doc_id_variable);
    std::error_code error;
    std::filesystem::remove(config_file, error);
  }

  std::string config_file;
};

TEST(bot_config_test, make_default_is_valid) {
  const auto cfg = bot_config::make_default();
  std::error_code error;
  EXPECT_TRUE(cfg.validate(error));
  EXPECT_FALSE(error) << error;
  EXPECT_EQ(cfg.n_workers, 2u);
  EXPECT_EQ(cfg.max_concurrent_processing, 2u);
  EXPECT_EQ(cfg.default_audio_bitrate, "320k");
  EXPECT_EQ(cfg.max_retries, 3u);
  EXPECT_EQ(cfg.record_max_age_secs, 7u * 24 * 3600);
  EXPECT_EQ(cfg.get_instagram_doc_id(), bot_config::default_instagram_doc_id);
}

TEST(bot_config_test, empty_config_is_invalid) {
  const bot_config cfg;
  std::error_code error;
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_EQ(error, bot_config_error_code::invalid_config_information);
}

TEST_F(bot_config_mock, read_fail) {
  std::error_code error;
  std::ignore = bot_config::read("non_existent_file", error);
  EXPECT_EQ(error, bot_config_error_code::failed_to_read_config_file);
}

TEST_F(bot_config_mock, read_throwing_overload) {
  EXPECT_THROW(std::ignore = bot_config::read("non_existent_file"),
               std::system_error);
  EXPECT_NO_THROW(std::ignore = bot_config::read(config_file));
}

TEST_F(bot_config_mock, read_unparsable) {
  {
    std::ofstream out(config_file);
    out << "{ not json";
  }
  std::error_code error;
  std::ignore = bot_config::read(config_file, error);
  EXPECT_EQ(error, bot_config_error_code::failed_to_parse_config_file);
}

TEST_F(bot_config_mock, read_success) {
  std::error_code error;
  const auto cfg = bot_config::read(config_file, error);
  EXPECT_FALSE(error) << error;
  EXPECT_EQ(cfg.download_dir, "my_downloads");
  EXPECT_EQ(cfg.log_level, log_level_t::debug);
  EXPECT_EQ(cfg.n_workers, 3u);
  EXPECT_EQ(cfg.max_queue_size, 50u);
  EXPECT_EQ(cfg.cookies_file, "cookies.txt");
  ASSERT_EQ(std::size(cfg.proxies), 1u);
  EXPECT_EQ(cfg.proxies[0].name, "residential");
  // missing members take the value of a default-constructed config
  EXPECT_TRUE(cfg.cookies_from_browser.empty());
  EXPECT_TRUE(cfg.validate(error));
}

TEST_F(bot_config_mock, validate_rejects_two_cookie_sources) {
  std::error_code error;
  auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  cfg.cookies_from_browser = "firefox";
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_EQ(error, bot_config_error_code::invalid_config_information);
}

TEST_F(bot_config_mock, validate_rejects_too_many_workers) {
  std::error_code error;
  auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  cfg.n_workers = bot_config::max_n_workers + 1;
  EXPECT_FALSE(cfg.validate(error));
}

TEST_F(bot_config_mock, getters_success) {
  std::error_code error;
  const auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  EXPECT_EQ(cfg.get_download_dir(), "a_bot_config_dir/my_downloads");
  EXPECT_EQ(cfg.get_mirror_dir(), "a_bot_config_dir/my_queue");
  EXPECT_EQ(cfg.get_log_file(), "");
}

TEST_F(bot_config_mock, read_config_file_no_overwrite) {
  auto cfg = bot_config{};
  cfg.ytdlp_path = "something_else"s;
  std::error_code error;
  cfg.read_config_file_no_overwrite(config_file, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(cfg.ytdlp_path, "something_else");
  EXPECT_EQ(cfg.n_workers, 3u);
}

TEST_F(bot_config_mock, roundtrip_success) {
  std::error_code error;
  auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  cfg.n_workers = 7;
  const auto tmp_file = generate_temp_filename("tmp", ".json");
  EXPECT_FALSE(cfg.write(tmp_file));
  const auto other = bot_config::read(tmp_file, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(other.n_workers, 7u);
  EXPECT_EQ(other.proxies, cfg.proxies);
  EXPECT_EQ(other.tostring(), cfg.tostring());
  std::filesystem::remove(tmp_file, error);
}

TEST_F(bot_config_mock, make_paths_absolute) {
  std::error_code error;
  auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  cfg.make_paths_absolute();
  EXPECT_EQ(cfg.download_dir[0], '/');
  EXPECT_EQ(cfg.cookies_file[0], '/');
}

TEST_F(bot_config_mock, proxy_chain_without_env) {
  std::error_code error;
  const auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  const auto chain = cfg.get_proxy_chain();
  ASSERT_EQ(std::size(chain), 2u);
  ASSERT_TRUE(chain[0].has_value());
  EXPECT_EQ(chain[0]->name, "residential");
  EXPECT_FALSE(chain[1].has_value());
}

TEST_F(bot_config_mock, proxy_chain_env_proxy_first) {
  setenv(bot_config::env_proxy_variable, "socks5://127.0.0.1:40000", 1);
  std::error_code error;
  const auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  const auto chain = cfg.get_proxy_chain();
  ASSERT_EQ(std::size(chain), 3u);
  ASSERT_TRUE(chain[0].has_value());
  EXPECT_EQ(chain[0]->url, "socks5://127.0.0.1:40000");
  EXPECT_EQ(chain[1]->name, "residential");
  EXPECT_FALSE(chain[2].has_value());
}

TEST_F(bot_config_mock, instagram_doc_id_sources) {
  std::error_code error;
  auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);
  // not in the file
  EXPECT_EQ(cfg.get_instagram_doc_id(), bot_config::default_instagram_doc_id);
  cfg.instagram_doc_id = "111";
  EXPECT_EQ(cfg.get_instagram_doc_id(), "111");
  setenv(bot_config::env_instagram_doc_id_variable, "222", 1);
  EXPECT_EQ(cfg.get_instagram_doc_id(), "222");
}

TEST_F(bot_config_mock, derived_settings) {
  std::error_code error;
  const auto cfg = bot_config::read(config_file, error);
  ASSERT_FALSE(error);

  const auto yc = cfg.get_ytdlp_config();
  EXPECT_EQ(yc.ytdlp_path, "/usr/local/bin/yt-dlp");
  EXPECT_EQ(yc.timeout, std::chrono::seconds{120});
  EXPECT_EQ(yc.extractor.cookies_file, "cookies.txt");
  EXPECT_EQ(std::size(yc.proxies), 2u);

  const auto ws = cfg.get_worker_settings();
  EXPECT_EQ(ws.n_workers, 3u);
  EXPECT_EQ(ws.inter_download_delay, std::chrono::milliseconds{0});
  EXPECT_EQ(ws.download_dir, "a_bot_config_dir/my_downloads");
  EXPECT_EQ(ws.max_file_size, 52428800u);
}
