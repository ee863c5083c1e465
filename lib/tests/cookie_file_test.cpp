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

#include <cookie_file.hpp>

#include <logger.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

using namespace mediaq;  // NOLINT

static const std::string valid_cookies =
  "# Netscape HTTP Cookie File\n"
  "# This file is generated by a browser extension\n"
  "\n"
  ".youtube.com\tTRUE\t/\tTRUE\t1767225600\tPREF\tf6=40000000\n"
  "#HttpOnly_.youtube.com\tTRUE\t/\tTRUE\t1767225600\tSID\tabc\n";

class cookie_file_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    cookie_path = generate_temp_filename("cookies", "txt");
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    std::filesystem::remove(cookie_path, error);
  }

  [[nodiscard]] auto
  read_back() const -> std::string {
    std::ifstream in(cookie_path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
  }

  std::string cookie_path;
};

TEST(cookie_file_test, is_netscape_cookie_text_success) {
  EXPECT_TRUE(is_netscape_cookie_text(valid_cookies));
  EXPECT_TRUE(is_netscape_cookie_text(
    "# HTTP Cookie File\r\nexample.com\tFALSE\t/\tFALSE\t0\tk\tv\r\n"));
}

TEST(cookie_file_test, is_netscape_cookie_text_failure) {
  EXPECT_FALSE(is_netscape_cookie_text(""));
  // header but no cookies
  EXPECT_FALSE(is_netscape_cookie_text("# Netscape HTTP Cookie File\n"));
  // cookies but no header
  EXPECT_FALSE(
    is_netscape_cookie_text("example.com\tFALSE\t/\tFALSE\t0\tk\tv\n"));
  EXPECT_FALSE(is_netscape_cookie_text(
    "# Netscape HTTP Cookie File\nname=value; Path=/; Secure\n"));
}

TEST_F(cookie_file_mock, replace_cookie_file_success) {
  std::error_code error;
  replace_cookie_file(cookie_path, valid_cookies, error);
  EXPECT_FALSE(error) << error;
  EXPECT_EQ(read_back(), valid_cookies);
  EXPECT_FALSE(std::filesystem::exists(cookie_path + ".tmp"));
  validate_cookie_file(cookie_path, error);
  EXPECT_FALSE(error) << error;
}

TEST_F(cookie_file_mock, replace_cookie_file_rejects_garbage) {
  std::error_code error;
  replace_cookie_file(cookie_path, valid_cookies, error);
  ASSERT_FALSE(error);
  replace_cookie_file(cookie_path, "<html>login</html>", error);
  EXPECT_EQ(error, cookie_file_error_code::invalid_format);
  // the previous file is untouched
  EXPECT_EQ(read_back(), valid_cookies);
}

TEST_F(cookie_file_mock, validate_missing_file) {
  std::error_code error;
  validate_cookie_file(cookie_path, error);
  EXPECT_EQ(error, cookie_file_error_code::read_failed);
}

TEST_F(cookie_file_mock, replace_cookie_file_throwing_overload) {
  EXPECT_NO_THROW(replace_cookie_file(cookie_path, valid_cookies));
  EXPECT_THROW(replace_cookie_file(cookie_path, "not cookies"),
               std::system_error);
  EXPECT_EQ(read_back(), valid_cookies);
}
