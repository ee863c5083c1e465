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

#include "unit_test_utils_cli.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

[[nodiscard]] auto
files_are_identical_cli(const std::string &a, const std::string &b) -> bool {
  std::ifstream in_a(a, std::ios::binary);
  std::ifstream in_b(b, std::ios::binary);
  if (!in_a || !in_b)
    return false;
  return std::equal(std::istreambuf_iterator<char>(in_a),
                    std::istreambuf_iterator<char>(),
                    std::istreambuf_iterator<char>(in_b),
                    std::istreambuf_iterator<char>());
}

[[nodiscard]] auto
generate_temp_filename_cli(const std::string &prefix,
                           const std::string &suffix) -> std::string {
  static std::atomic<std::uint32_t> counter{};
  const auto now = std::chrono::system_clock::now().time_since_epoch().count();
  const auto filename =
    std::format("{}_{}_{}{}", prefix, now, counter++, suffix);
  return (std::filesystem::temp_directory_path() / filename).string();
}

[[nodiscard]] auto
generate_unique_dir_name_cli() -> std::string {
  static constexpr auto test_dir_prefix = "cli_test_dir_";
  static constexpr auto min_fn_suff = 1000;
  static constexpr auto max_fn_suff = 9999;
  const auto now = std::chrono::system_clock::now().time_since_epoch().count();
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(min_fn_suff, max_fn_suff);
  return (std::filesystem::temp_directory_path() /
          (test_dir_prefix + std::to_string(now) + "_" +
           std::to_string(dis(gen))))
    .string();
}

auto
remove_directories_cli(const std::string &dirname,
                       std::error_code &error) -> void {
  const bool exists = std::filesystem::exists(dirname, error);
  if (error || !exists)
    return;
  std::filesystem::remove_all(dirname, error);
}
