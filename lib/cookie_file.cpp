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

#include "cookie_file.hpp"

#include "logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace mediaq {

[[nodiscard]] auto
is_netscape_cookie_text(const std::string_view text) -> bool {
  bool has_header{false};
  bool has_cookie{false};
  for (const auto line_view : text | std::views::split('\n')) {
    std::string_view line(std::cbegin(line_view), std::cend(line_view));
    while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
      line.remove_suffix(1);
    while (!line.empty() && line.front() == ' ')
      line.remove_prefix(1);
    if (line.empty())
      continue;
    if (line.starts_with("# Netscape HTTP Cookie File") ||
        line.starts_with("# HTTP Cookie File"))
      has_header = true;
    else if ((!line.starts_with('#') || line.starts_with("#HttpOnly_")) &&
             std::ranges::count(line, '\t') >= 6)
      has_cookie = true;
  }
  return has_header && has_cookie;
}

auto
validate_cookie_file(const std::string &path,
                     std::error_code &error) noexcept -> void {
  std::ifstream in(path);
  if (!in) {
    error = cookie_file_error_code::read_failed;
    return;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (!is_netscape_cookie_text(buf.str()))
    error = cookie_file_error_code::invalid_format;
}

auto
replace_cookie_file(const std::string &path, const std::string &contents,
                    std::error_code &error) noexcept -> void {
  auto &lgr = logger::instance();
  if (!is_netscape_cookie_text(contents)) {
    lgr.warning("Rejected cookie file update for {}: invalid format", path);
    error = cookie_file_error_code::invalid_format;
    return;
  }
  const auto tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.write(contents.data(), std::ssize(contents))) {
      error = cookie_file_error_code::write_failed;
      return;
    }
  }
  std::filesystem::rename(tmp, path, error);
  if (error) {
    lgr.error("Failed to replace cookie file {}: {}", path, error);
    std::error_code remove_error;
    std::filesystem::remove(tmp, remove_error);
    error = cookie_file_error_code::write_failed;
    return;
  }
  lgr.info("Cookie file replaced: {}", path);
}

}  // namespace mediaq
