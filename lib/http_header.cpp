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

#include "http_header.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>

namespace mediaq {

// trim from start (in place)
static inline auto
ltrim(std::string &s) {
  const auto no_space = [](const auto c) {
    return !std::isspace(static_cast<unsigned char>(c));
  };
  const auto e = std::find_if(std::cbegin(s), std::cend(s), no_space);
  s.erase(std::cbegin(s), e);
}

// trim from end (in place)
static inline auto
rtrim(std::string &s) -> void {
  const auto no_space = [](const auto c) {
    return !std::isspace(static_cast<unsigned char>(c));
  };
  const auto b = std::find_if(std::crbegin(s), std::crend(s), no_space);
  s.erase(b.base(), std::cend(s));
}

// trim from both ends (in place)
static inline auto
trim(std::string &s) -> void {
  rtrim(s);
  ltrim(s);
}

// split a string at the first colon
static inline auto
split_http_field(const std::string &s) -> std::tuple<std::string, std::string> {
  const auto colon = s.find(':');
  if (colon == std::string::npos || colon >= std::size(s) - 1)
    return {{}, {}};
  auto field_name = s.substr(0, colon);
  auto field_value = s.substr(colon + 1);
  trim(field_name);
  trim(field_value);
  if (field_value.empty())
    return {{}, {}};
  std::ranges::for_each(field_name, [](auto &c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return {field_name, field_value};
}

static inline auto
is_status_line(const std::string &line) -> bool {
  using std::string_view_literals::operator""sv;
  constexpr auto http_tag = "HTTP"sv;
  return line.starts_with(http_tag);
}

static inline auto
parse_status_line(const std::string &line, std::string &status_line,
                  std::string &status_code) {
  constexpr auto status_code_size = 3u;

  status_line = line;
  std::istringstream iss(line);
  std::string field_name;
  std::string field_value;
  if ((iss >> field_name >> field_value) &&
      std::size(field_value) == status_code_size &&
      std::ranges::all_of(field_value, [](const auto c) {
        return std::isdigit(static_cast<unsigned char>(c));
      }))
    status_code = field_value;
}

// "bytes 100-199/1234" gives 1234; "bytes */1234" too; "/*" gives nothing
static inline auto
parse_content_range_total(const std::string &value)
  -> std::optional<std::uint64_t> {
  const auto slash = value.rfind('/');
  if (slash == std::string::npos)
    return std::nullopt;
  std::uint64_t total{};
  const auto first = value.data() + slash + 1;
  const auto last = value.data() + std::size(value);
  const auto [ptr, ec] = std::from_chars(first, last, total);
  if (ec != std::errc{} || ptr == first)
    return std::nullopt;
  return total;
}

// attachment; filename="clip.mp3" or filename*=UTF-8''clip.mp3
static inline auto
parse_disposition_filename(const std::string &value) -> std::string {
  using std::string_view_literals::operator""sv;
  constexpr auto ext_key = "filename*="sv;
  constexpr auto key = "filename="sv;
  std::string name;
  if (const auto pos = value.find(ext_key); pos != std::string::npos) {
    name = value.substr(pos + std::size(ext_key));
    if (const auto tick = name.find("''"); tick != std::string::npos)
      name = name.substr(tick + 2);
  }
  else if (const auto pos = value.find(key); pos != std::string::npos)
    name = value.substr(pos + std::size(key));
  else
    return {};
  name = name.substr(0, name.find(';'));
  trim(name);
  if (std::size(name) >= 2 && name.front() == '"' && name.back() == '"')
    name = name.substr(1, std::size(name) - 2);
  // no directory parts from a remote server
  if (const auto slash = name.find_last_of("/\\"); slash != std::string::npos)
    name = name.substr(slash + 1);
  return name;
}

http_header::http_header(const std::string &header_block) {
  const auto unview = [](const auto r) {
    return std::string(std::cbegin(r), std::cend(r));
  };
  for (const auto &line_view : header_block | std::views::split('\n')) {
    if (line_view.empty())
      continue;
    auto line = unview(line_view);
    rtrim(line);
    if (line.empty())
      continue;
    if (is_status_line(line)) {
      parse_status_line(line, status_line, status_code);
      continue;
    }

    const auto [field_name, field_value] = split_http_field(line);
    if (field_name.empty())
      continue;

    if (field_name == "content-length") {
      std::istringstream iss(field_value);
      std::uint64_t content_length_tmp{};
      if (iss >> content_length_tmp)
        content_length = content_length_tmp;
    }
    else if (field_name == "last-modified")
      last_modified = field_value;
    else if (field_name == "content-type")
      content_type = field_value.substr(0, field_value.find(';'));
    else if (field_name == "content-range")
      content_range_total = parse_content_range_total(field_value);
    else if (field_name == "content-disposition")
      filename = parse_disposition_filename(field_value);
    else if (field_name == "location")
      location = field_value;
    else if (field_name == "transfer-encoding")
      chunked = field_value.find("chunked") != std::string::npos;
  }
}

[[nodiscard]] auto
http_header::status() const -> int {
  int s{};
  const auto first = status_code.data();
  const auto last = first + std::size(status_code);
  const auto [ptr, ec] = std::from_chars(first, last, s);
  return ec == std::errc{} && ptr == last ? s : 0;
}

auto
http_header::tostring() const -> std::string {
  return std::format("{}\n"
                     "status-code: {}\n"
                     "last-modified: {}\n"
                     "content-length: {}\n"
                     "content-type: {}\n"
                     "content-range-total: {}\n"
                     "filename: {}",
                     status_line, status_code, last_modified, content_length,
                     content_type,
                     content_range_total ? std::to_string(*content_range_total)
                                         : std::string{"NA"},
                     filename);
}

[[nodiscard]] auto
decode_chunked_body(const std::string_view body) -> std::optional<std::string> {
  using std::string_view_literals::operator""sv;
  std::string r;
  std::size_t pos{};
  while (pos < std::size(body)) {
    const auto eol = body.find("\r\n"sv, pos);
    if (eol == std::string_view::npos)
      return std::nullopt;
    // chunk extensions follow a ';'
    const auto size_end = std::min(eol, body.find(';', pos));
    std::size_t n{};
    const auto first = body.data() + pos;
    const auto last = body.data() + size_end;
    const auto [ptr, ec] = std::from_chars(first, last, n, 16);
    if (ec != std::errc{} || ptr == first)
      return std::nullopt;
    pos = eol + 2;
    if (n == 0)
      return r;
    if (pos + n > std::size(body))
      return std::nullopt;
    r.append(body.substr(pos, n));
    pos += n + 2;  // the CRLF after the chunk data
  }
  return std::nullopt;
}

}  // namespace mediaq
