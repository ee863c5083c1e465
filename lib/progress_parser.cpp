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

#include "progress_parser.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ranges>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

namespace mediaq {

using std::literals::string_view_literals::operator""sv;

[[nodiscard]] static inline auto
parse_double(const std::string_view s) -> std::optional<double> {
  double v{};
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + std::size(s), v);
  if (ec != std::errc{} || ptr != s.data() + std::size(s))
    return std::nullopt;
  return v;
}

[[nodiscard]] static inline auto
split_whitespace(const std::string_view line) -> std::vector<std::string_view> {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < std::size(line)) {
    const auto b = line.find_first_not_of(" \t\r\n", pos);
    if (b == std::string_view::npos)
      break;
    const auto e = line.find_first_of(" \t\r\n", b);
    const auto len = (e == std::string_view::npos ? std::size(line) : e) - b;
    tokens.push_back(line.substr(b, len));
    pos = b + len;
  }
  return tokens;
}

[[nodiscard]] auto
parse_size(std::string_view s) -> std::optional<std::uint64_t> {
  // clang-format off
  static constexpr auto units = std::array{
    std::tuple{"GiB"sv, 1024.0 * 1024.0 * 1024.0},
    std::tuple{"MiB"sv, 1024.0 * 1024.0},
    std::tuple{"KiB"sv, 1024.0},
    std::tuple{"GB"sv, 1000.0 * 1000.0 * 1000.0},
    std::tuple{"MB"sv, 1000.0 * 1000.0},
    std::tuple{"KB"sv, 1000.0},
    std::tuple{"kB"sv, 1000.0},
    std::tuple{"B"sv, 1.0},
  };
  // clang-format on
  if (s.starts_with('~'))  // approximate sizes
    s.remove_prefix(1);
  for (const auto &[suffix, multiplier] : units) {
    if (!s.ends_with(suffix))
      continue;
    const auto value =
      parse_double(s.substr(0, std::size(s) - std::size(suffix)));
    if (!value || *value < 0.0)
      return std::nullopt;
    return static_cast<std::uint64_t>(*value * multiplier);
  }
  return std::nullopt;
}

[[nodiscard]] auto
parse_eta(const std::string_view s) -> std::optional<std::uint64_t> {
  std::uint64_t total{};
  std::uint32_t n_fields{};
  for (const auto field : s | std::views::split(':')) {
    const std::string_view f(std::cbegin(field), std::cend(field));
    std::uint64_t v{};
    const auto [ptr, ec] =
      std::from_chars(f.data(), f.data() + std::size(f), v);
    if (f.empty() || ec != std::errc{} || ptr != f.data() + std::size(f))
      return std::nullopt;
    total = total * 60 + v;
    ++n_fields;
  }
  if (n_fields < 2 || n_fields > 3)
    return std::nullopt;
  return total;
}

[[nodiscard]] auto
parse_progress(const std::string_view line) -> std::optional<source_progress> {
  static constexpr auto max_percent = 100.0;
  if (line.find("[download]") == std::string_view::npos ||
      line.find('%') == std::string_view::npos)
    return std::nullopt;

  const auto tokens = split_whitespace(line);
  std::optional<double> percent;
  source_progress p;
  for (auto i = 0u; i < std::size(tokens); ++i) {
    const auto tok = tokens[i];
    const bool has_next = i + 1 < std::size(tokens);
    if (!percent && tok.ends_with('%')) {
      percent = parse_double(tok.substr(0, std::size(tok) - 1));
    }
    else if (tok == "of" && has_next) {
      p.total_bytes = parse_size(tokens[i + 1]);
    }
    else if (tok == "at" && has_next && tokens[i + 1].ends_with("/s")) {
      const auto speed = tokens[i + 1];
      p.speed_bytes_sec = parse_size(speed.substr(0, std::size(speed) - 2));
    }
    else if (tok == "ETA" && has_next) {
      p.eta_seconds = parse_eta(tokens[i + 1]);
    }
  }
  if (!percent)
    return std::nullopt;

  const auto clamped = std::clamp(*percent, 0.0, max_percent);
  p.percent = static_cast<std::uint8_t>(clamped);
  if (p.total_bytes)
    p.downloaded_bytes =
      static_cast<std::uint64_t>(*p.total_bytes * clamped / max_percent);
  return p;
}

}  // namespace mediaq
