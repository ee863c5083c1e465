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

#include "task_priority.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>    // for std::get (iywu fp)
#include <utility>  // for std::to_underlying

namespace mediaq {

[[nodiscard]] auto
priority_from_plan(const std::string_view plan) noexcept -> task_priority_t {
  const auto eq = [](const char a, const char b) {
    return std::tolower(static_cast<unsigned char>(a)) == b;
  };
  if (std::ranges::equal(plan, "vip"sv, eq))
    return task_priority_t::high;
  if (std::ranges::equal(plan, "premium"sv, eq))
    return task_priority_t::medium;
  return task_priority_t::low;
}

auto
operator<<(std::ostream &o, const task_priority_t &p) -> std::ostream & {
  // NOLINTNEXTLINE(*-array-index)
  return o << task_priority_t_name[std::to_underlying(p)];
}

auto
operator>>(std::istream &in, task_priority_t &p) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  for (const auto [idx, name] : std::views::enumerate(task_priority_t_name))
    if (tmp == name) {
      p = static_cast<task_priority_t>(idx);
      return in;
    }
  in.setstate(std::ios::failbit);
  return in;
}

}  // namespace mediaq

auto
std::formatter<mediaq::task_priority_t>::format(
  const mediaq::task_priority_t &p,
  std::format_context &ctx) const -> std::format_context::iterator {
  return std::format_to(
    ctx.out(), "{}",
    // NOLINTNEXTLINE(*-array-index)
    mediaq::task_priority_t_name[std::to_underlying(p)]);
};
