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

#ifndef LIB_TASK_PRIORITY_HPP_
#define LIB_TASK_PRIORITY_HPP_

#include "nlohmann/json.hpp"  // IWYU pragma: keep

#include <array>
#include <cstdint>
#include <format>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

namespace mediaq {

/// Scheduling class of a task; larger values are served first
enum class task_priority_t : std::uint8_t {
  low = 0,
  medium = 1,
  high = 2,
};

static constexpr auto n_task_priorities = 3;

using std::literals::string_view_literals::operator""sv;
static constexpr auto task_priority_t_name = std::array{
  // clang-format off
  "low"sv,
  "medium"sv,
  "high"sv,
  // clang-format on
};

static const std::map<std::string, task_priority_t> task_priority_cli11{
  // clang-format off
  {"low", task_priority_t::low},
  {"medium", task_priority_t::medium},
  {"high", task_priority_t::high},
  // clang-format on
};

// clang-format off
NLOHMANN_JSON_SERIALIZE_ENUM(task_priority_t, {
    {task_priority_t::low, "low"},
    {task_priority_t::medium, "medium"},
    {task_priority_t::high, "high"},
  })
// clang-format on

/// Priority for a subscription plan: "vip" gets high, "premium" gets
/// medium and everything else (including "free") gets low.
[[nodiscard]] auto
priority_from_plan(const std::string_view plan) noexcept -> task_priority_t;

auto
operator<<(std::ostream &o, const task_priority_t &p) -> std::ostream &;

auto
operator>>(std::istream &in, task_priority_t &p) -> std::istream &;

}  // namespace mediaq

template <>
struct std::formatter<mediaq::task_priority_t> : std::formatter<std::string> {
  auto
  format(const mediaq::task_priority_t &p,
         std::format_context &ctx) const -> std::format_context::iterator;
};

#endif  // LIB_TASK_PRIORITY_HPP_
