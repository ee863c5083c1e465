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

#ifndef LIB_DOWNLOAD_TASK_HPP_
#define LIB_DOWNLOAD_TASK_HPP_

#include "task_priority.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <tuple>

namespace mediaq {

/// Clip bounds passed through to the extractor, e.g. "00:01:00"
struct time_range {
  std::string start;
  std::string end;

  auto
  operator<=>(const time_range &) const = default;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(time_range, start, end)
};

/// Identity used to detect the same request submitted twice
using task_key = std::tuple<std::string, std::int64_t, std::string>;

/// One user request. Created when a user confirms a format choice and
/// not modified afterwards.
struct download_task {
  using clock = std::chrono::system_clock;

  std::string id;
  std::string url;
  std::int64_t chat_id{};
  std::optional<std::int32_t> message_id;
  bool is_video{};
  std::string format;
  std::optional<std::string> video_quality;
  std::optional<std::string> audio_bitrate;
  std::optional<time_range> range;
  clock::time_point created_at{};
  task_priority_t priority{task_priority_t::low};

  [[nodiscard]] auto
  key() const -> task_key {
    return {url, chat_id, format};
  }

  [[nodiscard]] auto
  age(const clock::time_point now = clock::now()) const -> clock::duration {
    return now - created_at;
  }

  [[nodiscard]] auto
  tostring() const -> std::string;

  auto
  operator==(const download_task &) const -> bool = default;
};

/// Create a task with a fresh id and timestamp, priority derived from the
/// requester's subscription plan.
[[nodiscard]] auto
make_download_task(const std::string &url, const std::int64_t chat_id,
                   const std::string &format, const bool is_video,
                   const std::string &plan) -> download_task;

auto
to_json(nlohmann::json &j, const download_task &t) -> void;

auto
from_json(const nlohmann::json &j, download_task &t) -> void;

}  // namespace mediaq

template <>
struct std::formatter<mediaq::download_task> : std::formatter<std::string> {
  auto
  format(const mediaq::download_task &t, auto &ctx) const {
    return std::formatter<std::string>::format(
      std::format("{} [{}] {} {} chat={}", t.id, t.priority, t.format, t.url,
                  t.chat_id),
      ctx);
  }
};

#endif  // LIB_DOWNLOAD_TASK_HPP_
