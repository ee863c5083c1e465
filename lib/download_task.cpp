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

#include "download_task.hpp"

#include "environment_utilities.hpp"
#include "task_priority.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mediaq {

[[nodiscard]] auto
make_download_task(const std::string &url, const std::int64_t chat_id,
                   const std::string &format, const bool is_video,
                   const std::string &plan) -> download_task {
  download_task t;
  t.id = generate_uuid();
  t.url = url;
  t.chat_id = chat_id;
  t.format = format;
  t.is_video = is_video;
  t.created_at = download_task::clock::now();
  t.priority = priority_from_plan(plan);
  return t;
}

[[nodiscard]] auto
download_task::tostring() const -> std::string {
  static constexpr auto n_indent = 4;
  const nlohmann::json data = *this;
  return data.dump(n_indent);
}

// optional members are written only when present; timestamps are
// seconds since the epoch

auto
to_json(nlohmann::json &j, const download_task &t) -> void {
  j = nlohmann::json{
    // clang-format off
    {"id", t.id},
    {"url", t.url},
    {"chat_id", t.chat_id},
    {"is_video", t.is_video},
    {"format", t.format},
    {"priority", t.priority},
    {"created_at", std::chrono::duration_cast<std::chrono::seconds>(
                     t.created_at.time_since_epoch()).count()},
    // clang-format on
  };
  if (t.message_id)
    j["message_id"] = *t.message_id;
  if (t.video_quality)
    j["video_quality"] = *t.video_quality;
  if (t.audio_bitrate)
    j["audio_bitrate"] = *t.audio_bitrate;
  if (t.range)
    j["time_range"] = *t.range;
}

auto
from_json(const nlohmann::json &j, download_task &t) -> void {
  j.at("url").get_to(t.url);
  j.at("chat_id").get_to(t.chat_id);
  j.at("format").get_to(t.format);
  t.id = j.contains("id") ? j.at("id").get<std::string>() : generate_uuid();
  t.is_video = j.value("is_video", false);
  t.priority = j.value("priority", task_priority_t::low);
  if (j.contains("plan"))
    t.priority = priority_from_plan(j.at("plan").get<std::string>());
  if (j.contains("created_at"))
    t.created_at = download_task::clock::time_point{
      std::chrono::seconds{j.at("created_at").get<std::int64_t>()}};
  else
    t.created_at = download_task::clock::now();
  if (j.contains("message_id"))
    t.message_id = j.at("message_id").get<std::int32_t>();
  if (j.contains("video_quality"))
    t.video_quality = j.at("video_quality").get<std::string>();
  if (j.contains("audio_bitrate"))
    t.audio_bitrate = j.at("audio_bitrate").get<std::string>();
  if (j.contains("time_range"))
    t.range = j.at("time_range").get<time_range>();
}

}  // namespace mediaq
