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

#include "download.hpp"

#include "download_task.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace mediaq {

[[nodiscard]] auto
make_download_request(const download_task &task, const std::string &output_dir,
                      const std::optional<std::uint64_t> max_file_size)
  -> download_request {
  const auto ext = task.format.empty() ? std::string{"bin"} : task.format;
  download_request req;
  req.url = task.url;
  req.output_path =
    (std::filesystem::path{output_dir} / (task.id + "." + ext)).string();
  req.format = task.format;
  req.audio_bitrate = task.audio_bitrate;
  req.video_quality = task.video_quality;
  req.max_file_size = max_file_size;
  req.range = task.range;
  return req;
}

[[nodiscard]] auto
mime_type_for_extension(const std::string &ext) -> std::string {
  static const std::unordered_map<std::string, std::string> mime_types{
    // clang-format off
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"wav", "audio/wav"},
    {"flac", "audio/flac"},
    {"ogg", "audio/ogg"},
    {"m4a", "audio/mp4"},
    {"webm", "video/webm"},
    {"avi", "video/x-msvideo"},
    {"mkv", "video/x-matroska"},
    {"aac", "audio/aac"},
    {"opus", "audio/opus"},
    // clang-format on
  };
  std::string lower{ext};
  std::ranges::for_each(lower, [](auto &c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  const auto itr = mime_types.find(lower);
  return itr == std::cend(mime_types) ? std::string{} : itr->second;
}

[[nodiscard]] auto
find_actual_downloaded_file(const std::string &requested_path) -> std::string {
  namespace fs = std::filesystem;
  std::error_code error;
  const fs::path requested{requested_path};
  if (fs::is_regular_file(requested, error))
    return requested_path;

  const auto dir = requested.has_parent_path() ? requested.parent_path()
                                               : fs::path{"."};
  const auto stem = requested.stem().string();
  std::string best;
  fs::file_time_type best_time{};
  for (auto itr = fs::directory_iterator(dir, error);
       !error && itr != fs::directory_iterator{}; itr.increment(error)) {
    const auto &entry = *itr;
    std::error_code entry_error;
    if (!entry.is_regular_file(entry_error))
      continue;
    const auto name = entry.path().filename().string();
    if (!name.starts_with(stem) || name.ends_with(".part") ||
        name.ends_with(".ytdl"))
      continue;
    const auto t = entry.last_write_time(entry_error);
    if (entry_error)
      continue;
    if (best.empty() || t > best_time) {
      best = entry.path().string();
      best_time = t;
    }
  }
  return best;
}

auto
cleanup_partial_download(const std::string &output_path,
                         std::error_code &error) noexcept -> std::uint32_t {
  namespace fs = std::filesystem;
  const fs::path out{output_path};
  const auto dir = out.has_parent_path() ? out.parent_path() : fs::path{"."};
  const auto stem = out.stem().string();

  std::uint32_t n_removed{};
  if (fs::remove(out, error))
    ++n_removed;
  if (error)
    return n_removed;

  const auto exists = fs::exists(dir, error);
  if (error || !exists)
    return n_removed;

  // names like <stem>.mp4.part, <stem>.f137.mp4, <stem>.temp.mp4,
  // <stem>.mp4.ytdl or <stem>.mp4.part-Frag12
  std::vector<fs::path> to_remove;
  for (auto itr = fs::directory_iterator(dir, error);
       !error && itr != fs::directory_iterator{}; itr.increment(error)) {
    const auto name = itr->path().filename().string();
    if (name.starts_with(stem + "."))
      to_remove.push_back(itr->path());
  }
  if (error)
    return n_removed;
  for (const auto &p : to_remove) {
    if (fs::remove(p, error))
      ++n_removed;
    if (error)
      return n_removed;
  }
  return n_removed;
}

auto
to_json(nlohmann::json &j, const additional_file &f) -> void {
  j = nlohmann::json{{"file_path", f.file_path}, {"mime_type", f.mime_type}};
  if (f.duration_secs)
    j["duration_secs"] = *f.duration_secs;
}

auto
to_json(nlohmann::json &j, const download_output &o) -> void {
  j = nlohmann::json{
    // clang-format off
    {"file_path", o.file_path},
    {"file_size", o.file_size},
    {"mime_hint", o.mime_hint},
    {"additional_files", o.additional_files},
    // clang-format on
  };
  if (o.duration_secs)
    j["duration_secs"] = *o.duration_secs;
}

}  // namespace mediaq
