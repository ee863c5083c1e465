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

#include "queue_mirror.hpp"

#include "download_task.hpp"
#include "environment_utilities.hpp"
#include "logger.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace mediaq {

auto
to_json(nlohmann::json &j, const task_record &r) -> void {
  j = r.task;
  j["status"] = r.status;
  j["error_message"] = r.error_message;
  j["retry_count"] = r.retry_count;
  j["updated_at"] = r.updated_at;
}

auto
from_json(const nlohmann::json &j, task_record &r) -> void {
  j.get_to(r.task);
  r.status = j.value("status", task_status_t::pending);
  r.error_message = j.value("error_message", std::string{});
  r.retry_count = j.value("retry_count", 0u);
  r.updated_at = j.value("updated_at", std::int64_t{});
}

json_file_mirror::json_file_mirror(const std::string &directory) :
  directory{directory} {}

[[nodiscard]] auto
json_file_mirror::initialize() -> std::error_code {
  std::error_code error;
  std::filesystem::create_directories(directory, error);
  if (error) {
    logger::instance().error("Failed to create mirror directory {}: {}",
                             directory, error);
    return queue_mirror_error_code::failed_to_create_directory;
  }
  return {};
}

[[nodiscard]] auto
json_file_mirror::record_path(const std::string &id) const -> std::string {
  return (std::filesystem::path{directory} / (id + record_extension))
    .string();
}

[[nodiscard]] auto
json_file_mirror::read_record(const std::string &path,
                              std::error_code &error) const -> task_record {
  std::ifstream in(path);
  if (!in) {
    error = queue_mirror_error_code::failed_to_read_record;
    return {};
  }
  const nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
  if (data.is_discarded()) {
    error = queue_mirror_error_code::failed_to_parse_record;
    return {};
  }
  task_record r;
  try {
    r = data;
  }
  catch (const nlohmann::json::exception &e) {
    error = queue_mirror_error_code::failed_to_parse_record;
    return {};
  }
  return r;
}

[[nodiscard]] auto
json_file_mirror::write_record(const task_record &r) const -> std::error_code {
  static constexpr auto n_indent = 4;
  // ids become file names
  if (r.task.id.empty() || r.task.id.find('/') != std::string::npos)
    return queue_mirror_error_code::invalid_task_id;

  const auto path = record_path(r.task.id);
  const auto tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path);
    if (!out)
      return queue_mirror_error_code::failed_to_write_record;
    const nlohmann::json data = r;
    const auto payload = data.dump(n_indent);
    out.write(payload.data(), static_cast<std::streamsize>(std::size(payload)));
    if (!out)
      return queue_mirror_error_code::failed_to_write_record;
  }
  std::error_code error;
  std::filesystem::rename(tmp_path, path, error);
  if (error) {
    std::error_code remove_error;
    std::filesystem::remove(tmp_path, remove_error);
    return queue_mirror_error_code::failed_to_write_record;
  }
  return {};
}

template <typename F>
[[nodiscard]] auto
json_file_mirror::update(const std::string &id, F &&f) -> std::error_code {
  std::lock_guard lck{mtx};
  std::error_code error;
  const auto path = record_path(id);
  if (!std::filesystem::exists(path, error))
    return queue_mirror_error_code::record_not_found;
  auto r = read_record(path, error);
  if (error)
    return error;
  f(r);
  r.updated_at = get_epoch_seconds();
  return write_record(r);
}

auto
json_file_mirror::upsert(const download_task &task) -> std::error_code {
  std::lock_guard lck{mtx};
  task_record r;
  std::error_code error;
  const auto path = record_path(task.id);
  // keep the retry history of a task that comes back
  if (std::filesystem::exists(path, error)) {
    r = read_record(path, error);
    if (error)
      r = task_record{};
  }
  r.task = task;
  r.status = task_status_t::pending;
  r.updated_at = get_epoch_seconds();
  return write_record(r);
}

auto
json_file_mirror::mark_processing(const std::string &id) -> std::error_code {
  return update(id,
                [](task_record &r) { r.status = task_status_t::processing; });
}

auto
json_file_mirror::mark_completed(const std::string &id) -> std::error_code {
  return update(id, [](task_record &r) {
    r.status = task_status_t::completed;
    r.error_message.clear();
  });
}

auto
json_file_mirror::mark_failed(const std::string &id,
                              const std::string &message) -> std::error_code {
  return update(id, [&](task_record &r) {
    r.status = task_status_t::failed;
    r.error_message = message;
    ++r.retry_count;
  });
}

[[nodiscard]] auto
json_file_mirror::get(const std::string &id, std::error_code &error) const
  -> std::optional<task_record> {
  std::lock_guard lck{mtx};
  const auto path = record_path(id);
  if (!std::filesystem::exists(path, error))
    return std::nullopt;
  auto r = read_record(path, error);
  if (error)
    return std::nullopt;
  return r;
}

[[nodiscard]] auto
json_file_mirror::read_all(std::error_code &error) const
  -> std::vector<task_record> {
  auto &lgr = logger::instance();
  std::vector<task_record> records;
  std::filesystem::directory_iterator dir_itr(directory, error);
  if (error)
    return {};
  for (; dir_itr != std::filesystem::directory_iterator{};
       dir_itr.increment(error)) {
    if (error)
      return {};
    const auto &path = dir_itr->path();
    if (path.extension() != record_extension)
      continue;
    std::error_code read_error;
    auto r = read_record(path.string(), read_error);
    if (read_error) {
      // one damaged record must not hide the others
      lgr.warning("Skipping mirror record {}: {}", path.string(), read_error);
      continue;
    }
    records.push_back(std::move(r));
  }
  if (error)
    return {};
  return records;
}

[[nodiscard]] auto
json_file_mirror::pending(std::error_code &error) const
  -> std::vector<task_record> {
  std::lock_guard lck{mtx};
  auto records = read_all(error);
  std::erase_if(records, [](const auto &r) { return !r.is_recoverable(); });
  std::ranges::sort(records, [](const auto &a, const auto &b) {
    if (a.task.priority != b.task.priority)
      return a.task.priority > b.task.priority;
    return a.task.created_at < b.task.created_at;
  });
  return records;
}

[[nodiscard]] auto
json_file_mirror::failed(const std::uint32_t max_retries,
                         std::error_code &error) const
  -> std::vector<task_record> {
  std::lock_guard lck{mtx};
  auto records = read_all(error);
  std::erase_if(records, [&](const auto &r) {
    return r.status != task_status_t::failed || r.retry_count >= max_retries;
  });
  std::ranges::sort(records, [](const auto &a, const auto &b) {
    return a.task.created_at < b.task.created_at;
  });
  return records;
}

auto
json_file_mirror::prune(const std::chrono::seconds max_age,
                        std::error_code &error) -> std::size_t {
  auto &lgr = logger::instance();
  std::lock_guard lck{mtx};
  const auto records = read_all(error);
  if (error)
    return 0;
  const auto cutoff = get_epoch_seconds() - max_age.count();
  std::size_t n_removed{};
  for (const auto &r : records) {
    const bool finished = r.status == task_status_t::completed ||
                          r.status == task_status_t::failed;
    if (!finished || r.updated_at > cutoff)
      continue;
    std::error_code remove_error;
    if (std::filesystem::remove(record_path(r.task.id), remove_error))
      ++n_removed;
    else if (remove_error)
      lgr.warning("Failed to remove mirror record {}: {}", r.task.id,
                  remove_error);
  }
  if (n_removed > 0)
    lgr.info("Pruned {} finished records from {}", n_removed, directory);
  return n_removed;
}

}  // namespace mediaq
