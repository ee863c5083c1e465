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

#ifndef LIB_QUEUE_MIRROR_HPP_
#define LIB_QUEUE_MIRROR_HPP_

#include "download_task.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace mediaq {

enum class task_status_t : std::uint8_t {
  pending = 0,
  processing = 1,
  completed = 2,
  failed = 3,
};

// clang-format off
NLOHMANN_JSON_SERIALIZE_ENUM(task_status_t, {
    {task_status_t::pending, "pending"},
    {task_status_t::processing, "processing"},
    {task_status_t::completed, "completed"},
    {task_status_t::failed, "failed"},
  })
// clang-format on

/// The durable row for one task
struct task_record {
  download_task task;
  task_status_t status{task_status_t::pending};
  std::string error_message;
  std::uint32_t retry_count{};
  std::int64_t updated_at{};

  [[nodiscard]] auto
  is_recoverable() const -> bool {
    return status == task_status_t::pending ||
           status == task_status_t::processing;
  }
};

auto
to_json(nlohmann::json &j, const task_record &r) -> void;

auto
from_json(const nlohmann::json &j, task_record &r) -> void;

/// Durable copy of the queue so that work survives a restart. The queue
/// calls this best-effort; failures are logged by the caller and never
/// block scheduling.
class queue_mirror {
public:
  virtual ~queue_mirror() = default;

  virtual auto
  upsert(const download_task &task) -> std::error_code = 0;

  virtual auto
  mark_processing(const std::string &id) -> std::error_code = 0;

  virtual auto
  mark_completed(const std::string &id) -> std::error_code = 0;

  /// Also increments the retry count
  virtual auto
  mark_failed(const std::string &id,
              const std::string &message) -> std::error_code = 0;

  [[nodiscard]] virtual auto
  get(const std::string &id,
      std::error_code &error) const -> std::optional<task_record> = 0;

  /// Pending and processing rows, highest priority first, then oldest
  [[nodiscard]] virtual auto
  pending(std::error_code &error) const -> std::vector<task_record> = 0;

  /// Failed rows that have been retried fewer than `max_retries` times
  [[nodiscard]] virtual auto
  failed(const std::uint32_t max_retries,
         std::error_code &error) const -> std::vector<task_record> = 0;

  /// Remove completed and failed rows not updated for at least `max_age`;
  /// returns how many were removed
  virtual auto
  prune(const std::chrono::seconds max_age,
        std::error_code &error) -> std::size_t = 0;
};

/// One JSON document per task in a directory; each write goes to a
/// temporary file that is then renamed over the record
class json_file_mirror : public queue_mirror {
public:
  static constexpr auto record_extension = ".json";

  explicit json_file_mirror(const std::string &directory);

  /// Create the directory if needed
  [[nodiscard]] auto
  initialize() -> std::error_code;

  auto
  upsert(const download_task &task) -> std::error_code override;

  auto
  mark_processing(const std::string &id) -> std::error_code override;

  auto
  mark_completed(const std::string &id) -> std::error_code override;

  auto
  mark_failed(const std::string &id,
              const std::string &message) -> std::error_code override;

  [[nodiscard]] auto
  get(const std::string &id,
      std::error_code &error) const -> std::optional<task_record> override;

  [[nodiscard]] auto
  pending(std::error_code &error) const -> std::vector<task_record> override;

  [[nodiscard]] auto
  failed(const std::uint32_t max_retries,
         std::error_code &error) const -> std::vector<task_record> override;

  auto
  prune(const std::chrono::seconds max_age,
        std::error_code &error) -> std::size_t override;

  [[nodiscard]] auto
  get_directory() const -> const std::string & {
    return directory;
  }

private:
  [[nodiscard]] auto
  record_path(const std::string &id) const -> std::string;

  [[nodiscard]] auto
  read_record(const std::string &path,
              std::error_code &error) const -> task_record;

  [[nodiscard]] auto
  write_record(const task_record &r) const -> std::error_code;

  [[nodiscard]] auto
  read_all(std::error_code &error) const -> std::vector<task_record>;

  template <typename F>
  [[nodiscard]] auto
  update(const std::string &id, F &&f) -> std::error_code;

  std::string directory;
  mutable std::mutex mtx;
};

}  // namespace mediaq

/// @brief Enum for error codes related to the durable queue mirror
enum class queue_mirror_error_code : std::uint8_t {
  ok = 0,
  failed_to_read_record = 1,
  failed_to_parse_record = 2,
  failed_to_write_record = 3,
  record_not_found = 4,
  failed_to_create_directory = 5,
  invalid_task_id = 6,
};

template <>
struct std::is_error_code_enum<queue_mirror_error_code>
  : public std::true_type {};

struct queue_mirror_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "queue_mirror";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "failed to read record"s;
    case 2: return "failed to parse record"s;
    case 3: return "failed to write record"s;
    case 4: return "record not found"s;
    case 5: return "failed to create directory"s;
    case 6: return "invalid task id"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(queue_mirror_error_code e) -> std::error_code {
  static auto category = queue_mirror_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

template <>
struct std::formatter<mediaq::task_status_t> : std::formatter<std::string> {
  auto
  format(const mediaq::task_status_t &s, auto &ctx) const {
    const nlohmann::json j = s;
    return std::formatter<std::string>::format(j.get<std::string>(), ctx);
  }
};

#endif  // LIB_QUEUE_MIRROR_HPP_
