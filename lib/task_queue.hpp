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

#ifndef LIB_TASK_QUEUE_HPP_
#define LIB_TASK_QUEUE_HPP_

#include "download_task.hpp"
#include "task_priority.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace mediaq {

class queue_mirror;

struct task_queue_gauges {
  std::array<std::uint32_t, n_task_priorities> depth{};
  std::uint64_t n_enqueued{};
  std::uint64_t n_dequeued{};
  std::uint64_t n_evicted{};
  std::uint64_t n_rejected{};

  [[nodiscard]] auto
  total_depth() const -> std::uint32_t {
    return depth[0] + depth[1] + depth[2];
  }
};

/// Tasks ordered by priority, first come first served within a
/// priority. All operations are linearizable under one mutex; the durable
/// mirror is written after the lock is released.
class task_queue {
public:
  static constexpr std::uint32_t default_max_size{1000};

  explicit task_queue(const std::uint32_t max_size = default_max_size,
                      std::shared_ptr<queue_mirror> mirror = nullptr) :
    max_size{max_size}, mirror{std::move(mirror)} {}

  task_queue(const task_queue &) = delete;
  auto
  operator=(const task_queue &) -> task_queue & = delete;

  /// Fails with queue_full or duplicate_task
  [[nodiscard]] auto
  enqueue(const download_task &task) -> std::error_code;

  /// The head of the queue; it stays active (blocking duplicates) until
  /// `finish` is called for it
  [[nodiscard]] auto
  dequeue() -> std::optional<download_task>;

  auto
  finish(const download_task &task) -> void;

  /// 1-based rank of the first queued task for `chat_id`
  [[nodiscard]] auto
  position_of(const std::int64_t chat_id) const -> std::optional<std::size_t>;

  [[nodiscard]] auto
  snapshot_for(const std::int64_t chat_id) const -> std::vector<download_task>;

  /// Remove queued tasks whose age is at least `max_age`; returns how many
  auto
  evict_older_than(const std::chrono::seconds max_age) -> std::size_t;

  [[nodiscard]] auto
  size() const -> std::size_t;

  [[nodiscard]] auto
  empty() const -> bool;

  [[nodiscard]] auto
  n_active() const -> std::size_t;

  [[nodiscard]] auto
  depth(const task_priority_t p) const -> std::uint32_t {
    const auto d = depth_gauge[std::to_underlying(p)].load();
    return static_cast<std::uint32_t>(d);
  }

  [[nodiscard]] auto
  gauges() const -> task_queue_gauges;

  [[nodiscard]] auto
  get_max_size() const -> std::uint32_t {
    return max_size;
  }

private:
  struct queue_key {
    task_priority_t priority{};
    std::uint64_t seq{};

    // higher priority first, then arrival order
    [[nodiscard]] auto
    operator<(const queue_key &rhs) const -> bool {
      if (priority != rhs.priority)
        return priority > rhs.priority;
      return seq < rhs.seq;
    }
  };

  auto
  update_depth(const task_priority_t p, const int delta) -> void {
    depth_gauge[std::to_underlying(p)] += delta;
  }

  std::uint32_t max_size{default_max_size};
  std::shared_ptr<queue_mirror> mirror;

  mutable std::mutex mtx;
  std::map<queue_key, download_task> tasks;
  // keys of queued and active tasks
  std::set<task_key> keys;
  std::size_t active{};
  std::uint64_t next_seq{};

  std::array<std::atomic<std::int32_t>, n_task_priorities> depth_gauge{};
  std::atomic<std::uint64_t> n_enqueued{};
  std::atomic<std::uint64_t> n_dequeued{};
  std::atomic<std::uint64_t> n_evicted{};
  std::atomic<std::uint64_t> n_rejected{};
};

}  // namespace mediaq

/// @brief Enum for error codes related to the task queue
enum class task_queue_error_code : std::uint8_t {
  ok = 0,
  queue_full = 1,
  duplicate_task = 2,
};

template <>
struct std::is_error_code_enum<task_queue_error_code> : public std::true_type {
};

struct task_queue_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "task_queue";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "queue full"s;
    case 2: return "duplicate task"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(task_queue_error_code e) -> std::error_code {
  static auto category = task_queue_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

template <>
struct std::formatter<mediaq::task_queue_gauges> : std::formatter<std::string> {
  auto
  format(const mediaq::task_queue_gauges &g, auto &ctx) const {
    return std::formatter<std::string>::format(
      std::format("depth(high={}, medium={}, low={}) enqueued={} dequeued={} "
                  "evicted={} rejected={}",
                  g.depth[2], g.depth[1], g.depth[0], g.n_enqueued,
                  g.n_dequeued, g.n_evicted, g.n_rejected),
      ctx);
  }
};

#endif  // LIB_TASK_QUEUE_HPP_
