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

#include "task_queue.hpp"

#include "download_task.hpp"
#include "logger.hpp"
#include "queue_mirror.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <mutex>
#include <optional>
#include <ranges>
#include <string>
#include <system_error>
#include <vector>

namespace mediaq {

[[nodiscard]] auto
task_queue::enqueue(const download_task &task) -> std::error_code {
  auto &lgr = logger::instance();
  const auto error = [&]() -> std::error_code {
    std::lock_guard lck{mtx};
    if (std::size(tasks) >= max_size) {
      ++n_rejected;
      return task_queue_error_code::queue_full;
    }
    if (keys.contains(task.key())) {
      ++n_rejected;
      return task_queue_error_code::duplicate_task;
    }
    tasks.emplace(queue_key{task.priority, next_seq++}, task);
    keys.insert(task.key());
    update_depth(task.priority, 1);
    ++n_enqueued;
    return {};
  }();
  if (error == task_queue_error_code::queue_full) {
    lgr.warning("Queue full ({}), rejecting {}", max_size, task.id);
    return error;
  }
  if (error) {
    lgr.info("Duplicate task rejected: {}", task);
    return error;
  }
  lgr.debug("Enqueued {}", task);
  if (mirror != nullptr)
    if (const auto mirror_error = mirror->upsert(task); mirror_error)
      lgr.warning("Failed to mirror task {}: {}", task.id, mirror_error);
  return {};
}

[[nodiscard]] auto
task_queue::dequeue() -> std::optional<download_task> {
  std::lock_guard lck{mtx};
  if (tasks.empty())
    return std::nullopt;
  auto node = tasks.extract(std::cbegin(tasks));
  update_depth(node.key().priority, -1);
  ++active;
  ++n_dequeued;
  return std::move(node.mapped());
}

auto
task_queue::finish(const download_task &task) -> void {
  std::lock_guard lck{mtx};
  if (keys.erase(task.key()) > 0 && active > 0)
    --active;
}

[[nodiscard]] auto
task_queue::position_of(const std::int64_t chat_id) const
  -> std::optional<std::size_t> {
  std::lock_guard lck{mtx};
  std::size_t rank{1};
  for (const auto &t : tasks | std::views::values) {
    if (t.chat_id == chat_id)
      return rank;
    ++rank;
  }
  return std::nullopt;
}

[[nodiscard]] auto
task_queue::snapshot_for(const std::int64_t chat_id) const
  -> std::vector<download_task> {
  std::lock_guard lck{mtx};
  std::vector<download_task> r;
  for (const auto &t : tasks | std::views::values)
    if (t.chat_id == chat_id)
      r.push_back(t);
  return r;
}

auto
task_queue::evict_older_than(const std::chrono::seconds max_age)
  -> std::size_t {
  auto &lgr = logger::instance();
  const auto now = download_task::clock::now();
  std::vector<download_task> evicted;
  {
    std::lock_guard lck{mtx};
    for (auto it = std::begin(tasks); it != std::end(tasks);) {
      if (it->second.age(now) >= max_age) {
        update_depth(it->first.priority, -1);
        keys.erase(it->second.key());
        evicted.push_back(std::move(it->second));
        it = tasks.erase(it);
      }
      else
        ++it;
    }
    n_evicted += std::size(evicted);
  }
  for (const auto &t : evicted) {
    lgr.info("Evicted stale task {}", t);
    if (mirror != nullptr)
      if (const auto error = mirror->mark_failed(t.id, "expired in queue");
          error)
        lgr.warning("Failed to mirror eviction of {}: {}", t.id, error);
  }
  return std::size(evicted);
}

[[nodiscard]] auto
task_queue::size() const -> std::size_t {
  std::lock_guard lck{mtx};
  return std::size(tasks);
}

[[nodiscard]] auto
task_queue::empty() const -> bool {
  std::lock_guard lck{mtx};
  return tasks.empty();
}

[[nodiscard]] auto
task_queue::n_active() const -> std::size_t {
  std::lock_guard lck{mtx};
  return active;
}

[[nodiscard]] auto
task_queue::gauges() const -> task_queue_gauges {
  task_queue_gauges g;
  for (auto i = 0; i < n_task_priorities; ++i)
    g.depth[i] = static_cast<std::uint32_t>(depth_gauge[i].load());
  g.n_enqueued = n_enqueued;
  g.n_dequeued = n_dequeued;
  g.n_evicted = n_evicted;
  g.n_rejected = n_rejected;
  return g;
}

}  // namespace mediaq
