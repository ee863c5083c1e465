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

#ifndef LIB_QUEUE_WORKER_HPP_
#define LIB_QUEUE_WORKER_HPP_

#include "download.hpp"
#include "download_task.hpp"
#include "error_kind.hpp"
#include "source_progress.hpp"

#include "nlohmann/json.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace mediaq {

class processing_semaphore;
class queue_mirror;
class source_registry;
class task_queue;

struct worker_settings {
  static constexpr std::uint32_t default_n_workers{2};
  static constexpr auto default_check_interval = std::chrono::milliseconds{100};
  static constexpr auto default_inter_download_delay =
    std::chrono::milliseconds{3000};

  std::uint32_t n_workers{default_n_workers};
  std::chrono::milliseconds check_interval{default_check_interval};
  std::chrono::milliseconds inter_download_delay{default_inter_download_delay};
  std::string download_dir;
  std::optional<std::uint64_t> max_file_size;
};

/// How one task ended, as reported to whoever delivers results
struct task_result {
  download_task task;
  std::string backend;
  download_output output;
  std::error_code error{};
  error_kind kind{error_kind::ok};
  std::string user_message;
  /// Failure text cleaned of extractor output, for showing to users
  std::string error_detail;
  bool notify_admin{false};

  [[nodiscard]] auto
  success() const -> bool {
    return !error;
  }
};

auto
to_json(nlohmann::json &j, const task_result &r) -> void;

using task_result_handler = std::function<void(const task_result &)>;

using task_progress_handler =
  std::function<void(const download_task &, const source_progress &)>;

/// Runs on a finished download while a processing permit is held; an
/// error fails the task
using post_processing_hook =
  std::function<std::error_code(const download_task &, download_output &)>;

/// N threads each taking the head of the queue, resolving a backend,
/// downloading and reporting. A worker that fails a task goes on to the
/// next one.
class worker_pool {
public:
  worker_pool(task_queue &queue, const source_registry &registry,
              std::shared_ptr<queue_mirror> mirror,
              processing_semaphore &semaphore, const worker_settings &settings,
              task_result_handler on_result);

  worker_pool(const worker_pool &) = delete;
  auto
  operator=(const worker_pool &) -> worker_pool & = delete;

  ~worker_pool() { stop(); }

  auto
  set_post_processing(post_processing_hook hook) -> void {
    post_process = std::move(hook);
  }

  auto
  set_progress_handler(task_progress_handler handler) -> void {
    on_progress = std::move(handler);
  }

  auto
  start() -> void;

  /// Request stop and join; a download in flight finishes first
  auto
  stop() -> void;

  [[nodiscard]] auto
  is_running() const -> bool {
    return !workers.empty();
  }

  /// Run one task to completion on the calling thread
  [[nodiscard]] auto
  process(const download_task &task) -> task_result;

  [[nodiscard]] auto
  n_completed() const -> std::uint64_t {
    return completed;
  }

  [[nodiscard]] auto
  n_failed() const -> std::uint64_t {
    return failed;
  }

private:
  auto
  worker_loop(std::stop_token stoken, const std::uint32_t worker_id) -> void;

  /// Sleep unless stop is requested first; false if stopped
  auto
  pause(std::stop_token stoken, const std::chrono::milliseconds d) -> bool;

  auto
  report(const task_result &r) -> void;

  task_queue &queue;
  const source_registry &registry;
  std::shared_ptr<queue_mirror> mirror;
  processing_semaphore &semaphore;
  worker_settings settings;
  task_result_handler on_result;
  task_progress_handler on_progress;
  post_processing_hook post_process;

  std::mutex pause_mtx;
  std::condition_variable_any pause_cv;
  std::mutex result_mtx;
  std::atomic<std::uint64_t> completed{};
  std::atomic<std::uint64_t> failed{};
  std::vector<std::jthread> workers;
};

}  // namespace mediaq

#endif  // LIB_QUEUE_WORKER_HPP_
