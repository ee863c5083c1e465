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

#ifndef LIB_DOWNLOAD_SERVER_HPP_
#define LIB_DOWNLOAD_SERVER_HPP_

#include "bot_config.hpp"
#include "processing_semaphore.hpp"
#include "queue_worker.hpp"
#include "task_queue.hpp"

#include "nlohmann/json.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

namespace mediaq {

class json_file_mirror;
class metadata_cache;
class refresh_signal;
class source_registry;

/// The plain HTTP backend for direct media links, the Instagram backend for
/// posts and reels, then the extractor backend for everything else
[[nodiscard]] auto
make_default_registry(const bot_config &config,
                      std::shared_ptr<metadata_cache> cache,
                      std::shared_ptr<refresh_signal> refresher)
  -> std::shared_ptr<source_registry>;

/// Long-running service around the worker pool. Newline-delimited JSON
/// arrives on the input descriptor:
///   {"url": ..., "chat_id": ..., "format": ..., "plan": ...}  submit a task
///   {"status": chat_id}                                       queue position
///   {"retry_failed": true}                  requeue failed tasks with retries
///   {"refresh_response": {"id": ..., "ok": ..., "cookies": ...}}
/// and one JSON document per line goes to the output stream for task
/// acceptance, progress, results and credential refresh requests. Stops on
/// SIGINT or SIGTERM, or once the input is closed and all work is done.
class download_server {
public:
  static constexpr auto eviction_interval = std::chrono::seconds{60};

  download_server(const bot_config &config,
                  std::shared_ptr<source_registry> registry,
                  std::shared_ptr<refresh_signal> refresher,
                  std::ostream &out, const int in_fd,
                  std::error_code &error);

  download_server(const download_server &) = delete;
  auto
  operator=(const download_server &) -> download_server & = delete;

  ~download_server();

  // clang-format off
  auto run() -> void;
  auto do_await_stop() -> void;  // wait for request to stop server
  // clang-format on

  /// Put tasks left pending or processing by a previous run back in the
  /// queue; returns how many
  auto
  recover() -> std::size_t;

  /// Put failed tasks that have not used up their retries back in the
  /// queue; returns how many
  auto
  retry_failed() -> std::size_t;

  /// Drop finished mirror records older than the configured age
  auto
  prune_records() -> std::size_t;

  auto
  handle_line(const std::string_view line) -> void;

  [[nodiscard]] auto
  get_queue() -> task_queue & {
    return queue;
  }

private:
  auto
  schedule_maintenance() -> void;

  auto
  read_input(std::stop_token stoken) -> void;

  auto
  forward_refresh_requests(std::stop_token stoken) -> void;

  auto
  handle_task(const nlohmann::json &data) -> void;

  auto
  handle_refresh_response(const nlohmann::json &data) -> void;

  auto
  handle_status(const nlohmann::json &data) -> void;

  auto
  emit(const nlohmann::json &data) -> void;

  bot_config config;
  std::shared_ptr<source_registry> registry;
  std::shared_ptr<refresh_signal> refresher;
  std::shared_ptr<json_file_mirror> mirror;
  std::ostream &out;
  std::mutex out_mtx;
  int input_fd{-1};

  asio::io_context ioc;
  asio::signal_set signals;
  asio::steady_timer maintenance_timer;
  std::chrono::steady_clock::time_point last_eviction{};
  bool input_closed{false};

  task_queue queue;
  processing_semaphore semaphore;
  worker_pool pool;
  std::jthread input_reader;
  std::jthread refresh_forwarder;
};

}  // namespace mediaq

#endif  // LIB_DOWNLOAD_SERVER_HPP_
