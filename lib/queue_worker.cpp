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

#include "queue_worker.hpp"

#include "download.hpp"
#include "download_task.hpp"
#include "error_kind.hpp"
#include "logger.hpp"
#include "processing_semaphore.hpp"
#include "queue_mirror.hpp"
#include "source_backend.hpp"
#include "source_progress.hpp"
#include "source_registry.hpp"
#include "task_queue.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>

namespace mediaq {

auto
to_json(nlohmann::json &j, const task_result &r) -> void {
  j = nlohmann::json{
    // clang-format off
    {"task_id", r.task.id},
    {"chat_id", r.task.chat_id},
    {"url", r.task.url},
    {"backend", r.backend},
    {"success", r.success()},
    // clang-format on
  };
  if (r.success())
    j["output"] = r.output;
  else {
    j["error"] = r.error.message();
    j["error_kind"] = to_name(r.kind);
    j["user_message"] = r.user_message;
    if (!r.error_detail.empty())
      j["error_detail"] = r.error_detail;
    j["notify_admin"] = r.notify_admin;
  }
}

worker_pool::worker_pool(task_queue &queue, const source_registry &registry,
                         std::shared_ptr<queue_mirror> mirror,
                         processing_semaphore &semaphore,
                         const worker_settings &settings,
                         task_result_handler on_result) :
  queue{queue}, registry{registry}, mirror{std::move(mirror)},
  semaphore{semaphore}, settings{settings}, on_result{std::move(on_result)} {}

auto
worker_pool::start() -> void {
  auto &lgr = logger::instance();
  if (is_running())
    return;
  const auto n_workers = settings.n_workers == 0 ? 1 : settings.n_workers;
  for (std::uint32_t i = 0; i < n_workers; ++i)
    workers.emplace_back(
      [this, i](std::stop_token stoken) { worker_loop(stoken, i); });
  lgr.info("Started {} workers", n_workers);
}

auto
worker_pool::stop() -> void {
  if (!is_running())
    return;
  for (auto &w : workers)
    w.request_stop();
  pause_cv.notify_all();
  workers.clear();  // joins
  logger::instance().info("Workers stopped (completed: {}, failed: {})",
                          completed.load(), failed.load());
}

auto
worker_pool::pause(std::stop_token stoken,
                   const std::chrono::milliseconds d) -> bool {
  std::unique_lock lck{pause_mtx};
  pause_cv.wait_for(lck, stoken, d, [] { return false; });
  return !stoken.stop_requested();
}

auto
worker_pool::worker_loop(std::stop_token stoken,
                         const std::uint32_t worker_id) -> void {
  auto &lgr = logger::instance();
  lgr.debug("Worker {} running", worker_id);
  while (!stoken.stop_requested()) {
    const auto task = queue.dequeue();
    if (!task) {
      if (!pause(stoken, settings.check_interval))
        break;
      continue;
    }
    lgr.info("Worker {} took {}", worker_id, *task);
    const auto r = process(*task);
    queue.finish(*task);
    report(r);
    // spacing between starts keeps extractor traffic below rate limits
    if (!pause(stoken, settings.inter_download_delay))
      break;
  }
  lgr.debug("Worker {} exiting", worker_id);
}

auto
worker_pool::report(const task_result &r) -> void {
  if (r.success())
    ++completed;
  else
    ++failed;
  if (on_result) {
    // handlers need not be thread safe
    std::lock_guard lck{result_mtx};
    on_result(r);
  }
}

[[nodiscard]] auto
worker_pool::process(const download_task &task) -> task_result {
  auto &lgr = logger::instance();

  task_result r;
  r.task = task;

  const auto fail = [&](const std::error_code error,
                        const std::string &diagnostic = {}) {
    r.error = error;
    r.kind = to_error_kind(error);
    r.user_message = user_message(r.kind);
    if (!diagnostic.empty())
      r.error_detail = sanitize_error_message(diagnostic);
    r.notify_admin = should_notify_admin(r.kind);
    lgr.warning("Task {} failed: {} ({})", task.id, error, r.kind);
    if (!diagnostic.empty())
      lgr.debug("Task {} diagnostic: {}", task.id, diagnostic);
    if (r.notify_admin)
      for (const auto &fix : fix_recommendations(r.kind))
        lgr.warning("Recommended fix for {}: {}", r.kind, fix);
    // the record keeps the full text so operators can see what happened
    const auto record_message = diagnostic.empty() ? error.message()
                                                   : diagnostic;
    if (mirror != nullptr)
      if (const auto mirror_error =
            mirror->mark_failed(task.id, record_message);
          mirror_error)
        lgr.warning("Failed to mirror failure of {}: {}", task.id,
                    mirror_error);
    return r;
  };

  std::error_code error;
  const auto backend = registry.resolve(task.url, error);
  if (error)
    return fail(error);  // permanent: no amount of retrying helps
  r.backend = std::string(backend->name());

  if (mirror != nullptr)
    if (const auto mirror_error = mirror->mark_processing(task.id);
        mirror_error)
      lgr.warning("Failed to mirror start of {}: {}", task.id, mirror_error);

  const auto request =
    make_download_request(task, settings.download_dir, settings.max_file_size);

  progress_channel progress;
  // leaving this scope by any path requests stop, so the forwarder never
  // outlives the download even if the channel is left open
  std::jthread forwarder;
  if (on_progress)
    forwarder = std::jthread([&](std::stop_token stoken) {
      while (!stoken.stop_requested()) {
        const auto p = progress.receive_for(settings.check_interval);
        if (p)
          on_progress(task, *p);
        else if (progress.is_closed() && progress.size() == 0)
          return;
      }
    });

  const auto start = std::chrono::steady_clock::now();
  try {
    r.output = backend->download(request, progress, error);
  }
  catch (const std::exception &e) {
    lgr.error("Backend {} threw on {}: {}", r.backend, task.id, e.what());
    error = error_kind::unknown;
    r.output.diagnostic = e.what();
  }
  progress.close();
  if (forwarder.joinable())
    forwarder.join();
  if (error)
    return fail(error, r.output.diagnostic);

  if (post_process) {
    const auto permit = semaphore.acquire_permit();
    std::error_code pp_error;
    std::string pp_diagnostic;
    try {
      pp_error = post_process(task, r.output);
    }
    catch (const std::exception &e) {
      lgr.error("Post-processing threw on {}: {}", task.id, e.what());
      pp_error = error_kind::postprocessing_error;
      pp_diagnostic = e.what();
    }
    if (pp_error)
      return fail(pp_error, pp_diagnostic);
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::steady_clock::now() - start);
  lgr.info("Task {} done via {} in {}: {} ({} bytes)", task.id, r.backend,
           elapsed, r.output.file_path, r.output.file_size);
  if (mirror != nullptr)
    if (const auto mirror_error = mirror->mark_completed(task.id);
        mirror_error)
      lgr.warning("Failed to mirror completion of {}: {}", task.id,
                  mirror_error);
  return r;
}

}  // namespace mediaq
