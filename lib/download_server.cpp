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

#include "download_server.hpp"

#include "bot_config.hpp"
#include "cookie_file.hpp"
#include "credential_refresher.hpp"
#include "download_task.hpp"
#include "http_source.hpp"
#include "instagram_source.hpp"
#include "logger.hpp"
#include "metadata_cache.hpp"
#include "queue_mirror.hpp"
#include "queue_worker.hpp"
#include "source_registry.hpp"
#include "task_queue.hpp"
#include "ytdlp_source.hpp"

#include "nlohmann/json.hpp"

#include <asio.hpp>

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>  // std::strsignal
#include <filesystem>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace mediaq {

[[nodiscard]] auto
make_default_registry(const bot_config &config,
                      std::shared_ptr<metadata_cache> cache,
                      std::shared_ptr<refresh_signal> refresher)
  -> std::shared_ptr<source_registry> {
  auto registry = std::make_shared<source_registry>();
  auto ytdlp = std::make_shared<ytdlp_source>(
    config.get_ytdlp_config(), std::move(cache), std::move(refresher));
  // direct links first; the extractor claims almost anything so it is last
  registry->add(std::make_shared<http_source>());
  registry->add(
    std::make_shared<instagram_source>(config.get_instagram_doc_id(), ytdlp));
  registry->add(ytdlp);
  return registry;
}

/// Fills in the duration when the backend could not tell
[[nodiscard]] static auto
make_duration_filler(const ytdlp_config &cfg) -> post_processing_hook {
  return [cfg](const download_task &, download_output &output) {
    const bool is_media = output.mime_hint.starts_with("audio/") ||
                          output.mime_hint.starts_with("video/");
    if (is_media && !output.duration_secs)
      output.duration_secs = read_media_duration(
        cfg.ffprobe_path, output.file_path, cfg.query_timeout);
    return std::error_code{};
  };
}

download_server::download_server(const bot_config &config,
                                 std::shared_ptr<source_registry> registry,
                                 std::shared_ptr<refresh_signal> refresher,
                                 std::ostream &out, const int in_fd,
                                 std::error_code &error) :
  config{config}, registry{std::move(registry)},
  refresher{std::move(refresher)},
  mirror{std::make_shared<json_file_mirror>(config.get_mirror_dir())},
  out{out}, input_fd{::dup(in_fd)},
#if defined(SIGQUIT)
  signals(ioc, SIGINT, SIGTERM, SIGQUIT),
#else
  signals(ioc, SIGINT, SIGTERM),
#endif
  maintenance_timer{ioc}, queue{config.max_queue_size, mirror},
  semaphore{config.max_concurrent_processing},
  pool{queue,
       *this->registry,
       mirror,
       semaphore,
       config.get_worker_settings(),
       [this](const task_result &r) { emit({{"result", r}}); }} {
  auto &lgr = logger::instance();
  if (this->input_fd < 0) {
    error = std::error_code(errno, std::system_category());
    lgr.error("Failed to open input: {}", error);
    return;
  }
  if (const auto mirror_error = mirror->initialize(); mirror_error) {
    error = mirror_error;
    return;
  }
  std::filesystem::create_directories(config.get_download_dir(), error);
  if (error) {
    lgr.error("Failed to create download directory {}: {}",
              config.get_download_dir(), error);
    return;
  }
  pool.set_post_processing(make_duration_filler(config.get_ytdlp_config()));
  pool.set_progress_handler(
    [this](const download_task &task, const source_progress &p) {
      nlohmann::json progress{
        {"task_id", task.id},
        {"chat_id", task.chat_id},
        {"percent", p.percent},
      };
      if (p.speed_bytes_sec)
        progress["speed_bytes_sec"] = *p.speed_bytes_sec;
      if (p.eta_seconds)
        progress["eta_seconds"] = *p.eta_seconds;
      emit({{"progress", progress}});
    });
}

download_server::~download_server() {
  input_reader = {};
  if (refresher != nullptr)
    refresher->close();
  refresh_forwarder = {};
  pool.stop();
  if (input_fd >= 0)
    ::close(input_fd);
}

auto
download_server::emit(const nlohmann::json &data) -> void {
  const auto line = data.dump();
  std::lock_guard lck{out_mtx};
  out << line << '\n';
  out.flush();
}

auto
download_server::recover() -> std::size_t {
  auto &lgr = logger::instance();
  std::error_code error;
  const auto records = mirror->pending(error);
  if (error) {
    lgr.error("Failed to read queue mirror {}: {}", mirror->get_directory(),
              error);
    return 0;
  }
  std::size_t n_recovered{};
  for (const auto &r : records) {
    if (const auto enqueue_error = queue.enqueue(r.task); enqueue_error)
      lgr.warning("Not recovering {}: {}", r.task.id, enqueue_error);
    else
      ++n_recovered;
  }
  if (n_recovered > 0)
    lgr.info("Recovered {} tasks from {}", n_recovered,
             mirror->get_directory());
  return n_recovered;
}

auto
download_server::retry_failed() -> std::size_t {
  auto &lgr = logger::instance();
  std::error_code error;
  const auto records = mirror->failed(config.max_retries, error);
  if (error) {
    lgr.error("Failed to read queue mirror {}: {}", mirror->get_directory(),
              error);
    return 0;
  }
  std::size_t n_requeued{};
  for (const auto &r : records) {
    if (const auto enqueue_error = queue.enqueue(r.task); enqueue_error)
      lgr.warning("Not retrying {}: {}", r.task.id, enqueue_error);
    else {
      lgr.info("Retrying {} (failed {} times: {})", r.task.id, r.retry_count,
               r.error_message);
      ++n_requeued;
    }
  }
  return n_requeued;
}

auto
download_server::prune_records() -> std::size_t {
  if (config.record_max_age_secs == 0)
    return 0;
  std::error_code error;
  const auto n_removed = mirror->prune(
    std::chrono::seconds{config.record_max_age_secs}, error);
  if (error)
    logger::instance().warning("Failed to prune queue mirror {}: {}",
                               mirror->get_directory(), error);
  return n_removed;
}

auto
download_server::run() -> void {
  auto &lgr = logger::instance();
  do_await_stop();
  (void)prune_records();
  (void)recover();
  pool.start();
  last_eviction = std::chrono::steady_clock::now();
  schedule_maintenance();
  input_reader =
    std::jthread([this](std::stop_token stoken) { read_input(stoken); });
  if (refresher != nullptr)
    refresh_forwarder = std::jthread(
      [this](std::stop_token stoken) { forward_refresh_requests(stoken); });
  lgr.info("Server running ({} workers)", config.n_workers);
  ioc.run();

  input_reader = {};
  if (refresher != nullptr)
    refresher->close();  // wakes workers waiting for a refresh
  refresh_forwarder = {};
  pool.stop();
  lgr.info("Server stopped: {}", queue.gauges());
}

auto
download_server::do_await_stop() -> void {
  signals.async_wait([this](const std::error_code ec, const int signo) {
    if (ec == asio::error::operation_aborted)
      return;  // cancelled after the input drained
    logger::instance().warning("Received signal {} ({})", strsignal(signo),
                               ec);
    // stop by cancelling all outstanding async ops; when all have
    // finished, the call to io_context::run() will finish
    ioc.stop();
  });
}

auto
download_server::schedule_maintenance() -> void {
  maintenance_timer.expires_after(
    std::chrono::milliseconds{config.check_interval_ms});
  maintenance_timer.async_wait([this](const std::error_code ec) {
    if (ec)
      return;
    const auto now = std::chrono::steady_clock::now();
    if (now - last_eviction >= eviction_interval) {
      last_eviction = now;
      (void)queue.evict_older_than(
        std::chrono::seconds{config.queue_max_age_secs});
      (void)prune_records();
    }
    if (input_closed && queue.empty() && queue.n_active() == 0) {
      logger::instance().info("Input closed and queue drained");
      signals.cancel();
      return;  // the io_context runs out of work
    }
    schedule_maintenance();
  });
}

auto
download_server::read_input(std::stop_token stoken) -> void {
  static constexpr auto buf_size = 4096;
  auto &lgr = logger::instance();
  std::array<char, buf_size> buf{};
  std::string pending;
  const auto poll_timeout = static_cast<int>(config.check_interval_ms);
  while (!stoken.stop_requested()) {
    pollfd pfd{input_fd, POLLIN, 0};
    const int rc = ::poll(&pfd, 1, poll_timeout);
    if (rc == 0 || (rc < 0 && errno == EINTR))
      continue;
    const auto n = rc < 0 ? -1 : ::read(input_fd, buf.data(), buf_size);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      if (n < 0)
        lgr.error("Failed reading input: {}",
                  std::error_code(errno, std::system_category()));
      if (!pending.empty())
        asio::post(ioc,
                   [this, line = std::move(pending)] { handle_line(line); });
      asio::post(ioc, [this] { input_closed = true; });
      return;
    }
    pending.append(buf.data(), static_cast<std::size_t>(n));
    std::size_t pos{};
    while ((pos = pending.find('\n')) != std::string::npos) {
      asio::post(ioc,
                 [this, line = pending.substr(0, pos)] { handle_line(line); });
      pending.erase(0, pos + 1);
    }
  }
}

auto
download_server::forward_refresh_requests(std::stop_token stoken) -> void {
  const auto wait = std::chrono::milliseconds{config.check_interval_ms};
  while (!stoken.stop_requested()) {
    const auto req = refresher->next_request(wait);
    if (!req)
      continue;
    logger::instance().warning("Credential refresh requested: {}", *req);
    emit({{"refresh_request",
           {{"id", req->id}, {"reason", req->reason}, {"url", req->url}}}});
  }
}

auto
download_server::handle_line(const std::string_view line) -> void {
  auto &lgr = logger::instance();
  if (line.find_first_not_of(" \t\r") == std::string_view::npos)
    return;
  const auto data = nlohmann::json::parse(line, nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    lgr.warning("Ignoring malformed input line: {}", line);
    emit({{"error", "malformed input"}});
    return;
  }
  if (data.contains("refresh_response"))
    handle_refresh_response(data.at("refresh_response"));
  else if (data.contains("status"))
    handle_status(data);
  else if (data.contains("retry_failed"))
    emit({{"retried", {{"count", retry_failed()}}}});
  else
    handle_task(data);
}

auto
download_server::handle_task(const nlohmann::json &data) -> void {
  auto &lgr = logger::instance();
  download_task task;
  try {
    task = data;
  }
  catch (const nlohmann::json::exception &e) {
    lgr.warning("Invalid task: {}", e.what());
    emit({{"rejected", {{"error", "invalid task"}}}});
    return;
  }
  if (!task.audio_bitrate && !task.is_video)
    task.audio_bitrate = config.default_audio_bitrate;
  if (const auto error = queue.enqueue(task); error) {
    emit({{"rejected",
           {
             {"task_id", task.id},
             {"url", task.url},
             {"error", error.message()},
           }}});
    return;
  }
  const auto position = queue.position_of(task.chat_id);
  nlohmann::json accepted{{"task_id", task.id}, {"chat_id", task.chat_id}};
  if (position)
    accepted["position"] = *position;
  emit({{"accepted", accepted}});
}

auto
download_server::handle_refresh_response(const nlohmann::json &data) -> void {
  auto &lgr = logger::instance();
  if (refresher == nullptr || !data.is_object() || !data.contains("id")) {
    lgr.warning("Ignoring refresh response: {}", data.dump());
    return;
  }
  const auto id = data.value("id", std::uint64_t{});
  bool ok = data.value("ok", false);
  if (ok && data.contains("cookies")) {
    const auto cookies = data.value("cookies", std::string{});
    if (config.cookies_file.empty()) {
      lgr.warning("Cookies received but no cookies file is configured");
      ok = false;
    }
    else {
      std::error_code error;
      replace_cookie_file(config.cookies_file, cookies, error);
      if (error) {
        lgr.error("Failed to replace cookies {}: {}", config.cookies_file,
                  error);
        ok = false;
      }
      else
        lgr.info("Replaced cookies file {}", config.cookies_file);
    }
  }
  if (!refresher->respond(id, ok))
    lgr.warning("Refresh response {} arrived after the request expired", id);
}

auto
download_server::handle_status(const nlohmann::json &data) -> void {
  const auto chat_id = data.value("status", std::int64_t{});
  nlohmann::json status{{"chat_id", chat_id}};
  if (const auto position = queue.position_of(chat_id); position)
    status["position"] = *position;
  nlohmann::json ids = nlohmann::json::array();
  for (const auto &t : queue.snapshot_for(chat_id))
    ids.push_back(t.id);
  status["tasks"] = ids;
  status["queued"] = queue.size();
  emit({{"status", status}});
}

}  // namespace mediaq
