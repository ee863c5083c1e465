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

#include <queue_worker.hpp>

#include <download.hpp>
#include <download_task.hpp>
#include <error_kind.hpp>
#include <logger.hpp>
#include <processing_semaphore.hpp>
#include <queue_mirror.hpp>
#include <source_backend.hpp>
#include <source_progress.hpp>
#include <source_registry.hpp>
#include <task_queue.hpp>

#include "unit_test_utils.hpp"

#include "nlohmann/json.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace mediaq;  // NOLINT

namespace {

static constexpr auto expired_cookies_text =
  "ERROR: [youtube] abc: The provided YouTube account cookies are no "
  "longer valid";

/// Succeeds unless the URL mentions "bot", "gone", "cookies" or "throw";
/// reports two progress events per download
class fake_backend : public source_backend {
public:
  [[nodiscard]] auto
  name() const -> std::string_view override {
    return "fake";
  }

  [[nodiscard]] auto
  supports(const std::string &url) const -> bool override {
    return url.starts_with("https://");
  }

  [[nodiscard]] auto
  metadata(const std::string &, std::error_code &) const
    -> media_metadata override {
    return {"title", "artist"};
  }

  [[nodiscard]] auto
  estimate_size(const std::string &) const
    -> std::optional<std::uint64_t> override {
    return std::nullopt;
  }

  [[nodiscard]] auto
  is_livestream(const std::string &) const -> bool override {
    return false;
  }

  [[nodiscard]] auto
  download(const download_request &request, progress_channel &progress,
           std::error_code &error) const -> download_output override {
    ++n_downloads;
    progress.send({50, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
    if (request.url.find("bot") != std::string::npos) {
      error = error_kind::bot_detection;
      return {};
    }
    if (request.url.find("gone") != std::string::npos) {
      error = error_kind::video_unavailable;
      return {};
    }
    if (request.url.find("cookies") != std::string::npos) {
      error = error_kind::invalid_cookies;
      download_output failed;
      failed.diagnostic = expired_cookies_text;
      return failed;
    }
    if (request.url.find("throw") != std::string::npos)
      throw std::runtime_error("backend exploded");
    progress.send(
      {100, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
    download_output out;
    out.file_path = request.output_path;
    out.file_size = 1;
    out.mime_hint = "audio/mpeg";
    return out;
  }

  mutable std::atomic<std::uint32_t> n_downloads{};
};

}  // namespace

class queue_worker_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    directory = generate_unique_dir_name();
    mirror = std::make_shared<json_file_mirror>(directory);
    ASSERT_FALSE(mirror->initialize());
    backend = std::make_shared<fake_backend>();
    registry.add(backend);
    settings.n_workers = 2;
    settings.check_interval = std::chrono::milliseconds{10};
    settings.inter_download_delay = std::chrono::milliseconds{0};
    settings.download_dir = directory;
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    remove_directories(directory, error);
  }

  [[nodiscard]] static auto
  make_task(const std::string &id, const std::string &url) -> download_task {
    download_task t;
    t.id = id;
    t.url = url;
    t.chat_id = 1;
    t.format = "mp3";
    t.created_at = download_task::clock::now();
    return t;
  }

  [[nodiscard]] auto
  status_of(const std::string &id) const -> std::optional<task_record> {
    std::error_code error;
    return mirror->get(id, error);
  }

  std::string directory;
  std::shared_ptr<json_file_mirror> mirror;
  std::shared_ptr<fake_backend> backend;
  source_registry registry;
  task_queue queue;
  processing_semaphore semaphore;
  worker_settings settings;
};

TEST_F(queue_worker_mock, process_success) {
  worker_pool pool(queue, registry, mirror, semaphore, settings, nullptr);
  const auto task = make_task("t1", "https://youtu.be/abc");
  ASSERT_FALSE(mirror->upsert(task));
  const auto r = pool.process(task);
  EXPECT_TRUE(r.success());
  EXPECT_EQ(r.backend, "fake");
  EXPECT_EQ(r.output.file_path,
            (std::filesystem::path{directory} / "t1.mp3").string());
  const auto rec = status_of("t1");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, task_status_t::completed);
}

TEST_F(queue_worker_mock, process_failure_is_classified) {
  worker_pool pool(queue, registry, mirror, semaphore, settings, nullptr);
  const auto task = make_task("t2", "https://youtu.be/bot");
  ASSERT_FALSE(mirror->upsert(task));
  const auto r = pool.process(task);
  EXPECT_FALSE(r.success());
  EXPECT_EQ(r.kind, error_kind::bot_detection);
  EXPECT_TRUE(r.notify_admin);
  EXPECT_EQ(r.user_message, user_message(error_kind::bot_detection));
  const auto rec = status_of("t2");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, task_status_t::failed);
  EXPECT_EQ(rec->retry_count, 1u);
  EXPECT_FALSE(rec->error_message.empty());
}

TEST_F(queue_worker_mock, failure_diagnostic_reaches_record) {
  worker_pool pool(queue, registry, mirror, semaphore, settings, nullptr);
  const auto task = make_task("t4", "https://youtu.be/cookies");
  ASSERT_FALSE(mirror->upsert(task));
  const auto r = pool.process(task);
  EXPECT_EQ(r.kind, error_kind::invalid_cookies);
  const auto rec = status_of("t4");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, task_status_t::failed);
  EXPECT_EQ(rec->error_message, expired_cookies_text);
  // users see the message for the kind, not the extractor output
  EXPECT_EQ(r.error_detail,
            user_message(classify_error(expired_cookies_text)));
  EXPECT_EQ(r.error_detail.find("[youtube]"), std::string::npos);
  const nlohmann::json j = r;
  EXPECT_EQ(j["error_detail"].get<std::string>(), r.error_detail);
}

TEST_F(queue_worker_mock, failure_without_diagnostic_records_error_name) {
  worker_pool pool(queue, registry, mirror, semaphore, settings, nullptr);
  const auto task = make_task("t5", "https://youtu.be/gone");
  ASSERT_FALSE(mirror->upsert(task));
  const auto r = pool.process(task);
  EXPECT_TRUE(r.error_detail.empty());
  const auto rec = status_of("t5");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->error_message,
            make_error_code(error_kind::video_unavailable).message());
}

TEST_F(queue_worker_mock, throwing_backend_fails_task) {
  worker_pool pool(queue, registry, mirror, semaphore, settings, nullptr);
  std::atomic<std::uint32_t> n_events{};
  pool.set_progress_handler(
    [&](const download_task &, const source_progress &) { ++n_events; });
  const auto task = make_task("t6", "https://youtu.be/throw");
  ASSERT_FALSE(mirror->upsert(task));
  const auto r = pool.process(task);
  EXPECT_FALSE(r.success());
  EXPECT_EQ(r.kind, error_kind::unknown);
  EXPECT_EQ(n_events.load(), 1u);
  const auto rec = status_of("t6");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, task_status_t::failed);
  EXPECT_EQ(rec->error_message, "backend exploded");
}

TEST_F(queue_worker_mock, throwing_post_processing_fails_task) {
  worker_pool pool(queue, registry, mirror, semaphore, settings, nullptr);
  pool.set_post_processing(
    [](const download_task &, download_output &) -> std::error_code {
      throw std::runtime_error("tagging failed");
    });
  const auto r = pool.process(make_task("t7", "https://youtu.be/abc"));
  EXPECT_EQ(r.kind, error_kind::postprocessing_error);
  EXPECT_EQ(r.error_detail, "tagging failed");
  EXPECT_EQ(semaphore.available(), processing_semaphore::default_permits);
}

TEST_F(queue_worker_mock, unavailable_does_not_notify_admin) {
  worker_pool pool(queue, registry, nullptr, semaphore, settings, nullptr);
  const auto r = pool.process(make_task("t3", "https://youtu.be/gone"));
  EXPECT_EQ(r.kind, error_kind::video_unavailable);
  EXPECT_FALSE(r.notify_admin);
}

TEST_F(queue_worker_mock, no_backend_fails_without_download) {
  worker_pool pool(queue, registry, nullptr, semaphore, settings, nullptr);
  const auto r = pool.process(make_task("t4", "ftp://example.com/a.mp3"));
  EXPECT_EQ(r.error, source_error_code::no_backend_for_url);
  EXPECT_TRUE(r.backend.empty());
  EXPECT_EQ(backend->n_downloads.load(), 0u);
}

TEST_F(queue_worker_mock, post_processing_holds_permit) {
  worker_pool pool(queue, registry, nullptr, semaphore, settings, nullptr);
  std::uint32_t available_inside{};
  pool.set_post_processing(
    [&](const download_task &, download_output &out) -> std::error_code {
      available_inside = semaphore.available();
      out.mime_hint = "audio/ogg";
      return {};
    });
  const auto r = pool.process(make_task("t5", "https://youtu.be/abc"));
  EXPECT_TRUE(r.success());
  EXPECT_EQ(r.output.mime_hint, "audio/ogg");
  EXPECT_EQ(available_inside, processing_semaphore::default_permits - 1);
  EXPECT_EQ(semaphore.available(), processing_semaphore::default_permits);
}

TEST_F(queue_worker_mock, post_processing_error_fails_task) {
  worker_pool pool(queue, registry, nullptr, semaphore, settings, nullptr);
  pool.set_post_processing(
    [](const download_task &, download_output &) -> std::error_code {
      return error_kind::postprocessing_error;
    });
  const auto r = pool.process(make_task("t6", "https://youtu.be/abc"));
  EXPECT_FALSE(r.success());
  EXPECT_EQ(r.kind, error_kind::postprocessing_error);
}

TEST_F(queue_worker_mock, progress_forwarded) {
  worker_pool pool(queue, registry, nullptr, semaphore, settings, nullptr);
  std::vector<std::uint8_t> seen;
  pool.set_progress_handler(
    [&](const download_task &, const source_progress &p) {
      seen.push_back(p.percent);
    });
  const auto r = pool.process(make_task("t7", "https://youtu.be/abc"));
  EXPECT_TRUE(r.success());
  const std::vector<std::uint8_t> expected{50, 100};
  EXPECT_EQ(seen, expected);
}

TEST_F(queue_worker_mock, workers_drain_queue) {
  static constexpr auto n_tasks = 5u;
  std::mutex mtx;
  std::condition_variable cv;
  std::vector<task_result> results;
  worker_pool pool(queue, registry, mirror, semaphore, settings,
                   [&](const task_result &r) {
                     std::lock_guard lck{mtx};
                     results.push_back(r);
                     cv.notify_one();
                   });

  for (auto i = 0u; i < n_tasks; ++i) {
    const auto url = i == 0 ? std::string{"https://youtu.be/gone"}
                            : std::format("https://youtu.be/v{}", i);
    ASSERT_FALSE(queue.enqueue(make_task(std::format("w{}", i), url)));
  }

  pool.start();
  EXPECT_TRUE(pool.is_running());
  {
    std::unique_lock lck{mtx};
    const auto done = cv.wait_for(lck, std::chrono::seconds{10}, [&] {
      return std::size(results) == n_tasks;
    });
    EXPECT_TRUE(done);
  }
  pool.stop();
  EXPECT_FALSE(pool.is_running());

  EXPECT_EQ(pool.n_completed(), n_tasks - 1);
  EXPECT_EQ(pool.n_failed(), 1u);
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.n_active(), 0u);
}

TEST_F(queue_worker_mock, stop_without_start) {
  worker_pool pool(queue, registry, nullptr, semaphore, settings, nullptr);
  EXPECT_FALSE(pool.is_running());
  pool.stop();
  EXPECT_FALSE(pool.is_running());
}

TEST(queue_worker_test, task_result_to_json) {
  task_result r;
  r.task.id = "abc";
  r.task.chat_id = 7;
  r.backend = "ytdlp";
  r.output.file_path = "/tmp/abc.mp3";
  nlohmann::json j = r;
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["output"]["file_path"], "/tmp/abc.mp3");
  EXPECT_FALSE(j.contains("error"));

  r.error = error_kind::network_error;
  r.kind = error_kind::network_error;
  j = r;
  EXPECT_EQ(j["success"], false);
  EXPECT_EQ(j["error_kind"].get<std::string>(),
            to_name(error_kind::network_error));
  EXPECT_FALSE(j.contains("output"));
}
