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

#include <task_queue.hpp>

#include <download_task.hpp>
#include <logger.hpp>
#include <queue_mirror.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <format>
#include <memory>
#include <ostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace mediaq;  // NOLINT

namespace {

[[nodiscard]] auto
make_task(const std::string &id, const task_priority_t priority,
          const std::int64_t chat_id = 1) -> download_task {
  download_task t;
  t.id = id;
  t.url = std::format("https://youtu.be/{}", id);
  t.chat_id = chat_id;
  t.format = "mp3";
  t.priority = priority;
  t.created_at = download_task::clock::now();
  return t;
}

/// Records what the queue asks of durable storage
class recording_mirror : public queue_mirror {
public:
  auto
  upsert(const download_task &task) -> std::error_code override {
    upserted.push_back(task.id);
    return fail_writes ? queue_mirror_error_code::failed_to_write_record
                       : std::error_code{};
  }

  auto
  mark_processing(const std::string &) -> std::error_code override {
    return {};
  }

  auto
  mark_completed(const std::string &) -> std::error_code override {
    return {};
  }

  auto
  mark_failed(const std::string &id,
              const std::string &message) -> std::error_code override {
    failed_ids.push_back(id);
    last_message = message;
    return {};
  }

  [[nodiscard]] auto
  get(const std::string &, std::error_code &) const
    -> std::optional<task_record> override {
    return std::nullopt;
  }

  [[nodiscard]] auto
  pending(std::error_code &) const -> std::vector<task_record> override {
    return {};
  }

  [[nodiscard]] auto
  failed(const std::uint32_t, std::error_code &) const
    -> std::vector<task_record> override {
    return {};
  }

  auto
  prune(const std::chrono::seconds, std::error_code &)
    -> std::size_t override {
    return 0;
  }

  bool fail_writes{false};
  std::vector<std::string> upserted;
  std::vector<std::string> failed_ids;
  std::string last_message;
};

}  // namespace

// the logger keeps the first stream it is given for the whole binary
hooked_log_buf log_buf;  // NOLINT

class task_queue_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(std::make_shared<std::ostream>(&log_buf), "none",
                     log_level_t::debug);
  }
};

TEST_F(task_queue_mock, priority_order_then_arrival) {
  task_queue q;
  EXPECT_FALSE(q.enqueue(make_task("a", task_priority_t::low)));
  EXPECT_FALSE(q.enqueue(make_task("b", task_priority_t::high)));
  EXPECT_FALSE(q.enqueue(make_task("c", task_priority_t::medium)));
  EXPECT_FALSE(q.enqueue(make_task("d", task_priority_t::high)));

  std::vector<std::string> order;
  while (const auto t = q.dequeue())
    order.push_back(t->id);
  EXPECT_EQ(order, (std::vector<std::string>{"b", "d", "c", "a"}));
  EXPECT_TRUE(q.empty());
  EXPECT_EQ(q.n_active(), 4);
}

TEST_F(task_queue_mock, dequeue_empty) {
  task_queue q;
  EXPECT_FALSE(q.dequeue());
}

TEST_F(task_queue_mock, position_of_decreases_with_dequeue) {
  task_queue q;
  for (std::int64_t user = 1; user <= 5; ++user)
    EXPECT_FALSE(q.enqueue(
      make_task(std::format("t{}", user), task_priority_t::low, user)));

  EXPECT_EQ(q.position_of(3), 3);
  const auto first = q.dequeue();
  ASSERT_TRUE(first);
  EXPECT_EQ(q.position_of(3), 2);
  const auto second = q.dequeue();
  ASSERT_TRUE(second);
  EXPECT_EQ(q.position_of(3), 1);
  const auto third = q.dequeue();
  ASSERT_TRUE(third);
  EXPECT_EQ(third->chat_id, 3);
  EXPECT_FALSE(q.position_of(3));
  EXPECT_FALSE(q.position_of(42));
}

TEST_F(task_queue_mock, snapshot_for_chat) {
  task_queue q;
  EXPECT_FALSE(q.enqueue(make_task("x", task_priority_t::low, 10)));
  EXPECT_FALSE(q.enqueue(make_task("y", task_priority_t::low, 20)));
  EXPECT_FALSE(q.enqueue(make_task("z", task_priority_t::high, 10)));
  const auto s = q.snapshot_for(10);
  ASSERT_EQ(std::size(s), 2);
  EXPECT_EQ(s[0].id, "z");
  EXPECT_EQ(s[1].id, "x");
}

TEST_F(task_queue_mock, queue_full_rejected) {
  task_queue q(2);
  EXPECT_FALSE(q.enqueue(make_task("a", task_priority_t::low)));
  EXPECT_FALSE(q.enqueue(make_task("b", task_priority_t::low)));
  const auto error = q.enqueue(make_task("c", task_priority_t::high));
  EXPECT_EQ(error, task_queue_error_code::queue_full);
  EXPECT_EQ(q.size(), 2);
  EXPECT_EQ(q.gauges().n_rejected, 1);
}

TEST_F(task_queue_mock, queue_usable_while_enqueue_logs) {
  task_queue q(2);
  // each log write asks another thread for the size; a lock held across
  // the write would keep that thread waiting
  std::uint32_t n_writes{};
  std::uint32_t n_blocked{};
  std::vector<std::future<std::size_t>> lookups;
  log_buf.set_hook([&] {
    ++n_writes;
    auto f = std::async(std::launch::async, [&q] { return q.size(); });
    if (f.wait_for(std::chrono::seconds{2}) != std::future_status::ready)
      ++n_blocked;
    lookups.push_back(std::move(f));
  });
  const auto a = make_task("a", task_priority_t::low);
  EXPECT_FALSE(q.enqueue(a));
  EXPECT_EQ(q.enqueue(a), task_queue_error_code::duplicate_task);
  EXPECT_FALSE(q.enqueue(make_task("b", task_priority_t::low)));
  EXPECT_EQ(q.enqueue(make_task("c", task_priority_t::low)),
            task_queue_error_code::queue_full);
  log_buf.set_hook(nullptr);
  lookups.clear();
  EXPECT_GE(n_writes, 4u);
  EXPECT_EQ(n_blocked, 0u);
}

TEST_F(task_queue_mock, duplicate_rejected_until_finished) {
  task_queue q;
  const auto a = make_task("a", task_priority_t::low);
  auto again = a;
  again.id = "a2";
  EXPECT_FALSE(q.enqueue(a));
  EXPECT_EQ(q.enqueue(again), task_queue_error_code::duplicate_task);

  // still blocked while a worker holds it
  const auto t = q.dequeue();
  ASSERT_TRUE(t);
  EXPECT_EQ(q.enqueue(again), task_queue_error_code::duplicate_task);

  q.finish(*t);
  EXPECT_EQ(q.n_active(), 0);
  EXPECT_FALSE(q.enqueue(again));
}

TEST_F(task_queue_mock, evict_older_than_idempotent) {
  auto mirror = std::make_shared<recording_mirror>();
  task_queue q(task_queue::default_max_size, mirror);
  auto old_task = make_task("old", task_priority_t::medium);
  old_task.created_at -= std::chrono::hours{2};
  EXPECT_FALSE(q.enqueue(old_task));
  EXPECT_FALSE(q.enqueue(make_task("new", task_priority_t::low)));

  EXPECT_EQ(q.evict_older_than(std::chrono::hours{1}), 1);
  EXPECT_EQ(q.evict_older_than(std::chrono::hours{1}), 0);
  EXPECT_EQ(q.size(), 1);
  EXPECT_EQ(q.depth(task_priority_t::medium), 0);
  EXPECT_EQ(mirror->failed_ids, std::vector<std::string>{"old"});
  EXPECT_EQ(mirror->last_message, "expired in queue");

  // the key is released with the task
  EXPECT_FALSE(q.enqueue(old_task));
}

TEST_F(task_queue_mock, mirror_failure_does_not_block) {
  auto mirror = std::make_shared<recording_mirror>();
  mirror->fail_writes = true;
  task_queue q(task_queue::default_max_size, mirror);
  EXPECT_FALSE(q.enqueue(make_task("a", task_priority_t::low)));
  EXPECT_EQ(q.size(), 1);
  EXPECT_EQ(mirror->upserted, std::vector<std::string>{"a"});
}

TEST_F(task_queue_mock, gauges_track_depth) {
  task_queue q;
  EXPECT_FALSE(q.enqueue(make_task("a", task_priority_t::low)));
  EXPECT_FALSE(q.enqueue(make_task("b", task_priority_t::high)));
  EXPECT_FALSE(q.enqueue(make_task("c", task_priority_t::high)));
  auto g = q.gauges();
  EXPECT_EQ(g.depth[std::to_underlying(task_priority_t::high)], 2);
  EXPECT_EQ(g.total_depth(), 3);
  EXPECT_EQ(g.n_enqueued, 3);

  const auto t = q.dequeue();
  ASSERT_TRUE(t);
  g = q.gauges();
  EXPECT_EQ(q.depth(task_priority_t::high), 1);
  EXPECT_EQ(g.n_dequeued, 1);
  EXPECT_FALSE(std::format("{}", g).empty());
}

TEST_F(task_queue_mock, concurrent_enqueue_dequeue) {
  static constexpr auto n_producers = 4;
  static constexpr auto n_per_producer = 50;
  task_queue q;
  std::vector<std::jthread> producers;
  for (auto p = 0; p < n_producers; ++p)
    producers.emplace_back([&q, p] {
      for (auto i = 0; i < n_per_producer; ++i) {
        const auto prio = static_cast<task_priority_t>(i % n_task_priorities);
        [[maybe_unused]] const auto error =
          q.enqueue(make_task(std::format("{}-{}", p, i), prio, p));
      }
    });
  producers.clear();  // joins

  EXPECT_EQ(q.size(), n_producers * n_per_producer);
  auto last = task_priority_t::high;
  std::size_t n{};
  while (const auto t = q.dequeue()) {
    EXPECT_LE(t->priority, last);
    last = t->priority;
    ++n;
  }
  EXPECT_EQ(n, n_producers * n_per_producer);
}
