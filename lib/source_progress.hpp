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

#ifndef LIB_SOURCE_PROGRESS_HPP_
#define LIB_SOURCE_PROGRESS_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <format>
#include <iterator>  // for std::size
#include <mutex>
#include <new>  // for std::bad_alloc
#include <optional>
#include <string>

namespace mediaq {

/// A point-in-time snapshot of one transfer. Percent can go back to zero
/// when a new attempt starts.
struct source_progress {
  std::uint8_t percent{};
  std::optional<std::uint64_t> speed_bytes_sec;
  std::optional<std::uint64_t> eta_seconds;
  std::optional<std::uint64_t> downloaded_bytes;
  std::optional<std::uint64_t> total_bytes;

  auto
  operator==(const source_progress &) const -> bool = default;
};

/// Unbounded multi-producer single-consumer channel for progress events.
/// Sending never blocks; once closed, sends are dropped.
class progress_channel {
public:
  progress_channel() = default;

  // clang-format off
  progress_channel(const progress_channel &) = delete;
  auto operator=(const progress_channel &) -> progress_channel & = delete;
  // clang-format on

  auto
  send(const source_progress &p) noexcept -> bool {
    {
      std::lock_guard lck{mtx};
      if (closed)
        return false;
      try {
        events.push_back(p);
      }
      catch (const std::bad_alloc &) {
        return false;  // progress is advisory; drop on allocation failure
      }
    }
    cv.notify_one();
    return true;
  }

  [[nodiscard]] auto
  try_receive() -> std::optional<source_progress> {
    std::lock_guard lck{mtx};
    return pop_front();
  }

  /// Wait up to `timeout` for an event; nothing if the channel is closed
  /// and drained or the wait expires
  [[nodiscard]] auto
  receive_for(const std::chrono::milliseconds timeout)
    -> std::optional<source_progress> {
    std::unique_lock lck{mtx};
    cv.wait_for(lck, timeout, [this] { return closed || !events.empty(); });
    return pop_front();
  }

  auto
  close() noexcept -> void {
    {
      std::lock_guard lck{mtx};
      closed = true;
    }
    cv.notify_all();
  }

  [[nodiscard]] auto
  is_closed() const -> bool {
    std::lock_guard lck{mtx};
    return closed;
  }

  [[nodiscard]] auto
  size() const -> std::size_t {
    std::lock_guard lck{mtx};
    return std::size(events);
  }

private:
  [[nodiscard]] auto
  pop_front() -> std::optional<source_progress> {
    if (events.empty())
      return std::nullopt;
    auto p = events.front();
    events.pop_front();
    return p;
  }

  mutable std::mutex mtx;
  std::condition_variable cv;
  std::deque<source_progress> events;
  bool closed{false};
};

}  // namespace mediaq

template <>
struct std::formatter<mediaq::source_progress> : std::formatter<std::string> {
  auto
  format(const mediaq::source_progress &p, auto &ctx) const {
    const auto opt = [](const auto &x) {
      return x ? std::to_string(*x) : std::string{"NA"};
    };
    return std::formatter<std::string>::format(
      std::format("{}% speed={} eta={} bytes={}/{}", p.percent,
                  opt(p.speed_bytes_sec), opt(p.eta_seconds),
                  opt(p.downloaded_bytes), opt(p.total_bytes)),
      ctx);
  }
};

#endif  // LIB_SOURCE_PROGRESS_HPP_
