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

#ifndef LIB_DOWNLOAD_PROGRESS_HPP_
#define LIB_DOWNLOAD_PROGRESS_HPP_

#include "source_progress.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>

namespace mediaq {

/// Coalesces progress so the listener only hears about an attempt when the
/// percent has advanced by at least `min_step`, or has reached 100.
struct download_progress {
  static constexpr std::uint8_t default_min_step{5};

  progress_channel *channel{};
  std::uint8_t min_step{default_min_step};
  std::optional<std::uint8_t> prev_percent;
  std::uint64_t total_size{};
  std::chrono::steady_clock::time_point started{};

  download_progress() = default;
  explicit download_progress(progress_channel *channel,
                             const std::uint8_t min_step = default_min_step) :
    channel{channel}, min_step{min_step},
    started{std::chrono::steady_clock::now()} {}

  /// Start over for a new attempt; the next update is always emitted
  auto
  reset() -> void {
    prev_percent.reset();
    total_size = 0;
    started = std::chrono::steady_clock::now();
  }

  /// Set the size of the file being downloaded; need a setter because we
  /// usually don't know the size when the transfer starts
  auto
  set_total_size(const std::uint64_t sz) -> void {
    total_size = sz;
  }

  /// Forward `p` if it passes the threshold; returns true if sent
  auto
  update(const source_progress &p) -> bool {
    if (channel == nullptr)
      return false;
    const bool advanced =
      !prev_percent || p.percent >= *prev_percent + min_step ||
      (p.percent == 100 && *prev_percent < 100);
    if (!advanced)
      return false;
    prev_percent = p.percent;
    return channel->send(p);
  }

  /// Byte-count form used by the HTTP backend
  auto
  update_bytes(const std::uint64_t bytes_downloaded) -> bool {
    if (total_size == 0)
      return false;
    const auto ratio = static_cast<double>(bytes_downloaded) / total_size;
    const auto percent =
      static_cast<std::uint8_t>(std::clamp(100.0 * ratio, 0.0, 100.0));
    source_progress p;
    p.percent = percent;
    p.downloaded_bytes = bytes_downloaded;
    p.total_bytes = total_size;
    const auto elapsed = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - started)
                           .count();
    if (elapsed > 0.0) {
      const auto speed = static_cast<double>(bytes_downloaded) / elapsed;
      p.speed_bytes_sec = static_cast<std::uint64_t>(speed);
      if (speed > 0.0 && total_size >= bytes_downloaded)
        p.eta_seconds =
          static_cast<std::uint64_t>((total_size - bytes_downloaded) / speed);
    }
    return update(p);
  }
};

}  // namespace mediaq

#endif  // LIB_DOWNLOAD_PROGRESS_HPP_
