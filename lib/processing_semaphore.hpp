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

#ifndef LIB_PROCESSING_SEMAPHORE_HPP_
#define LIB_PROCESSING_SEMAPHORE_HPP_

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace mediaq {

/// Caps concurrent post-processing (transcoding and the like) independent
/// of how many workers are downloading
class processing_semaphore {
public:
  static constexpr std::uint32_t default_permits{2};

  /// Held for the duration of one post-processing step
  class permit {
  public:
    explicit permit(processing_semaphore &sem) : sem{&sem} { sem.acquire(); }
    permit(const permit &) = delete;
    auto
    operator=(const permit &) -> permit & = delete;
    permit(permit &&other) noexcept : sem{other.sem} { other.sem = nullptr; }
    ~permit() {
      if (sem != nullptr)
        sem->release();
    }

  private:
    processing_semaphore *sem{};
  };

  explicit processing_semaphore(
    const std::uint32_t n_permits = default_permits) :
    n_available{n_permits == 0 ? 1 : n_permits} {}

  processing_semaphore(const processing_semaphore &) = delete;
  auto
  operator=(const processing_semaphore &) -> processing_semaphore & = delete;

  [[nodiscard]] auto
  acquire_permit() -> permit {
    return permit{*this};
  }

  [[nodiscard]] auto
  available() const -> std::uint32_t {
    std::lock_guard lck{mtx};
    return n_available;
  }

private:
  auto
  acquire() -> void {
    std::unique_lock lck{mtx};
    cv.wait(lck, [this] { return n_available > 0; });
    --n_available;
  }

  auto
  release() -> void {
    {
      std::lock_guard lck{mtx};
      ++n_available;
    }
    cv.notify_one();
  }

  mutable std::mutex mtx;
  std::condition_variable cv;
  std::uint32_t n_available{};
};

}  // namespace mediaq

#endif  // LIB_PROCESSING_SEMAPHORE_HPP_
