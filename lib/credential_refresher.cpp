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

#include "credential_refresher.hpp"

#include "logger.hpp"

#include <chrono>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>

namespace mediaq {

[[nodiscard]] auto
refresh_signal::request_refresh(const std::string &reason,
                                const std::string &url,
                                const std::chrono::milliseconds timeout)
  -> bool {
  auto &lgr = logger::instance();
  std::unique_lock lck{mtx};
  if (closed)
    return false;
  const auto id = ++next_id;
  requests.push_back({id, reason, url, std::chrono::system_clock::now()});
  waiting.insert(id);
  lgr.warning("Credential refresh requested ({}): {} [id {}]", reason, url, id);
  requests_cv.notify_all();

  const bool answered = responses_cv.wait_for(
    lck, timeout, [&] { return closed || responses.contains(id); });

  waiting.erase(id);
  std::erase_if(requests, [&](const auto &r) { return r.id == id; });
  if (!answered || !responses.contains(id)) {
    lgr.warning("Credential refresh {} not answered within {}", id, timeout);
    return false;
  }
  const bool refreshed = responses[id];
  responses.erase(id);
  lgr.info("Credential refresh {} answered: {}", id,
           refreshed ? "refreshed" : "refused");
  return refreshed;
}

[[nodiscard]] auto
refresh_signal::next_request(const std::chrono::milliseconds timeout)
  -> std::optional<refresh_request> {
  std::unique_lock lck{mtx};
  requests_cv.wait_for(lck, timeout,
                       [this] { return closed || !requests.empty(); });
  if (requests.empty())
    return std::nullopt;
  auto r = requests.front();
  requests.pop_front();
  return r;
}

auto
refresh_signal::respond(const std::uint64_t id, const bool refreshed) -> bool {
  {
    std::lock_guard lck{mtx};
    if (!waiting.contains(id))
      return false;
    responses[id] = refreshed;
  }
  responses_cv.notify_all();
  return true;
}

auto
refresh_signal::close() -> void {
  {
    std::lock_guard lck{mtx};
    closed = true;
  }
  requests_cv.notify_all();
  responses_cv.notify_all();
}

[[nodiscard]] auto
refresh_signal::n_waiting() const -> std::size_t {
  std::lock_guard lck{mtx};
  return std::size(waiting);
}

}  // namespace mediaq
