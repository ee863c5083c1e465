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

#ifndef LIB_CREDENTIAL_REFRESHER_HPP_
#define LIB_CREDENTIAL_REFRESHER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace mediaq {

/// Something that can be asked to renew the stored session credentials
class credential_refresher {
public:
  static constexpr auto default_timeout = std::chrono::seconds{20};

  virtual ~credential_refresher() = default;

  /// Block until the credentials are renewed (true), refused (false), or
  /// `timeout` expires, which counts as refused
  [[nodiscard]] virtual auto
  request_refresh(const std::string &reason, const std::string &url,
                  const std::chrono::milliseconds timeout) -> bool = 0;
};

struct refresh_request {
  std::uint64_t id{};
  std::string reason;
  std::string url;
  std::chrono::system_clock::time_point requested_at{};
};

/// Mailbox between download workers asking for new credentials and the
/// collaborator that can provide them (an operator, a browser session
/// exporter). Each request is answered at most once.
class refresh_signal : public credential_refresher {
public:
  refresh_signal() = default;

  // clang-format off
  refresh_signal(const refresh_signal &) = delete;
  auto operator=(const refresh_signal &) -> refresh_signal & = delete;
  // clang-format on

  [[nodiscard]] auto
  request_refresh(const std::string &reason, const std::string &url,
                  const std::chrono::milliseconds timeout) -> bool override;

  /// Collaborator side: wait up to `timeout` for a request
  [[nodiscard]] auto
  next_request(const std::chrono::milliseconds timeout)
    -> std::optional<refresh_request>;

  /// Collaborator side: answer request `id`; false if nobody is waiting
  /// for it any more
  auto
  respond(const std::uint64_t id, const bool refreshed) -> bool;

  /// Refuse everything from now on and wake all waiters
  auto
  close() -> void;

  [[nodiscard]] auto
  n_waiting() const -> std::size_t;

private:
  mutable std::mutex mtx;
  std::condition_variable requests_cv;
  std::condition_variable responses_cv;
  std::deque<refresh_request> requests;
  std::unordered_set<std::uint64_t> waiting;
  std::unordered_map<std::uint64_t, bool> responses;
  std::uint64_t next_id{};
  bool closed{false};
};

}  // namespace mediaq

template <>
struct std::formatter<mediaq::refresh_request> : std::formatter<std::string> {
  auto
  format(const mediaq::refresh_request &r, auto &ctx) const {
    return std::formatter<std::string>::format(
      std::format("refresh {} ({}): {}", r.id, r.reason, r.url), ctx);
  }
};

#endif  // LIB_CREDENTIAL_REFRESHER_HPP_
