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

#ifndef LIB_FALLBACK_ENGINE_HPP_
#define LIB_FALLBACK_ENGINE_HPP_

#include "download.hpp"
#include "download_progress.hpp"
#include "error_kind.hpp"
#include "proxy_config.hpp"
#include "source_progress.hpp"
#include "tier_config.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mediaq {

class credential_refresher;

/// Outcome of one extractor run
struct attempt_result {
  bool success{false};
  bool timed_out{false};
  /// Diagnostic text of a failed run (stderr tail, then stdout)
  std::string diagnostic;
};

/// Runs one extraction attempt. The engine owns the escalation policy;
/// implementations only execute what they are given.
class attempt_runner {
public:
  virtual ~attempt_runner() = default;

  [[nodiscard]] virtual auto
  run(const tier_config &tier, const std::optional<proxy_config> &proxy,
      download_progress &progress) -> attempt_result = 0;
};

struct fallback_stats {
  std::array<std::uint32_t, n_tiers> tier_attempts{};
  std::uint32_t proxies_tried{};
  std::uint32_t refreshes{};
  std::uint32_t cleanups{};
  bool postprocessing_skipped{false};

  [[nodiscard]] auto
  n_attempts() const -> std::uint32_t {
    return tier_attempts[0] + tier_attempts[1] + tier_attempts[2];
  }
};

struct fallback_result {
  /// Empty on success; otherwise an error_kind
  std::error_code error{};
  std::string diagnostic;
  fallback_stats stats;
  std::optional<proxy_config> proxy_used;
  tier_t tier_used{tier_t::unauthenticated};
};

/// Proxy chain crossed with the three tiers. For each proxy: tier 1; on
/// failures that a different network path could fix, the next proxy; on
/// credential, bot or ambiguous network failures, tier 2 (with one
/// credential refresh per proxy that restarts at tier 1); on
/// post-processing failures, tier 3. Partial output is removed before
/// every attempt but the first.
class fallback_engine {
public:
  static constexpr auto default_refresh_settle = std::chrono::seconds{3};

  fallback_engine(attempt_runner &runner, credential_refresher *refresher,
                  const std::chrono::milliseconds refresh_timeout,
                  const std::chrono::milliseconds refresh_settle =
                    default_refresh_settle) :
    runner{runner}, refresher{refresher}, refresh_timeout{refresh_timeout},
    refresh_settle{refresh_settle} {}

  [[nodiscard]] auto
  run(const download_request &request,
      const std::array<tier_config, n_tiers> &tiers, const proxy_chain &chain,
      progress_channel &progress) -> fallback_result;

private:
  attempt_runner &runner;
  credential_refresher *refresher{};
  std::chrono::milliseconds refresh_timeout{};
  std::chrono::milliseconds refresh_settle{};
};

/// Failures worth moving to the next proxy for: network failures and
/// anything mentioning the proxy path, except bot and cookie failures
[[nodiscard]] auto
is_proxy_addressable(const error_kind kind,
                     const std::string_view diagnostic) -> bool;

}  // namespace mediaq

template <>
struct std::formatter<mediaq::fallback_stats> : std::formatter<std::string> {
  auto
  format(const mediaq::fallback_stats &s, auto &ctx) const {
    return std::formatter<std::string>::format(
      std::format("tiers={}/{}/{} proxies={} refreshes={} cleanups={}",
                  s.tier_attempts[0], s.tier_attempts[1], s.tier_attempts[2],
                  s.proxies_tried, s.refreshes, s.cleanups),
      ctx);
  }
};

#endif  // LIB_FALLBACK_ENGINE_HPP_
