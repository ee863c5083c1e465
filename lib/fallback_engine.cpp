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

#include "fallback_engine.hpp"

#include "credential_refresher.hpp"
#include "download.hpp"
#include "error_kind.hpp"
#include "logger.hpp"
#include "proxy_config.hpp"
#include "tier_config.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

namespace mediaq {

[[nodiscard]] auto
is_proxy_addressable(const error_kind kind,
                     const std::string_view diagnostic) -> bool {
  return kind != error_kind::bot_detection &&
         is_proxy_related(kind, diagnostic);
}

[[nodiscard]] static auto
classify_attempt(const attempt_result &r) -> error_kind {
  // a killed extractor tells us nothing about why it was stuck
  return r.timed_out ? error_kind::unknown : classify_error(r.diagnostic);
}

[[nodiscard]] static auto
is_tier2_candidate(const error_kind kind) -> bool {
  return kind == error_kind::invalid_cookies ||
         kind == error_kind::bot_detection || kind == error_kind::network_error;
}

[[nodiscard]] auto
fallback_engine::run(const download_request &request,
                     const std::array<tier_config, n_tiers> &tiers,
                     const proxy_chain &chain,
                     progress_channel &progress) -> fallback_result {
  auto &lgr = logger::instance();

  fallback_result res;
  download_progress dp{&progress};
  error_kind last_kind{error_kind::unknown};

  const auto attempt = [&](const tier_config &t,
                           const std::optional<proxy_config> &proxy) {
    if (res.stats.n_attempts() > 0) {
      std::error_code cleanup_error;
      const auto n_removed =
        cleanup_partial_download(request.output_path, cleanup_error);
      ++res.stats.cleanups;
      if (cleanup_error)
        lgr.warning("Cleanup before retry failed for {}: {}",
                    request.output_path, cleanup_error);
      else if (n_removed > 0)
        lgr.debug("Removed {} partial files for {}", n_removed,
                  request.output_path);
    }
    dp.reset();
    ++res.stats.tier_attempts[tier_index(t.tier)];
    lgr.info("Attempt {} via {}: {}", t.tier, proxy_label(proxy), request.url);
    auto r = runner.run(t, proxy, dp);
    if (!r.success) {
      last_kind = classify_attempt(r);
      res.diagnostic = r.diagnostic;
      lgr.warning("{} via {} failed: {}", t.tier, proxy_label(proxy),
                  last_kind);
    }
    return r;
  };

  const auto succeed = [&](const tier_config &t,
                           const std::optional<proxy_config> &proxy) {
    res.error.clear();
    res.diagnostic.clear();
    res.proxy_used = proxy;
    res.tier_used = t.tier;
    lgr.info("Download succeeded with {} via {} ({})", t.tier,
             proxy_label(proxy), res.stats);
    return res;
  };

  const auto n_proxies = std::size(chain);
  for (std::size_t i = 0; i < n_proxies; ++i) {
    const auto &proxy = chain[i];
    const bool more_proxies = i + 1 < n_proxies;
    ++res.stats.proxies_tried;
    bool refreshed_here{false};

    bool restart{true};
    while (restart) {
      restart = false;

      const auto r1 = attempt(tiers[0], proxy);
      if (r1.success)
        return succeed(tiers[0], proxy);
      const auto kind1 = last_kind;

      if (more_proxies && is_proxy_addressable(kind1, r1.diagnostic)) {
        lgr.warning("Proxy-related failure on {}; trying next proxy",
                    proxy_label(proxy));
        break;
      }

      auto kind2 = error_kind::ok;
      if (is_tier2_candidate(kind1)) {
        if (kind1 == error_kind::bot_detection)
          lgr.warning("Bot detection without credentials via {}",
                      proxy_label(proxy));
        const auto r2 = attempt(tiers[1], proxy);
        if (r2.success)
          return succeed(tiers[1], proxy);
        kind2 = last_kind;

        if (kind2 == error_kind::invalid_cookies && refresher != nullptr &&
            !refreshed_here) {
          refreshed_here = true;
          ++res.stats.refreshes;
          if (refresher->request_refresh(std::format("{}", kind2), request.url,
                                         refresh_timeout)) {
            lgr.info("Credentials refreshed; restarting {} at tier 1",
                     proxy_label(proxy));
            std::this_thread::sleep_for(refresh_settle);
            restart = true;
            continue;
          }
        }
        else if (kind2 == error_kind::bot_detection)
          lgr.error("Bot detection with credentials via {}: proxy identity "
                    "is likely burned",
                    proxy_label(proxy));
      }

      if (kind1 == error_kind::postprocessing_error ||
          kind2 == error_kind::postprocessing_error) {
        const auto r3 = attempt(tiers[2], proxy);
        if (r3.success) {
          res.stats.postprocessing_skipped = true;
          lgr.warning("Post-processing skipped for {}", request.url);
          return succeed(tiers[2], proxy);
        }
      }

      if (more_proxies)
        lgr.warning("All tiers failed on {}; trying next proxy",
                    proxy_label(proxy));
    }
  }

  lgr.error("All {} proxies failed for {}: {} ({})", n_proxies, request.url,
            last_kind, res.stats);
  res.error = last_kind;
  return res;
}

}  // namespace mediaq
