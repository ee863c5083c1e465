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

#include "proxy_config.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaq {

[[nodiscard]] auto
proxy_config::masked_url() const -> std::string {
  return mask_proxy_password(url);
}

[[nodiscard]] auto
mask_proxy_password(const std::string_view url) -> std::string {
  const auto at_pos = url.rfind('@');
  if (at_pos == std::string_view::npos)
    return std::string(url);
  const auto colon_pos = url.substr(0, at_pos).rfind(':');
  // a colon that belongs to the scheme is not a password separator
  if (colon_pos == std::string_view::npos ||
      url.substr(colon_pos).starts_with("://"))
    return std::string(url);
  return std::format("{}***{}", url.substr(0, colon_pos + 1),
                     url.substr(at_pos));
}

[[nodiscard]] auto
name_for_proxy_url(const std::string_view url) -> std::string {
  if (url.find("geonode.com") != std::string_view::npos)
    return "Geonode Residential";
  if (url.find("cloudflare") != std::string_view::npos)
    return "WARP (Cloudflare)";
  return "Custom Proxy";
}

[[nodiscard]] static inline auto
trim_copy(const std::string &s) -> std::string {
  const auto is_space = [](const unsigned char c) { return std::isspace(c); };
  const auto b = std::ranges::find_if_not(s, is_space);
  const auto e = std::find_if_not(std::crbegin(s), std::crend(s), is_space);
  if (b == std::cend(s))
    return {};
  return std::string(b, e.base());
}

[[nodiscard]] auto
make_proxy_chain(const std::vector<proxy_config> &configured,
                 const std::string &env_proxy) -> proxy_chain {
  auto &lgr = logger::instance();
  proxy_chain chain;

  const auto url = trim_copy(env_proxy);
  if (!url.empty() && url != "none" && url != "disabled") {
    proxy_config p{name_for_proxy_url(url), url};
    lgr.info("Using proxy: {}", p);
    chain.emplace_back(std::move(p));
  }
  for (const auto &p : configured)
    if (!p.url.empty())
      chain.emplace_back(p);

  chain.emplace_back(std::nullopt);
  lgr.info("Proxy chain configured: {} entries", std::size(chain));
  return chain;
}

[[nodiscard]] auto
proxy_label(const std::optional<proxy_config> &proxy) -> std::string {
  return proxy ? std::format("{}", *proxy) : std::string{"direct"};
}

}  // namespace mediaq
