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

#include "environment_utilities.hpp"

#include <config.h>

#include <asio.hpp>  // asio::ip::host_name();

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>  // for std::getenv
#include <format>
#include <string>
#include <system_error>
#include <tuple>

namespace mediaq {

[[nodiscard]] auto
get_time_as_string() -> std::string {
  const auto now{std::chrono::system_clock::now()};
  const std::chrono::year_month_day ymd{
    std::chrono::floor<std::chrono::days>(now)};
  const std::chrono::hh_mm_ss hms{
    std::chrono::floor<std::chrono::seconds>(now) -
    std::chrono::floor<std::chrono::days>(now)};
  return std::format("{:%F} {:%T}", ymd, hms);
}

[[nodiscard]] auto
get_epoch_seconds() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::seconds>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

[[nodiscard]] auto
get_hostname() -> std::tuple<std::string, std::error_code> {
  std::error_code error;
  const auto host = asio::ip::host_name(error);
  if (error)
    return {std::string{}, error};
  return {host, std::error_code{}};
}

[[nodiscard]] auto
get_env(const std::string &name) -> std::string {
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  const auto value = std::getenv(name.data());
  return value == nullptr ? std::string{} : std::string{value};
}

[[nodiscard]] auto
generate_uuid() -> std::string {
  // a generator is not safe to share between threads
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

[[nodiscard]] auto
get_version() -> std::string {
  return VERSION;
}

}  // namespace mediaq
