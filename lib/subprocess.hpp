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

#ifndef LIB_SUBPROCESS_HPP_
#define LIB_SUBPROCESS_HPP_

#include <sys/types.h>  // for pid_t

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace mediaq {

struct subprocess_result {
  static constexpr std::size_t stderr_tail_lines{200};

  pid_t pid{};
  /// Exit code; 128 + signal number if the child was killed by a signal
  int exit_status{-1};
  bool timed_out{false};
  std::string stderr_tail;
  std::string stdout_text;

  [[nodiscard]] auto
  success() const -> bool {
    return !timed_out && exit_status == 0;
  }

  /// Everything the child said about a failure, stdout after stderr
  [[nodiscard]] auto
  diagnostic() const -> std::string {
    return stdout_text.empty() ? stderr_tail
                               : stderr_tail + '\n' + stdout_text;
  }
};

/// Called for every complete line the child writes; `from_stderr` tells
/// the streams apart
using subprocess_line_handler =
  std::function<void(const std::string_view line, const bool from_stderr)>;

/// Run `command` (argv[0] is looked up in PATH) in a new process group with
/// stdin from /dev/null. Both output streams are read line by line. The
/// child is polled rather than waited on, so when `timeout` expires the
/// whole group is killed with SIGKILL and the child is reaped before this
/// returns. On timeout the error is subprocess_error_code::timeout and the
/// result carries whatever output was collected.
[[nodiscard]] auto
run_subprocess(const std::vector<std::string> &command,
               const std::chrono::milliseconds timeout,
               const subprocess_line_handler &on_line,
               std::error_code &error) -> subprocess_result;

}  // namespace mediaq

/// @brief Enum for error codes related to running child processes
enum class subprocess_error_code : std::uint8_t {
  ok = 0,
  empty_command = 1,
  pipe_failed = 2,
  spawn_failed = 3,
  wait_failed = 4,
  timeout = 5,
};

template <>
struct std::is_error_code_enum<subprocess_error_code> : public std::true_type {
};

struct subprocess_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "subprocess";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "empty command"s;
    case 2: return "failed to create pipe"s;
    case 3: return "failed to spawn process"s;
    case 4: return "failed to wait for process"s;
    case 5: return "process timed out"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(subprocess_error_code e) -> std::error_code {
  static auto category = subprocess_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_SUBPROCESS_HPP_
