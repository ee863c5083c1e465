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

#include "subprocess.hpp"

#include "logger.hpp"
#include "ring_buffer.hpp"

#include <asio.hpp>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

extern char **environ;  // NOLINT

namespace mediaq {

namespace {

using namespace std::chrono_literals;

static constexpr auto poll_interval = 100ms;
// time allowed for the pipes to drain after the child exits; a grandchild
// holding them open longer is killed with the group
static constexpr auto drain_grace = 2s;
static constexpr std::size_t max_stdout_size{1024 * 1024};

/// Both ends of a pipe, closed on scope exit unless released
struct pipe_fds {
  int read_end{-1};
  int write_end{-1};

  pipe_fds() = default;
  pipe_fds(const pipe_fds &) = delete;
  auto
  operator=(const pipe_fds &) -> pipe_fds & = delete;

  ~pipe_fds() {
    close_read();
    close_write();
  }

  [[nodiscard]] auto
  open() -> bool {
    int fds[2]{-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0)
      return false;
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }

  [[nodiscard]] auto
  release_read() -> int {
    return std::exchange(read_end, -1);
  }

  auto
  close_read() -> void {
    if (read_end >= 0)
      ::close(std::exchange(read_end, -1));
  }

  auto
  close_write() -> void {
    if (write_end >= 0)
      ::close(std::exchange(write_end, -1));
  }
};

/// Kills the process group and reaps the child unless it was reaped
struct child_guard {
  pid_t pid{-1};
  bool reaped{false};
  int wstatus{};

  child_guard() = default;
  child_guard(const child_guard &) = delete;
  auto
  operator=(const child_guard &) -> child_guard & = delete;

  ~child_guard() {
    if (pid > 0 && !reaped)
      kill_and_reap();
  }

  auto
  kill_and_reap() -> void {
    (void)::kill(-pid, SIGKILL);
    while (::waitpid(pid, &wstatus, 0) == -1 && errno == EINTR)
      ;
    reaped = true;
  }
};

[[nodiscard]] auto
decode_wait_status(const int wstatus) -> int {
  if (WIFEXITED(wstatus))
    return WEXITSTATUS(wstatus);
  if (WIFSIGNALED(wstatus))
    return 128 + WTERMSIG(wstatus);
  return -1;
}

class line_reader {
public:
  using sink_type = std::function<void(std::string_view)>;

  line_reader(asio::io_context &ioc, const int fd, sink_type sink) :
    sd{ioc, fd}, sink{std::move(sink)} {}

  auto
  start() -> void {
    asio::async_read_until(
      sd, asio::dynamic_buffer(buf), '\n',
      [this](const std::error_code ec, const std::size_t n) {
        if (ec) {
          // the last line may lack a newline
          if (!buf.empty())
            emit(buf);
          buf.clear();
          done = true;
          return;
        }
        emit(std::string_view(buf).substr(0, n - 1));
        buf.erase(0, n);
        start();
      });
  }

  auto
  close() -> void {
    std::error_code ec;
    (void)sd.close(ec);
  }

  [[nodiscard]] auto
  is_done() const -> bool {
    return done;
  }

private:
  auto
  emit(std::string_view line) -> void {
    if (line.ends_with('\r'))
      line.remove_suffix(1);
    sink(line);
  }

  asio::posix::stream_descriptor sd;
  sink_type sink;
  std::string buf;
  bool done{false};
};

class subprocess_monitor {
public:
  subprocess_monitor(asio::io_context &ioc, child_guard &child,
                     const int out_fd, const int err_fd,
                     const std::chrono::milliseconds timeout,
                     const subprocess_line_handler &on_line,
                     subprocess_result &result) :
    child{child}, result{result}, on_line{on_line},
    out_reader{ioc, out_fd, [this](auto line) { handle_line(line, false); }},
    err_reader{ioc, err_fd, [this](auto line) { handle_line(line, true); }},
    timer{ioc}, deadline{std::chrono::steady_clock::now() + timeout} {}

  auto
  start() -> void {
    out_reader.start();
    err_reader.start();
    schedule_poll();
  }

  [[nodiscard]] auto
  get_stderr_tail() const -> std::string {
    return join_lines(stderr_tail);
  }

  [[nodiscard]] auto
  get_wait_error() const -> std::error_code {
    return wait_error;
  }

private:
  auto
  handle_line(const std::string_view line, const bool from_stderr) -> void {
    if (from_stderr)
      stderr_tail.push_back(std::string(line));
    else if (std::size(result.stdout_text) < max_stdout_size) {
      result.stdout_text += line;
      result.stdout_text += '\n';
    }
    if (on_line)
      on_line(line, from_stderr);
  }

  auto
  schedule_poll() -> void {
    timer.expires_after(poll_interval);
    timer.async_wait([this](const std::error_code ec) {
      if (!ec)
        poll_child();
    });
  }

  auto
  close_readers() -> void {
    out_reader.close();
    err_reader.close();
  }

  auto
  poll_child() -> void {
    const auto now = std::chrono::steady_clock::now();
    if (!child.reaped) {
      const auto r = ::waitpid(child.pid, &child.wstatus, WNOHANG);
      if (r == child.pid) {
        child.reaped = true;
        reaped_at = now;
        result.exit_status = decode_wait_status(child.wstatus);
      }
      else if (r == -1 && errno != EINTR) {
        // nothing left to reap, e.g., SIGCHLD is ignored
        wait_error = std::error_code(errno, std::system_category());
        child.reaped = true;
        reaped_at = now;
      }
    }

    if (!child.reaped && now >= deadline) {
      result.timed_out = true;
      child.kill_and_reap();
      result.exit_status = decode_wait_status(child.wstatus);
      close_readers();
      return;
    }

    const bool drained = out_reader.is_done() && err_reader.is_done();
    if (child.reaped && drained)
      return;  // nothing else pending; the io_context runs out of work

    if (child.reaped && (now >= reaped_at + drain_grace || now >= deadline)) {
      // a grandchild still holds the pipes
      (void)::kill(-child.pid, SIGKILL);
      close_readers();
      return;
    }
    schedule_poll();
  }

  child_guard &child;
  subprocess_result &result;
  const subprocess_line_handler &on_line;
  ring_buffer<std::string> stderr_tail{subprocess_result::stderr_tail_lines};
  line_reader out_reader;
  line_reader err_reader;
  asio::steady_timer timer;
  std::chrono::steady_clock::time_point deadline{};
  std::chrono::steady_clock::time_point reaped_at{};
  std::error_code wait_error{};
};

[[nodiscard]] auto
spawn_child(const std::vector<std::string> &command, pipe_fds &out,
            pipe_fds &err, pid_t &pid) -> int {
  std::vector<char *> argv;
  argv.reserve(std::size(command) + 1);
  for (const auto &arg : command)
    argv.push_back(const_cast<char *>(arg.c_str()));  // NOLINT
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out.write_end, STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err.write_end, STDERR_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  // own process group so that a timeout can kill the whole tree
  posix_spawnattr_setpgroup(&attr, 0);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  sigset_t no_signals;
  sigemptyset(&no_signals);
  posix_spawnattr_setsigmask(&attr, &no_signals);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP |
                                    POSIX_SPAWN_SETSIGDEF |
                                    POSIX_SPAWN_SETSIGMASK);

  const int rc =
    ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);

  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&actions);
  return rc;
}

}  // namespace

[[nodiscard]] auto
run_subprocess(const std::vector<std::string> &command,
               const std::chrono::milliseconds timeout,
               const subprocess_line_handler &on_line,
               std::error_code &error) -> subprocess_result {
  auto &lgr = logger::instance();
  subprocess_result result;

  if (command.empty()) {
    error = subprocess_error_code::empty_command;
    return result;
  }

  pipe_fds out;
  pipe_fds err;
  if (!out.open() || !err.open()) {
    lgr.error("Failed to create pipes for {}: {}", command.front(),
              std::error_code(errno, std::system_category()));
    error = subprocess_error_code::pipe_failed;
    return result;
  }

  child_guard child;
  const int rc = spawn_child(command, out, err, child.pid);
  if (rc != 0) {
    lgr.error("Failed to spawn {}: {}", command.front(),
              std::error_code(rc, std::system_category()));
    child.pid = -1;
    error = subprocess_error_code::spawn_failed;
    return result;
  }
  result.pid = child.pid;
  lgr.debug("Spawned {} (pid {})", command.front(), child.pid);

  // only the child writes; without this no EOF ever arrives
  out.close_write();
  err.close_write();

  asio::io_context ioc;
  subprocess_monitor monitor(ioc, child, out.release_read(),
                             err.release_read(), timeout, on_line, result);
  monitor.start();
  ioc.run();

  result.stderr_tail = monitor.get_stderr_tail();
  if (result.timed_out) {
    lgr.warning("Killed {} (pid {}) after {}", command.front(), result.pid,
                timeout);
    error = subprocess_error_code::timeout;
  }
  else if (const auto wait_error = monitor.get_wait_error(); wait_error) {
    lgr.error("Failed waiting for {} (pid {}): {}", command.front(),
              result.pid, wait_error);
    error = subprocess_error_code::wait_failed;
  }
  return result;
}

}  // namespace mediaq
