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

#include <subprocess.hpp>

#include <logger.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

using namespace mediaq;  // NOLINT
using namespace std::chrono_literals;  // NOLINT

[[nodiscard]] static auto
sh(const std::string &script) -> std::vector<std::string> {
  return {"/bin/sh", "-c", script};
}

/// Gone, or a zombie waiting for init to reap it
[[nodiscard]] static auto
process_is_gone(const pid_t pid) -> bool {
  if (::kill(pid, 0) != 0)
    return errno == ESRCH;
  std::ifstream in(std::format("/proc/{}/stat", pid));
  std::string pid_field, comm, state;
  if (!(in >> pid_field >> comm >> state))
    return true;
  return state == "Z";
}

class subprocess_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
  }
};

TEST_F(subprocess_mock, collects_both_streams) {
  std::vector<std::string> out_lines;
  std::vector<std::string> err_lines;
  const auto on_line = [&](const std::string_view line,
                           const bool from_stderr) {
    (from_stderr ? err_lines : out_lines).emplace_back(line);
  };
  std::error_code error;
  const auto r = run_subprocess(
    sh("echo one; echo two >&2; printf 'three\\r\\n'; printf 'no newline'"),
    10s, on_line, error);
  EXPECT_FALSE(error) << error;
  EXPECT_TRUE(r.success());
  EXPECT_EQ(r.exit_status, 0);
  EXPECT_GT(r.pid, 0);
  EXPECT_EQ(out_lines,
            (std::vector<std::string>{"one", "three", "no newline"}));
  EXPECT_EQ(err_lines, std::vector<std::string>{"two"});
  EXPECT_EQ(r.stdout_text, "one\nthree\nno newline\n");
  EXPECT_EQ(r.stderr_tail, "two");
}

TEST_F(subprocess_mock, exit_status_reported) {
  std::error_code error;
  const auto r =
    run_subprocess(sh("echo 'ERROR: Private video' >&2; exit 3"), 10s, {},
                   error);
  EXPECT_FALSE(error) << error;
  EXPECT_FALSE(r.success());
  EXPECT_EQ(r.exit_status, 3);
  EXPECT_FALSE(r.timed_out);
  EXPECT_EQ(r.diagnostic(), "ERROR: Private video");
}

TEST_F(subprocess_mock, killed_by_signal) {
  std::error_code error;
  const auto r = run_subprocess(sh("kill -TERM $$"), 10s, {}, error);
  EXPECT_FALSE(error) << error;
  EXPECT_EQ(r.exit_status, 128 + SIGTERM);
}

TEST_F(subprocess_mock, timeout_kills_and_reaps) {
  const auto dir = generate_unique_dir_name();
  std::filesystem::create_directories(dir);
  const auto pid_file = (std::filesystem::path{dir} / "grandchild").string();

  std::error_code error;
  const auto start = std::chrono::steady_clock::now();
  const auto r = run_subprocess(
    sh(std::format("echo started; sleep 30 & echo $! > {}; wait", pid_file)),
    500ms, {}, error);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(error, subprocess_error_code::timeout);
  EXPECT_TRUE(r.timed_out);
  EXPECT_FALSE(r.success());
  EXPECT_EQ(r.exit_status, 128 + SIGKILL);
  EXPECT_EQ(r.stdout_text, "started\n");
  EXPECT_GE(elapsed, 500ms);
  EXPECT_LT(elapsed, 5s);

  // the child was reaped before returning
  int status{};
  EXPECT_EQ(::waitpid(r.pid, &status, WNOHANG), -1);
  EXPECT_EQ(errno, ECHILD);

  // and its process group went with it
  pid_t grandchild{};
  std::ifstream(pid_file) >> grandchild;
  ASSERT_GT(grandchild, 0);
  bool gone{false};
  for (auto i = 0; i < 50 && !gone; ++i) {
    gone = process_is_gone(grandchild);
    if (!gone)
      std::this_thread::sleep_for(100ms);
  }
  EXPECT_TRUE(gone);

  std::error_code remove_error;
  remove_directories(dir, remove_error);
}

TEST_F(subprocess_mock, spawn_failure) {
  std::error_code error;
  const auto r =
    run_subprocess({"/nonexistent/mediaq-test-binary"}, 1s, {}, error);
  EXPECT_EQ(error, subprocess_error_code::spawn_failed);
  EXPECT_FALSE(r.success());
}

TEST_F(subprocess_mock, empty_command) {
  std::error_code error;
  const auto r = run_subprocess({}, 1s, {}, error);
  EXPECT_EQ(error, subprocess_error_code::empty_command);
  EXPECT_FALSE(r.success());
}

TEST_F(subprocess_mock, stderr_tail_is_bounded) {
  std::error_code error;
  const auto r = run_subprocess(
    sh("i=0; while [ $i -lt 300 ]; do echo line$i >&2; i=$((i+1)); done"), 10s,
    {}, error);
  EXPECT_FALSE(error) << error;
  EXPECT_TRUE(r.stderr_tail.starts_with("line100\n"));
  EXPECT_TRUE(r.stderr_tail.ends_with("line299"));
}
