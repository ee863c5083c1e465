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

#include "command_classify.hpp"

static constexpr auto about = R"(
classify an extractor failure
)";

static constexpr auto description = R"(
Read the diagnostic text of a failed extractor run (its stderr) from a file
or from standard input and report how the download service would treat it:
the kind of failure, the message a user would see, whether an operator
should be notified and what the operator can do about it. With --json the
same report is printed as one JSON document.
)";

static constexpr auto examples = R"(
Examples:

yt-dlp https://youtu.be/xyz 2> err.txt; mediaq classify -i err.txt
echo "HTTP Error 429: Too Many Requests" | mediaq classify
)";

#include "cli_common.hpp"
#include "error_kind.hpp"

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <print>
#include <sstream>
#include <string>
#include <string_view>

auto
command_classify_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto command = "classify";
  static const auto usage =
    std::format("Usage: mediaq {} [options]", rstrip(command));
  static const auto about_msg =
    std::format("mediaq {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  std::string input_file;
  std::string text;
  bool write_json{false};

  CLI::App app{about_msg};
  argv = app.ensure_utf8(argv);
  setup_app(app, usage, description_msg, argc);
  // clang-format off
  const auto input_opt =
    app.add_option("-i,--input", input_file, "file with diagnostic text")
    ->check(CLI::ExistingFile);
  app.add_option("-t,--text", text, "diagnostic text given directly")
    ->excludes(input_opt);
  app.add_flag("-j,--json", write_json, "output in JSON format");
  // clang-format on
  CLI11_PARSE(app, argc, argv);

  if (text.empty()) {
    std::ifstream file_in;
    if (!input_file.empty()) {
      file_in.open(input_file);
      if (!file_in) {
        std::println(std::cerr, "Error: failed to open {}", input_file);
        return EXIT_FAILURE;
      }
    }
    std::istream &in = input_file.empty() ? std::cin : file_in;
    std::ostringstream buf;
    buf << in.rdbuf();
    text = buf.str();
  }

  const auto kind = mediaq::classify_error(text);
  const auto notify = mediaq::should_notify_admin(kind);
  const auto fixes = mediaq::fix_recommendations(kind);

  if (write_json) {
    static constexpr auto n_indent = 4;
    const nlohmann::json data{
      // clang-format off
      {"kind", mediaq::to_name(kind)},
      {"user_message", mediaq::user_message(kind)},
      {"notify_admin", notify},
      {"fix_recommendations", fixes},
      // clang-format on
    };
    std::println("{}", data.dump(n_indent));
    return EXIT_SUCCESS;
  }

  std::println("kind: {}", kind);
  std::println("user message: {}", mediaq::user_message(kind));
  std::println("notify admin: {}", notify);
  if (!fixes.empty()) {
    std::println("fix recommendations:");
    for (const auto &fix : fixes)
      std::println("  - {}", fix);
  }
  return EXIT_SUCCESS;
}
