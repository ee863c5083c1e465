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

#ifndef LIB_PROGRESS_PARSER_HPP_
#define LIB_PROGRESS_PARSER_HPP_

#include "source_progress.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace mediaq {

/// Parse one line of extractor output, e.g.
///   [download]  45.2% of 10.00MiB at 500.00KiB/s ETA 00:10
/// Lines without "[download]" and a percent sign give nothing.
[[nodiscard]] auto
parse_progress(const std::string_view line) -> std::optional<source_progress>;

/// Parse sizes like "10.00MiB", "512KiB", "1.2GB" or "300B" into bytes
[[nodiscard]] auto
parse_size(const std::string_view s) -> std::optional<std::uint64_t>;

/// Parse "mm:ss" or "hh:mm:ss" into seconds
[[nodiscard]] auto
parse_eta(const std::string_view s) -> std::optional<std::uint64_t>;

}  // namespace mediaq

#endif  // LIB_PROGRESS_PARSER_HPP_
