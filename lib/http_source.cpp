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

#include "http_source.hpp"

#include "download.hpp"
#include "download_progress.hpp"
#include "http_client.hpp"
#include "http_error_code.hpp"
#include "http_header.hpp"
#include "logger.hpp"
#include "url.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <system_error>

namespace mediaq {

[[nodiscard]] auto
http_source::supports(const std::string &url) const -> bool {
  const auto u = parse_url(url);
  if (!u)
    return false;
  const auto ext = path_extension(u->path);
  return std::ranges::find(media_extensions, ext) !=
         std::cend(media_extensions);
}

[[nodiscard]] auto
http_source::metadata(const std::string &url,
                      std::error_code &error) const -> media_metadata {
  const auto u = parse_url(url);
  if (!u) {
    error = source_error_code::unsupported_url;
    return {};
  }
  const auto filename = std::filesystem::path{u->path}.filename();
  const auto title = percent_decode(filename.stem().string());
  if (title.empty()) {
    error = source_error_code::empty_title;
    return {};
  }
  return {title, {}};
}

[[nodiscard]] auto
http_source::estimate_size(const std::string &url) const
  -> std::optional<std::uint64_t> {
  std::error_code error;
  const auto header = download_header_http(url, timeout, error);
  if (error || header.content_length == 0) {
    logger::instance().debug("No size estimate for {}: {}", url, error);
    return std::nullopt;
  }
  return header.content_length;
}

[[nodiscard]] auto
http_source::download(const download_request &request,
                      progress_channel &progress,
                      std::error_code &error) const -> download_output {
  namespace fs = std::filesystem;
  auto &lgr = logger::instance();

  if (!supports(request.url)) {
    error = source_error_code::unsupported_url;
    return {};
  }

  download_progress dp{&progress};
  http_request_options options;
  options.timeout = timeout;
  options.max_file_size = request.max_file_size;
  options.progress = &dp;

  // a partial file from an interrupted transfer is resumed
  std::error_code size_error;
  const auto existing = fs::file_size(request.output_path, size_error);
  if (!size_error && existing > 0) {
    options.offset = existing;
    lgr.info("Resuming {} at byte {}", request.url, existing);
  }

  auto header = download_http(request.url, request.output_path, options, error);
  if (error == http_error_code::bad_status && header.status() == 416 &&
      options.offset > 0) {
    // the server will not serve our range; start over
    lgr.warning("Range not satisfiable for {}; restarting", request.url);
    error.clear();
    options.offset = 0;
    dp.reset();
    header = download_http(request.url, request.output_path, options, error);
  }
  if (error) {
    lgr.warning("HTTP download failed {}: {} (status {})", request.url, error,
                header.status_code);
    if (error == http_error_code::file_too_large ||
        error == http_error_code::bad_status) {
      std::error_code remove_error;
      fs::remove(request.output_path, remove_error);
    }
    download_output failed;
    failed.diagnostic =
      std::format("{}: {} (status {})", request.url, error.message(),
                  header.status_code);
    return failed;
  }

  download_output out;
  out.file_path = request.output_path;
  out.file_size = fs::file_size(out.file_path, error);
  if (error) {
    error = source_error_code::output_file_missing;
    return {};
  }

  if (header.content_type.starts_with("audio/") ||
      header.content_type.starts_with("video/"))
    out.mime_hint = header.content_type;
  else {
    const auto u = parse_url(request.url);
    auto ext = u ? path_extension(u->path) : std::string{};
    if (ext.empty() && !header.filename.empty())
      ext = path_extension(header.filename);
    out.mime_hint = mime_type_for_extension(ext);
  }
  if (!header.filename.empty())
    lgr.debug("Server filename for {}: {}", request.url, header.filename);

  lgr.info("HTTP download complete {} ({} bytes)", out.file_path,
           out.file_size);
  return out;
}

}  // namespace mediaq
