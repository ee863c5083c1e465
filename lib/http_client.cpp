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

#include "http_client.hpp"

#include "download_progress.hpp"
#include "environment_utilities.hpp"
#include "http_error_code.hpp"
#include "http_header.hpp"
#include "logger.hpp"
#include "url.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>  // IWYU pragma: keep

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

namespace mediaq {

using namespace std::chrono_literals;

template <typename derived> class http_client_base {
public:
  static constexpr std::size_t chunk_size{64 * 1024};

  http_client_base(const url_parts &u, const http_request_options &options,
                   const std::string &outfile, const bool header_only) :
    resolver{ioc}, u{u}, outfile{outfile}, header_only{header_only},
    duration{options.timeout}, watchdog_timer{ioc}, offset{options.offset},
    max_file_size{options.max_file_size}, progress{options.progress},
    method{options.method}, body{options.body},
    extra_headers{options.headers} {}

  auto
  download() -> void {
    resolve();
    ioc.run();
  }

  [[nodiscard]] auto
  get_status() const -> std::error_code {
    return status;
  }

  [[nodiscard]] auto
  get_header() const -> http_header {
    return header;
  }

  // private:
  auto
  reset_deadline() -> void {
    deadline = std::chrono::steady_clock::now() + duration;
  }

  auto
  watchdog() -> void {
    watchdog_timer.expires_at(deadline);
    watchdog_timer.async_wait([this](auto) {
      if (!is_stopped()) {
        if (deadline < std::chrono::steady_clock::now())
          stop(http_error_code::inactive_timeout);
        else
          watchdog();
      }
    });
  }

  [[nodiscard]] auto
  is_stopped() const -> bool {
    return !self().get_sock().is_open();
  }

  auto
  stop(std::error_code ec) -> void {
    status = ec;
    (void)self().get_sock().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    (void)self().get_sock().lowest_layer().close(ec);
    watchdog_timer.cancel();
    if (out.is_open())
      out.close();
  }

  auto
  resolve() -> void {
    resolver.async_resolve(u.host, u.port,
                           [this](const auto &ec, const auto &res) {
                             if (ec)
                               stop(http_error_code::connect_failed);
                             else
                               connect(res);
                           });
  }

  auto
  connect(const auto &resolved) -> void {
    asio::async_connect(self().get_sock().lowest_layer(), resolved,
                        [this](const auto ec, auto) {
                          if (ec)
                            stop(http_error_code::connect_failed);
                          else
                            self().connect_handler();
                        });
    reset_deadline();
    watchdog();
  }

  [[nodiscard]] auto
  make_request() const -> std::string {
    static constexpr auto req_fmt = "{} {} HTTP/1.1\r\n"
                                    "Host: {}\r\n"
                                    "User-Agent: mediaq/{}\r\n"
                                    "Accept: */*\r\n"
                                    "Connection: close\r\n"
                                    "{}"
                                    "\r\n";
    std::string fields =
      offset > 0 ? std::format("Range: bytes={}-\r\n", offset)
                 : std::string{};
    for (const auto &[name, value] : extra_headers)
      fields += std::format("{}: {}\r\n", name, value);
    if (!body.empty())
      fields += std::format("Content-Length: {}\r\n", std::size(body));
    std::string verb = method.empty() ? "GET" : method;
    if (header_only)
      verb = "HEAD";
    return std::format(req_fmt, verb, u.target, u.host, get_version(),
                       fields) +
           body;
  }

  auto
  process_header(const std::error_code ec, const std::size_t n_bytes) {
    if (is_stopped())
      return;
    if (ec) {
      stop(http_error_code::receive_header_failed);
      return;
    }

    header = http_header(std::string(buf.data(), n_bytes));
    // the caller decides what to do with redirects and errors
    if (header_only || !header.is_success()) {
      stop(std::error_code{});
      return;
    }

    const bool resumed = header.status() == 206 && offset > 0;
    if (!resumed)
      offset = 0;
    const std::uint64_t total =
      resumed ? header.content_range_total.value_or(offset +
                                                    header.content_length)
              : header.content_length;
    if (max_file_size && total > *max_file_size) {
      stop(http_error_code::file_too_large);
      return;
    }

    out.open(outfile, std::ios::binary | (resumed ? std::ios::app
                                                  : std::ios::trunc));
    if (!out) {
      stop(http_error_code::writing_file_failed);
      return;
    }
    bytes_written = offset;
    content_remaining = header.content_length;
    if (progress != nullptr)
      progress->set_total_size(total);

    // body bytes that arrived together with the header
    const auto leftover = std::size(buf) - n_bytes;
    if (leftover > 0 && !write_chunk(buf.data() + n_bytes, leftover))
      return;
    if (header.content_length > 0 && content_remaining == 0) {
      finish();
      return;
    }
    buf.resize(chunk_size);
    self().read_content();
  }

  /// Returns false if the transfer was stopped
  [[nodiscard]] auto
  write_chunk(const char *data, const std::size_t n) -> bool {
    out.write(data, static_cast<std::streamsize>(n));
    if (!out) {
      stop(http_error_code::writing_file_failed);
      return false;
    }
    bytes_written += n;
    if (header.content_length > 0)
      content_remaining -= std::min<std::uint64_t>(n, content_remaining);
    if (max_file_size && bytes_written > *max_file_size) {
      stop(http_error_code::file_too_large);
      return false;
    }
    if (progress != nullptr)
      progress->update_bytes(bytes_written);
    return true;
  }

  auto
  handle_content(const std::error_code ec, const std::size_t n_bytes) -> void {
    if (is_stopped())
      return;
    reset_deadline();
    if (n_bytes > 0 && !write_chunk(buf.data(), n_bytes))
      return;
    if (header.content_length > 0 && content_remaining == 0) {
      finish();
      return;
    }
    if (ec) {
      // without a content-length the body ends when the server closes
      const bool closed = ec == asio::error::eof ||
                          ec == asio::ssl::error::stream_truncated;
      if (closed && header.content_length == 0)
        finish();
      else
        stop(http_error_code::reading_body_failed);
      return;
    }
    self().read_content();
  }

  auto
  finish() -> void {
    out.close();
    if (!out)
      stop(http_error_code::writing_file_failed);
    else
      stop(std::error_code{});
  }

  [[nodiscard]] auto
  self() -> derived & {
    return static_cast<derived &>(*this);
  }

  [[nodiscard]] auto
  self() const -> const derived & {
    return static_cast<const derived &>(*this);
  }

  asio::io_context ioc;
  asio::ip::tcp::resolver resolver;

  const url_parts u;
  const std::string outfile;
  const bool header_only{false};

  std::chrono::steady_clock::time_point deadline{};
  std::chrono::microseconds duration{1s};
  asio::steady_timer watchdog_timer;

  http_header header;
  std::vector<char> buf;
  std::uint64_t offset{};
  std::uint64_t bytes_written{};
  std::uint64_t content_remaining{};
  std::optional<std::uint64_t> max_file_size;
  std::ofstream out;

  download_progress *progress{};

  const std::string method;
  const std::string body;
  const std::vector<std::pair<std::string, std::string>> extra_headers;

  std::error_code status{};
};

class http_client : public http_client_base<http_client> {
public:
  http_client(const url_parts &u, const http_request_options &options,
              const std::string &outfile, const bool header_only) :
    http_client_base(u, options, outfile, header_only),
    sock{http_client_base::ioc} {}

  auto
  connect_handler() -> void {
    send_request();
  }

  [[nodiscard]] auto
  get_sock() -> asio::ip::tcp::socket & {
    return sock;
  }

  [[nodiscard]] auto
  get_sock() const -> const asio::ip::tcp::socket & {
    return sock;
  }

  auto
  read_header() -> void {
    reset_deadline();
    asio::async_read_until(sock, asio::dynamic_buffer(buf), "\r\n\r\n",
                           std::bind(&http_client_base::process_header, this,
                                     std::placeholders::_1,
                                     std::placeholders::_2));
  }

  auto
  read_content() -> void {
    sock.async_read_some(asio::buffer(buf),
                         std::bind(&http_client_base::handle_content, this,
                                   std::placeholders::_1,
                                   std::placeholders::_2));
  }

  auto
  send_request() -> void {
    req = make_request();
    reset_deadline();
    asio::async_write(sock, asio::buffer(req), [this](const auto ec, auto) {
      if (ec)
        stop(http_error_code::send_request_failed);
      else
        read_header();
    });
  }

  std::string req;
  asio::ip::tcp::socket sock;
};

class https_client : public http_client_base<https_client> {
public:
  https_client(const url_parts &u, const http_request_options &options,
               const std::string &outfile, const bool header_only,
               asio::ssl::context &ssl_context) :
    http_client_base(u, options, outfile, header_only),
    sock{http_client_base::ioc, ssl_context} {
    sock.set_verify_mode(asio::ssl::verify_none);
    sock.set_verify_callback(
      [](const auto preverified, asio::ssl::verify_context &) {
        return preverified;
      });
    // SNI; most media hosts refuse the handshake without it
    SSL_set_tlsext_host_name(sock.native_handle(), u.host.c_str());
  }

  auto
  connect_handler() -> void {
    sock.async_handshake(asio::ssl::stream_base::client, [this](const auto ec) {
      if (ec)
        stop(http_error_code::handshake_failed);
      else
        send_request();
    });
  }

  [[nodiscard]] auto
  get_sock() -> asio::ip::tcp::socket & {
    return sock.next_layer();
  }

  [[nodiscard]] auto
  get_sock() const -> const asio::ip::tcp::socket & {
    return sock.next_layer();
  }

  auto
  read_header() -> void {
    reset_deadline();
    asio::async_read_until(sock, asio::dynamic_buffer(buf), "\r\n\r\n",
                           std::bind(&http_client_base::process_header, this,
                                     std::placeholders::_1,
                                     std::placeholders::_2));
  }

  auto
  read_content() -> void {
    sock.async_read_some(asio::buffer(buf),
                         std::bind(&http_client_base::handle_content, this,
                                   std::placeholders::_1,
                                   std::placeholders::_2));
  }

  auto
  send_request() -> void {
    req = make_request();
    reset_deadline();
    asio::async_write(sock, asio::buffer(req), [this](const auto ec, auto) {
      if (ec)
        stop(http_error_code::send_request_failed);
      else
        read_header();
    });
  }

  std::string req;
  asio::ssl::stream<asio::ip::tcp::socket> sock;
};

[[nodiscard]] static auto
run_http_client(const url_parts &u, const http_request_options &options,
                const std::string &outfile, const bool header_only)
  -> std::tuple<http_header, std::error_code> {
  if (u.is_https()) {
    // ADS: verification currently disabled
    asio::ssl::context ctx(asio::ssl::context::sslv23);
    https_client c(u, options, outfile, header_only, ctx);
    c.download();
    return {c.get_header(), c.get_status()};
  }
  http_client c(u, options, outfile, header_only);
  c.download();
  return {c.get_header(), c.get_status()};
}

/// Location may be absolute or relative to the current host
[[nodiscard]] static auto
resolve_location(const url_parts &current,
                 const std::string &location) -> std::optional<url_parts> {
  if (location.starts_with("/"))
    return parse_url(std::format("{}://{}:{}{}", current.scheme, current.host,
                                 current.port, location));
  return parse_url(location);
}

[[nodiscard]] static auto
request_following_redirects(const std::string &url,
                            const http_request_options &options,
                            const std::string &outfile, const bool header_only,
                            std::error_code &error) -> http_header {
  auto &lgr = logger::instance();
  auto u = parse_url(url);
  if (!u) {
    error = http_error_code::invalid_url;
    return {};
  }
  auto current = options;
  for (std::uint32_t i = 0; i <= http_request_options::max_redirects; ++i) {
    auto [header, status] = run_http_client(*u, current, outfile, header_only);
    if (status) {
      error = status;
      return header;
    }
    if (!header.is_redirect()) {
      if (!header.is_success())
        error = http_error_code::bad_status;
      return header;
    }
    lgr.debug("Redirect {} -> {}", u->tostring(), header.location);
    current.method.clear();
    current.body.clear();
    u = resolve_location(*u, header.location);
    if (!u) {
      error = http_error_code::invalid_url;
      return header;
    }
  }
  error = http_error_code::bad_status;
  return {};
}

[[nodiscard]] auto
download_http(const std::string &url, const std::string &outfile,
              const http_request_options &options,
              std::error_code &error) -> http_header {
  return request_following_redirects(url, options, outfile, false, error);
}

[[nodiscard]] auto
request_text_http(const std::string &url, const std::string &scratch_file,
                  const http_request_options &options,
                  std::error_code &error) -> std::string {
  const auto header =
    request_following_redirects(url, options, scratch_file, false, error);
  std::string text;
  if (!error) {
    std::ifstream in(scratch_file, std::ios::binary);
    if (!in)
      error = http_error_code::reading_body_failed;
    else
      text.assign(std::istreambuf_iterator<char>(in),
                  std::istreambuf_iterator<char>{});
  }
  if (!error && header.chunked) {
    auto decoded = decode_chunked_body(text);
    if (decoded)
      text = std::move(*decoded);
    else
      error = http_error_code::reading_body_failed;
  }
  if (error)
    logger::instance().debug("Request to {} failed: {} (status {})", url,
                             error, header.status_code);
  std::error_code remove_error;
  std::filesystem::remove(scratch_file, remove_error);
  return text;
}

[[nodiscard]] auto
download_header_http(const std::string &url,
                     const std::chrono::microseconds timeout,
                     std::error_code &error) -> http_header {
  http_request_options options;
  options.timeout = timeout;
  return request_following_redirects(url, options, {}, true, error);
}

}  // namespace mediaq
