/// @file http_client.cpp
/// @brief Implementation of the per-worker Beast HTTP client.

#include "http/http_client.hpp"

#include "common/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <utility>

namespace loadgen {

namespace {

constexpr char kUserAgent[] = "loadgen/1.0";

auto is_token(std::string_view s) -> bool {
  constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
  return !s.empty() && std::all_of(s.begin(), s.end(), [&](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           extra.find(c) != std::string_view::npos;
  });
}

// The peer closed an idle keep-alive connection before we noticed.
auto is_stale_connection(const beast::error_code &ec) -> bool {
  return ec == http::error::end_of_stream || ec == net::error::eof ||
         ec == net::error::connection_reset || ec == net::error::broken_pipe;
}

} // namespace

auto Reply::status_text() const -> std::string {
  auto text = std::to_string(status);
  if (!reason.empty()) {
    text += ' ';
    text += reason;
  }
  return text;
}

// ─── HttpClient ─────────────────────────────────────────────────────────

HttpClient::HttpClient(std::string_view url, std::string_view method,
                       std::chrono::seconds timeout)
    : timeout_{timeout} {
  if (method.empty()) {
    method = "GET";
  }
  if (!is_token(method)) {
    build_error_ = make_error_code(errc::invalid_method);
    return;
  }

  auto target = parse_target(url);
  if (!target.has_value()) {
    build_error_ = target.error();
    return;
  }
  target_ = std::move(*target);

  const beast::string_view method_sv{method.data(), method.size()};
  const auto verb = http::string_to_verb(method_sv);
  if (verb == http::verb::unknown) {
    request_.method_string(method_sv);
  } else {
    request_.method(verb);
  }
  head_request_ = verb == http::verb::head;
  replayable_ = verb == http::verb::get || verb == http::verb::head ||
                verb == http::verb::options || verb == http::verb::trace;

  request_.version(11);
  request_.target(target_.path);
  request_.set(http::field::host, target_.host_header);
  request_.set(http::field::user_agent, kUserAgent);
  request_.prepare_payload();
}

auto HttpClient::round_trip() -> std::expected<Reply, std::error_code> {
  if (build_error_) {
    return std::unexpected(build_error_);
  }

  auto deadline = net::steady_timer::time_point::max();
  if (timeout_.count() > 0) {
    const auto now = net::steady_timer::clock_type::now();
    // Compared in seconds: converting timeout_ to the clock's nanoseconds
    // can itself overflow.
    const auto headroom = std::chrono::duration_cast<std::chrono::seconds>(
        net::steady_timer::time_point::max() - now);
    if (timeout_ < headroom) {
      deadline = now + timeout_;
    }
  }

  const bool reused = connected_;
  auto ec = exchange(deadline);
  if (ec && reused && replayable_ && is_stale_connection(ec) &&
      !parser_->got_some()) {
    close();
    ec = exchange(deadline);
  }
  if (ec) {
    close();
    return std::unexpected(std::error_code{ec});
  }

  const auto &res = parser_->get();
  auto reason = res.reason();
  if (reason.empty()) {
    reason = http::obsolete_reason(res.result());
  }
  Reply reply{.status = res.result_int(),
              .reason = std::string(reason.data(), reason.size())};
  if (!res.keep_alive()) {
    close();
  }
  return reply;
}

auto HttpClient::exchange(net::steady_timer::time_point deadline)
    -> beast::error_code {
  parser_.emplace();
  parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
  parser_->skip(head_request_);
  done_ = false;
  result_ = {};

  ioc_.restart();
  if (connected_) {
    do_write();
  } else {
    do_resolve();
  }

  if (deadline == net::steady_timer::time_point::max()) {
    ioc_.run();
  } else {
    ioc_.run_until(deadline);
  }

  if (!done_) {
    // Deadline hit: abort whatever is pending and let the handlers unwind.
    resolver_.cancel();
    close();
    ioc_.run();
    return beast::error::timeout;
  }
  return result_;
}

void HttpClient::do_resolve() {
  resolver_.async_resolve(
      target_.host, target_.port,
      [this](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
          finish(ec);
          return;
        }
        do_connect(results);
      });
}

void HttpClient::do_connect(const tcp::resolver::results_type &endpoints) {
  stream_.async_connect(endpoints,
                        [this](beast::error_code ec, tcp::endpoint) {
                          if (ec) {
                            finish(ec);
                            return;
                          }
                          connected_ = true;
                          ++connections_opened_;
                          do_write();
                        });
}

void HttpClient::do_write() {
  http::async_write(stream_, request_,
                    [this](beast::error_code ec, std::size_t) {
                      if (ec) {
                        finish(ec);
                        return;
                      }
                      do_read();
                    });
}

void HttpClient::do_read() {
  http::async_read(stream_, buffer_, *parser_,
                   [this](beast::error_code ec, std::size_t) { finish(ec); });
}

void HttpClient::finish(beast::error_code ec) {
  result_ = ec;
  done_ = true;
}

void HttpClient::close() {
  beast::error_code ignored;
  stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
  stream_.close();
  buffer_.consume(buffer_.size());
  connected_ = false;
}

} // namespace loadgen
