#pragma once
/// @file http_client.hpp
/// @brief Boost.Beast HTTP/1.1 client owned by a single worker.

#include "http/target.hpp"

#include <utility>  // before Asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace loadgen {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

/// @brief Status line of a received response.
struct Reply {
  unsigned status = 0;
  std::string reason;

  /// @brief e.g. "404 Not Found".
  [[nodiscard]] auto status_text() const -> std::string;
};

/// @brief Sends the same bodiless request over one persistent connection.
///
/// Not thread-safe: each worker owns its client, and with it a private
/// io_context that only runs inside round_trip(). The connection is kept
/// open while the server allows keep-alive and dropped after any error.
/// A GET, HEAD, OPTIONS or TRACE that finds a reused connection already
/// closed by the peer is resent once on a fresh connection; any other method
/// reports the failure, so each round_trip() sends it at most once.
class HttpClient {
public:
  /// @brief Prepare a client for @p url.
  ///
  /// A URL or method that cannot form a request is not reported here; every
  /// round_trip() then fails with the same build error.
  /// @param timeout Deadline for one whole exchange, zero for none. A
  ///                timeout beyond the clock's range also means none.
  HttpClient(std::string_view url, std::string_view method,
             std::chrono::seconds timeout);

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  /// @brief Perform one request and read the full response.
  /// @return The response status, or the build / transport error.
  auto round_trip() -> std::expected<Reply, std::error_code>;

  /// @brief Number of TCP connections opened so far.
  [[nodiscard]] auto connections_opened() const noexcept -> std::size_t {
    return connections_opened_;
  }

private:
  auto exchange(net::steady_timer::time_point deadline) -> beast::error_code;
  void do_resolve();
  void do_connect(const tcp::resolver::results_type &endpoints);
  void do_write();
  void do_read();
  void finish(beast::error_code ec);
  void close();

  std::error_code build_error_;
  Target target_;
  http::request<http::empty_body> request_;
  bool head_request_ = false;
  bool replayable_ = false;
  std::chrono::seconds timeout_;

  net::io_context ioc_{1};
  tcp::resolver resolver_{ioc_};
  beast::tcp_stream stream_{ioc_};
  beast::flat_buffer buffer_;
  std::optional<http::response_parser<http::string_body>> parser_;

  bool connected_ = false;
  bool done_ = false;
  beast::error_code result_;
  std::size_t connections_opened_ = 0;
};

} // namespace loadgen
