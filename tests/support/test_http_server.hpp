#pragma once
/// @file test_http_server.hpp
/// @brief In-process Boost.Beast HTTP server for exercising the load
///        generator against real sockets.

#include <utility>  // before Asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace loadgen::testing {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

/// @brief How the server answers one request.
struct CannedReply {
  unsigned status = 200;
  std::chrono::milliseconds delay{0}; ///< Held before the response is sent.
  bool keep_alive = true;
  bool drop = false; ///< Close the connection without answering.
};

using RequestHandler =
    std::function<CannedReply(const http::request<http::string_body> &)>;

/// @brief One accepted connection, serving requests until the peer or the
/// handler closes it.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket socket, RequestHandler &handler);

  void run();

private:
  void do_read();
  void on_read(beast::error_code ec);
  void send(CannedReply reply);

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  net::steady_timer timer_;
  RequestHandler &handler_;
};

/// @brief Listens on 127.0.0.1 at an ephemeral port, served by a small
/// thread pool so slow replies overlap.
class TestHttpServer {
public:
  explicit TestHttpServer(RequestHandler handler = nullptr,
                          std::size_t threads = 4);
  ~TestHttpServer();

  TestHttpServer(const TestHttpServer &) = delete;
  TestHttpServer &operator=(const TestHttpServer &) = delete;

  [[nodiscard]] auto port() const -> unsigned short;

  /// @brief e.g. "http://127.0.0.1:41234/path".
  [[nodiscard]] auto url(std::string_view path = "/") const -> std::string;

  [[nodiscard]] auto request_count() const -> std::size_t {
    return requests_.load();
  }
  [[nodiscard]] auto connection_count() const -> std::size_t {
    return connections_.load();
  }

  /// @brief Methods of every request received so far, in arrival order.
  [[nodiscard]] auto methods() const -> std::vector<std::string>;

private:
  void do_accept();

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  RequestHandler handler_;
  std::vector<std::thread> threads_;

  std::atomic<std::size_t> requests_{0};
  std::atomic<std::size_t> connections_{0};
  mutable std::mutex methods_mutex_;
  std::vector<std::string> methods_;
};

} // namespace loadgen::testing
