#pragma once
#include <atomic>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace streamscout::testing {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

// ----------------------------- Test Logger -----------------------------
struct TestLogger : application::ports::ILogger {
  void init(const domain::Settings&) override {}
  void app(application::ports::LogLevel, const std::string& msg) override {
    std::lock_guard<std::mutex> lk(m);
    lines.push_back(msg);
  }
  void net(application::ports::LogLevel, std::string_view) override {}

  bool saw(const std::string& needle) {
    std::lock_guard<std::mutex> lk(m);
    for (const auto& l : lines)
      if (l.find(needle) != std::string::npos) return true;
    return false;
  }

  std::mutex m;
  std::vector<std::string> lines;
};

// Runs one coroutine to completion on `io` and returns its result (rethrows its exception).
template <typename T>
T run_sync(asio::io_context& io, asio::awaitable<T> task) {
  auto fut = asio::co_spawn(io, std::move(task), asio::use_future);
  io.restart();
  io.run();
  return fut.get();
}

// A port nobody listens on (bound once, then released).
inline uint16_t closed_port() {
  asio::io_context io;
  tcp::acceptor a(io, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0});
  const auto p = a.local_endpoint().port();
  a.close();
  return p;
}

// ----------------------------- Loopback server -----------------------------
// Accepts on 127.0.0.1:<ephemeral> in a background thread and serves one connection at a time.
class LoopbackServer {
 public:
  using Handler = std::function<void(tcp::socket&)>;

  explicit LoopbackServer(Handler h) : handler_(std::move(h)), acceptor_(io_) {
    tcp::endpoint ep{asio::ip::make_address("127.0.0.1"), 0};
    acceptor_.open(ep.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
    th_ = std::thread([this] { loop_(); });
  }

  ~LoopbackServer() { stop(); }

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  uint16_t port() const { return port_; }
  std::size_t connections() const { return connections_.load(); }

  void stop() {
    if (stopping_.exchange(true)) return;
    // wake the blocking accept() with a throwaway connection
    {
      asio::io_context io;
      tcp::socket s(io);
      boost::system::error_code ec;
      s.connect({asio::ip::make_address("127.0.0.1"), port_}, ec);
    }
    if (th_.joinable()) th_.join();
    boost::system::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void loop_() {
    while (!stopping_) {
      tcp::socket s(io_);
      boost::system::error_code ec;
      acceptor_.accept(s, ec);
      if (ec || stopping_) break;
      ++connections_;
      handler_(s);
      s.shutdown(tcp::socket::shutdown_both, ec);
      s.close(ec);
    }
  }

  Handler handler_;
  asio::io_context io_;
  tcp::acceptor acceptor_;
  uint16_t port_{0};
  std::atomic<bool> stopping_{false};
  std::atomic<std::size_t> connections_{0};
  std::thread th_;
};

// ----------------------------- Protocol handlers -----------------------------
struct HttpReply {
  unsigned status{200};
  std::string contentType;
  std::string body;
  std::string location;
};

using HttpRoute = std::function<HttpReply(const std::string& method, const std::string& target)>;

inline LoopbackServer::Handler http_handler(HttpRoute route) {
  return [route](tcp::socket& s) {
    beast::flat_buffer buf;
    http::request<http::string_body> req;
    boost::system::error_code ec;
    http::read(s, buf, req, ec);
    if (ec) return;  // plain connectivity checks close without a request

    const auto r = route(std::string(req.method_string()), std::string(req.target()));
    http::response<http::string_body> res{static_cast<http::status>(r.status), req.version()};
    if (!r.contentType.empty()) res.set(http::field::content_type, r.contentType);
    if (!r.location.empty()) res.set(http::field::location, r.location);
    res.body() = r.body;
    res.keep_alive(false);
    res.prepare_payload();
    if (req.method() == http::verb::head) res.body().clear();
    http::write(s, res, ec);
  };
}

// Answers OPTIONS with 200 when `ok(path)` holds, 404 otherwise.
inline LoopbackServer::Handler rtsp_handler(std::function<bool(const std::string& path)> ok) {
  return [ok](tcp::socket& s) {
    std::string data;
    boost::system::error_code ec;
    asio::read_until(s, asio::dynamic_buffer(data), "\r\n\r\n", ec);
    if (ec) return;

    // "OPTIONS rtsp://host:port/path RTSP/1.0"
    const auto line = data.substr(0, data.find("\r\n"));
    const auto sp1 = line.find(' ');
    const auto sp2 = line.rfind(' ');
    const auto url = line.substr(sp1 + 1, sp2 - sp1 - 1);
    const auto slash = url.find('/', url.find("://") + 3);
    const auto path = slash == std::string::npos ? std::string{"/"} : url.substr(slash);

    std::string cseq = "1";
    if (auto p = data.find("CSeq: "); p != std::string::npos)
      cseq = data.substr(p + 6, data.find("\r\n", p) - p - 6);

    const std::string reply =
        ok(path) ? "RTSP/1.0 200 OK\r\nCSeq: " + cseq + "\r\nPublic: OPTIONS, DESCRIBE, PLAY\r\n\r\n"
                 : "RTSP/1.0 404 Not Found\r\nCSeq: " + cseq + "\r\n\r\n";
    asio::write(s, asio::buffer(reply), ec);
  };
}

// Accepts the upgrade, reads one message and answers it.
inline LoopbackServer::Handler websocket_handler(std::string reply) {
  return [reply](tcp::socket& s) {
    beast::websocket::stream<tcp::socket> ws(std::move(s));
    boost::system::error_code ec;
    ws.accept(ec);
    if (ec) return;
    beast::flat_buffer buf;
    ws.read(buf, ec);
    if (ec) return;
    ws.text(true);
    ws.write(asio::buffer(reply), ec);
    ws.close(beast::websocket::close_code::normal, ec);
  };
}

}  // namespace streamscout::testing
