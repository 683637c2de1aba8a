#pragma once

// tickflow client helper.
//
// Dependencies:
// - Boost (Asio + Beast WebSocket)
// - nlohmann::json (header-only)
//
// Synchronous facade over a single-threaded io_context. A read that times
// out stays pending and is resumed by the next read call, so no message is
// lost between calls.

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tickflow {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
  std::string host;
  std::string port;
  std::string target;
};

inline bool parse_ws_url(const std::string& url, WsUrl& out) {
  // Minimal parser for ws://host:port/path
  std::string s = url;
  const std::string prefix = "ws://";
  if (s.rfind(prefix, 0) != 0) return false;
  s = s.substr(prefix.size());

  std::string hostport;
  auto slash = s.find('/');
  if (slash == std::string::npos) {
    hostport = s;
    out.target = "/";
  } else {
    hostport = s.substr(0, slash);
    out.target = s.substr(slash);
    if (out.target.empty()) out.target = "/";
  }

  auto colon = hostport.find(':');
  if (colon == std::string::npos) {
    out.host = hostport;
    out.port = "80";
  } else {
    out.host = hostport.substr(0, colon);
    out.port = hostport.substr(colon + 1);
    if (out.port.empty()) out.port = "80";
  }

  return !out.host.empty();
}

class Client {
 public:
  explicit Client(std::string ws_url = "ws://localhost:8083/") : ws_url_(std::move(ws_url)), ws_(ioc_) {
    if (!parse_ws_url(ws_url_, url_)) {
      throw std::runtime_error("Invalid ws url (expected ws://host:port/path): " + ws_url_);
    }
  }

  ~Client() {
    try {
      close();
    } catch (const std::exception&) {
      // peer already gone
    }
  }

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  const std::string& ws_url() const { return ws_url_; }
  bool connected() const { return connected_; }

  void connect() {
    tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve(url_.host, url_.port);
    beast::get_lowest_layer(ws_).connect(results);
    ws_.handshake(url_.host + ":" + url_.port, url_.target);
    ws_.text(true);
    connected_ = true;
  }

  void send(const json& msg) { send_text(msg.dump()); }

  void send_text(const std::string& text) {
    require_connected();
    auto payload = std::make_shared<std::string>(text);
    bool done = false;
    beast::error_code ec;
    ws_.async_write(net::buffer(*payload), [&](beast::error_code e, std::size_t) {
      ec = e;
      done = true;
    });
    ioc_.restart();
    while (!done && ioc_.run_one() > 0) {
    }
    if (ec) throw std::runtime_error("write failed: " + ec.message());
  }

  // Next message, or nullopt when nothing arrived within `timeout`.
  // Frames that are not JSON come back as a discarded value.
  std::optional<json> read_for(std::chrono::milliseconds timeout) {
    require_connected();
    if (!read_pending_) {
      read_pending_ = true;
      read_done_ = false;
      ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
        read_ec_ = ec;
        read_done_ = true;
      });
    }
    if (!read_done_) {
      ioc_.restart();
      ioc_.run_for(timeout);
    }
    if (!read_done_) return std::nullopt;

    read_pending_ = false;
    if (read_ec_) {
      connected_ = false;
      throw std::runtime_error("read failed: " + read_ec_.message());
    }
    std::string data = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    return json::parse(data, nullptr, false);
  }

  json read(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto msg = read_for(timeout);
    if (!msg) throw std::runtime_error("read timeout");
    return *msg;
  }

  // Skips (and optionally collects) messages until one of `type` arrives
  json read_until(const std::string& type, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                  std::vector<json>* skipped = nullptr) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) throw std::runtime_error("timeout waiting for " + type);
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      auto msg = read_for(left);
      if (!msg) continue;
      if (msg->is_object() && msg->value("type", std::string{}) == type) return *msg;
      if (skipped) skipped->push_back(*msg);
    }
  }

  // Everything received during `window`
  std::vector<json> collect_for(std::chrono::milliseconds window) {
    std::vector<json> out;
    const auto deadline = std::chrono::steady_clock::now() + window;
    for (;;) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) break;
      auto msg = read_for(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
      if (msg) out.push_back(*msg);
    }
    return out;
  }

  void subscribe(const std::string& source, int frequency_ms) {
    send(json{{"type", "subscribe"}, {"source", source}, {"frequency", frequency_ms}});
  }

  void unsubscribe() { send(json{{"type", "unsubscribe"}}); }

  void ping() { send(json{{"type", "ping"}}); }

  // Normal close handshake
  void close() {
    if (!connected_) return;
    connected_ = false;
    bool done = false;
    beast::error_code ec;
    ws_.async_close(websocket::close_code::normal, [&](beast::error_code e) {
      ec = e;
      done = true;
    });
    ioc_.restart();
    ioc_.run_for(std::chrono::seconds(2));
    read_pending_ = false;
    if (!done) {
      beast::error_code ignored;
      beast::get_lowest_layer(ws_).socket().close(ignored);
    }
  }

  // Abrupt disconnect without a close frame
  void drop() {
    if (!connected_) return;
    connected_ = false;
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    beast::get_lowest_layer(ws_).socket().close(ignored);
    ioc_.restart();
    ioc_.poll();
    read_pending_ = false;
  }

 private:
  void require_connected() const {
    if (!connected_) throw std::runtime_error("not connected: " + ws_url_);
  }

  std::string ws_url_;
  WsUrl url_;
  net::io_context ioc_;
  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  bool connected_ = false;
  bool read_pending_ = false;
  bool read_done_ = false;
  beast::error_code read_ec_;
};

}  // namespace tickflow
