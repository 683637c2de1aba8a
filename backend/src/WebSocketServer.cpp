#include "WebSocketServer.hpp"
#include "ClientSession.hpp"
#include "ConnectionRegistry.hpp"
#include "OutboundChannel.hpp"
#include "SourceRegistry.hpp"
#include "StatsBroadcaster.hpp"
#include "StreamMetrics.hpp"
#include "StreamProtocol.hpp"
#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include <chrono>
#include <deque>
#include <iostream>
#include <stdexcept>
// Boost.Beast / Asio for WebSocket
#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace http = beast::http;           // server header in the handshake response
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>

namespace tickflow {

namespace {

// One accepted client. Implements OutboundChannel with a write queue that is
// only touched on the connection's strand, so deliver() is safe from any
// thread and frames go out one async_write at a time, in order.
class WsConnection : public OutboundChannel, public std::enable_shared_from_this<WsConnection> {
public:
    WsConnection(tcp::socket&& socket, StreamProtocol& protocol, const ServerConfig& config)
    : ws_(std::move(socket)), protocol_(protocol), config_(config) {}

    void run() {
        asio::dispatch(ws_.get_executor(), beast::bind_front_handler(&WsConnection::on_run, shared_from_this()));
    }

    bool deliver(const std::string& payload) override {
        if (!open_.load()) return false;
        auto msg = std::make_shared<const std::string>(payload);
        asio::post(ws_.get_executor(), [self = shared_from_this(), msg]() {
            if (self->close_started_) return;
            self->queue_.push_back(msg);
            if (self->queue_.size() == 1) self->write_next();
        });
        return true;
    }

    bool is_open() const override { return open_.load(); }

    void close() override {
        if (!open_.exchange(false)) return;
        asio::post(ws_.get_executor(), [self = shared_from_this()]() {
            self->close_requested_ = true;
            // frames already accepted by deliver() go out first
            if (self->queue_.empty()) self->do_close();
        });
    }

private:
    void on_run() {
        // the websocket layer manages its own timeouts once the handshake starts
        beast::get_lowest_layer(ws_).expires_never();

        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = std::chrono::seconds(30);
        opt.idle_timeout = keepalive_idle_timeout(config_);
        opt.keep_alive_pings = true;
        ws_.set_option(opt);
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "tickflow/" + buildinfo::version());
        }));

        ws_.async_accept(beast::bind_front_handler(&WsConnection::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            open_.store(false);
            std::cerr << "WebSocketServer: websocket accept failed: " << ec.message() << std::endl;
            return;
        }
        ws_.text(true);
        session_ = protocol_.on_connect(shared_from_this());
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WsConnection::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            open_.store(false);
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                std::cerr << "WebSocketServer: " << session_->id() << " read ended: " << ec.message() << std::endl;
            }
            protocol_.on_disconnect(session_);
            // the session holds this channel; drop the back reference
            session_.reset();
            return;
        }
        auto data = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        protocol_.on_message(session_, data);
        do_read();
    }

    void write_next() {
        ws_.async_write(asio::buffer(*queue_.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    // the read loop observes the same failure and reports the disconnect
                    self->open_.store(false);
                    self->queue_.clear();
                    return;
                }
                self->queue_.pop_front();
                if (!self->queue_.empty()) {
                    self->write_next();
                } else if (self->close_requested_) {
                    self->do_close();
                }
            });
    }

    void do_close() {
        if (close_started_) return;
        close_started_ = true;
        ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code) {});
    }

    websocket::stream<beast::tcp_stream> ws_;
    StreamProtocol& protocol_;
    ServerConfig config_;
    beast::flat_buffer buffer_;
    std::shared_ptr<ClientSession> session_;

    std::atomic<bool> open_{true};
    // strand-only state
    std::deque<std::shared_ptr<const std::string>> queue_;
    bool close_requested_ = false;
    bool close_started_ = false;
};

} // namespace

struct WebSocketServer::Impl {
    asio::io_context ioc;
    asio::executor_work_guard<asio::io_context::executor_type> work;
    tcp::acceptor acceptor;
    Impl(): ioc(), work(asio::make_work_guard(ioc)), acceptor(ioc) {}
};

WebSocketServer::WebSocketServer(const ServerConfig& config, ConnectionRegistry& connections,
                                 SourceRegistry& sources, StreamMetrics& metrics)
: config_(config), connections_(connections), sources_(sources), metrics_(metrics) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    if (running_) return;
    impl_ = std::make_shared<Impl>();

    boost::system::error_code ec;
    tcp::resolver resolver(impl_->ioc);
    auto results = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec || results.empty()) {
        throw std::runtime_error(errors::format_E1500_bind_failed(
            config_.host + ":" + std::to_string(config_.port) + " (" + ec.message() + ")"));
    }
    // prefer IPv4 so "localhost" matches what most clients dial
    tcp::endpoint endpoint = results.begin()->endpoint();
    for (const auto& r : results) {
        if (r.endpoint().address().is_v4()) { endpoint = r.endpoint(); break; }
    }

    auto& acceptor = impl_->acceptor;
    auto fail = [&](const char* step) {
        std::string detail = std::string(step) + " " + endpoint.address().to_string() + ":" +
                             std::to_string(endpoint.port()) + " (" + ec.message() + ")";
        boost::system::error_code ignored;
        acceptor.close(ignored);
        throw std::runtime_error(errors::format_E1500_bind_failed(detail));
    };
    acceptor.open(endpoint.protocol(), ec);
    if (ec) fail("open");
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) fail("set_option");
    acceptor.bind(endpoint, ec);
    if (ec) fail("bind");
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) fail("listen");
    bound_port_ = acceptor.local_endpoint(ec).port();
    if (ec) fail("local_endpoint");

    ProtocolOptions options;
    options.reject_unknown_types = config_.reject_unknown_types;
    protocol_ = std::make_unique<StreamProtocol>(connections_, sources_, metrics_, options);
    broadcaster_ = std::make_unique<StatsBroadcaster>(connections_, sources_, metrics_, config_.stats_interval);

    running_ = true;
    do_accept();
    event_thread_ = std::thread([this](){ run_event_loop(); });
    broadcaster_->start();

    std::cout << "WebSocketServer: listening on ws://" << config_.host << ":" << bound_port_ << std::endl;
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) return;
    std::cout << "WebSocketServer: shutting down..." << std::endl;

    if (broadcaster_) broadcaster_->stop();
    if (protocol_) protocol_->shutdown();
    if (event_thread_.joinable()) event_thread_.join();

    // sessions that did not finish the close handshake in time
    for (auto& s : connections_.snapshot()) protocol_->on_disconnect(s);
    std::cout << "WebSocketServer: stopped" << std::endl;
}

void WebSocketServer::do_accept() {
    impl_->acceptor.async_accept(asio::make_strand(impl_->ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted) return;
                if (running_) std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
            } else {
                std::make_shared<WsConnection>(std::move(socket), *protocol_, config_)->run();
            }
            if (running_ && impl_->acceptor.is_open()) do_accept();
        });
}

void WebSocketServer::run_event_loop() {
    auto& ioc = impl_->ioc;
    while (running_) {
        try {
            ioc.run_for(std::chrono::milliseconds(100));
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: I/O context error: " << e.what() << std::endl;
        }
    }

    // stop accepting and give sessions a moment to complete the close handshake
    try {
        boost::system::error_code ec;
        impl_->acceptor.close(ec);
        for (auto& s : connections_.snapshot()) s->close();
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while (connections_.count() > 0 && std::chrono::steady_clock::now() < deadline) {
            ioc.run_for(std::chrono::milliseconds(50));
        }
    } catch (const std::exception& e) {
        std::cerr << "WebSocketServer: shutdown drain error: " << e.what() << std::endl;
    }
    impl_->work.reset();
    ioc.stop();
}

} // namespace tickflow
