#include "WebSocketServer.hpp"
#include "ConnectionRegistry.hpp"
#include "SignalGenerator.hpp"
#include "SourceRegistry.hpp"
#include "StreamMetrics.hpp"
#include "core/BuildInfo.hpp"
#include "core/ServerConfig.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    tickflow::ServerConfig config;
    try {
        config = tickflow::parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        tickflow::print_usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        tickflow::print_usage(argv[0]);
        return 0;
    }

    tickflow::SourceRegistry sources(config.seed, config.anomaly_probability, config.max_custom_sources);
    tickflow::ConnectionRegistry connections;
    tickflow::StreamMetrics metrics;

    tickflow::WebSocketServer server(config, connections, sources, metrics);
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "tickflow " << tickflow::buildinfo::version() << " (" << tickflow::buildinfo::git_commit()
              << ") streaming on ws://" << config.host << ":" << server.port() << std::endl;
    std::cout << "Available data sources:";
    for (const auto& s : tickflow::available_source_names()) std::cout << " " << s;
    std::cout << std::endl;

    // CTRL-C / SIGTERM stop the server
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) std::cout << "\nReceived signal " << signo << ", shutting down..." << std::endl;
    });
    signal_ioc.run();

    server.stop();
    return 0;
}
