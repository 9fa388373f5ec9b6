#include "config/config.hpp"// Configuration management using INI file
#include "core/engine_server.h"
#include "core/logger.h"
#include "transport/http_listener.h"
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>

/**
 * Entry point of the engine server.
 * Loads the configuration, sets up logging, starts the HTTP listener and
 * echoes every client message back to its session until SIGINT or SIGTERM.
 *
 * An optional first argument names the config file to use.
 *
 * @return 0 on clean shutdown, 1 if an exception occurs.
 */
int main(int argc, char *argv[]) {
    try {
        if (argc > 1) {
            eio::config::set_config_file_path(argv[1]);
        }

        // Step 1: Ensure a config file exists, then load it once.
        eio::config::initialize_default_config();
        eio::config::initialize_config_system(eio::config::ConfigMode::STATIC);
        auto config = eio::config::get_current_config();

        // Step 2: Logging as configured.
        eio::core::initializeAsyncLogger(
                config.server.log_path,
                config.server.log_level,
                config.server.max_file_size,
                config.server.max_files);
        EIO_INFO("Starting engine server with configuration: {}", eio::config::get_default_config_path());
        eio::config::print_config(config);

        // Step 3: The engine and what it does with each new session.
        auto options = eio::config::to_server_options(config);
        // the HTTP listener has no WebSocket bridge, so polling is all clients get
        options.allow_upgrades = false;
        eio::core::EngineServer server(std::move(options));
        server.set_connection_callback([](const std::shared_ptr<eio::core::Session> &session) {
            EIO_INFO("Client connected: {}", session->id());
            std::weak_ptr<eio::core::Session> weak_session = session;
            session->set_message_callback([weak_session](const std::string &message) {
                if (auto session = weak_session.lock()) {
                    session->send(message);
                }
            });
            session->once_close([id = session->id()](const std::string &reason) {
                EIO_INFO("Client {} disconnected: {}", id, reason);
            });
        });

        // Step 4: Serve HTTP.
        eio::transport::HttpListener listener(config.server.ip, config.server.port, config.server.path, server,
                                              config.server.io_threads, config.server.max_request_size);
        listener.start();

        EIO_INFO("Engine server is ready on http://{}:{}{}", config.server.ip, listener.port(), config.server.path);

        // Block until asked to stop
        asio::io_context io_context;
        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code &error, int signal_number) {
            if (!error) {
                EIO_INFO("Received signal {}, initiating graceful shutdown...", signal_number);
            }
            io_context.stop();
        });
        io_context.run();

        listener.stop();
        server.close_all();

        EIO_INFO("Server shutdown complete.");
        return 0;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        EIO_ERROR("Server error: {}", e.what());
        return 1;
    }
}
