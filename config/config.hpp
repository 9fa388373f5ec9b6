#ifndef EIO_CONFIG_HPP
#define EIO_CONFIG_HPP

#include "core/executable_path.h"
#include "core/logger.h"
#include "core/server_options.h"
#include <filesystem>
#include <inicpp.hpp>
#include <memory>
#include <mutex>
#include <string>


namespace eio {
    namespace config {

        constexpr const char *CONFIG_FILE = "config.ini";

        inline std::string g_config_file_path;

        // config.ini next to the executable
        inline std::string get_config_file_path() {
            static std::string config_file_path = []() {
                std::filesystem::path exe_dir(eio::core::getExecutableDirectory());
                return (exe_dir / CONFIG_FILE).string();
            }();
            return config_file_path;
        }

        inline void set_config_file_path(const std::string &path) {
            g_config_file_path = path;
        }

        // An explicitly set path wins over the executable-relative default
        inline std::string get_default_config_path() {
            if (!g_config_file_path.empty()) {
                return g_config_file_path;
            }
            return get_config_file_path();
        }

        enum class ConfigMode {
            NONE, // Use default settings without file
            STATIC// Load from file once, defaults if missing
        };

        /**
 * [server] section: listener and logging
 */
        struct ServerConfig {
            std::string ip = "127.0.0.1";
            unsigned short port = 3000;
            std::string path = "/engine.io/";
            size_t io_threads = 2;
            size_t max_request_size = 1024 * 1024;
            std::string log_level = "info";
            std::string log_path = "logs/eio_server.log";
            size_t max_file_size = 10485760;
            size_t max_files = 10;

            static ServerConfig load(inicpp::IniManager &ini) {
                try {
                    auto section = ini["server"];
                    ServerConfig config;

                    if (!section["ip"].String().empty()) config.ip = section["ip"].String();
                    if (!section["port"].String().empty()) config.port = static_cast<unsigned short>(section["port"]);
                    if (!section["path"].String().empty()) config.path = section["path"].String();
                    if (!section["io_threads"].String().empty()) config.io_threads = static_cast<size_t>(section["io_threads"]);
                    if (!section["max_request_size"].String().empty()) config.max_request_size = static_cast<size_t>(section["max_request_size"]);
                    if (!section["log_level"].String().empty()) config.log_level = section["log_level"].String();
                    if (!section["log_path"].String().empty()) config.log_path = section["log_path"].String();
                    if (!section["max_file_size"].String().empty()) config.max_file_size = static_cast<size_t>(section["max_file_size"]);
                    if (!section["max_files"].String().empty()) config.max_files = static_cast<size_t>(section["max_files"]);

                    return config;
                } catch (const std::exception &e) {
                    EIO_ERROR("Failed to load server config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * [engine] section: values handed to every session
 */
        struct EngineConfig {
            size_t ping_timeout = 5000;
            size_t ping_interval = 25000;

            static EngineConfig load(inicpp::IniManager &ini) {
                try {
                    auto section = ini["engine"];
                    EngineConfig config;
                    if (!section["ping_timeout"].String().empty()) config.ping_timeout = static_cast<size_t>(section["ping_timeout"]);
                    if (!section["ping_interval"].String().empty()) config.ping_interval = static_cast<size_t>(section["ping_interval"]);
                    return config;
                } catch (const std::exception &e) {
                    EIO_ERROR("Failed to load engine config: {}", e.what());
                    throw;
                }
            }
        };

        struct GlobalConfig {
            std::string title = "EngineIO Server Configuration";
            ServerConfig server;
            EngineConfig engine;

            static GlobalConfig load(const std::string &path) {
                try {
                    inicpp::IniManager ini(path);
                    EIO_INFO("Loading configuration from: {}", path);

                    GlobalConfig config;
                    if (!ini[""]["title"].String().empty()) config.title = ini[""]["title"].String();
                    config.server = ServerConfig::load(ini);
                    config.engine = EngineConfig::load(ini);
                    return config;
                } catch (const std::exception &e) {
                    EIO_ERROR("Failed to load global config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Map the [engine] section onto the server options
 */
        inline core::ServerOptions to_server_options(const GlobalConfig &config) {
            core::ServerOptions options;
            options.ping_timeout = std::chrono::milliseconds(config.engine.ping_timeout);
            options.ping_interval = std::chrono::milliseconds(config.engine.ping_interval);
            return options;
        }

        inline std::unique_ptr<GlobalConfig> g_current_config;
        inline std::mutex g_config_mutex;

        inline std::unique_ptr<GlobalConfig> load_config(ConfigMode mode) {
            switch (mode) {
                case ConfigMode::NONE:
                    return std::make_unique<GlobalConfig>();
                case ConfigMode::STATIC: {
                    std::string path = get_default_config_path();
                    if (std::filesystem::exists(path)) {
                        return std::make_unique<GlobalConfig>(GlobalConfig::load(path));
                    }
                    EIO_WARN("Config file {} not found, using default settings", path);
                    return std::make_unique<GlobalConfig>();
                }
            }
            return std::make_unique<GlobalConfig>();
        }

        /**
 * Write a commented default config file if none exists yet
 */
        inline void initialize_default_config() {
            try {
                std::string config_file = get_default_config_path();
                if (std::filesystem::exists(config_file) && std::filesystem::file_size(config_file) > 0) {
                    return;
                }

                inicpp::IniManager ini(config_file);
                EIO_INFO("Creating default config file: {}", config_file);

                // [server]
                ini.set("server", "ip", "127.0.0.1");
                ini.set("server", "port", 3000);
                ini.set("server", "path", "/engine.io/");
                ini.set("server", "io_threads", 2);
                ini.set("server", "max_request_size", 1024 * 1024);
                ini.set("server", "log_level", "info");
                ini.set("server", "log_path", "logs/eio_server.log");
                ini.set("server", "max_file_size", 10485760);
                ini.set("server", "max_files", 10);

                // [engine]
                ini.set("engine", "ping_timeout", 5000);
                ini.set("engine", "ping_interval", 25000);

                ini.setComment("server", "ip", "IP address the server binds to");
                ini.setComment("server", "port", "HTTP port for polling requests");
                ini.setComment("server", "path", "Request path served by the engine");
                ini.setComment("server", "io_threads", "Threads serving HTTP connections");
                ini.setComment("server", "max_request_size", "Largest accepted HTTP request in bytes");
                ini.setComment("server", "log_level", "Logging severity (trace, debug, info, warn, error)");
                ini.setComment("server", "log_path", "Filesystem path for log storage");
                ini.setComment("server", "max_file_size", "Maximum size per log file in bytes");
                ini.setComment("server", "max_files", "Maximum number of rotated log files");
                ini.setComment("engine", "ping_timeout", "Milliseconds without a heartbeat before a session is dead");
                ini.setComment("engine", "ping_interval", "Milliseconds between heartbeats");

                ini.set("title", "EngineIO Server Configuration");
                ini.setComment("title", "Auto-generated configuration file");
                ini.parse();

                EIO_INFO("Default config created successfully");
            } catch (const std::exception &e) {
                EIO_ERROR("Failed to initialize default config: {}", e.what());
                throw;
            }
        }

        inline void print_config(const GlobalConfig &config) {
            EIO_DEBUG("===== EngineIO Configuration =====");
            EIO_DEBUG("Title: {}", config.title);
            EIO_DEBUG("Listen: {}:{}{}", config.server.ip, config.server.port, config.server.path);
            EIO_DEBUG("IO threads: {}", config.server.io_threads);
            EIO_DEBUG("Log Level: {}", config.server.log_level);
            EIO_DEBUG("Ping timeout: {}ms", config.engine.ping_timeout);
            EIO_DEBUG("Ping interval: {}ms", config.engine.ping_interval);
            EIO_DEBUG("==================================");
        }

        /**
 * Load the config once and keep it for get_current_config()
 */
        inline void initialize_config_system(ConfigMode mode = ConfigMode::STATIC) {
            std::lock_guard<std::mutex> lock(g_config_mutex);
            if (g_current_config) return;
            g_current_config = load_config(mode);
        }

        /**
 * Get current config (thread-safe)
 */
        inline GlobalConfig get_current_config() {
            std::lock_guard<std::mutex> lock(g_config_mutex);
            return g_current_config ? *g_current_config : GlobalConfig{};
        }

    }// namespace config
}// namespace eio

#endif// EIO_CONFIG_HPP
