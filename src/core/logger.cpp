#include "logger.h"
#include <memory>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace eio {
    namespace core {

        std::shared_ptr<spdlog::logger> g_logger = nullptr;
        LogLevel g_current_level = LogLevel::INFO;

        EioLogger &EioLogger::instance() {
            static EioLogger instance;
            return instance;
        }

        std::shared_ptr<spdlog::logger> EioLogger::operator->() {
            return g_logger;
        }

        void EioLogger::set_level(LogLevel level) {
            g_current_level = level;
            if (g_logger) {
                g_logger->set_level(static_cast<spdlog::level::level_enum>(static_cast<int>(level)));
            }
        }

        LogLevel EioLogger::get_level() const {
            return g_current_level;
        }

        void EioLogger::trace(const char *msg) {
            if (enabled(LogLevel::TRACE)) {
                g_logger->trace(msg);
            }
        }

        void EioLogger::debug(const char *msg) {
            if (enabled(LogLevel::DEBUG)) {
                g_logger->debug(msg);
            }
        }

        void EioLogger::info(const char *msg) {
            if (enabled(LogLevel::INFO)) {
                g_logger->info(msg);
            }
        }

        void EioLogger::warn(const char *msg) {
            if (enabled(LogLevel::WARN)) {
                g_logger->warn(msg);
            }
        }

        void EioLogger::error(const char *msg) {
            if (enabled(LogLevel::ERR)) {
                g_logger->error(msg);
            }
        }

        void EioLogger::critical(const char *msg) {
            if (enabled(LogLevel::CRITICAL)) {
                g_logger->critical(msg);
            }
        }

        LogLevel parse_log_level(const std::string &name) {
            if (name == "trace") return LogLevel::TRACE;
            if (name == "debug") return LogLevel::DEBUG;
            if (name == "warn") return LogLevel::WARN;
            if (name == "error") return LogLevel::ERR;
            if (name == "critical") return LogLevel::CRITICAL;
            if (name == "off") return LogLevel::OFF;
            return LogLevel::INFO;
        }

        void initializeAsyncLogger(const std::string &log_path, const std::string &log_level, size_t max_file_size,
                                   size_t max_files) {
            spdlog::init_thread_pool(8192, 1);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_color_mode(spdlog::color_mode::automatic);
            console_sink->set_color(spdlog::level::trace, "\033[36m");           // Cyan
            console_sink->set_color(spdlog::level::debug, "\033[34m");           // Blue
            console_sink->set_color(spdlog::level::info, "\033[32m");            // Green
            console_sink->set_color(spdlog::level::warn, "\033[33m");            // Yellow
            console_sink->set_color(spdlog::level::err, "\033[31m");             // Red
            console_sink->set_color(spdlog::level::critical, "\033[41m\033[37m");// White on red background

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path, max_file_size, max_files);

            g_current_level = parse_log_level(log_level);

            g_logger = std::make_shared<spdlog::async_logger>(
                    "eio_logger",
                    spdlog::sinks_init_list{console_sink, file_sink},
                    spdlog::thread_pool(),
                    spdlog::async_overflow_policy::block);
            g_logger->set_level(static_cast<spdlog::level::level_enum>(static_cast<int>(g_current_level)));
            g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%t] [%^%l%$] %v");

            spdlog::register_logger(g_logger);
            spdlog::set_default_logger(g_logger);

            spdlog::flush_every(std::chrono::seconds(3));
        }

    }// namespace core
}// namespace eio
