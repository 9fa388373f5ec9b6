#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

#define EIO_TRACE(...) ::eio::core::EioLogger::instance().trace(__VA_ARGS__)
#define EIO_DEBUG(...) ::eio::core::EioLogger::instance().debug(__VA_ARGS__)
#define EIO_INFO(...) ::eio::core::EioLogger::instance().info(__VA_ARGS__)
#define EIO_WARN(...) ::eio::core::EioLogger::instance().warn(__VA_ARGS__)
#define EIO_ERROR(...) ::eio::core::EioLogger::instance().error(__VA_ARGS__)
#define EIO_CRITICAL(...) ::eio::core::EioLogger::instance().critical(__VA_ARGS__)

namespace eio {
    namespace core {

        /**
        * @brief Log levels, numerically aligned with spdlog::level::level_enum
        */
        enum class LogLevel {
            TRACE = 0,
            DEBUG = 1,
            INFO = 2,
            WARN = 3,
            ERR = 4,
            CRITICAL = 5,
            OFF = 6
        };

        // global logger instance, null until initializeAsyncLogger() runs
        extern std::shared_ptr<spdlog::logger> g_logger;
        extern LogLevel g_current_level;

        /**
        * @brief Thin front for the global spdlog logger.
        * Every call is a no-op while no logger is installed.
        */
        class EioLogger {
        public:
            static EioLogger &instance();

            std::shared_ptr<spdlog::logger> operator->();

            template<typename... Args>
            void trace(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void debug(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void info(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void warn(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void error(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::ERR, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void critical(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::CRITICAL, fmt, std::forward<Args>(args)...);
            }

            // Overloads for plain messages
            void trace(const char *msg);
            void debug(const char *msg);
            void info(const char *msg);
            void warn(const char *msg);
            void error(const char *msg);
            void critical(const char *msg);

            void set_level(LogLevel level);
            LogLevel get_level() const;

        private:
            EioLogger() = default;

            bool enabled(LogLevel level) const {
                return g_logger && static_cast<int>(level) >= static_cast<int>(g_current_level);
            }

            template<typename... Args>
            void log(LogLevel level, fmt::format_string<Args...> fmt, Args &&...args) {
                if (!enabled(level)) {
                    return;
                }

                try {
                    std::string formatted_msg = fmt::format(fmt, std::forward<Args>(args)...);
                    g_logger->log(static_cast<spdlog::level::level_enum>(static_cast<int>(level)), formatted_msg);
                } catch (const std::exception &e) {
                    g_logger->error("Log formatting error: {}", e.what());
                }
            }
        };

        /**
        * @brief Parse a textual level (trace, debug, info, warn, error, critical, off).
        * Unknown names map to INFO.
        */
        LogLevel parse_log_level(const std::string &name);

        /**
        * @brief Initialize the global spdlog logger with console and rotating file sinks
        * @param log_path Log file path
        * @param log_level Log level name
        * @param max_file_size Maximum size of each log file (bytes)
        * @param max_files Maximum number of rotated log files
        */
        void initializeAsyncLogger(
                const std::string &log_path,
                const std::string &log_level = "info",
                size_t max_file_size = 1048576 * 5,// 5MB
                size_t max_files = 3);

    }// namespace core
}// namespace eio
