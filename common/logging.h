#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>

namespace Common {

/// Printf-style front end of the asynchronous file logger.
/// Formatting happens on the caller's thread into a fixed stack buffer; the record is
/// then handed to a lock-free queue drained by a single writer thread.
class Logger {
public:
    enum Level : uint16_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        FATAL = 4
    };

    static constexpr size_t MAX_MSG_SIZE = 240;

    struct Stats {
        uint64_t messages_written = 0;
        uint64_t messages_dropped = 0;
        uint64_t bytes_written = 0;
    };

    template<typename... Args>
    static void log(Level level, const char* format, Args&&... args) noexcept {
        if (level < minLevel()) {
            return;
        }
        char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
        int len = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
        if (len <= 0) {
            return;
        }
        // Truncated messages are still delivered
        size_t n = static_cast<size_t>(len) < sizeof(buffer) ? static_cast<size_t>(len) : sizeof(buffer) - 1;
        submit(level, buffer, n);
    }

    static auto minLevel() noexcept -> Level;
    static auto setMinLevel(Level level) noexcept -> void;
    [[nodiscard]] static auto parseLevel(const char* name, Level* out) noexcept -> bool;
    [[nodiscard]] static auto getStats() noexcept -> Stats;

private:
    static void submit(Level level, const char* msg, size_t len) noexcept;
};

/// Starts the writer thread logging to log_file; replaces any previous logger
void initLogging(const char* log_file);

/// Drains pending records, flushes and stops the writer thread
void shutdownLogging();

} // namespace Common

#define LOG_DEBUG(...) ::Common::Logger::log(::Common::Logger::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  ::Common::Logger::log(::Common::Logger::INFO, __VA_ARGS__)
#define LOG_WARN(...)  ::Common::Logger::log(::Common::Logger::WARN, __VA_ARGS__)
#define LOG_ERROR(...) ::Common::Logger::log(::Common::Logger::ERROR, __VA_ARGS__)
#define LOG_FATAL(...) ::Common::Logger::log(::Common::Logger::FATAL, __VA_ARGS__)
