#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace nodegate {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();

    // Cheap check used by the macros so disabled levels skip message formatting
    static bool is_enabled(Level level) { return level >= threshold_.load(std::memory_order_relaxed); }

    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Parses "debug", "info", "warn", "error" (case-insensitive). Unknown strings map to INFO.
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace nodegate

#define NODEGATE_LOG_INTERNAL(level, msg)                                               \
    do {                                                                                \
        if (nodegate::logging::Logger::is_enabled(level)) {                             \
            std::stringstream nodegate_log_ss;                                          \
            nodegate_log_ss << msg;                                                     \
            nodegate::logging::Logger::log(level, __FILE__, __LINE__, nodegate_log_ss.str()); \
        }                                                                               \
    } while (0)

#define LOG_DEBUG(msg) NODEGATE_LOG_INTERNAL(nodegate::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) NODEGATE_LOG_INTERNAL(nodegate::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) NODEGATE_LOG_INTERNAL(nodegate::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) NODEGATE_LOG_INTERNAL(nodegate::logging::Level::LVL_ERROR, msg)
