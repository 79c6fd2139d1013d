#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace greenhouse {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Cheap check used by the LOG_* macros before building the message
    static bool is_enabled(Level level) { return level >= threshold_; }

private:
    static Level threshold_;
    static std::mutex mutex_;
};

// Config string ("debug", "INFO", ...) to Level. Unknown strings map to INFO.
Level string_to_level(const std::string &level_str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace greenhouse

#define LOG_INTERNAL(level, msg)                                                   \
    do {                                                                           \
        if (greenhouse::logging::Logger::is_enabled(level)) {                      \
            std::stringstream ss;                                                  \
            ss << msg;                                                             \
            greenhouse::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        }                                                                          \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(greenhouse::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(greenhouse::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(greenhouse::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(greenhouse::logging::Level::LVL_ERROR, msg)
