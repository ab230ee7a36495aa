#pragma once

#include "chunked.types.h"

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

class Logger
{
  public:
    static void set_log_level(ChunkedLogLevel level);
    static ChunkedLogLevel get_log_level();

    /**
     * @brief Format and emit a log message.
     * @details The message is always built and returned, so callers can
     * reuse it as an exception message. It is only printed if @p level is at
     * or above the current log level.
     */
    template<typename... Args>
    static std::string log(ChunkedLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        std::ostringstream body;
        format_arg_(body, std::forward<Args>(args)...);

        std::string message = body.str();
        if (should_emit_(level)) {
            emit_(level, file, line, func, message);
        }

        return message;
    }

  private:
    static std::atomic<ChunkedLogLevel> current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream&) {} // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static bool should_emit_(ChunkedLogLevel level) noexcept;
    static void emit_(ChunkedLogLevel level,
                      const char* file,
                      int line,
                      const char* func,
                      const std::string& message);
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(ChunkedLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(ChunkedLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(                                                               \
      ChunkedLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(ChunkedLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
