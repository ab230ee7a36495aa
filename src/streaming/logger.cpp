#include "logger.hh"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>

std::atomic<ChunkedLogLevel> Logger::current_level_{ ChunkedLogLevel_Info };
std::mutex Logger::log_mutex_{};

namespace {
const char*
level_tag(ChunkedLogLevel level)
{
    switch (level) {
        case ChunkedLogLevel_Debug:
            return "DEBUG";
        case ChunkedLogLevel_Info:
            return "INFO";
        case ChunkedLogLevel_Warning:
            return "WARNING";
        default:
            return "ERROR";
    }
}

/// e.g. 2024-05-01 13:04:59.123
std::string
timestamp()
{
    using namespace std::chrono;

    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const auto millis =
      duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char date[32];
    const size_t n = std::strftime(date, sizeof(date), "%F %T", &local);

    char out[40];
    std::snprintf(out,
                  sizeof(out),
                  "%.*s.%03d",
                  static_cast<int>(n),
                  date,
                  static_cast<int>(millis));

    return out;
}
} // namespace

void
Logger::set_log_level(ChunkedLogLevel level)
{
    current_level_ = level;
}

ChunkedLogLevel
Logger::get_log_level()
{
    return current_level_;
}

bool
Logger::should_emit_(ChunkedLogLevel level) noexcept
{
    const ChunkedLogLevel current = current_level_;
    return current != ChunkedLogLevel_None && level >= current;
}

void
Logger::emit_(ChunkedLogLevel level,
              const char* file,
              int line,
              const char* func,
              const std::string& message)
{
    const std::string filename =
      std::filesystem::path(file).filename().string();
    FILE* stream = level >= ChunkedLogLevel_Warning ? stderr : stdout;

    std::scoped_lock lock(log_mutex_);
    std::fprintf(stream,
                 "%s [%s] %s:%d %s: %s\n",
                 timestamp().c_str(),
                 level_tag(level),
                 filename.c_str(),
                 line,
                 func,
                 message.c_str());
    std::fflush(stream);
}
