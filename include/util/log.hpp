#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace dogemesh
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always printed, used for daemon status lines
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

// Serializes writers; maintenance threads log concurrently with rx/tx paths.
inline std::mutex &log_mutex()
{
    static std::mutex m;
    return m;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline void set_log_level_by_name(const char *name)
{
    const std::string level = name ? std::string(name) : std::string();
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);
}

// No-op when the variable is unset, so tests and embedders keep their own level.
inline void init_log_level_from_env(const char *env_var)
{
    const char *v = env_var ? std::getenv(env_var) : nullptr;
    if (v && *v)
        set_log_level_by_name(v);
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::dogemesh::logf(::dogemesh::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::dogemesh::logf(::dogemesh::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::dogemesh::logf(::dogemesh::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::dogemesh::logf(::dogemesh::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::dogemesh::logf(::dogemesh::Level::System, __func__, __VA_ARGS__)

}  // namespace dogemesh
