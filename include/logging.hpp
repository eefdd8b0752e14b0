#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace goesrx {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    bool enabled(LogLevel lvl) const { return lvl >= level_; }
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    const char* level_str(LogLevel lvl);
};

} // namespace goesrx
