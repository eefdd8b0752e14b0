#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace goesrx {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "trace")
    out = LogLevel::TRACE;
  else if (s == "debug")
    out = LogLevel::DEBUG;
  else if (s == "info")
    out = LogLevel::INFO;
  else if (s == "warn")
    out = LogLevel::WARN;
  else if (s == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", std::gmtime(&t));
  std::fprintf(stderr, "%sZ [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "\n");
}

} // namespace goesrx
