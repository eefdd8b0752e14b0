#include "util.hpp"
#include <cctype>
#include <stdexcept>

namespace goesrx {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::logic_error &) {
    return false;
  }
}

bool parse_scid(const std::string &s, uint8_t &id) {
  if (s.empty() || s.size() > 3)
    return false;
  int v = 0;
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
    v = v * 10 + (c - '0');
  }
  if (v > 255)
    return false;
  id = (uint8_t)v;
  return true;
}

std::string sanitize_component(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    unsigned char u = (unsigned char)c;
    if (std::isalnum(u) || c == '.' || c == '_' || c == '-')
      out.push_back(c);
    else
      out.push_back('_');
  }
  // never produce a relative path component
  while (!out.empty() && out.front() == '.')
    out.erase(out.begin());
  return out;
}

std::string format_utc(std::time_t t, const char *fmt) {
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && (std::isspace((unsigned char)s[b]) || s[b] == '\0'))
    b++;
  while (e > b && (std::isspace((unsigned char)s[e - 1]) || s[e - 1] == '\0'))
    e--;
  return s.substr(b, e - b);
}

} // namespace goesrx
