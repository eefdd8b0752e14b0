#pragma once
#include <ctime>
#include <string>
#include <cstdint>
#include <vector>

namespace goesrx {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// Decimal spacecraft id, 0..255.
bool parse_scid(const std::string& s, uint8_t& id);

// Keeps [A-Za-z0-9._-], replaces everything else with '_'.
std::string sanitize_component(const std::string& s);

// strftime over UTC.
std::string format_utc(std::time_t t, const char* fmt);

std::string trim(const std::string& s);

} // namespace goesrx
