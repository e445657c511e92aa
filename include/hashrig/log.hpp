#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hashrig {

enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
};

void log_line(LogLevel level, std::string line);
inline void log_debug(std::string line) { log_line(LogLevel::DEBUG, std::move(line)); }
inline void log_info(std::string line) { log_line(LogLevel::INFO, std::move(line)); }
inline void log_warn(std::string line) { log_line(LogLevel::WARN, std::move(line)); }
inline void log_error(std::string line) { log_line(LogLevel::ERROR, std::move(line)); }

void set_log_echo(bool enabled);
void set_log_min_level(LogLevel level);

// Newest lines last. max == 0 returns everything retained.
std::vector<std::string> recent_log_lines(size_t max = 0);
void clear_log_lines();

} // namespace hashrig
