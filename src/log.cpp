#include "hashrig/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace hashrig {

namespace {

constexpr size_t kMaxRuntimeLogLines = 5000;

std::mutex g_log_mutex;
std::vector<std::string> g_runtime_logs;
std::atomic<bool> g_log_echo{true};
std::atomic<int> g_log_min_level{static_cast<int>(LogLevel::INFO)};

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "[debug] ";
    case LogLevel::INFO: return "[info] ";
    case LogLevel::WARN: return "[warn] ";
    case LogLevel::ERROR: return "[error] ";
  }
  return "";
}

} // namespace

void log_line(LogLevel level, std::string line) {
  std::string tagged = level_tag(level) + std::move(line);

  const bool echo = g_log_echo.load(std::memory_order_relaxed) &&
                    static_cast<int>(level) >= g_log_min_level.load(std::memory_order_relaxed);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (echo) {
    std::cerr << tagged << '\n';
  }
  if (g_runtime_logs.size() >= kMaxRuntimeLogLines) {
    const size_t drop = g_runtime_logs.size() - kMaxRuntimeLogLines + 1;
    g_runtime_logs.erase(
      g_runtime_logs.begin(),
      g_runtime_logs.begin() + static_cast<std::vector<std::string>::difference_type>(drop));
  }
  g_runtime_logs.push_back(std::move(tagged));
}

void set_log_echo(bool enabled) {
  g_log_echo.store(enabled, std::memory_order_relaxed);
}

void set_log_min_level(LogLevel level) {
  g_log_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

std::vector<std::string> recent_log_lines(size_t max) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (max == 0 || max >= g_runtime_logs.size()) {
    return g_runtime_logs;
  }
  return std::vector<std::string>(
    g_runtime_logs.end() - static_cast<std::vector<std::string>::difference_type>(max),
    g_runtime_logs.end());
}

void clear_log_lines() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_runtime_logs.clear();
}

} // namespace hashrig
