#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

static std::atomic<int> g_level{(int)LogLevel::Info};
static std::mutex g_mu;

void set_log_level(LogLevel level) { g_level = (int)level; }
LogLevel log_level() { return (LogLevel)g_level.load(); }

static void emit(LogLevel at, const std::string& component, const std::string& tag, const std::string& msg) {
  if (g_level.load() < (int)at) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << component << ": " << tag << msg << "\n";
}

void log_info(const std::string& component, const std::string& msg)  { emit(LogLevel::Info, component, "", msg); }
void log_warn(const std::string& component, const std::string& msg)  { emit(LogLevel::Info, component, "warning: ", msg); }
void log_debug(const std::string& component, const std::string& msg) { emit(LogLevel::Debug, component, "", msg); }
