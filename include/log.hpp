#pragma once
#include <string>

enum class LogLevel { Quiet = 0, Info = 1, Debug = 2 };

void set_log_level(LogLevel level);
LogLevel log_level();

// One line on stderr: "<component>: <msg>"
void log_info(const std::string& component, const std::string& msg);
void log_warn(const std::string& component, const std::string& msg);
void log_debug(const std::string& component, const std::string& msg);
