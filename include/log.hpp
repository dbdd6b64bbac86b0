#pragma once

#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

void setLogLevel(LogLevel level);

// Diagnostics go to stderr so that stdout carries only extracted rows.
void logDebug(const std::string& msg);
void logInfo(const std::string& msg);
void logWarn(const std::string& msg);
void logError(const std::string& msg);
