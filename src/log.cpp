#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> gLevel{static_cast<int>(LogLevel::Warn)};
std::mutex gOutMutex;

void emit(LogLevel level, const char* tag, const std::string& msg) {
  if (static_cast<int>(level) < gLevel.load()) return;
  std::lock_guard<std::mutex> lock(gOutMutex);
  std::cerr << "[" << tag << "] " << msg << "\n";
}

} // namespace

void setLogLevel(LogLevel level) {
  gLevel.store(static_cast<int>(level));
}

void logDebug(const std::string& msg) { emit(LogLevel::Debug, "debug", msg); }
void logInfo(const std::string& msg) { emit(LogLevel::Info, "info", msg); }
void logWarn(const std::string& msg) { emit(LogLevel::Warn, "warn", msg); }
void logError(const std::string& msg) { emit(LogLevel::Error, "error", msg); }
