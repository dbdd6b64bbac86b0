#include <catch2/catch_all.hpp>

#include "log.hpp"

#include <iostream>
#include <sstream>
#include <string>

namespace {

// Captures std::cerr for the lifetime of the object.
struct CerrCapture {
  std::ostringstream out;
  std::streambuf* saved;
  CerrCapture() : saved(std::cerr.rdbuf(out.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(saved); }
};

} // namespace

TEST_CASE("messages below the log level are suppressed", "[log]") {
  CerrCapture capture;
  setLogLevel(LogLevel::Warn);

  logDebug("hidden");
  logInfo("hidden too");
  logWarn("careful");
  logError("broken");

  REQUIRE(capture.out.str() == "[warn] careful\n[error] broken\n");
}

TEST_CASE("debug level lets everything through", "[log]") {
  CerrCapture capture;
  setLogLevel(LogLevel::Debug);

  logDebug("d");
  logError("e");
  setLogLevel(LogLevel::Warn);

  REQUIRE(capture.out.str() == "[debug] d\n[error] e\n");
}
