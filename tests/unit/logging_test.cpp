#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using bridgewatch::observability::BoolField;
using bridgewatch::observability::DoubleField;
using bridgewatch::observability::FormatLine;
using bridgewatch::observability::IntField;
using bridgewatch::observability::ParseLevel;
using bridgewatch::observability::StringField;

void TestFormatLine() {
  assert(FormatLine("Scored batch", {}) == "Scored batch");
  assert(FormatLine("Scored batch", {IntField("scored", 100), IntField("anomalies", 3)}) == "Scored batch scored=100 anomalies=3");
  assert(FormatLine("x", {DoubleField("score", -0.123456), DoubleField("pct", 42.0, 1)}) == "x score=-0.1235 pct=42.0");
  assert(FormatLine("x", {BoolField("truncated", true)}) == "x truncated=true");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatLine("Reconnect failed", {StringField("error", "connection reset by peer")}) ==
         R"(Reconnect failed error="connection reset by peer")");
  assert(FormatLine("x", {StringField("sql", R"(a="b")")}) == R"(x sql="a=\"b\"")");
  assert(FormatLine("x", {StringField("path", "")}) == R"(x path="")");
  assert(FormatLine("x", {StringField("msg", "line1\nline2")}) == R"(x msg="line1\nline2")");
}

void TestParseLevel() {
  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("INFO") == spdlog::level::info);
  assert(ParseLevel("warning") == spdlog::level::warn);
  assert(ParseLevel("error") == spdlog::level::err);
  assert(ParseLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    (void)ParseLevel("verbose");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestLogHonoursLevel() {
  std::ostringstream out;
  auto               sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto               logger = std::make_shared<spdlog::logger>("logging_test", sink);
  logger->set_pattern("[%l] %v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  BRIDGEWATCH_LOG_DEBUG("Hidden", {IntField("cycle", 1)});
  BRIDGEWATCH_LOG_INFO("Waiting for new data", {IntField("cycle", 2)});
  BRIDGEWATCH_LOG_WARN("Replay insert failed, skipping record", {StringField("code", "conflict")});
  logger->flush();

  const auto text = out.str();
  assert(text.find("Hidden") == std::string::npos);
  assert(text.find("[info] Waiting for new data cycle=2") != std::string::npos);
  assert(text.find("[warning] Replay insert failed, skipping record code=conflict") != std::string::npos);
}

} // namespace

int main() {
  TestFormatLine();
  TestValuesWithSpacesAreQuoted();
  TestParseLevel();
  TestLogHonoursLevel();

  std::cout << "bridgewatch_unit_logging: pass\n";
  return 0;
}
