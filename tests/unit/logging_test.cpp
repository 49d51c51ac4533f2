#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using namespace lending::observability;

std::filesystem::path LogPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "lending_ledger_logging_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".log");
  std::filesystem::remove(path);
  return path;
}

std::string ReadAll(const std::filesystem::path& path) {
  spdlog::default_logger()->flush();
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

lending::runtime::config::RuntimeConfig ConfigFor(const std::filesystem::path& path, const std::string& level) {
  lending::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level(level);
  config.mutable_logging()->set_pattern("%l %v");
  config.mutable_logging()->set_file(path.string());
  return config;
}

void TestFieldsAreQuotedWhenNeeded() {
  const auto path = LogPath("fields");
  InitializeLogging(ConfigFor(path, "debug"));

  LENDING_LOG_DEBUG("Loan opened", {StringField("borrower", "alice"), UintField("item_id", 7), StringField("title", "Principia Mathematica"),
                                    StringField("note", "say \"hi\""), StringField("tier", "")});
  LENDING_LOG_INFO("Ledger idle");

  const auto text = ReadAll(path);
  assert(text.find("debug Loan opened borrower=alice item_id=7 title=\"Principia Mathematica\" note=\"say \\\"hi\\\"\" tier=\"\"\n") !=
         std::string::npos);
  assert(text.find("info Ledger idle\n") != std::string::npos);
}

void TestUnknownLevelFallsBackToInfo() {
  const auto path = LogPath("unknown_level");
  InitializeLogging(ConfigFor(path, "verbose"));

  LENDING_LOG_DEBUG("hidden");
  LENDING_LOG_INFO("Deposit refunded", {UintField("amount", 10)});

  const auto text = ReadAll(path);
  assert(text.find("warning Unknown log level, using info level=verbose\n") != std::string::npos);
  assert(text.find("hidden") == std::string::npos);
  assert(text.find("info Deposit refunded amount=10\n") != std::string::npos);
}

void TestReinitializeReplacesLogger() {
  const auto first  = LogPath("first");
  const auto second = LogPath("second");
  InitializeLogging(ConfigFor(first, "info"));
  InitializeLogging(ConfigFor(second, "warn"));

  LENDING_LOG_INFO("dropped");
  LENDING_LOG_WARN("Deposit forfeited", {UintField("amount", 10)});

  assert(ReadAll(second) == "warning Deposit forfeited amount=10\n");
  assert(ReadAll(first).find("Deposit forfeited") == std::string::npos);
}

} // namespace

int main() {
  ::unsetenv("LENDING_LOG_LEVEL");
  ::unsetenv("LENDING_LOG_PATTERN");
  ::unsetenv("LENDING_LOG_FILE");

  TestFieldsAreQuotedWhenNeeded();
  TestUnknownLevelFallsBackToInfo();
  TestReinitializeReplacesLogger();
  ShutdownLogging();

  std::cout << "lending_ledger_unit_logging: pass\n";
  return 0;
}
