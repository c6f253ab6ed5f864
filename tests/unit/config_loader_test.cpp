#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/engine_options.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "goalgraph_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\goals\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = goalgraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\goals\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = goalgraph::config::ConfigLoader::LoadFromString(R"(lifecycle:
  default_lock_rationale: "42"
  calendar_notes_signature: "line1\nline2☃"
)");
  assert(config.lifecycle().default_lock_rationale() == "42");
  assert(config.lifecycle().calendar_notes_signature() == std::string("line1\nline2☃"));
}

void TestLoggingSection() {
  auto config = goalgraph::config::ConfigLoader::LoadFromString(R"(logging:
  level: warn
  file: /tmp/goalgraph.log
)");
  assert(config.logging().level() == "warn");
  assert(config.logging().file() == "/tmp/goalgraph.log");
  assert(config.logging().pattern().empty());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)goalgraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)goalgraph::config::ConfigLoader::LoadFromYaml("/nonexistent/goalgraph.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEngineOptionsDefaultsAndOverrides() {
  const auto defaults = goalgraph::config::ResolveEngineOptions(goalgraph::config::ConfigLoader::LoadFromString("logging:\n  level: debug\n"));
  assert(defaults.step_hard_limit == 15);
  assert(defaults.step_soft_warning == 12);
  assert(defaults.default_step_days == 7);
  assert(defaults.default_span_days == 14);

  auto config = goalgraph::config::ConfigLoader::LoadFromString(R"(roadmap:
  step_hard_limit: 20
  step_soft_warning: 18
timeline:
  planned_phase_days: 5
lifecycle:
  calendar_notes_signature: "Booked by the planner"
)");
  const auto options = goalgraph::config::ResolveEngineOptions(config);
  assert(options.step_hard_limit == 20);
  assert(options.step_soft_warning == 18);
  assert(options.planned_phase_days == 5);
  assert(options.calendar_notes_signature == "Booked by the planner");
  assert(options.default_lock_rationale == defaults.default_lock_rationale);
}

void TestSoftWarningAboveHardLimitIsRejected() {
  auto config = goalgraph::config::ConfigLoader::LoadFromString(R"(roadmap:
  step_hard_limit: 5
  step_soft_warning: 9
)");

  bool threw = false;
  try {
    (void)goalgraph::config::ResolveEngineOptions(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestLoggingSection();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestEngineOptionsDefaultsAndOverrides();
  TestSoftWarningAboveHardLimitIsRejected();

  std::cout << "goalgraph_unit_config_loader: pass\n";
  return 0;
}
