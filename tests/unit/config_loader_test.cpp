#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using timebank::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "timebank_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full", R"(logging:
  level: debug
database:
  sqlite:
    path: "/tmp/timebank \"test\".db"
  lock_timeout_ms: 250
engine:
  max_conflict_retries: 5
  reject_overlapping_requests: false
  default_timezone: America/Chicago
scheduler:
  interval_seconds: 60
  run_on_start: true
directory:
  employees:
    - company_id: acme
      employee_id: "1001"
      timezone: Europe/Berlin
      hire_date: "2021-03-15"
      weekend_days: [friday, saturday]
  holidays:
    - company_id: acme
      date: "2025-12-25"
      name: Christmas Day
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/timebank \"test\".db");
  assert(config.database().lock_timeout_ms() == 250);
  assert(config.engine().max_conflict_retries() == 5);
  assert(!config.engine().reject_overlapping_requests());
  assert(config.engine().default_timezone() == "America/Chicago");
  assert(config.scheduler().interval_seconds() == 60);
  assert(config.scheduler().run_on_start());

  assert(config.directory().employees_size() == 1);
  const auto& employee = config.directory().employees(0);
  assert(employee.employee_id() == "1001");
  assert(employee.weekend_days_size() == 2);
  assert(employee.weekend_days(1) == "saturday");
  assert(config.directory().holidays(0).date() == "2025-12-25");
}

void TestDefaultsApplied() {
  const auto config = ConfigLoader::LoadFromString("logging:\n  level: info\n");
  assert(config.database().has_memory());
  assert(config.database().lock_timeout_ms() == 5000);
  assert(config.engine().max_conflict_retries() == 3);
  assert(config.engine().reject_overlapping_requests());
  assert(config.engine().default_workday_minutes() == 480);
  assert(config.engine().default_work_start_minute() == 540);
  assert(config.engine().default_timezone() == "UTC");
  assert(config.scheduler().interval_seconds() == 3600);

  const auto empty = ConfigLoader::LoadFromString("");
  assert(empty.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("engine:\n  max_conflict_retries: 3\nunknown_field: 123\n"));
  assert(Rejects("engine:\n  reject_overlaps: true\n"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 2\n"));
  assert(Rejects("engine:\n  default_timezone: Mars/Olympus\n"));
  assert(Rejects("engine:\n  default_work_start_minute: 1440\n"));
  assert(Rejects("directory:\n  employees:\n    - company_id: acme\n      employee_id: \"1\"\n"
                 "      hire_date: \"15/03/2021\"\n"));
  assert(Rejects("directory:\n  holidays:\n    - company_id: acme\n      date: tomorrow\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/timebank.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must report unreadable files.");
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestDefaultsApplied();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "timebank_unit_config_loader: pass\n";
  return 0;
}
