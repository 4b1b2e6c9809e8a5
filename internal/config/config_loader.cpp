#include "config_loader.hpp"

#include <absl/time/time.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace timebank::config {

using timebank::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("1001" as an employee id)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsDefined() && !yaml.IsNull()) {
    YamlToProtoValue(yaml, &json_value);
  } else {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->backend_case() == timebank::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->lock_timeout_ms() == 0) {
    database->set_lock_timeout_ms(5000);
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(4);
  }

  auto* engine = config.mutable_engine();
  if (engine->max_conflict_retries() == 0) {
    engine->set_max_conflict_retries(3);
  }
  if (!engine->has_reject_overlapping_requests()) {
    engine->set_reject_overlapping_requests(true);
  }
  if (engine->default_workday_minutes() == 0) {
    engine->set_default_workday_minutes(480);
  }
  if (engine->default_work_start_minute() == 0) {
    engine->set_default_work_start_minute(540);
  }
  if (engine->default_timezone().empty()) {
    engine->set_default_timezone("UTC");
  }

  if (config.scheduler().interval_seconds() == 0) {
    config.mutable_scheduler()->set_interval_seconds(3600);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& engine = config.engine();
  if (engine.default_workday_minutes() > 24 * 60) {
    throw std::runtime_error("Invalid configuration: engine.default_workday_minutes exceeds one day");
  }
  if (engine.default_work_start_minute() >= 24 * 60) {
    throw std::runtime_error("Invalid configuration: engine.default_work_start_minute must be < 1440");
  }

  absl::TimeZone tz;
  if (!absl::LoadTimeZone(engine.default_timezone(), &tz)) {
    throw std::runtime_error("Invalid configuration: unknown time zone '" + engine.default_timezone() + "'");
  }

  for (const auto& employee : config.directory().employees()) {
    if (employee.company_id().empty() || employee.employee_id().empty()) {
      throw std::runtime_error("Invalid configuration: directory employees need company_id and employee_id");
    }
    if (!employee.timezone().empty() && !absl::LoadTimeZone(employee.timezone(), &tz)) {
      throw std::runtime_error("Invalid configuration: unknown time zone '" + employee.timezone() + "'");
    }
    if (!employee.hire_date().empty() && !util::TryParseDate(employee.hire_date())) {
      throw std::runtime_error("Invalid configuration: bad hire_date for employee " + employee.employee_id());
    }
  }
  for (const auto& holiday : config.directory().holidays()) {
    if (!util::TryParseDate(holiday.date())) {
      throw std::runtime_error("Invalid configuration: bad holiday date '" + holiday.date() + "'");
    }
  }
}

} // namespace timebank::config
