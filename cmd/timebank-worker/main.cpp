#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using timebank::observability::IntField;
using timebank::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: timebank-worker --config <config.yaml> [--once] [--date YYYY-MM-DD]" << std::endl;
}

int main(int argc, char** argv) {
  std::string                config_path;
  bool                       once = false;
  std::optional<std::string> date_arg;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--once") {
      once = true;
    } else if (arg == "--date" && i + 1 < argc) {
      date_arg = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = timebank::config::ConfigLoader::LoadFromYaml(config_path);
    timebank::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto rt = timebank::factory::Build(config);

    if (once || date_arg) {
      const auto date    = date_arg ? timebank::util::FromDateString(*date_arg) : rt.clock->Today();
      const auto summary = rt.scheduler->RunOnce(date);
      TIMEBANK_LOG_INFO("daily run complete",
                        {StringField("date", timebank::util::FormatDate(summary.date)),
                         IntField("accrued", summary.accruals.accrued),
                         IntField("carryovers", summary.carryover.carryovers),
                         IntField("expirations", summary.expiration.expirations),
                         IntField("errors", summary.accruals.errors + summary.carryover.errors +
                                                summary.expiration.errors)});
      timebank::observability::ShutdownLogging();
      return 0;
    }

    // Register signal handlers before starting the scheduler thread.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    rt.scheduler->Start(config.scheduler().run_on_start());
    TIMEBANK_LOG_INFO("timebank worker started",
                      {IntField("interval_seconds", config.scheduler().interval_seconds())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TIMEBANK_LOG_INFO("Shutting down timebank worker");

    rt.scheduler->Stop();
    timebank::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TIMEBANK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    timebank::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
