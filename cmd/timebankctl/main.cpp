#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/codec/settings_codec.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/payroll_codec.hpp"

using namespace timebank;

static void Usage() {
  std::cout << "Usage:\n"
            << "  timebankctl --config <file> create-policy <company> <key> <category> <effective_from> <settings.json>\n"
            << "  timebankctl --config <file> add-version <policy> <effective_from> <settings.json> [reason]\n"
            << "  timebankctl --config <file> assign <company> <employee> <policy> <from> [to]\n"
            << "  timebankctl --config <file> submit <company> <employee> <policy> <start> <end> [idempotency_key]\n"
            << "  timebankctl --config <file> approve <request> <actor> [note]\n"
            << "  timebankctl --config <file> deny <request> <actor> [note]\n"
            << "  timebankctl --config <file> cancel <request> <actor>\n"
            << "  timebankctl --config <file> adjust <company> <employee> <policy> <minutes> <reason> <actor>\n"
            << "  timebankctl --config <file> run-accruals <date>\n"
            << "  timebankctl --config <file> run-carryover <date>\n"
            << "  timebankctl --config <file> run-expiration <date>\n"
            << "  timebankctl --config <file> payroll <payload.json>\n"
            << "  timebankctl --config <file> balance <company> <employee> <policy>\n"
            << "  timebankctl --config <file> ledger <company> <employee> <policy>\n"
            << "  timebankctl --config <file> rebuild <company> <employee> <policy>\n"
            << "  timebankctl --config <file> audit <company> [entity_type]\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("unable to open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static void PrintRequest(const model::TimeOffRequest& request) {
  std::cout << "id=" << request.id << "\n";
  std::cout << "status=" << model::ToString(request.status) << "\n";
  std::cout << "requested_minutes=" << request.requested_minutes << "\n";
}

static void PrintAccruals(const service::AccrualRunSummary& summary) {
  std::cout << "processed=" << summary.processed << "\n";
  std::cout << "accrued=" << summary.accrued << "\n";
  std::cout << "skipped=" << summary.skipped << "\n";
  std::cout << "errors=" << summary.errors << "\n";
}

static void PrintCarryover(const service::CarryoverRunSummary& summary) {
  std::cout << "carryovers=" << summary.carryovers << "\n";
  std::cout << "expirations=" << summary.expirations << "\n";
  std::cout << "skipped=" << summary.skipped << "\n";
  std::cout << "errors=" << summary.errors << "\n";
}

static int Dispatch(factory::Runtime& rt, const std::vector<std::string>& args) {
  const auto& cmd  = args[0];
  const auto  argc = args.size();

  // ------------------------------------------------------------

  if (cmd == "create-policy") {
    if (argc < 6) return 1;

    policy::NewPolicyVersion initial;
    initial.effective_from = util::FromDateString(args[4]);
    initial.settings       = db::codec::DecodeSettings(ReadFile(args[5]));
    initial.created_by     = "timebankctl";
    initial.change_reason  = "initial version";

    auto created = rt.policies->CreatePolicy(args[1], args[2], args[3], initial);
    std::cout << "policy=" << created.policy.id << "\n";
    std::cout << "version=" << created.version.version << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-version") {
    if (argc < 4) return 1;

    policy::NewPolicyVersion next;
    next.effective_from = util::FromDateString(args[2]);
    next.settings       = db::codec::DecodeSettings(ReadFile(args[3]));
    next.created_by     = "timebankctl";
    next.change_reason  = argc >= 5 ? args[4] : "";

    auto version = rt.policies->Create(args[1], next);
    std::cout << "version=" << version.version << "\n";
    std::cout << "version_id=" << version.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    if (argc < 5) return 1;

    std::optional<util::Date> to;
    if (argc >= 6) to = util::FromDateString(args[5]);

    auto assignment =
        rt.assignments->Assign(args[1], args[2], args[3], util::FromDateString(args[4]), to, "timebankctl");
    std::cout << "assignment=" << assignment.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 6) return 1;

    service::SubmitRequestInput input;
    input.company_id      = args[1];
    input.employee_id     = args[2];
    input.policy_id       = args[3];
    input.start_at        = util::ParseTimestamp(args[4]);
    input.end_at          = util::ParseTimestamp(args[5]);
    input.idempotency_key = argc >= 7 ? args[6] : "";
    input.actor_id        = args[2];

    PrintRequest(rt.requests->SubmitRequest(input));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "approve" || cmd == "deny") {
    if (argc < 3) return 1;

    const std::string note = argc >= 4 ? args[3] : "";
    PrintRequest(cmd == "approve" ? rt.requests->Approve(args[1], args[2], note)
                                  : rt.requests->Deny(args[1], args[2], note));
    return 0;
  }

  if (cmd == "cancel") {
    if (argc < 3) return 1;

    PrintRequest(rt.requests->Cancel(args[1], args[2]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "adjust") {
    if (argc < 7) return 1;

    service::AdjustmentInput input;
    input.company_id     = args[1];
    input.employee_id    = args[2];
    input.policy_id      = args[3];
    input.amount_minutes = std::stoll(args[4]);
    input.reason         = args[5];
    input.actor_id       = args[6];

    auto entry = rt.balances->PostAdjustment(input);
    std::cout << "entry=" << entry.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run-accruals") {
    if (argc < 2) return 1;

    PrintAccruals(rt.accruals->RunAccruals(util::FromDateString(args[1])));
    return 0;
  }

  if (cmd == "run-carryover") {
    if (argc < 2) return 1;

    PrintCarryover(rt.carryover->RunCarryover(util::FromDateString(args[1])));
    return 0;
  }

  if (cmd == "run-expiration") {
    if (argc < 2) return 1;

    PrintCarryover(rt.carryover->RunExpiration(util::FromDateString(args[1])));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "payroll") {
    if (argc < 2) return 1;

    auto summary = rt.accruals->ProcessPayroll(service::LoadPayrollEvent(args[1]));
    std::cout << "payroll_run_id=" << summary.payroll_run_id << "\n";
    std::cout << "processed=" << summary.processed << "\n";
    std::cout << "accrued=" << summary.accrued << "\n";
    std::cout << "skipped=" << summary.skipped << "\n";
    std::cout << "errors=" << summary.errors << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance" || cmd == "rebuild") {
    if (argc < 4) return 1;

    const model::BalanceKey key{args[1], args[2], args[3]};
    if (cmd == "rebuild") {
      rt.balances->RebuildBalance(key);
    }

    auto view = rt.balances->GetBalance(key);
    std::cout << "accrued=" << view.totals.accrued_minutes << "\n";
    std::cout << "used=" << view.totals.used_minutes << "\n";
    std::cout << "held=" << view.totals.held_minutes << "\n";
    if (view.available_minutes) {
      std::cout << "available=" << *view.available_minutes << "\n";
    } else {
      std::cout << "available=unlimited\n";
    }
    std::cout << "version=" << view.version << "\n";
    return 0;
  }

  if (cmd == "ledger") {
    if (argc < 4) return 1;

    for (const auto& entry : rt.balances->ListLedger({args[1], args[2], args[3]})) {
      std::cout << util::FormatTimestamp(entry.effective_at) << " " << model::ToString(entry.entry_type) << " "
                << entry.amount_minutes << " " << model::ToString(entry.source_type) << ":" << entry.source_id
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "audit") {
    if (argc < 2) return 1;

    model::AuditFilter filter;
    filter.company_id = args[1];
    if (argc >= 3) filter.entity_type = args[2];

    for (const auto& record : rt.balances->QueryAuditLog(filter)) {
      std::cout << util::FormatTimestamp(record.created_at) << " " << record.actor_id << " " << record.entity_type
                << "/" << record.entity_id << " " << record.action << " " << record.detail << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto rt     = factory::Build(config);
    int  status = Dispatch(rt, args);
    if (status == 1) {
      Usage();
    }
    observability::ShutdownLogging();
    return status;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  }
}
