// File: src/cli/careledger_cli.cpp
//
// Interactive CLI for CareLedger
// Ingests patient records, answers history queries and runs maintenance

#include "cli/careledger_cli.hpp"
#include "embedding/hashing_embedder.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <sstream>
#include <vector>

namespace careledger {

namespace {

bool LooksLikeDate(const std::string& token) {
    if (token.size() != 10 || token[4] != '-' || token[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < token.size(); ++i) {
        if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(token[i]))) {
            return false;
        }
    }
    return true;
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::string Preview(const std::string& text, size_t length = 80) {
    if (text.size() <= length) {
        return text;
    }
    return text.substr(0, length - 3) + "...";
}

} // namespace

CareLedgerCli::CareLedgerCli(const CliConfig& config, std::ostream& out)
    : config_(config),
      out_(out),
      colors_enabled_(config.interface.colors_enabled) {
    std::shared_ptr<RecordStore> store = CreateRecordStore(config_.ToStoreConfig());

    HashingEmbedder::Config embedder_config;
    embedder_config.dimension = config_.embedding.dimension;

    service_ = std::make_unique<MemoryService>(
        store,
        std::make_shared<HashingEmbedder>(embedder_config),
        config_.ToServiceConfig());
}

void CareLedgerCli::Run(std::istream& in) {
    PrintWelcome();

    std::string line;
    while (running_) {
        out_ << C(Color::BOLD_CYAN) << config_.interface.prompt << C(Color::RESET);
        out_.flush();
        if (!std::getline(in, line)) {
            break;
        }
        ProcessCommand(line);
    }

    service_->GetStore()->Flush();
    out_ << "\nGoodbye.\n";
}

void CareLedgerCli::PrintWelcome() {
    out_ << C(Color::BOLD_CYAN) << "CareLedger" << C(Color::RESET)
         << " - patient record memory\n"
         << "Storage: " << config_.storage.backend;
    if (config_.storage.backend == "sqlite") {
        out_ << " (" << config_.storage.db_path << ")";
    }
    out_ << ", " << service_->GetStore()->Count() << " records\n"
         << "Type 'help' for available commands.\n\n";
}

void CareLedgerCli::ProcessCommand(const std::string& input) {
    const std::string line = Trim(input);
    if (line.empty()) return;

    std::istringstream iss(line);
    std::string command;
    iss >> command;
    std::string args;
    std::getline(iss, args);
    args = Trim(args);

    commands_processed_++;

    try {
        if (command == "ingest") {
            Ingest(args);
        } else if (command == "query") {
            Query(args);
        } else if (command == "maintain") {
            Maintain(args);
        } else if (command == "purge") {
            Purge(args);
        } else if (command == "timeline") {
            ShowTimeline(args);
        } else if (command == "summary") {
            ShowSummary(args);
        } else if (command == "progression") {
            ShowProgression(args);
        } else if (command == "stats") {
            ShowStatistics();
        } else if (command == "help") {
            ShowHelp();
        } else if (command == "quit" || command == "exit") {
            running_ = false;
        } else {
            errors_++;
            out_ << "Unknown command: " << command << "\n";
            out_ << "Type 'help' for available commands.\n";
        }
    } catch (const std::invalid_argument& e) {
        // ValidationError and malformed dates
        errors_++;
        out_ << C(Color::RED) << "Invalid input: " << e.what() << C(Color::RESET) << "\n";
    } catch (const std::runtime_error& e) {
        errors_++;
        GetLogger()->error("Command '{}' failed: {}", command, e.what());
        out_ << C(Color::RED) << "Error: " << e.what() << C(Color::RESET) << "\n";
    }
}

// ============================================================================
// Commands
// ============================================================================

void CareLedgerCli::Ingest(const std::string& args) {
    const auto separator = args.find("::");
    if (separator == std::string::npos) {
        throw ValidationError("Usage: ingest <owner> [YYYY-MM-DD] [category] :: <text>");
    }

    std::istringstream head(args.substr(0, separator));
    std::string owner_id;
    head >> owner_id;

    std::optional<Timestamp> created_at;
    RecordContent content;
    content.text = Trim(args.substr(separator + 2));

    std::string token;
    while (head >> token) {
        if (!created_at && content.category.empty() && LooksLikeDate(token)) {
            created_at = Timestamp::ParseDate(token);
        } else if (content.category.empty()) {
            content.category = token;
        } else {
            content.tags.push_back(token);
        }
    }

    RecordID id = service_->Ingest(owner_id, content, created_at);
    out_ << C(Color::GREEN) << "Stored record #" << id.value() << " for " << owner_id
         << C(Color::RESET) << "\n";
}

void CareLedgerCli::Query(const std::string& args) {
    std::istringstream iss(args);
    QueryRequest request;
    iss >> request.owner_id;
    std::getline(iss, request.query_text);
    request.query_text = Trim(request.query_text);

    PrintOutcome(service_->Query(request));
}

void CareLedgerCli::PrintOutcome(const QueryOutcome& outcome) {
    const QueryResult& result = outcome.result;

    out_ << "Status: " << ToString(outcome.status);
    if (!outcome.failed_stages.empty()) {
        out_ << " (failed:";
        for (PipelineState stage : outcome.failed_stages) {
            out_ << " " << ToString(stage);
        }
        out_ << ")";
    }
    out_ << "\n";

    if (result.emergency_message) {
        out_ << C(Color::BOLD_RED) << *result.emergency_message << C(Color::RESET) << "\n";
    }

    if (result.summary) {
        out_ << "\n" << *result.summary << "\n";
    }

    if (!result.ranked_candidates.empty()) {
        out_ << "\nRelated records (" << result.ranked_candidates.size() << " of "
             << result.records_scanned << " scanned):\n";
        for (const auto& candidate : result.ranked_candidates) {
            out_ << fmt::format("  [{:<6}] {} {:<12} score {:.2f}  ",
                                ToString(candidate.partition),
                                candidate.created_at.ToDateString(),
                                candidate.content.category.empty() ? "-" : candidate.content.category,
                                candidate.final_score)
                 << C(Color::DIM) << Preview(candidate.content.text) << C(Color::RESET) << "\n";
        }
    }

    if (!result.insights.empty()) {
        out_ << "\n" << C(Color::YELLOW) << "Forgotten insights:" << C(Color::RESET) << "\n";
        for (const auto& insight : result.insights) {
            out_ << "  - " << insight.text << "\n";
        }
    }

    if (result.recommendations && !result.recommendations->empty()) {
        out_ << "\nRecommendations:\n";
        for (const auto& recommendation : *result.recommendations) {
            out_ << "  [" << ToString(recommendation.type) << "] " << recommendation.text << "\n";
        }
    }

    if (!result.safety_disclaimer.empty()) {
        out_ << "\n" << C(Color::DIM) << result.safety_disclaimer << C(Color::RESET) << "\n";
    }

    if (config_.interface.verbose) {
        out_ << fmt::format("\nReinforced {} record(s), {} level-up(s), {} failure(s)\n",
                            outcome.reinforcement.applied,
                            outcome.reinforcement.level_ups,
                            outcome.reinforcement.failed);
        for (const auto& error : outcome.stage_errors) {
            out_ << "  stage error: " << error << "\n";
        }
    }
}

void CareLedgerCli::Maintain(const std::string& args) {
    std::istringstream iss(args);
    std::string owner_id;
    std::string date;
    iss >> owner_id >> date;

    std::optional<Timestamp> as_of;
    if (!date.empty()) {
        as_of = Timestamp::ParseDate(date);
    }

    DecayReport report = service_->Maintain(owner_id, as_of);
    out_ << fmt::format("Examined {} record(s): {} decayed, {} protected, {} too young, {} already current",
                        report.examined, report.decayed_count, report.protected_count,
                        report.skipped_young, report.skipped_current);
    if (report.failed > 0) {
        out_ << ", " << C(Color::RED) << report.failed << " failed" << C(Color::RESET);
    }
    out_ << "\n";
}

void CareLedgerCli::Purge(const std::string& args) {
    std::istringstream iss(args);
    std::string owner_id;
    iss >> owner_id;

    size_t deleted = service_->Purge(owner_id);
    out_ << "Purged " << deleted << " record(s) for " << owner_id << "\n";
}

void CareLedgerCli::ShowTimeline(const std::string& args) {
    std::istringstream iss(args);
    std::string owner_id;
    iss >> owner_id;

    auto records = service_->Timeline(owner_id);
    if (records.empty()) {
        out_ << "No records for " << owner_id << "\n";
        return;
    }

    for (const auto& record : records) {
        const auto& content = record.GetContent();
        out_ << fmt::format("{} #{:<6} {:<12} weight {:.2f} accessed {:>3}  ",
                            record.GetCreatedAt().ToDateString(),
                            record.GetID().value(),
                            content.category.empty() ? "-" : content.category,
                            record.GetMemoryWeight(),
                            record.GetAccessCount())
             << Preview(content.text) << "\n";
    }
}

void CareLedgerCli::ShowSummary(const std::string& args) {
    std::istringstream iss(args);
    std::string owner_id;
    iss >> owner_id;

    MemorySummary summary = service_->Summary(owner_id);

    out_ << "Records: " << summary.total_records << "\n";
    if (summary.earliest && summary.latest) {
        out_ << "Span: " << summary.earliest->ToDateString() << " to "
             << summary.latest->ToDateString() << " (" << summary.span_days << " days)\n";
    }
    for (const auto& [category, count] : summary.records_by_category) {
        out_ << "  " << category << ": " << count << "\n";
    }

    out_ << fmt::format("Health: {} ({:.2f})\n", summary.health.status, summary.health.score);
    for (const auto& suggestion : summary.health.suggestions) {
        out_ << "  - " << suggestion << "\n";
    }
    for (const auto& pattern : summary.recurring_patterns) {
        out_ << "Pattern: " << pattern.description << "\n";
    }
    for (const auto& insight : summary.timeline_insights) {
        out_ << "Insight: " << insight.text << "\n";
    }
}

void CareLedgerCli::ShowProgression(const std::string& args) {
    std::istringstream iss(args);
    std::string owner_id;
    iss >> owner_id;

    std::string rest;
    std::getline(iss, rest);
    rest = Trim(rest);

    // Optional leading window in days
    int64_t window_days = 365;
    size_t digits = rest.find_first_not_of("0123456789");
    if (digits > 0 && digits != std::string::npos && rest[digits] == ' ') {
        if (digits > 6) {
            throw std::invalid_argument("Window of " + rest.substr(0, digits) + " days is too long");
        }
        window_days = std::stoll(rest.substr(0, digits));
        rest = Trim(rest.substr(digits));
    }

    SymptomProgression progression = service_->SymptomProgressionFor(owner_id, rest, window_days);
    if (progression.occurrences == 0) {
        out_ << "No records mention '" << progression.symptom << "' in the last "
             << window_days << " days\n";
        return;
    }

    out_ << fmt::format("{}: {} occurrence(s) in {} days, {}\n", progression.symptom,
                        progression.occurrences, window_days, progression.trend);
    out_ << "First: " << progression.first_occurrence->ToDateString()
         << "  Latest: " << progression.latest_occurrence->ToDateString() << "\n";
    if (progression.average_frequency_days > 0.0) {
        out_ << fmt::format("Average frequency: every {:.1f} days\n",
                            progression.average_frequency_days);
    }
    for (const auto& occurrence : progression.timeline) {
        out_ << "  " << occurrence.date.ToDateString() << " " << occurrence.category << "\n";
    }
}

void CareLedgerCli::ShowStatistics() {
    StorageStats storage = service_->GetStore()->GetStats();
    auto pipeline = service_->GetOrchestrator().GetStats();
    auto memory = service_->GetReinforcementEngine().GetStats();

    out_ << "Storage:\n";
    out_ << "  Records: " << storage.total_records << "\n";
    out_ << "  Owners: " << storage.total_owners << "\n";
    out_ << "  Reads / writes: " << storage.total_reads << " / " << storage.total_writes << "\n";
    if (storage.disk_usage_bytes > 0) {
        out_ << "  Disk usage: " << storage.disk_usage_bytes / 1024 << " KB\n";
    }

    out_ << "Queries:\n";
    out_ << "  Total: " << pipeline.queries << "\n";
    out_ << "  Accepted: " << pipeline.accepted << "\n";
    out_ << "  Degraded: " << pipeline.degraded << "\n";
    out_ << "  Rejected: " << pipeline.rejected << "\n";
    out_ << "  Invalid: " << pipeline.validation_errors << "\n";

    out_ << "Memory:\n";
    out_ << "  Reinforcements: " << memory.reinforcements << " (" << memory.level_ups << " level-ups)\n";
    out_ << "  Decays: " << memory.decays << " (" << memory.protected_decays << " protected)\n";
    out_ << "  Maintenance passes: " << memory.maintenance_passes << "\n";
}

void CareLedgerCli::ShowHelp() {
    out_ << R"(Commands:
  ingest <owner> [YYYY-MM-DD] [category] [tags...] :: <text>
                              Store a record (date defaults to today)
  query <owner> <text>        Search an owner's history
  maintain <owner> [YYYY-MM-DD]
                              Apply memory decay as of a date (default today)
  purge <owner>               Delete every record of an owner
  timeline <owner>            List an owner's records, oldest first
  summary <owner>             Categories, span, health and recurring patterns
  progression <owner> [days] <symptom>
                              How often a symptom was recorded (default 365 days)
  stats                       Storage, query and memory statistics
  help                        Show this help
  quit                        Exit
)";
}

} // namespace careledger
