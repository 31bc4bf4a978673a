// File: examples/memory_evolution_demo.cpp
//
// Memory evolution walkthrough using the CareLedger core.
// Demonstrates:
// - Building a MemoryService over an in-memory store
// - Ingesting a patient history with backdated records
// - Querying and watching reinforcement change record weights
// - Running decay maintenance a year later
// - Surfacing a forgotten recommendation

#include "service/memory_service.hpp"
#include "embedding/hashing_embedder.hpp"
#include "storage/memory_backend.hpp"
#include "core/logging.hpp"
#include <iostream>
#include <iomanip>

using namespace careledger;

namespace {

RecordContent Content(const std::string& text, const std::string& category) {
    RecordContent content;
    content.text = text;
    content.category = category;
    return content;
}

void PrintWeights(MemoryService& service, const std::string& owner) {
    for (const auto& record : service.Timeline(owner)) {
        std::cout << "  " << record.GetCreatedAt().ToDateString()
                  << "  weight " << std::fixed << std::setprecision(3) << record.GetMemoryWeight()
                  << "  accesses " << record.GetAccessCount()
                  << "  level " << record.GetReinforcementLevel()
                  << "  " << record.GetContent().text << "\n";
    }
}

} // namespace

int main() {
    if (!ConfigureLogging("warn")) {
        std::cerr << "Unknown log level\n";
        return 1;
    }

    std::cout << "=== CareLedger Memory Evolution Demo ===\n\n";

    // Step 1: Create the service
    std::cout << "Step 1: Creating MemoryService...\n";
    auto store = std::make_shared<MemoryBackend>(MemoryBackend::Config{});
    MemoryService service(store, std::make_shared<HashingEmbedder>());
    std::cout << "  ✓ Service ready\n\n";

    // Step 2: Ingest a history relative to a fixed date
    const Timestamp today = Timestamp::ParseDate("2025-06-01");
    const std::string owner = "patient-042";

    std::cout << "Step 2: Ingesting patient history...\n";
    service.Ingest(owner, Content("Doctor recommended physical therapy for knee pain.", "doctor_note"),
                   today.PlusDays(-400));
    service.Ingest(owner, Content("Routine dental cleaning", "visit"), today.PlusDays(-60));
    service.Ingest(owner, Content("Knee pain getting worse when climbing stairs", "symptom"),
                   today.PlusDays(-15));
    std::cout << "  ✓ " << store->CountByOwner(owner) << " records stored\n\n";
    PrintWeights(service, owner);

    // Step 3: Query three times; returned records are reinforced each time
    std::cout << "\nStep 3: Querying 'knee pain is getting worse' three times...\n";
    QueryRequest request;
    request.owner_id = owner;
    request.query_text = "knee pain is getting worse";
    request.similarity_floor = 0.1f;
    request.as_of = today;

    QueryOutcome outcome;
    for (int i = 0; i < 3; ++i) {
        outcome = service.Query(request);
    }
    std::cout << "  Status: " << ToString(outcome.status) << ", "
              << outcome.result.ranked_candidates.size() << " related record(s)\n";
    for (const auto& candidate : outcome.result.ranked_candidates) {
        std::cout << "  [" << ToString(candidate.partition) << "] score "
                  << std::setprecision(3) << candidate.final_score
                  << "  " << candidate.content.text << "\n";
    }
    std::cout << "\n  Weights after reinforcement:\n";
    PrintWeights(service, owner);

    // Step 4: Forgotten insights
    std::cout << "\nStep 4: Forgotten insights\n";
    for (const auto& insight : outcome.result.insights) {
        std::cout << "  - " << insight.text << "\n";
    }
    if (outcome.result.insights.empty()) {
        std::cout << "  (none)\n";
    }

    // Step 5: Decay a year later
    std::cout << "\nStep 5: Maintenance one year later...\n";
    DecayReport report = service.Maintain(owner, today.PlusDays(365));
    std::cout << "  Examined " << report.examined << ", decayed " << report.decayed_count
              << ", protected " << report.protected_count << "\n";
    PrintWeights(service, owner);

    // Step 6: History summary
    MemorySummary summary = service.Summary(owner, today);
    std::cout << "\nStep 6: Summary\n"
              << "  Records: " << summary.total_records << " over " << summary.span_days << " days\n"
              << "  Health: " << summary.health.status << " (" << std::setprecision(2)
              << summary.health.score << ")\n";

    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
