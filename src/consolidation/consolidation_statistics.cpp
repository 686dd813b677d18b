#include "consolidation/consolidation_statistics.hpp"

#include <iomanip>
#include <numeric>
#include <sstream>

namespace ACE {
namespace Consolidation {

ConsolidationStatistics::ConsolidationStatistics() {
    reset();
}

void ConsolidationStatistics::reset() {
    entities_loaded_ = 0;
    entities_remaining_ = 0;
    candidates_by_method_.clear();
    candidates_filtered_ = 0;
    candidates_accepted_ = 0;
    dropped_by_reason_.clear();
    merges_succeeded_ = 0;
    merges_failed_ = 0;
    merges_not_found_ = 0;
    merges_resumed_ = 0;
    failures_resumed_ = 0;
    mentions_transferred_ = 0;
    rows_repointed_ = 0;
    rows_dropped_ = 0;
    persons_merged_ = 0;
    persons_moved_ = 0;
    mentions_recounted_ = 0;
    total_duration_ = std::chrono::duration<double>(0);
    phase_timings_.clear();
}

void ConsolidationStatistics::startTiming() {
    start_time_ = std::chrono::steady_clock::now();
}

void ConsolidationStatistics::stopTiming() {
    total_duration_ = std::chrono::steady_clock::now() - start_time_;
}

void ConsolidationStatistics::recordPhaseTime(const std::string& phase, std::chrono::duration<double> duration) {
    phase_timings_[phase] += duration;
}

void ConsolidationStatistics::recordMerge(const MergeOutcome& outcome) {
    merges_succeeded_++;
    mentions_transferred_ += outcome.mentions_transferred;
    rows_repointed_ += outcome.rows_repointed;
    rows_dropped_ += outcome.rows_dropped;
    if (outcome.person_action == PersonAction::MERGED) {
        persons_merged_++;
    } else if (outcome.person_action == PersonAction::MOVED) {
        persons_moved_++;
    }
}

void ConsolidationStatistics::recordFailure(Storage::MergeError kind) {
    // EN: NotFound is counted apart; it usually means the row vanished under us.
    // FR: NotFound est compté à part.
    if (kind == Storage::MergeError::NOT_FOUND) {
        merges_not_found_++;
    } else {
        merges_failed_++;
    }
}

void ConsolidationStatistics::seedFromCheckpoint(size_t merges_completed, size_t merges_failed) {
    merges_resumed_ = merges_completed;
    failures_resumed_ = merges_failed;
}

size_t ConsolidationStatistics::getCandidatesTotal() const {
    return std::accumulate(candidates_by_method_.begin(), candidates_by_method_.end(), size_t{0},
                           [](size_t sum, const auto& entry) { return sum + entry.second; });
}

size_t ConsolidationStatistics::getCandidatesDropped() const {
    return std::accumulate(dropped_by_reason_.begin(), dropped_by_reason_.end(), size_t{0},
                           [](size_t sum, const auto& entry) { return sum + entry.second; });
}

std::string ConsolidationStatistics::generateReport() const {
    std::ostringstream report;
    report << std::fixed << std::setprecision(2);

    report << "=== Consolidation Statistics ===\n";
    report << "Total Duration: " << total_duration_.count() << " seconds\n";

    report << "Entities:\n";
    report << "  - Loaded: " << entities_loaded_ << "\n";
    report << "  - Remaining: " << entities_remaining_ << "\n";

    report << "Candidates:\n";
    report << "  - Generated: " << getCandidatesTotal() << "\n";
    for (const auto& [method, count] : candidates_by_method_) {
        report << "    * " << method << ": " << count << "\n";
    }
    report << "  - Below minimum confidence: " << candidates_filtered_ << "\n";
    report << "  - Accepted: " << candidates_accepted_ << "\n";
    report << "  - Dropped: " << getCandidatesDropped() << "\n";
    for (const auto& [reason, count] : dropped_by_reason_) {
        report << "    * " << reason << ": " << count << "\n";
    }

    report << "Merges:\n";
    report << "  - Succeeded: " << merges_succeeded_ << "\n";
    report << "  - Failed: " << merges_failed_ << "\n";
    report << "  - Not Found: " << merges_not_found_ << "\n";
    if (merges_resumed_ > 0 || failures_resumed_ > 0) {
        report << "  - Carried from checkpoint: " << merges_resumed_ << " succeeded, "
               << failures_resumed_ << " failed\n";
    }
    report << "  - Mentions Transferred: " << mentions_transferred_ << "\n";
    report << "  - Rows Repointed: " << rows_repointed_ << "\n";
    report << "  - Duplicate Rows Dropped: " << rows_dropped_ << "\n";
    report << "  - Persons Merged/Moved: " << persons_merged_ << "/" << persons_moved_ << "\n";
    if (mentions_recounted_ > 0) {
        report << "  - Mention Counts Recomputed: " << mentions_recounted_ << "\n";
    }

    if (!phase_timings_.empty()) {
        report << "Phase Timings:\n";
        for (const auto& [phase, duration] : phase_timings_) {
            report << "  - " << phase << ": " << duration.count() << " seconds\n";
        }
    }

    return report.str();
}

nlohmann::json ConsolidationStatistics::toJson() const {
    nlohmann::json timings = nlohmann::json::object();
    for (const auto& [phase, duration] : phase_timings_) {
        timings[phase] = duration.count();
    }

    return nlohmann::json{
        {"duration_seconds", total_duration_.count()},
        {"entities", {{"loaded", entities_loaded_}, {"remaining", entities_remaining_}}},
        {"candidates", {
            {"generated", getCandidatesTotal()},
            {"by_method", candidates_by_method_},
            {"filtered", candidates_filtered_},
            {"accepted", candidates_accepted_},
            {"dropped", dropped_by_reason_}
        }},
        {"merges", {
            {"succeeded", merges_succeeded_},
            {"failed", merges_failed_},
            {"not_found", merges_not_found_},
            {"resumed_succeeded", merges_resumed_},
            {"resumed_failed", failures_resumed_},
            {"mentions_transferred", mentions_transferred_},
            {"rows_repointed", rows_repointed_},
            {"rows_dropped", rows_dropped_},
            {"persons_merged", persons_merged_},
            {"persons_moved", persons_moved_},
            {"mentions_recounted", mentions_recounted_}
        }},
        {"phase_timings", timings}
    };
}

} // namespace Consolidation
} // namespace ACE
