#pragma once

#include "consolidation/chain_resolver.hpp"
#include "consolidation/merge_executor.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace ACE {
namespace Consolidation {

// EN: Counters and phase timings of one consolidation run. Owned by the executing thread.
// FR: Compteurs et chronométrages de phases d'une exécution. Appartient au thread exécutant.
class ConsolidationStatistics {
public:
    ConsolidationStatistics();

    // EN: Reset all statistics
    // FR: Remet à zéro toutes les statistiques
    void reset();

    // EN: Timing operations
    // FR: Opérations de chronométrage
    void startTiming();
    void stopTiming();
    void recordPhaseTime(const std::string& phase, std::chrono::duration<double> duration);

    void setEntitiesLoaded(size_t count) { entities_loaded_ = count; }
    void setEntitiesRemaining(size_t count) { entities_remaining_ = count; }
    void setCandidatesByMethod(const std::map<std::string, size_t>& counts) { candidates_by_method_ = counts; }
    void setCandidatesFiltered(size_t count) { candidates_filtered_ = count; }
    void setCandidatesAccepted(size_t count) { candidates_accepted_ = count; }
    void recordDropped(DropReason reason) { dropped_by_reason_[dropReasonToString(reason)]++; }
    void recordMerge(const MergeOutcome& outcome);
    void recordFailure(Storage::MergeError kind);
    void setMentionsRecounted(size_t count) { mentions_recounted_ = count; }

    // EN: Seed counters carried over from an interrupted run.
    // FR: Initialise les compteurs repris d'une exécution interrompue.
    void seedFromCheckpoint(size_t merges_completed, size_t merges_failed);

    size_t getEntitiesLoaded() const { return entities_loaded_; }
    size_t getEntitiesRemaining() const { return entities_remaining_; }
    size_t getCandidatesTotal() const;
    size_t getCandidatesFiltered() const { return candidates_filtered_; }
    size_t getCandidatesAccepted() const { return candidates_accepted_; }
    size_t getCandidatesDropped() const;
    size_t getMergesSucceeded() const { return merges_succeeded_; }
    size_t getMergesFailed() const { return merges_failed_; }
    size_t getMergesNotFound() const { return merges_not_found_; }
    size_t getMergesResumed() const { return merges_resumed_; }
    std::int64_t getMentionsTransferred() const { return mentions_transferred_; }
    std::int64_t getRowsRepointed() const { return rows_repointed_; }
    std::int64_t getRowsDropped() const { return rows_dropped_; }
    size_t getPersonsMerged() const { return persons_merged_; }
    size_t getPersonsMoved() const { return persons_moved_; }
    const std::map<std::string, size_t>& getCandidatesByMethod() const { return candidates_by_method_; }
    const std::map<std::string, size_t>& getDroppedByReason() const { return dropped_by_reason_; }
    std::chrono::duration<double> getTotalDuration() const { return total_duration_; }
    const std::map<std::string, std::chrono::duration<double>>& getPhaseTimings() const { return phase_timings_; }

    // EN: Generate comprehensive statistics report
    // FR: Génère un rapport de statistiques complet
    std::string generateReport() const;
    nlohmann::json toJson() const;

private:
    size_t entities_loaded_ = 0;
    size_t entities_remaining_ = 0;
    std::map<std::string, size_t> candidates_by_method_;
    size_t candidates_filtered_ = 0;
    size_t candidates_accepted_ = 0;
    std::map<std::string, size_t> dropped_by_reason_;
    size_t merges_succeeded_ = 0;
    size_t merges_failed_ = 0;
    size_t merges_not_found_ = 0;
    size_t merges_resumed_ = 0;
    size_t failures_resumed_ = 0;
    std::int64_t mentions_transferred_ = 0;
    std::int64_t rows_repointed_ = 0;
    std::int64_t rows_dropped_ = 0;
    size_t persons_merged_ = 0;
    size_t persons_moved_ = 0;
    size_t mentions_recounted_ = 0;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::duration<double> total_duration_{0};
    std::map<std::string, std::chrono::duration<double>> phase_timings_;
};

} // namespace Consolidation
} // namespace ACE
