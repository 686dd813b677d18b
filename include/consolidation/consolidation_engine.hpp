#pragma once

#include "consolidation/audit_logger.hpp"
#include "consolidation/chain_resolver.hpp"
#include "consolidation/checkpoint_store.hpp"
#include "consolidation/consolidation_config.hpp"
#include "consolidation/consolidation_statistics.hpp"
#include "storage/database.hpp"

#include <functional>
#include <string>

namespace ACE {
namespace Consolidation {

enum class RunStatus {
    COMPLETED,      // EN: All accepted merges attempted / FR: Toutes les fusions acceptées tentées
    DRY_RUN,        // EN: Plan computed, nothing written / FR: Plan calculé, rien écrit
    INTERRUPTED,    // EN: Stop requested, checkpoint written / FR: Arrêt demandé, checkpoint écrit
    FAILED          // EN: Could not load or plan / FR: Chargement ou planification impossible
};

std::string runStatusToString(RunStatus status);

struct RunResult {
    RunStatus status = RunStatus::FAILED;
    std::string message;
    ResolutionResult plan;
    bool audit_persisted = true;
};

// EN: Orchestrates one consolidation run for one entity type: load, generate, filter,
//     resolve, then either report the plan (dry-run) or execute it merge by merge.
// FR: Orchestre une exécution pour un type d'entité : chargement, génération, filtrage,
//     résolution, puis rapport du plan (simulation) ou exécution fusion par fusion.
class ConsolidationEngine {
public:
    using StopPredicate = std::function<bool()>;

    // EN: The stop predicate is polled between merges. The config must outlive the engine.
    // FR: Le prédicat d'arrêt est interrogé entre les fusions.
    ConsolidationEngine(Storage::Database& db, const ConsolidationConfig& config, AuditLogger& audit,
                        StopPredicate stop_requested = {});

    RunResult run();

    const ConsolidationStatistics& statistics() const { return stats_; }
    const std::string& runId() const { return run_id_; }

private:
    void restoreFromCheckpoint(CheckpointStore& store);
    void logPlan(const ResolutionResult& plan) const;
    // EN: Flush the audit sinks, then write the checkpoint with their offsets.
    //     Returns whether the flush succeeded.
    // FR: Vide les destinations d'audit puis écrit le checkpoint avec leurs positions.
    bool saveCheckpoint(CheckpointStore& store);
    bool stopRequested() const { return stop_requested_ && stop_requested_(); }

    template<typename Fn>
    auto timed(const std::string& phase, Fn&& fn) -> decltype(fn());

    Storage::Database& db_;
    const ConsolidationConfig& config_;
    AuditLogger& audit_;
    StopPredicate stop_requested_;
    ConsolidationStatistics stats_;
    std::string run_id_;
    size_t resumed_completed_ = 0;
    size_t resumed_failed_ = 0;
};

} // namespace Consolidation
} // namespace ACE
