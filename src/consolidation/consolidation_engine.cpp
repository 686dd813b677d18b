#include "consolidation/consolidation_engine.hpp"
#include "consolidation/candidate_generator.hpp"
#include "consolidation/confidence_scorer.hpp"
#include "consolidation/merge_executor.hpp"
#include "infrastructure/logging/logger.hpp"
#include "storage/entity_repository.hpp"

#include <sstream>
#include <unordered_map>

namespace ACE {
namespace Consolidation {

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED:   return "completed";
        case RunStatus::DRY_RUN:     return "dry_run";
        case RunStatus::INTERRUPTED: return "interrupted";
        case RunStatus::FAILED:      return "failed";
    }
    return "unknown";
}

ConsolidationEngine::ConsolidationEngine(Storage::Database& db, const ConsolidationConfig& config,
                                         AuditLogger& audit, StopPredicate stop_requested)
    : db_(db), config_(config), audit_(audit), stop_requested_(std::move(stop_requested)),
      run_id_(Logger::getInstance().generateCorrelationId()) {}

template<typename Fn>
auto ConsolidationEngine::timed(const std::string& phase, Fn&& fn) -> decltype(fn()) {
    auto start = std::chrono::steady_clock::now();
    auto result = fn();
    stats_.recordPhaseTime(phase, std::chrono::steady_clock::now() - start);
    return result;
}

RunResult ConsolidationEngine::run() {
    RunResult result;
    stats_.reset();
    stats_.startTiming();

    const std::string type_name = entityTypeToString(config_.entity_type);
    LOG_INFO("engine", std::string(config_.dry_run ? "Starting dry run" : "Starting live run") +
                       " for " + type_name + " entities on " + db_.path());

    // EN: Phase 1: resolve schema and load entities
    // FR: Phase 1 : résolution du schéma et chargement des entités
    auto schema = config_.schema.resolveAgainst(db_);
    if (!schema) {
        result.message = "schema check failed: " + schema.error().message;
        LOG_ERROR("engine", result.message);
        return result;
    }
    Storage::EntityRepository repository(db_, schema.value());

    auto entities = timed("load", [&]() { return repository.loadEntities(config_.entity_type); });
    if (!entities) {
        result.message = "cannot load entities: " + entities.error().message;
        LOG_ERROR("engine", result.message);
        return result;
    }
    stats_.setEntitiesLoaded(entities.value().size());

    CheckpointStore store(config_.checkpoint.path);
    bool checkpointing = !config_.dry_run && config_.checkpoint.enabled;
    if (checkpointing && config_.checkpoint.resume) {
        restoreFromCheckpoint(store);
    }

    // EN: Phase 2: generate, filter and resolve candidates
    // FR: Phase 2 : génération, filtrage et résolution des candidats
    CandidateGenerator generator(config_);
    auto candidates = timed("generate", [&]() { return generator.generate(entities.value()); });
    stats_.setCandidatesByMethod(generator.lastPassCounts());

    ConfidenceScorer scorer(config_.scoring);
    std::vector<MergeCandidate> retained;
    retained.reserve(candidates.size());
    for (auto& candidate : candidates) {
        if (scorer.accepts(candidate)) {
            retained.push_back(std::move(candidate));
        }
    }
    stats_.setCandidatesFiltered(candidates.size() - retained.size());

    ChainResolver resolver;
    result.plan = timed("resolve", [&]() { return resolver.resolve(std::move(retained)); });
    stats_.setCandidatesAccepted(result.plan.accepted.size());
    for (const auto& dropped : result.plan.dropped) {
        stats_.recordDropped(dropped.reason);
    }

    if (config_.dry_run) {
        logPlan(result.plan);
        stats_.setEntitiesRemaining(entities.value().size() - result.plan.accepted.size());
        stats_.stopTiming();
        result.status = RunStatus::DRY_RUN;
        LOG_INFO("engine", "Dry run complete: " + std::to_string(result.plan.accepted.size()) +
                           " merges planned, nothing written");
        return result;
    }

    // EN: Phase 3: execute sequentially, one transaction per merge
    // FR: Phase 3 : exécution séquentielle, une transaction par fusion
    MergeExecutor executor(db_, schema.value(), audit_);
    auto execute_start = std::chrono::steady_clock::now();
    size_t processed = 0;
    bool interrupted = false;

    for (const auto& candidate : result.plan.accepted) {
        if (stopRequested()) {
            interrupted = true;
            break;
        }

        auto outcome = executor.execute(candidate);
        if (outcome) {
            stats_.recordMerge(outcome.value());
        } else {
            const auto& error = outcome.error();
            stats_.recordFailure(error.kind);
            std::unordered_map<std::string, std::string> metadata = {
                {"source_id", std::to_string(candidate.source_id)},
                {"target_id", std::to_string(candidate.target_id)},
                {"error_kind", Storage::mergeErrorToString(error.kind)},
                {"sqlite_code", std::to_string(error.code)}
            };
            LOG_ERROR_META("engine", "Merge failed: " + error.message, metadata);
        }

        processed++;
        if (checkpointing && config_.checkpoint.interval > 0 && processed % config_.checkpoint.interval == 0) {
            saveCheckpoint(store);
        }
    }
    stats_.recordPhaseTime("execute", std::chrono::steady_clock::now() - execute_start);

    if (interrupted) {
        LOG_WARN("engine", "Stop requested after " + std::to_string(processed) + " of " +
                           std::to_string(result.plan.accepted.size()) + " merges");
        result.audit_persisted = checkpointing ? saveCheckpoint(store) : audit_.flush();
        stats_.setEntitiesRemaining(entities.value().size() - stats_.getMergesSucceeded());
        stats_.stopTiming();
        result.status = RunStatus::INTERRUPTED;
        result.message = "interrupted";
        return result;
    }

    if (config_.recount_mentions) {
        auto recounted = timed("recount", [&]() { return repository.recountMentions(config_.entity_type); });
        if (recounted) {
            stats_.setMentionsRecounted(static_cast<size_t>(recounted.value()));
        } else {
            LOG_ERROR("engine", "Mention recount failed: " + recounted.error().message);
        }
    }

    auto remaining = repository.countEntities(config_.entity_type);
    if (remaining) {
        stats_.setEntitiesRemaining(static_cast<size_t>(remaining.value()));
    } else {
        LOG_WARN("engine", "Cannot count remaining entities: " + remaining.error().message);
    }

    result.audit_persisted = audit_.flush();
    if (checkpointing) {
        // EN: Keep the checkpoint when the audit could not be written so a resume can retry.
        // FR: Conserve le checkpoint si l'audit n'a pu être écrit.
        if (result.audit_persisted) {
            store.remove();
        } else {
            saveCheckpoint(store);
        }
    }

    stats_.stopTiming();
    result.status = RunStatus::COMPLETED;

    std::unordered_map<std::string, std::string> metadata = {
        {"merges_succeeded", std::to_string(stats_.getMergesSucceeded())},
        {"merges_failed", std::to_string(stats_.getMergesFailed())},
        {"merges_not_found", std::to_string(stats_.getMergesNotFound())},
        {"mentions_transferred", std::to_string(stats_.getMentionsTransferred())}
    };
    LOG_INFO_META("engine", "Consolidation complete", metadata);
    return result;
}

void ConsolidationEngine::restoreFromCheckpoint(CheckpointStore& store) {
    auto checkpoint = store.load();
    if (!checkpoint) {
        LOG_INFO("engine", "No usable checkpoint at " + store.path() + ", starting fresh");
        return;
    }
    if (!checkpoint->matches(db_.path(), entityTypeToString(config_.entity_type))) {
        LOG_WARN("engine", "Checkpoint belongs to " + checkpoint->database_path + " (" +
                           checkpoint->entity_type + "), ignoring");
        return;
    }

    run_id_ = checkpoint->run_id;
    Logger::getInstance().setCorrelationId(run_id_);
    resumed_completed_ = checkpoint->merges_completed;
    resumed_failed_ = checkpoint->merges_failed;
    stats_.seedFromCheckpoint(resumed_completed_, resumed_failed_);
    audit_.restore(std::move(checkpoint->audit_entries), checkpoint->sink_offsets);
    LOG_INFO("engine", "Resuming run " + run_id_ + " after " + std::to_string(resumed_completed_) + " merges");
}

bool ConsolidationEngine::saveCheckpoint(CheckpointStore& store) {
    // EN: Flush first so the recorded offsets describe what each sink really holds.
    // FR: Vide d'abord l'audit pour que les positions enregistrées soient exactes.
    bool flushed = audit_.flush();
    if (!flushed) {
        LOG_WARN("engine", "Audit flush failed while checkpointing; pending entries stay in the checkpoint");
    }

    Checkpoint checkpoint;
    checkpoint.run_id = run_id_;
    checkpoint.timestamp = std::chrono::system_clock::now();
    checkpoint.database_path = db_.path();
    checkpoint.entity_type = entityTypeToString(config_.entity_type);
    checkpoint.merges_completed = resumed_completed_ + stats_.getMergesSucceeded();
    checkpoint.merges_failed = resumed_failed_ + stats_.getMergesFailed() + stats_.getMergesNotFound();
    checkpoint.audit_entries = audit_.entries();
    checkpoint.sink_offsets = audit_.appendOffsets();

    if (!store.save(checkpoint)) {
        LOG_WARN("engine", "Checkpoint could not be written to " + store.path());
    }
    return flushed;
}

void ConsolidationEngine::logPlan(const ResolutionResult& plan) const {
    for (const auto& candidate : plan.accepted) {
        std::unordered_map<std::string, std::string> metadata = {
            {"source_id", std::to_string(candidate.source_id)},
            {"target_id", std::to_string(candidate.target_id)},
            {"confidence", std::to_string(candidate.confidence)},
            {"method", methodName(candidate.method)},
            {"reason", candidate.reason}
        };
        LOG_INFO_META("plan", "Would merge \"" + candidate.source_name + "\" into \"" +
                              candidate.target_name + "\"", metadata);
    }
    for (const auto& dropped : plan.dropped) {
        std::unordered_map<std::string, std::string> metadata = {
            {"source_id", std::to_string(dropped.candidate.source_id)},
            {"target_id", std::to_string(dropped.candidate.target_id)},
            {"drop_reason", dropReasonToString(dropped.reason)}
        };
        LOG_INFO_META("plan", "Skipped \"" + dropped.candidate.source_name + "\"", metadata);
    }
}

} // namespace Consolidation
} // namespace ACE
