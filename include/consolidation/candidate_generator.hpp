#pragma once

#include "consolidation/confidence_scorer.hpp"
#include "consolidation/consolidation_config.hpp"
#include "consolidation/merge_candidate.hpp"
#include "core/entity.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ACE {
namespace Consolidation {

// EN: Runs the matching passes over all entities of one type and returns deduplicated,
//     scored candidates in pass order. Sources always rank below their targets except in
//     the prefix and known-alias passes, whose direction is fixed by the match itself.
// FR: Exécute les passes de correspondance sur toutes les entités d'un type et retourne des
//     candidats dédupliqués et notés, dans l'ordre des passes.
class CandidateGenerator {
public:
    explicit CandidateGenerator(const ConsolidationConfig& config);

    std::vector<MergeCandidate> generate(const std::vector<Entity>& entities) const;

    // EN: Candidate count produced by each method during the last generate() call.
    // FR: Nombre de candidats produits par méthode lors du dernier appel à generate().
    const std::map<std::string, size_t>& lastPassCounts() const { return pass_counts_; }

private:
    struct PreparedEntity {
        const Entity* entity = nullptr;
        std::string normalized;
        std::vector<std::string> tokens;
    };

    // EN: Candidate accumulator shared by all passes; one candidate per unordered pair.
    // FR: Accumulateur partagé par toutes les passes ; un candidat par paire non ordonnée.
    class CandidateSet {
    public:
        CandidateSet(const ConfidenceScorer& scorer, std::map<std::string, size_t>& counts);

        // EN: Orient by rank (fewer mentions -> more mentions, lowest id wins ties).
        // FR: Oriente selon le rang.
        bool addRanked(const Entity& a, const Entity& b, const MatchMethod& method);
        bool addDirected(const Entity& source, const Entity& target, const MatchMethod& method);

        std::vector<MergeCandidate> take() { return std::move(candidates_); }

    private:
        const ConfidenceScorer& scorer_;
        std::map<std::string, size_t>& counts_;
        std::set<std::pair<EntityId, EntityId>> seen_;
        std::vector<MergeCandidate> candidates_;
    };

    void exactMatchPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const;
    void reorderingPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const;
    void fuzzyPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const;
    void prefixStrippingPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const;
    void nicknamePass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const;
    void knownAliasPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const;

    bool isStopWord(const std::string& token) const;

    const ConsolidationConfig& config_;
    ConfidenceScorer scorer_;
    mutable std::map<std::string, size_t> pass_counts_;
};

} // namespace Consolidation
} // namespace ACE
