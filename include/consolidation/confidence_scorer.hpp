#pragma once

#include "consolidation/consolidation_config.hpp"
#include "consolidation/merge_candidate.hpp"

#include <string>

namespace ACE {
namespace Consolidation {

// EN: Assigns a 0-100 confidence to a match method and renders its human-readable reason.
// FR: Attribue une confiance 0-100 à une méthode de correspondance et produit sa raison lisible.
class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const ScoringSettings& settings);

    double score(const MatchMethod& method) const;
    std::string describe(const MatchMethod& method) const;

    // EN: Fill confidence and reason of a candidate from its method.
    // FR: Renseigne la confiance et la raison d'un candidat depuis sa méthode.
    void apply(MergeCandidate& candidate) const;

    // EN: Whether the candidate clears the configured minimum confidence.
    // FR: Indique si le candidat dépasse la confiance minimale configurée.
    bool accepts(const MergeCandidate& candidate) const;

private:
    const ScoringSettings& settings_;
};

} // namespace Consolidation
} // namespace ACE
