#pragma once

#include "consolidation/merge_candidate.hpp"
#include "core/entity.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ACE {
namespace Consolidation {

// EN: Disjoint-set forest over entity ids with path compression. A node absent from the
//     forest is its own root.
// FR: Forêt d'ensembles disjoints sur les id d'entité avec compression de chemin.
class RedirectForest {
public:
    EntityId find(EntityId id);

    // EN: Point `source` at `root`. `source` must currently be a root.
    // FR: Fait pointer `source` vers `root`. `source` doit être une racine.
    void link(EntityId source, EntityId root);

    bool isRedirected(EntityId id) const { return parent_.count(id) > 0; }
    size_t size() const { return parent_.size(); }

private:
    std::unordered_map<EntityId, EntityId> parent_;
};

enum class DropReason {
    ALREADY_REDIRECTED,
    CIRCULAR
};

std::string dropReasonToString(DropReason reason);

struct DroppedCandidate {
    MergeCandidate candidate;
    DropReason reason;
};

struct ResolutionResult {
    // EN: Accepted candidates in execution order, targets rewritten to their final root.
    // FR: Candidats acceptés dans l'ordre d'exécution, cibles réécrites vers la racine finale.
    std::vector<MergeCandidate> accepted;
    std::vector<DroppedCandidate> dropped;
    // EN: source id -> final target id.
    // FR: id source -> id cible finale.
    std::unordered_map<EntityId, EntityId> redirects;
};

// EN: Collapses overlapping and chained candidates into a safe redirect map: no entity is
//     merged away twice, no merge targets an entity deleted later in the run, chains
//     A->B->C become A->C and B->C.
// FR: Réduit les candidats chevauchants ou chaînés en une table de redirection sûre.
class ChainResolver {
public:
    // EN: Candidates are stably sorted by confidence descending before the walk.
    // FR: Les candidats sont triés de façon stable par confiance décroissante avant le parcours.
    ResolutionResult resolve(std::vector<MergeCandidate> candidates) const;
};

} // namespace Consolidation
} // namespace ACE
