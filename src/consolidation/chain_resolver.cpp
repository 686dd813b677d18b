#include "consolidation/chain_resolver.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace ACE {
namespace Consolidation {

EntityId RedirectForest::find(EntityId id) {
    EntityId root = id;
    for (auto it = parent_.find(root); it != parent_.end(); it = parent_.find(root)) {
        root = it->second;
    }

    // EN: Path compression.
    // FR: Compression de chemin.
    EntityId current = id;
    while (current != root) {
        auto it = parent_.find(current);
        EntityId next = it->second;
        it->second = root;
        current = next;
    }
    return root;
}

void RedirectForest::link(EntityId source, EntityId root) {
    parent_[source] = root;
}

std::string dropReasonToString(DropReason reason) {
    switch (reason) {
        case DropReason::ALREADY_REDIRECTED: return "already_redirected";
        case DropReason::CIRCULAR:           return "circular";
    }
    return "unknown";
}

ResolutionResult ChainResolver::resolve(std::vector<MergeCandidate> candidates) const {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const MergeCandidate& a, const MergeCandidate& b) {
                         return a.confidence > b.confidence;
                     });

    ResolutionResult result;
    RedirectForest forest;

    struct Side {
        std::string name;
        std::int64_t mentions = 0;
    };
    std::unordered_map<EntityId, Side> sides;
    for (const auto& candidate : candidates) {
        sides[candidate.source_id] = {candidate.source_name, candidate.source_mentions};
        sides[candidate.target_id] = {candidate.target_name, candidate.target_mentions};
    }

    for (auto& candidate : candidates) {
        if (forest.isRedirected(candidate.source_id)) {
            LOG_DEBUG("resolver", "Dropping candidate, source already redirected: " +
                      std::to_string(candidate.source_id) + " -> " + std::to_string(candidate.target_id));
            result.dropped.push_back({std::move(candidate), DropReason::ALREADY_REDIRECTED});
            continue;
        }

        EntityId root = forest.find(candidate.target_id);
        if (root == candidate.source_id) {
            LOG_WARN("resolver", "Dropping circular candidate: " + std::to_string(candidate.source_id) +
                     " -> " + std::to_string(candidate.target_id));
            result.dropped.push_back({std::move(candidate), DropReason::CIRCULAR});
            continue;
        }

        forest.link(candidate.source_id, root);
        result.accepted.push_back(std::move(candidate));
    }

    // EN: Later links may have moved a target; re-resolve so every merge points at a survivor.
    // FR: Des liens ultérieurs ont pu déplacer une cible ; on re-résout vers un survivant.
    for (auto& candidate : result.accepted) {
        EntityId final_target = forest.find(candidate.target_id);
        if (final_target != candidate.target_id) {
            LOG_DEBUG("resolver", "Collapsed chain for " + std::to_string(candidate.source_id) + ": " +
                      std::to_string(candidate.target_id) + " -> " + std::to_string(final_target));
            candidate.target_id = final_target;
            const Side& side = sides[final_target];
            candidate.target_name = side.name;
            candidate.target_mentions = side.mentions;
        }
        result.redirects[candidate.source_id] = final_target;
    }

    std::unordered_map<std::string, std::string> metadata = {
        {"accepted", std::to_string(result.accepted.size())},
        {"dropped", std::to_string(result.dropped.size())}
    };
    LOG_INFO_META("resolver", "Resolved merge plan", metadata);
    return result;
}

} // namespace Consolidation
} // namespace ACE
