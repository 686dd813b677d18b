#pragma once

#include "core/entity.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace ACE {
namespace Consolidation {

// EN: Match methods. Core passes: ExactMatch, Reordering, FuzzyTypo. The others come from
//     the opt-in supplemental passes.
// FR: Méthodes de correspondance. Passes principales : ExactMatch, Reordering, FuzzyTypo.
//     Les autres proviennent des passes supplémentaires optionnelles.
struct ExactMatch {};
struct Reordering {};
struct FuzzyTypo {
    size_t distance = 0;
};
struct PrefixStripping {
    std::string prefix;
};
struct NicknameMatch {
    std::string first;
    std::string second;
};
struct KnownAlias {
    std::string canonical;
};

using MatchMethod = std::variant<ExactMatch, Reordering, FuzzyTypo, PrefixStripping, NicknameMatch, KnownAlias>;

// EN: Stable identifier written to the audit trail ("exact_match", "typo_correction"...).
// FR: Identifiant stable écrit dans la piste d'audit.
std::string methodName(const MatchMethod& method);

// EN: Proposed merge of `source` into `target`. Ephemeral; only its audit entry persists.
// FR: Fusion proposée de `source` dans `target`. Éphémère ; seule son entrée d'audit persiste.
struct MergeCandidate {
    EntityId source_id = 0;
    std::string source_name;
    std::int64_t source_mentions = 0;
    EntityId target_id = 0;
    std::string target_name;
    std::int64_t target_mentions = 0;
    double confidence = 0.0;
    MatchMethod method;
    std::string reason;
};

} // namespace Consolidation
} // namespace ACE
