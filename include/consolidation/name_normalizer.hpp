#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ACE {
namespace Consolidation {

// EN: Canonicalizes raw entity names for comparison.
// FR: Canonicalise les noms d'entité bruts pour la comparaison.
class NameNormalizer {
public:
    // EN: ASCII-lowercase, drop every character that is neither a word character
    //     ([A-Za-z0-9_]) nor whitespace, collapse whitespace runs and trim. Idempotent.
    // FR: Minuscules ASCII, suppression de tout caractère ni alphanumérique ni espace,
    //     fusion des espaces et rognage. Idempotent.
    static std::string normalize(std::string_view name);

    // EN: Split an already normalized name on single spaces.
    // FR: Découpe un nom déjà normalisé sur les espaces.
    static std::vector<std::string> tokens(std::string_view normalized);

    // EN: Normalized tokens sorted and re-joined: "Epstein, Jeffrey" -> "epstein jeffrey".
    // FR: Jetons normalisés triés puis rejoints.
    static std::string sortedTokenKey(std::string_view name);

    // EN: Same multiset of at least two tokens on both sides.
    // FR: Même multiensemble d'au moins deux jetons des deux côtés.
    static bool isReordering(std::string_view a, std::string_view b);

    // EN: Levenshtein edit distance, unit costs.
    // FR: Distance d'édition de Levenshtein, coûts unitaires.
    static size_t levenshtein(std::string_view a, std::string_view b);
};

} // namespace Consolidation
} // namespace ACE
