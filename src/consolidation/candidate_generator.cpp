// EN: Candidate generation passes: exact normalized match, token reordering, sliding-window
//     typo detection, and the opt-in prefix, nickname and known-alias passes.
// FR: Passes de génération de candidats : correspondance normalisée exacte, réordonnancement
//     des jetons, détection de fautes par fenêtre glissante, et passes optionnelles.

#include "consolidation/candidate_generator.hpp"
#include "consolidation/name_normalizer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace ACE {
namespace Consolidation {

namespace {

std::string joinTokens(const std::vector<std::string>& tokens, size_t from) {
    std::string out;
    for (size_t i = from; i < tokens.size(); ++i) {
        if (i > from) out += ' ';
        out += tokens[i];
    }
    return out;
}

// EN: Highest-ranked member of a group.
// FR: Membre de plus haut rang d'un groupe.
const Entity* topOf(const std::vector<const Entity*>& group) {
    const Entity* top = group.front();
    for (const Entity* member : group) {
        if (outranks(*member, *top)) {
            top = member;
        }
    }
    return top;
}

} // namespace

CandidateGenerator::CandidateSet::CandidateSet(const ConfidenceScorer& scorer,
                                               std::map<std::string, size_t>& counts)
    : scorer_(scorer), counts_(counts) {}

bool CandidateGenerator::CandidateSet::addRanked(const Entity& a, const Entity& b, const MatchMethod& method) {
    return outranks(a, b) ? addDirected(b, a, method) : addDirected(a, b, method);
}

bool CandidateGenerator::CandidateSet::addDirected(const Entity& source, const Entity& target,
                                                   const MatchMethod& method) {
    if (source.id == target.id) {
        return false;
    }
    auto key = std::minmax(source.id, target.id);
    if (!seen_.insert({key.first, key.second}).second) {
        return false;
    }

    MergeCandidate candidate;
    candidate.source_id = source.id;
    candidate.source_name = source.full_name;
    candidate.source_mentions = source.mentions;
    candidate.target_id = target.id;
    candidate.target_name = target.full_name;
    candidate.target_mentions = target.mentions;
    candidate.method = method;
    scorer_.apply(candidate);

    counts_[methodName(method)]++;
    candidates_.push_back(std::move(candidate));
    return true;
}

CandidateGenerator::CandidateGenerator(const ConsolidationConfig& config)
    : config_(config), scorer_(config.scoring) {}

std::vector<MergeCandidate> CandidateGenerator::generate(const std::vector<Entity>& entities) const {
    pass_counts_.clear();

    std::vector<PreparedEntity> prepared;
    prepared.reserve(entities.size());
    for (const auto& entity : entities) {
        PreparedEntity item;
        item.entity = &entity;
        item.normalized = NameNormalizer::normalize(entity.full_name);
        item.tokens = NameNormalizer::tokens(item.normalized);
        if (!item.normalized.empty()) {
            prepared.push_back(std::move(item));
        }
    }

    // EN: Id order makes every pass independent of the caller's ordering.
    // FR: L'ordre des id rend chaque passe indépendante de l'ordre fourni.
    std::sort(prepared.begin(), prepared.end(), [](const PreparedEntity& a, const PreparedEntity& b) {
        return a.entity->id < b.entity->id;
    });

    CandidateSet out(scorer_, pass_counts_);
    const PassSettings& passes = config_.passes;

    if (passes.exact_match) exactMatchPass(prepared, out);
    if (passes.reordering) reorderingPass(prepared, out);
    if (passes.fuzzy) fuzzyPass(prepared, out);
    if (passes.prefix_stripping) prefixStrippingPass(prepared, out);
    if (passes.nickname) nicknamePass(prepared, out);
    if (passes.known_alias) knownAliasPass(prepared, out);

    std::vector<MergeCandidate> candidates = out.take();

    std::unordered_map<std::string, std::string> metadata;
    for (const auto& [method, count] : pass_counts_) {
        metadata[method] = std::to_string(count);
    }
    metadata["entities"] = std::to_string(prepared.size());
    LOG_INFO_META("generator", "Generated " + std::to_string(candidates.size()) + " merge candidates", metadata);
    return candidates;
}

// EN: Pass 1: identical normalized names. The best-ranked member absorbs the others.
// FR: Passe 1 : noms normalisés identiques. Le membre de meilleur rang absorbe les autres.
void CandidateGenerator::exactMatchPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const {
    std::map<std::string, std::vector<const Entity*>> groups;
    for (const auto& item : prepared) {
        if (item.normalized.size() < config_.passes.min_key_length) {
            continue;
        }
        groups[item.normalized].push_back(item.entity);
    }

    for (const auto& [key, group] : groups) {
        if (group.size() < 2) continue;
        const Entity* target = topOf(group);
        for (const Entity* member : group) {
            if (member != target) {
                out.addDirected(*member, *target, ExactMatch{});
            }
        }
    }
}

// EN: Pass 2: same multiset of tokens ("Epstein Jeffrey" / "Jeffrey Epstein").
// FR: Passe 2 : même multiensemble de jetons.
void CandidateGenerator::reorderingPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const {
    std::map<std::string, std::vector<const Entity*>> groups;
    for (const auto& item : prepared) {
        if (item.tokens.size() < 2 || item.normalized.size() < config_.passes.min_key_length) {
            continue;
        }
        std::vector<std::string> sorted = item.tokens;
        std::sort(sorted.begin(), sorted.end());
        groups[joinTokens(sorted, 0)].push_back(item.entity);
    }

    for (const auto& [key, group] : groups) {
        if (group.size() < 2) continue;
        const Entity* target = topOf(group);
        for (const Entity* member : group) {
            if (member != target) {
                out.addDirected(*member, *target, Reordering{});
            }
        }
    }
}

// EN: Pass 3: sort by normalized name and compare each anchor with the next `window`
//     neighbours. Short names only accept one edit, long names up to the configured maximum.
// FR: Passe 3 : tri par nom normalisé et comparaison de chaque ancre avec les `window`
//     voisins suivants. Les noms courts n'acceptent qu'une édition.
void CandidateGenerator::fuzzyPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const {
    const PassSettings& passes = config_.passes;

    std::vector<const PreparedEntity*> sorted;
    sorted.reserve(prepared.size());
    for (const auto& item : prepared) {
        sorted.push_back(&item);
    }
    std::sort(sorted.begin(), sorted.end(), [](const PreparedEntity* a, const PreparedEntity* b) {
        if (a->normalized != b->normalized) return a->normalized < b->normalized;
        return a->entity->id < b->entity->id;
    });

    for (size_t i = 0; i < sorted.size(); ++i) {
        const PreparedEntity& anchor = *sorted[i];
        if (isStopWord(anchor.tokens.front())) continue;
        const size_t anchor_length = anchor.normalized.size();
        if (anchor_length < passes.fuzzy_min_anchor_length) continue;

        const size_t end = std::min(sorted.size(), i + 1 + passes.fuzzy_window);
        for (size_t j = i + 1; j < end; ++j) {
            const PreparedEntity& neighbour = *sorted[j];
            if (isStopWord(neighbour.tokens.front())) continue;
            if (anchor.normalized[0] != neighbour.normalized[0]) continue;

            const size_t neighbour_length = neighbour.normalized.size();
            const size_t delta = anchor_length > neighbour_length ? anchor_length - neighbour_length
                                                                  : neighbour_length - anchor_length;
            if (delta > passes.fuzzy_max_length_delta) continue;

            const size_t distance = NameNormalizer::levenshtein(anchor.normalized, neighbour.normalized);
            const bool short_name_typo = anchor_length >= passes.fuzzy_single_edit_min_length &&
                                         anchor_length <= passes.fuzzy_single_edit_max_length &&
                                         distance == 1;
            const bool long_name_typo = anchor_length > passes.fuzzy_single_edit_max_length &&
                                        distance <= passes.fuzzy_long_max_distance;
            if (short_name_typo || long_name_typo) {
                out.addRanked(*anchor.entity, *neighbour.entity, FuzzyTypo{distance});
            }
        }
    }
}

// EN: "President Bill Clinton" -> "Bill Clinton". The stripped remainder must keep two words.
// FR: "President Bill Clinton" -> "Bill Clinton". Le reste doit garder deux mots.
void CandidateGenerator::prefixStrippingPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const {
    const auto& prefixes = config_.passes.title_prefixes;

    std::map<std::string, const Entity*> by_name;
    for (const auto& item : prepared) {
        auto it = by_name.find(item.normalized);
        if (it == by_name.end() || outranks(*item.entity, *it->second)) {
            by_name[item.normalized] = item.entity;
        }
    }

    for (const auto& item : prepared) {
        if (item.tokens.size() < 3) continue;
        const std::string& first = item.tokens.front();
        if (std::find(prefixes.begin(), prefixes.end(), first) == prefixes.end()) continue;

        auto it = by_name.find(joinTokens(item.tokens, 1));
        if (it == by_name.end()) continue;
        out.addDirected(*item.entity, *it->second, PrefixStripping{first});
    }
}

// EN: "Bill Clinton" ~ "William Clinton": first names in one nickname group, identical rest.
// FR: "Bill Clinton" ~ "William Clinton" : prénoms du même groupe, reste identique.
void CandidateGenerator::nicknamePass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const {
    std::map<std::string, std::set<std::string>> groups_of;
    for (const auto& [formal, nicks] : config_.nicknames) {
        groups_of[formal].insert(formal);
        for (const auto& nick : nicks) {
            groups_of[nick].insert(formal);
        }
    }

    auto share_group = [&groups_of](const std::string& a, const std::string& b) {
        auto ia = groups_of.find(a);
        auto ib = groups_of.find(b);
        if (ia == groups_of.end() || ib == groups_of.end()) return false;
        for (const auto& formal : ia->second) {
            if (ib->second.count(formal)) return true;
        }
        return false;
    };

    std::map<std::string, std::vector<const PreparedEntity*>> by_rest;
    for (const auto& item : prepared) {
        if (item.tokens.size() < 2 || !groups_of.count(item.tokens.front())) continue;
        by_rest[joinTokens(item.tokens, 1)].push_back(&item);
    }

    for (const auto& [rest, bucket] : by_rest) {
        for (size_t i = 0; i < bucket.size(); ++i) {
            for (size_t j = i + 1; j < bucket.size(); ++j) {
                const PreparedEntity& a = *bucket[i];
                const PreparedEntity& b = *bucket[j];
                const std::string& first_a = a.tokens.front();
                const std::string& first_b = b.tokens.front();
                if (first_a == first_b || !share_group(first_a, first_b)) continue;

                if (outranks(*a.entity, *b.entity)) {
                    out.addDirected(*b.entity, *a.entity, NicknameMatch{first_b, first_a});
                } else {
                    out.addDirected(*a.entity, *b.entity, NicknameMatch{first_a, first_b});
                }
            }
        }
    }
}

// EN: Configured canonical name -> variants. The canonical entity is always the target.
// FR: Nom canonique configuré -> variantes. L'entité canonique est toujours la cible.
void CandidateGenerator::knownAliasPass(const std::vector<PreparedEntity>& prepared, CandidateSet& out) const {
    for (const auto& [canonical, variants] : config_.known_aliases) {
        const std::string canonical_key = NameNormalizer::normalize(canonical);

        const Entity* target = nullptr;
        for (const auto& item : prepared) {
            if (item.entity->full_name == canonical) {
                if (!target || outranks(*item.entity, *target)) target = item.entity;
            }
        }
        if (!target) {
            for (const auto& item : prepared) {
                if (item.normalized == canonical_key && (!target || outranks(*item.entity, *target))) {
                    target = item.entity;
                }
            }
        }
        if (!target) {
            LOG_DEBUG("generator", "Known alias canonical not found: " + canonical);
            continue;
        }

        std::set<std::string> variant_keys;
        for (const auto& variant : variants) {
            std::string key = NameNormalizer::normalize(variant);
            if (!key.empty()) variant_keys.insert(key);
        }

        for (const auto& item : prepared) {
            if (item.entity->id != target->id && variant_keys.count(item.normalized)) {
                out.addDirected(*item.entity, *target, KnownAlias{canonical});
            }
        }
    }
}

bool CandidateGenerator::isStopWord(const std::string& token) const {
    const auto& stop_words = config_.passes.stop_words;
    return std::find(stop_words.begin(), stop_words.end(), token) != stop_words.end();
}

} // namespace Consolidation
} // namespace ACE
