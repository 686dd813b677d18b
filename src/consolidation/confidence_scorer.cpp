#include "consolidation/confidence_scorer.hpp"

#include <algorithm>
#include <type_traits>

namespace ACE {
namespace Consolidation {

std::string methodName(const MatchMethod& method) {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExactMatch>) {
            return "exact_match";
        } else if constexpr (std::is_same_v<T, Reordering>) {
            return "name_reordering";
        } else if constexpr (std::is_same_v<T, FuzzyTypo>) {
            return "typo_correction";
        } else if constexpr (std::is_same_v<T, PrefixStripping>) {
            return "prefix_stripping";
        } else if constexpr (std::is_same_v<T, NicknameMatch>) {
            return "nickname_resolution";
        } else {
            static_assert(std::is_same_v<T, KnownAlias>, "unhandled match method");
            return "known_alias";
        }
    }, method);
}

ConfidenceScorer::ConfidenceScorer(const ScoringSettings& settings) : settings_(settings) {}

double ConfidenceScorer::score(const MatchMethod& method) const {
    double value = std::visit([this](const auto& m) -> double {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExactMatch>) {
            return settings_.exact_match;
        } else if constexpr (std::is_same_v<T, Reordering>) {
            return settings_.reordering;
        } else if constexpr (std::is_same_v<T, FuzzyTypo>) {
            return settings_.typo_base - settings_.typo_penalty_per_edit * static_cast<double>(m.distance);
        } else if constexpr (std::is_same_v<T, PrefixStripping>) {
            return settings_.prefix_stripping;
        } else if constexpr (std::is_same_v<T, NicknameMatch>) {
            return settings_.nickname;
        } else {
            static_assert(std::is_same_v<T, KnownAlias>, "unhandled match method");
            return settings_.known_alias;
        }
    }, method);
    return std::clamp(value, 0.0, 100.0);
}

std::string ConfidenceScorer::describe(const MatchMethod& method) const {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExactMatch>) {
            return "exact match (case-insensitive)";
        } else if constexpr (std::is_same_v<T, Reordering>) {
            return "name word order variation";
        } else if constexpr (std::is_same_v<T, FuzzyTypo>) {
            return "typo detected (edit distance: " + std::to_string(m.distance) + ")";
        } else if constexpr (std::is_same_v<T, PrefixStripping>) {
            return "prefix stripping: \"" + m.prefix + "\" removed";
        } else if constexpr (std::is_same_v<T, NicknameMatch>) {
            return "nickname match: " + m.first + " ~ " + m.second;
        } else {
            static_assert(std::is_same_v<T, KnownAlias>, "unhandled match method");
            return "known alias of \"" + m.canonical + "\"";
        }
    }, method);
}

void ConfidenceScorer::apply(MergeCandidate& candidate) const {
    candidate.confidence = score(candidate.method);
    candidate.reason = describe(candidate.method);
}

bool ConfidenceScorer::accepts(const MergeCandidate& candidate) const {
    return candidate.confidence >= settings_.min_confidence;
}

} // namespace Consolidation
} // namespace ACE
