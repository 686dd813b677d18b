#include "consolidation/name_normalizer.hpp"

#include <algorithm>
#include <numeric>

namespace ACE {
namespace Consolidation {

namespace {

bool isWordChar(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool isSpaceChar(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ' ';
        out += parts[i];
    }
    return out;
}

} // namespace

std::string NameNormalizer::normalize(std::string_view name) {
    std::string out;
    out.reserve(name.size());

    bool pending_space = false;
    for (unsigned char c : name) {
        if (isSpaceChar(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (!isWordChar(c)) {
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
    }
    return out;
}

std::vector<std::string> NameNormalizer::tokens(std::string_view normalized) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start < normalized.size()) {
        size_t end = normalized.find(' ', start);
        if (end == std::string_view::npos) {
            end = normalized.size();
        }
        if (end > start) {
            result.emplace_back(normalized.substr(start, end - start));
        }
        start = end + 1;
    }
    return result;
}

std::string NameNormalizer::sortedTokenKey(std::string_view name) {
    std::vector<std::string> parts = tokens(normalize(name));
    std::sort(parts.begin(), parts.end());
    return join(parts);
}

bool NameNormalizer::isReordering(std::string_view a, std::string_view b) {
    std::vector<std::string> left = tokens(normalize(a));
    std::vector<std::string> right = tokens(normalize(b));
    if (left.size() < 2 || left.size() != right.size()) {
        return false;
    }
    std::sort(left.begin(), left.end());
    std::sort(right.begin(), right.end());
    return left == right;
}

size_t NameNormalizer::levenshtein(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) {
        std::swap(a, b);
    }
    // EN: Two rows over the shorter string.
    // FR: Deux lignes sur la chaîne la plus courte.
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);
    std::iota(previous.begin(), previous.end(), 0);

    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

} // namespace Consolidation
} // namespace ACE
