#include "runner/text_merge.hpp"
#include "document/utf8.hpp"

#include <algorithm>
#include <vector>

namespace text_merge {

double levenshtein_ratio(std::u32string_view a, std::u32string_view b) {
    const size_t lensum = a.size() + b.size();
    if (lensum == 0) return 1.0;

    // Single-row DP, substitution weighted 2.
    std::vector<size_t> row(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) row[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        size_t diag = row[0];
        row[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t up = row[j];
            size_t sub = diag + (a[i - 1] == b[j - 1] ? 0 : 2);
            row[j] = std::min({row[j] + 1, row[j - 1] + 1, sub});
            diag = up;
        }
    }

    auto dist = static_cast<double>(row[b.size()]);
    return (static_cast<double>(lensum) - dist) / static_cast<double>(lensum);
}

Merge merge_overlapping(std::string_view first, std::string_view second,
                        double threshold, size_t max_chars) {
    Merge out;

    auto a = utf8::decode(first);
    auto b = utf8::decode(second);
    if (!a || !b) {
        out.text = std::string(first) + std::string(second);
        return out;
    }

    size_t range = std::min({a->size(), b->size(), max_chars});
    std::u32string_view av(*a);
    std::u32string_view bv(*b);

    for (size_t i = 1; i <= range; ++i) {
        double score = levenshtein_ratio(av.substr(av.size() - i), bv.substr(0, i));
        if (score >= threshold) {
            out.match = i;
            out.score = score;
        }
    }

    out.text = std::string(first) + utf8::encode(bv.substr(out.match));
    return out;
}

} // namespace text_merge
