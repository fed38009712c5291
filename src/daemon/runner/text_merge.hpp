#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace text_merge {

// Normalized indel similarity in [0, 1]: 1 - distance / (len(a) + len(b)),
// where a substitution costs 2. Two empty strings are identical.
double levenshtein_ratio(std::u32string_view a, std::u32string_view b);

struct Merge {
    std::string text;
    size_t match = 0; // overlapping code points dropped from the head of the second string
    double score = -1.0;
};

// Joins two consecutive window transcripts. Compares growing suffixes of
// `first` with prefixes of `second` (at most max_chars code points) and drops
// the longest prefix of `second` whose similarity reaches `threshold`.
// Invalid UTF-8 on either side disables the overlap search.
Merge merge_overlapping(std::string_view first, std::string_view second,
                        double threshold = 0.9, size_t max_chars = 1000);

} // namespace text_merge
