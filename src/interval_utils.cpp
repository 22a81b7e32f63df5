/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "interval_utils.hpp"

// standard
#include <algorithm>
#include <stdexcept>

bool overlaps(const exon& a, const exon& b) {
    return a.start <= b.end && b.start <= a.end;
}

bool overlaps_on_strand(const exon& a, const exon& b) {
    return a.strand == b.strand && overlaps(a, b);
}

int64_t overlap_extent(const exon& a, const exon& b) {
    int64_t low = static_cast<int64_t>(std::max(a.start, b.start));
    int64_t high = static_cast<int64_t>(std::min(a.end, b.end));
    return high - low;
}

double overlap_percent(const exon& a, const exon& b, size_t denominator) {
    if (denominator == 0) {
        throw std::invalid_argument("Overlap percentage requested with a zero denominator");
    }
    return static_cast<double>(overlap_extent(a, b)) / static_cast<double>(denominator) * 100.0;
}

size_t coding_length(const gene& g) {
    size_t length = 0;
    for (const auto& tr : g.transcripts) {
        if (!tr->is_coding()) continue;
        length = std::max(length, tr->peptide_length());
    }
    return length;
}

std::vector<exon> coding_exons_for_gene(const gene& g) {
    std::vector<exon> coding;
    for (const auto& tr : g.transcripts) {
        if (!tr->is_coding()) continue;
        auto tr_coding = tr->translateable_exons();
        coding.insert(coding.end(), tr_coding.begin(), tr_coding.end());
    }
    return coding;
}
