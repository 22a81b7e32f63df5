/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_INTERVAL_UTILS_HPP
#define LOCUSMERGE_INTERVAL_UTILS_HPP

// standard
#include <cstdint>
#include <vector>

// locusmerge
#include "genomic_feature.hpp"

/**
 * Inclusive interval overlap, strand is ignored
 */
bool overlaps(const exon& a, const exon& b);

/**
 * Inclusive interval overlap on the same strand
 */
bool overlaps_on_strand(const exon& a, const exon& b);

/**
 * Signed overlap extent min(end) - max(start)
 * 0 when the intervals share exactly one base, negative when they are apart
 */
int64_t overlap_extent(const exon& a, const exon& b);

/**
 * Overlap extent as percentage of a denominator
 * (min(a.end, b.end) - max(a.start, b.start)) / denominator * 100
 * The result is <= 0 for intervals that touch or do not overlap.
 * @throws std::invalid_argument if the denominator is 0
 */
double overlap_percent(const exon& a, const exon& b, size_t denominator);

/**
 * Longest peptide (in amino acids) among the coding transcripts of a gene
 * @return 0 if no transcript is coding
 */
size_t coding_length(const gene& g);

/**
 * Coding exons of every coding transcript of the gene (clipped to the
 * coding region), transcript after transcript
 */
std::vector<exon> coding_exons_for_gene(const gene& g);

#endif //LOCUSMERGE_INTERVAL_UTILS_HPP
