/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "interval_utils.hpp"
#include "test_helpers.hpp"

TEST(IntervalUtilsTest, InclusiveOverlap) {
    EXPECT_TRUE(overlaps(exon(100, 200, 1), exon(200, 300, 1)));
    EXPECT_FALSE(overlaps(exon(100, 200, 1), exon(201, 300, 1)));
    EXPECT_TRUE(overlaps(exon(100, 200, 1), exon(150, 160, -1)));
}

TEST(IntervalUtilsTest, OverlapOnStrand) {
    EXPECT_TRUE(overlaps_on_strand(exon(100, 200, -1), exon(150, 300, -1)));
    EXPECT_FALSE(overlaps_on_strand(exon(100, 200, 1), exon(150, 300, -1)));
}

TEST(IntervalUtilsTest, OverlapExtent) {
    EXPECT_EQ(overlap_extent(exon(100, 200, 1), exon(150, 300, 1)), 50);
    EXPECT_EQ(overlap_extent(exon(100, 200, 1), exon(200, 300, 1)), 0);
    EXPECT_EQ(overlap_extent(exon(100, 200, 1), exon(250, 300, 1)), -50);
}

TEST(IntervalUtilsTest, OverlapPercent) {
    EXPECT_DOUBLE_EQ(overlap_percent(exon(100, 200, 1), exon(150, 300, 1), 100), 50.0);
    EXPECT_LE(overlap_percent(exon(100, 200, 1), exon(200, 300, 1), 100), 0.0);
    EXPECT_THROW(overlap_percent(exon(100, 200, 1), exon(150, 300, 1), 0), std::invalid_argument);
}

TEST(IntervalUtilsTest, CodingLengthIsLongestPeptide) {
    auto t1 = test::make_transcript("T1", {{100, 200}, {300, 400}}, test::interval{101, 400});
    auto t2 = test::make_transcript("T2", {{101, 130}}, test::interval{101, 130});
    auto t3 = test::make_transcript("T3", {{100, 1000}});
    gene g = test::make_gene("G1", "protein_coding", {t1, t2, t3});

    // 100 + 101 coding bases
    EXPECT_EQ(coding_length(g), 67u);

    gene non_coding = test::make_gene("G2", "pseudogene", {t3});
    EXPECT_EQ(coding_length(non_coding), 0u);
}

TEST(IntervalUtilsTest, CodingExonsForGene) {
    auto t1 = test::make_transcript("T1", {{100, 200}, {300, 400}}, test::interval{101, 400});
    auto t2 = test::make_transcript("T2", {{101, 130}}, test::interval{101, 130});
    auto t3 = test::make_transcript("T3", {{100, 1000}});
    gene g = test::make_gene("G1", "protein_coding", {t1, t2, t3});

    auto coding = coding_exons_for_gene(g);
    ASSERT_EQ(coding.size(), 3u);
    EXPECT_EQ(coding[0].start, 101u);
    EXPECT_EQ(coding[1].end, 400u);
    EXPECT_EQ(coding[2].start, 101u);
    EXPECT_EQ(coding[2].end, 130u);
}
