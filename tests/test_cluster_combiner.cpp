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

#include "cluster_combiner.hpp"
#include "test_helpers.hpp"

namespace {

// 300000 coding bases: longest translation of 100000 amino acids
gene large_coding_gene() {
    auto tr = test::make_transcript("C1", {{1, 300000}}, test::interval{1, 300000});
    return test::make_gene("coding", "protein_coding", {tr});
}

gene pseudo_gene(const std::string& id, size_t start, size_t end, int strand = 1) {
    auto tr = test::make_transcript(id, {{start, end}}, std::nullopt, strand,
                                    source_tag::SOURCE_B, "pseudogene");
    return test::make_gene(id, "pseudogene", {tr});
}

} // namespace

TEST(ClusterCombinerTest, AbsorbsAboveThreshold) {
    cluster_combiner combiner;
    // Overlap extent 10001 of 100000
    EXPECT_TRUE(combiner.should_absorb(large_coding_gene(), pseudo_gene("P1", 289999, 300000)));
}

TEST(ClusterCombinerTest, KeepsBelowThreshold) {
    cluster_combiner combiner;
    // Overlap extent 9999 of 100000
    EXPECT_FALSE(combiner.should_absorb(large_coding_gene(), pseudo_gene("P1", 290000, 299999)));
    // Exactly 10% is not enough
    EXPECT_FALSE(combiner.should_absorb(large_coding_gene(), pseudo_gene("P2", 290000, 300000)));
}

TEST(ClusterCombinerTest, OppositeStrandNotAbsorbed) {
    cluster_combiner combiner;
    EXPECT_FALSE(combiner.should_absorb(large_coding_gene(), pseudo_gene("P1", 1, 300000, -1)));
}

TEST(ClusterCombinerTest, TouchingExonsNeverAbsorbed) {
    cluster_combiner::config cfg;
    cfg.absorption_threshold = 0.0;
    cluster_combiner combiner(cfg);
    EXPECT_FALSE(combiner.should_absorb(large_coding_gene(), pseudo_gene("P1", 300000, 300500)));
}

TEST(ClusterCombinerTest, NoCompleteCodonNotAbsorbed) {
    cluster_combiner combiner;
    auto tr = test::make_transcript("C1", {{100, 101}}, test::interval{100, 101});
    gene coding = test::make_gene("coding", "protein_coding", {tr});

    EXPECT_FALSE(combiner.should_absorb(coding, pseudo_gene("P1", 100, 101)));
    EXPECT_EQ(combiner.get_stats().zero_length_coding, 1u);
}

TEST(ClusterCombinerTest, CombineOrdersCodingFirst) {
    cluster_combiner combiner;
    std::vector<gene> coding;
    coding.push_back(large_coding_gene());

    std::vector<gene> pseudo;
    pseudo.push_back(pseudo_gene("far", 500000, 501000));
    pseudo.push_back(pseudo_gene("near", 100, 50000));

    auto genes = combiner.combine(std::move(coding), std::move(pseudo));
    ASSERT_EQ(genes.size(), 2u);
    EXPECT_EQ(genes[0].id, "coding");
    EXPECT_EQ(genes[0].size(), 2u);
    EXPECT_EQ(genes[1].id, "far");

    EXPECT_EQ(combiner.get_stats().absorbed, 1u);
    EXPECT_EQ(combiner.get_stats().standalone, 1u);
}

TEST(ClusterCombinerTest, PseudogeneJoinsFirstMatchingCodingGene) {
    cluster_combiner combiner;
    auto c1 = test::make_transcript("C1", {{100, 400}}, test::interval{100, 399});
    auto c2 = test::make_transcript("C2", {{200, 500}}, test::interval{201, 500});

    std::vector<gene> coding;
    coding.push_back(test::make_gene("second", "protein_coding", {c2}));
    coding.push_back(test::make_gene("first", "protein_coding", {c1}));

    std::vector<gene> pseudo;
    pseudo.push_back(pseudo_gene("P1", 250, 350));

    auto genes = combiner.combine(std::move(coding), std::move(pseudo));
    ASSERT_EQ(genes.size(), 2u);
    EXPECT_EQ(genes[0].id, "first");
    EXPECT_EQ(genes[0].size(), 2u);
    EXPECT_EQ(genes[1].size(), 1u);
}
