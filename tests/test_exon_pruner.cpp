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

#include "exon_pruner.hpp"
#include "test_helpers.hpp"

class ExonPrunerTest : public ::testing::Test {
protected:
    void SetUp() override {
        t1 = test::make_transcript("T1", {{100, 200}, {300, 400}});
        t2 = test::make_transcript("T2", {{100, 200}, {300, 400}});
        // Same coordinates, coding phases
        t3 = test::make_transcript("T3", {{100, 200}}, test::interval{100, 200});
        g = test::make_gene("G1", "protein_coding", {t1, t2, t3});
    }

    transcript_ptr t1;
    transcript_ptr t2;
    transcript_ptr t3;
    gene g;
    exon_pruner pruner;
};

TEST_F(ExonPrunerTest, SharesIdenticalExons) {
    EXPECT_EQ(pruner.prune(g), 2u);
    EXPECT_EQ(t2->exons[0].get(), t1->exons[0].get());
    EXPECT_EQ(t2->exons[1].get(), t1->exons[1].get());
    EXPECT_EQ(g.get_all_exons().size(), 3u);
    EXPECT_EQ(pruner.get_stats().exons_replaced, 2u);
}

TEST_F(ExonPrunerTest, DifferentPhasesStaySeparate) {
    pruner.prune(g);
    EXPECT_NE(t3->exons[0].get(), t1->exons[0].get());
    EXPECT_EQ(t3->exons[0]->phase, 0);
    EXPECT_EQ(t1->exons[0]->phase, -1);
}

TEST_F(ExonPrunerTest, TranslationSurvivesPruning) {
    auto t4 = test::make_transcript("T4", {{100, 200}}, test::interval{100, 200});
    g.add_transcript(t4);

    pruner.prune(g);
    EXPECT_EQ(t4->exons[0].get(), t3->exons[0].get());
    EXPECT_EQ(t4->coding_region_start(), 100u);
    EXPECT_EQ(t4->coding_region_end(), 200u);
}

TEST_F(ExonPrunerTest, Idempotent) {
    pruner.prune(g);
    auto exons_before = g.get_all_exons();

    EXPECT_EQ(pruner.prune(g), 0u);
    EXPECT_EQ(g.get_all_exons(), exons_before);
}

TEST_F(ExonPrunerTest, PruneAllCountsGenes) {
    auto t5 = test::make_transcript("T5", {{900, 950}});
    auto t6 = test::make_transcript("T6", {{900, 950}});
    std::vector<gene> genes;
    genes.push_back(g);
    genes.push_back(test::make_gene("G2", "pseudogene", {t5, t6}));

    pruner.prune_all(genes);
    EXPECT_EQ(pruner.get_stats().genes, 2u);
    EXPECT_EQ(pruner.get_stats().exons_replaced, 3u);
    EXPECT_EQ(t5->exons[0].get(), t6->exons[0].get());
}
