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

#include <set>
#include <stdexcept>

#include "transcript_clusterer.hpp"
#include "test_helpers.hpp"

namespace {

size_t total_transcripts(const std::vector<gene>& genes) {
    size_t total = 0;
    for (const auto& g : genes) total += g.size();
    return total;
}

} // namespace

TEST(TranscriptClustererTest, CodingOverlapPartition) {
    transcript_clusterer clusterer;
    auto t1 = test::make_transcript("T1", {{100, 200}}, test::interval{100, 200});
    auto t2 = test::make_transcript("T2", {{150, 250}}, test::interval{150, 250});
    auto t3 = test::make_transcript("T3", {{1000, 1100}}, test::interval{1000, 1100});

    auto genes = clusterer.cluster_into_genes({t3, t1, t2});
    ASSERT_EQ(genes.size(), 2u);
    EXPECT_EQ(total_transcripts(genes), 3u);

    EXPECT_EQ(genes[0].size(), 2u);
    EXPECT_EQ(genes[0].id, "chr1_+_100_250_n2_T1");
    EXPECT_TRUE(genes[0].contains(t1.get()));
    EXPECT_TRUE(genes[0].contains(t2.get()));
    EXPECT_TRUE(genes[1].contains(t3.get()));
}

TEST(TranscriptClustererTest, StrandsAreSeparated) {
    transcript_clusterer clusterer;
    auto fwd = test::make_transcript("F", {{100, 200}}, test::interval{100, 200}, 1);
    auto rev = test::make_transcript("R", {{100, 200}}, test::interval{100, 200}, -1);

    auto genes = clusterer.cluster_into_genes({fwd, rev});
    EXPECT_EQ(genes.size(), 2u);
}

TEST(TranscriptClustererTest, UtrOverlapDoesNotJoinCodingClusters) {
    transcript_clusterer clusterer;
    // Exons overlap only in the UTR of t1
    auto t1 = test::make_transcript("T1", {{100, 400}}, test::interval{100, 200});
    auto t2 = test::make_transcript("T2", {{300, 500}}, test::interval{450, 500});

    EXPECT_EQ(clusterer.cluster_into_genes({t1, t2}).size(), 2u);
    EXPECT_EQ(clusterer.cluster_into_pseudogenes({t1, t2}).size(), 1u);
}

TEST(TranscriptClustererTest, TransitiveOverlapFormsOneCluster) {
    transcript_clusterer clusterer;
    auto a = test::make_transcript("A", {{100, 200}}, test::interval{100, 200});
    auto b = test::make_transcript("B", {{150, 350}}, test::interval{150, 350});
    auto c = test::make_transcript("C", {{300, 400}}, test::interval{300, 400});

    auto genes = clusterer.cluster_into_genes({c, a, b});
    ASSERT_EQ(genes.size(), 1u);
    EXPECT_EQ(genes[0].size(), 3u);
}

TEST(TranscriptClustererTest, BridgingTranscriptMergesClusters) {
    transcript_clusterer clusterer;
    auto a = test::make_transcript("A", {{100, 150}, {450, 500}}, test::interval{100, 500});
    auto b = test::make_transcript("B", {{200, 300}}, test::interval{200, 300});
    auto c = test::make_transcript("C", {{280, 290}, {460, 470}}, test::interval{280, 470});

    auto clusters = clusterer.cluster_transcripts({a, b, c},
        transcript_clusterer::overlap_mode::CODING);
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].size(), 3u);
    EXPECT_EQ(clusters[0].start, 100u);
    EXPECT_EQ(clusters[0].end, 500u);
    EXPECT_EQ(clusterer.get_stats().cluster_merges, 1u);
}

TEST(TranscriptClustererTest, NonCodingLeftOutOfCodingClusters) {
    transcript_clusterer clusterer;
    auto coding = test::make_transcript("T1", {{100, 200}}, test::interval{100, 200});
    auto non_coding = test::make_transcript("T2", {{100, 200}});

    auto genes = clusterer.cluster_into_genes({coding, non_coding});
    ASSERT_EQ(genes.size(), 1u);
    EXPECT_EQ(genes[0].size(), 1u);
    EXPECT_EQ(clusterer.get_stats().non_coding_skipped, 1u);
}

TEST(TranscriptClustererTest, PseudogenesClusterByExonOverlap) {
    transcript_clusterer clusterer;
    auto p1 = test::make_transcript("P1", {{100, 200}, {500, 600}});
    auto p2 = test::make_transcript("P2", {{550, 700}});
    // Inside the intron of p1
    auto p3 = test::make_transcript("P3", {{300, 400}});

    auto genes = clusterer.cluster_into_pseudogenes({p1, p2, p3});
    ASSERT_EQ(genes.size(), 2u);
    EXPECT_EQ(total_transcripts(genes), 3u);
    EXPECT_EQ(genes[0].size(), 2u);
}

TEST(TranscriptClustererTest, CacheClearedOnEachRun) {
    transcript_clusterer clusterer;
    auto t1 = test::make_transcript("T1", {{100, 200}}, test::interval{100, 200});
    auto t2 = test::make_transcript("T2", {{150, 250}}, test::interval{150, 250});

    clusterer.cluster_into_genes({t1, t2});
    EXPECT_EQ(clusterer.get_cache().size(), 2u);

    clusterer.cluster_into_genes({});
    EXPECT_EQ(clusterer.get_cache().size(), 0u);
}

TEST(TranscriptClustererTest, CheckClustersDetectsBrokenPartition) {
    auto t1 = test::make_transcript("T1", {{100, 200}});
    auto t2 = test::make_transcript("T2", {{300, 400}});

    transcript_cluster c1;
    c1.add_transcript(t1);
    transcript_cluster c2;
    c2.add_transcript(t1);

    EXPECT_THROW(transcript_clusterer::check_clusters(2, {c1, c2}), std::logic_error);
    EXPECT_THROW(transcript_clusterer::check_clusters(2, {c1}), std::logic_error);
    EXPECT_THROW(transcript_clusterer::check_clusters(0, {transcript_cluster()}), std::logic_error);

    c2.members.clear();
    c2.add_transcript(t2);
    EXPECT_NO_THROW(transcript_clusterer::check_clusters(2, {c1, c2}));
}
