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

#include "genomic_feature.hpp"
#include "test_helpers.hpp"

TEST(TranscriptTest, ForwardCodingRegion) {
    auto tr = test::make_transcript("T1", {{300, 400}, {100, 200}}, test::interval{150, 350});

    ASSERT_EQ(tr->exons.size(), 2u);
    EXPECT_EQ(tr->exons.front()->start, 100u);
    EXPECT_EQ(tr->start(), 100u);
    EXPECT_EQ(tr->end(), 400u);
    EXPECT_EQ(tr->coding_region_start(), 150u);
    EXPECT_EQ(tr->coding_region_end(), 350u);

    auto coding = tr->translateable_exons();
    ASSERT_EQ(coding.size(), 2u);
    EXPECT_EQ(coding[0].start, 150u);
    EXPECT_EQ(coding[0].end, 200u);
    EXPECT_EQ(coding[1].start, 300u);
    EXPECT_EQ(coding[1].end, 350u);
    EXPECT_EQ(tr->coding_length(), 102u);
    EXPECT_EQ(tr->peptide_length(), 34u);
}

TEST(TranscriptTest, ReverseStrandTranslation) {
    auto tr = test::make_transcript("T1", {{100, 200}, {300, 400}}, test::interval{150, 350}, -1);

    // Transcript order on the reverse strand is descending
    EXPECT_EQ(tr->exons[0]->start, 300u);
    EXPECT_EQ(tr->exons[1]->start, 100u);

    ASSERT_TRUE(tr->translation.has_value());
    EXPECT_EQ(tr->translation->start_exon, 0u);
    EXPECT_EQ(tr->translation->end_exon, 1u);
    EXPECT_EQ(tr->translation->seq_start, 51u);
    EXPECT_EQ(tr->translation->seq_end, 51u);
    EXPECT_EQ(tr->coding_region_start(), 150u);
    EXPECT_EQ(tr->coding_region_end(), 350u);

    EXPECT_EQ(tr->exons[0]->phase, -1);
    EXPECT_EQ(tr->exons[0]->end_phase, 0);
    EXPECT_EQ(tr->exons[1]->phase, 0);
    EXPECT_EQ(tr->exons[1]->end_phase, -1);
}

TEST(TranscriptTest, NonCodingHasNoPhases) {
    auto tr = test::make_transcript("T1", {{100, 200}, {300, 400}});
    EXPECT_FALSE(tr->is_coding());
    EXPECT_TRUE(tr->translateable_exons().empty());
    EXPECT_EQ(tr->peptide_length(), 0u);
    EXPECT_EQ(tr->exons[0]->phase, -1);
    EXPECT_THROW(tr->coding_region_start(), std::invalid_argument);
}

TEST(TranscriptTest, CodingBoundInIntronThrows) {
    auto tr = test::make_transcript("T1", {{100, 200}, {300, 400}});
    EXPECT_THROW(tr->set_coding_region(250, 350), std::invalid_argument);
    EXPECT_THROW(tr->set_coding_region(350, 150), std::invalid_argument);
}

TEST(TranscriptTest, ValidateRejectsMixedStrands) {
    transcript tr("T1", "chr1", "protein_coding", source_tag::SOURCE_B);
    tr.exons.push_back(std::make_shared<exon>(100, 200, 1));
    tr.exons.push_back(std::make_shared<exon>(300, 400, -1));
    EXPECT_THROW(tr.validate(), std::invalid_argument);

    transcript empty("T2", "chr1", "protein_coding", source_tag::SOURCE_B);
    EXPECT_THROW(empty.validate(), std::invalid_argument);
}

TEST(TranscriptTest, TranslationOffsetPastExonIsRejected) {
    auto tr = test::make_transcript("T1", {{100, 200}, {300, 400}});
    // First exon has 101 bases
    tr->translation = translation_span(0, 1, 150, 50);
    EXPECT_THROW(tr->validate(), std::invalid_argument);
    EXPECT_THROW(tr->assign_phases(), std::invalid_argument);

    tr->translation = translation_span(0, 1, 1, 102);
    EXPECT_THROW(tr->validate(), std::invalid_argument);

    tr->translation = translation_span(0, 1, 101, 101);
    EXPECT_NO_THROW(tr->validate());
    EXPECT_NO_THROW(tr->assign_phases());
}

TEST(TranscriptTest, AddersSkipDuplicates) {
    auto tr = test::make_transcript("T1", {{100, 200}});

    EXPECT_TRUE(tr->add_db_entry({"Vega_transcript", "OTT1", "OTT1"}));
    EXPECT_FALSE(tr->add_db_entry({"Vega_transcript", "OTT1", "OTT1"}));
    EXPECT_TRUE(tr->add_attribute({"enst_link", "T1"}));
    EXPECT_FALSE(tr->add_attribute({"enst_link", "T1"}));
    EXPECT_TRUE(tr->add_supporting_feature(test::make_evidence("AB000001", 100, 200)));
    EXPECT_FALSE(tr->add_supporting_feature(
        test::make_evidence("AB000001", 100, 200, evidence_type::PROTEIN)));

    EXPECT_EQ(tr->db_entries.size(), 1u);
    EXPECT_EQ(tr->attributes.size(), 1u);
    EXPECT_EQ(tr->supporting_features.size(), 1u);
}

TEST(TranscriptTest, RemoveDbEntriesByDatabase) {
    auto tr = test::make_transcript("T1", {{100, 200}});
    tr->add_db_entry({"OTTT", "OTT1", "T1"});
    tr->add_db_entry({"shares_CDS_with_ENST", "T9", "T9"});
    tr->add_db_entry({"Vega_transcript", "OTT1", "OTT1"});

    EXPECT_EQ(tr->remove_db_entries({"OTTT", "shares_CDS_with_ENST"}), 2u);
    ASSERT_EQ(tr->db_entries.size(), 1u);
    EXPECT_TRUE(tr->has_db_entry("Vega_transcript"));
    EXPECT_FALSE(tr->has_db_entry("OTTT"));
}

TEST(GeneTest, SpanAndRemoval) {
    auto t1 = test::make_transcript("T1", {{100, 200}});
    auto t2 = test::make_transcript("T2", {{150, 500}});
    gene g = test::make_gene("G1", "protein_coding", {t1, t2});

    EXPECT_EQ(g.start(), 100u);
    EXPECT_EQ(g.end(), 500u);
    EXPECT_TRUE(g.contains(t1.get()));
    EXPECT_TRUE(g.remove_transcript(t1.get()));
    EXPECT_FALSE(g.remove_transcript(t1.get()));
    EXPECT_EQ(g.size(), 1u);
    EXPECT_EQ(g.start(), 150u);
}

TEST(GeneTest, CloneKeepsExonSharing) {
    auto t1 = test::make_transcript("T1", {{100, 200}, {300, 400}});
    auto t2 = test::make_transcript("T2", {{100, 200}});
    t2->exons[0] = t1->exons[0];
    gene g = test::make_gene("G1", "protein_coding", {t1, t2});

    gene copy = g.clone();
    ASSERT_EQ(copy.size(), 2u);
    EXPECT_NE(copy.transcripts[0].get(), t1.get());
    EXPECT_NE(copy.transcripts[0]->exons[0].get(), t1->exons[0].get());
    EXPECT_EQ(copy.transcripts[0]->exons[0].get(), copy.transcripts[1]->exons[0].get());
    EXPECT_EQ(copy.get_all_exons().size(), 2u);

    copy.transcripts[0]->biotype = "changed";
    EXPECT_EQ(t1->biotype, "protein_coding");
}
