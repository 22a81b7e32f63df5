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

#include <sstream>
#include <stdexcept>

#include "gff_gene_source.hpp"
#include "gff_writer.hpp"
#include "test_helpers.hpp"

namespace {

const char* annotation =
    "##gff-version 3\n"
    "chr1\ttest\tgene\t1000\t5000\t.\t+\t.\tID=G1;biotype=protein_coding;logic_name=havana\n"
    "chr1\ttest\tmRNA\t1000\t5000\t.\t+\t.\tID=T1;Parent=G1;biotype=protein_coding;"
        "Dbxref=Vega_transcript:OTT1;evidence=BC0001:dna\n"
    "chr1\ttest\texon\t1000\t1200\t.\t+\t.\tParent=T1;evidence=AK0001:dna,Q9XYZ1:protein\n"
    "chr1\ttest\texon\t3000\t3200\t.\t+\t.\tParent=T1\n"
    "chr1\ttest\texon\t4800\t5000\t.\t+\t.\tParent=T1\n"
    "chr1\ttest\tCDS\t1100\t1200\t.\t+\t0\tParent=T1\n"
    "chr1\ttest\tCDS\t3000\t3200\t.\t+\t2\tParent=T1\n"
    "chr1\ttest\tCDS\t4800\t4900\t.\t+\t1\tParent=T1\n"
    "chr1\ttest\tmRNA\t1000\t3200\t.\t+\t.\tID=T2;Parent=G1;biotype=retained_intron\n"
    "chr1\ttest\texon\t1000\t1200\t.\t+\t.\tParent=T2\n"
    "chr1\ttest\texon\t3000\t3200\t.\t+\t.\tParent=T2\n"
    "chr1\ttest\tmRNA\t7000\t7100\t.\t+\t.\tID=T3;Parent=G1;biotype=protein_coding\n"
    "chr2\ttest\tgene\t100\t200\t.\t-\t.\tID=G2;biotype=pseudogene\n"
    "chr2\ttest\ttranscript\t100\t200\t.\t-\t.\tID=T4;Parent=G2\n"
    "chr2\ttest\texon\t100\t200\t.\t-\t.\tParent=T4\n";

} // namespace

TEST(GffGeneSourceTest, LoadsGenesTranscriptsAndEvidence) {
    test::temp_dir dir("gff_source");
    auto path = dir.write("annotation.gff3", annotation);

    gff_gene_source source(path);
    ASSERT_EQ(source.genes().size(), 2u);
    // T3 has no exons
    EXPECT_EQ(source.get_stats().skipped_transcripts, 1u);
    EXPECT_EQ(source.get_stats().transcripts, 3u);

    const gene& g1 = source.genes()[0];
    EXPECT_EQ(g1.id, "G1");
    EXPECT_EQ(g1.biotype, "protein_coding");
    EXPECT_EQ(g1.logic_name, "havana");
    ASSERT_EQ(g1.size(), 2u);

    const transcript& t1 = *g1.transcripts[0];
    EXPECT_EQ(t1.id, "T1");
    EXPECT_EQ(t1.logic_name, "havana");
    ASSERT_EQ(t1.exons.size(), 3u);
    ASSERT_TRUE(t1.is_coding());
    EXPECT_EQ(t1.coding_region_start() - t1.start(), 100u);
    EXPECT_EQ(t1.end() - t1.coding_region_end(), 100u);

    ASSERT_EQ(t1.db_entries.size(), 1u);
    EXPECT_EQ(t1.db_entries[0].dbname, "Vega_transcript");
    EXPECT_EQ(t1.db_entries[0].primary_id, "OTT1");
    ASSERT_EQ(t1.supporting_features.size(), 1u);
    ASSERT_EQ(t1.exons[0]->supporting_features.size(), 2u);
    EXPECT_EQ(t1.exons[0]->supporting_features[1].type, evidence_type::PROTEIN);

    const transcript& t2 = *g1.transcripts[1];
    EXPECT_EQ(t2.biotype, "retained_intron");
    EXPECT_FALSE(t2.is_coding());

    const gene& g2 = source.genes()[1];
    EXPECT_EQ(g2.seqid, "chr2");
    EXPECT_EQ(g2.transcripts[0]->strand(), -1);
    // Transcript biotype falls back to the gene biotype
    EXPECT_EQ(g2.transcripts[0]->biotype, "pseudogene");

    auto names = source.sequence_names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(source.fetch_genes_by_type(region("chr1"), "protein_coding").size(), 1u);
    EXPECT_TRUE(source.fetch_genes_by_type(region("chr2"), "protein_coding").empty());
}

TEST(GffGeneSourceTest, MissingFileThrows) {
    test::temp_dir dir("gff_missing");
    EXPECT_THROW(gff_gene_source(dir.path() / "missing.gff3"), std::runtime_error);
}

TEST(GffGeneSourceTest, AttributeHelpers) {
    auto xrefs = gff_gene_source::parse_dbxrefs("Vega_transcript:OTT1, CCDS:CCDS42.1");
    ASSERT_EQ(xrefs.size(), 2u);
    EXPECT_EQ(xrefs[1].dbname, "CCDS");
    EXPECT_EQ(xrefs[1].primary_id, "CCDS42.1");
    EXPECT_EQ(xrefs[1].display_id, "CCDS42.1");
    EXPECT_THROW(gff_gene_source::parse_dbxrefs("OTT1"), std::runtime_error);

    auto evidence = gff_gene_source::parse_evidence("NM_001:DNA,P12345:protein", 10, 20, -1);
    ASSERT_EQ(evidence.size(), 2u);
    EXPECT_EQ(evidence[0].type, evidence_type::DNA);
    EXPECT_EQ(evidence[1].hit_name, "P12345");
    EXPECT_EQ(evidence[1].strand, -1);
    EXPECT_THROW(gff_gene_source::parse_evidence("NM_001:rna", 10, 20, 1), std::runtime_error);

    std::map<std::string, std::string> attributes = {{"gene_type", "lincRNA"}, {"biotype", ""}};
    EXPECT_EQ(gff_gene_source::first_attribute(attributes, {"biotype", "gene_type"}), "lincRNA");
    EXPECT_FALSE(gff_gene_source::extract_attribute(attributes, "biotype").has_value());
}

TEST(GffWriterTest, WritesGeneRecords) {
    auto tr = test::make_transcript("T1", {{100, 200}, {300, 400}}, test::interval{151, 350});
    tr->logic_name = "ensembl_havana_transcript";
    tr->add_db_entry({"shares_CDS_with_OTTT", "OTT1", "OTT1"});
    tr->add_attribute({"ed_otter_support", "AK1"});
    tr->add_attribute({"ed_otter_support", "AK2"});
    gene g = test::make_gene("G1", "protein_coding_merged", {tr});

    std::ostringstream out;
    gff_writer::write_gene(out, g);
    std::string text = out.str();

    EXPECT_NE(text.find("chr1\tlocusmerge\tgene\t100\t400\t.\t+\t.\tID=G1;biotype=protein_coding_merged\n"),
              std::string::npos);
    EXPECT_NE(text.find("ID=T1;Parent=G1;biotype=protein_coding;logic_name=ensembl_havana_transcript;"
                        "Dbxref=shares_CDS_with_OTTT:OTT1;ed_otter_support=AK1,AK2\n"),
              std::string::npos);
    EXPECT_NE(text.find("chr1\tlocusmerge\texon\t300\t400\t.\t+\t.\tParent=T1\n"), std::string::npos);
    // 50 coding bases in the first CDS leave one base before the next codon
    EXPECT_NE(text.find("chr1\tlocusmerge\tCDS\t151\t200\t.\t+\t0\tParent=T1\n"), std::string::npos);
    EXPECT_NE(text.find("chr1\tlocusmerge\tCDS\t300\t350\t.\t+\t1\tParent=T1\n"), std::string::npos);
}

TEST(GffWriterTest, EscapesReservedCharacters) {
    EXPECT_EQ(gff_writer::escape("a;b=c,d"), "a%3Bb%3Dc%2Cd");
    EXPECT_EQ(gff_writer::escape("plain"), "plain");
}

TEST(GffWriterTest, StoreWritesEachGeneOnce) {
    test::temp_dir dir("gff_writer");
    auto path = dir.path() / "out.gff3";
    gene g = test::make_gene("G1", "pseudogene", {test::make_transcript("T1", {{100, 200}})});

    {
        gff_writer writer(path);
        writer.store(g);
        writer.store(g);
        EXPECT_EQ(writer.genes_written(), 1u);
        EXPECT_EQ(writer.transcripts_written(), 1u);
    }

    std::string text = test::read_file(path);
    EXPECT_EQ(text.rfind("##gff-version 3\n", 0), 0u);
    EXPECT_EQ(text.find("\tgene\t"), text.rfind("\tgene\t"));
}

TEST(GffWriterTest, UnwritablePathThrows) {
    test::temp_dir dir("gff_writer_bad");
    EXPECT_THROW(gff_writer(dir.path() / "missing_dir" / "out.gff3"), std::runtime_error);
}
