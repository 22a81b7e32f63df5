/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_GFF_GENE_SOURCE_HPP
#define LOCUSMERGE_GFF_GENE_SOURCE_HPP

// standard
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// genogrove
#include <genogrove/io/gff_reader.hpp>

// locusmerge
#include "gene_source.hpp"
#include "genomic_feature.hpp"

namespace gio = genogrove::io;

/**
 * Gene source backed by a GFF3/GTF annotation file
 *
 * The file is read once on construction; fetches hand out copies.
 *
 * Recognised records and attributes:
 * - genes: GFF3 records with ID and no Parent, GTF "gene" lines
 * - transcripts: GFF3 records with ID and Parent, GTF "transcript" lines
 *   (GTF transcripts without their own line are created from their exons)
 * - exon and CDS records; the coding region spans the lowest to highest CDS base
 * - biotype: biotype, gene_biotype / transcript_biotype, gene_type / transcript_type
 * - logic_name: analysis logic name (transcripts inherit the gene's)
 * - Dbxref: db:id cross references
 * - evidence: name:kind supporting evidence (kind dna or protein), on
 *   transcripts and exons
 */
class gff_gene_source : public gene_source {
public:
    struct stats {
        size_t entries = 0;
        size_t genes = 0;
        size_t transcripts = 0;
        size_t skipped_transcripts = 0;   // Without exons or with an invalid structure
    };

    /**
     * @throws std::runtime_error if the file does not exist or holds bad attributes
     */
    explicit gff_gene_source(const std::filesystem::path& filepath);

    std::vector<gene> fetch_genes_by_type(const region& r, const std::string& biotype) override;
    std::vector<std::string> sequence_names() const override;

    const std::vector<gene>& genes() const { return genes_; }
    const stats& get_stats() const { return stats_; }

    /**
     * Discarded transcript set built from every transcript of a GFF file
     */
    static transcript_discarded_set load_discarded_set(const std::filesystem::path& filepath);

    // ========== Attribute extraction helpers ==========

    static std::optional<std::string> extract_attribute(
        const std::map<std::string, std::string>& attributes,
        const std::string& key);

    /**
     * First present attribute of a list of keys
     */
    static std::optional<std::string> first_attribute(
        const std::map<std::string, std::string>& attributes,
        const std::vector<std::string>& keys);

    /**
     * "db:id,db:id" -> cross references (primary and display id are the same)
     * @throws std::runtime_error for entries without a database name
     */
    static std::vector<db_entry> parse_dbxrefs(const std::string& value);

    /**
     * "name:kind,name:kind" -> supporting features located on start-end
     * @throws std::runtime_error for kinds other than dna and protein
     */
    static std::vector<supporting_feature> parse_evidence(const std::string& value,
                                                          size_t start, size_t end, int strand);

private:
    std::filesystem::path filepath_;
    std::vector<gene> genes_;
    stats stats_;

    void load();
};

#endif //LOCUSMERGE_GFF_GENE_SOURCE_HPP
