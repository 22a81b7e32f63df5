/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_GFF_WRITER_HPP
#define LOCUSMERGE_GFF_WRITER_HPP

// standard
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <unordered_set>

// locusmerge
#include "gene_source.hpp"
#include "genomic_feature.hpp"

/**
 * Gene store writing GFF3
 *
 * One gene line, one mRNA line per transcript, exon lines with their
 * evidence and CDS lines for the coding part. The attributes use the names
 * read by gff_gene_source, so written files can be merged again.
 */
class gff_writer : public gene_store {
public:
    /**
     * @throws std::runtime_error if the file cannot be created
     */
    explicit gff_writer(const std::filesystem::path& filepath);

    void store(const gene& g) override;

    size_t genes_written() const { return genes_written_; }
    size_t transcripts_written() const { return transcripts_written_; }

    /**
     * Write the records of one gene to a stream
     */
    static void write_gene(std::ostream& out, const gene& g);

    /**
     * Percent-encode the characters GFF3 reserves in attribute values
     */
    static std::string escape(const std::string& value);

private:
    std::filesystem::path filepath_;
    std::ofstream out_;
    std::unordered_set<std::string> written_ids_;
    size_t genes_written_ = 0;
    size_t transcripts_written_ = 0;
};

#endif //LOCUSMERGE_GFF_WRITER_HPP
