/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_BIOTYPE_CONFIG_HPP
#define LOCUSMERGE_BIOTYPE_CONFIG_HPP

// standard
#include <array>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

// locusmerge
#include "genomic_feature.hpp"

/**
 * Input biotype category
 */
enum class biotype_category {
    CODING,
    PROCESSED,
    PSEUDOGENE
};

std::string to_string(biotype_category category);

/**
 * Biotype sets and provenance naming shared by all merge stages
 *
 * For each source the configured biotypes of each category are fetched;
 * lookups are exact matches on the biotype with provenance suffixes removed.
 *
 * File format (TSV, header line required, '#' lines are comments):
 * source    category    biotype
 * a         coding      protein_coding
 * b         pseudogene  processed_pseudogene
 */
class biotype_config {
public:
    /**
     * Built-in defaults
     */
    biotype_config();

    /**
     * Replace the built-in biotype sets with the ones listed in a TSV file
     * @throws std::runtime_error if the file cannot be read or is malformed
     */
    static biotype_config from_file(const std::filesystem::path& filepath);

    /**
     * Write a template file containing the current biotype sets
     */
    void write_template(const std::filesystem::path& output_path) const;

    void add(source_tag source, biotype_category category, const std::string& biotype);
    void clear();

    /**
     * Configured biotypes of one source/category in insertion order
     */
    const std::vector<std::string>& biotypes(source_tag source, biotype_category category) const;

    /**
     * Exact-match membership of a (suffix-free) biotype
     */
    bool contains(source_tag source, biotype_category category, const std::string& biotype) const;

    /**
     * Biotype with the merged suffix, the non-coding conversion suffix and
     * the source A suffix removed (in that order, each only when present at the end)
     */
    std::string base_biotype(const std::string& biotype) const;

    bool is_merged_biotype(const std::string& biotype) const;

    // Provenance and output naming
    std::string source_a_suffix = "_havana";
    std::string merged_transcript_suffix = "_merged";
    std::string non_coding_conversion_suffix = "_e";
    std::string merged_gene_suffix = "_merged";
    std::string source_a_gene_suffix = "_havana";
    std::string source_b_gene_suffix = "_ensembl";

    // Analysis logic names used by the merge-status filter
    std::string source_a_logic_name = "havana";
    std::string merged_gene_logic_name = "ensembl_havana_gene";
    std::string merged_transcript_logic_name = "ensembl_havana_transcript";

private:
    // [source][category]
    std::array<std::array<std::vector<std::string>, 3>, 2> lists_;

    static size_t source_index(source_tag source);
    static size_t category_index(biotype_category category);

    static source_tag parse_source(const std::string& value);
    static biotype_category parse_category(const std::string& value);

    static bool ends_with(const std::string& str, const std::string& suffix);
};

#endif //LOCUSMERGE_BIOTYPE_CONFIG_HPP
