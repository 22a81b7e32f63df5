/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_BIOTYPE_RESOLVER_HPP
#define LOCUSMERGE_BIOTYPE_RESOLVER_HPP

// standard
#include <optional>
#include <string>
#include <vector>

// locusmerge
#include "biotype_config.hpp"
#include "genomic_feature.hpp"

/**
 * Where the transcripts of a gene came from
 */
enum class provenance {
    SOURCE_A_ONLY,
    SOURCE_B_ONLY,
    MERGED
};

/**
 * Classification of one gene
 * category is empty when no transcript biotype is known (the "weird" state)
 */
struct gene_classification {
    std::optional<biotype_category> category;
    provenance origin = provenance::SOURCE_B_ONLY;
    bool has_coding = false;
    bool has_processed = false;
    bool has_pseudogene = false;

    bool is_classified() const { return category.has_value(); }
};

/**
 * Assigns the final gene biotype
 *
 * The base biotype follows the highest category found among the gene's
 * transcripts (coding > processed > pseudogene), the suffix follows the
 * provenance (merged, source A only, source B only).
 */
class biotype_resolver {
public:
    struct config {
        std::string coding_biotype = "protein_coding";
        std::string processed_biotype = "processed_transcript";
        std::string pseudogene_biotype = "pseudogene";
        std::string unclassified_biotype = "unclassified";
        bool strict_biotypes = false;   // Throw instead of warning on unclassified genes
    };

    struct stats {
        size_t genes = 0;
        size_t coding = 0;
        size_t processed = 0;
        size_t pseudogene = 0;
        size_t merged = 0;
        size_t source_a_only = 0;
        size_t source_b_only = 0;
        size_t unclassified = 0;
    };

    explicit biotype_resolver(const biotype_config& biotypes)
        : biotype_resolver(biotypes, config{}) {}
    biotype_resolver(const biotype_config& biotypes, const config& cfg);

    /**
     * Category of a single transcript biotype (provenance suffixes are removed,
     * the source is taken from the source A suffix)
     */
    std::optional<biotype_category> categorize(const std::string& transcript_biotype) const;

    /**
     * Category flags and provenance of a gene, nothing is modified
     */
    gene_classification classify(const gene& g) const;

    /**
     * Final biotype string for a classification
     */
    std::string biotype_for(const gene_classification& classification) const;

    /**
     * Set the biotype of a gene
     * @throws std::runtime_error for an unclassified gene in strict mode
     */
    void update_biotype(gene& g);

    void update_biotypes(std::vector<gene>& genes);

    const stats& get_stats() const { return stats_; }

private:
    const biotype_config& biotypes_;
    config cfg_;
    stats stats_;

    bool has_suffix(const std::string& str, const std::string& suffix) const;
};

#endif //LOCUSMERGE_BIOTYPE_RESOLVER_HPP
