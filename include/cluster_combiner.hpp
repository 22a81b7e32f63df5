/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_CLUSTER_COMBINER_HPP
#define LOCUSMERGE_CLUSTER_COMBINER_HPP

// standard
#include <vector>

// locusmerge
#include "genomic_feature.hpp"

/**
 * Folds pseudogene / processed transcript clusters into overlapping coding genes
 *
 * A pseudogene cluster is absorbed by the first coding gene (in start order)
 * for which some same-strand coding exon / pseudogene exon pair overlaps by
 * more than absorption_threshold percent of the coding gene's longest
 * translation. Clusters that are not absorbed stay standalone genes.
 */
class cluster_combiner {
public:
    struct config {
        double absorption_threshold = 10.0;   // Percent, strictly greater than
    };

    struct stats {
        size_t coding_genes = 0;
        size_t pseudo_genes = 0;
        size_t absorbed = 0;
        size_t standalone = 0;
        size_t zero_length_coding = 0;   // Overlapping coding genes without a full codon
    };

    cluster_combiner() : cluster_combiner(config{}) {}
    explicit cluster_combiner(const config& cfg);

    /**
     * Combine coding and pseudogene clusters
     * @return Coding genes (possibly enlarged) in start order followed by
     *         the pseudogenes that were not absorbed
     */
    std::vector<gene> combine(std::vector<gene> coding_genes, std::vector<gene> pseudo_genes);

    /**
     * Does the coding gene absorb the pseudogene
     */
    bool should_absorb(const gene& coding_gene, const gene& pseudo_gene);

    const stats& get_stats() const { return stats_; }

private:
    config cfg_;
    stats stats_;

    static void sort_genes(std::vector<gene>& genes);
};

#endif //LOCUSMERGE_CLUSTER_COMBINER_HPP
