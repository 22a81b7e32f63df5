/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_EXON_PRUNER_HPP
#define LOCUSMERGE_EXON_PRUNER_HPP

// standard
#include <map>
#include <vector>

// genogrove
#include <genogrove/data_type/genomic_coordinate.hpp>

// locusmerge
#include "genomic_feature.hpp"

namespace gdt = genogrove::data_type;

/**
 * Unifies structurally identical exons of a gene into shared exon objects
 *
 * Transcripts are walked in gene order and exons in transcript order; the
 * first exon seen with a given start/end/strand/phase/end_phase becomes the
 * canonical object and every later identical exon is replaced by it.
 * Translations reference exons by index and therefore keep pointing at the
 * right (now shared) exon without being touched.
 */
class exon_pruner {
public:
    struct stats {
        size_t genes = 0;
        size_t exons_seen = 0;
        size_t exons_replaced = 0;
    };

    /**
     * Share identical exons within one gene (mutates the gene in place)
     * @return number of exon references replaced by a shared object
     */
    size_t prune(gene& g);

    /**
     * Prune every gene of a list
     */
    void prune_all(std::vector<gene>& genes);

    const stats& get_stats() const { return stats_; }

private:
    stats stats_;

    // Canonical exons per coordinate, candidates differ only in phase
    using exon_cache_type = std::map<gdt::genomic_coordinate, std::vector<exon_ptr>>;
};

#endif //LOCUSMERGE_EXON_PRUNER_HPP
