/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_GENE_BUILDER_HPP
#define LOCUSMERGE_GENE_BUILDER_HPP

// standard
#include <string>
#include <vector>

// locusmerge
#include "biotype_config.hpp"
#include "biotype_resolver.hpp"
#include "cluster_combiner.hpp"
#include "exon_pruner.hpp"
#include "gene_source.hpp"
#include "genomic_feature.hpp"
#include "transcript_clusterer.hpp"
#include "transcript_reconciler.hpp"

/**
 * Builds the merged gene set of one region from two annotation sources
 *
 * Pipeline per region:
 * 1. fetch coding, processed and pseudogene genes of both sources
 * 2. filter transcripts by merge status and the discarded set
 * 3. cluster coding transcripts and processed / pseudogene transcripts
 * 4. fold pseudogene clusters into coding genes
 * 5. reconcile source A against source B transcripts
 * 6. share identical exons
 * 7. assign gene biotypes
 *
 * Each call works on freshly fetched objects, so regions are independent.
 */
class gene_builder {
public:
    struct config {
        cluster_combiner::config combiner;
        transcript_reconciler::config reconciler;
        biotype_resolver::config resolver;
    };

    /**
     * Input and filter statistics (accumulated over all regions)
     */
    struct stats {
        size_t regions = 0;
        size_t source_a_genes = 0;
        size_t source_b_genes = 0;
        size_t reimported_genes_skipped = 0;        // Source B genes with the source A logic name
        size_t merged_gene_transcripts_skipped = 0; // Source A transcripts of merged genes
        size_t linked_transcripts_skipped = 0;      // Earlier merge products sharing only the CDS
        size_t discarded_transcripts = 0;
        size_t xrefs_flushed = 0;
        size_t coding_transcripts = 0;
        size_t processed_transcripts = 0;
        size_t pseudo_transcripts = 0;
        size_t final_genes = 0;
        size_t final_transcripts = 0;
    };

    gene_builder(gene_source& source_a, gene_source& source_b, const discarded_set& discarded,
                 const biotype_config& biotypes)
        : gene_builder(source_a, source_b, discarded, biotypes, config{}) {}
    gene_builder(gene_source& source_a, gene_source& source_b, const discarded_set& discarded,
                 const biotype_config& biotypes, const config& cfg);

    /**
     * Merged genes of a region
     * @throws std::invalid_argument for a region without sequence name
     * @throws std::logic_error if clustering breaks its partition invariant
     */
    std::vector<gene> build_genes(const region& r);

    /**
     * Transcripts of a gene list that take part in the merge
     * Skips earlier merge products that must be rebuilt and discarded
     * transcripts; merge cross references are flushed from the rest
     */
    std::vector<transcript_ptr> check_merge_status(const std::vector<gene>& genes);

    /**
     * Remove cross references written by an earlier merge
     * @return number of removed entries
     */
    size_t flush_merge_xrefs(transcript& tr) const;

    const stats& get_stats() const { return stats_; }
    const transcript_clusterer::stats& get_clusterer_stats() const { return clusterer_.get_stats(); }
    const cluster_combiner::stats& get_combiner_stats() const { return combiner_.get_stats(); }
    const transcript_reconciler& get_reconciler() const { return reconciler_; }
    const exon_pruner::stats& get_pruner_stats() const { return pruner_.get_stats(); }
    const biotype_resolver::stats& get_resolver_stats() const { return resolver_.get_stats(); }

    /**
     * Write summary statistics of all stages to file
     * @param filepath Output file path
     */
    void write_summary(const std::string& filepath) const;

private:
    gene_source& source_a_;
    gene_source& source_b_;
    const discarded_set& discarded_;
    const biotype_config& biotypes_;
    stats stats_;

    transcript_clusterer clusterer_;
    cluster_combiner combiner_;
    transcript_reconciler reconciler_;
    exon_pruner pruner_;
    biotype_resolver resolver_;

    /**
     * Genes of one category from both sources, source A tagged
     */
    std::vector<gene> fetch_category(const region& r, biotype_category category);

    void tag_source_a(gene& g) const;

    /**
     * Logic names of the merged output
     */
    void assign_logic_names(std::vector<gene>& genes) const;

    static transcript_reconciler::config reconciler_config(const config& cfg,
                                                           const biotype_config& biotypes);
};

#endif //LOCUSMERGE_GENE_BUILDER_HPP
