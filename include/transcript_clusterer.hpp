/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_TRANSCRIPT_CLUSTERER_HPP
#define LOCUSMERGE_TRANSCRIPT_CLUSTERER_HPP

// standard
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// locusmerge
#include "genomic_feature.hpp"

/**
 * Group of transcripts believed to belong to one gene
 * Only lives for the duration of one clustering run
 */
struct transcript_cluster {
    std::vector<transcript_ptr> members;
    size_t start;                              // Min start across all members
    size_t end;                                // Max end across all members

    transcript_cluster() : start(SIZE_MAX), end(0) {}

    /**
     * Add a transcript to this cluster
     * Updates bounds and member list
     */
    void add_transcript(transcript_ptr tr);

    /**
     * Move all members of another cluster into this one
     */
    void absorb(transcript_cluster& other);

    size_t size() const { return members.size(); }
    bool empty() const { return members.empty(); }

    /**
     * Turn the cluster into a gene holding all members
     * Gene id format: seqid_strand_start_end_n<members>_<first member id>
     * Every transcript is in one cluster, so ids are unique within a run
     */
    gene to_gene() const;
};

/**
 * Coding exons per transcript, computed once per clustering run
 * Keyed by transcript identity; must be cleared between runs
 */
class coding_exon_cache {
public:
    /**
     * Coding exons of a transcript sorted by start (empty for non-coding)
     */
    const std::vector<exon>& get(const transcript& tr);

    void clear() { cache_.clear(); }
    size_t size() const { return cache_.size(); }

private:
    std::unordered_map<const transcript*, std::vector<exon>> cache_;
};

/**
 * Transcript clustering engine
 * Groups transcripts into genes by exon overlap on the same strand
 *
 * Transcripts are processed in sorted order; a transcript joining two or
 * more existing clusters merges them, so that transitively connected
 * transcripts always end up in the same gene.
 */
class transcript_clusterer {
public:
    /**
     * Overlap predicate used for clustering
     */
    enum class overlap_mode {
        CODING,     // Coding span and coding exons, coding transcripts only
        GENOMIC     // Genomic span and all exons
    };

    /**
     * Clustering statistics (accumulated over all runs)
     */
    struct stats {
        size_t runs = 0;
        size_t input_transcripts = 0;
        size_t non_coding_skipped = 0;     // Transcripts without translation in CODING mode
        size_t clusters = 0;
        size_t cluster_merges = 0;         // Transcripts that joined >= 2 clusters
    };

    /**
     * Cluster coding transcripts by coding exon overlap
     * Transcripts without a translation are ignored
     * @param transcripts Input transcripts (not modified)
     * @return One gene per cluster
     */
    std::vector<gene> cluster_into_genes(const std::vector<transcript_ptr>& transcripts);

    /**
     * Cluster pseudogene / processed transcripts by exon overlap
     * @param transcripts Input transcripts (not modified)
     * @return One gene per cluster
     */
    std::vector<gene> cluster_into_pseudogenes(const std::vector<transcript_ptr>& transcripts);

    /**
     * Clusters of a list of transcripts under the given overlap predicate
     * The coding exon cache is cleared at the start of each call
     */
    std::vector<transcript_cluster> cluster_transcripts(
        const std::vector<transcript_ptr>& transcripts, overlap_mode mode);

    /**
     * Partition post-condition: every transcript in exactly one cluster,
     * no empty cluster, member count equal to the input count
     * @throws std::logic_error naming the offending transcript
     */
    static void check_clusters(size_t num_transcripts,
                               const std::vector<transcript_cluster>& clusters);

    const stats& get_stats() const { return stats_; }
    const coding_exon_cache& get_cache() const { return cache_; }

private:
    stats stats_;
    coding_exon_cache cache_;

    /**
     * Does the transcript overlap any member of the cluster
     */
    bool matches(const transcript& tr, const transcript_cluster& cluster, overlap_mode mode);

    bool coding_overlap(const transcript& a, const transcript& b);
    bool genomic_overlap(const transcript& a, const transcript& b) const;

    static std::vector<gene> to_genes(const std::vector<transcript_cluster>& clusters);
};

#endif // LOCUSMERGE_TRANSCRIPT_CLUSTERER_HPP
