/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_GENE_SOURCE_HPP
#define LOCUSMERGE_GENE_SOURCE_HPP

// standard
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

// locusmerge
#include "genomic_feature.hpp"

/**
 * Named, coordinate-addressed part of a reference sequence
 * 1-based inclusive; a region without bounds covers the whole sequence
 */
struct region {
    std::string seqid;
    size_t start = 1;
    size_t end = SIZE_MAX;

    region() = default;
    explicit region(std::string seq) : seqid(std::move(seq)) {}
    region(std::string seq, size_t s, size_t e) : seqid(std::move(seq)), start(s), end(e) {}

    /**
     * Parse "seqid" or "seqid:start-end"
     * @throws std::invalid_argument for malformed or inverted regions
     */
    static region parse(const std::string& str);

    std::string to_string() const;

    bool overlaps(const std::string& seq, size_t s, size_t e) const {
        return seq == seqid && s <= end && start <= e;
    }
};

/**
 * Region-scoped gene fetch
 * Every call returns freshly built genes that the caller may mutate
 */
class gene_source {
public:
    virtual ~gene_source() = default;

    /**
     * Genes of one biotype overlapping the region, with transcripts,
     * exons, translations and evidence populated
     */
    virtual std::vector<gene> fetch_genes_by_type(const region& r, const std::string& biotype) = 0;

    /**
     * Names of all sequences with at least one gene
     */
    virtual std::vector<std::string> sequence_names() const = 0;
};

/**
 * Lookup of transcripts that were rejected in an earlier curation round
 */
class discarded_set {
public:
    virtual ~discarded_set() = default;
    virtual bool contains(const transcript& tr) const = 0;
};

/**
 * Destination of the final genes
 * Storing the same gene id twice has no further effect
 */
class gene_store {
public:
    virtual ~gene_store() = default;
    virtual void store(const gene& g) = 0;
};

/**
 * In-memory gene source, genes are handed out as deep copies
 */
class memory_gene_source : public gene_source {
public:
    void add_gene(gene g);
    const std::vector<gene>& genes() const { return genes_; }

    std::vector<gene> fetch_genes_by_type(const region& r, const std::string& biotype) override;
    std::vector<std::string> sequence_names() const override;

private:
    std::vector<gene> genes_;
};

/**
 * Discarded transcripts matched by exon coordinates
 * A transcript is discarded iff a stored transcript on the same sequence has
 * the same number of exons and every exon (in transcript order) has the same
 * start, end and strand.
 */
class transcript_discarded_set : public discarded_set {
public:
    void add(const transcript& tr);
    void add_gene(const gene& g);

    bool contains(const transcript& tr) const override;

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

private:
    std::map<std::string, std::vector<std::vector<exon>>> by_seqid_;
    size_t size_ = 0;
};

/**
 * Gene store keeping the genes in memory
 */
class memory_gene_store : public gene_store {
public:
    void store(const gene& g) override;
    const std::vector<gene>& genes() const { return genes_; }

private:
    std::vector<gene> genes_;
    std::unordered_set<std::string> ids_;
};

#endif //LOCUSMERGE_GENE_SOURCE_HPP
