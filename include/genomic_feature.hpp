/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_GENOMIC_FEATURE_HPP
#define LOCUSMERGE_GENOMIC_FEATURE_HPP

// standard
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// genogrove
#include <genogrove/data_type/genomic_coordinate.hpp>

namespace gdt = genogrove::data_type;

/**
 * Annotation source a transcript was fetched from.
 * SOURCE_A is the curated set whose biotypes carry the provenance suffix,
 * SOURCE_B the automatic set it is merged into.
 */
enum class source_tag {
    SOURCE_A,
    SOURCE_B
};

/**
 * Kind of alignment backing a supporting feature
 */
enum class evidence_type {
    DNA,
    PROTEIN
};

/**
 * Alignment of a hit sequence supporting an exon or transcript
 * Only carried along and transferred, never used for matching
 */
struct supporting_feature {
    std::string hit_name;
    size_t start;
    size_t end;
    int strand;
    size_t hit_start;
    size_t hit_end;
    int hit_strand;
    evidence_type type;

    supporting_feature()
        : start(0), end(0), strand(1), hit_start(0), hit_end(0), hit_strand(1),
          type(evidence_type::DNA) {}

    supporting_feature(std::string name, size_t s, size_t e, int str,
                       size_t hs, size_t he, int hstr, evidence_type t)
        : hit_name(std::move(name)), start(s), end(e), strand(str),
          hit_start(hs), hit_end(he), hit_strand(hstr), type(t) {}

    // Same alignment, regardless of the evidence type
    bool same_alignment(const supporting_feature& other) const {
        return hit_name == other.hit_name && start == other.start && end == other.end &&
               strand == other.strand && hit_start == other.hit_start &&
               hit_end == other.hit_end;
    }
};

/**
 * Cross reference to another database entry (e.g. a curated transcript id)
 */
struct db_entry {
    std::string dbname;
    std::string primary_id;
    std::string display_id;

    bool operator==(const db_entry& other) const {
        return dbname == other.dbname && primary_id == other.primary_id &&
               display_id == other.display_id;
    }
};

/**
 * Code/value annotation attached to a transcript
 */
struct attribute {
    std::string code;
    std::string value;

    bool operator==(const attribute& other) const {
        return code == other.code && value == other.value;
    }
};

/**
 * Exon on the reference sequence, 1-based inclusive coordinates
 * Phases follow the Ensembl convention (-1 = not coding at that boundary)
 */
struct exon {
    size_t start;
    size_t end;
    int strand;
    int phase;
    int end_phase;
    std::vector<supporting_feature> supporting_features;

    exon() : start(0), end(0), strand(1), phase(-1), end_phase(-1) {}

    exon(size_t s, size_t e, int str, int ph = -1, int end_ph = -1)
        : start(s), end(e), strand(str), phase(ph), end_phase(end_ph) {}

    size_t length() const { return end - start + 1; }

    /**
     * Inclusive interval overlap, strand is not considered
     */
    bool overlaps(const exon& other) const {
        return start <= other.end && other.start <= end;
    }

    /**
     * Same start, end, strand, phase and end phase
     */
    bool is_identical(const exon& other) const {
        return start == other.start && end == other.end && strand == other.strand &&
               phase == other.phase && end_phase == other.end_phase;
    }

    /**
     * Same start, end and strand
     */
    bool same_coordinates(const exon& other) const {
        return start == other.start && end == other.end && strand == other.strand;
    }

    /**
     * Strand-aware coordinate used as lookup key
     */
    gdt::genomic_coordinate get_coordinate() const {
        return gdt::genomic_coordinate(strand == -1 ? '-' : '+', start, end);
    }

    /**
     * Copy of the coordinates and phases without the supporting features
     */
    exon structure() const {
        return exon(start, end, strand, phase, end_phase);
    }
};

using exon_ptr = std::shared_ptr<exon>;

/**
 * Coding region of a transcript
 * Exons are referenced by index into the owning transcript's exon list,
 * offsets are 1-based positions inside those exons in transcript (5'->3') direction
 */
struct translation_span {
    size_t start_exon;
    size_t end_exon;
    size_t seq_start;
    size_t seq_end;

    translation_span() : start_exon(0), end_exon(0), seq_start(1), seq_end(1) {}
    translation_span(size_t se, size_t ee, size_t ss, size_t send)
        : start_exon(se), end_exon(ee), seq_start(ss), seq_end(send) {}
};

/**
 * Transcript model
 * Exons are kept in transcript order (ascending start on the forward strand,
 * descending start on the reverse strand). Exon objects can be shared between
 * transcripts of the same gene after exon pruning.
 */
class transcript {
public:
    std::string id;
    std::string seqid;
    std::string biotype;
    std::string logic_name;
    source_tag source;

    std::vector<exon_ptr> exons;
    std::optional<translation_span> translation;

    std::vector<supporting_feature> supporting_features;
    std::vector<db_entry> db_entries;
    std::vector<attribute> attributes;

    transcript() : source(source_tag::SOURCE_B) {}
    transcript(std::string tid, std::string seq, std::string bt, source_tag src)
        : id(std::move(tid)), seqid(std::move(seq)), biotype(std::move(bt)), source(src) {}

    // Genomic span
    size_t start() const;
    size_t end() const;
    int strand() const;

    bool is_coding() const { return translation.has_value(); }

    /**
     * Genomic bounds of the coding region (lowest and highest coding base)
     * @throws std::invalid_argument for a non-coding transcript
     */
    size_t coding_region_start() const;
    size_t coding_region_end() const;

    /**
     * Number of coding nucleotides
     */
    size_t coding_length() const;

    /**
     * Length of the translated peptide in amino acids (0 for non-coding)
     */
    size_t peptide_length() const;

    /**
     * Coding parts of the exons, clipped to the coding region, in transcript order
     * Returns copies carrying no supporting features
     */
    std::vector<exon> translateable_exons() const;

    /**
     * Copies of all exons (coordinates and phases only), in transcript order
     */
    std::vector<exon> exon_structure() const;

    /**
     * Set the translation from the genomic coding bounds
     * @throws std::invalid_argument if a bound does not fall inside an exon
     */
    void set_coding_region(size_t cds_start, size_t cds_end);

    /**
     * Derive exon phases from the translation (all -1 when non-coding)
     */
    void assign_phases();

    /**
     * Sort exons into transcript order, keeping the translation pointing at
     * the same exon objects
     */
    void sort_exons();

    /**
     * Check exon coordinates, strands and translation indices
     * @throws std::invalid_argument naming the transcript
     */
    void validate() const;

    // Adders skip entries that are already present
    bool add_db_entry(const db_entry& entry);
    bool add_attribute(const attribute& attrib);
    bool add_supporting_feature(const supporting_feature& feature);

    bool has_db_entry(const std::string& dbname) const;
    size_t remove_db_entries(const std::vector<std::string>& dbnames);

private:
    const exon& exon_at(size_t index) const;
};

using transcript_ptr = std::shared_ptr<transcript>;

/**
 * Gene: a collection of transcripts with a biotype
 * The span is the union of the transcript spans
 */
class gene {
public:
    std::string id;
    std::string seqid;
    std::string biotype;
    std::string logic_name;
    std::vector<transcript_ptr> transcripts;

    gene() = default;
    gene(std::string gid, std::string seq, std::string bt)
        : id(std::move(gid)), seqid(std::move(seq)), biotype(std::move(bt)) {}

    size_t start() const;
    size_t end() const;

    bool empty() const { return transcripts.empty(); }
    size_t size() const { return transcripts.size(); }

    void add_transcript(transcript_ptr tr);

    /**
     * Remove a transcript by identity
     * @return true if the transcript was part of the gene
     */
    bool remove_transcript(const transcript* tr);

    bool contains(const transcript* tr) const;

    /**
     * All distinct exon objects of the gene
     */
    std::vector<exon_ptr> get_all_exons() const;

    /**
     * Deep copy: new transcript and exon objects, exon sharing inside the
     * copy mirrors the sharing in the original
     */
    gene clone() const;
};

#endif //LOCUSMERGE_GENOMIC_FEATURE_HPP
