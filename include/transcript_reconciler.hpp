/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_TRANSCRIPT_RECONCILER_HPP
#define LOCUSMERGE_TRANSCRIPT_RECONCILER_HPP

// standard
#include <functional>
#include <map>
#include <string>
#include <vector>

// locusmerge
#include "genomic_feature.hpp"

/**
 * Result of comparing a source A transcript with a source B transcript
 */
struct pair_decision {
    /**
     * What happens to the pair
     */
    enum class outcome {
        KEEP_BOTH,          // Different models
        KEEP_BOTH_LINKED,   // Same coding exons, different UTR structure
        DROP_B,             // B is redundant, A is kept
        DROP_A              // A is redundant, B is kept
    };

    outcome result = outcome::KEEP_BOTH;
    std::string rule;                   // Name of the rule that decided
    bool strip_b_translation = false;   // B becomes non-coding when it is kept

    bool drops() const {
        return result == outcome::DROP_A || result == outcome::DROP_B;
    }
    bool resolves() const { return result != outcome::KEEP_BOTH; }
};

std::string to_string(pair_decision::outcome result);

/**
 * Exon lists of a transcript pair, computed once per comparison
 * Exons are copies in transcript order
 */
struct pair_view {
    const transcript& a;
    const transcript& b;
    std::vector<exon> a_exons;
    std::vector<exon> b_exons;
    std::vector<exon> a_coding;
    std::vector<exon> b_coding;

    pair_view(const transcript& ta, const transcript& tb);

    bool a_is_coding() const { return !a_coding.empty(); }
    bool b_is_coding() const { return !b_coding.empty(); }
};

/**
 * One row of the reconciliation table: the first rule whose predicate
 * holds decides the pair
 */
struct match_rule {
    std::string name;
    std::function<bool(const pair_view&)> applies;
    pair_decision::outcome result;
    bool strip_b_translation = false;
};

/**
 * Resolves redundancy between source A and source B transcripts of a gene
 *
 * Every source A transcript is compared with every source B transcript of
 * the same gene. The best resolving pair (drop B, then drop A, then linked)
 * is applied: cross references and attributes record the relation, evidence
 * of the dropped transcript moves to the kept one and the dropped transcript
 * leaves the gene. Source A transcripts without any resolving partner get an
 * unmatched cross reference.
 */
class transcript_reconciler {
public:
    /**
     * Cross reference and attribute names written by the reconciler
     */
    struct config {
        std::string merged_suffix = "_merged";
        std::string non_coding_conversion_suffix = "_e";

        std::string source_a_xref_db = "Vega_transcript";
        std::string unmatched_xref_db = "OTTT";
        std::string shares_cds_with_a_db = "shares_CDS_with_OTTT";
        std::string shares_cds_with_b_db = "shares_CDS_with_ENST";
        std::string shares_cds_and_utr_db = "shares_CDS_and_UTR_with_OTTT";

        std::string link_attribute = "enst_link";
        std::string edge_attribute = "TranscriptEdge";
        std::string transcript_protein_evidence = "tp_otter_support";
        std::string transcript_dna_evidence = "td_otter_support";
        std::string exon_protein_evidence = "ep_otter_support";
        std::string exon_dna_evidence = "ed_otter_support";

        /**
         * All cross reference databases produced by a merge
         */
        std::vector<std::string> merge_xref_dbnames() const {
            return {shares_cds_and_utr_db, shares_cds_with_a_db, shares_cds_with_b_db,
                    unmatched_xref_db};
        }
    };

    /**
     * Reconciliation statistics (accumulated over all genes)
     */
    struct stats {
        size_t genes = 0;
        size_t genes_without_source_a = 0;
        size_t source_a_transcripts = 0;
        size_t pairs_evaluated = 0;
        size_t dropped_a = 0;
        size_t dropped_b = 0;
        size_t linked = 0;
        size_t unmatched = 0;
        size_t converted_non_coding = 0;
        std::map<std::string, size_t> rule_hits;   // Rule name -> decisions
    };

    transcript_reconciler() : transcript_reconciler(config{}) {}
    explicit transcript_reconciler(const config& cfg);

    /**
     * Decide the relation of a source A and a source B transcript
     * Pure: neither transcript is modified
     */
    pair_decision are_matched_pair(const transcript& a, const transcript& b) const;

    /**
     * Apply a resolving decision to a pair (cross references, attributes,
     * evidence, biotype suffixes). Does not remove anything from a gene.
     * @throws std::invalid_argument if evidence has to move between
     *         transcripts with different exon counts
     */
    void apply_relation(const pair_decision& decision, transcript& a, transcript& b);

    /**
     * Reconcile the source A and source B transcripts of one gene
     * @return number of transcripts removed from the gene
     */
    size_t merge_redundant_transcripts(gene& g);

    /**
     * Reconcile every gene of a list
     */
    void merge_all(std::vector<gene>& genes);

    /**
     * Same inner boundaries of the terminal exons and identical internal
     * exons; strand taken from the first exon of the first list
     */
    static bool check_internal_exon_structure(const std::vector<exon>& first,
                                              const std::vector<exon>& second);

    /**
     * false iff the first list's span lies inside the second's and is
     * shorter on at least one end; true otherwise (equal spans included)
     */
    static bool check_terminal_exon_structure(const std::vector<exon>& first,
                                              const std::vector<exon>& second);

    /**
     * Copy supporting features of one exon to another, skipping features
     * already present on the target
     */
    static void transfer_supporting_evidence(const exon& from, exon& to);

    /**
     * Positional exon evidence transfer
     * @throws std::invalid_argument if the exon counts differ
     */
    static void transfer_exon_evidence(const transcript& from, transcript& to);

    /**
     * Record the evidence names of one transcript as attributes of another
     */
    void add_evidence_attributes(const transcript& from, transcript& to) const;

    /**
     * Mark a source A transcript that did not match any source B transcript
     */
    void add_unmatched_xref(transcript& a) const;

    const std::vector<match_rule>& rules() const { return rules_; }
    const config& get_config() const { return cfg_; }
    const stats& get_stats() const { return stats_; }

    /**
     * Write summary statistics to file
     * @param filepath Output file path
     */
    void write_summary(const std::string& filepath) const;

private:
    config cfg_;
    stats stats_;
    std::vector<match_rule> rules_;

    static std::vector<match_rule> build_rules();

    /**
     * Priority of a decision when choosing the best pair (higher wins)
     */
    static int priority(const pair_decision& decision);

    void append_merged_suffix(transcript& tr) const;
};

#endif //LOCUSMERGE_TRANSCRIPT_RECONCILER_HPP
