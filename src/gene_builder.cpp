/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "gene_builder.hpp"
#include "utility.hpp"

#include <fstream>
#include <stdexcept>

gene_builder::gene_builder(gene_source& source_a, gene_source& source_b,
                           const discarded_set& discarded, const biotype_config& biotypes,
                           const config& cfg)
    : source_a_(source_a), source_b_(source_b), discarded_(discarded), biotypes_(biotypes),
      combiner_(cfg.combiner),
      reconciler_(reconciler_config(cfg, biotypes)),
      resolver_(biotypes, cfg.resolver) {}

transcript_reconciler::config gene_builder::reconciler_config(const config& cfg,
                                                              const biotype_config& biotypes) {
    // Suffixes have to agree with the ones the resolver strips
    transcript_reconciler::config rc = cfg.reconciler;
    rc.merged_suffix = biotypes.merged_transcript_suffix;
    rc.non_coding_conversion_suffix = biotypes.non_coding_conversion_suffix;
    return rc;
}

void gene_builder::tag_source_a(gene& g) const {
    g.biotype += biotypes_.source_a_suffix;
    for (auto& tr : g.transcripts) {
        tr->biotype += biotypes_.source_a_suffix;
        tr->source = source_tag::SOURCE_A;
    }
}

std::vector<gene> gene_builder::fetch_category(const region& r, biotype_category category) {
    std::vector<gene> genes;

    for (const auto& biotype : biotypes_.biotypes(source_tag::SOURCE_B, category)) {
        for (auto& g : source_b_.fetch_genes_by_type(r, biotype)) {
            // Imported from source A by an earlier merge
            if (g.logic_name == biotypes_.source_a_logic_name) {
                stats_.reimported_genes_skipped++;
                continue;
            }
            for (auto& tr : g.transcripts) {
                tr->source = source_tag::SOURCE_B;
            }
            stats_.source_b_genes++;
            genes.push_back(std::move(g));
        }
    }

    for (const auto& biotype : biotypes_.biotypes(source_tag::SOURCE_A, category)) {
        for (auto& g : source_a_.fetch_genes_by_type(r, biotype)) {
            tag_source_a(g);
            stats_.source_a_genes++;
            genes.push_back(std::move(g));
        }
    }

    logging::debug("Fetched " + std::to_string(genes.size()) + " " + to_string(category) +
                   " gene(s) on " + r.to_string());
    return genes;
}

size_t gene_builder::flush_merge_xrefs(transcript& tr) const {
    return tr.remove_db_entries(reconciler_.get_config().merge_xref_dbnames());
}

std::vector<transcript_ptr> gene_builder::check_merge_status(const std::vector<gene>& genes) {
    const auto& rc = reconciler_.get_config();
    std::vector<transcript_ptr> transcripts;

    for (const auto& g : genes) {
        for (const auto& tr : g.transcripts) {
            if (g.logic_name == biotypes_.merged_gene_logic_name &&
                tr->logic_name == biotypes_.source_a_logic_name) {
                stats_.merged_gene_transcripts_skipped++;
                continue;
            }
            if (tr->logic_name == biotypes_.merged_transcript_logic_name &&
                tr->has_db_entry(rc.shares_cds_with_b_db) &&
                !tr->has_db_entry(rc.shares_cds_and_utr_db)) {
                stats_.linked_transcripts_skipped++;
                continue;
            }

            stats_.xrefs_flushed += flush_merge_xrefs(*tr);

            if (discarded_.contains(*tr)) {
                logging::debug("Transcript " + tr->id + " is in the discarded set");
                stats_.discarded_transcripts++;
                continue;
            }
            transcripts.push_back(tr);
        }
    }
    return transcripts;
}

void gene_builder::assign_logic_names(std::vector<gene>& genes) const {
    for (auto& g : genes) {
        g.logic_name = biotypes_.merged_gene_logic_name;
        for (auto& tr : g.transcripts) {
            if (biotypes_.is_merged_biotype(tr->biotype)) {
                tr->logic_name = biotypes_.merged_transcript_logic_name;
            } else if (tr->source == source_tag::SOURCE_A) {
                tr->logic_name = biotypes_.source_a_logic_name;
            }
        }
    }
}

std::vector<gene> gene_builder::build_genes(const region& r) {
    if (r.seqid.empty()) {
        throw std::invalid_argument("Region without sequence name");
    }
    stats_.regions++;
    logging::info("Building genes on " + r.to_string());

    auto coding_tr = check_merge_status(fetch_category(r, biotype_category::CODING));
    auto processed_tr = check_merge_status(fetch_category(r, biotype_category::PROCESSED));
    auto pseudo_tr = check_merge_status(fetch_category(r, biotype_category::PSEUDOGENE));

    stats_.coding_transcripts += coding_tr.size();
    stats_.processed_transcripts += processed_tr.size();
    stats_.pseudo_transcripts += pseudo_tr.size();

    auto coding_genes = clusterer_.cluster_into_genes(coding_tr);
    logging::info("Coding gene clusters: " + std::to_string(coding_genes.size()));

    auto processed_genes = clusterer_.cluster_into_pseudogenes(processed_tr);
    logging::info("Processed transcript clusters: " + std::to_string(processed_genes.size()));

    auto pseudo_genes = clusterer_.cluster_into_pseudogenes(pseudo_tr);
    logging::info("Pseudogene clusters: " + std::to_string(pseudo_genes.size()));

    for (auto& g : processed_genes) {
        pseudo_genes.push_back(std::move(g));
    }

    auto genes = combiner_.combine(std::move(coding_genes), std::move(pseudo_genes));
    logging::info("Total clusters: " + std::to_string(genes.size()));

    reconciler_.merge_all(genes);
    pruner_.prune_all(genes);
    resolver_.update_biotypes(genes);
    assign_logic_names(genes);

    size_t transcripts = 0;
    for (const auto& g : genes) {
        transcripts += g.size();
    }
    stats_.final_genes += genes.size();
    stats_.final_transcripts += transcripts;

    logging::info(std::to_string(genes.size()) + " gene(s) with " + std::to_string(transcripts) +
                  " transcript(s) built on " + r.to_string());
    return genes;
}

void gene_builder::write_summary(const std::string& filepath) const {
    std::ofstream out(filepath);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open summary file: " + filepath);
    }

    const auto& cs = clusterer_.get_stats();
    const auto& cb = combiner_.get_stats();
    const auto& rs = reconciler_.get_stats();
    const auto& ps = pruner_.get_stats();
    const auto& bs = resolver_.get_stats();

    out << "# Locusmerge Summary\n\n";

    out << "## Input\n";
    out << "Regions: " << stats_.regions << "\n";
    out << "Source A genes: " << stats_.source_a_genes << "\n";
    out << "Source B genes: " << stats_.source_b_genes << "\n";
    out << "Re-imported source B genes skipped: " << stats_.reimported_genes_skipped << "\n";
    out << "Merged-gene source A transcripts skipped: " << stats_.merged_gene_transcripts_skipped << "\n";
    out << "CDS-linked merge products skipped: " << stats_.linked_transcripts_skipped << "\n";
    out << "Discarded transcripts: " << stats_.discarded_transcripts << "\n";
    out << "Merge cross references flushed: " << stats_.xrefs_flushed << "\n";
    out << "Coding transcripts: " << stats_.coding_transcripts << "\n";
    out << "Processed transcripts: " << stats_.processed_transcripts << "\n";
    out << "Pseudogene transcripts: " << stats_.pseudo_transcripts << "\n";
    out << "\n";

    out << "## Clustering\n";
    out << "Clustering runs: " << cs.runs << "\n";
    out << "Non-coding transcripts left out of coding clusters: " << cs.non_coding_skipped << "\n";
    out << "Clusters: " << cs.clusters << "\n";
    out << "Cluster merges: " << cs.cluster_merges << "\n";
    out << "Pseudogene clusters absorbed: " << cb.absorbed << "\n";
    out << "Standalone pseudogene clusters: " << cb.standalone << "\n";
    out << "\n";

    out << "## Reconciliation\n";
    out << "Pairs evaluated: " << rs.pairs_evaluated << "\n";
    out << "Source B dropped: " << rs.dropped_b << "\n";
    out << "Source A dropped: " << rs.dropped_a << "\n";
    out << "Linked (shared CDS): " << rs.linked << "\n";
    out << "Unmatched source A: " << rs.unmatched << "\n";
    out << "Converted to non-coding: " << rs.converted_non_coding << "\n";
    out << "\n";

    out << "## Output\n";
    out << "Genes: " << stats_.final_genes << "\n";
    out << "Transcripts: " << stats_.final_transcripts << "\n";
    out << "Shared exon references: " << ps.exons_replaced << "\n";
    out << "Protein coding: " << bs.coding << "\n";
    out << "Processed transcript: " << bs.processed << "\n";
    out << "Pseudogene: " << bs.pseudogene << "\n";
    out << "Merged: " << bs.merged << "\n";
    out << "Source A only: " << bs.source_a_only << "\n";
    out << "Source B only: " << bs.source_b_only << "\n";
    out << "Unclassified: " << bs.unclassified << "\n";

    out.close();
    logging::info("Wrote summary to: " + filepath);
}
