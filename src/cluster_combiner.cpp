/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "cluster_combiner.hpp"
#include "interval_utils.hpp"
#include "utility.hpp"

#include <algorithm>

cluster_combiner::cluster_combiner(const config& cfg)
    : cfg_(cfg) {}

void cluster_combiner::sort_genes(std::vector<gene>& genes) {
    std::stable_sort(genes.begin(), genes.end(),
        [](const gene& a, const gene& b) {
            if (a.start() != b.start()) return a.start() < b.start();
            return a.end() > b.end();
        });
}

bool cluster_combiner::should_absorb(const gene& coding_gene, const gene& pseudo_gene) {
    if (coding_gene.end() < pseudo_gene.start() || coding_gene.start() > pseudo_gene.end()) {
        return false;
    }

    size_t length = coding_length(coding_gene);
    if (length == 0) {
        stats_.zero_length_coding++;
        logging::debug("Coding gene " + coding_gene.id +
                       " has no complete codon, not absorbing " + pseudo_gene.id);
        return false;
    }

    auto coding_exons = coding_exons_for_gene(coding_gene);
    auto pseudo_exons = pseudo_gene.get_all_exons();

    for (const auto& cg_exon : coding_exons) {
        for (const auto& pg_exon : pseudo_exons) {
            if (!overlaps_on_strand(cg_exon, *pg_exon)) continue;

            // Touching exons give a percentage <= 0 and never pass
            if (overlap_percent(cg_exon, *pg_exon, length) > cfg_.absorption_threshold) {
                return true;
            }
        }
    }
    return false;
}

std::vector<gene> cluster_combiner::combine(std::vector<gene> coding_genes,
                                            std::vector<gene> pseudo_genes) {
    sort_genes(coding_genes);
    sort_genes(pseudo_genes);

    stats_.coding_genes += coding_genes.size();
    stats_.pseudo_genes += pseudo_genes.size();

    std::vector<gene> unclustered_pseudos;

    for (auto& pseudo_gene : pseudo_genes) {
        bool absorbed = false;

        for (auto& coding_gene : coding_genes) {
            if (!should_absorb(coding_gene, pseudo_gene)) continue;

            for (const auto& tr : pseudo_gene.transcripts) {
                coding_gene.add_transcript(tr);
            }
            logging::debug("Pseudogene cluster " + pseudo_gene.id +
                           " absorbed into coding gene " + coding_gene.id);
            absorbed = true;
            break;
        }

        if (absorbed) {
            stats_.absorbed++;
        } else {
            stats_.standalone++;
            unclustered_pseudos.push_back(std::move(pseudo_gene));
        }
    }

    coding_genes.insert(coding_genes.end(),
                        std::make_move_iterator(unclustered_pseudos.begin()),
                        std::make_move_iterator(unclustered_pseudos.end()));
    return coding_genes;
}
