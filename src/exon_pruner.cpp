/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "exon_pruner.hpp"
#include "utility.hpp"

size_t exon_pruner::prune(gene& g) {
    exon_cache_type unique_exons;
    size_t replaced = 0;

    for (auto& tr : g.transcripts) {
        for (auto& ex : tr->exons) {
            stats_.exons_seen++;

            auto& candidates = unique_exons[ex->get_coordinate()];
            exon_ptr found;
            for (const auto& candidate : candidates) {
                if (candidate->is_identical(*ex)) {
                    found = candidate;
                    break;
                }
            }

            if (!found) {
                candidates.push_back(ex);
            } else if (found != ex) {
                ex = found;
                replaced++;
            }
        }
    }

    stats_.genes++;
    stats_.exons_replaced += replaced;
    return replaced;
}

void exon_pruner::prune_all(std::vector<gene>& genes) {
    size_t before = stats_.exons_replaced;
    for (auto& g : genes) {
        prune(g);
    }
    logging::debug("Shared " + std::to_string(stats_.exons_replaced - before) +
                   " duplicated exon(s) across " + std::to_string(genes.size()) + " gene(s)");
}
