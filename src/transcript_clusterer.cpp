/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "transcript_clusterer.hpp"
#include "utility.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

// ============================================================================
// transcript_cluster implementation
// ============================================================================

void transcript_cluster::add_transcript(transcript_ptr tr) {
    start = std::min(start, tr->start());
    end = std::max(end, tr->end());
    members.push_back(std::move(tr));
}

void transcript_cluster::absorb(transcript_cluster& other) {
    for (auto& tr : other.members) {
        add_transcript(std::move(tr));
    }
    other.members.clear();
}

gene transcript_cluster::to_gene() const {
    gene g;
    if (members.empty()) return g;

    const transcript& first = *members.front();
    std::ostringstream ss;
    ss << first.seqid << "_" << (first.strand() == -1 ? '-' : '+') << "_"
       << start << "_" << end << "_n" << members.size() << "_" << first.id;
    g.id = ss.str();
    g.seqid = first.seqid;

    for (const auto& tr : members) {
        g.add_transcript(tr);
    }
    return g;
}

// ============================================================================
// coding_exon_cache implementation
// ============================================================================

const std::vector<exon>& coding_exon_cache::get(const transcript& tr) {
    auto it = cache_.find(&tr);
    if (it != cache_.end()) {
        return it->second;
    }

    std::vector<exon> coding = tr.translateable_exons();
    std::sort(coding.begin(), coding.end(),
              [](const exon& a, const exon& b) { return a.start < b.start; });
    return cache_.emplace(&tr, std::move(coding)).first->second;
}

// ============================================================================
// transcript_clusterer implementation
// ============================================================================

std::vector<gene> transcript_clusterer::cluster_into_genes(
    const std::vector<transcript_ptr>& transcripts) {

    auto clusters = cluster_transcripts(transcripts, overlap_mode::CODING);
    logging::debug("Clustered " + std::to_string(transcripts.size()) +
                   " transcript(s) into " + std::to_string(clusters.size()) + " coding cluster(s)");
    return to_genes(clusters);
}

std::vector<gene> transcript_clusterer::cluster_into_pseudogenes(
    const std::vector<transcript_ptr>& transcripts) {

    auto clusters = cluster_transcripts(transcripts, overlap_mode::GENOMIC);
    logging::debug("Clustered " + std::to_string(transcripts.size()) +
                   " transcript(s) into " + std::to_string(clusters.size()) + " cluster(s)");
    return to_genes(clusters);
}

std::vector<transcript_cluster> transcript_clusterer::cluster_transcripts(
    const std::vector<transcript_ptr>& transcripts, overlap_mode mode) {

    // Cached coding exons from a previous run may belong to freed transcripts
    cache_.clear();
    stats_.runs++;

    std::vector<transcript_ptr> sorted;
    sorted.reserve(transcripts.size());
    for (const auto& tr : transcripts) {
        stats_.input_transcripts++;
        if (mode == overlap_mode::CODING && !tr->is_coding()) {
            stats_.non_coding_skipped++;
            continue;
        }
        sorted.push_back(tr);
    }

    // Start ascending, end descending
    if (mode == overlap_mode::CODING) {
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const transcript_ptr& a, const transcript_ptr& b) {
                if (a->coding_region_start() != b->coding_region_start()) {
                    return a->coding_region_start() < b->coding_region_start();
                }
                return a->coding_region_end() > b->coding_region_end();
            });
    } else {
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const transcript_ptr& a, const transcript_ptr& b) {
                if (a->start() != b->start()) return a->start() < b->start();
                return a->end() > b->end();
            });
    }

    std::vector<transcript_cluster> clusters;

    for (const auto& tr : sorted) {
        std::vector<size_t> matching;
        for (size_t i = 0; i < clusters.size(); ++i) {
            if (matches(*tr, clusters[i], mode)) {
                matching.push_back(i);
            }
        }

        if (matching.empty()) {
            transcript_cluster cluster;
            cluster.add_transcript(tr);
            clusters.push_back(std::move(cluster));
        } else if (matching.size() == 1) {
            clusters[matching.front()].add_transcript(tr);
        } else {
            // Transcript bridges several clusters: merge them all
            stats_.cluster_merges++;
            transcript_cluster merged;
            for (size_t idx : matching) {
                merged.absorb(clusters[idx]);
            }
            merged.add_transcript(tr);

            std::vector<transcript_cluster> remaining;
            remaining.reserve(clusters.size() - matching.size() + 1);
            remaining.push_back(std::move(merged));
            for (size_t i = 0; i < clusters.size(); ++i) {
                if (std::find(matching.begin(), matching.end(), i) == matching.end()) {
                    remaining.push_back(std::move(clusters[i]));
                }
            }
            clusters = std::move(remaining);
        }
    }

    check_clusters(sorted.size(), clusters);
    stats_.clusters += clusters.size();

    return clusters;
}

bool transcript_clusterer::matches(const transcript& tr, const transcript_cluster& cluster,
                                   overlap_mode mode) {
    for (const auto& member : cluster.members) {
        bool overlap = mode == overlap_mode::CODING
            ? coding_overlap(tr, *member)
            : genomic_overlap(tr, *member);
        if (overlap) return true;
    }
    return false;
}

bool transcript_clusterer::coding_overlap(const transcript& a, const transcript& b) {
    if (a.coding_region_end() < b.coding_region_start() ||
        a.coding_region_start() > b.coding_region_end()) {
        return false;
    }

    const auto& exons_a = cache_.get(a);
    const auto& exons_b = cache_.get(b);
    for (const auto& ea : exons_a) {
        for (const auto& eb : exons_b) {
            if (ea.overlaps(eb) && ea.strand == eb.strand) {
                return true;
            }
        }
    }
    return false;
}

bool transcript_clusterer::genomic_overlap(const transcript& a, const transcript& b) const {
    if (a.end() < b.start() || a.start() > b.end()) {
        return false;
    }

    for (const auto& ea : a.exons) {
        for (const auto& eb : b.exons) {
            if (ea->overlaps(*eb) && ea->strand == eb->strand) {
                return true;
            }
        }
    }
    return false;
}

void transcript_clusterer::check_clusters(size_t num_transcripts,
                                          const std::vector<transcript_cluster>& clusters) {
    size_t total = 0;
    std::unordered_set<const transcript*> seen;

    for (const auto& cluster : clusters) {
        if (cluster.empty()) {
            throw std::logic_error("Empty cluster");
        }
        total += cluster.size();
        for (const auto& tr : cluster.members) {
            if (!seen.insert(tr.get()).second) {
                throw std::logic_error("Transcript " + tr->id + " added twice to clusters");
            }
        }
    }

    if (total != num_transcripts) {
        throw std::logic_error("Not all transcripts have been added into clusters: " +
            std::to_string(total) + " clustered, " + std::to_string(num_transcripts) + " expected");
    }
}

std::vector<gene> transcript_clusterer::to_genes(const std::vector<transcript_cluster>& clusters) {
    std::vector<gene> genes;
    genes.reserve(clusters.size());
    for (const auto& cluster : clusters) {
        genes.push_back(cluster.to_gene());
    }
    return genes;
}
