/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "gene_source.hpp"
#include "utility.hpp"

#include <algorithm>
#include <stdexcept>

// ============================================================================
// region implementation
// ============================================================================

region region::parse(const std::string& str) {
    std::string value = trim(str);
    if (value.empty()) {
        throw std::invalid_argument("Empty region");
    }

    auto colon = value.rfind(':');
    if (colon == std::string::npos) {
        return region(value);
    }

    std::string seq = value.substr(0, colon);
    std::string range = value.substr(colon + 1);
    auto dash = range.find('-');
    if (seq.empty() || dash == std::string::npos) {
        throw std::invalid_argument("Malformed region '" + str + "' (expected seqid:start-end)");
    }

    size_t s = 0;
    size_t e = 0;
    try {
        size_t pos_start = 0;
        size_t pos_end = 0;
        std::string start_str = range.substr(0, dash);
        std::string end_str = range.substr(dash + 1);
        // Thousands separators are allowed
        start_str.erase(std::remove(start_str.begin(), start_str.end(), ','), start_str.end());
        end_str.erase(std::remove(end_str.begin(), end_str.end(), ','), end_str.end());
        s = std::stoull(start_str, &pos_start);
        e = std::stoull(end_str, &pos_end);
        if (pos_start != start_str.size() || pos_end != end_str.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Malformed region '" + str + "' (expected seqid:start-end)");
    }

    if (s == 0 || s > e) {
        throw std::invalid_argument("Invalid region bounds in '" + str + "'");
    }
    return region(seq, s, e);
}

std::string region::to_string() const {
    if (start <= 1 && end == SIZE_MAX) {
        return seqid;
    }
    return seqid + ":" + std::to_string(start) + "-" + std::to_string(end);
}

// ============================================================================
// memory_gene_source implementation
// ============================================================================

void memory_gene_source::add_gene(gene g) {
    genes_.push_back(std::move(g));
}

std::vector<gene> memory_gene_source::fetch_genes_by_type(const region& r,
                                                          const std::string& biotype) {
    std::vector<gene> result;
    for (const auto& g : genes_) {
        if (g.biotype != biotype || g.empty()) continue;
        if (!r.overlaps(g.seqid, g.start(), g.end())) continue;
        result.push_back(g.clone());
    }
    return result;
}

std::vector<std::string> memory_gene_source::sequence_names() const {
    std::set<std::string> names;
    for (const auto& g : genes_) {
        names.insert(g.seqid);
    }
    return {names.begin(), names.end()};
}

// ============================================================================
// transcript_discarded_set implementation
// ============================================================================

void transcript_discarded_set::add(const transcript& tr) {
    by_seqid_[tr.seqid].push_back(tr.exon_structure());
    size_++;
}

void transcript_discarded_set::add_gene(const gene& g) {
    for (const auto& tr : g.transcripts) {
        add(*tr);
    }
}

bool transcript_discarded_set::contains(const transcript& tr) const {
    auto it = by_seqid_.find(tr.seqid);
    if (it == by_seqid_.end()) return false;

    for (const auto& discarded : it->second) {
        if (discarded.size() != tr.exons.size()) continue;

        bool same = true;
        for (size_t i = 0; i < discarded.size() && same; ++i) {
            same = discarded[i].same_coordinates(*tr.exons[i]);
        }
        if (same) return true;
    }
    return false;
}

// ============================================================================
// memory_gene_store implementation
// ============================================================================

void memory_gene_store::store(const gene& g) {
    if (!ids_.insert(g.id).second) {
        logging::debug("Gene " + g.id + " already stored");
        return;
    }
    genes_.push_back(g.clone());
}
