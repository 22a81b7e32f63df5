/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "biotype_resolver.hpp"
#include "utility.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

biotype_resolver::biotype_resolver(const biotype_config& biotypes, const config& cfg)
    : biotypes_(biotypes), cfg_(cfg) {}

bool biotype_resolver::has_suffix(const std::string& str, const std::string& suffix) const {
    return !suffix.empty() && str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<biotype_category> biotype_resolver::categorize(
    const std::string& transcript_biotype) const {

    std::string name = transcript_biotype;
    for (const auto* suffix : {&biotypes_.merged_transcript_suffix,
                               &biotypes_.non_coding_conversion_suffix}) {
        if (has_suffix(name, *suffix)) {
            name.erase(name.size() - suffix->size());
        }
    }

    source_tag source = source_tag::SOURCE_B;
    if (has_suffix(name, biotypes_.source_a_suffix)) {
        name.erase(name.size() - biotypes_.source_a_suffix.size());
        source = source_tag::SOURCE_A;
    }

    for (auto category : {biotype_category::CODING, biotype_category::PROCESSED,
                          biotype_category::PSEUDOGENE}) {
        if (biotypes_.contains(source, category, name)) {
            return category;
        }
    }
    return std::nullopt;
}

gene_classification biotype_resolver::classify(const gene& g) const {
    gene_classification result;
    bool has_a = false;
    bool has_b = false;
    bool has_merged = false;

    for (const auto& tr : g.transcripts) {
        auto category = categorize(tr->biotype);
        if (category == biotype_category::CODING) result.has_coding = true;
        if (category == biotype_category::PROCESSED) result.has_processed = true;
        if (category == biotype_category::PSEUDOGENE) result.has_pseudogene = true;

        if (biotypes_.is_merged_biotype(tr->biotype)) {
            has_merged = true;
        } else if (has_suffix(tr->biotype, biotypes_.source_a_suffix)) {
            has_a = true;
        } else {
            has_b = true;
        }
    }

    if (result.has_coding) {
        result.category = biotype_category::CODING;
    } else if (result.has_processed) {
        result.category = biotype_category::PROCESSED;
    } else if (result.has_pseudogene) {
        result.category = biotype_category::PSEUDOGENE;
    }

    if (has_merged || (has_a && has_b)) {
        result.origin = provenance::MERGED;
    } else if (has_a) {
        result.origin = provenance::SOURCE_A_ONLY;
    } else {
        result.origin = provenance::SOURCE_B_ONLY;
    }
    return result;
}

std::string biotype_resolver::biotype_for(const gene_classification& classification) const {
    if (!classification.category) {
        return cfg_.unclassified_biotype;
    }

    std::string base;
    switch (*classification.category) {
        case biotype_category::CODING: base = cfg_.coding_biotype; break;
        case biotype_category::PROCESSED: base = cfg_.processed_biotype; break;
        case biotype_category::PSEUDOGENE: base = cfg_.pseudogene_biotype; break;
    }

    switch (classification.origin) {
        case provenance::MERGED: return base + biotypes_.merged_gene_suffix;
        case provenance::SOURCE_A_ONLY: return base + biotypes_.source_a_gene_suffix;
        case provenance::SOURCE_B_ONLY: return base + biotypes_.source_b_gene_suffix;
    }
    return base;
}

void biotype_resolver::update_biotype(gene& g) {
    stats_.genes++;
    auto classification = classify(g);

    if (!classification.is_classified()) {
        std::set<std::string> transcript_biotypes;
        for (const auto& tr : g.transcripts) {
            transcript_biotypes.insert(tr->biotype);
        }
        std::ostringstream ss;
        ss << "Gene " << g.id << " (" << g.seqid << ":" << g.start() << "-" << g.end()
           << ") has no known transcript biotype:";
        for (const auto& bt : transcript_biotypes) {
            ss << " " << bt;
        }

        if (cfg_.strict_biotypes) {
            throw std::runtime_error(ss.str());
        }
        logging::warning(ss.str() + "; biotype set to " + cfg_.unclassified_biotype);
        stats_.unclassified++;
        g.biotype = cfg_.unclassified_biotype;
        return;
    }

    switch (*classification.category) {
        case biotype_category::CODING: stats_.coding++; break;
        case biotype_category::PROCESSED: stats_.processed++; break;
        case biotype_category::PSEUDOGENE: stats_.pseudogene++; break;
    }
    switch (classification.origin) {
        case provenance::MERGED: stats_.merged++; break;
        case provenance::SOURCE_A_ONLY: stats_.source_a_only++; break;
        case provenance::SOURCE_B_ONLY: stats_.source_b_only++; break;
    }

    g.biotype = biotype_for(classification);
}

void biotype_resolver::update_biotypes(std::vector<gene>& genes) {
    for (auto& g : genes) {
        update_biotype(g);
    }
    logging::info("Assigned biotypes to " + std::to_string(genes.size()) + " gene(s) (" +
                  std::to_string(stats_.coding) + " coding, " +
                  std::to_string(stats_.processed) + " processed, " +
                  std::to_string(stats_.pseudogene) + " pseudogene, " +
                  std::to_string(stats_.unclassified) + " unclassified so far)");
}
