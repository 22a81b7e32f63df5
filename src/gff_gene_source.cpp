/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>

// class
#include "gff_gene_source.hpp"
#include "utility.hpp"

namespace {

const std::vector<std::string> gene_biotype_keys = {"biotype", "gene_biotype", "gene_type"};
const std::vector<std::string> transcript_biotype_keys =
    {"biotype", "transcript_biotype", "transcript_type"};

struct gene_record {
    std::string id;
    std::string seqid;
    std::string biotype;
    std::string logic_name;
};

struct exon_record {
    size_t start;
    size_t end;
    std::vector<supporting_feature> evidence;
};

struct transcript_record {
    std::string id;
    std::string gene_id;
    std::string seqid;
    std::string biotype;
    std::string logic_name;
    int strand = 1;
    std::vector<db_entry> dbxrefs;
    std::vector<supporting_feature> evidence;
    std::vector<exon_record> exons;
    std::optional<size_t> cds_low;
    std::optional<size_t> cds_high;
};

int to_strand(const gio::gff_entry& entry) {
    return entry.strand.value_or('+') == '-' ? -1 : 1;
}

} // namespace

gff_gene_source::gff_gene_source(const std::filesystem::path& filepath)
    : filepath_(filepath) {
    if (!std::filesystem::exists(filepath_)) {
        throw std::runtime_error("Annotation file not found: " + filepath_.string());
    }
    load();
}

std::optional<std::string> gff_gene_source::extract_attribute(
    const std::map<std::string, std::string>& attributes,
    const std::string& key) {
    auto it = attributes.find(key);
    if (it == attributes.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> gff_gene_source::first_attribute(
    const std::map<std::string, std::string>& attributes,
    const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        auto value = extract_attribute(attributes, key);
        if (value) return value;
    }
    return std::nullopt;
}

std::vector<db_entry> gff_gene_source::parse_dbxrefs(const std::string& value) {
    std::vector<db_entry> entries;
    for (const auto& item : split(value, ',')) {
        std::string xref = trim(item);
        if (xref.empty()) continue;

        auto colon = xref.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == xref.size()) {
            throw std::runtime_error("Malformed Dbxref '" + xref + "' (expected db:id)");
        }
        std::string id = xref.substr(colon + 1);
        entries.push_back({xref.substr(0, colon), id, id});
    }
    return entries;
}

std::vector<supporting_feature> gff_gene_source::parse_evidence(const std::string& value,
                                                                size_t start, size_t end,
                                                                int strand) {
    std::vector<supporting_feature> features;
    for (const auto& item : split(value, ',')) {
        std::string ev = trim(item);
        if (ev.empty()) continue;

        auto colon = ev.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            throw std::runtime_error("Malformed evidence '" + ev + "' (expected name:kind)");
        }
        std::string kind = to_lower(ev.substr(colon + 1));
        evidence_type type;
        if (kind == "protein") {
            type = evidence_type::PROTEIN;
        } else if (kind == "dna") {
            type = evidence_type::DNA;
        } else {
            throw std::runtime_error("Unknown evidence kind '" + kind + "' in '" + ev +
                                     "' (expected dna or protein)");
        }
        features.emplace_back(ev.substr(0, colon), start, end, strand, 0, 0, 1, type);
    }
    return features;
}

void gff_gene_source::load() {
    gio::gff_reader reader(filepath_.string());

    std::vector<std::string> gene_order;
    std::unordered_map<std::string, gene_record> gene_records;
    std::vector<std::string> transcript_order;
    std::unordered_map<std::string, transcript_record> transcript_records;

    auto add_gene_record = [&](const std::string& id, const gio::gff_entry& entry) -> gene_record& {
        auto it = gene_records.find(id);
        if (it != gene_records.end()) return it->second;

        gene_record record;
        record.id = id;
        record.seqid = entry.seqid;
        gene_order.push_back(id);
        return gene_records.emplace(id, std::move(record)).first->second;
    };

    auto add_transcript_record = [&](const std::string& id, const gio::gff_entry& entry)
        -> transcript_record& {
        auto it = transcript_records.find(id);
        if (it != transcript_records.end()) return it->second;

        transcript_record record;
        record.id = id;
        record.seqid = entry.seqid;
        record.strand = to_strand(entry);
        transcript_order.push_back(id);
        return transcript_records.emplace(id, std::move(record)).first->second;
    };

    for (const auto& entry : reader) {
        stats_.entries++;

        auto id = extract_attribute(entry.attributes, "ID");
        auto parent = extract_attribute(entry.attributes, "Parent");
        size_t start = entry.interval.get_start();
        size_t end = entry.interval.get_end();

        if (entry.type == "exon" || entry.type == "CDS") {
            std::vector<std::string> parents;
            if (parent) {
                parents = split(*parent, ',');
            } else if (auto tid = entry.get_transcript_id()) {
                parents.push_back(*tid);
            }

            for (const auto& p : parents) {
                auto& record = add_transcript_record(p, entry);
                if (record.gene_id.empty()) {
                    // GTF without transcript lines
                    if (auto gid = entry.get_gene_id()) {
                        record.gene_id = *gid;
                        add_gene_record(*gid, entry);
                    }
                }

                if (entry.type == "exon") {
                    exon_record ex{start, end, {}};
                    if (auto ev = extract_attribute(entry.attributes, "evidence")) {
                        ex.evidence = parse_evidence(*ev, start, end, to_strand(entry));
                    }
                    record.exons.push_back(std::move(ex));
                } else {
                    record.cds_low = std::min(record.cds_low.value_or(start), start);
                    record.cds_high = std::max(record.cds_high.value_or(end), end);
                }
            }
            continue;
        }

        std::optional<std::string> transcript_id;
        std::optional<std::string> gene_id;
        if (id && parent) {
            transcript_id = id;
            gene_id = split(*parent, ',').front();
        } else if (entry.type == "transcript" && entry.get_transcript_id()) {
            transcript_id = entry.get_transcript_id();
            gene_id = entry.get_gene_id();
        }

        if (transcript_id) {
            auto& record = add_transcript_record(*transcript_id, entry);
            if (gene_id) {
                record.gene_id = *gene_id;
                auto& g = add_gene_record(*gene_id, entry);
                // GTF transcript lines repeat the gene attributes
                if (g.biotype.empty()) {
                    g.biotype = first_attribute(entry.attributes, {"gene_biotype", "gene_type"})
                        .value_or("");
                }
            }
            record.biotype = first_attribute(entry.attributes, transcript_biotype_keys).value_or("");
            record.logic_name = extract_attribute(entry.attributes, "logic_name").value_or("");
            if (auto xrefs = extract_attribute(entry.attributes, "Dbxref")) {
                record.dbxrefs = parse_dbxrefs(*xrefs);
            }
            if (auto ev = extract_attribute(entry.attributes, "evidence")) {
                record.evidence = parse_evidence(*ev, start, end, to_strand(entry));
            }
            continue;
        }

        std::optional<std::string> gid = (id && !parent) ? id : std::nullopt;
        if (!gid && entry.type == "gene") {
            gid = entry.get_gene_id();
        }
        if (gid) {
            auto& g = add_gene_record(*gid, entry);
            g.biotype = first_attribute(entry.attributes, gene_biotype_keys).value_or(g.biotype);
            g.logic_name = extract_attribute(entry.attributes, "logic_name").value_or("");
        }
        // UTR, codon and other feature lines are not needed
    }

    // Assemble genes in file order
    std::unordered_map<std::string, size_t> gene_index;
    std::vector<gene> assembled;
    for (const auto& gid : gene_order) {
        const auto& record = gene_records.at(gid);
        gene g(record.id, record.seqid, record.biotype);
        g.logic_name = record.logic_name;
        gene_index[gid] = assembled.size();
        assembled.push_back(std::move(g));
    }

    for (const auto& tid : transcript_order) {
        auto& record = transcript_records.at(tid);

        auto git = gene_index.find(record.gene_id);
        if (git == gene_index.end()) {
            logging::warning("Transcript " + tid + " in " + filepath_.filename().string() +
                             " has no gene, skipping");
            stats_.skipped_transcripts++;
            continue;
        }
        gene& g = assembled[git->second];

        auto tr = std::make_shared<transcript>(record.id, record.seqid,
            record.biotype.empty() ? g.biotype : record.biotype, source_tag::SOURCE_B);
        tr->logic_name = record.logic_name.empty() ? g.logic_name : record.logic_name;
        tr->supporting_features = record.evidence;
        for (const auto& xref : record.dbxrefs) {
            tr->add_db_entry(xref);
        }
        for (const auto& ex : record.exons) {
            auto e = std::make_shared<exon>(ex.start, ex.end, record.strand);
            e->supporting_features = ex.evidence;
            tr->exons.push_back(std::move(e));
        }

        try {
            if (tr->exons.empty()) {
                throw std::invalid_argument("Transcript " + tid + " has no exons");
            }
            tr->sort_exons();
            if (record.cds_low && record.cds_high) {
                tr->set_coding_region(*record.cds_low, *record.cds_high);
            }
            tr->assign_phases();
            tr->validate();
        } catch (const std::invalid_argument& e) {
            logging::warning(std::string(e.what()) + " (" + filepath_.filename().string() +
                             "), skipping");
            stats_.skipped_transcripts++;
            continue;
        }

        g.add_transcript(std::move(tr));
        stats_.transcripts++;
    }

    for (auto& g : assembled) {
        if (g.empty()) continue;
        genes_.push_back(std::move(g));
    }
    stats_.genes = genes_.size();

    logging::info("Loaded " + std::to_string(stats_.genes) + " gene(s) with " +
                  std::to_string(stats_.transcripts) + " transcript(s) from " +
                  filepath_.filename().string());
}

std::vector<gene> gff_gene_source::fetch_genes_by_type(const region& r,
                                                       const std::string& biotype) {
    std::vector<gene> result;
    for (const auto& g : genes_) {
        if (g.biotype != biotype) continue;
        if (!r.overlaps(g.seqid, g.start(), g.end())) continue;
        result.push_back(g.clone());
    }
    return result;
}

std::vector<std::string> gff_gene_source::sequence_names() const {
    std::set<std::string> names;
    for (const auto& g : genes_) {
        names.insert(g.seqid);
    }
    return {names.begin(), names.end()};
}

transcript_discarded_set gff_gene_source::load_discarded_set(const std::filesystem::path& filepath) {
    gff_gene_source source(filepath);
    transcript_discarded_set discarded;
    for (const auto& g : source.genes()) {
        discarded.add_gene(g);
    }
    logging::info("Discarded set holds " + std::to_string(discarded.size()) + " transcript(s)");
    return discarded;
}
