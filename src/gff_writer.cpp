/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "gff_writer.hpp"
#include "utility.hpp"

#include <cstdio>
#include <map>
#include <stdexcept>
#include <vector>

namespace {

const char* source_column = "locusmerge";

char strand_char(int strand) {
    return strand == -1 ? '-' : '+';
}

void write_line(std::ostream& out, const std::string& seqid, const std::string& type,
                size_t start, size_t end, int strand, const std::string& phase,
                const std::string& attributes) {
    out << seqid << "\t" << source_column << "\t" << type << "\t"
        << start << "\t" << end << "\t.\t" << strand_char(strand) << "\t"
        << phase << "\t" << attributes << "\n";
}

} // namespace

gff_writer::gff_writer(const std::filesystem::path& filepath)
    : filepath_(filepath), out_(filepath) {
    if (!out_.is_open()) {
        throw std::runtime_error("Cannot create output file: " + filepath.string());
    }
    out_ << "##gff-version 3\n";
}

std::string gff_writer::escape(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case ';': case '=': case '&': case ',': case '%': case '\t': case '\n': {
                char buf[4];
                std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned char>(c));
                result += buf;
                break;
            }
            default:
                result += c;
        }
    }
    return result;
}

void gff_writer::write_gene(std::ostream& out, const gene& g) {
    if (g.empty()) return;

    std::string gene_attrs = "ID=" + escape(g.id);
    if (!g.biotype.empty()) gene_attrs += ";biotype=" + escape(g.biotype);
    if (!g.logic_name.empty()) gene_attrs += ";logic_name=" + escape(g.logic_name);
    write_line(out, g.seqid, "gene", g.start(), g.end(), g.transcripts.front()->strand(), ".",
               gene_attrs);

    for (const auto& tr : g.transcripts) {
        std::string attrs = "ID=" + escape(tr->id) + ";Parent=" + escape(g.id);
        if (!tr->biotype.empty()) attrs += ";biotype=" + escape(tr->biotype);
        if (!tr->logic_name.empty()) attrs += ";logic_name=" + escape(tr->logic_name);

        if (!tr->db_entries.empty()) {
            attrs += ";Dbxref=";
            for (size_t i = 0; i < tr->db_entries.size(); ++i) {
                if (i > 0) attrs += ",";
                attrs += escape(tr->db_entries[i].dbname) + ":" +
                         escape(tr->db_entries[i].primary_id);
            }
        }

        // Attributes with the same code are written as one multi-value attribute
        std::map<std::string, std::vector<std::string>> grouped;
        for (const auto& attrib : tr->attributes) {
            grouped[attrib.code].push_back(attrib.value);
        }
        for (const auto& [code, values] : grouped) {
            attrs += ";" + escape(code) + "=";
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) attrs += ",";
                attrs += escape(values[i]);
            }
        }

        if (!tr->supporting_features.empty()) {
            attrs += ";evidence=";
            for (size_t i = 0; i < tr->supporting_features.size(); ++i) {
                const auto& sf = tr->supporting_features[i];
                if (i > 0) attrs += ",";
                attrs += escape(sf.hit_name) + (sf.type == evidence_type::PROTEIN ? ":protein" : ":dna");
            }
        }
        write_line(out, tr->seqid, "mRNA", tr->start(), tr->end(), tr->strand(), ".", attrs);

        for (const auto& ex : tr->exons) {
            std::string exon_attrs = "Parent=" + escape(tr->id);
            if (!ex->supporting_features.empty()) {
                exon_attrs += ";evidence=";
                for (size_t i = 0; i < ex->supporting_features.size(); ++i) {
                    const auto& sf = ex->supporting_features[i];
                    if (i > 0) exon_attrs += ",";
                    exon_attrs += escape(sf.hit_name) +
                        (sf.type == evidence_type::PROTEIN ? ":protein" : ":dna");
                }
            }
            write_line(out, tr->seqid, "exon", ex->start, ex->end, ex->strand, ".", exon_attrs);
        }

        // CDS phase: bases to skip before the next complete codon
        size_t coding_bases = 0;
        for (const auto& cds : tr->translateable_exons()) {
            size_t phase = (3 - coding_bases % 3) % 3;
            write_line(out, tr->seqid, "CDS", cds.start, cds.end, cds.strand,
                       std::to_string(phase), "Parent=" + escape(tr->id));
            coding_bases += cds.length();
        }
    }
}

void gff_writer::store(const gene& g) {
    if (!written_ids_.insert(g.id).second) {
        logging::debug("Gene " + g.id + " already written to " + filepath_.string());
        return;
    }
    write_gene(out_, g);
    if (!out_) {
        throw std::runtime_error("Failed writing gene " + g.id + " to " + filepath_.string());
    }
    genes_written_++;
    transcripts_written_ += g.size();
}
