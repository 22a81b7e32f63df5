/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "transcript_reconciler.hpp"
#include "utility.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace {

using outcome = pair_decision::outcome;

size_t span_low(const std::vector<exon>& exons) {
    return std::min(exons.front().start, exons.back().start);
}

size_t span_high(const std::vector<exon>& exons) {
    return std::max(exons.front().end, exons.back().end);
}

bool same_strand(const std::vector<exon>& a, const std::vector<exon>& b) {
    return a.front().strand == b.front().strand && a.back().strand == b.back().strand;
}

/**
 * Splice-site side of the first and last exon
 * Forward strand: end of the first exon, start of the last exon
 * Reverse strand: start of the first exon, end of the last exon
 */
bool inner_boundaries_match(const std::vector<exon>& a, const std::vector<exon>& b) {
    if (!same_strand(a, b)) return false;
    if (a.front().strand == 1) {
        return a.front().end == b.front().end && a.back().start == b.back().start;
    }
    return a.front().start == b.front().start && a.back().end == b.back().end;
}

// Internal exons (all but first and last) of two equally sized lists
bool internal_exons_match(const std::vector<exon>& a, const std::vector<exon>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 1; i + 1 < a.size(); ++i) {
        if (!a[i].same_coordinates(b[i])) return false;
    }
    return true;
}

bool same_span(const std::vector<exon>& a, const std::vector<exon>& b) {
    return span_low(a) == span_low(b) && span_high(a) == span_high(b);
}

// Span of the first list strictly contains the span of the second
bool extends_both_ends(const std::vector<exon>& outer, const std::vector<exon>& inner) {
    return same_strand(outer, inner) &&
           span_low(outer) < span_low(inner) && span_high(outer) > span_high(inner);
}

// Exons of B reach beyond its coding region
bool b_has_utr(const pair_view& p) {
    return span_low(p.b_exons) != p.b.coding_region_start() ||
           span_high(p.b_exons) != p.b.coding_region_end();
}

bool both_non_coding(const pair_view& p) { return !p.a_is_coding() && !p.b_is_coding(); }
bool only_a_coding(const pair_view& p) { return p.a_is_coding() && !p.b_is_coding(); }
bool only_b_coding(const pair_view& p) { return !p.a_is_coding() && p.b_is_coding(); }
bool single_exon(const pair_view& p) { return p.a_exons.size() == 1; }

} // namespace

std::string to_string(pair_decision::outcome result) {
    switch (result) {
        case outcome::KEEP_BOTH: return "keep_both";
        case outcome::KEEP_BOTH_LINKED: return "keep_both_linked";
        case outcome::DROP_B: return "drop_b";
        case outcome::DROP_A: return "drop_a";
    }
    return "unknown";
}

pair_view::pair_view(const transcript& ta, const transcript& tb)
    : a(ta), b(tb),
      a_exons(ta.exon_structure()), b_exons(tb.exon_structure()),
      a_coding(ta.translateable_exons()), b_coding(tb.translateable_exons()) {}

// ============================================================================
// Rule table
// ============================================================================

std::vector<match_rule> transcript_reconciler::build_rules() {
    // Evaluated top to bottom; later rules rely on earlier ones having failed
    return {
        {"exon_count_mismatch",
         [](const pair_view& p) {
             return p.a_exons.empty() || p.a_exons.size() != p.b_exons.size();
         },
         outcome::KEEP_BOTH},

        // Both non-coding: full exon structure decides
        {"non_coding_internal_mismatch",
         [](const pair_view& p) {
             return both_non_coding(p) && !check_internal_exon_structure(p.b_exons, p.a_exons);
         },
         outcome::KEEP_BOTH},
        {"non_coding_a_not_shorter",
         [](const pair_view& p) {
             return both_non_coding(p) && check_terminal_exon_structure(p.a_exons, p.b_exons);
         },
         outcome::DROP_B},
        {"non_coding_b_longer", both_non_coding, outcome::DROP_A},

        // One coding, one non-coding: coding exons of the one against all
        // exons of the other. The coding one wins unless the non-coding one
        // reaches beyond its coding span at both ends.
        {"coding_a_internal_mismatch",
         [](const pair_view& p) {
             return only_a_coding(p) && p.b_exons.size() > 1 &&
                    !check_internal_exon_structure(p.b_exons, p.a_coding);
         },
         outcome::KEEP_BOTH},
        {"coding_a_shorter_both_ends",
         [](const pair_view& p) {
             return only_a_coding(p) && extends_both_ends(p.b_exons, p.a_coding);
         },
         outcome::DROP_A},
        {"coding_a_kept", only_a_coding, outcome::DROP_B},

        {"coding_b_internal_mismatch",
         [](const pair_view& p) {
             return only_b_coding(p) && p.a_exons.size() > 1 &&
                    !check_internal_exon_structure(p.a_exons, p.b_coding);
         },
         outcome::KEEP_BOTH},
        {"non_coding_a_longer_both_ends",
         [](const pair_view& p) {
             return only_b_coding(p) && extends_both_ends(p.a_exons, p.b_coding);
         },
         outcome::DROP_B},
        {"coding_b_made_non_coding", only_b_coding, outcome::DROP_A, true},

        // Both coding from here on
        {"coding_bounds_differ",
         [](const pair_view& p) {
             return p.a.coding_region_start() != p.b.coding_region_start() ||
                    p.a.coding_region_end() != p.b.coding_region_end();
         },
         outcome::KEEP_BOTH},

        {"single_exon_identical",
         [](const pair_view& p) {
             return single_exon(p) && p.a_exons.front().same_coordinates(p.b_exons.front());
         },
         outcome::DROP_B},
        {"single_exon_a_utr_superset",
         [](const pair_view& p) {
             const exon& ea = p.a_exons.front();
             const exon& eb = p.b_exons.front();
             return single_exon(p) && ea.strand == eb.strand &&
                    ea.start <= eb.start && ea.end >= eb.end && !b_has_utr(p);
         },
         outcome::DROP_B},
        {"single_exon_both_utr",
         [](const pair_view& p) {
             const exon& ea = p.a_exons.front();
             const exon& eb = p.b_exons.front();
             return single_exon(p) && ea.strand == eb.strand &&
                    (ea.start != eb.start || ea.end != eb.end) && b_has_utr(p);
         },
         outcome::DROP_B},
        {"single_exon_fallback", single_exon, outcome::KEEP_BOTH},

        {"internal_coding_mismatch",
         [](const pair_view& p) { return !internal_exons_match(p.a_coding, p.b_coding); },
         outcome::KEEP_BOTH},
        {"internal_exon_mismatch",
         [](const pair_view& p) { return !internal_exons_match(p.a_exons, p.b_exons); },
         outcome::KEEP_BOTH_LINKED},
        {"terminal_exons_identical",
         [](const pair_view& p) {
             return p.a_exons.front().same_coordinates(p.b_exons.front()) &&
                    p.a_exons.back().same_coordinates(p.b_exons.back());
         },
         outcome::DROP_B},
        {"terminal_a_utr_only",
         [](const pair_view& p) {
             return inner_boundaries_match(p.a_exons, p.b_exons) && !b_has_utr(p) &&
                    !same_span(p.a_exons, p.b_exons);
         },
         outcome::DROP_B},
        {"terminal_b_utr",
         [](const pair_view& p) {
             return inner_boundaries_match(p.a_exons, p.b_exons) && b_has_utr(p) &&
                    !same_span(p.a_exons, p.b_exons);
         },
         outcome::DROP_A},
        {"terminal_fallback", [](const pair_view&) { return true; }, outcome::KEEP_BOTH_LINKED},
    };
}

// ============================================================================
// transcript_reconciler implementation
// ============================================================================

transcript_reconciler::transcript_reconciler(const config& cfg)
    : cfg_(cfg), rules_(build_rules()) {}

pair_decision transcript_reconciler::are_matched_pair(const transcript& a,
                                                      const transcript& b) const {
    pair_view view(a, b);

    for (const auto& rule : rules_) {
        if (!rule.applies(view)) continue;

        pair_decision decision;
        decision.result = rule.result;
        decision.rule = rule.name;
        decision.strip_b_translation = rule.strip_b_translation;
        return decision;
    }

    throw std::logic_error("No reconciliation rule applies to transcripts " + a.id + " and " + b.id);
}

bool transcript_reconciler::check_internal_exon_structure(const std::vector<exon>& first,
                                                          const std::vector<exon>& second) {
    if (first.empty() || first.size() != second.size()) {
        return false;
    }
    return inner_boundaries_match(first, second) && internal_exons_match(first, second);
}

bool transcript_reconciler::check_terminal_exon_structure(const std::vector<exon>& first,
                                                          const std::vector<exon>& second) {
    if (first.empty() || second.empty() || first.front().strand != second.front().strand) {
        return true;
    }

    size_t low1 = span_low(first), high1 = span_high(first);
    size_t low2 = span_low(second), high2 = span_high(second);

    if (low1 <= low2 && high1 >= high2) {
        return true;
    }
    if (low1 >= low2 && high1 <= high2) {
        return false;
    }
    return true;
}

void transcript_reconciler::transfer_supporting_evidence(const exon& from, exon& to) {
    if (&from == &to) return;

    for (const auto& feature : from.supporting_features) {
        bool present = std::any_of(to.supporting_features.begin(), to.supporting_features.end(),
            [&feature](const supporting_feature& sf) { return sf.same_alignment(feature); });
        if (!present) {
            to.supporting_features.push_back(feature);
        }
    }
}

void transcript_reconciler::transfer_exon_evidence(const transcript& from, transcript& to) {
    if (from.exons.size() != to.exons.size()) {
        throw std::invalid_argument("Cannot transfer exon evidence from transcript " + from.id +
            " (" + std::to_string(from.exons.size()) + " exons) to transcript " + to.id +
            " (" + std::to_string(to.exons.size()) + " exons)");
    }
    for (size_t i = 0; i < from.exons.size(); ++i) {
        transfer_supporting_evidence(*from.exons[i], *to.exons[i]);
    }
}

void transcript_reconciler::add_evidence_attributes(const transcript& from, transcript& to) const {
    for (const auto& sf : from.supporting_features) {
        const std::string& code = sf.type == evidence_type::PROTEIN
            ? cfg_.transcript_protein_evidence : cfg_.transcript_dna_evidence;
        to.add_attribute({code, sf.hit_name});
    }
    for (const auto& ex : from.exons) {
        for (const auto& sf : ex->supporting_features) {
            const std::string& code = sf.type == evidence_type::PROTEIN
                ? cfg_.exon_protein_evidence : cfg_.exon_dna_evidence;
            to.add_attribute({code, sf.hit_name});
        }
    }
}

void transcript_reconciler::add_unmatched_xref(transcript& a) const {
    const auto entries = a.db_entries;
    for (const auto& entry : entries) {
        if (entry.dbname == cfg_.source_a_xref_db && entry.primary_id == entry.display_id) {
            a.add_db_entry({cfg_.unmatched_xref_db, entry.primary_id, a.id});
        }
    }
}

void transcript_reconciler::append_merged_suffix(transcript& tr) const {
    const std::string& suffix = cfg_.merged_suffix;
    bool has_suffix = tr.biotype.size() >= suffix.size() &&
        tr.biotype.compare(tr.biotype.size() - suffix.size(), suffix.size(), suffix) == 0;
    if (!has_suffix) {
        tr.biotype += suffix;
    }
}

void transcript_reconciler::apply_relation(const pair_decision& decision,
                                           transcript& a, transcript& b) {
    if (!decision.resolves()) return;

    // Own curated ids of A (primary == display)
    std::vector<db_entry> own_ids;
    for (const auto& entry : a.db_entries) {
        if (entry.dbname == cfg_.source_a_xref_db && entry.primary_id == entry.display_id) {
            own_ids.push_back(entry);
        }
    }

    switch (decision.result) {
        case outcome::KEEP_BOTH_LINKED:
            for (const auto& entry : own_ids) {
                b.add_db_entry({cfg_.shares_cds_with_a_db, entry.primary_id, entry.display_id});
                a.add_db_entry({cfg_.unmatched_xref_db, entry.primary_id, entry.display_id});
            }
            b.add_attribute({cfg_.link_attribute, b.id});
            a.add_db_entry({cfg_.shares_cds_with_b_db, b.id, b.id});
            stats_.linked++;
            break;

        case outcome::DROP_A:
            for (const auto& entry : own_ids) {
                b.add_db_entry({cfg_.shares_cds_with_a_db, entry.primary_id, entry.display_id});
            }
            b.add_attribute({cfg_.edge_attribute, a.seqid + ":" + std::to_string(a.start()) + ":" +
                             std::to_string(a.end()) + ":1"});
            transfer_exon_evidence(a, b);
            add_evidence_attributes(a, b);

            if (decision.strip_b_translation) {
                b.translation.reset();
                b.assign_phases();
                b.biotype = a.biotype + cfg_.non_coding_conversion_suffix;
                stats_.converted_non_coding++;
            }
            stats_.dropped_a++;
            break;

        case outcome::DROP_B:
            for (const auto& entry : own_ids) {
                a.add_db_entry({cfg_.shares_cds_and_utr_db, entry.primary_id, entry.display_id});
            }
            for (const auto& sf : b.supporting_features) {
                a.add_supporting_feature(sf);
            }
            transfer_exon_evidence(b, a);
            stats_.dropped_b++;
            break;

        case outcome::KEEP_BOTH:
            break;
    }

    append_merged_suffix(a);
    append_merged_suffix(b);
}

int transcript_reconciler::priority(const pair_decision& decision) {
    switch (decision.result) {
        case outcome::DROP_B: return 3;
        case outcome::DROP_A: return 2;
        case outcome::KEEP_BOTH_LINKED: return 1;
        case outcome::KEEP_BOTH: return 0;
    }
    return 0;
}

size_t transcript_reconciler::merge_redundant_transcripts(gene& g) {
    stats_.genes++;

    std::vector<transcript_ptr> source_a;
    std::vector<transcript_ptr> source_b;
    for (const auto& tr : g.transcripts) {
        if (tr->source == source_tag::SOURCE_A) {
            source_a.push_back(tr);
        } else {
            source_b.push_back(tr);
        }
    }

    if (source_a.empty()) {
        stats_.genes_without_source_a++;
        return 0;
    }

    size_t removed = 0;
    for (const auto& ta : source_a) {
        stats_.source_a_transcripts++;

        add_evidence_attributes(*ta, *ta);
        ta->supporting_features.clear();

        pair_decision best;
        transcript_ptr partner;

        for (const auto& tb : source_b) {
            // Dropped by an earlier source A transcript
            if (!g.contains(tb.get())) continue;

            stats_.pairs_evaluated++;
            pair_decision decision = are_matched_pair(*ta, *tb);
            stats_.rule_hits[decision.rule]++;

            // Ties keep the earlier partner
            if (priority(decision) > priority(best)) {
                best = decision;
                partner = tb;
            }
        }

        if (!partner) {
            add_unmatched_xref(*ta);
            stats_.unmatched++;
            continue;
        }

        logging::debug("Transcript pair " + ta->id + " / " + partner->id + ": " +
                       to_string(best.result) + " (" + best.rule + ")");

        apply_relation(best, *ta, *partner);

        if (best.drops()) {
            const transcript_ptr& dropped = best.result == outcome::DROP_B ? partner : ta;
            if (g.remove_transcript(dropped.get())) {
                removed++;
            }
        }
    }
    return removed;
}

void transcript_reconciler::merge_all(std::vector<gene>& genes) {
    size_t removed = 0;
    for (auto& g : genes) {
        removed += merge_redundant_transcripts(g);
    }
    logging::info("Reconciled " + std::to_string(genes.size()) + " gene(s): " +
                  std::to_string(removed) + " redundant transcript(s) removed");
}

void transcript_reconciler::write_summary(const std::string& filepath) const {
    std::ofstream out(filepath);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open summary file: " + filepath);
    }

    out << "# Locusmerge Transcript Reconciliation Summary\n\n";

    out << "## Input\n";
    out << "Genes: " << stats_.genes << "\n";
    out << "Genes without source A transcripts: " << stats_.genes_without_source_a << "\n";
    out << "Source A transcripts: " << stats_.source_a_transcripts << "\n";
    out << "Pairs evaluated: " << stats_.pairs_evaluated << "\n";
    out << "\n";

    out << "## Outcomes\n";
    out << "Source B dropped: " << stats_.dropped_b << "\n";
    out << "Source A dropped: " << stats_.dropped_a << "\n";
    out << "Linked (shared CDS): " << stats_.linked << "\n";
    out << "Unmatched source A: " << stats_.unmatched << "\n";
    out << "Converted to non-coding: " << stats_.converted_non_coding << "\n";

    if (!stats_.rule_hits.empty()) {
        out << "\n## Rule Hits\n";
        for (const auto& [rule, count] : stats_.rule_hits) {
            out << rule << ": " << count << "\n";
        }
    }

    out.close();
    logging::info("Wrote reconciliation summary to: " + filepath);
}
