/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "genomic_feature.hpp"

// standard
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

// ============================================================================
// transcript implementation
// ============================================================================

size_t transcript::start() const {
    if (exons.empty()) return 0;
    size_t low = exons.front()->start;
    for (const auto& ex : exons) {
        low = std::min(low, ex->start);
    }
    return low;
}

size_t transcript::end() const {
    size_t high = 0;
    for (const auto& ex : exons) {
        high = std::max(high, ex->end);
    }
    return high;
}

int transcript::strand() const {
    return exons.empty() ? 1 : exons.front()->strand;
}

const exon& transcript::exon_at(size_t index) const {
    if (index >= exons.size()) {
        throw std::invalid_argument("Translation of transcript " + id +
            " references exon " + std::to_string(index) + " but the transcript has " +
            std::to_string(exons.size()) + " exon(s)");
    }
    return *exons[index];
}

size_t transcript::coding_region_start() const {
    if (!translation) {
        throw std::invalid_argument("Transcript " + id + " has no translation");
    }
    if (strand() == 1) {
        return exon_at(translation->start_exon).start + translation->seq_start - 1;
    }
    return exon_at(translation->end_exon).end - translation->seq_end + 1;
}

size_t transcript::coding_region_end() const {
    if (!translation) {
        throw std::invalid_argument("Transcript " + id + " has no translation");
    }
    if (strand() == 1) {
        return exon_at(translation->end_exon).start + translation->seq_end - 1;
    }
    return exon_at(translation->start_exon).end - translation->seq_start + 1;
}

std::vector<exon> transcript::translateable_exons() const {
    std::vector<exon> coding;
    if (!translation) return coding;

    size_t cds_start = coding_region_start();
    size_t cds_end = coding_region_end();

    for (size_t i = translation->start_exon; i <= translation->end_exon; ++i) {
        exon clipped = exon_at(i).structure();
        clipped.start = std::max(clipped.start, cds_start);
        clipped.end = std::min(clipped.end, cds_end);
        if (clipped.start > clipped.end) continue;
        coding.push_back(clipped);
    }
    return coding;
}

std::vector<exon> transcript::exon_structure() const {
    std::vector<exon> result;
    result.reserve(exons.size());
    for (const auto& ex : exons) {
        result.push_back(ex->structure());
    }
    return result;
}

size_t transcript::coding_length() const {
    size_t length = 0;
    for (const auto& ex : translateable_exons()) {
        length += ex.length();
    }
    return length;
}

size_t transcript::peptide_length() const {
    return coding_length() / 3;
}

void transcript::set_coding_region(size_t cds_start, size_t cds_end) {
    if (cds_start > cds_end) {
        throw std::invalid_argument("Transcript " + id + " has an inverted coding region " +
            std::to_string(cds_start) + "-" + std::to_string(cds_end));
    }

    std::optional<size_t> low_exon;
    std::optional<size_t> high_exon;
    for (size_t i = 0; i < exons.size(); ++i) {
        if (exons[i]->start <= cds_start && cds_start <= exons[i]->end) low_exon = i;
        if (exons[i]->start <= cds_end && cds_end <= exons[i]->end) high_exon = i;
    }
    if (!low_exon || !high_exon) {
        throw std::invalid_argument("Coding region " + std::to_string(cds_start) + "-" +
            std::to_string(cds_end) + " of transcript " + id + " does not start and end inside exons");
    }

    if (strand() == 1) {
        translation = translation_span(*low_exon, *high_exon,
            cds_start - exons[*low_exon]->start + 1,
            cds_end - exons[*high_exon]->start + 1);
    } else {
        // 5' end of the coding region is the highest coordinate
        translation = translation_span(*high_exon, *low_exon,
            exons[*high_exon]->end - cds_end + 1,
            exons[*low_exon]->end - cds_start + 1);
    }
}

void transcript::assign_phases() {
    size_t coding_bases = 0;
    std::vector<exon> coding = translateable_exons();
    size_t coding_idx = 0;

    for (size_t i = 0; i < exons.size(); ++i) {
        exon& ex = *exons[i];
        if (!translation || i < translation->start_exon || i > translation->end_exon) {
            ex.phase = -1;
            ex.end_phase = -1;
            continue;
        }

        if (coding_idx >= coding.size()) {
            throw std::invalid_argument("Translation of transcript " + id +
                " does not cover exon " + std::to_string(i));
        }
        size_t clipped = coding[coding_idx++].length();
        ex.phase = (i == translation->start_exon && translation->seq_start != 1)
            ? -1 : static_cast<int>(coding_bases % 3);
        coding_bases += clipped;
        ex.end_phase = (i == translation->end_exon && translation->seq_end != ex.length())
            ? -1 : static_cast<int>(coding_bases % 3);
    }
}

void transcript::sort_exons() {
    exon* start_exon = nullptr;
    exon* end_exon = nullptr;
    if (translation) {
        start_exon = exons.at(translation->start_exon).get();
        end_exon = exons.at(translation->end_exon).get();
    }

    bool reverse = strand() == -1;
    std::stable_sort(exons.begin(), exons.end(),
        [reverse](const exon_ptr& a, const exon_ptr& b) {
            return reverse ? a->start > b->start : a->start < b->start;
        });

    if (translation) {
        for (size_t i = 0; i < exons.size(); ++i) {
            if (exons[i].get() == start_exon) translation->start_exon = i;
            if (exons[i].get() == end_exon) translation->end_exon = i;
        }
    }
}

void transcript::validate() const {
    if (exons.empty()) {
        throw std::invalid_argument("Transcript " + id + " has no exons");
    }
    int str = exons.front()->strand;
    for (size_t i = 0; i < exons.size(); ++i) {
        const exon& ex = *exons[i];
        if (ex.start > ex.end) {
            throw std::invalid_argument("Exon " + std::to_string(i) + " of transcript " + id +
                " has start " + std::to_string(ex.start) + " after end " + std::to_string(ex.end));
        }
        if (ex.strand != str || (ex.strand != 1 && ex.strand != -1)) {
            throw std::invalid_argument("Transcript " + id + " has exons on inconsistent strands");
        }
    }
    if (translation) {
        const exon& first = exon_at(translation->start_exon);
        const exon& last = exon_at(translation->end_exon);
        if (translation->seq_start < 1 || translation->seq_start > first.length() ||
            translation->seq_end < 1 || translation->seq_end > last.length()) {
            throw std::invalid_argument("Translation of transcript " + id +
                " has offsets " + std::to_string(translation->seq_start) + "/" +
                std::to_string(translation->seq_end) + " outside its exons");
        }
        if (translation->start_exon > translation->end_exon) {
            throw std::invalid_argument("Translation of transcript " + id +
                " starts after it ends");
        }
        if (coding_region_start() > coding_region_end()) {
            throw std::invalid_argument("Transcript " + id + " has an empty coding region");
        }
    }
}

bool transcript::add_db_entry(const db_entry& entry) {
    if (std::find(db_entries.begin(), db_entries.end(), entry) != db_entries.end()) {
        return false;
    }
    db_entries.push_back(entry);
    return true;
}

bool transcript::add_attribute(const attribute& attrib) {
    if (std::find(attributes.begin(), attributes.end(), attrib) != attributes.end()) {
        return false;
    }
    attributes.push_back(attrib);
    return true;
}

bool transcript::add_supporting_feature(const supporting_feature& feature) {
    for (const auto& existing : supporting_features) {
        if (existing.same_alignment(feature)) return false;
    }
    supporting_features.push_back(feature);
    return true;
}

bool transcript::has_db_entry(const std::string& dbname) const {
    return std::any_of(db_entries.begin(), db_entries.end(),
        [&dbname](const db_entry& e) { return e.dbname == dbname; });
}

size_t transcript::remove_db_entries(const std::vector<std::string>& dbnames) {
    size_t before = db_entries.size();
    db_entries.erase(std::remove_if(db_entries.begin(), db_entries.end(),
        [&dbnames](const db_entry& e) {
            return std::find(dbnames.begin(), dbnames.end(), e.dbname) != dbnames.end();
        }), db_entries.end());
    return before - db_entries.size();
}

// ============================================================================
// gene implementation
// ============================================================================

size_t gene::start() const {
    if (transcripts.empty()) return 0;
    size_t low = transcripts.front()->start();
    for (const auto& tr : transcripts) {
        low = std::min(low, tr->start());
    }
    return low;
}

size_t gene::end() const {
    size_t high = 0;
    for (const auto& tr : transcripts) {
        high = std::max(high, tr->end());
    }
    return high;
}

void gene::add_transcript(transcript_ptr tr) {
    if (seqid.empty()) {
        seqid = tr->seqid;
    }
    transcripts.push_back(std::move(tr));
}

bool gene::remove_transcript(const transcript* tr) {
    auto it = std::find_if(transcripts.begin(), transcripts.end(),
        [tr](const transcript_ptr& t) { return t.get() == tr; });
    if (it == transcripts.end()) return false;
    transcripts.erase(it);
    return true;
}

bool gene::contains(const transcript* tr) const {
    return std::any_of(transcripts.begin(), transcripts.end(),
        [tr](const transcript_ptr& t) { return t.get() == tr; });
}

std::vector<exon_ptr> gene::get_all_exons() const {
    std::vector<exon_ptr> all;
    for (const auto& tr : transcripts) {
        for (const auto& ex : tr->exons) {
            if (std::find(all.begin(), all.end(), ex) == all.end()) {
                all.push_back(ex);
            }
        }
    }
    return all;
}

gene gene::clone() const {
    gene copy(id, seqid, biotype);
    copy.logic_name = logic_name;

    std::unordered_map<const exon*, exon_ptr> copied_exons;
    for (const auto& tr : transcripts) {
        auto tr_copy = std::make_shared<transcript>(*tr);
        for (auto& ex : tr_copy->exons) {
            auto it = copied_exons.find(ex.get());
            if (it == copied_exons.end()) {
                auto ex_copy = std::make_shared<exon>(*ex);
                copied_exons.emplace(ex.get(), ex_copy);
                ex = ex_copy;
            } else {
                ex = it->second;
            }
        }
        copy.transcripts.push_back(std::move(tr_copy));
    }
    return copy;
}
