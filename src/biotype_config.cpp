/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "biotype_config.hpp"
#include "utility.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

std::string to_string(biotype_category category) {
    switch (category) {
        case biotype_category::CODING: return "coding";
        case biotype_category::PROCESSED: return "processed";
        case biotype_category::PSEUDOGENE: return "pseudogene";
    }
    return "unknown";
}

biotype_config::biotype_config() {
    add(source_tag::SOURCE_A, biotype_category::CODING, "protein_coding");
    add(source_tag::SOURCE_A, biotype_category::PROCESSED, "processed_transcript");
    add(source_tag::SOURCE_A, biotype_category::PROCESSED, "retained_intron");
    add(source_tag::SOURCE_A, biotype_category::PROCESSED, "lincRNA");
    add(source_tag::SOURCE_A, biotype_category::PSEUDOGENE, "pseudogene");
    add(source_tag::SOURCE_A, biotype_category::PSEUDOGENE, "processed_pseudogene");
    add(source_tag::SOURCE_A, biotype_category::PSEUDOGENE, "unprocessed_pseudogene");

    add(source_tag::SOURCE_B, biotype_category::CODING, "protein_coding");
    add(source_tag::SOURCE_B, biotype_category::PROCESSED, "processed_transcript");
    add(source_tag::SOURCE_B, biotype_category::PSEUDOGENE, "pseudogene");
    add(source_tag::SOURCE_B, biotype_category::PSEUDOGENE, "processed_pseudogene");
}

size_t biotype_config::source_index(source_tag source) {
    return source == source_tag::SOURCE_A ? 0 : 1;
}

size_t biotype_config::category_index(biotype_category category) {
    switch (category) {
        case biotype_category::CODING: return 0;
        case biotype_category::PROCESSED: return 1;
        case biotype_category::PSEUDOGENE: return 2;
    }
    return 0;
}

void biotype_config::add(source_tag source, biotype_category category, const std::string& biotype) {
    auto& list = lists_[source_index(source)][category_index(category)];
    if (std::find(list.begin(), list.end(), biotype) == list.end()) {
        list.push_back(biotype);
    }
}

void biotype_config::clear() {
    for (auto& per_source : lists_) {
        for (auto& list : per_source) {
            list.clear();
        }
    }
}

const std::vector<std::string>& biotype_config::biotypes(source_tag source,
                                                         biotype_category category) const {
    return lists_[source_index(source)][category_index(category)];
}

bool biotype_config::contains(source_tag source, biotype_category category,
                              const std::string& biotype) const {
    const auto& list = biotypes(source, category);
    return std::find(list.begin(), list.end(), biotype) != list.end();
}

bool biotype_config::ends_with(const std::string& str, const std::string& suffix) {
    return !suffix.empty() && str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool biotype_config::is_merged_biotype(const std::string& biotype) const {
    return ends_with(biotype, merged_transcript_suffix);
}

std::string biotype_config::base_biotype(const std::string& biotype) const {
    std::string base = biotype;
    for (const auto* suffix : {&merged_transcript_suffix, &non_coding_conversion_suffix,
                               &source_a_suffix}) {
        if (ends_with(base, *suffix)) {
            base.erase(base.size() - suffix->size());
        }
    }
    return base;
}

source_tag biotype_config::parse_source(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "a") return source_tag::SOURCE_A;
    if (v == "b") return source_tag::SOURCE_B;
    throw std::runtime_error("Unknown source '" + value + "' (expected a or b)");
}

biotype_category biotype_config::parse_category(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "coding") return biotype_category::CODING;
    if (v == "processed") return biotype_category::PROCESSED;
    if (v == "pseudogene") return biotype_category::PSEUDOGENE;
    throw std::runtime_error("Unknown biotype category '" + value +
                             "' (expected coding, processed or pseudogene)");
}

biotype_config biotype_config::from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open biotype config file: " + filepath.string());
    }

    std::string line;
    size_t line_num = 0;
    std::unordered_map<std::string, size_t> columns;

    // Header: first non-comment line
    while (std::getline(file, line)) {
        line_num++;
        if (trim(line).empty() || line[0] == '#') continue;

        auto fields = split(line, '\t');
        for (size_t i = 0; i < fields.size(); ++i) {
            std::string name = to_lower(trim(fields[i]));
            if (!name.empty()) {
                columns[name] = i;
            }
        }
        break;
    }

    for (const auto* required : {"source", "category", "biotype"}) {
        if (columns.find(required) == columns.end()) {
            throw std::runtime_error("Biotype config missing required '" + std::string(required) +
                                     "' column: " + filepath.string());
        }
    }
    if (columns.size() != 3) {
        throw std::runtime_error("Biotype config has unknown columns: " + filepath.string());
    }

    biotype_config cfg;
    cfg.clear();
    size_t entries = 0;

    while (std::getline(file, line)) {
        line_num++;

        // Skip empty lines and comments
        if (trim(line).empty() || line[0] == '#') {
            continue;
        }

        auto fields = split(line, '\t');
        auto get_field = [&](const std::string& col_name) -> std::string {
            size_t idx = columns[col_name];
            return idx < fields.size() ? trim(fields[idx]) : "";
        };

        try {
            std::string biotype = get_field("biotype");
            if (biotype.empty()) {
                throw std::runtime_error("Missing biotype");
            }
            cfg.add(parse_source(get_field("source")), parse_category(get_field("category")), biotype);
            entries++;
        } catch (const std::exception& e) {
            throw std::runtime_error("Error parsing biotype config line " +
                std::to_string(line_num) + ": " + e.what());
        }
    }

    if (entries == 0) {
        throw std::runtime_error("Biotype config lists no biotypes: " + filepath.string());
    }

    logging::info("Loaded " + std::to_string(entries) + " biotype(s) from " + filepath.string());
    return cfg;
}

void biotype_config::write_template(const std::filesystem::path& output_path) const {
    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create template file: " + output_path.string());
    }

    file << "source\tcategory\tbiotype\n";
    for (auto source : {source_tag::SOURCE_A, source_tag::SOURCE_B}) {
        for (auto category : {biotype_category::CODING, biotype_category::PROCESSED,
                              biotype_category::PSEUDOGENE}) {
            for (const auto& biotype : biotypes(source, category)) {
                file << (source == source_tag::SOURCE_A ? "a" : "b") << "\t"
                     << to_string(category) << "\t" << biotype << "\n";
            }
        }
    }
}
