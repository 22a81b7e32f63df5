/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/merge.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "utility.hpp"
#include "gene_builder.hpp"
#include "gff_gene_source.hpp"
#include "gff_writer.hpp"

namespace subcall {

cxxopts::Options merge::parse_args(int /*argc*/, char** /*argv*/) {
    cxxopts::Options options("locusmerge merge",
        "Merge two gene annotation sets into one non-redundant set");

    options.add_options("Input/Output")
        ("a,source-a", "Curated annotation (GFF3/GTF), its models are preferred",
            cxxopts::value<std::string>())
        ("b,source-b", "Automatic annotation (GFF3/GTF)",
            cxxopts::value<std::string>())
        ("d,discarded", "Transcripts rejected in earlier curation (GFF3/GTF)",
            cxxopts::value<std::string>())
        ("o,output", "Output GFF3 file",
            cxxopts::value<std::string>())
        ("summary", "Write summary statistics to file",
            cxxopts::value<std::string>())
        ;

    options.add_options("Merge")
        ("r,region", "Region to merge (seqid or seqid:start-end), can be given multiple times",
            cxxopts::value<std::vector<std::string>>())
        ("absorption-threshold", "Percent of the longest translation a pseudogene exon "
            "has to overlap to join a coding gene",
            cxxopts::value<double>()->default_value("10.0"))
        ("strict-biotypes", "Fail a region when a gene cannot be classified")
        ;

    options.add_options("Biotypes")
        ("c,biotype-config", "Biotype sets (TSV: source, category, biotype)",
            cxxopts::value<std::string>())
        ("biotype-template", "Write the built-in biotype sets to file and exit",
            cxxopts::value<std::string>())
        ("source-a-suffix", "Biotype suffix marking source A",
            cxxopts::value<std::string>())
        ("source-a-logic-name", "Logic name of genes imported from source A",
            cxxopts::value<std::string>())
        ("merged-gene-logic-name", "Logic name of merged genes",
            cxxopts::value<std::string>())
        ("merged-transcript-logic-name", "Logic name of merged transcripts",
            cxxopts::value<std::string>())
        ;

    add_common_options(options);

    return options;
}

void merge::validate(const cxxopts::ParseResult& args) {
    if (args.count("biotype-template")) {
        return;
    }

    require_file(args, "source-a");
    require_file(args, "source-b");
    if (args.count("discarded")) {
        require_file(args, "discarded");
    }
    if (args.count("biotype-config")) {
        require_file(args, "biotype-config");
    }

    if (!args.count("output")) {
        throw std::runtime_error("No output path specified. Use -o/--output");
    }

    if (args["absorption-threshold"].as<double>() < 0.0) {
        throw std::runtime_error("--absorption-threshold must not be negative");
    }

    // Fail early on malformed regions
    if (args.count("region")) {
        for (const auto& r : args["region"].as<std::vector<std::string>>()) {
            region::parse(r);
        }
    }
}

biotype_config merge::load_biotypes(const cxxopts::ParseResult& args) {
    biotype_config biotypes = args.count("biotype-config")
        ? biotype_config::from_file(args["biotype-config"].as<std::string>())
        : biotype_config();

    if (args.count("source-a-suffix")) {
        biotypes.source_a_suffix = args["source-a-suffix"].as<std::string>();
    }
    if (args.count("source-a-logic-name")) {
        biotypes.source_a_logic_name = args["source-a-logic-name"].as<std::string>();
    }
    if (args.count("merged-gene-logic-name")) {
        biotypes.merged_gene_logic_name = args["merged-gene-logic-name"].as<std::string>();
    }
    if (args.count("merged-transcript-logic-name")) {
        biotypes.merged_transcript_logic_name = args["merged-transcript-logic-name"].as<std::string>();
    }
    return biotypes;
}

std::vector<region> merge::collect_regions(const cxxopts::ParseResult& args,
                                           const gene_source& source_a,
                                           const gene_source& source_b) {
    std::vector<region> regions;

    if (args.count("region")) {
        for (const auto& r : args["region"].as<std::vector<std::string>>()) {
            regions.push_back(region::parse(r));
        }
        return regions;
    }

    std::set<std::string> names;
    for (const auto& name : source_a.sequence_names()) names.insert(name);
    for (const auto& name : source_b.sequence_names()) names.insert(name);
    for (const auto& name : names) {
        regions.emplace_back(name);
    }
    return regions;
}

void merge::execute(const cxxopts::ParseResult& args) {
    if (args.count("biotype-template")) {
        std::string template_path = args["biotype-template"].as<std::string>();
        load_biotypes(args).write_template(template_path);
        logging::info("Wrote biotype template to: " + template_path);
        return;
    }

    biotype_config biotypes = load_biotypes(args);

    gff_gene_source source_a(args["source-a"].as<std::string>());
    gff_gene_source source_b(args["source-b"].as<std::string>());

    transcript_discarded_set discarded;
    if (args.count("discarded")) {
        discarded = gff_gene_source::load_discarded_set(args["discarded"].as<std::string>());
    }

    gene_builder::config cfg;
    cfg.combiner.absorption_threshold = args["absorption-threshold"].as<double>();
    cfg.resolver.strict_biotypes = args.count("strict-biotypes") > 0;

    gene_builder builder(source_a, source_b, discarded, biotypes, cfg);
    gff_writer writer(args["output"].as<std::string>());

    auto regions = collect_regions(args, source_a, source_b);
    logging::info("Merging " + std::to_string(regions.size()) + " region(s)");

    size_t failed = 0;
    for (const auto& r : regions) {
        try {
            for (const auto& g : builder.build_genes(r)) {
                writer.store(g);
            }
        } catch (const std::exception& e) {
            // Regions are independent, the next one still gets merged
            logging::error("Region " + r.to_string() + " failed: " + e.what());
            failed++;
        }
    }

    logging::info("Wrote " + std::to_string(writer.genes_written()) + " gene(s) with " +
                  std::to_string(writer.transcripts_written()) + " transcript(s) to " +
                  args["output"].as<std::string>());

    if (args.count("summary")) {
        builder.write_summary(args["summary"].as<std::string>());
    }

    if (failed > 0) {
        throw std::runtime_error(std::to_string(failed) + " of " + std::to_string(regions.size()) +
                                 " region(s) failed");
    }
}

} // namespace subcall
