/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_SUBCALL_MERGE_HPP
#define LOCUSMERGE_SUBCALL_MERGE_HPP

#include <string>
#include <vector>

#include "subcall/subcall.hpp"
#include "biotype_config.hpp"
#include "gene_source.hpp"

namespace subcall {

/**
 * Merge subcommand: merge two annotation sets region by region.
 *
 * Source A transcripts (curated set) are clustered together with source B
 * transcripts, redundant pairs are resolved and the merged genes are
 * written as GFF3. A failing region is reported and skipped; the command
 * fails at the end if any region failed.
 */
class merge : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "merge"; }
    std::string description() const override {
        return "Merge two gene annotation sets into one non-redundant set";
    }

private:
    /**
     * Built-in or file biotype sets with command line overrides applied
     */
    static biotype_config load_biotypes(const cxxopts::ParseResult& args);

    /**
     * Regions given with -r, or every sequence of both sources
     */
    static std::vector<region> collect_regions(const cxxopts::ParseResult& args,
                                               const gene_source& source_a,
                                               const gene_source& source_b);
};

} // namespace subcall

#endif // LOCUSMERGE_SUBCALL_MERGE_HPP
