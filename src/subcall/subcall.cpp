/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <stdexcept>

#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Common")
        ("verbose", "Print debug output")
        ("h,help", "Show help message")
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("verbose")) {
        logging::set_verbose(true);
    }
}

void subcall::require_file(const cxxopts::ParseResult& args, const std::string& option) {
    if (!args.count(option)) {
        throw std::runtime_error("Missing required option --" + option);
    }
    std::string path = args[option].as<std::string>();
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Input file not found: " + path);
    }
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    execute(args);
}

} // namespace subcall
