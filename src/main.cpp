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
#include <iostream>
#include <memory>
#include <string>

// cxxopts
#include <cxxopts.hpp>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/merge.hpp"

void showVersion(std::ostream& _str) {
    _str << "locusmerge v" << locusmerge_VERSION_MAJOR;
    _str << "." << locusmerge_VERSION_MINOR << ".";
    _str << locusmerge_VERSION_PATCH << " - ";
    _str << "Merge and deduplicate gene annotations ";
    _str << "from two sources";
    _str << std::endl;
}

void showUsage(std::ostream& _str) {
    showVersion(_str);
    _str << "\nUsage: locusmerge <command> [options]\n\n";
    _str << "Commands:\n";
    _str << "  merge    Merge two gene annotation sets into one non-redundant set\n\n";
    _str << "Run 'locusmerge <command> --help' for the options of a command.\n";
}

std::unique_ptr<subcall::subcall> make_subcall(const std::string& name) {
    if (name == "merge") {
        return std::make_unique<subcall::merge>();
    }
    return nullptr;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        showUsage(std::cout);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        showUsage(std::cout);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        showVersion(std::cout);
        return 0;
    }

    auto sub = make_subcall(command);
    if (!sub) {
        logging::error("Unknown command: " + command);
        showUsage(std::cerr);
        return 1;
    }

    try {
        // Options of the subcommand start after its name
        cxxopts::Options options = sub->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        sub->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch(const std::exception& e) {
        logging::error(e.what());
        return 1;
    }

    return 0;
}
