/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of locusmerge and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef LOCUSMERGE_UTILITY_HPP
#define LOCUSMERGE_UTILITY_HPP

// standard
#include <chrono>
#include <string>
#include <vector>

namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Only printed when verbose output is enabled (--verbose)
    void debug(const std::string& message);

    void set_verbose(bool enabled);
    bool is_verbose();
}

/**
 * Split a string on a single-character delimiter (empty fields are kept)
 */
std::vector<std::string> split(const std::string& str, char delim);

/**
 * Trim leading and trailing whitespace
 */
std::string trim(const std::string& str);

std::string to_lower(const std::string& str);

#endif //LOCUSMERGE_UTILITY_HPP
