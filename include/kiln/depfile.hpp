#pragma once

#include "kiln/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

struct Depfile {
    std::string target;
    std::vector<std::string> dependencies;
};

/**
 * @brief Parses Makefile-style `target: dep dep \` rules.
 *
 * Backslash escapes the next character and joins continued lines. Only the
 * first ':' of a rule separates the target; later ones are literal, so a
 * dependency may be written as `output:<id>`. Dependencies of later rules are
 * appended; their targets (phony `-MP` style rules) are dropped.
 */
Depfile parse_depfile_content(std::string_view content);

Result<Depfile> parse_depfile(const std::filesystem::path &path);

} // namespace kiln
