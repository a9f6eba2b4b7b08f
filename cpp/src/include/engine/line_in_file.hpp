#pragma once

#include <optional>
#include <source_location>
#include <string>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

namespace treespec::engine
{

/**
 * @brief Source position of a registration call (test, branch, info, markup).
 *
 * Captured from `std::source_location` at the DSL call site and carried on
 * tree nodes, events and registration errors.
 */
struct LineInFile
{
    std::string file_name;
    unsigned line_number{0};
    std::optional<std::string> file_path_name;

    static LineInFile from(const std::source_location &loc)
    {
        return LineInFile{std::string(format_tools::filename_only(loc.file_name())), loc.line(),
                          std::string(loc.file_name())};
    }

    std::string to_string() const { return fmt::format("{}:{}", file_name, line_number); }

    bool operator==(const LineInFile &) const = default;
};

} // namespace treespec::engine
