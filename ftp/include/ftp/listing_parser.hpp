#pragma once

#include <shared_data/directory_entry.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace Ftp
{
    /**
     * @brief True iff the listing line starts with 'd'. Assumes the unix "ls -l" permission column; lines in other
     * formats are classified as files.
     */
    bool isDirectory(std::string_view line);

    /**
     * @brief Returns the token after the last whitespace run. A line without whitespace is returned as is, a blank
     * line yields an empty name.
     */
    std::string extractName(std::string_view line);

    /**
     * @brief Name and type of one listing line. The name may be empty, callers skip those.
     */
    SharedData::DirectoryEntry parseListingLine(std::string_view line);

    /**
     * @brief Splits a raw listing into lines. A trailing '\r' is stripped from each line and trailing empty lines
     * are dropped.
     */
    std::vector<std::string> splitLines(std::string_view listing);
}
