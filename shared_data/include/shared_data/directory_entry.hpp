#pragma once

#include <cstdint>
#include <string>

namespace SharedData
{
    enum class FileType : std::uint8_t
    {
        Regular = 1,
        Directory = 2,
    };

    /**
     * @brief One parsed line of a directory listing.
     */
    struct DirectoryEntry
    {
        using FileType = SharedData::FileType;

        std::string name{};
        FileType type{FileType::Regular};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool hasName() const
        {
            return !name.empty();
        }
    };
}
