#pragma once

#include <shared_data/tree_node.hpp>

#include <fmt/format.h>

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace Persistence
{
    constexpr std::string_view defaultExportPath = "directory_structure.json";

    struct ExportWriteError
    {
        std::string path{};
        std::string message{};

        inline std::string toString() const
        {
            return fmt::format("Cannot write '{}': {}", path, message);
        }
    };

    /**
     * @brief Writes the tree as indented JSON, replacing the file if it exists.
     *
     * @param tree
     * @param path Destination file, its directory must exist.
     * @return std::expected<void, ExportWriteError>
     */
    std::expected<void, ExportWriteError>
    writeTreeToJson(SharedData::TreeNode const& tree, std::filesystem::path const& path);
}
