#include <tree_ftp/export_tree.hpp>
#include <log/log.hpp>
#include <persistence/tree_export.hpp>

namespace TreeFtp
{
    std::expected<void, Ftp::Error> exportTree(Traversal::TraversalEngine& engine, std::string const& exportPath)
    {
        auto tree = engine.buildTree("/");
        if (!tree)
        {
            Log::error("Export: Building the tree failed: {}", tree.error().toString());
            return std::unexpected(std::move(tree).error());
        }
        if (!*tree)
        {
            Log::warn("Export: Nothing to export.");
            return {};
        }

        Log::info("Export: Writing the tree to {}.", exportPath);
        if (const auto written = Persistence::writeTreeToJson(**tree, exportPath); !written)
            Log::error("Export: {}", written.error().toString());
        return {};
    }
}
