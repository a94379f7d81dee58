#pragma once

#include <ftp/client.hpp>
#include <ftp/ftp_error.hpp>
#include <shared_data/tree_node.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Traversal
{
    enum class Mode
    {
        DepthFirst,
        BreadthFirst
    };

    /**
     * @brief "bfs" in any letter case selects breadth first, everything else depth first.
     */
    Mode modeFromString(std::string_view mode);
    std::string_view modeToString(Mode mode);

    struct TraversalOptions
    {
        static constexpr std::size_t defaultDepthCeiling = 512;

        // Deepest level whose listing is fetched, the root is level 0. Unset means unbounded.
        std::optional<std::size_t> maxDepth{std::nullopt};
        // Hard limit that also applies when maxDepth is unset, directory cycles end here.
        std::size_t depthCeiling{defaultDepthCeiling};
    };

    /**
     * @brief parent + "/" + name. Only the root "/" gets no extra separator.
     */
    std::string childPath(std::string_view parent, std::string_view name);

    /**
     * @brief Walks a remote hierarchy through an IClient, one listing fetch per directory. Either prints the
     * hierarchy or builds it as a tree.
     *
     * Any failed listing fetch aborts the traversal. Lines printed so far stay printed.
     */
    class TraversalEngine
    {
      public:
        TraversalEngine(Ftp::IClient& client, std::ostream& output, TraversalOptions options = {});

        /**
         * @brief Prints the hierarchy in pre-order with "|-- " and "`-- " branch glyphs.
         *
         * @param root Remote path to start at.
         */
        std::expected<void, Ftp::Error> showTreeDepthFirst(std::string const& root);

        /**
         * @brief Prints the hierarchy level by level, each line indented by its depth.
         *
         * @param root Remote path to start at.
         */
        std::expected<void, Ftp::Error> showTreeBreadthFirst(std::string const& root);

        std::expected<void, Ftp::Error> show(Mode mode, std::string const& root);

        /**
         * @brief Builds the hierarchy below root. The root node is named after the last path segment, directories
         * beyond maxDepth are left out.
         *
         * @return std::optional<SharedData::TreeNode> nullopt only if the root itself is out of bounds.
         */
        std::expected<std::optional<SharedData::TreeNode>, Ftp::Error> buildTree(std::string const& root);

        TraversalOptions const& options() const;

      private:
        bool withinMaxDepth(std::size_t depth) const;
        bool belowCeiling(std::string const& path, std::size_t depth) const;
        std::expected<std::vector<std::string>, Ftp::Error> fetchLines(std::string const& path);

        std::expected<void, Ftp::Error>
        showDepthFirst(std::string const& path, std::string const& prefix, std::size_t depth);
        std::expected<std::optional<SharedData::TreeNode>, Ftp::Error>
        build(std::string const& path, std::size_t depth);

      private:
        Ftp::IClient& client_;
        std::ostream& output_;
        TraversalOptions options_;
    };
}
