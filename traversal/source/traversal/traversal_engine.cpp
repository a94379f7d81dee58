#include <traversal/traversal_engine.hpp>
#include <ftp/listing_parser.hpp>
#include <log/log.hpp>
#include <utility/algorithm/case_convert.hpp>
#include <utility/breadth_first_walker.hpp>

#include <utility>

namespace Traversal
{
    namespace
    {
        constexpr std::string_view middleBranch = "|-- ";
        constexpr std::string_view lastBranch = "`-- ";
        constexpr std::string_view middleIndent = "|   ";
        constexpr std::string_view lastIndent = "    ";
        constexpr std::string_view levelIndent = "   ";
        constexpr std::string_view levelBranch = "|__ ";
    }

    Mode modeFromString(std::string_view mode)
    {
        if (Utility::Algorithm::toLowerCase(std::string{mode}) == "bfs")
            return Mode::BreadthFirst;
        return Mode::DepthFirst;
    }

    std::string_view modeToString(Mode mode)
    {
        switch (mode)
        {
            case Mode::DepthFirst:
                return "dfs";
            case Mode::BreadthFirst:
                return "bfs";
        }
        return "dfs";
    }

    std::string childPath(std::string_view parent, std::string_view name)
    {
        std::string path{parent};
        if (parent != "/")
            path.push_back('/');
        path.append(name);
        return path;
    }

    TraversalEngine::TraversalEngine(Ftp::IClient& client, std::ostream& output, TraversalOptions options)
        : client_{client}
        , output_{output}
        , options_{std::move(options)}
    {}

    TraversalOptions const& TraversalEngine::options() const
    {
        return options_;
    }

    bool TraversalEngine::withinMaxDepth(std::size_t depth) const
    {
        return !options_.maxDepth || depth <= *options_.maxDepth;
    }

    bool TraversalEngine::belowCeiling(std::string const& path, std::size_t depth) const
    {
        if (depth <= options_.depthCeiling)
            return true;
        Log::warn(
            "TraversalEngine: Not descending into '{}', depth {} exceeds the ceiling of {}.",
            path,
            depth,
            options_.depthCeiling);
        return false;
    }

    std::expected<std::vector<std::string>, Ftp::Error> TraversalEngine::fetchLines(std::string const& path)
    {
        Log::debug("TraversalEngine: Listing '{}'.", path);
        auto listing = client_.listDirectory(path);
        if (!listing)
        {
            Log::error("TraversalEngine: Listing '{}' failed: {}", path, listing.error().toString());
            return std::unexpected(std::move(listing).error());
        }
        return Ftp::splitLines(*listing);
    }

    std::expected<void, Ftp::Error> TraversalEngine::showTreeDepthFirst(std::string const& root)
    {
        return showDepthFirst(root, "", 0);
    }

    std::expected<void, Ftp::Error>
    TraversalEngine::showDepthFirst(std::string const& path, std::string const& prefix, std::size_t depth)
    {
        if (!withinMaxDepth(depth) || !belowCeiling(path, depth))
            return {};

        const auto lines = fetchLines(path);
        if (!lines)
            return std::unexpected(lines.error());

        for (std::size_t i = 0; i != lines->size(); ++i)
        {
            const auto& line = (*lines)[i];
            const auto entry = Ftp::parseListingLine(line);
            if (!entry.hasName())
                continue;

            // The last raw line decides the glyph, even if it was blank and skipped.
            const bool isLast = i + 1 == lines->size();
            output_ << prefix << (isLast ? lastBranch : middleBranch) << entry.name << '\n';

            if (entry.isDirectory())
            {
                auto result = showDepthFirst(
                    childPath(path, entry.name), prefix + std::string{isLast ? lastIndent : middleIndent}, depth + 1);
                if (!result)
                    return result;
            }
        }
        return {};
    }

    std::expected<void, Ftp::Error> TraversalEngine::showTreeBreadthFirst(std::string const& root)
    {
        auto scanner = [this](Utility::PendingDirectory const& directory)
            -> std::expected<std::vector<std::string>, Ftp::Error> {
            if (!belowCeiling(directory.path, directory.depth))
                return std::vector<std::string>{};

            const auto lines = fetchLines(directory.path);
            if (!lines)
                return std::unexpected(lines.error());

            std::string indent{};
            for (std::size_t i = 0; i != directory.depth; ++i)
                indent += levelIndent;

            std::vector<std::string> subdirectories{};
            for (auto const& line : *lines)
            {
                const auto entry = Ftp::parseListingLine(line);
                if (!entry.hasName())
                    continue;

                output_ << indent << levelBranch << entry.name << '\n';
                if (entry.isDirectory())
                    subdirectories.push_back(childPath(directory.path, entry.name));
            }
            return subdirectories;
        };

        Utility::BreadthFirstWalker<Ftp::Error, decltype(scanner)> walker{root, options_.maxDepth, std::move(scanner)};
        auto result = walker.walkAll();
        Log::debug(
            "TraversalEngine: Breadth first walk listed {} directories, skipped {}.",
            walker.visitedCount(),
            walker.skippedCount());
        return result;
    }

    std::expected<void, Ftp::Error> TraversalEngine::show(Mode mode, std::string const& root)
    {
        switch (mode)
        {
            case Mode::BreadthFirst:
                return showTreeBreadthFirst(root);
            case Mode::DepthFirst:
                break;
        }
        return showTreeDepthFirst(root);
    }

    std::expected<std::optional<SharedData::TreeNode>, Ftp::Error> TraversalEngine::buildTree(std::string const& root)
    {
        return build(root, 0);
    }

    std::expected<std::optional<SharedData::TreeNode>, Ftp::Error>
    TraversalEngine::build(std::string const& path, std::size_t depth)
    {
        if (!withinMaxDepth(depth) || !belowCeiling(path, depth))
            return std::optional<SharedData::TreeNode>{};

        SharedData::TreeNode node{.name = Ftp::extractName(path)};

        const auto lines = fetchLines(path);
        if (!lines)
            return std::unexpected(lines.error());

        for (auto const& line : *lines)
        {
            auto entry = Ftp::parseListingLine(line);
            if (!entry.hasName())
                continue;

            if (!entry.isDirectory())
            {
                node.addChild(SharedData::TreeNode{.name = std::move(entry.name)});
                continue;
            }

            auto child = build(childPath(path, entry.name), depth + 1);
            if (!child)
                return std::unexpected(std::move(child).error());
            if (*child)
                node.addChild(std::move(**child));
        }
        return node;
    }
}
