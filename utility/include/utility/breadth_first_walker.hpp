#pragma once

#include <cstddef>
#include <deque>
#include <expected>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace Utility
{
    struct PendingDirectory
    {
        std::string path{};
        std::size_t depth{0};
    };

    /**
     * @brief Visits directories in FIFO order, starting with the root at depth 0.
     * The scanner is called once per visited directory and returns the paths of the child directories to visit
     * next, which are queued at depth + 1. Directories deeper than maxDepth are dequeued but not scanned.
     */
    template <typename WalkErrorType, typename ScannerT>
    requires std::is_invocable_r_v<
        std::expected<std::vector<std::string>, WalkErrorType>,
        ScannerT,
        PendingDirectory const&>
    class BreadthFirstWalker
    {
      public:
        template <typename ForwardingScannerT = ScannerT>
        requires std::is_same_v<std::decay_t<ForwardingScannerT>, ScannerT>
        BreadthFirstWalker(std::string rootPath, std::optional<std::size_t> maxDepth, ForwardingScannerT&& scanner)
            : rootPath_{std::move(rootPath)}
            , maxDepth_{maxDepth}
            , scanner_{std::forward<ForwardingScannerT>(scanner)}
            , pending_{PendingDirectory{.path = rootPath_, .depth = 0}}
        {}

        void reset()
        {
            pending_ = {PendingDirectory{.path = rootPath_, .depth = 0}};
            visited_ = 0;
            skipped_ = 0;
        }

        /**
         * @brief Walk a single iteration.
         *
         * @return std::expected<bool, WalkErrorType> Returns false if there are more directories to process, true if
         * done. On error returns unexpected with the error, the failed directory is not requeued.
         */
        std::expected<bool, WalkErrorType> walk()
        {
            if (completed())
                return true;

            auto current = std::move(pending_.front());
            pending_.pop_front();

            if (maxDepth_ && current.depth > *maxDepth_)
            {
                ++skipped_;
                return completed();
            }

            auto result = scanner_(std::as_const(current));
            if (!result)
                return std::unexpected(std::move(result).error());

            ++visited_;
            for (auto& child : result.value())
                pending_.push_back(PendingDirectory{.path = std::move(child), .depth = current.depth + 1});

            return completed();
        }

        std::expected<void, WalkErrorType> walkAll()
        {
            decltype(walk()) res;
            do
            {
                res = walk();
                if (!res)
                    return std::unexpected(std::move(res).error());
            } while (!res.value());
            return {};
        }

        bool completed() const
        {
            return pending_.empty();
        }

        std::size_t visitedCount() const
        {
            return visited_;
        }

        std::size_t skippedCount() const
        {
            return skipped_;
        }

        std::size_t pendingCount() const
        {
            return pending_.size();
        }

      private:
        std::string rootPath_;
        std::optional<std::size_t> maxDepth_;
        ScannerT scanner_;
        std::deque<PendingDirectory> pending_;
        std::size_t visited_{0};
        std::size_t skipped_{0};
    };
}
