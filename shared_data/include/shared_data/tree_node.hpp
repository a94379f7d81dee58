#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace SharedData
{
    /**
     * @brief A named node of the discovered hierarchy. Children keep the order in which the server listed them.
     */
    struct TreeNode
    {
        std::string name{};
        std::vector<TreeNode> children{};

        TreeNode& addChild(TreeNode child)
        {
            children.push_back(std::move(child));
            return children.back();
        }

        bool isLeaf() const
        {
            return children.empty();
        }

        /**
         * @brief Number of nodes in this subtree, including this node.
         */
        std::size_t size() const;
    };

    void to_json(nlohmann::json& j, TreeNode const& node);
    // Keeps "name" in front of "children", as the export writes it.
    void to_json(nlohmann::ordered_json& j, TreeNode const& node);
    void from_json(nlohmann::json const& j, TreeNode& node);
}
