#include <shared_data/tree_node.hpp>

#include <numeric>

namespace SharedData
{
    std::size_t TreeNode::size() const
    {
        return std::accumulate(
            children.begin(), children.end(), std::size_t{1}, [](std::size_t sum, TreeNode const& child) {
                return sum + child.size();
            });
    }

    void to_json(nlohmann::json& j, TreeNode const& node)
    {
        auto children = nlohmann::json::array();
        for (auto const& child : node.children)
            children.push_back(nlohmann::json(child));

        j = nlohmann::json{
            {"name", node.name},
            {"children", std::move(children)},
        };
    }
    void to_json(nlohmann::ordered_json& j, TreeNode const& node)
    {
        auto children = nlohmann::ordered_json::array();
        for (auto const& child : node.children)
            children.push_back(nlohmann::ordered_json(child));

        j = nlohmann::ordered_json::object();
        j["name"] = node.name;
        j["children"] = std::move(children);
    }
    void from_json(nlohmann::json const& j, TreeNode& node)
    {
        j.at("name").get_to(node.name);
        node.children.clear();
        if (auto it = j.find("children"); it != j.end())
        {
            for (auto const& child : *it)
                node.children.push_back(child.get<TreeNode>());
        }
    }
}
