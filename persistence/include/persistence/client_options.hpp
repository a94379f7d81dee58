#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    struct RetryOptions
    {
        std::optional<int> maxAttempts{std::nullopt};
        std::optional<int> backoffMilliseconds{std::nullopt};

        void useDefaultsFrom(RetryOptions const& other);
    };
    void to_json(nlohmann::json& j, RetryOptions const& options);
    void from_json(nlohmann::json const& j, RetryOptions& options);

    /**
     * @brief Everything the client can be configured with. Unset members are filled from a lower precedence source
     * with useDefaultsFrom.
     */
    struct ClientOptions
    {
        std::optional<std::string> host{std::nullopt};
        // 1..65535.
        std::optional<int> port{std::nullopt};
        std::optional<std::string> user{std::nullopt};
        std::optional<std::string> password{std::nullopt};
        // Unset means unbounded.
        std::optional<int> maxDepth{std::nullopt};
        // "dfs" or "bfs".
        std::optional<std::string> traversal{std::nullopt};
        std::optional<bool> exportJson{std::nullopt};
        std::optional<std::string> exportPath{std::nullopt};
        std::optional<int> depthCeiling{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<std::string> logFile{std::nullopt};
        std::optional<RetryOptions> retry{std::nullopt};

        void useDefaultsFrom(ClientOptions const& other);
    };
    void to_json(nlohmann::json& j, ClientOptions const& options);
    void from_json(nlohmann::json const& j, ClientOptions& options);

    /**
     * @brief The built-in defaults, lowest precedence.
     */
    ClientOptions defaultClientOptions();

    /**
     * @brief Reads a JSON config file. Comments are allowed.
     *
     * @param path
     * @return std::expected<ClientOptions, std::string> The options or a description of what is wrong with the file.
     */
    std::expected<ClientOptions, std::string> loadClientOptions(std::filesystem::path const& path);
}
