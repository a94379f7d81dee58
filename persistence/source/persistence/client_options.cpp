#include <persistence/client_options.hpp>
#include <persistence/tree_export.hpp>
#include <log/log.hpp>
#include <utility/json.hpp>

#include <fmt/format.h>

#include <fstream>

namespace Persistence
{
    void RetryOptions::useDefaultsFrom(RetryOptions const& other)
    {
        if (!maxAttempts)
            maxAttempts = other.maxAttempts;
        if (!backoffMilliseconds)
            backoffMilliseconds = other.backoffMilliseconds;
    }
    void to_json(nlohmann::json& j, RetryOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, maxAttempts);
        TO_JSON_OPTIONAL(j, options, backoffMilliseconds);
    }
    void from_json(nlohmann::json const& j, RetryOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, maxAttempts);
        FROM_JSON_OPTIONAL(j, options, backoffMilliseconds);
    }

    void ClientOptions::useDefaultsFrom(ClientOptions const& other)
    {
        if (!host)
            host = other.host;
        if (!port)
            port = other.port;
        if (!user)
            user = other.user;
        if (!password)
            password = other.password;
        if (!maxDepth)
            maxDepth = other.maxDepth;
        if (!traversal)
            traversal = other.traversal;
        if (!exportJson)
            exportJson = other.exportJson;
        if (!exportPath)
            exportPath = other.exportPath;
        if (!depthCeiling)
            depthCeiling = other.depthCeiling;
        if (!logLevel)
            logLevel = other.logLevel;
        if (!logFile)
            logFile = other.logFile;

        if (!retry)
            retry = other.retry;
        else if (other.retry)
            retry->useDefaultsFrom(*other.retry);
    }
    void to_json(nlohmann::json& j, ClientOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, host);
        TO_JSON_OPTIONAL(j, options, port);
        TO_JSON_OPTIONAL(j, options, user);
        TO_JSON_OPTIONAL(j, options, password);
        TO_JSON_OPTIONAL(j, options, maxDepth);
        TO_JSON_OPTIONAL(j, options, traversal);
        TO_JSON_OPTIONAL(j, options, exportJson);
        TO_JSON_OPTIONAL(j, options, exportPath);
        TO_JSON_OPTIONAL(j, options, depthCeiling);
        TO_JSON_OPTIONAL(j, options, logLevel);
        TO_JSON_OPTIONAL(j, options, logFile);
        TO_JSON_OPTIONAL(j, options, retry);
    }
    void from_json(nlohmann::json const& j, ClientOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, host);
        FROM_JSON_OPTIONAL(j, options, port);
        FROM_JSON_OPTIONAL(j, options, user);
        FROM_JSON_OPTIONAL(j, options, password);
        FROM_JSON_OPTIONAL(j, options, maxDepth);
        FROM_JSON_OPTIONAL(j, options, traversal);
        FROM_JSON_OPTIONAL(j, options, exportJson);
        FROM_JSON_OPTIONAL(j, options, exportPath);
        FROM_JSON_OPTIONAL(j, options, depthCeiling);
        FROM_JSON_OPTIONAL(j, options, logLevel);
        FROM_JSON_OPTIONAL(j, options, logFile);
        FROM_JSON_OPTIONAL(j, options, retry);
    }

    ClientOptions defaultClientOptions()
    {
        return ClientOptions{
            .host = std::nullopt,
            .port = 21,
            .user = "anonymous",
            .password = "anonymous@example.com",
            .maxDepth = std::nullopt,
            .traversal = "dfs",
            .exportJson = false,
            .exportPath = std::string{defaultExportPath},
            .depthCeiling = 512,
            .logLevel = "info",
            .logFile = std::nullopt,
            .retry =
                RetryOptions{
                    .maxAttempts = 3,
                    .backoffMilliseconds = 5000,
                },
        };
    }

    namespace
    {
        std::optional<std::string> validate(ClientOptions const& options)
        {
            if (options.port && (*options.port < 1 || *options.port > 65535))
                return fmt::format("port must be in 1..65535, is {}", *options.port);
            if (options.maxDepth && *options.maxDepth < 0)
                return fmt::format("maxDepth must not be negative, is {}", *options.maxDepth);
            if (options.depthCeiling && *options.depthCeiling < 0)
                return fmt::format("depthCeiling must not be negative, is {}", *options.depthCeiling);
            if (options.retry)
            {
                if (options.retry->maxAttempts && *options.retry->maxAttempts < 1)
                    return fmt::format("retry.maxAttempts must be at least 1, is {}", *options.retry->maxAttempts);
                if (options.retry->backoffMilliseconds && *options.retry->backoffMilliseconds < 0)
                {
                    return fmt::format(
                        "retry.backoffMilliseconds must not be negative, is {}", *options.retry->backoffMilliseconds);
                }
            }
            return std::nullopt;
        }
    }

    std::expected<ClientOptions, std::string> loadClientOptions(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected(fmt::format("Cannot open config file '{}'", path.string()));

        ClientOptions options{};
        try
        {
            nlohmann::json::parse(reader, nullptr, true, true).get_to(options);
        }
        catch (std::exception const& e)
        {
            return std::unexpected(fmt::format("Failed to parse config file '{}': {}", path.string(), e.what()));
        }

        if (const auto problem = validate(options); problem)
            return std::unexpected(fmt::format("Invalid config file '{}': {}", path.string(), *problem));

        Log::debug("Loaded config file: {}", path.string());
        return options;
    }
}
