#pragma once

#include <persistence/client_options.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TreeFtp
{
    struct CommandLine
    {
        bool showHelp{false};
        std::optional<std::string> configFile{std::nullopt};
        // Only what was given on the command line is set.
        Persistence::ClientOptions options{};
    };

    /**
     * @brief Parses "<server> [username] [password] [max-depth] [dfs|bfs] [--json] [--config=<file>]
     * [--log-level=<level>]". Positional arguments are the non-flag arguments in order.
     *
     * @param arguments The arguments without the program name.
     * @return std::expected<CommandLine, std::string> An error message for an invalid max depth, an unknown flag or
     * too many positional arguments.
     */
    std::expected<CommandLine, std::string> parseCommandLine(std::vector<std::string_view> const& arguments);

    std::string usage(std::string_view programName);
}
