#include <tree_ftp/command_line.hpp>
#include <traversal/traversal_engine.hpp>

#include <fmt/format.h>

#include <charconv>

namespace TreeFtp
{
    namespace
    {
        constexpr std::string_view configFlag = "--config=";
        constexpr std::string_view logLevelFlag = "--log-level=";

        std::expected<int, std::string> parseMaxDepth(std::string_view argument)
        {
            int depth = 0;
            const auto [ptr, ec] = std::from_chars(argument.data(), argument.data() + argument.size(), depth);
            if (argument.empty() || ec != std::errc{} || ptr != argument.data() + argument.size())
                return std::unexpected(fmt::format("Invalid max depth '{}', expected a number", argument));
            if (depth < 0)
                return std::unexpected(fmt::format("Invalid max depth '{}', must not be negative", argument));
            return depth;
        }

        std::expected<void, std::string>
        applyPositional(Persistence::ClientOptions& options, std::size_t index, std::string_view argument)
        {
            switch (index)
            {
                case 0:
                    options.host = std::string{argument};
                    return {};
                case 1:
                    options.user = std::string{argument};
                    return {};
                case 2:
                    options.password = std::string{argument};
                    return {};
                case 3:
                {
                    auto depth = parseMaxDepth(argument);
                    if (!depth)
                        return std::unexpected(std::move(depth).error());
                    options.maxDepth = *depth;
                    return {};
                }
                case 4:
                    options.traversal =
                        std::string{Traversal::modeToString(Traversal::modeFromString(argument))};
                    return {};
                default:
                    return std::unexpected(fmt::format("Unexpected argument '{}'", argument));
            }
        }
    }

    std::expected<CommandLine, std::string> parseCommandLine(std::vector<std::string_view> const& arguments)
    {
        CommandLine commandLine{};
        std::size_t positionalIndex = 0;

        for (auto const& argument : arguments)
        {
            if (argument == "--help" || argument == "-h")
            {
                commandLine.showHelp = true;
            }
            else if (argument == "--json")
            {
                commandLine.options.exportJson = true;
            }
            else if (argument.starts_with(configFlag))
            {
                commandLine.configFile = std::string{argument.substr(configFlag.size())};
            }
            else if (argument.starts_with(logLevelFlag))
            {
                commandLine.options.logLevel = std::string{argument.substr(logLevelFlag.size())};
            }
            else if (argument.starts_with("--"))
            {
                return std::unexpected(fmt::format("Unknown option '{}'", argument));
            }
            else
            {
                if (auto applied = applyPositional(commandLine.options, positionalIndex++, argument); !applied)
                    return std::unexpected(std::move(applied).error());
            }
        }

        return commandLine;
    }

    std::string usage(std::string_view programName)
    {
        return fmt::format(
            "Usage: {} <server> [username] [password] [max-depth] [dfs|bfs] [--json] [--config=<file>] "
            "[--log-level=<level>]\n"
            "\n"
            "Prints the directory tree of an FTP server.\n"
            "\n"
            "  server             Host name or address of the server.\n"
            "  username           Login name, default: anonymous.\n"
            "  password           Password, default: anonymous@example.com.\n"
            "  max-depth          Deepest level to list, the root is level 0. Default: unbounded.\n"
            "  dfs|bfs            Depth first (default) or breadth first output.\n"
            "  --json             Also write the tree to directory_structure.json.\n"
            "  --config=<file>    Read defaults from a JSON config file.\n"
            "  --log-level=<lvl>  trace, debug, info, warning, error, critical or off.\n"
            "  --help             Show this help.\n",
            programName);
    }
}
