#include <tree_ftp/main.hpp>
#include <tree_ftp/command_line.hpp>
#include <tree_ftp/export_tree.hpp>
#include <ftp/session.hpp>
#include <log/log.hpp>
#include <persistence/tree_export.hpp>
#include <traversal/traversal_engine.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>

Main::Main(int const argc, char const* const* argv)
    : programName_{argc > 0 ? std::filesystem::path{argv[0]}.filename().string() : std::string{"tree-ftp"}}
    , arguments_{}
{
    for (int i = 1; i < argc; ++i)
        arguments_.emplace_back(argv[i]);
}

int Main::run()
{
    const auto commandLine = TreeFtp::parseCommandLine(arguments_);
    if (!commandLine)
    {
        std::cerr << "Error: " << commandLine.error() << "\n\n" << TreeFtp::usage(programName_);
        return 1;
    }
    if (commandLine->showHelp)
    {
        std::cout << TreeFtp::usage(programName_);
        return 0;
    }

    auto options = commandLine->options;
    if (commandLine->configFile)
    {
        const auto config = Persistence::loadClientOptions(*commandLine->configFile);
        if (!config)
        {
            std::cerr << "Error: " << config.error() << "\n";
            return 1;
        }
        options.useDefaultsFrom(*config);
    }
    options.useDefaultsFrom(Persistence::defaultClientOptions());

    if (!options.host)
    {
        std::cout << TreeFtp::usage(programName_);
        return 0;
    }

    setupLogging(options);

    if (const auto result = scan(options); !result)
    {
        Log::error("Main: {}", result.error().toString());
        std::cerr << "Error: " << result.error().toString() << "\n";
        return 1;
    }
    return 0;
}

void Main::setupLogging(Persistence::ClientOptions const& options) const
{
    Log::LoggerOptions loggerOptions{.level = Log::levelFromString(options.logLevel.value_or("info"))};
    if (options.logFile)
        loggerOptions.logFile = std::filesystem::path{*options.logFile};
    Log::setup(loggerOptions);
}

std::expected<void, Ftp::Error> Main::scan(Persistence::ClientOptions const& options)
{
    const auto retry = options.retry.value_or(Persistence::RetryOptions{});
    auto session = Ftp::makeSession(Ftp::SessionOptions{
        .host = *options.host,
        .port = static_cast<unsigned short>(options.port.value_or(21)),
        .retryPolicy =
            Ftp::RetryPolicy{
                .maxAttempts = retry.maxAttempts.value_or(Ftp::RetryPolicy::defaultMaxAttempts),
                .backoff = retry.backoffMilliseconds ? std::chrono::milliseconds{*retry.backoffMilliseconds}
                                                     : Ftp::RetryPolicy::defaultBackoff,
            },
    });
    if (!session)
        return std::unexpected(std::move(session).error());

    auto& client = **session;
    if (auto loggedIn = client.login(options.user.value_or(""), options.password.value_or("")); !loggedIn)
    {
        client.disconnect();
        return loggedIn;
    }

    Traversal::TraversalEngine engine{
        client,
        std::cout,
        Traversal::TraversalOptions{
            .maxDepth = options.maxDepth ? std::optional<std::size_t>{static_cast<std::size_t>(*options.maxDepth)}
                                         : std::nullopt,
            .depthCeiling = static_cast<std::size_t>(
                options.depthCeiling.value_or(static_cast<int>(Traversal::TraversalOptions::defaultDepthCeiling))),
        },
    };

    if (options.exportJson.value_or(false))
    {
        const auto exported =
            TreeFtp::exportTree(engine, options.exportPath.value_or(std::string{Persistence::defaultExportPath}));
        if (!exported)
        {
            client.disconnect();
            return exported;
        }
    }

    auto shown = engine.show(Traversal::modeFromString(options.traversal.value_or("dfs")), "/");
    client.disconnect();
    return shown;
}

int main(int argc, char** argv)
{
    try
    {
        Main program{argc, argv};
        return program.run();
    }
    catch (std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
