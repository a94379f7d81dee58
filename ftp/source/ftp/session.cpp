#include <ftp/session.hpp>
#include <ftp/response_code.hpp>
#include <ftp/tcp_transport.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <thread>

namespace Ftp
{
    namespace
    {
        std::string maskSecrets(std::string_view command)
        {
            if (command.starts_with("PASS "))
                return "PASS ****";
            return std::string{command};
        }
    }

    Session::Session(SessionOptions options, TransportFactory transportFactory)
        : Session{std::move(options), std::move(transportFactory), nullptr}
    {}

    Session::Session(SessionOptions options, TransportFactory transportFactory, std::unique_ptr<ITransport> transport)
        : options_{std::move(options)}
        , transportFactory_{std::move(transportFactory)}
        , negotiator_{transportFactory_}
        , transport_{std::move(transport)}
        , state_{transport_ ? State::Connected : State::Disconnected}
        , retryState_{.attempts = 0, .maxAttempts = std::max(1, options_.retryPolicy.maxAttempts)}
    {}

    Session::~Session()
    {
        disconnect();
    }

    Session::State Session::state() const
    {
        return state_;
    }

    int Session::lastReadAttempts() const
    {
        return retryState_.attempts;
    }

    SessionOptions const& Session::options() const
    {
        return options_;
    }

    void Session::closeTransport()
    {
        if (transport_)
        {
            transport_->close();
            transport_.reset();
        }
        state_ = State::Disconnected;
    }

    std::expected<void, Error> Session::connect()
    {
        closeTransport();

        auto transport = transportFactory_(options_.host, options_.port);
        if (!transport)
        {
            return std::unexpected(Error{
                .type = ErrorType::ConnectionError,
                .message = fmt::format(
                    "Cannot connect to {}:{}: {}", options_.host, options_.port, transport.error().message),
            });
        }
        transport_ = std::move(transport).value();

        const auto greeting = transport_->readLine();
        if (!greeting)
        {
            closeTransport();
            return std::unexpected(Error{
                .type = ErrorType::ConnectionError,
                .message = fmt::format(
                    "No greeting from {}:{}: {}", options_.host, options_.port, greeting.error().message),
            });
        }

        Log::info("{}", *greeting);
        state_ = State::Connected;
        return {};
    }

    std::expected<void, Error> Session::login(std::string const& user, std::string const& password)
    {
        const auto authenticationStep = [this](std::string const& command,
                                               std::string_view what) -> std::expected<void, Error> {
            if (auto sent = sendCommand(command); !sent)
                return std::unexpected(std::move(sent).error());

            auto response = readLine();
            if (!response)
                return std::unexpected(std::move(response).error());

            Log::info("{}", *response);
            if (!isPositiveLoginResponse(*response))
            {
                return std::unexpected(Error{
                    .type = ErrorType::AuthenticationError,
                    .message = fmt::format("Authentication failed: {} rejected", what),
                    .serverResponse = *response,
                });
            }
            return {};
        };

        if (auto result = authenticationStep("USER " + user, "user name"); !result)
            return result;
        if (auto result = authenticationStep("PASS " + password, "password"); !result)
            return result;

        state_ = State::Authenticated;
        Log::info("Session: Logged in as '{}'.", user);
        return {};
    }

    std::expected<void, Error> Session::sendCommand(std::string_view command)
    {
        if (!transport_)
            return std::unexpected(Error{.type = ErrorType::NotConnected, .message = "No control connection"});

        Log::trace("Session: > {}", maskSecrets(command));
        if (auto written = transport_->writeLine(command); !written)
        {
            Log::warn("Session: Sending '{}' failed: {}", maskSecrets(command), written.error().message);
            return std::unexpected(std::move(written).error());
        }
        return {};
    }

    template <typename FunctionT>
    std::expected<std::string, Error> Session::readWithRetry(FunctionT&& readOnce)
    {
        retryState_.reset();
        Error lastError{.type = ErrorType::NotConnected, .message = "No control connection"};

        while (!retryState_.exhausted())
        {
            ++retryState_.attempts;
            if (transport_)
            {
                auto result = readOnce(*transport_);
                if (result)
                    return result;
                lastError = std::move(result).error();
            }

            Log::warn(
                "Session: Reading response failed ({}), attempt {}/{}.",
                lastError.message,
                retryState_.attempts,
                retryState_.maxAttempts);

            if (retryState_.exhausted())
                break;

            Log::warn("Session: Attempting to reconnect...");
            if (auto reconnected = reconnect(); !reconnected)
            {
                return std::unexpected(Error{
                    .type = ErrorType::ProtocolIOError,
                    .message = fmt::format(
                        "Reading response failed and reconnecting did not help: {}", reconnected.error().message),
                });
            }
        }

        closeTransport();
        return std::unexpected(Error{
            .type = ErrorType::ProtocolIOError,
            .message = fmt::format(
                "Reading response from server failed after {} attempts: {}", retryState_.attempts, lastError.message),
        });
    }

    std::expected<std::string, Error> Session::readLine()
    {
        return readWithRetry([](ITransport& transport) {
            return transport.readLine();
        });
    }

    std::expected<std::string, Error> Session::readMultiline()
    {
        return readWithRetry([](ITransport& transport) -> std::expected<std::string, Error> {
            std::string response{};
            while (true)
            {
                auto line = transport.readLine();
                if (!line)
                    return std::unexpected(std::move(line).error());

                response += *line;
                response += '\n';
                if (isCompletionResponse(*line))
                    return response;
            }
        });
    }

    std::expected<void, Error> Session::reconnect()
    {
        closeTransport();

        Error lastError{};
        const auto& policy = options_.retryPolicy;
        for (int attempt = 1; attempt <= retryState_.maxAttempts; ++attempt)
        {
            auto transport = transportFactory_(options_.host, options_.port);
            if (transport)
            {
                transport_ = std::move(transport).value();
                state_ = State::Connected;
                Log::info("Session: Reconnected to {}:{} on attempt {}.", options_.host, options_.port, attempt);
                return {};
            }

            lastError = std::move(transport).error();
            Log::warn(
                "Session: Reconnect attempt {}/{} failed: {}", attempt, retryState_.maxAttempts, lastError.message);
            if (attempt < retryState_.maxAttempts && policy.backoff.count() > 0)
                std::this_thread::sleep_for(policy.backoff);
        }

        Log::error("Session: Reconnection to {}:{} failed, giving up.", options_.host, options_.port);
        return std::unexpected(Error{
            .type = ErrorType::ConnectionError,
            .message = fmt::format(
                "Reconnecting to {}:{} failed after {} attempts: {}",
                options_.host,
                options_.port,
                retryState_.maxAttempts,
                lastError.message),
        });
    }

    void Session::disconnect()
    {
        if (transport_)
        {
            closeTransport();
            Log::info("Session: Disconnected from {}.", options_.host);
        }
        state_ = State::Disconnected;
    }

    std::expected<std::string, Error> Session::listDirectory(std::string const& path)
    {
        auto channel = negotiator_.open(*this);
        if (!channel)
        {
            if (channel.error().type == ErrorType::ProtocolParseError)
            {
                Log::warn("Session: No data connection for '{}': {}", path, channel.error().toString());
                return std::string{};
            }
            return std::unexpected(std::move(channel).error());
        }

        auto dataTransport = std::move(channel).value();
        if (!dataTransport)
            return std::string{};

        if (auto sent = sendCommand("LIST " + path); !sent)
            return std::unexpected(std::move(sent).error());

        auto listing = dataTransport->readToEnd();
        dataTransport->close();
        if (!listing)
            return std::unexpected(std::move(listing).error());

        const auto completion = readMultiline();
        if (!completion)
            return std::unexpected(completion.error());

        Log::debug("Session: Listed '{}', {} bytes.", path, listing->size());
        return std::move(listing).value();
    }

    std::expected<std::unique_ptr<Session>, Error> makeSession(SessionOptions options)
    {
        auto session = std::make_unique<Session>(std::move(options), makeTcpTransportFactory());
        if (auto connected = session->connect(); !connected)
            return std::unexpected(std::move(connected).error());
        return session;
    }
}
