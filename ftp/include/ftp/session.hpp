#pragma once

#include <ftp/client.hpp>
#include <ftp/data_channel.hpp>
#include <ftp/ftp_error.hpp>
#include <ftp/retry_policy.hpp>
#include <ftp/transport.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace Ftp
{
    struct SessionOptions
    {
        std::string host{};
        unsigned short port = 21;
        RetryPolicy retryPolicy{};
    };

    /**
     * @brief The control connection to one server. Owns at most one control transport at a time, which is replaced
     * as a whole on reconnect.
     */
    class Session : public IClient
    {
      public:
        enum class State
        {
            Disconnected,
            Connected,
            Authenticated
        };

        Session(SessionOptions options, TransportFactory transportFactory);

        /**
         * @brief Adopts an already connected control transport, the greeting is expected to be consumed already.
         */
        Session(SessionOptions options, TransportFactory transportFactory, std::unique_ptr<ITransport> transport);

        ~Session() override;
        Session(Session const&) = delete;
        Session& operator=(Session const&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        /**
         * @brief Opens the control transport and reads the greeting.
         *
         * @return std::expected<void, Error> ConnectionError if the server is unreachable or sends no greeting.
         */
        std::expected<void, Error> connect();

        std::expected<void, Error> login(std::string const& user, std::string const& password) override;
        std::expected<void, Error> reconnect() override;
        std::expected<std::string, Error> readLine() override;
        std::expected<std::string, Error> readMultiline() override;
        std::expected<void, Error> sendCommand(std::string_view command) override;
        void disconnect() override;
        std::expected<std::string, Error> listDirectory(std::string const& path) override;

        State state() const;

        /**
         * @brief How many read attempts the last readLine or readMultiline used.
         */
        int lastReadAttempts() const;

        SessionOptions const& options() const;

      private:
        /**
         * @brief Runs readOnce against the current transport, reconnecting after each failure until the retry policy
         * is exhausted.
         */
        template <typename FunctionT>
        std::expected<std::string, Error> readWithRetry(FunctionT&& readOnce);

        void closeTransport();

      private:
        SessionOptions options_;
        TransportFactory transportFactory_;
        DataChannelNegotiator negotiator_;
        std::unique_ptr<ITransport> transport_;
        State state_;
        RetryState retryState_;
    };

    /**
     * @brief Creates a session using TCP transports and connects it.
     *
     * @param options
     * @return std::expected<std::unique_ptr<Session>, Error>
     */
    std::expected<std::unique_ptr<Session>, Error> makeSession(SessionOptions options);
}
