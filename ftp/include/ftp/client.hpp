#pragma once

#include <ftp/ftp_error.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace Ftp
{
    /**
     * @brief What the traversal and the data channel negotiation need from a control connection.
     */
    class IClient
    {
      public:
        IClient() = default;
        virtual ~IClient() = default;
        IClient(IClient const&) = delete;
        IClient& operator=(IClient const&) = delete;
        IClient(IClient&&) = delete;
        IClient& operator=(IClient&&) = delete;

        /**
         * @brief Sends USER and PASS. Both replies must be 230 or 331.
         *
         * @param user
         * @param password
         * @return std::expected<void, Error> AuthenticationError on a negative reply.
         */
        virtual std::expected<void, Error> login(std::string const& user, std::string const& password) = 0;

        /**
         * @brief Replaces the control transport with a fresh one to the same server. Does not log in again.
         */
        virtual std::expected<void, Error> reconnect() = 0;

        /**
         * @brief Reads one reply line, reconnecting on transport failure.
         */
        virtual std::expected<std::string, Error> readLine() = 0;

        /**
         * @brief Reads reply lines up to and including the first one starting with 226 or 421.
         *
         * @return std::expected<std::string, Error> All lines, each followed by '\n'.
         */
        virtual std::expected<std::string, Error> readMultiline() = 0;

        /**
         * @brief Sends one command line.
         */
        virtual std::expected<void, Error> sendCommand(std::string_view command) = 0;

        /**
         * @brief Closes the control connection. Safe to call more than once.
         */
        virtual void disconnect() = 0;

        /**
         * @brief Fetches the raw listing of a remote directory over a passive data connection.
         *
         * @param path Remote path.
         * @return std::expected<std::string, Error> The listing text, empty when no data connection was offered.
         */
        virtual std::expected<std::string, Error> listDirectory(std::string const& path) = 0;
    };
}
