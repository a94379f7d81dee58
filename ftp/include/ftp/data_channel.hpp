#pragma once

#include <ftp/client.hpp>
#include <ftp/ftp_error.hpp>
#include <ftp/transport.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace Ftp
{
    struct PassiveEndpoint
    {
        std::string address{};
        unsigned short port{0};
    };

    /**
     * @brief Parses the "(h1,h2,h3,h4,p1,p2)" payload of a 227 reply.
     *
     * @param response The full reply line.
     * @return std::expected<PassiveEndpoint, Error> Address h1.h2.h3.h4 and port p1*256+p2, or ProtocolParseError.
     */
    std::expected<PassiveEndpoint, Error> parsePassiveResponse(std::string_view response);

    /**
     * @brief Negotiates the passive data connection for one transfer.
     */
    class DataChannelNegotiator
    {
      public:
        explicit DataChannelNegotiator(TransportFactory transportFactory);

        /**
         * @brief Sends PASV over the control connection and connects to the advertised endpoint.
         *
         * @param control The control connection.
         * @return std::expected<std::unique_ptr<ITransport>, Error> The open data transport, or nullptr if the server
         * did not accept passive mode. ProtocolParseError on a malformed 227 reply, ConnectionError if the data
         * connection cannot be opened.
         */
        std::expected<std::unique_ptr<ITransport>, Error> open(IClient& control);

      private:
        TransportFactory transportFactory_;
    };
}
