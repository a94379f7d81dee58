#pragma once

#include <ftp/ftp_error.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace Ftp
{
    /**
     * @brief A connected, blocking byte stream, used for both the control and the data connection.
     */
    class ITransport
    {
      public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(ITransport const&) = delete;
        ITransport& operator=(ITransport const&) = delete;
        ITransport(ITransport&&) = delete;
        ITransport& operator=(ITransport&&) = delete;

        /**
         * @brief Reads one line. The line terminator (LF or CRLF) is not part of the result.
         *
         * @return std::expected<std::string, Error> The line, or ProtocolIOError when the read failed or the peer
         * closed the connection before a full line arrived.
         */
        virtual std::expected<std::string, Error> readLine() = 0;

        /**
         * @brief Reads everything until the peer closes the connection.
         *
         * @return std::expected<std::string, Error> All received bytes.
         */
        virtual std::expected<std::string, Error> readToEnd() = 0;

        /**
         * @brief Writes the line followed by CRLF.
         *
         * @param line
         * @return std::expected<void, Error> ProtocolIOError on failure.
         */
        virtual std::expected<void, Error> writeLine(std::string_view line) = 0;

        /**
         * @brief Closes the connection. Safe to call more than once.
         */
        virtual void close() = 0;
    };

    /**
     * @brief Opens a transport to host:port. Fails with ConnectionError.
     */
    using TransportFactory =
        std::function<std::expected<std::unique_ptr<ITransport>, Error>(std::string const& host, unsigned short port)>;
}
