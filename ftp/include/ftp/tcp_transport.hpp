#pragma once

#include <ftp/transport.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace Ftp
{
    class TcpTransport : public ITransport
    {
      public:
        TcpTransport();
        ~TcpTransport() override;
        TcpTransport(TcpTransport const&) = delete;
        TcpTransport& operator=(TcpTransport const&) = delete;
        TcpTransport(TcpTransport&&) = delete;
        TcpTransport& operator=(TcpTransport&&) = delete;

        /**
         * @brief Resolves host and connects to the first endpoint that accepts.
         *
         * @param host A host name or dotted address.
         * @param port
         * @return std::expected<std::unique_ptr<TcpTransport>, Error> ConnectionError if resolving or connecting
         * failed.
         */
        static std::expected<std::unique_ptr<TcpTransport>, Error>
        connect(std::string const& host, unsigned short port);

        std::expected<std::string, Error> readLine() override;
        std::expected<std::string, Error> readToEnd() override;
        std::expected<void, Error> writeLine(std::string_view line) override;
        void close() override;

      private:
        std::string takeBuffered(std::size_t count);

      private:
        boost::asio::io_context context_;
        boost::asio::ip::tcp::socket socket_;
        boost::asio::streambuf buffer_;
    };

    /**
     * @brief A TransportFactory that opens TcpTransports.
     */
    TransportFactory makeTcpTransportFactory();
}
