#include <ftp/tcp_transport.hpp>
#include <log/log.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>

namespace Ftp
{
    TcpTransport::TcpTransport()
        : context_{}
        , socket_{context_}
        , buffer_{}
    {}

    TcpTransport::~TcpTransport()
    {
        close();
    }

    std::expected<std::unique_ptr<TcpTransport>, Error>
    TcpTransport::connect(std::string const& host, unsigned short port)
    {
        auto transport = std::make_unique<TcpTransport>();

        boost::system::error_code ec;
        boost::asio::ip::tcp::resolver resolver{transport->context_};
        const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec)
        {
            return std::unexpected(Error{
                .type = ErrorType::ConnectionError,
                .message = fmt::format("Cannot resolve '{}': {}", host, ec.message()),
            });
        }

        boost::asio::connect(transport->socket_, endpoints, ec);
        if (ec)
        {
            return std::unexpected(Error{
                .type = ErrorType::ConnectionError,
                .message = fmt::format("Cannot connect to {}:{}: {}", host, port, ec.message()),
            });
        }

        Log::debug("TcpTransport: Connected to {}:{}.", host, port);
        return transport;
    }

    std::string TcpTransport::takeBuffered(std::size_t count)
    {
        const auto begin = boost::asio::buffers_begin(buffer_.data());
        std::string result{begin, begin + static_cast<std::ptrdiff_t>(count)};
        buffer_.consume(count);
        return result;
    }

    std::expected<std::string, Error> TcpTransport::readLine()
    {
        boost::system::error_code ec;
        const auto count = boost::asio::read_until(socket_, buffer_, '\n', ec);
        if (ec)
        {
            return std::unexpected(Error{
                .type = ErrorType::ProtocolIOError,
                .message = ec == boost::asio::error::eof ? std::string{"Connection closed by peer"} : ec.message(),
            });
        }

        auto line = takeBuffered(count);
        line.pop_back();
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }

    std::expected<std::string, Error> TcpTransport::readToEnd()
    {
        boost::system::error_code ec;
        boost::asio::read(socket_, buffer_, boost::asio::transfer_all(), ec);
        if (ec && ec != boost::asio::error::eof)
        {
            return std::unexpected(Error{
                .type = ErrorType::ProtocolIOError,
                .message = ec.message(),
            });
        }
        return takeBuffered(buffer_.size());
    }

    std::expected<void, Error> TcpTransport::writeLine(std::string_view line)
    {
        std::string data{line};
        data += "\r\n";

        boost::system::error_code ec;
        boost::asio::write(socket_, boost::asio::buffer(data), ec);
        if (ec)
        {
            return std::unexpected(Error{
                .type = ErrorType::ProtocolIOError,
                .message = ec.message(),
            });
        }
        return {};
    }

    void TcpTransport::close()
    {
        if (!socket_.is_open())
            return;

        boost::system::error_code ec;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        // not connected anymore is fine here
        socket_.close(ec);
        if (ec)
            Log::debug("TcpTransport: Close reported: {}", ec.message());
    }

    TransportFactory makeTcpTransportFactory()
    {
        return [](std::string const& host, unsigned short port) -> std::expected<std::unique_ptr<ITransport>, Error> {
            auto transport = TcpTransport::connect(host, port);
            if (!transport)
                return std::unexpected(std::move(transport).error());
            return std::unique_ptr<ITransport>{std::move(transport).value()};
        };
    }
}
