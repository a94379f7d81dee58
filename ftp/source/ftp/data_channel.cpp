#include <ftp/data_channel.hpp>
#include <ftp/response_code.hpp>
#include <log/log.hpp>

#include <utility/algorithm/trim.hpp>

#include <fmt/format.h>

#include <array>
#include <charconv>

namespace Ftp
{
    namespace
    {
        constexpr std::size_t passiveFieldCount = 6;

        Error parseError(std::string message, std::string_view response)
        {
            return Error{
                .type = ErrorType::ProtocolParseError,
                .message = std::move(message),
                .serverResponse = std::string{response},
            };
        }
    }

    std::expected<PassiveEndpoint, Error> parsePassiveResponse(std::string_view response)
    {
        const auto open = response.find('(');
        if (open == std::string_view::npos)
            return std::unexpected(parseError("Passive reply has no '('", response));
        const auto close = response.find(')', open);
        if (close == std::string_view::npos)
            return std::unexpected(parseError("Passive reply has no ')'", response));

        auto payload = response.substr(open + 1, close - open - 1);

        std::array<int, passiveFieldCount> fields{};
        std::size_t fieldIndex = 0;
        while (true)
        {
            const auto comma = payload.find(',');
            const auto token = Utility::Algorithm::trim(payload.substr(0, comma));

            if (fieldIndex >= passiveFieldCount)
                return std::unexpected(parseError("Passive reply has more than 6 fields", response));

            int value = 0;
            const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size())
            {
                return std::unexpected(
                    parseError(fmt::format("Passive field '{}' is not a number", token), response));
            }
            if (value < 0 || value > 255)
            {
                return std::unexpected(
                    parseError(fmt::format("Passive field '{}' is out of range", token), response));
            }

            fields[fieldIndex++] = value;

            if (comma == std::string_view::npos)
                break;
            payload.remove_prefix(comma + 1);
        }

        if (fieldIndex != passiveFieldCount)
        {
            return std::unexpected(
                parseError(fmt::format("Passive reply has {} fields, expected 6", fieldIndex), response));
        }

        return PassiveEndpoint{
            .address = fmt::format("{}.{}.{}.{}", fields[0], fields[1], fields[2], fields[3]),
            .port = static_cast<unsigned short>(fields[4] * 256 + fields[5]),
        };
    }

    DataChannelNegotiator::DataChannelNegotiator(TransportFactory transportFactory)
        : transportFactory_{std::move(transportFactory)}
    {}

    std::expected<std::unique_ptr<ITransport>, Error> DataChannelNegotiator::open(IClient& control)
    {
        if (auto sent = control.sendCommand("PASV"); !sent)
            return std::unexpected(std::move(sent).error());

        auto response = control.readLine();
        if (!response)
            return std::unexpected(std::move(response).error());

        if (!hasResponseCode(*response, ResponseCodes::enteringPassiveMode))
        {
            Log::warn("DataChannelNegotiator: Server did not enter passive mode: '{}'", *response);
            return std::unique_ptr<ITransport>{};
        }

        const auto endpoint = parsePassiveResponse(*response);
        if (!endpoint)
            return std::unexpected(endpoint.error());

        Log::debug("DataChannelNegotiator: Opening data connection to {}:{}.", endpoint->address, endpoint->port);
        auto transport = transportFactory_(endpoint->address, endpoint->port);
        if (!transport)
        {
            return std::unexpected(Error{
                .type = ErrorType::ConnectionError,
                .message = fmt::format("Cannot open data connection: {}", transport.error().message),
                .serverResponse = *response,
            });
        }
        return std::move(transport).value();
    }
}
