#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace Ftp
{
    enum class ErrorType
    {
        None,
        // The transport could not be opened, control or data connection.
        ConnectionError,
        // A read or write failed and reconnecting did not help.
        ProtocolIOError,
        // The server rejected USER or PASS.
        AuthenticationError,
        // The passive mode reply could not be understood.
        ProtocolParseError,
        NotConnected,
    };

    inline std::string_view errorTypeToString(ErrorType type)
    {
        switch (type)
        {
            case ErrorType::None:
                return "None";
            case ErrorType::ConnectionError:
                return "ConnectionError";
            case ErrorType::ProtocolIOError:
                return "ProtocolIOError";
            case ErrorType::AuthenticationError:
                return "AuthenticationError";
            case ErrorType::ProtocolParseError:
                return "ProtocolParseError";
            case ErrorType::NotConnected:
                return "NotConnected";
        }
        return "INVALID_ENUM_VALUE";
    }

    struct Error
    {
        ErrorType type = ErrorType::None;
        std::string message{};
        // The server reply that caused the error, if any.
        std::string serverResponse{};

        inline std::string toString() const
        {
            if (serverResponse.empty())
                return fmt::format("{}: {}", errorTypeToString(type), message);
            return fmt::format("{}: {} (server: '{}')", errorTypeToString(type), message, serverResponse);
        }
    };
}
