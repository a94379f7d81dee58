#pragma once

#include <charconv>
#include <optional>
#include <string_view>

namespace Ftp
{
    namespace ResponseCodes
    {
        constexpr int enteringPassiveMode = 227;
        constexpr int closingDataConnection = 226;
        constexpr int userLoggedIn = 230;
        constexpr int userNameOkay = 331;
        constexpr int serviceNotAvailable = 421;
    }

    enum class ResponseClass
    {
        PositivePreliminary,
        PositiveCompletion,
        PositiveIntermediate,
        TransientNegative,
        PermanentNegative,
        Invalid
    };

    /**
     * @brief Reads the 3 digit status code at the start of a reply line.
     *
     * @param line A reply line, for instance "227 Entering Passive Mode (...)".
     * @return std::optional<int> The code, or nullopt if the line does not start with 3 digits.
     */
    inline std::optional<int> parseResponseCode(std::string_view line)
    {
        if (line.size() < 3)
            return std::nullopt;

        int code = 0;
        const auto* first = line.data();
        const auto* last = line.data() + 3;
        const auto [ptr, ec] = std::from_chars(first, last, code);
        if (ec != std::errc{} || ptr != last || code < 100)
            return std::nullopt;
        return code;
    }

    inline ResponseClass classifyResponse(int code)
    {
        switch (code / 100)
        {
            case 1:
                return ResponseClass::PositivePreliminary;
            case 2:
                return ResponseClass::PositiveCompletion;
            case 3:
                return ResponseClass::PositiveIntermediate;
            case 4:
                return ResponseClass::TransientNegative;
            case 5:
                return ResponseClass::PermanentNegative;
            default:
                return ResponseClass::Invalid;
        }
    }

    inline ResponseClass classifyResponse(std::string_view line)
    {
        if (const auto code = parseResponseCode(line); code)
            return classifyResponse(*code);
        return ResponseClass::Invalid;
    }

    inline bool hasResponseCode(std::string_view line, int code)
    {
        return parseResponseCode(line) == code;
    }

    /**
     * @brief USER and PASS count as accepted on 230 (logged in) and 331 (need password).
     */
    inline bool isPositiveLoginResponse(std::string_view line)
    {
        return hasResponseCode(line, ResponseCodes::userLoggedIn) ||
            hasResponseCode(line, ResponseCodes::userNameOkay);
    }

    /**
     * @brief A multiline read ends on 226 (transfer complete) or 421 (service closing).
     */
    inline bool isCompletionResponse(std::string_view line)
    {
        return hasResponseCode(line, ResponseCodes::closingDataConnection) ||
            hasResponseCode(line, ResponseCodes::serviceNotAvailable);
    }
}
