#pragma once

#include <ftp/transport.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <string>
#include <string_view>

namespace Ftp::Test
{
    class TransportMock : public Ftp::ITransport
    {
      public:
        MOCK_METHOD((std::expected<std::string, Error>), readLine, (), (override));
        MOCK_METHOD((std::expected<std::string, Error>), readToEnd, (), (override));
        MOCK_METHOD((std::expected<void, Error>), writeLine, (std::string_view line), (override));
        MOCK_METHOD(void, close, (), (override));
    };
}
