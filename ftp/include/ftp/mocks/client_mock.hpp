#pragma once

#include <ftp/client.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <string>
#include <string_view>

namespace Ftp::Test
{
    class ClientMock : public Ftp::IClient
    {
      public:
        MOCK_METHOD(
            (std::expected<void, Error>),
            login,
            (std::string const& user, std::string const& password),
            (override));
        MOCK_METHOD((std::expected<void, Error>), reconnect, (), (override));
        MOCK_METHOD((std::expected<std::string, Error>), readLine, (), (override));
        MOCK_METHOD((std::expected<std::string, Error>), readMultiline, (), (override));
        MOCK_METHOD((std::expected<void, Error>), sendCommand, (std::string_view command), (override));
        MOCK_METHOD(void, disconnect, (), (override));
        MOCK_METHOD((std::expected<std::string, Error>), listDirectory, (std::string const& path), (override));
    };
}
