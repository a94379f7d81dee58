#pragma once

#include "common_fixture.hpp"

#include <ftp/session.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace std::string_literals;

namespace Ftp::Test
{
    class SessionTests : public TransportFixture
    {
      protected:
        std::unique_ptr<Session> makeConnectedSession(TransportMock*& control)
        {
            auto transport = makeTransport();
            control = transport.get();
            return std::make_unique<Session>(testOptions(), factory(), std::move(transport));
        }
    };

    TEST_F(SessionTests, ConnectReadsGreeting)
    {
        auto* control = queueTransport();
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(lineResult("220 Welcome to the test server")));

        Session session{testOptions(), factory()};
        const auto result = session.connect();

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(session.state(), Session::State::Connected);
        ASSERT_EQ(connectRequests_.size(), 1u);
        EXPECT_EQ(connectRequests_[0].first, "ftp.example.com");
        EXPECT_EQ(connectRequests_[0].second, 21);
    }

    TEST_F(SessionTests, ConnectToUnreachableServerIsConnectionError)
    {
        Session session{testOptions(), factory()};
        const auto result = session.connect();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ErrorType::ConnectionError);
        EXPECT_EQ(session.state(), Session::State::Disconnected);
    }

    TEST_F(SessionTests, ConnectWithoutGreetingIsConnectionError)
    {
        auto* control = queueTransport();
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(readFailure()));

        Session session{testOptions(), factory()};
        const auto result = session.connect();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ErrorType::ConnectionError);
        EXPECT_EQ(session.state(), Session::State::Disconnected);
    }

    TEST_F(SessionTests, SendCommandWritesTheCommandLine)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, writeLine(std::string_view{"NOOP"})).WillOnce(::testing::Return(writeSuccess()));

        EXPECT_TRUE(session->sendCommand("NOOP").has_value());
    }

    TEST_F(SessionTests, SendCommandWithoutConnectionIsNotConnected)
    {
        Session session{testOptions(), factory()};
        const auto result = session.sendCommand("NOOP");

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ErrorType::NotConnected);
        EXPECT_TRUE(connectRequests_.empty());
    }

    TEST_F(SessionTests, SendCommandIsNotRetried)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, writeLine(::testing::_))
            .WillOnce(::testing::Return(std::expected<void, Error>{
                std::unexpect, Error{.type = ErrorType::ProtocolIOError, .message = "Broken pipe"}}));

        const auto result = session->sendCommand("NOOP");

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ErrorType::ProtocolIOError);
        EXPECT_TRUE(connectRequests_.empty());
    }

    TEST_F(SessionTests, ReadLineReturnsTheLine)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(lineResult("200 OK")));

        const auto line = session->readLine();

        ASSERT_TRUE(line.has_value());
        EXPECT_EQ(*line, "200 OK");
        EXPECT_EQ(session->lastReadAttempts(), 1);
    }

    TEST_F(SessionTests, ReadLineReconnectsAfterFailure)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(readFailure()));
        EXPECT_CALL(*control, close()).Times(::testing::AtLeast(1));

        auto* replacement = queueTransport();
        EXPECT_CALL(*replacement, readLine()).WillOnce(::testing::Return(lineResult("200 OK")));

        const auto line = session->readLine();

        ASSERT_TRUE(line.has_value()) << line.error().toString();
        EXPECT_EQ(*line, "200 OK");
        EXPECT_EQ(session->lastReadAttempts(), 2);
        EXPECT_EQ(connectRequests_.size(), 1u);
        EXPECT_EQ(session->state(), Session::State::Connected);
    }

    TEST_F(SessionTests, ReadLineGivesUpAfterMaxAttempts)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(readFailure()));
        for (int i = 0; i != 2; ++i)
        {
            auto* replacement = queueTransport();
            EXPECT_CALL(*replacement, readLine()).WillOnce(::testing::Return(readFailure()));
        }

        const auto line = session->readLine();

        ASSERT_FALSE(line.has_value());
        EXPECT_EQ(line.error().type, ErrorType::ProtocolIOError);
        EXPECT_EQ(session->lastReadAttempts(), 3);
        EXPECT_EQ(connectRequests_.size(), 2u);
        EXPECT_EQ(session->state(), Session::State::Disconnected);
    }

    TEST_F(SessionTests, ReadLineFailsWhenReconnectFails)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(readFailure()));

        const auto line = session->readLine();

        ASSERT_FALSE(line.has_value());
        EXPECT_EQ(line.error().type, ErrorType::ProtocolIOError);
        EXPECT_EQ(connectRequests_.size(), 3u);
        EXPECT_EQ(session->state(), Session::State::Disconnected);
    }

    TEST_F(SessionTests, ReconnectReplacesTransport)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, close());
        queueTransport();

        const auto result = session->reconnect();

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(session->state(), Session::State::Connected);
        EXPECT_EQ(connectRequests_.size(), 1u);
    }

    TEST_F(SessionTests, ReconnectStopsAfterMaxAttempts)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);

        const auto result = session->reconnect();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ErrorType::ConnectionError);
        EXPECT_EQ(connectRequests_.size(), 3u);
        EXPECT_EQ(session->state(), Session::State::Disconnected);
    }

    TEST_F(SessionTests, ReadMultilineStopsAtTransferComplete)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, readLine())
            .WillOnce(::testing::Return(lineResult("150 Here comes the directory listing.")))
            .WillOnce(::testing::Return(lineResult("226 Directory send OK.")));

        const auto response = session->readMultiline();

        ASSERT_TRUE(response.has_value());
        EXPECT_EQ(*response, "150 Here comes the directory listing.\n226 Directory send OK.\n");
    }

    TEST_F(SessionTests, ReadMultilineStopsAtServiceClosing)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, readLine())
            .WillOnce(::testing::Return(lineResult("421 Timeout.")));

        const auto response = session->readMultiline();

        ASSERT_TRUE(response.has_value());
        EXPECT_EQ(*response, "421 Timeout.\n");
    }

    TEST_F(SessionTests, LoginWithPasswordPrompt)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        {
            ::testing::InSequence seq;
            EXPECT_CALL(*control, writeLine(std::string_view{"USER anonymous"}))
                .WillOnce(::testing::Return(writeSuccess()));
            EXPECT_CALL(*control, readLine())
                .WillOnce(::testing::Return(lineResult("331 Please specify the password.")));
            EXPECT_CALL(*control, writeLine(std::string_view{"PASS guest@"}))
                .WillOnce(::testing::Return(writeSuccess()));
            EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(lineResult("230 Login successful.")));
        }

        const auto result = session->login("anonymous", "guest@");

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(session->state(), Session::State::Authenticated);
    }

    TEST_F(SessionTests, LoginRejectedUserIsAuthenticationError)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, writeLine(std::string_view{"USER nobody"})).WillOnce(::testing::Return(writeSuccess()));
        EXPECT_CALL(*control, writeLine(::testing::StartsWith("PASS"))).Times(0);
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(lineResult("530 Permission denied.")));

        const auto result = session->login("nobody", "secret");

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ErrorType::AuthenticationError);
        EXPECT_EQ(result.error().serverResponse, "530 Permission denied.");
        EXPECT_EQ(session->state(), Session::State::Connected);
    }

    TEST_F(SessionTests, LoginRejectedPasswordIsAuthenticationError)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        ON_CALL(*control, writeLine(::testing::_)).WillByDefault(::testing::Return(writeSuccess()));
        EXPECT_CALL(*control, readLine())
            .WillOnce(::testing::Return(lineResult("331 Please specify the password.")))
            .WillOnce(::testing::Return(lineResult("530 Login incorrect.")));

        const auto result = session->login("user", "wrong");

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ErrorType::AuthenticationError);
        EXPECT_EQ(result.error().serverResponse, "530 Login incorrect.");
    }

    TEST_F(SessionTests, ListDirectoryTalksPassiveModeThenList)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        auto* data = queueTransport();

        const auto listing = "drwxr-xr-x 2 0 0 4096 Jan 01 00:00 pub\r\n-rw-r--r-- 1 0 0 12 Jan 01 00:00 README\r\n"s;
        {
            ::testing::InSequence seq;
            EXPECT_CALL(*control, writeLine(std::string_view{"PASV"})).WillOnce(::testing::Return(writeSuccess()));
            EXPECT_CALL(*control, readLine())
                .WillOnce(::testing::Return(lineResult("227 Entering Passive Mode (127,0,0,1,200,10)")));
            EXPECT_CALL(*control, writeLine(std::string_view{"LIST /srv"})).WillOnce(::testing::Return(writeSuccess()));
            EXPECT_CALL(*data, readToEnd()).WillOnce(::testing::Return(lineResult(listing)));
            EXPECT_CALL(*data, close());
            EXPECT_CALL(*control, readLine())
                .WillOnce(::testing::Return(lineResult("150 Here comes the directory listing.")))
                .WillOnce(::testing::Return(lineResult("226 Directory send OK.")));
        }

        const auto result = session->listDirectory("/srv");

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(*result, listing);
        ASSERT_EQ(connectRequests_.size(), 1u);
        EXPECT_EQ(connectRequests_[0].first, "127.0.0.1");
        EXPECT_EQ(connectRequests_[0].second, 200 * 256 + 10);
    }

    TEST_F(SessionTests, ListDirectoryWithoutPassiveModeIsEmpty)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, writeLine(std::string_view{"PASV"})).WillOnce(::testing::Return(writeSuccess()));
        EXPECT_CALL(*control, writeLine(::testing::StartsWith("LIST"))).Times(0);
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(lineResult("500 Unknown command.")));

        const auto result = session->listDirectory("/");

        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->empty());
        EXPECT_TRUE(connectRequests_.empty());
    }

    TEST_F(SessionTests, ListDirectoryWithMalformedPassiveReplyIsEmpty)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, writeLine(std::string_view{"PASV"})).WillOnce(::testing::Return(writeSuccess()));
        EXPECT_CALL(*control, readLine()).WillOnce(::testing::Return(lineResult("227 Entering Passive Mode (1,2)")));

        const auto result = session->listDirectory("/");

        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->empty());
    }

    TEST_F(SessionTests, DisconnectIsIdempotent)
    {
        TransportMock* control = nullptr;
        auto session = makeConnectedSession(control);
        EXPECT_CALL(*control, close()).Times(1);

        session->disconnect();
        session->disconnect();

        EXPECT_EQ(session->state(), Session::State::Disconnected);
        EXPECT_FALSE(session->sendCommand("NOOP").has_value());
    }
}
