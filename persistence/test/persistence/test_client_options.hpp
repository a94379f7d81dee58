#pragma once

#include <persistence/client_options.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>

namespace Persistence::Test
{
    class ClientOptionsTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            tempDir_ = std::make_unique<Utility::TemporaryDirectory>("tree_ftp_options_test");
        }

        void TearDown() override
        {
            tempDir_.reset();
        }

        std::filesystem::path writeConfig(std::string const& content)
        {
            const auto path = tempDir_->path() / "config.json";
            std::ofstream writer{path, std::ios_base::binary};
            writer << content;
            return path;
        }

      protected:
        std::unique_ptr<Utility::TemporaryDirectory> tempDir_;
    };

    TEST_F(ClientOptionsTests, DefaultsMatchDocumentedValues)
    {
        const auto defaults = defaultClientOptions();
        EXPECT_FALSE(defaults.host.has_value());
        EXPECT_EQ(defaults.port, 21);
        EXPECT_EQ(defaults.user, "anonymous");
        EXPECT_EQ(defaults.password, "anonymous@example.com");
        EXPECT_FALSE(defaults.maxDepth.has_value());
        EXPECT_EQ(defaults.traversal, "dfs");
        EXPECT_EQ(defaults.exportJson, false);
        EXPECT_EQ(defaults.exportPath, "directory_structure.json");
        EXPECT_EQ(defaults.depthCeiling, 512);
        EXPECT_EQ(defaults.logLevel, "info");
        ASSERT_TRUE(defaults.retry.has_value());
        EXPECT_EQ(defaults.retry->maxAttempts, 3);
        EXPECT_EQ(defaults.retry->backoffMilliseconds, 5000);
    }

    TEST_F(ClientOptionsTests, SetValuesWinOverDefaults)
    {
        ClientOptions commandLine{.host = "ftp.example.com", .maxDepth = 2};
        ClientOptions config{.user = "alice", .maxDepth = 7, .retry = RetryOptions{.maxAttempts = 5}};

        commandLine.useDefaultsFrom(config);
        commandLine.useDefaultsFrom(defaultClientOptions());

        EXPECT_EQ(commandLine.host, "ftp.example.com");
        EXPECT_EQ(commandLine.user, "alice");
        EXPECT_EQ(commandLine.password, "anonymous@example.com");
        EXPECT_EQ(commandLine.maxDepth, 2);
        ASSERT_TRUE(commandLine.retry.has_value());
        EXPECT_EQ(commandLine.retry->maxAttempts, 5);
        EXPECT_EQ(commandLine.retry->backoffMilliseconds, 5000);
    }

    TEST_F(ClientOptionsTests, LoadsPartialConfigWithComments)
    {
        const auto path = writeConfig(R"({
            // the server to scan
            "host": "ftp.example.com",
            "port": 2121,
            "traversal": "bfs",
            /* keep retrying quickly */
            "retry": {"backoffMilliseconds": 10}
        })");

        const auto options = loadClientOptions(path);

        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->host, "ftp.example.com");
        EXPECT_EQ(options->port, 2121);
        EXPECT_EQ(options->traversal, "bfs");
        EXPECT_FALSE(options->user.has_value());
        ASSERT_TRUE(options->retry.has_value());
        EXPECT_FALSE(options->retry->maxAttempts.has_value());
        EXPECT_EQ(options->retry->backoffMilliseconds, 10);
    }

    TEST_F(ClientOptionsTests, NullValuesCountAsUnset)
    {
        const auto options = loadClientOptions(writeConfig(R"({"maxDepth": null, "user": "bob"})"));

        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_FALSE(options->maxDepth.has_value());
        EXPECT_EQ(options->user, "bob");
    }

    TEST_F(ClientOptionsTests, MalformedConfigIsError)
    {
        const auto options = loadClientOptions(writeConfig(R"({"host": "ftp.example.com",)"));
        EXPECT_FALSE(options.has_value());
    }

    TEST_F(ClientOptionsTests, WrongTypeIsError)
    {
        const auto options = loadClientOptions(writeConfig(R"({"maxDepth": "deep"})"));
        EXPECT_FALSE(options.has_value());
    }

    TEST_F(ClientOptionsTests, NegativeMaxDepthIsError)
    {
        const auto options = loadClientOptions(writeConfig(R"({"maxDepth": -1})"));
        EXPECT_FALSE(options.has_value());
    }

    TEST_F(ClientOptionsTests, PortOutOfRangeIsError)
    {
        const auto tooLarge = loadClientOptions(writeConfig(R"({"port": 70000})"));
        ASSERT_FALSE(tooLarge.has_value());
        EXPECT_NE(tooLarge.error().find("70000"), std::string::npos);

        EXPECT_FALSE(loadClientOptions(writeConfig(R"({"port": 0})")).has_value());
        EXPECT_TRUE(loadClientOptions(writeConfig(R"({"port": 65535})")).has_value());
    }

    TEST_F(ClientOptionsTests, MissingConfigFileIsError)
    {
        const auto options = loadClientOptions(tempDir_->path() / "does_not_exist.json");
        EXPECT_FALSE(options.has_value());
    }

    TEST_F(ClientOptionsTests, OnlySetMembersAreSerialized)
    {
        const auto json = nlohmann::json(ClientOptions{.host = "ftp.example.com", .exportJson = true});
        EXPECT_EQ(json, (nlohmann::json{{"host", "ftp.example.com"}, {"exportJson", true}}));
    }
}
