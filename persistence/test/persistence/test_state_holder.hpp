#pragma once

#include <persistence/state_holder.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <string>

extern std::filesystem::path programDirectory;

namespace Persistence::Test
{
    class StateHolderTests : public ::testing::Test
    {
      protected:
        std::filesystem::path configPath() const
        {
            return isolateDirectory_.path() / "config.json";
        }

        void writeConfig(std::string const& content)
        {
            std::ofstream{configPath(), std::ios_base::binary} << content;
        }

        nlohmann::json readConfig() const
        {
            std::ifstream reader{configPath(), std::ios_base::binary};
            return nlohmann::json::parse(reader);
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(StateHolderTests, MissingFileIsCreatedWithDefaults)
    {
        StateHolder holder{configPath()};
        bool loaded = false;
        holder.load([&loaded](bool success, StateHolder&) {
            loaded = success;
        });

        EXPECT_TRUE(loaded);
        ASSERT_TRUE(std::filesystem::exists(configPath()));
        const auto json = readConfig();
        EXPECT_EQ(json["sidecar"]["basePort"].get<int>(), 31415);
        EXPECT_EQ(json["stream"]["reconnectMaxAttempts"].get<int>(), 3);
        EXPECT_EQ(json["scheduler"]["minimumIntervalMinutes"].get<int>(), 15);
        EXPECT_TRUE(json["sharedRuntime"]["enabled"].get<bool>());
        EXPECT_EQ(json["sharedRuntime"]["retryAttempts"].get<int>(), 5);
    }

    TEST_F(StateHolderTests, SharedRuntimeCanBeDisabled)
    {
        writeConfig(R"({"sharedRuntime": {"enabled": false, "workspacePath": "/srv/shared"}})");

        StateHolder holder{configPath()};
        holder.load([](bool, StateHolder&) {});

        auto const& state = holder.stateCache();
        EXPECT_EQ(state.sharedRuntime.enabled, false);
        EXPECT_EQ(state.sharedRuntime.workspacePath, "/srv/shared");
        EXPECT_EQ(state.sharedRuntime.retryBaseDelayMs, 2000);
    }

    TEST_F(StateHolderTests, ExplicitValuesAreKeptAndMissingOnesFilled)
    {
        writeConfig(R"({"sidecar": {"basePort": 40000, "command": "node"}, "logLevel": "debug"})");

        StateHolder holder{configPath()};
        holder.load([](bool, StateHolder&) {});

        auto const& state = holder.stateCache();
        EXPECT_EQ(state.sidecar.basePort, 40000);
        EXPECT_EQ(state.sidecar.command, "node");
        EXPECT_EQ(state.sidecar.portRange, 500);
        EXPECT_EQ(state.logLevel, Log::Level::Debug);
        EXPECT_EQ(readConfig()["sidecar"]["healthCheckAttempts"].get<int>(), 60);
    }

    TEST_F(StateHolderTests, UnparsableFileIsBackedUpAndReplaced)
    {
        writeConfig("{ this is not json");

        StateHolder holder{configPath()};
        bool loaded = false;
        holder.load([&loaded](bool success, StateHolder&) {
            loaded = success;
        });

        EXPECT_TRUE(loaded);
        int backups = 0;
        for (auto const& entry : std::filesystem::directory_iterator{isolateDirectory_.path()})
        {
            if (entry.path().filename().string().starts_with("config.json.backup_"))
                ++backups;
        }
        EXPECT_EQ(backups, 1);
        EXPECT_EQ(readConfig()["sidecar"]["basePort"].get<int>(), 31415);
    }

    TEST_F(StateHolderTests, LogLevelIsReadCaseInsensitively)
    {
        writeConfig(R"({"logLevel": "WARN"})");

        StateHolder holder{configPath()};
        holder.load([](bool, StateHolder&) {});
        EXPECT_EQ(holder.stateCache().logLevel, Log::Level::Warning);
        EXPECT_EQ(readConfig()["logLevel"].get<std::string>(), "warning");
    }

    TEST_F(StateHolderTests, UnknownLogLevelFallsBackToInfo)
    {
        writeConfig(R"({"logLevel": "verbose"})");

        StateHolder holder{configPath()};
        holder.load([](bool, StateHolder&) {});
        EXPECT_EQ(holder.stateCache().logLevel, Log::Level::Info);
    }
}
