#pragma once

#include <persistence/settings_holder.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace std::chrono_literals;

namespace Persistence::Test
{
    class SettingsTests : public ::testing::Test
    {
      protected:
        std::filesystem::path settingsPath() const
        {
            return tempDir_.path() / "config" / "settings.json";
        }

        void writeSettingsFile(std::string const& content)
        {
            std::filesystem::create_directories(settingsPath().parent_path());
            std::ofstream writer{settingsPath(), std::ios_base::binary};
            writer << content;
        }

        std::string readSettingsFile() const
        {
            std::ifstream reader{settingsPath(), std::ios_base::binary};
            std::stringstream buffer;
            buffer << reader.rdbuf();
            return buffer.str();
        }

        int countBackups() const
        {
            int count = 0;
            for (auto const& entry : std::filesystem::directory_iterator{settingsPath().parent_path()})
            {
                if (entry.path().filename().string().starts_with("settings.json.backup_"))
                    ++count;
            }
            return count;
        }

      protected:
        Utility::TemporaryDirectory tempDir_{};
    };

    TEST_F(SettingsTests, DefaultsAreFullyPopulated)
    {
        const auto defaults = Settings::defaults();
        ASSERT_TRUE(defaults.transfer.has_value());
        EXPECT_EQ(defaults.transfer->concurrency, 3);
        EXPECT_EQ(defaults.transfer->pollInterval, 1000ms);
        ASSERT_TRUE(defaults.actions.has_value());
        EXPECT_EQ(defaults.actions->moveSettleDelay, 2100ms);
        EXPECT_EQ(defaults.actions->mkdirSettleDelay, 1500ms);
        EXPECT_EQ(defaults.actions->recycleSettleDelay, 2600ms);
        ASSERT_TRUE(defaults.shareLink.has_value());
        EXPECT_TRUE(defaults.shareLink->pattern.has_value());
    }

    TEST_F(SettingsTests, UseDefaultsFromKeepsExplicitValues)
    {
        Settings settings{};
        settings.transfer = TransferOptions{.concurrency = 7};

        settings.useDefaultsFrom(Settings::defaults());

        EXPECT_EQ(settings.transfer->concurrency, 7);
        EXPECT_EQ(settings.transfer->pollInterval, 1000ms);
        EXPECT_TRUE(settings.log.has_value());
    }

    TEST_F(SettingsTests, MissingFileIsCreatedWithDefaults)
    {
        SettingsHolder holder{settingsPath()};

        ASSERT_TRUE(holder.load().has_value());

        EXPECT_TRUE(std::filesystem::exists(settingsPath()));
        EXPECT_EQ(holder.settings().transfer->concurrency, 3);
        const auto written = nlohmann::json::parse(readSettingsFile());
        EXPECT_EQ(written["transfer"]["concurrency"].get<int>(), 3);
        EXPECT_EQ(written["actions"]["moveSettleDelay"].get<int>(), 2100);
    }

    TEST_F(SettingsTests, PartialFileIsCompletedAndKeepsValues)
    {
        writeSettingsFile(R"({"transfer": {"concurrency": 5}, "update": {"currentVersion": "v1.2.3"}})");
        SettingsHolder holder{settingsPath()};

        ASSERT_TRUE(holder.load().has_value());

        EXPECT_EQ(holder.settings().transfer->concurrency, 5);
        EXPECT_EQ(holder.settings().transfer->pollInterval, 1000ms);
        EXPECT_EQ(holder.settings().update->currentVersion, "v1.2.3");
        const auto written = nlohmann::json::parse(readSettingsFile());
        EXPECT_EQ(written["transfer"]["concurrency"].get<int>(), 5);
        EXPECT_TRUE(written.contains("log"));
        EXPECT_EQ(countBackups(), 0);
    }

    TEST_F(SettingsTests, UnparsableFileIsBackedUpAndReplaced)
    {
        writeSettingsFile("{ this is not json");
        SettingsHolder holder{settingsPath()};

        ASSERT_TRUE(holder.load().has_value());

        EXPECT_EQ(countBackups(), 1);
        EXPECT_EQ(holder.settings().transfer->concurrency, 3);
        EXPECT_NO_THROW(nlohmann::json::parse(readSettingsFile()));
    }

    TEST_F(SettingsTests, WrongValueTypesFallBackToDefaults)
    {
        writeSettingsFile(R"({"transfer": {"concurrency": "many"}})");
        SettingsHolder holder{settingsPath()};

        ASSERT_TRUE(holder.load().has_value());

        EXPECT_EQ(countBackups(), 1);
        EXPECT_EQ(holder.settings().transfer->concurrency, 3);
    }

    TEST_F(SettingsTests, SaveWritesChangedValues)
    {
        SettingsHolder holder{settingsPath()};
        ASSERT_TRUE(holder.load().has_value());

        holder.settings().transfer->concurrency = 9;
        holder.save();

        SettingsHolder reloaded{settingsPath()};
        ASSERT_TRUE(reloaded.load().has_value());
        EXPECT_EQ(reloaded.settings().transfer->concurrency, 9);
    }
}
