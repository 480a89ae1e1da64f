#pragma once

#include "event_recorder.hpp"

#include <backend/session.hpp>
#include <storage/mocks/release_source_mock.hpp>
#include <storage/mocks/storage_client_mock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

using namespace std::chrono_literals;

namespace Test
{
    using ::testing::_;
    using ::testing::NiceMock;
    using ::testing::Return;

    class SessionTests : public ::testing::Test
    {
      protected:
        std::unique_ptr<Session> makeSession(Persistence::Settings settings = {})
        {
            return std::make_unique<Session>(
                client_, std::vector<std::shared_ptr<Storage::ReleaseSource>>{}, std::move(settings), hub_);
        }

        std::shared_ptr<NiceMock<Storage::Test::StorageClientMock>> client_ =
            std::make_shared<NiceMock<Storage::Test::StorageClientMock>>();
        std::shared_ptr<EventHub> hub_ = std::make_shared<EventHub>();
    };

    TEST_F(SessionTests, MissingSettingsAreDefaulted)
    {
        auto session = makeSession(Persistence::Settings{
            .transfer = Persistence::TransferOptions{.concurrency = 5},
        });

        EXPECT_EQ(session->downloads().concurrency(), 5);
        EXPECT_EQ(session->settings().transfer->downloadDirectory.value(), std::filesystem::path{"downloads"});
        EXPECT_EQ(session->settings().update->currentVersion.value(), "v0.0.0");
    }

    TEST_F(SessionTests, ResolvedShareLinksAreQueuedForDownload)
    {
        ON_CALL(*client_, classifyUrl(_)).WillByDefault(Return(Storage::ResourceKind::File));
        EXPECT_CALL(*client_, shareInfo(7, true))
            .WillOnce(Return(std::pair{
                Storage::StatusCode::Success,
                Storage::ShareInfo{.name = "a.txt", .url = "https://example.com/i7", .password = "pw"}}));
        EXPECT_CALL(*client_, downloadFile("https://example.com/i7", "pw", std::filesystem::path{"target"}, _))
            .WillOnce(Return(Storage::StatusCode::Success));

        auto session = makeSession(Persistence::Settings{
            .transfer = Persistence::TransferOptions{.pollInterval = 10ms, .downloadDirectory = "target"},
        });
        session->shareDetails().fetch({SharedData::RemoteItem{.id = 7, .name = "a.txt", .isFile = true}}, true);
        session->shareDetails().wait();

        EXPECT_TRUE(waitUntil([&session]() {
            const auto job = session->downloads().job("https://example.com/i7");
            return job && job->completed();
        }));
    }

    TEST_F(SessionTests, ManualUpdateCheckUsesTheConfiguredVersion)
    {
        auto source = std::make_shared<NiceMock<Storage::Test::ReleaseSourceMock>>();
        ON_CALL(*source, name()).WillByDefault(Return("primary"));
        EXPECT_CALL(*source, latestRelease()).WillOnce(Return(Storage::ReleaseInfo{.tag = "v2.0.0"}));

        EventRecorder recorder{*hub_};
        Session session{
            client_,
            {source},
            Persistence::Settings{.update = Persistence::UpdateOptions{.currentVersion = "v2.0.0"}},
            hub_};
        EXPECT_TRUE(session.checkForUpdates(true));
        session.updateCheck().wait();

        const auto results = recorder.all<SharedData::UpdateCheckFinished>();
        ASSERT_EQ(results.size(), 1);
        EXPECT_FALSE(results.front().updateAvailable);
    }
}
