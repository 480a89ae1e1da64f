#pragma once

#include "event_recorder.hpp"
#include "gate.hpp"

#include <backend/transfer/upload_dispatcher.hpp>
#include <storage/mocks/storage_client_mock.hpp>
#include <storage/storage_error.hpp>
#include <utility/awaiter.hpp>
#include <utility/temporary_directory.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace std::chrono_literals;

namespace Test
{
    using ::testing::_;
    using ::testing::NiceMock;
    using ::testing::Return;

    class UploadDispatcherTests : public ::testing::Test
    {
      protected:
        std::filesystem::path makeFile(std::string const& name)
        {
            const auto path = directory_.path() / name;
            std::ofstream{path} << "some content";
            return path;
        }

        static SharedData::UploadJob job(std::filesystem::path const& path)
        {
            return SharedData::UploadJob{.path = path, .folderId = 42, .folderName = "target"};
        }

        bool waitForIdle(UploadDispatcher const& dispatcher)
        {
            return waitUntil([&dispatcher]() {
                return dispatcher.idle();
            });
        }

        Utility::TemporaryDirectory directory_{};
        std::shared_ptr<NiceMock<Storage::Test::StorageClientMock>> client_ =
            std::make_shared<NiceMock<Storage::Test::StorageClientMock>>();
        std::shared_ptr<EventHub> hub_ = std::make_shared<EventHub>();
        EventRecorder recorder_{*hub_};
    };

    TEST_F(UploadDispatcherTests, MissingPathFailsAndTheNextJobRuns)
    {
        const auto missing = directory_.path() / "missing.txt";
        const auto present = makeFile("present.txt");

        EXPECT_CALL(*client_, uploadFile(missing, _, _)).Times(0);
        EXPECT_CALL(*client_, uploadFile(present, 42, _))
            .WillOnce([](auto const&, auto, Storage::ProgressCallback const& onProgress) {
                onProgress(Storage::TransferProgress{.fileName = "present.txt", .totalBytes = 12, .doneBytes = 12});
                return Storage::UploadResult{.code = Storage::StatusCode::Success, .id = 7, .isFile = true};
            });

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.addMany({job(missing), job(present)});
        ASSERT_TRUE(waitForIdle(dispatcher));

        const auto failed = dispatcher.job(missing.string());
        ASSERT_TRUE(failed.has_value());
        ASSERT_TRUE(failed->error.has_value());
        EXPECT_EQ(failed->error->type, SharedData::JobErrorType::NotFound);
        EXPECT_FALSE(failed->running);
        EXPECT_TRUE(recorder_.hasMessageContaining("ERROR: File does not exist"));

        const auto uploaded = dispatcher.job(present.string());
        ASSERT_TRUE(uploaded.has_value());
        EXPECT_FALSE(uploaded->error.has_value());
        EXPECT_EQ(uploaded->rate, Progress::completeRate);
    }

    TEST_F(UploadDispatcherTests, RateDoesNotGoBackWhenTheClientReportsLess)
    {
        const auto file = makeFile("shaky.bin");
        Gate gate;
        Awaiter reported{};

        EXPECT_CALL(*client_, uploadFile(file, 42, _))
            .WillOnce([&](auto const&, auto, Storage::ProgressCallback const& onProgress) {
                onProgress(Storage::TransferProgress{.fileName = "shaky.bin", .totalBytes = 100, .doneBytes = 60});
                onProgress(Storage::TransferProgress{.fileName = "shaky.bin", .totalBytes = 100, .doneBytes = 20});
                reported.arrive();
                gate.wait();
                return Storage::UploadResult{.code = Storage::StatusCode::Success, .id = 3, .isFile = true};
            });

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.add(job(file));
        ASSERT_TRUE(reported.waitFor(2s));

        EXPECT_EQ(dispatcher.job(file.string())->rate, 600);
        int previous = 0;
        for (auto const& progress : recorder_.all<SharedData::JobProgress>())
        {
            EXPECT_GE(progress.ratePerMille, previous);
            previous = progress.ratePerMille;
        }
        EXPECT_EQ(previous, 600);

        gate.open();
        ASSERT_TRUE(waitForIdle(dispatcher));
        EXPECT_EQ(dispatcher.job(file.string())->rate, Progress::completeRate);
    }

    TEST_F(UploadDispatcherTests, DirectivesAreAppliedAfterSuccess)
    {
        const auto file = makeFile("secret.txt");
        auto uploadJob = job(file);
        uploadJob.applyPassword = true;
        uploadJob.password = "ab12";
        uploadJob.applyDescription = true;
        uploadJob.description = "a description";

        EXPECT_CALL(*client_, uploadFile(file, 42, _))
            .WillOnce(Return(Storage::UploadResult{.code = Storage::StatusCode::Success, .id = 99, .isFile = true}));
        EXPECT_CALL(*client_, setPassword(99, "ab12", true)).WillOnce(Return(Storage::StatusCode::Success));
        EXPECT_CALL(*client_, setDescription(99, "a description", true)).WillOnce(Return(Storage::StatusCode::Success));

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.add(uploadJob);
        ASSERT_TRUE(waitForIdle(dispatcher));

        EXPECT_EQ(dispatcher.job(file.string())->rate, Progress::completeRate);
    }

    TEST_F(UploadDispatcherTests, DirectivesAreSkippedWhenTheUploadIsDeclined)
    {
        const auto file = makeFile("secret.txt");
        auto uploadJob = job(file);
        uploadJob.applyPassword = true;
        uploadJob.password = "ab12";

        EXPECT_CALL(*client_, uploadFile(file, 42, _))
            .WillOnce(Return(Storage::UploadResult{.code = Storage::StatusCode::Failed}));
        EXPECT_CALL(*client_, setPassword(_, _, _)).Times(0);

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.add(uploadJob);
        ASSERT_TRUE(waitForIdle(dispatcher));

        const auto record = dispatcher.job(file.string());
        ASSERT_TRUE(record->error.has_value());
        EXPECT_EQ(record->error->type, SharedData::JobErrorType::Declined);
        EXPECT_EQ(record->error->code, Storage::StatusCode::Failed);
    }

    TEST_F(UploadDispatcherTests, FailingDirectiveIsOnlyAWarning)
    {
        const auto file = makeFile("secret.txt");
        auto uploadJob = job(file);
        uploadJob.applyPassword = true;
        uploadJob.password = "ab12";

        EXPECT_CALL(*client_, uploadFile(file, 42, _))
            .WillOnce(Return(Storage::UploadResult{.code = Storage::StatusCode::Success, .id = 99, .isFile = true}));
        EXPECT_CALL(*client_, setPassword(99, "ab12", true))
            .WillOnce([](auto, auto const&, auto) -> Storage::StatusCode {
                throw Storage::TimeoutError{"no answer"};
            });

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.add(uploadJob);
        ASSERT_TRUE(waitForIdle(dispatcher));

        const auto record = dispatcher.job(file.string());
        EXPECT_FALSE(record->error.has_value());
        EXPECT_EQ(record->rate, Progress::completeRate);
        EXPECT_TRUE(recorder_.hasMessageContaining("but setting the password failed"));
    }

    TEST_F(UploadDispatcherTests, TimeoutDoesNotAbortTheBatch)
    {
        const auto first = makeFile("first.txt");
        const auto second = makeFile("second.txt");

        EXPECT_CALL(*client_, uploadFile(first, _, _))
            .WillOnce([](auto const&, auto, auto const&) -> Storage::UploadResult {
                throw Storage::TimeoutError{"no answer"};
            });
        EXPECT_CALL(*client_, uploadFile(second, _, _))
            .WillOnce(Return(Storage::UploadResult{.code = Storage::StatusCode::Success, .id = 3}));

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.addMany({job(first), job(second)});
        ASSERT_TRUE(waitForIdle(dispatcher));

        EXPECT_EQ(dispatcher.job(first.string())->error->type, SharedData::JobErrorType::Timeout);
        EXPECT_TRUE(recorder_.hasMessage("ERROR: Network timeout, please retry!"));
        EXPECT_FALSE(dispatcher.job(second.string())->error.has_value());
        EXPECT_EQ(dispatcher.job(second.string())->rate, Progress::completeRate);
    }

    TEST_F(UploadDispatcherTests, DirectoryReportsFailedFilesSeparately)
    {
        const auto folder = directory_.path() / "folder";
        std::filesystem::create_directory(folder);

        EXPECT_CALL(*client_, uploadFile(_, _, _)).Times(0);
        EXPECT_CALL(*client_, uploadFolder(folder, 42, _, _))
            .WillOnce([](auto const&,
                         auto,
                         Storage::DirectoryProgressCallback const& onProgress,
                         Storage::FailedItemCallback const& onItemFailed) {
                onProgress(Storage::DirectoryTransferProgress{
                    .currentFile = "a.txt",
                    .fileIndex = 1,
                    .fileCount = 2,
                    .fileBytes = 10,
                    .fileTotalBytes = 10,
                    .bytesDone = 10,
                    .bytesTotal = 20,
                });
                onItemFailed(Storage::StatusCode::Failed, Storage::FailedItem{.name = "b.txt"});
                return Storage::StatusCode::Success;
            });

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.add(job(folder));
        ASSERT_TRUE(waitForIdle(dispatcher));

        const auto failures = recorder_.all<SharedData::FolderItemFailed>();
        ASSERT_EQ(failures.size(), 1);
        EXPECT_EQ(failures.front().itemName, "b.txt");
        EXPECT_EQ(failures.front().jobKey, folder.string());

        const auto record = dispatcher.job(folder.string());
        EXPECT_FALSE(record->error.has_value());
        EXPECT_EQ(record->rate, Progress::completeRate);
    }

    TEST_F(UploadDispatcherTests, RemovingTheRunningJobAbortsIt)
    {
        const auto file = makeFile("big.bin");
        Gate gate;
        Awaiter started{};
        bool continued = true;

        EXPECT_CALL(*client_, uploadFile(file, _, _))
            .WillOnce([&](auto const&, auto, Storage::ProgressCallback const& onProgress) {
                started.arrive();
                gate.wait();
                continued = onProgress(Storage::TransferProgress{.fileName = "big.bin", .totalBytes = 100, .doneBytes = 5});
                return Storage::UploadResult{.code = Storage::StatusCode::Aborted};
            });

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.add(job(file));
        EXPECT_TRUE(started.waitFor(2s));
        EXPECT_TRUE(dispatcher.remove(file.string()));
        gate.open();
        ASSERT_TRUE(waitForIdle(dispatcher));

        EXPECT_FALSE(continued);
        EXPECT_TRUE(dispatcher.snapshot().empty());
    }

    TEST_F(UploadDispatcherTests, QueuedPathIsNotAddedTwice)
    {
        const auto first = makeFile("first.txt");
        const auto second = makeFile("second.txt");
        Gate gate;
        Awaiter started{};

        EXPECT_CALL(*client_, uploadFile(first, _, _)).WillOnce([&](auto const&, auto, auto const&) {
            started.arrive();
            gate.wait();
            return Storage::UploadResult{.code = Storage::StatusCode::Success};
        });
        EXPECT_CALL(*client_, uploadFile(second, _, _))
            .Times(1)
            .WillOnce(Return(Storage::UploadResult{.code = Storage::StatusCode::Success}));

        UploadDispatcher dispatcher{client_, hub_};
        dispatcher.add(job(first));
        EXPECT_TRUE(started.waitFor(2s));
        dispatcher.addMany({job(second), job(second), job(first)});
        EXPECT_EQ(dispatcher.pendingCount(), 1);

        gate.open();
        ASSERT_TRUE(waitForIdle(dispatcher));
        EXPECT_EQ(dispatcher.snapshot().size(), 2);
    }
}
