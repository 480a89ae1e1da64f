#pragma once

#include <backend/progress/progress_reporter.hpp>
#include <shared_data/job_error.hpp>
#include <shared_data/jobs.hpp>
#include <storage/storage_client.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Runs one download at a time on its own thread and reports through callbacks.
 *
 * Stopping is cooperative: the stop flag is checked before the transfer starts and on every progress sample.
 * All callbacks are invoked on the worker thread.
 */
class DownloadWorker
{
  public:
    enum class Outcome
    {
        Completed,
        Failed,
        Stopped
    };

    struct DownloadWorkerOptions
    {
        std::function<void(DownloadWorker& worker, std::string const& key, Progress::Sample const& sample)>
            progressCallback = [](auto&, auto const&, auto const&) {};
        std::function<void(DownloadWorker& worker, std::string const& key, SharedData::JobError const& error)>
            failureCallback = [](auto&, auto const&, auto const&) {};
        std::function<void(
            DownloadWorker& worker,
            std::string const& key,
            Storage::StatusCode code,
            Storage::FailedItem const& item)>
            folderItemFailedCallback = [](auto&, auto const&, auto, auto const&) {};
        std::function<void(DownloadWorker& worker, std::string const& key, Outcome outcome)> finishedCallback =
            [](auto&, auto const&, auto) {};
    };

    DownloadWorker(std::shared_ptr<Storage::StorageClient> client, DownloadWorkerOptions options);
    ~DownloadWorker();
    DownloadWorker(DownloadWorker const&) = delete;
    DownloadWorker& operator=(DownloadWorker const&) = delete;
    DownloadWorker(DownloadWorker&&) = delete;
    DownloadWorker& operator=(DownloadWorker&&) = delete;

    /**
     * @brief Starts downloading the job. Waits for a previous run of this worker to end first.
     * Does not reset a pending stop request.
     */
    void start(SharedData::DownloadJob job);

    void requestStop();
    void clearStop();
    bool stopRequested() const;

    /// True from start() until the finished callback returned.
    bool isRunning() const;

    void join();

  private:
    Outcome run(SharedData::DownloadJob const& job);
    Outcome classifyResult(SharedData::DownloadJob const& job, Storage::StatusCode code);

  private:
    std::shared_ptr<Storage::StorageClient> client_;
    DownloadWorkerOptions options_;
    std::atomic_bool stopRequested_{false};
    std::atomic_bool running_{false};
    std::mutex threadGuard_{};
    std::thread thread_{};
};
