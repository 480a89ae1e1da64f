#pragma once

#include <backend/event_hub.hpp>
#include <backend/transfer/download_worker.hpp>
#include <shared_data/jobs.hpp>
#include <storage/storage_client.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Runs download jobs on a bounded number of workers.
 *
 * Jobs are keyed by their url. A dispatch loop thread runs while jobs are pending and starts a worker per job
 * while fewer than concurrency() workers are active. Every state change republishes the snapshot of all jobs.
 * Finished jobs stay in the snapshot until they are removed.
 */
class DownloadDispatcher
{
  public:
    struct DownloadDispatcherOptions
    {
        int concurrency{3};
        std::chrono::milliseconds pollInterval{1000};
    };

    DownloadDispatcher(
        std::shared_ptr<Storage::StorageClient> client,
        std::shared_ptr<EventHub> hub,
        DownloadDispatcherOptions options);
    ~DownloadDispatcher();
    DownloadDispatcher(DownloadDispatcher const&) = delete;
    DownloadDispatcher& operator=(DownloadDispatcher const&) = delete;
    DownloadDispatcher(DownloadDispatcher&&) = delete;
    DownloadDispatcher& operator=(DownloadDispatcher&&) = delete;

    /**
     * @brief Queues a job. Ignored if a job with the same url is pending or running.
     */
    void add(SharedData::DownloadJob job);
    void addMany(std::vector<SharedData::DownloadJob> jobs);

    /**
     * @brief Queues a job that is not running, or revokes a stop request that was not honored yet.
     */
    void start(SharedData::DownloadJob const& job);

    /**
     * @brief Asks the worker of a job to stop, or takes the job out of the queue if it was not dispatched yet.
     */
    void stop(std::string const& url);

    /**
     * @brief Forgets a job. A running worker is asked to stop and its reports are ignored from now on.
     *
     * @return true if the job was known.
     */
    bool remove(std::string const& url);

    /**
     * @brief Changes the number of parallel workers for jobs dispatched from now on. Values below 1 count as 1.
     */
    void setConcurrency(int concurrency);
    int concurrency() const;

    int inFlight() const;
    std::size_t pendingCount() const;
    std::map<std::string, SharedData::DownloadJob> snapshot() const;
    std::optional<SharedData::DownloadJob> job(std::string const& url) const;

    /// Nothing pending, nothing running.
    bool idle() const;

  private:
    struct WorkerSlot
    {
        std::shared_ptr<DownloadWorker> worker{};
        bool active{false};
        bool restartOnStop{false};
    };

    std::shared_ptr<DownloadWorker> makeWorker();
    bool isPending(std::string const& url) const;
    bool isActive(std::string const& url) const;
    std::deque<SharedData::DownloadJob>::iterator nextDispatchable();
    void enqueue(SharedData::DownloadJob job);
    void ensureLoopRunning();
    void dispatchLoop();
    std::vector<std::shared_ptr<DownloadWorker>> takeFinishedRetired();
    std::optional<std::string> aggregateStatus(std::string const& line);
    void publishSnapshot(std::map<std::string, SharedData::DownloadJob> snapshot) const;

    void onProgress(DownloadWorker& worker, std::string const& url, Progress::Sample const& sample);
    void onFailure(DownloadWorker& worker, std::string const& url, SharedData::JobError const& error);
    void onFolderItemFailed(
        DownloadWorker& worker,
        std::string const& url,
        Storage::StatusCode code,
        Storage::FailedItem const& item);
    void onFinished(DownloadWorker& worker, std::string const& url, DownloadWorker::Outcome outcome);

  private:
    std::shared_ptr<Storage::StorageClient> client_;
    std::shared_ptr<EventHub> hub_;

    mutable std::mutex mutex_;
    std::condition_variable slotFreed_;
    std::deque<SharedData::DownloadJob> pending_;
    std::map<std::string, SharedData::DownloadJob> jobs_;
    std::map<std::string, WorkerSlot> workers_;
    std::vector<std::shared_ptr<DownloadWorker>> retired_;
    // Removed jobs whose worker has not returned from the client yet.
    std::map<std::string, DownloadWorker const*> draining_;
    int inFlight_;
    int concurrency_;
    std::chrono::milliseconds pollInterval_;
    bool loopRunning_;
    bool shuttingDown_;
    std::string lastStatus_;
    std::thread loopThread_;
};
