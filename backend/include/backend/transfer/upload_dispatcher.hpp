#pragma once

#include <backend/event_hub.hpp>
#include <shared_data/jobs.hpp>
#include <storage/storage_client.hpp>

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Uploads queued local files and directories one after another on a single background thread.
 *
 * Jobs are keyed by their local path. A failing job records its error and the next job is processed.
 */
class UploadDispatcher
{
  public:
    UploadDispatcher(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);
    ~UploadDispatcher();
    UploadDispatcher(UploadDispatcher const&) = delete;
    UploadDispatcher& operator=(UploadDispatcher const&) = delete;
    UploadDispatcher(UploadDispatcher&&) = delete;
    UploadDispatcher& operator=(UploadDispatcher&&) = delete;

    /**
     * @brief Queues a job unless a job for the same path is queued or being uploaded.
     * Finished jobs for the same path are replaced.
     */
    void add(SharedData::UploadJob job);
    void addMany(std::vector<SharedData::UploadJob> jobs);

    /**
     * @brief Forgets a job. A running upload of it is aborted at its next progress report.
     */
    bool remove(std::string const& key);

    std::size_t pendingCount() const;
    std::map<std::string, SharedData::UploadJob> snapshot() const;
    std::optional<SharedData::UploadJob> job(std::string const& key) const;
    bool idle() const;

  private:
    bool isQueued(std::string const& key) const;
    void ensureLoopRunning();
    void uploadLoop();
    void process(SharedData::UploadJob const& job);
    void uploadDirectory(SharedData::UploadJob const& job);
    void uploadFile(SharedData::UploadJob const& job);
    void applyDirectives(SharedData::UploadJob const& job, Storage::UploadResult const& result);
    bool reportProgress(std::string const& key, std::string const& line, int ratePerMille);
    void update(
        std::string const& key,
        std::function<SharedData::UploadJob(SharedData::UploadJob const&)> const& change);
    void publishSnapshot(std::map<std::string, SharedData::UploadJob> snapshot) const;

  private:
    std::shared_ptr<Storage::StorageClient> client_;
    std::shared_ptr<EventHub> hub_;

    mutable std::mutex mutex_;
    std::deque<SharedData::UploadJob> pending_;
    std::map<std::string, SharedData::UploadJob> jobs_;
    std::optional<std::string> current_;
    bool currentRemoved_;
    bool loopRunning_;
    bool shuttingDown_;
    std::thread loopThread_;
};
