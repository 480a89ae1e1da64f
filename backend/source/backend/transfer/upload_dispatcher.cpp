#include <backend/transfer/upload_dispatcher.hpp>
#include <backend/progress/progress_reporter.hpp>
#include <log/log.hpp>
#include <shared_data/job_error.hpp>
#include <storage/storage_error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <utility>

using namespace std::chrono_literals;

UploadDispatcher::UploadDispatcher(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : client_{std::move(client)}
    , hub_{std::move(hub)}
    , mutex_{}
    , pending_{}
    , jobs_{}
    , current_{std::nullopt}
    , currentRemoved_{false}
    , loopRunning_{false}
    , shuttingDown_{false}
    , loopThread_{}
{}

UploadDispatcher::~UploadDispatcher()
{
    {
        std::scoped_lock lock{mutex_};
        shuttingDown_ = true;
        pending_.clear();
    }
    if (loopThread_.joinable())
        loopThread_.join();
}

bool UploadDispatcher::isQueued(std::string const& key) const
{
    return (current_ && *current_ == key) || std::any_of(pending_.begin(), pending_.end(), [&key](auto const& job) {
               return job.key() == key;
           });
}

void UploadDispatcher::add(SharedData::UploadJob job)
{
    addMany({std::move(job)});
}

void UploadDispatcher::addMany(std::vector<SharedData::UploadJob> jobs)
{
    std::map<std::string, SharedData::UploadJob> snapshot;
    {
        std::scoped_lock lock{mutex_};
        if (shuttingDown_)
            return;

        bool added = false;
        for (auto& job : jobs)
        {
            const auto key = job.key();
            if (key.empty() || isQueued(key))
            {
                Log::debug("UploadDispatcher: '{}' is already queued.", key);
                continue;
            }
            Log::info("UploadDispatcher: Queueing '{}'.", key);
            auto fresh = job.fresh();
            jobs_[key] = fresh;
            pending_.push_back(std::move(fresh));
            added = true;
        }
        if (!added)
            return;

        ensureLoopRunning();
        snapshot = jobs_;
    }
    publishSnapshot(std::move(snapshot));
}

bool UploadDispatcher::remove(std::string const& key)
{
    std::map<std::string, SharedData::UploadJob> snapshot;
    {
        std::scoped_lock lock{mutex_};
        if (jobs_.erase(key) == 0)
            return false;

        std::erase_if(pending_, [&key](auto const& job) {
            return job.key() == key;
        });
        if (current_ && *current_ == key)
            currentRemoved_ = true;
        Log::info("UploadDispatcher: Removed '{}'.", key);
        snapshot = jobs_;
    }
    publishSnapshot(std::move(snapshot));
    return true;
}

std::size_t UploadDispatcher::pendingCount() const
{
    std::scoped_lock lock{mutex_};
    return pending_.size();
}

std::map<std::string, SharedData::UploadJob> UploadDispatcher::snapshot() const
{
    std::scoped_lock lock{mutex_};
    return jobs_;
}

std::optional<SharedData::UploadJob> UploadDispatcher::job(std::string const& key) const
{
    std::scoped_lock lock{mutex_};
    if (const auto iter = jobs_.find(key); iter != jobs_.end())
        return iter->second;
    return std::nullopt;
}

bool UploadDispatcher::idle() const
{
    std::scoped_lock lock{mutex_};
    return pending_.empty() && !current_ && !loopRunning_;
}

void UploadDispatcher::ensureLoopRunning()
{
    if (loopRunning_ || shuttingDown_)
        return;

    if (loopThread_.joinable())
        loopThread_.join();

    loopRunning_ = true;
    loopThread_ = std::thread{[this]() {
        uploadLoop();
    }};
}

void UploadDispatcher::uploadLoop()
{
    Log::debug("UploadDispatcher: Upload loop started.");
    while (true)
    {
        SharedData::UploadJob job;
        std::map<std::string, SharedData::UploadJob> snapshot;
        {
            std::scoped_lock lock{mutex_};
            current_ = std::nullopt;
            currentRemoved_ = false;
            if (shuttingDown_ || pending_.empty())
            {
                loopRunning_ = false;
                Log::debug("UploadDispatcher: Upload loop ended.");
                return;
            }

            job = std::move(pending_.front());
            pending_.pop_front();
            current_ = job.key();
            auto& record = jobs_[job.key()];
            record = record.withRunning(true);
            job = record;
            snapshot = jobs_;
        }
        publishSnapshot(std::move(snapshot));

        process(job);

        update(job.key(), [](auto const& record) {
            return record.withRunning(false);
        });
    }
}

void UploadDispatcher::process(SharedData::UploadJob const& job)
{
    std::error_code ec;
    const auto exists = std::filesystem::exists(job.path, ec);
    if (!exists || ec)
    {
        Log::error("UploadDispatcher: '{}' does not exist.", job.path.string());
        hub_->message(
            fmt::format("ERROR: File does not exist: {}", job.path.string()), 3100ms, SharedData::MessageLevel::Error);
        update(job.key(), [&job](auto const& record) {
            return record.withError(SharedData::notFoundError(fmt::format("No such file: {}", job.path.string())));
        });
        return;
    }

    try
    {
        if (std::filesystem::is_directory(job.path, ec))
            uploadDirectory(job);
        else
            uploadFile(job);
    }
    catch (Storage::TimeoutError const& e)
    {
        Log::error("UploadDispatcher: Timeout while uploading '{}': {}", job.path.string(), e.what());
        hub_->message("ERROR: Network timeout, please retry!", 3100ms, SharedData::MessageLevel::Error);
        update(job.key(), [](auto const& record) {
            return record.withError(SharedData::timeoutError("Network timeout"));
        });
    }
    catch (std::exception const& e)
    {
        Log::error("UploadDispatcher: Error while uploading '{}': {}", job.path.string(), e.what());
        update(job.key(), [&e](auto const& record) {
            return record.withError(SharedData::unexpectedError(e.what()));
        });
    }
    catch (...)
    {
        Log::error("UploadDispatcher: Unknown error while uploading '{}'.", job.path.string());
        update(job.key(), [](auto const& record) {
            return record.withError(SharedData::unexpectedError("Unknown error"));
        });
    }
}

void UploadDispatcher::uploadDirectory(SharedData::UploadJob const& job)
{
    const auto key = job.key();
    hub_->message(fmt::format("INFO: Uploading directory: {}", key), 30000ms);

    const auto code = client_->uploadFolder(
        job.path,
        job.folderId,
        [this, &key](Storage::DirectoryTransferProgress const& progress) {
            auto sample = Progress::compute(progress.currentFile, progress.fileTotalBytes, progress.fileBytes);
            return reportProgress(
                key,
                sample.line,
                std::min(Progress::ratePerMille(progress.bytesTotal, progress.bytesDone), Progress::completeRate - 1));
        },
        [this, &key](Storage::StatusCode code, Storage::FailedItem const& item) {
            Log::warn("UploadDispatcher: '{}' of '{}' failed: {}.", item.name, key, Storage::describeStatus(code));
            hub_->publish(
                SharedData::FolderItemFailed{.jobKey = key, .code = code, .itemName = item.name, .itemUrl = item.url});
            hub_->message(
                fmt::format("File upload failed, reason: {}, file: {}", Storage::describeStatus(code), item.name),
                0ms,
                SharedData::MessageLevel::Warning);
        });

    if (code == Storage::StatusCode::Success)
    {
        update(key, [](auto const& record) {
            return record.withRate(Progress::completeRate);
        });
        return;
    }
    if (code == Storage::StatusCode::Aborted)
    {
        Log::info("UploadDispatcher: Upload of '{}' aborted.", key);
        return;
    }
    Log::error("UploadDispatcher: Upload of '{}' declined: {}.", key, Storage::describeStatus(code));
    update(key, [code](auto const& record) {
        return record.withError(SharedData::declinedError(code));
    });
}

void UploadDispatcher::uploadFile(SharedData::UploadJob const& job)
{
    const auto key = job.key();
    hub_->message(fmt::format("INFO: Uploading file: {}", key), 20000ms);

    const auto result = client_->uploadFile(job.path, job.folderId, [this, &key](auto const& progress) {
        auto sample = Progress::compute(progress.fileName, progress.totalBytes, progress.doneBytes);
        return reportProgress(key, sample.line, sample.ratePerMille);
    });

    if (result.code == Storage::StatusCode::Aborted)
    {
        Log::info("UploadDispatcher: Upload of '{}' aborted.", key);
        return;
    }
    if (result.code != Storage::StatusCode::Success)
    {
        Log::error("UploadDispatcher: Upload of '{}' declined: {}.", key, Storage::describeStatus(result.code));
        update(key, [code = result.code](auto const& record) {
            return record.withError(SharedData::declinedError(code));
        });
        return;
    }

    applyDirectives(job, result);
    update(key, [](auto const& record) {
        return record.withRate(Progress::completeRate);
    });
}

void UploadDispatcher::applyDirectives(SharedData::UploadJob const& job, Storage::UploadResult const& result)
{
    const auto apply = [this, &job](std::string_view what, auto&& call) {
        try
        {
            const auto code = call();
            if (code != Storage::StatusCode::Success)
            {
                Log::warn(
                    "UploadDispatcher: Setting the {} of '{}' failed: {}.",
                    what,
                    job.path.string(),
                    Storage::describeStatus(code));
                hub_->message(
                    fmt::format(
                        "Uploaded {}, but setting the {} failed: {}",
                        job.path.filename().string(),
                        what,
                        Storage::describeStatus(code)),
                    4000ms,
                    SharedData::MessageLevel::Warning);
            }
        }
        catch (std::exception const& e)
        {
            Log::warn("UploadDispatcher: Setting the {} of '{}' failed: {}", what, job.path.string(), e.what());
            hub_->message(
                fmt::format("Uploaded {}, but setting the {} failed.", job.path.filename().string(), what),
                4000ms,
                SharedData::MessageLevel::Warning);
        }
    };

    if (job.applyPassword)
    {
        apply("password", [&]() {
            return client_->setPassword(result.id, job.password, result.isFile);
        });
    }
    if (job.applyDescription)
    {
        apply("description", [&]() {
            return client_->setDescription(result.id, job.description, result.isFile);
        });
    }
}

bool UploadDispatcher::reportProgress(std::string const& key, std::string const& line, int ratePerMille)
{
    std::map<std::string, SharedData::UploadJob> snapshot;
    int rate = 0;
    {
        std::scoped_lock lock{mutex_};
        if (currentRemoved_ || shuttingDown_)
            return false;

        auto& record = jobs_[key];
        record = record.withRate(std::max(record.rate, ratePerMille));
        rate = record.rate;
        snapshot = jobs_;
    }
    hub_->publish(SharedData::JobProgress{.key = key, .text = line, .ratePerMille = rate});
    publishSnapshot(std::move(snapshot));
    hub_->message(line, 0ms);
    return true;
}

void UploadDispatcher::update(
    std::string const& key,
    std::function<SharedData::UploadJob(SharedData::UploadJob const&)> const& change)
{
    std::map<std::string, SharedData::UploadJob> snapshot;
    {
        std::scoped_lock lock{mutex_};
        const auto iter = jobs_.find(key);
        // Removed meanwhile.
        if (iter == jobs_.end() || (current_ && *current_ == key && currentRemoved_))
            return;
        iter->second = change(iter->second);
        snapshot = jobs_;
    }
    publishSnapshot(std::move(snapshot));
}

void UploadDispatcher::publishSnapshot(std::map<std::string, SharedData::UploadJob> snapshot) const
{
    hub_->publish(SharedData::UploadSnapshot{.jobs = std::move(snapshot)});
}
