#include <backend/transfer/download_dispatcher.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

DownloadDispatcher::DownloadDispatcher(
    std::shared_ptr<Storage::StorageClient> client,
    std::shared_ptr<EventHub> hub,
    DownloadDispatcherOptions options)
    : client_{std::move(client)}
    , hub_{std::move(hub)}
    , mutex_{}
    , slotFreed_{}
    , pending_{}
    , jobs_{}
    , workers_{}
    , retired_{}
    , draining_{}
    , inFlight_{0}
    , concurrency_{std::max(1, options.concurrency)}
    , pollInterval_{options.pollInterval}
    , loopRunning_{false}
    , shuttingDown_{false}
    , lastStatus_{}
    , loopThread_{}
{}

DownloadDispatcher::~DownloadDispatcher()
{
    std::vector<std::shared_ptr<DownloadWorker>> workers;
    {
        std::scoped_lock lock{mutex_};
        shuttingDown_ = true;
        pending_.clear();
        for (auto& [url, slot] : workers_)
        {
            if (slot.active)
                slot.worker->requestStop();
            if (slot.worker)
                workers.push_back(slot.worker);
        }
        for (auto& worker : retired_)
        {
            worker->requestStop();
            workers.push_back(worker);
        }
    }
    slotFreed_.notify_all();

    if (loopThread_.joinable())
        loopThread_.join();
    for (auto& worker : workers)
        worker->join();
}

std::shared_ptr<DownloadWorker> DownloadDispatcher::makeWorker()
{
    return std::make_shared<DownloadWorker>(
        client_,
        DownloadWorker::DownloadWorkerOptions{
            .progressCallback =
                [this](DownloadWorker& worker, std::string const& url, Progress::Sample const& sample) {
                    onProgress(worker, url, sample);
                },
            .failureCallback =
                [this](DownloadWorker& worker, std::string const& url, SharedData::JobError const& error) {
                    onFailure(worker, url, error);
                },
            .folderItemFailedCallback =
                [this](
                    DownloadWorker& worker,
                    std::string const& url,
                    Storage::StatusCode code,
                    Storage::FailedItem const& item) {
                    onFolderItemFailed(worker, url, code, item);
                },
            .finishedCallback =
                [this](DownloadWorker& worker, std::string const& url, DownloadWorker::Outcome outcome) {
                    onFinished(worker, url, outcome);
                },
        });
}

bool DownloadDispatcher::isPending(std::string const& url) const
{
    return std::any_of(pending_.begin(), pending_.end(), [&url](auto const& job) {
        return job.url == url;
    });
}

bool DownloadDispatcher::isActive(std::string const& url) const
{
    const auto iter = workers_.find(url);
    return iter != workers_.end() && iter->second.active;
}

std::deque<SharedData::DownloadJob>::iterator DownloadDispatcher::nextDispatchable()
{
    return std::find_if(pending_.begin(), pending_.end(), [this](auto const& job) {
        return !draining_.contains(job.url);
    });
}

void DownloadDispatcher::enqueue(SharedData::DownloadJob job)
{
    auto fresh = job.fresh();
    jobs_[fresh.url] = fresh;
    pending_.push_back(std::move(fresh));
}

void DownloadDispatcher::add(SharedData::DownloadJob job)
{
    addMany({std::move(job)});
}

void DownloadDispatcher::addMany(std::vector<SharedData::DownloadJob> jobs)
{
    std::map<std::string, SharedData::DownloadJob> snapshot;
    {
        std::scoped_lock lock{mutex_};
        if (shuttingDown_)
            return;

        bool added = false;
        for (auto& job : jobs)
        {
            if (job.url.empty() || isPending(job.url) || isActive(job.url))
            {
                Log::debug("DownloadDispatcher: '{}' is already queued.", job.url);
                continue;
            }
            Log::info("DownloadDispatcher: Queueing '{}'.", job.name);
            enqueue(std::move(job));
            added = true;
        }
        if (!added)
            return;

        ensureLoopRunning();
        snapshot = jobs_;
    }
    publishSnapshot(std::move(snapshot));
}

void DownloadDispatcher::start(SharedData::DownloadJob const& job)
{
    std::map<std::string, SharedData::DownloadJob> snapshot;
    {
        std::scoped_lock lock{mutex_};
        if (shuttingDown_ || isPending(job.url))
            return;

        const auto slot = workers_.find(job.url);
        if (slot == workers_.end() || !slot->second.active)
        {
            Log::info("DownloadDispatcher: Restarting '{}'.", job.name);
            const auto known = jobs_.find(job.url);
            enqueue(known != jobs_.end() ? known->second : job);
            ensureLoopRunning();
        }
        else
        {
            // The worker may not have seen the stop request yet.
            slot->second.worker->clearStop();
            slot->second.restartOnStop = true;
            auto& record = jobs_[job.url];
            record = record.withRunning(true);
        }
        snapshot = jobs_;
    }
    publishSnapshot(std::move(snapshot));
}

void DownloadDispatcher::stop(std::string const& url)
{
    std::map<std::string, SharedData::DownloadJob> snapshot;
    {
        std::scoped_lock lock{mutex_};
        const auto record = jobs_.find(url);
        if (record == jobs_.end())
            return;

        if (const auto slot = workers_.find(url); slot != workers_.end() && slot->second.active)
        {
            Log::info("DownloadDispatcher: Stopping '{}'.", record->second.name);
            slot->second.worker->requestStop();
            slot->second.restartOnStop = false;
        }
        else if (isPending(url))
        {
            Log::info("DownloadDispatcher: Unqueueing '{}'.", record->second.name);
            std::erase_if(pending_, [&url](auto const& job) {
                return job.url == url;
            });
        }
        else
            return;

        record->second = record->second.withRunning(false);
        snapshot = jobs_;
    }
    publishSnapshot(std::move(snapshot));
}

bool DownloadDispatcher::remove(std::string const& url)
{
    std::map<std::string, SharedData::DownloadJob> snapshot;
    {
        std::scoped_lock lock{mutex_};
        if (jobs_.erase(url) == 0)
            return false;

        std::erase_if(pending_, [&url](auto const& job) {
            return job.url == url;
        });
        if (const auto slot = workers_.find(url); slot != workers_.end())
        {
            if (slot->second.worker)
            {
                if (slot->second.active)
                {
                    slot->second.worker->requestStop();
                    draining_[url] = slot->second.worker.get();
                }
                retired_.push_back(slot->second.worker);
            }
            workers_.erase(slot);
        }
        Log::info("DownloadDispatcher: Removed '{}'.", url);
        snapshot = jobs_;
    }
    publishSnapshot(std::move(snapshot));
    return true;
}

void DownloadDispatcher::setConcurrency(int concurrency)
{
    {
        std::scoped_lock lock{mutex_};
        concurrency_ = std::max(1, concurrency);
        Log::info("DownloadDispatcher: Concurrency set to {}.", concurrency_);
    }
    slotFreed_.notify_all();
}

int DownloadDispatcher::concurrency() const
{
    std::scoped_lock lock{mutex_};
    return concurrency_;
}

int DownloadDispatcher::inFlight() const
{
    std::scoped_lock lock{mutex_};
    return inFlight_;
}

std::size_t DownloadDispatcher::pendingCount() const
{
    std::scoped_lock lock{mutex_};
    return pending_.size();
}

std::map<std::string, SharedData::DownloadJob> DownloadDispatcher::snapshot() const
{
    std::scoped_lock lock{mutex_};
    return jobs_;
}

std::optional<SharedData::DownloadJob> DownloadDispatcher::job(std::string const& url) const
{
    std::scoped_lock lock{mutex_};
    if (const auto iter = jobs_.find(url); iter != jobs_.end())
        return iter->second;
    return std::nullopt;
}

bool DownloadDispatcher::idle() const
{
    std::scoped_lock lock{mutex_};
    return pending_.empty() && inFlight_ == 0 && !loopRunning_;
}

void DownloadDispatcher::ensureLoopRunning()
{
    if (loopRunning_ || shuttingDown_)
        return;

    // A previous loop has left its loop body already.
    if (loopThread_.joinable())
        loopThread_.join();

    loopRunning_ = true;
    loopThread_ = std::thread{[this]() {
        dispatchLoop();
    }};
}

std::vector<std::shared_ptr<DownloadWorker>> DownloadDispatcher::takeFinishedRetired()
{
    std::vector<std::shared_ptr<DownloadWorker>> finished;
    std::erase_if(retired_, [&finished](auto const& worker) {
        if (worker->isRunning())
            return false;
        finished.push_back(worker);
        return true;
    });
    return finished;
}

void DownloadDispatcher::dispatchLoop()
{
    Log::debug("DownloadDispatcher: Dispatch loop started.");
    while (true)
    {
        SharedData::DownloadJob job;
        std::shared_ptr<DownloadWorker> worker;
        std::vector<std::shared_ptr<DownloadWorker>> reaped;
        std::map<std::string, SharedData::DownloadJob> snapshot;
        {
            std::unique_lock lock{mutex_};
            auto next = nextDispatchable();
            while (!shuttingDown_ && !pending_.empty() && (inFlight_ >= concurrency_ || next == pending_.end()))
            {
                slotFreed_.wait_for(lock, pollInterval_);
                next = nextDispatchable();
            }

            if (shuttingDown_ || pending_.empty())
            {
                loopRunning_ = false;
                Log::debug("DownloadDispatcher: Dispatch loop ended.");
                return;
            }

            job = std::move(*next);
            pending_.erase(next);
            ++inFlight_;

            auto& slot = workers_[job.url];
            if (slot.worker)
                retired_.push_back(slot.worker);
            slot.worker = makeWorker();
            slot.active = true;
            slot.restartOnStop = false;
            worker = slot.worker;

            auto& record = jobs_[job.url];
            record = record.withRunning(true);
            job = record;
            snapshot = jobs_;
            reaped = takeFinishedRetired();
        }

        for (auto& old : reaped)
            old->join();

        publishSnapshot(std::move(snapshot));
        hub_->message(fmt::format("Preparing download: {}", job.name), std::chrono::milliseconds{8000});

        try
        {
            worker->start(job);
        }
        catch (std::exception const& e)
        {
            Log::error("DownloadDispatcher: Could not start worker for '{}': {}", job.name, e.what());
            {
                std::scoped_lock lock{mutex_};
                --inFlight_;
                if (const auto slot = workers_.find(job.url); slot != workers_.end() && slot->second.worker == worker)
                {
                    slot->second.active = false;
                    auto& record = jobs_[job.url];
                    record = record.withError(SharedData::unexpectedError(e.what()));
                }
                snapshot = jobs_;
            }
            publishSnapshot(std::move(snapshot));
        }
    }
}

std::optional<std::string> DownloadDispatcher::aggregateStatus(std::string const& line)
{
    std::string status = inFlight_ > 1 ? fmt::format("{} download tasks are running", inFlight_) : line;
    if (status.empty() || status == lastStatus_)
        return std::nullopt;
    lastStatus_ = status;
    return status;
}

void DownloadDispatcher::publishSnapshot(std::map<std::string, SharedData::DownloadJob> snapshot) const
{
    hub_->publish(SharedData::DownloadSnapshot{.jobs = std::move(snapshot)});
}

void DownloadDispatcher::onProgress(DownloadWorker& worker, std::string const& url, Progress::Sample const& sample)
{
    std::map<std::string, SharedData::DownloadJob> snapshot;
    std::optional<std::string> status;
    int rate = 0;
    {
        std::scoped_lock lock{mutex_};
        const auto slot = workers_.find(url);
        if (slot == workers_.end() || slot->second.worker.get() != &worker)
            return;

        auto& record = jobs_[url];
        record = record.withRate(std::max(record.rate, sample.ratePerMille));
        rate = record.rate;
        snapshot = jobs_;
        status = aggregateStatus(sample.line);
    }

    hub_->publish(SharedData::JobProgress{.key = url, .text = sample.line, .ratePerMille = rate});
    publishSnapshot(std::move(snapshot));
    if (status)
        hub_->message(std::move(*status), std::chrono::milliseconds{0});
}

void DownloadDispatcher::onFailure(DownloadWorker& worker, std::string const& url, SharedData::JobError const& error)
{
    std::map<std::string, SharedData::DownloadJob> snapshot;
    std::string name;
    {
        std::scoped_lock lock{mutex_};
        const auto slot = workers_.find(url);
        if (slot == workers_.end() || slot->second.worker.get() != &worker)
            return;

        auto& record = jobs_[url];
        record = record.withError(error);
        name = record.name;
        snapshot = jobs_;
    }

    publishSnapshot(std::move(snapshot));
    hub_->message(
        fmt::format("Download of {} failed: {}", name, error.message),
        std::chrono::milliseconds{6000},
        SharedData::MessageLevel::Error);
}

void DownloadDispatcher::onFolderItemFailed(
    DownloadWorker& worker,
    std::string const& url,
    Storage::StatusCode code,
    Storage::FailedItem const& item)
{
    {
        std::scoped_lock lock{mutex_};
        const auto slot = workers_.find(url);
        if (slot == workers_.end() || slot->second.worker.get() != &worker)
            return;
    }

    hub_->publish(
        SharedData::FolderItemFailed{.jobKey = url, .code = code, .itemName = item.name, .itemUrl = item.url});
    hub_->message(
        fmt::format(
            "File download failed, reason: {}, file: {}, URL: {}", Storage::describeStatus(code), item.name, item.url),
        std::chrono::milliseconds{0},
        SharedData::MessageLevel::Warning);
}

void DownloadDispatcher::onFinished(DownloadWorker& worker, std::string const& url, DownloadWorker::Outcome outcome)
{
    std::map<std::string, SharedData::DownloadJob> snapshot;
    bool changed = false;
    {
        std::scoped_lock lock{mutex_};
        --inFlight_;
        if (const auto draining = draining_.find(url); draining != draining_.end() && draining->second == &worker)
            draining_.erase(draining);

        const auto slot = workers_.find(url);
        if (slot != workers_.end() && slot->second.worker.get() == &worker)
        {
            slot->second.active = false;
            auto& record = jobs_[url];
            switch (outcome)
            {
                case DownloadWorker::Outcome::Completed:
                    record = record.withRate(Progress::completeRate).withRunning(false);
                    break;
                case DownloadWorker::Outcome::Stopped:
                    if (slot->second.restartOnStop && !shuttingDown_)
                    {
                        Log::info("DownloadDispatcher: '{}' stopped, but was restarted meanwhile.", record.name);
                        enqueue(record);
                        ensureLoopRunning();
                    }
                    else
                        record = record.withRunning(false);
                    break;
                case DownloadWorker::Outcome::Failed:
                default:
                    record = record.withRunning(false);
                    break;
            }
            slot->second.restartOnStop = false;
            snapshot = jobs_;
            changed = true;
        }
    }
    slotFreed_.notify_all();

    if (changed)
        publishSnapshot(std::move(snapshot));
}
