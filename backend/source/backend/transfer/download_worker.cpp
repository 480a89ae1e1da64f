#include <backend/transfer/download_worker.hpp>
#include <log/log.hpp>
#include <storage/storage_error.hpp>
#include <utility/enum_string_convert.hpp>

DownloadWorker::DownloadWorker(std::shared_ptr<Storage::StorageClient> client, DownloadWorkerOptions options)
    : client_{std::move(client)}
    , options_{std::move(options)}
{}

DownloadWorker::~DownloadWorker()
{
    join();
}

void DownloadWorker::start(SharedData::DownloadJob job)
{
    std::scoped_lock lock{threadGuard_};
    if (thread_.joinable())
        thread_.join();

    running_ = true;
    thread_ = std::thread{[this, job = std::move(job)]() {
        const auto outcome = run(job);
        options_.finishedCallback(*this, job.url, outcome);
        running_ = false;
    }};
}

void DownloadWorker::requestStop()
{
    stopRequested_ = true;
}

void DownloadWorker::clearStop()
{
    stopRequested_ = false;
}

bool DownloadWorker::stopRequested() const
{
    return stopRequested_;
}

bool DownloadWorker::isRunning() const
{
    return running_;
}

void DownloadWorker::join()
{
    std::scoped_lock lock{threadGuard_};
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

DownloadWorker::Outcome DownloadWorker::classifyResult(SharedData::DownloadJob const& job, Storage::StatusCode code)
{
    Log::debug("DownloadWorker: '{}' finished with {}.", job.name, Utility::enumToString(code));

    if (code == Storage::StatusCode::Success)
    {
        options_.progressCallback(*this, job.url, Progress::Sample{.line = {}, .ratePerMille = Progress::completeRate});
        return Outcome::Completed;
    }
    if (stopRequested_ || code == Storage::StatusCode::Aborted)
    {
        Log::info("DownloadWorker: '{}' stopped.", job.name);
        return Outcome::Stopped;
    }

    Log::error("DownloadWorker: '{}' declined: {}.", job.name, Storage::describeStatus(code));
    options_.failureCallback(*this, job.url, SharedData::declinedError(code));
    return Outcome::Failed;
}

DownloadWorker::Outcome DownloadWorker::run(SharedData::DownloadJob const& job)
{
    if (stopRequested_)
        return Outcome::Stopped;

    try
    {
        switch (client_->classifyUrl(job.url))
        {
            case Storage::ResourceKind::File:
            {
                const auto code = client_->downloadFile(
                    job.url, job.password, job.destination, [this, &job](Storage::TransferProgress const& progress) {
                        const auto& name = progress.fileName.empty() ? job.name : progress.fileName;
                        options_.progressCallback(
                            *this, job.url, Progress::compute(name, progress.totalBytes, progress.doneBytes));
                        return !stopRequested_;
                    });
                return classifyResult(job, code);
            }
            case Storage::ResourceKind::Folder:
            {
                const auto code = client_->downloadFolder(
                    job.url,
                    job.password,
                    job.destination,
                    [this, &job](Storage::DirectoryTransferProgress const& progress) {
                        auto sample = Progress::compute(
                            progress.currentFile, progress.fileTotalBytes, progress.fileBytes);
                        sample.ratePerMille = Progress::ratePerMille(progress.bytesTotal, progress.bytesDone);
                        // The directory is complete once the client reports success.
                        if (sample.ratePerMille == Progress::completeRate)
                            sample.ratePerMille = Progress::completeRate - 1;
                        options_.progressCallback(*this, job.url, sample);
                        return !stopRequested_;
                    },
                    [this, &job](Storage::StatusCode code, Storage::FailedItem const& item) {
                        Log::warn(
                            "DownloadWorker: '{}' of '{}' failed: {}.",
                            item.name,
                            job.name,
                            Storage::describeStatus(code));
                        options_.folderItemFailedCallback(*this, job.url, code, item);
                    });
                return classifyResult(job, code);
            }
            case Storage::ResourceKind::Unknown:
            default:
            {
                Log::error("DownloadWorker: '{}' is neither a file nor a folder link.", job.url);
                options_.failureCallback(*this, job.url, SharedData::declinedError(Storage::StatusCode::UrlInvalid));
                return Outcome::Failed;
            }
        }
    }
    catch (Storage::TimeoutError const& e)
    {
        if (stopRequested_)
            return Outcome::Stopped;
        Log::error("DownloadWorker: Timeout while downloading '{}': {}", job.name, e.what());
        options_.failureCallback(*this, job.url, SharedData::timeoutError("Network connection failed"));
    }
    catch (std::exception const& e)
    {
        Log::error("DownloadWorker: Error while downloading '{}': {}", job.name, e.what());
        options_.failureCallback(*this, job.url, SharedData::unexpectedError(e.what()));
    }
    catch (...)
    {
        Log::error("DownloadWorker: Unknown error while downloading '{}'.", job.name);
        options_.failureCallback(*this, job.url, SharedData::unexpectedError("Unknown error"));
    }
    return Outcome::Failed;
}
