#include <backend/actions/share_details_action.hpp>
#include <log/log.hpp>

#include <algorithm>

using namespace std::chrono_literals;

ShareDetailsAction::ShareDetailsAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : ClientAction{"ShareDetailsAction", std::move(client), std::move(hub)}
{}

bool ShareDetailsAction::fetch(
    std::vector<SharedData::RemoteItem> items,
    bool download,
    std::filesystem::path destination)
{
    if (items.empty())
        return false;

    return submit([this, items = std::move(items), download, destination = std::move(destination)]() mutable {
        std::vector<SharedData::RemoteItem> resolved;
        std::vector<SharedData::DownloadJob> jobs;

        for (auto& item : items)
        {
            if (item.id != 0)
            {
                const auto [code, info] = client_->shareInfo(item.id, item.isFile);
                if (code == Storage::StatusCode::Success)
                {
                    item.password = info.password;
                    item.url = info.url;
                    item.description = info.description;
                }
                else if (code == Storage::StatusCode::NetworkError)
                {
                    Log::warn("{}: Network error while fetching '{}'.", name(), item.name);
                    message("Network error, please retry later!", 6000ms, SharedData::MessageLevel::Error);
                    continue;
                }
                else
                    Log::warn("{}: Fetching '{}' declined: {}.", name(), item.name, Storage::describeStatus(code));
            }

            if (download && !item.url.empty() &&
                std::none_of(jobs.begin(), jobs.end(), [&item](auto const& job) {
                    return job.url == item.url;
                }))
            {
                jobs.push_back(SharedData::DownloadJob{
                    .name = item.name,
                    .url = item.url,
                    .password = item.password,
                    .destination = destination,
                });
            }
            resolved.push_back(std::move(item));
        }

        if (download)
            hub_->publish(SharedData::DownloadJobsResolved{.jobs = std::move(jobs)});
        else
            hub_->publish(SharedData::ShareDetailsResolved{.items = std::move(resolved)});
    });
}
