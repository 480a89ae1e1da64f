#pragma once

#include <backend/actions/client_action.hpp>
#include <shared_data/jobs.hpp>

#include <filesystem>
#include <vector>

/**
 * @brief Fetches link, extraction code and description of own items, either to show them or to download them.
 */
class ShareDetailsAction : public ClientAction
{
  public:
    ShareDetailsAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    /**
     * @brief Items with an id of 0 are passed on as they are.
     *
     * @param download Publish DownloadJobsResolved with one job per link instead of ShareDetailsResolved.
     * @param destination The directory the download jobs save to.
     */
    bool fetch(std::vector<SharedData::RemoteItem> items, bool download, std::filesystem::path destination = {});
};
