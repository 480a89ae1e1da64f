#pragma once

#include <backend/actions/client_action.hpp>
#include <shared_data/jobs.hpp>

#include <string>

class MoreInfoAction : public ClientAction
{
  public:
    MoreInfoAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    /**
     * @brief Completes link, extraction code and description of an own item. Publishes ItemDetailsResolved.
     *
     * @param forShareLink The details are requested to show the share link.
     */
    bool details(SharedData::RemoteItem item, bool forShareLink = false);

    /**
     * @brief Resolves the direct download link of a shared file. Publishes DirectLinkResolved.
     */
    bool directLink(std::string url, std::string password);
};
