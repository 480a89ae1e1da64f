#pragma once

#include <backend/actions/client_action.hpp>
#include <shared_data/events.hpp>

/**
 * @brief Reads the content of a remote folder. Publishes DirectoryListed with name sorted maps.
 */
class ListRefreshAction : public ClientAction
{
  public:
    ListRefreshAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    bool refresh(SharedData::ListRequest request);
};
