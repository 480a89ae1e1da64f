#pragma once

#include <backend/actions/client_action.hpp>
#include <shared_data/jobs.hpp>

#include <vector>

class RemoveAction : public ClientAction
{
  public:
    RemoveAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    /**
     * @brief Deletes the items one by one. A failing item does not stop the others.
     * Publishes ItemsRemoved.
     */
    bool remove(std::vector<SharedData::RemoteItem> items);
};
