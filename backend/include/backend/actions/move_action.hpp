#pragma once

#include <backend/actions/client_action.hpp>
#include <shared_data/jobs.hpp>

#include <chrono>
#include <string>
#include <vector>

class MoveAction : public ClientAction
{
  public:
    struct MoveRequest
    {
        Storage::ItemId id{0};
        Storage::ItemId targetFolderId{Storage::rootFolderId};
        std::string name{};
        bool isFile{true};
    };

    /**
     * @param settleDelay Wait after a successful move before ItemsMoved is published.
     */
    MoveAction(
        std::shared_ptr<Storage::StorageClient> client,
        std::shared_ptr<EventHub> hub,
        std::chrono::milliseconds settleDelay);

    /**
     * @brief Reads all folders the items can be moved to. Publishes MoveTargetsListed.
     */
    bool listTargets(std::vector<SharedData::RemoteItem> items);

    /**
     * @brief Moves the items one by one. Publishes ItemsMoved if at least one move succeeded.
     */
    bool move(std::vector<MoveRequest> requests);

  private:
    std::chrono::milliseconds settleDelay_;
};
