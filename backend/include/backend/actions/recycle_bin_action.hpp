#pragma once

#include <backend/actions/client_action.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Restores or purges items of the recycle bin. Publishes RecycleBinChanged after the settle delay
 * on success.
 */
class RecycleBinAction : public ClientAction
{
  public:
    RecycleBinAction(
        std::shared_ptr<Storage::StorageClient> client,
        std::shared_ptr<EventHub> hub,
        std::chrono::milliseconds settleDelay);

    /// Does nothing when both lists are empty.
    bool recover(std::vector<Storage::ItemId> files, std::vector<Storage::ItemId> folders);
    /// Does nothing when both lists are empty.
    bool purge(std::vector<Storage::ItemId> files, std::vector<Storage::ItemId> folders);
    bool clean();
    bool recoverAll();

  private:
    bool manipulate(std::function<Storage::StatusCode()> call, std::string successText);

  private:
    std::chrono::milliseconds settleDelay_;
};
