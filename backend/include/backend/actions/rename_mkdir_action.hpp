#pragma once

#include <backend/actions/client_action.hpp>
#include <shared_data/jobs.hpp>

#include <chrono>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Creates folders, renames folders and changes descriptions.
 */
class RenameMkdirAction : public ClientAction
{
  public:
    /**
     * @param mkdirSettleDelay Wait after creating a folder until it shows up in listings.
     */
    RenameMkdirAction(
        std::shared_ptr<Storage::StorageClient> client,
        std::shared_ptr<EventHub> hub,
        std::chrono::milliseconds mkdirSettleDelay);

    /**
     * @param existingNames Folder names already present in the parent. A duplicate is refused without asking
     * the remote.
     */
    bool makeFolder(
        Storage::ItemId parentId,
        std::string name,
        std::string description,
        std::set<std::string> existingNames = {});

    /**
     * @brief Applies newDescription to files and newName and newDescription to folders.
     * Publishes FolderContentChanged.
     */
    bool update(Storage::ItemId folderId, std::vector<SharedData::RemoteItem> items);

  private:
    std::chrono::milliseconds mkdirSettleDelay_;
};
