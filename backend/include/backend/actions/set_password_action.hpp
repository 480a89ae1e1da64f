#pragma once

#include <backend/actions/client_action.hpp>
#include <shared_data/jobs.hpp>

#include <optional>
#include <string>
#include <vector>

class SetPasswordAction : public ClientAction
{
  public:
    SetPasswordAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    /**
     * @brief Checks the newPassword of an item, counted in UTF-8 characters. An empty one removes the password.
     *
     * @return The complaint about an invalid password.
     */
    static std::optional<std::string> validate(SharedData::RemoteItem const& item);

    /**
     * @brief Sets newPassword on all items. Nothing is changed if any password is invalid.
     * Publishes FolderContentChanged for the folder.
     */
    bool apply(std::vector<SharedData::RemoteItem> items, Storage::ItemId folderId);
};
