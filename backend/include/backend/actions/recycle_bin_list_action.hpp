#pragma once

#include <backend/actions/client_action.hpp>

class RecycleBinListAction : public ClientAction
{
  public:
    RecycleBinListAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub);

    /// Publishes RecycleBinListed with the deleted folders and the deleted top level files.
    bool list();

    /// Publishes RecycleFolderListed with the files of one deleted folder.
    bool listFolder(Storage::ItemId folderId);
};
