#include <backend/actions/rename_mkdir_action.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <thread>

using namespace std::chrono_literals;

RenameMkdirAction::RenameMkdirAction(
    std::shared_ptr<Storage::StorageClient> client,
    std::shared_ptr<EventHub> hub,
    std::chrono::milliseconds mkdirSettleDelay)
    : ClientAction{"RenameMkdirAction", std::move(client), std::move(hub)}
    , mkdirSettleDelay_{mkdirSettleDelay}
{}

bool RenameMkdirAction::makeFolder(
    Storage::ItemId parentId,
    std::string name,
    std::string description,
    std::set<std::string> existingNames)
{
    return submit([this,
                   parentId,
                   folderName = std::move(name),
                   description = std::move(description),
                   existingNames = std::move(existingNames),
                   settleDelay = mkdirSettleDelay_]() {
        if (existingNames.contains(folderName))
        {
            message(fmt::format("Folder already exists: {}", folderName), 7000ms, SharedData::MessageLevel::Warning);
            return;
        }

        const auto code = client_->makeFolder(parentId, folderName, description);
        if (code != Storage::StatusCode::Success)
        {
            Log::warn("{}: Creating '{}' declined: {}.", name(), folderName, Storage::describeStatus(code));
            message(fmt::format("Creating folder failed: {}", folderName), 7000ms, SharedData::MessageLevel::Error);
            return;
        }

        std::this_thread::sleep_for(settleDelay);
        hub_->publish(
            SharedData::FolderContentChanged{.folderId = parentId, .filesChanged = false, .foldersChanged = true});
        message(fmt::format("Folder created: {}", folderName), 4000ms, SharedData::MessageLevel::Success);
    });
}

bool RenameMkdirAction::update(Storage::ItemId folderId, std::vector<SharedData::RemoteItem> items)
{
    if (items.empty())
        return false;

    return submit([this, folderId, items = std::move(items)]() {
        SharedData::FolderContentChanged changed{.folderId = folderId};
        bool failed = false;

        for (auto const& item : items)
        {
            const auto code = item.isFile
                ? client_->setDescription(item.id, item.newDescription, true)
                : client_->setFolderInfo(item.id, item.newName.empty() ? item.name : item.newName, item.newDescription);

            if (code != Storage::StatusCode::Success)
            {
                Log::warn("{}: Changing '{}' declined: {}.", name(), item.name, Storage::describeStatus(code));
                failed = true;
            }
            else if (item.isFile)
                changed.filesChanged = true;
            else
                changed.foldersChanged = true;
        }

        hub_->publish(changed);
        if (failed)
            message("Some changes failed!", 6000ms, SharedData::MessageLevel::Error);
        else
            message("Changes saved!", 4000ms, SharedData::MessageLevel::Success);
    });
}
