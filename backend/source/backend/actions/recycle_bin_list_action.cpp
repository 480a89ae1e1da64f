#include <backend/actions/recycle_bin_list_action.hpp>
#include <log/log.hpp>

using namespace std::chrono_literals;

RecycleBinListAction::RecycleBinListAction(
    std::shared_ptr<Storage::StorageClient> client,
    std::shared_ptr<EventHub> hub)
    : ClientAction{"RecycleBinListAction", std::move(client), std::move(hub)}
{}

bool RecycleBinListAction::list()
{
    return submit([this]() {
        auto folders = client_->recycleFolderList();
        auto files = client_->recycleFileList(std::nullopt);
        Log::debug("{}: {} folders and {} files in the recycle bin.", name(), folders.size(), files.size());
        hub_->publish(SharedData::RecycleBinListed{.folders = std::move(folders), .files = std::move(files)});
        message("Recycle bin refreshed!", 2000ms, SharedData::MessageLevel::Success);
    });
}

bool RecycleBinListAction::listFolder(Storage::ItemId folderId)
{
    return submit([this, folderId]() {
        hub_->publish(
            SharedData::RecycleFolderListed{.folderId = folderId, .files = client_->recycleFileList(folderId)});
    });
}
