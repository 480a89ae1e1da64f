#include <backend/actions/list_refresh_action.hpp>
#include <log/log.hpp>

using namespace std::chrono_literals;

ListRefreshAction::ListRefreshAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : ClientAction{
          "ListRefreshAction",
          std::move(client),
          std::move(hub),
          ActionMessages{
              .busy = "Refreshing the directory, please retry later.",
              .busyDuration = 3100ms,
              .timeout = "Network timeout, could not refresh the directory, please retry later.",
              .timeoutDuration = 7000ms,
              .failure = "Unknown error, could not refresh the directory, please retry later.",
              .failureDuration = 7000ms,
          }}
{}

bool ListRefreshAction::refresh(SharedData::ListRequest request)
{
    return submit([this, request]() {
        SharedData::DirectoryListed listed{.request = request};

        if (request.files)
        {
            std::map<std::string, Storage::RemoteFile> files;
            for (auto& file : client_->fileList(request.folderId))
                files.insert_or_assign(file.name, std::move(file));
            listed.files = std::move(files);
        }
        if (request.folders)
        {
            auto listing = client_->folderList(request.folderId);
            std::map<std::string, Storage::RemoteFolder> folders;
            for (auto& folder : listing.folders)
                folders.insert_or_assign(folder.name, std::move(folder));
            listed.folders = std::move(folders);
            if (request.path)
                listed.path = std::move(listing.path);
        }

        Log::debug("{}: Listed folder {}.", name(), request.folderId);
        hub_->publish(listed);
    });
}
