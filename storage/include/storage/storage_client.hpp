#pragma once

#include <storage/entries.hpp>
#include <storage/status_code.hpp>
#include <storage/transfer_progress.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Storage
{
    struct UploadResult
    {
        StatusCode code{StatusCode::Failed};
        ItemId id{0};
        bool isFile{true};
    };

    /**
     * @brief The remote storage account. All calls block until the remote answered.
     *
     * Every call may throw TimeoutError when the remote does not answer in time or any other std::exception
     * for unstructured failures. Implementations must be callable from multiple threads.
     */
    class StorageClient
    {
      public:
        virtual ~StorageClient() = default;

        virtual ResourceKind classifyUrl(std::string const& url) const = 0;

        // Transfers
        virtual StatusCode downloadFile(
            std::string const& url,
            std::string const& password,
            std::filesystem::path const& destination,
            ProgressCallback const& onProgress) = 0;
        virtual StatusCode downloadFolder(
            std::string const& url,
            std::string const& password,
            std::filesystem::path const& destination,
            DirectoryProgressCallback const& onProgress,
            FailedItemCallback const& onItemFailed) = 0;
        virtual UploadResult
        uploadFile(std::filesystem::path const& path, ItemId folderId, ProgressCallback const& onProgress) = 0;
        virtual StatusCode uploadFolder(
            std::filesystem::path const& path,
            ItemId folderId,
            DirectoryProgressCallback const& onProgress,
            FailedItemCallback const& onItemFailed) = 0;

        // Account
        virtual StatusCode login(std::string const& user, std::string const& password) = 0;
        virtual StatusCode loginByCookie(std::string const& cookie) = 0;
        virtual std::string cookie() const = 0;
        virtual StatusCode logout() = 0;

        // Share links
        virtual std::pair<StatusCode, FileShareInfo>
        shareInfoByUrl(std::string const& url, std::string const& password) = 0;
        virtual std::pair<StatusCode, FolderShareInfo>
        folderInfoByUrl(std::string const& url, std::string const& password) = 0;
        virtual std::pair<StatusCode, DirectLinkInfo>
        directLinkByUrl(std::string const& url, std::string const& password) = 0;
        virtual std::pair<StatusCode, ShareInfo> shareInfo(ItemId id, bool isFile) = 0;

        // Listing and organizing
        virtual std::vector<RemoteFile> fileList(ItemId folderId) = 0;
        virtual FolderListing folderList(ItemId folderId) = 0;
        virtual std::map<std::string, ItemId> moveTargets() = 0;
        virtual StatusCode moveFile(ItemId fileId, ItemId targetFolderId) = 0;
        virtual StatusCode moveFolder(ItemId folderId, ItemId targetFolderId) = 0;
        virtual StatusCode deleteItem(ItemId id, bool isFile) = 0;
        virtual StatusCode makeFolder(ItemId parentId, std::string const& name, std::string const& description) = 0;
        virtual StatusCode setDescription(ItemId id, std::string const& description, bool isFile) = 0;
        virtual StatusCode setFolderInfo(ItemId id, std::string const& name, std::string const& description) = 0;
        virtual StatusCode setPassword(ItemId id, std::string const& password, bool isFile) = 0;

        // Recycle bin
        virtual std::vector<RecycleFolder> recycleFolderList() = 0;
        virtual std::vector<RecycleFile> recycleFileList(std::optional<ItemId> folderId) = 0;
        virtual StatusCode recoverItems(std::vector<ItemId> const& files, std::vector<ItemId> const& folders) = 0;
        virtual StatusCode purgeItems(std::vector<ItemId> const& files, std::vector<ItemId> const& folders) = 0;
        virtual StatusCode cleanRecycleBin() = 0;
        virtual StatusCode recoverAll() = 0;
    };
}
