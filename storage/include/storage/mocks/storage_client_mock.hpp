#pragma once

#include <storage/storage_client.hpp>

#include <gmock/gmock.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Storage::Test
{
    class StorageClientMock : public Storage::StorageClient
    {
      public:
        MOCK_METHOD(ResourceKind, classifyUrl, (std::string const& url), (const, override));

        MOCK_METHOD(
            StatusCode,
            downloadFile,
            (std::string const& url,
             std::string const& password,
             std::filesystem::path const& destination,
             ProgressCallback const& onProgress),
            (override));
        MOCK_METHOD(
            StatusCode,
            downloadFolder,
            (std::string const& url,
             std::string const& password,
             std::filesystem::path const& destination,
             DirectoryProgressCallback const& onProgress,
             FailedItemCallback const& onItemFailed),
            (override));
        MOCK_METHOD(
            UploadResult,
            uploadFile,
            (std::filesystem::path const& path, ItemId folderId, ProgressCallback const& onProgress),
            (override));
        MOCK_METHOD(
            StatusCode,
            uploadFolder,
            (std::filesystem::path const& path,
             ItemId folderId,
             DirectoryProgressCallback const& onProgress,
             FailedItemCallback const& onItemFailed),
            (override));

        MOCK_METHOD(StatusCode, login, (std::string const& user, std::string const& password), (override));
        MOCK_METHOD(StatusCode, loginByCookie, (std::string const& cookie), (override));
        MOCK_METHOD(std::string, cookie, (), (const, override));
        MOCK_METHOD(StatusCode, logout, (), (override));

        MOCK_METHOD(
            (std::pair<StatusCode, FileShareInfo>),
            shareInfoByUrl,
            (std::string const& url, std::string const& password),
            (override));
        MOCK_METHOD(
            (std::pair<StatusCode, FolderShareInfo>),
            folderInfoByUrl,
            (std::string const& url, std::string const& password),
            (override));
        MOCK_METHOD(
            (std::pair<StatusCode, DirectLinkInfo>),
            directLinkByUrl,
            (std::string const& url, std::string const& password),
            (override));
        MOCK_METHOD((std::pair<StatusCode, ShareInfo>), shareInfo, (ItemId id, bool isFile), (override));

        MOCK_METHOD(std::vector<RemoteFile>, fileList, (ItemId folderId), (override));
        MOCK_METHOD(FolderListing, folderList, (ItemId folderId), (override));
        MOCK_METHOD((std::map<std::string, ItemId>), moveTargets, (), (override));
        MOCK_METHOD(StatusCode, moveFile, (ItemId fileId, ItemId targetFolderId), (override));
        MOCK_METHOD(StatusCode, moveFolder, (ItemId folderId, ItemId targetFolderId), (override));
        MOCK_METHOD(StatusCode, deleteItem, (ItemId id, bool isFile), (override));
        MOCK_METHOD(
            StatusCode,
            makeFolder,
            (ItemId parentId, std::string const& name, std::string const& description),
            (override));
        MOCK_METHOD(StatusCode, setDescription, (ItemId id, std::string const& description, bool isFile), (override));
        MOCK_METHOD(
            StatusCode,
            setFolderInfo,
            (ItemId id, std::string const& name, std::string const& description),
            (override));
        MOCK_METHOD(StatusCode, setPassword, (ItemId id, std::string const& password, bool isFile), (override));

        MOCK_METHOD(std::vector<RecycleFolder>, recycleFolderList, (), (override));
        MOCK_METHOD(std::vector<RecycleFile>, recycleFileList, (std::optional<ItemId> folderId), (override));
        MOCK_METHOD(
            StatusCode,
            recoverItems,
            (std::vector<ItemId> const& files, std::vector<ItemId> const& folders),
            (override));
        MOCK_METHOD(
            StatusCode,
            purgeItems,
            (std::vector<ItemId> const& files, std::vector<ItemId> const& folders),
            (override));
        MOCK_METHOD(StatusCode, cleanRecycleBin, (), (override));
        MOCK_METHOD(StatusCode, recoverAll, (), (override));
    };
}
