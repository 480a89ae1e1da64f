#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Storage
{
    using ItemId = std::int64_t;

    /// Id of the account's root folder.
    constexpr ItemId rootFolderId = -1;

    enum class ResourceKind
    {
        File,
        Folder,
        Unknown
    };

    struct RemoteFile
    {
        ItemId id{0};
        std::string name{};
        std::string time{};
        std::string size{};
        std::string type{};
        int downloads{0};
        bool hasPassword{false};
        bool hasDescription{false};
    };

    struct RemoteFolder
    {
        ItemId id{0};
        std::string name{};
        bool hasPassword{false};
        std::string description{};
    };

    /// Share data of one own file or folder.
    struct ShareInfo
    {
        std::string name{};
        std::string url{};
        std::string password{};
        std::string description{};
    };

    /// Result of resolving a share link of a file.
    struct FileShareInfo
    {
        std::string name{};
        std::string size{};
        std::string type{};
        std::string time{};
        std::string description{};
        std::string password{};
        std::string url{};
        std::string directUrl{};
    };

    struct SharedFile
    {
        std::string name{};
        std::string time{};
        std::string size{};
        std::string type{};
        std::string url{};
        std::string password{};
    };

    /// Result of resolving a share link of a folder.
    struct FolderShareInfo
    {
        std::string name{};
        std::string time{};
        std::string size{};
        std::string description{};
        std::string url{};
        std::string password{};
        std::vector<SharedFile> files{};
    };

    struct DirectLinkInfo
    {
        std::string name{};
        std::string size{};
        std::string directUrl{};
    };

    struct FolderPathEntry
    {
        ItemId id{0};
        std::string name{};
    };

    struct FolderListing
    {
        std::vector<RemoteFolder> folders{};
        std::vector<FolderPathEntry> path{};
    };

    struct RecycleFile
    {
        ItemId id{0};
        std::string name{};
        std::string time{};
        std::string size{};
        std::string type{};
    };

    struct RecycleFolder
    {
        ItemId id{0};
        std::string name{};
        std::string time{};
        std::string size{};
        std::vector<RecycleFile> files{};
    };
}
