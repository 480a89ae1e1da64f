#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/duration.hpp>
#include <shared_data/jobs.hpp>
#include <shared_data/storage_types.hpp>
#include <storage/entries.hpp>
#include <utility/describe.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(MessageLevel, Info, Success, Warning, Error);

    inline void to_json(nlohmann::json& j, MessageLevel const& level)
    {
        j = Utility::enumToString<MessageLevel>(level);
    }
    inline void from_json(nlohmann::json const& j, MessageLevel& level)
    {
        level = Utility::enumFromString<MessageLevel>(j.template get<std::string>());
    }

    /// A one shot message for the status line. A duration of 0 keeps it until the next message.
    struct StatusMessage
    {
        static constexpr std::string_view eventName = "StatusMessage";
        std::string text{};
        std::chrono::milliseconds duration{0};
        MessageLevel level{MessageLevel::Info};
    };
    BOOST_DESCRIBE_STRUCT(StatusMessage, (), (text, duration, level))

    struct JobProgress
    {
        static constexpr std::string_view eventName = "JobProgress";
        std::string key{};
        std::string text{};
        int ratePerMille{0};
    };
    BOOST_DESCRIBE_STRUCT(JobProgress, (), (key, text, ratePerMille))

    struct DownloadSnapshot
    {
        static constexpr std::string_view eventName = "DownloadSnapshot";
        std::map<std::string, DownloadJob> jobs{};
    };
    BOOST_DESCRIBE_STRUCT(DownloadSnapshot, (), (jobs))

    struct UploadSnapshot
    {
        static constexpr std::string_view eventName = "UploadSnapshot";
        std::map<std::string, UploadJob> jobs{};
    };
    BOOST_DESCRIBE_STRUCT(UploadSnapshot, (), (jobs))

    /// One entry of a directory transfer failed, the transfer itself goes on.
    struct FolderItemFailed
    {
        static constexpr std::string_view eventName = "FolderItemFailed";
        std::string jobKey{};
        Storage::StatusCode code{Storage::StatusCode::Failed};
        std::string itemName{};
        std::string itemUrl{};
    };
    BOOST_DESCRIBE_STRUCT(FolderItemFailed, (), (jobKey, code, itemName, itemUrl))

    struct LoginFinished
    {
        static constexpr std::string_view eventName = "LoginFinished";
        bool success{false};
        bool byCookie{false};
        std::string username{};
        std::optional<std::string> cookie{std::nullopt};
    };
    BOOST_DESCRIBE_STRUCT(LoginFinished, (), (success, byCookie, username, cookie))

    struct LoggedOut
    {
        static constexpr std::string_view eventName = "LoggedOut";
    };
    BOOST_DESCRIBE_STRUCT(LoggedOut, (), ())

    struct ShareLookupStarted
    {
        static constexpr std::string_view eventName = "ShareLookupStarted";
        std::string url{};
    };
    BOOST_DESCRIBE_STRUCT(ShareLookupStarted, (), (url))

    struct FileShareResolved
    {
        static constexpr std::string_view eventName = "FileShareResolved";
        Storage::StatusCode code{Storage::StatusCode::Failed};
        Storage::FileShareInfo info{};
    };
    BOOST_DESCRIBE_STRUCT(FileShareResolved, (), (code, info))

    struct FolderShareResolved
    {
        static constexpr std::string_view eventName = "FolderShareResolved";
        Storage::StatusCode code{Storage::StatusCode::Failed};
        Storage::FolderShareInfo info{};
    };
    BOOST_DESCRIBE_STRUCT(FolderShareResolved, (), (code, info))

    struct DownloadJobsResolved
    {
        static constexpr std::string_view eventName = "DownloadJobsResolved";
        std::vector<DownloadJob> jobs{};
    };
    BOOST_DESCRIBE_STRUCT(DownloadJobsResolved, (), (jobs))

    struct ShareDetailsResolved
    {
        static constexpr std::string_view eventName = "ShareDetailsResolved";
        std::vector<RemoteItem> items{};
    };
    BOOST_DESCRIBE_STRUCT(ShareDetailsResolved, (), (items))

    struct ListRequest
    {
        Storage::ItemId folderId{Storage::rootFolderId};
        bool files{true};
        bool folders{true};
        bool path{true};
    };
    BOOST_DESCRIBE_STRUCT(ListRequest, (), (folderId, files, folders, path))

    /// Listing of one folder. Only the parts named in the request are filled.
    struct DirectoryListed
    {
        static constexpr std::string_view eventName = "DirectoryListed";
        ListRequest request{};
        std::optional<std::map<std::string, Storage::RemoteFile>> files{std::nullopt};
        std::optional<std::map<std::string, Storage::RemoteFolder>> folders{std::nullopt};
        std::optional<std::vector<Storage::FolderPathEntry>> path{std::nullopt};
    };
    BOOST_DESCRIBE_STRUCT(DirectoryListed, (), (request, files, folders, path))

    struct ItemsRemoved
    {
        static constexpr std::string_view eventName = "ItemsRemoved";
        int removed{0};
        int failed{0};
    };
    BOOST_DESCRIBE_STRUCT(ItemsRemoved, (), (removed, failed))

    struct ItemDetailsResolved
    {
        static constexpr std::string_view eventName = "ItemDetailsResolved";
        RemoteItem item{};
        bool forShareLink{false};
    };
    BOOST_DESCRIBE_STRUCT(ItemDetailsResolved, (), (item, forShareLink))

    struct DirectLinkResolved
    {
        static constexpr std::string_view eventName = "DirectLinkResolved";
        Storage::StatusCode code{Storage::StatusCode::Failed};
        std::string text{};
    };
    BOOST_DESCRIBE_STRUCT(DirectLinkResolved, (), (code, text))

    struct MoveTargetsListed
    {
        static constexpr std::string_view eventName = "MoveTargetsListed";
        std::vector<RemoteItem> items{};
        std::map<std::string, Storage::ItemId> targets{};
    };
    BOOST_DESCRIBE_STRUCT(MoveTargetsListed, (), (items, targets))

    struct ItemsMoved
    {
        static constexpr std::string_view eventName = "ItemsMoved";
        bool filesChanged{false};
        bool foldersChanged{false};
    };
    BOOST_DESCRIBE_STRUCT(ItemsMoved, (), (filesChanged, foldersChanged))

    struct FolderContentChanged
    {
        static constexpr std::string_view eventName = "FolderContentChanged";
        Storage::ItemId folderId{Storage::rootFolderId};
        bool filesChanged{false};
        bool foldersChanged{false};
    };
    BOOST_DESCRIBE_STRUCT(FolderContentChanged, (), (folderId, filesChanged, foldersChanged))

    struct RecycleBinListed
    {
        static constexpr std::string_view eventName = "RecycleBinListed";
        std::vector<Storage::RecycleFolder> folders{};
        std::vector<Storage::RecycleFile> files{};
    };
    BOOST_DESCRIBE_STRUCT(RecycleBinListed, (), (folders, files))

    struct RecycleFolderListed
    {
        static constexpr std::string_view eventName = "RecycleFolderListed";
        Storage::ItemId folderId{0};
        std::vector<Storage::RecycleFile> files{};
    };
    BOOST_DESCRIBE_STRUCT(RecycleFolderListed, (), (folderId, files))

    struct RecycleBinChanged
    {
        static constexpr std::string_view eventName = "RecycleBinChanged";
    };
    BOOST_DESCRIBE_STRUCT(RecycleBinChanged, (), ())

    struct UpdateCheckFinished
    {
        static constexpr std::string_view eventName = "UpdateCheckFinished";
        std::string tag{};
        std::string notes{};
        bool updateAvailable{false};
        bool background{false};
    };
    BOOST_DESCRIBE_STRUCT(UpdateCheckFinished, (), (tag, notes, updateAvailable, background))

    using Event = std::variant<
        StatusMessage,
        JobProgress,
        DownloadSnapshot,
        UploadSnapshot,
        FolderItemFailed,
        LoginFinished,
        LoggedOut,
        ShareLookupStarted,
        FileShareResolved,
        FolderShareResolved,
        DownloadJobsResolved,
        ShareDetailsResolved,
        DirectoryListed,
        ItemsRemoved,
        ItemDetailsResolved,
        DirectLinkResolved,
        MoveTargetsListed,
        ItemsMoved,
        FolderContentChanged,
        RecycleBinListed,
        RecycleFolderListed,
        RecycleBinChanged,
        UpdateCheckFinished>;

    std::string_view eventName(Event const& event);

    /**
     * @brief Serializes an event as {"event": <name>, "data": <payload>}.
     */
    void to_json(nlohmann::json& j, Event const& event);
}
