#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/job_error.hpp>
#include <storage/entries.hpp>
#include <utility/describe.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace SharedData
{
    /**
     * @brief One requested download, keyed by its share url.
     *
     * Records are values. A state change produces a modified copy that replaces the old record.
     */
    struct DownloadJob
    {
        std::string name{};
        std::string url{};
        std::string password{};
        std::filesystem::path destination{};
        std::optional<JobError> error{std::nullopt};
        bool running{false};
        int rate{0};

        std::string const& key() const
        {
            return url;
        }

        DownloadJob withRunning(bool value) const
        {
            auto copy = *this;
            copy.running = value;
            return copy;
        }
        DownloadJob withRate(int value) const
        {
            auto copy = *this;
            copy.rate = value;
            return copy;
        }
        DownloadJob withError(JobError value) const
        {
            auto copy = *this;
            copy.error = std::move(value);
            copy.running = false;
            return copy;
        }
        /// The same request without any progress or error state.
        DownloadJob fresh() const
        {
            return DownloadJob{.name = name, .url = url, .password = password, .destination = destination};
        }

        bool completed() const
        {
            return rate >= 1000 && !error;
        }
        bool failed() const
        {
            return error.has_value();
        }
    };
    BOOST_DESCRIBE_STRUCT(DownloadJob, (), (name, url, password, destination, error, running, rate))

    /**
     * @brief One requested upload of a local file or directory, keyed by its local path.
     */
    struct UploadJob
    {
        std::filesystem::path path{};
        Storage::ItemId folderId{Storage::rootFolderId};
        std::string folderName{};
        std::optional<JobError> error{std::nullopt};
        bool running{false};
        int rate{0};
        bool applyPassword{false};
        std::string password{};
        bool applyDescription{false};
        std::string description{};

        std::string key() const
        {
            return path.string();
        }

        UploadJob withRunning(bool value) const
        {
            auto copy = *this;
            copy.running = value;
            return copy;
        }
        UploadJob withRate(int value) const
        {
            auto copy = *this;
            copy.rate = value;
            return copy;
        }
        UploadJob withError(JobError value) const
        {
            auto copy = *this;
            copy.error = std::move(value);
            copy.running = false;
            return copy;
        }
        UploadJob fresh() const
        {
            auto copy = *this;
            copy.error = std::nullopt;
            copy.running = false;
            copy.rate = 0;
            return copy;
        }
    };
    BOOST_DESCRIBE_STRUCT(
        UploadJob,
        (),
        (path,
         folderId,
         folderName,
         error,
         running,
         rate,
         applyPassword,
         password,
         applyDescription,
         description))

    /**
     * @brief A file or folder of the logged in account as the display layer knows it, together with the edits the
     * user requested for it.
     */
    struct RemoteItem
    {
        Storage::ItemId id{0};
        std::string name{};
        bool isFile{true};
        std::string size{};
        std::string time{};
        int downloads{0};
        std::string password{};
        std::string url{};
        std::string description{};
        std::string newName{};
        std::string newPassword{};
        std::string newDescription{};
    };
    BOOST_DESCRIBE_STRUCT(
        RemoteItem,
        (),
        (id, name, isFile, size, time, downloads, password, url, description, newName, newPassword, newDescription))
}
