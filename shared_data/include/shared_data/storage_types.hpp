#pragma once

#include <shared_data/shared_data.hpp>
#include <storage/entries.hpp>
#include <storage/status_code.hpp>
#include <storage/transfer_progress.hpp>

#include <nlohmann/json.hpp>

namespace Storage
{
    BOOST_DESCRIBE_STRUCT(RemoteFile, (), (id, name, time, size, type, downloads, hasPassword, hasDescription))
    BOOST_DESCRIBE_STRUCT(RemoteFolder, (), (id, name, hasPassword, description))
    BOOST_DESCRIBE_STRUCT(ShareInfo, (), (name, url, password, description))
    BOOST_DESCRIBE_STRUCT(FileShareInfo, (), (name, size, type, time, description, password, url, directUrl))
    BOOST_DESCRIBE_STRUCT(SharedFile, (), (name, time, size, type, url, password))
    BOOST_DESCRIBE_STRUCT(FolderShareInfo, (), (name, time, size, description, url, password, files))
    BOOST_DESCRIBE_STRUCT(DirectLinkInfo, (), (name, size, directUrl))
    BOOST_DESCRIBE_STRUCT(FolderPathEntry, (), (id, name))
    BOOST_DESCRIBE_STRUCT(RecycleFile, (), (id, name, time, size, type))
    BOOST_DESCRIBE_STRUCT(RecycleFolder, (), (id, name, time, size, files))
    BOOST_DESCRIBE_STRUCT(FailedItem, (), (name, url))

    inline void to_json(nlohmann::json& j, StatusCode const& code)
    {
        SharedData::to_json(j, code);
    }
    inline void from_json(nlohmann::json const& j, StatusCode& code)
    {
        SharedData::from_json(j, code);
    }

#define COURIER_STORAGE_JSON(Type) \
    inline void to_json(nlohmann::json& j, Type const& value) \
    { \
        SharedData::to_json(j, value); \
    } \
    inline void from_json(nlohmann::json const& j, Type& value) \
    { \
        SharedData::from_json(j, value); \
    }

    COURIER_STORAGE_JSON(RemoteFile)
    COURIER_STORAGE_JSON(RemoteFolder)
    COURIER_STORAGE_JSON(ShareInfo)
    COURIER_STORAGE_JSON(FileShareInfo)
    COURIER_STORAGE_JSON(SharedFile)
    COURIER_STORAGE_JSON(FolderShareInfo)
    COURIER_STORAGE_JSON(DirectLinkInfo)
    COURIER_STORAGE_JSON(FolderPathEntry)
    COURIER_STORAGE_JSON(RecycleFile)
    COURIER_STORAGE_JSON(RecycleFolder)
    COURIER_STORAGE_JSON(FailedItem)

#undef COURIER_STORAGE_JSON
}
