#pragma once

#include <storage/status_code.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace Storage
{
    struct TransferProgress
    {
        std::string fileName{};
        std::uint64_t totalBytes{0};
        std::uint64_t doneBytes{0};
    };

    /// Progress of a directory transfer. The byte counters cover the whole directory.
    struct DirectoryTransferProgress
    {
        std::string currentFile{};
        int fileIndex{0};
        int fileCount{0};
        std::uint64_t fileBytes{0};
        std::uint64_t fileTotalBytes{0};
        std::uint64_t bytesDone{0};
        std::uint64_t bytesTotal{0};
    };

    /// One entry of a directory transfer that could not be transferred.
    struct FailedItem
    {
        std::string name{};
        std::string url{};
    };

    /**
     * Called between chunks. Returning false asks the client to abort the transfer,
     * in which case the call returns StatusCode::Aborted.
     */
    using ProgressCallback = std::function<bool(TransferProgress const&)>;
    using DirectoryProgressCallback = std::function<bool(DirectoryTransferProgress const&)>;
    using FailedItemCallback = std::function<void(StatusCode, FailedItem const&)>;
}
