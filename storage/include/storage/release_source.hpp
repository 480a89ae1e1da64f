#pragma once

#include <optional>
#include <string>

namespace Storage
{
    struct ReleaseInfo
    {
        std::string tag{};
        std::string notes{};
    };

    /// Somewhere the latest published release can be looked up.
    class ReleaseSource
    {
      public:
        virtual ~ReleaseSource() = default;

        virtual std::string name() const = 0;

        /**
         * @brief Fetches the newest release. Returns nullopt when the source has none or could not be read.
         * May throw like StorageClient calls do.
         */
        virtual std::optional<ReleaseInfo> latestRelease() = 0;
    };
}
