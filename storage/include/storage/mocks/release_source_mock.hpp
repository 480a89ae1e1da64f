#pragma once

#include <storage/release_source.hpp>

#include <gmock/gmock.h>

#include <optional>
#include <string>

namespace Storage::Test
{
    class ReleaseSourceMock : public Storage::ReleaseSource
    {
      public:
        MOCK_METHOD(std::string, name, (), (const, override));
        MOCK_METHOD(std::optional<ReleaseInfo>, latestRelease, (), (override));
    };
}
