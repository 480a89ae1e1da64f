#include <utility/temporary_directory.hpp>

#include <fmt/format.h>

#include <random>
#include <stdexcept>
#include <system_error>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::string const& prefix)
        : m_path{}
    {
        std::random_device device;
        std::mt19937_64 rng{device()};

        const auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt != 100; ++attempt)
        {
            auto candidate = base / fmt::format("{}_{:016x}", prefix, rng());
            std::error_code ec;
            if (std::filesystem::create_directory(candidate, ec) && !ec)
            {
                m_path = std::move(candidate);
                return;
            }
        }
        throw std::runtime_error(fmt::format("Could not setup temporary directory below: {}", base.string()));
    }
    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
