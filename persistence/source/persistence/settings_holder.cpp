#include <persistence/settings_holder.hpp>
#include <log/log.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <fstream>
#include <stdexcept>

namespace Persistence
{
    SettingsHolder::SettingsHolder(std::filesystem::path path)
        : path_{std::move(path)}
        , settings_{}
    {}

    void SettingsHolder::makeBackup() const
    {
        const auto backupFileName = [this]() {
            const auto now = std::chrono::system_clock::now();
            const auto time = fmt::format("{:%Y-%m-%d_%H-%M-%S}", now);

            return path_.parent_path() / (path_.filename().string() + ".backup_" + time);
        }();

        {
            std::ifstream reader{path_, std::ios_base::binary};
            std::ofstream writer{backupFileName, std::ios_base::binary};

            writer << reader.rdbuf();
        }
        Log::info("Copied settings file to backup: {}", backupFileName.string());
    }

    Utility::Expected<void, std::string> SettingsHolder::load()
    {
        const auto before = [this]() {
            try
            {
                std::ifstream reader{path_, std::ios_base::binary};
                if (!reader.good())
                {
                    Log::warn("Settings file '{}' does not exist, creating it with defaults.", path_.string());
                    return nlohmann::json(nullptr);
                }
                return nlohmann::json::parse(reader, nullptr, true, true);
            }
            catch (std::exception const& e)
            {
                Log::error("Failed to parse settings file: {}", e.what());
                makeBackup();
                return nlohmann::json(nullptr);
            }
        }();

        settings_ = Settings{};
        if (!before.is_null())
        {
            try
            {
                before.get_to(settings_);
            }
            catch (std::exception const& e)
            {
                Log::error("Settings file contains invalid values, using defaults: {}", e.what());
                makeBackup();
                settings_ = Settings{};
            }
        }

        try
        {
            dataFixer(before.is_null() ? nlohmann::json::object() : before);
        }
        catch (std::exception const& e)
        {
            return Utility::Unexpected<std::string>{fmt::format("Failed to write settings file: {}", e.what())};
        }
        return {};
    }

    void SettingsHolder::dataFixer(nlohmann::json const& before)
    {
        settings_.useDefaultsFrom(Settings::defaults());

        const auto after = nlohmann::json(settings_);
        const auto diff = nlohmann::json::diff(before, after);
        if (!diff.empty())
        {
            Log::warn("Settings diff: {}", diff.dump());
            Log::warn("Settings file misses some defaults, writing them back to disk.");
            save();
        }
    }

    void SettingsHolder::save() const
    {
        try
        {
            if (path_.has_parent_path() && !std::filesystem::exists(path_.parent_path()))
                std::filesystem::create_directories(path_.parent_path());

            std::ofstream writer{path_, std::ios_base::binary};
            if (!writer.good())
                throw std::runtime_error(fmt::format("Cannot open '{}' for writing", path_.string()));
            writer << nlohmann::json(settings_).dump(4);
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to save settings file: {}", e.what());
            throw;
        }
    }

    Settings& SettingsHolder::settings()
    {
        return settings_;
    }
    Settings const& SettingsHolder::settings() const
    {
        return settings_;
    }
    std::filesystem::path const& SettingsHolder::path() const
    {
        return path_;
    }
}
