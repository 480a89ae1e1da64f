#pragma once

#include <persistence/settings/settings.hpp>
#include <utility/expected.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace Persistence
{
    /**
     * @brief Owns the settings file on disk.
     */
    class SettingsHolder
    {
      public:
        explicit SettingsHolder(std::filesystem::path path);

        /**
         * @brief Reads the settings file. A missing file is created with defaults, an unreadable one is backed up
         * and replaced with defaults. Missing values are filled with defaults and written back.
         *
         * @return An error only when the completed settings could not be written.
         */
        Utility::Expected<void, std::string> load();

        /**
         * @brief Writes the settings as pretty printed JSON. Throws on failure.
         */
        void save() const;

        Settings& settings();
        Settings const& settings() const;
        std::filesystem::path const& path() const;

      private:
        void makeBackup() const;
        void dataFixer(nlohmann::json const& before);

      private:
        std::filesystem::path path_;
        Settings settings_;
    };
}
