#include <backend/actions/set_password_action.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace std::chrono_literals;

namespace
{
    constexpr std::size_t minimumPasswordLength = 2;
    constexpr std::size_t maximumFilePasswordLength = 6;
    constexpr std::size_t maximumFolderPasswordLength = 12;

    /// Number of code points in UTF-8 text.
    std::size_t characterCount(std::string const& text)
    {
        return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }
}

SetPasswordAction::SetPasswordAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : ClientAction{"SetPasswordAction", std::move(client), std::move(hub)}
{}

std::optional<std::string> SetPasswordAction::validate(SharedData::RemoteItem const& item)
{
    const auto length = characterCount(item.newPassword);
    if (length == 0)
        return std::nullopt;

    if (item.isFile && (length < minimumPasswordLength || length > maximumFilePasswordLength))
        return "File extraction codes have 2 to 6 characters, leave empty to disable!";
    if (!item.isFile && (length < minimumPasswordLength || length > maximumFolderPasswordLength))
        return "Folder extraction codes have 2 to 12 characters, leave empty to disable!";
    return std::nullopt;
}

bool SetPasswordAction::apply(std::vector<SharedData::RemoteItem> items, Storage::ItemId folderId)
{
    if (items.empty())
        return false;

    return submit([this, items = std::move(items), folderId]() {
        for (auto const& item : items)
        {
            if (const auto complaint = validate(item); complaint)
            {
                Log::info("{}: Refused password of '{}'.", name(), item.name);
                message(*complaint, 4000ms, SharedData::MessageLevel::Warning);
                return;
            }
        }

        SharedData::FolderContentChanged changed{.folderId = folderId};
        std::optional<Storage::StatusCode> lastFailure;
        for (auto const& item : items)
        {
            if (item.isFile)
                changed.filesChanged = true;
            else
                changed.foldersChanged = true;

            const auto code = client_->setPassword(item.id, item.newPassword, item.isFile);
            if (code != Storage::StatusCode::Success)
            {
                Log::warn(
                    "{}: Setting the password of '{}' declined: {}.", name(), item.name, Storage::describeStatus(code));
                lastFailure = code;
            }
        }

        if (lastFailure)
            message(
                fmt::format(
                    "Some extraction codes could not be changed: {}. Avoid special characters!",
                    Storage::describeStatus(*lastFailure)),
                4000ms,
                SharedData::MessageLevel::Error);
        else
            message("Extraction codes changed!", 3000ms, SharedData::MessageLevel::Success);
        hub_->publish(changed);
    });
}
