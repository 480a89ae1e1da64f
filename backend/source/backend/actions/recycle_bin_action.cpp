#include <backend/actions/recycle_bin_action.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <thread>

using namespace std::chrono_literals;

RecycleBinAction::RecycleBinAction(
    std::shared_ptr<Storage::StorageClient> client,
    std::shared_ptr<EventHub> hub,
    std::chrono::milliseconds settleDelay)
    : ClientAction{"RecycleBinAction", std::move(client), std::move(hub)}
    , settleDelay_{settleDelay}
{}

bool RecycleBinAction::recover(std::vector<Storage::ItemId> files, std::vector<Storage::ItemId> folders)
{
    if (files.empty() && folders.empty())
        return false;

    return manipulate(
        [this, files = std::move(files), folders = std::move(folders)]() {
            return client_->recoverItems(files, folders);
        },
        "Selected items restored, refreshing the list.");
}

bool RecycleBinAction::purge(std::vector<Storage::ItemId> files, std::vector<Storage::ItemId> folders)
{
    if (files.empty() && folders.empty())
        return false;

    return manipulate(
        [this, files = std::move(files), folders = std::move(folders)]() {
            return client_->purgeItems(files, folders);
        },
        "Selected items deleted permanently, refreshing the list.");
}

bool RecycleBinAction::clean()
{
    return manipulate(
        [this]() {
            return client_->cleanRecycleBin();
        },
        "Recycle bin emptied, refreshing the list.");
}

bool RecycleBinAction::recoverAll()
{
    return manipulate(
        [this]() {
            return client_->recoverAll();
        },
        "All items restored, refreshing the list.");
}

bool RecycleBinAction::manipulate(std::function<Storage::StatusCode()> call, std::string successText)
{
    return submit(
        [this, call = std::move(call), successText = std::move(successText), settleDelay = settleDelay_]() {
            const auto code = call();
            switch (code)
            {
                case Storage::StatusCode::Success:
                    break;
                case Storage::StatusCode::Failed:
                    message("Failed, please retry!", 4500ms, SharedData::MessageLevel::Error);
                    return;
                case Storage::StatusCode::NetworkError:
                    message("Network error, please retry later!", 4500ms, SharedData::MessageLevel::Error);
                    return;
                default:
                    Log::warn("{}: Declined: {}.", name(), Storage::describeStatus(code));
                    message(
                        fmt::format("Failed: {}", Storage::describeStatus(code)),
                        4500ms,
                        SharedData::MessageLevel::Error);
                    return;
            }

            message(successText, 2500ms, SharedData::MessageLevel::Success);
            std::this_thread::sleep_for(settleDelay);
            hub_->publish(SharedData::RecycleBinChanged{});
        });
}
