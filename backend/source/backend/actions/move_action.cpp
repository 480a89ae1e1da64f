#include <backend/actions/move_action.hpp>
#include <log/log.hpp>
#include <storage/storage_error.hpp>

#include <fmt/format.h>

#include <thread>

using namespace std::chrono_literals;

MoveAction::MoveAction(
    std::shared_ptr<Storage::StorageClient> client,
    std::shared_ptr<EventHub> hub,
    std::chrono::milliseconds settleDelay)
    : ClientAction{
          "MoveAction",
          std::move(client),
          std::move(hub),
          ActionMessages{
              .timeout = "Network timeout! Please retry later.",
              .timeoutDuration = 6000ms,
          }}
    , settleDelay_{settleDelay}
{}

bool MoveAction::listTargets(std::vector<SharedData::RemoteItem> items)
{
    return submit([this, items = std::move(items)]() mutable {
        message("Requesting, please wait...", 0ms);
        auto targets = client_->moveTargets();
        hub_->publish(SharedData::MoveTargetsListed{.items = std::move(items), .targets = std::move(targets)});
        message("", 0ms);
    });
}

bool MoveAction::move(std::vector<MoveRequest> requests)
{
    if (requests.empty())
        return false;

    return submit([this, requests = std::move(requests), settleDelay = settleDelay_]() {
        SharedData::ItemsMoved moved{};
        bool anyMoved = false;

        for (auto const& request : requests)
        {
            try
            {
                if (request.isFile)
                {
                    if (client_->moveFile(request.id, request.targetFolderId) == Storage::StatusCode::Success)
                    {
                        message(fmt::format("{} moved.", request.name), 3000ms, SharedData::MessageLevel::Success);
                        moved.filesChanged = true;
                        anyMoved = true;
                    }
                    else
                        message(
                            fmt::format("Moving file {} failed!", request.name),
                            4000ms,
                            SharedData::MessageLevel::Error);
                }
                else
                {
                    if (client_->moveFolder(request.id, request.targetFolderId) == Storage::StatusCode::Success)
                    {
                        message(fmt::format("{} moved.", request.name), 3000ms, SharedData::MessageLevel::Success);
                        moved.foldersChanged = true;
                        anyMoved = true;
                    }
                    else
                        message(
                            fmt::format(
                                "Moving folder {} failed! A moved folder must not contain subfolders.", request.name),
                            4000ms,
                            SharedData::MessageLevel::Error);
                }
            }
            catch (Storage::TimeoutError const& e)
            {
                Log::warn("{}: Timeout while moving '{}': {}", name(), request.name, e.what());
                message(
                    fmt::format("Moving {} failed, network timeout! Please retry later.", request.name),
                    5000ms,
                    SharedData::MessageLevel::Error);
            }
            catch (std::exception const& e)
            {
                Log::error("{}: Error while moving '{}': {}", name(), request.name, e.what());
                message(
                    fmt::format("Moving {} failed, unknown error!", request.name),
                    5000ms,
                    SharedData::MessageLevel::Error);
            }
        }

        if (!anyMoved)
            return;

        // Listings lag behind moves.
        std::this_thread::sleep_for(settleDelay);
        hub_->publish(moved);
    });
}
