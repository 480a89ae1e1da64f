#include <backend/actions/remove_action.hpp>
#include <log/log.hpp>
#include <storage/storage_error.hpp>

#include <fmt/format.h>

using namespace std::chrono_literals;

RemoveAction::RemoveAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : ClientAction{
          "RemoveAction",
          std::move(client),
          std::move(hub),
          ActionMessages{
              .busy = "Deleting is still running in the background!",
              .busyDuration = 3100ms,
          }}
{}

bool RemoveAction::remove(std::vector<SharedData::RemoteItem> items)
{
    if (items.empty())
        return false;

    return submit([this, items = std::move(items)]() {
        SharedData::ItemsRemoved result{};
        for (auto const& item : items)
        {
            try
            {
                if (const auto code = client_->deleteItem(item.id, item.isFile); code != Storage::StatusCode::Success)
                {
                    Log::warn("{}: Deleting '{}' declined: {}.", name(), item.name, Storage::describeStatus(code));
                    ++result.failed;
                    continue;
                }
                ++result.removed;
            }
            catch (Storage::TimeoutError const& e)
            {
                Log::warn("{}: Timeout while deleting '{}': {}", name(), item.name, e.what());
                message(
                    fmt::format("Deleting {} failed because of a network timeout!", item.name),
                    3000ms,
                    SharedData::MessageLevel::Error);
                ++result.failed;
            }
            catch (std::exception const& e)
            {
                Log::error("{}: Error while deleting '{}': {}", name(), item.name, e.what());
                ++result.failed;
            }
        }
        hub_->publish(result);
    });
}
