#include <backend/actions/more_info_action.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

using namespace std::chrono_literals;

MoreInfoAction::MoreInfoAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub)
    : ClientAction{
          "MoreInfoAction",
          std::move(client),
          std::move(hub),
          ActionMessages{
              .timeout = "Network timeout! Please retry later.",
              .timeoutDuration = 6000ms,
          }}
{}

bool MoreInfoAction::details(SharedData::RemoteItem item, bool forShareLink)
{
    return submit([this, item = std::move(item), forShareLink]() mutable {
        message("Requesting, please wait...", 0ms);
        const auto [code, info] = client_->shareInfo(item.id, item.isFile);
        if (code != Storage::StatusCode::Success)
        {
            Log::warn("{}: Details of '{}' declined: {}.", name(), item.name, Storage::describeStatus(code));
            message(
                fmt::format("Could not fetch the details of {}: {}", item.name, Storage::describeStatus(code)),
                4000ms,
                SharedData::MessageLevel::Error);
            return;
        }

        item.password = info.password;
        item.url = info.url;
        item.description = info.description;
        hub_->publish(SharedData::ItemDetailsResolved{.item = std::move(item), .forShareLink = forShareLink});
        message("", 0ms);
    });
}

bool MoreInfoAction::directLink(std::string url, std::string password)
{
    return submit([this, url = std::move(url), password = std::move(password)]() {
        const auto [code, info] = client_->directLinkByUrl(url, password);

        std::string text;
        switch (code)
        {
            case Storage::StatusCode::Success:
                text = info.directUrl.empty() ? "None" : info.directUrl;
                break;
            case Storage::StatusCode::NetworkError:
                text = "Network error! Could not fetch the link";
                break;
            default:
                Log::warn("{}: Direct link of '{}' declined: {}.", name(), url, Storage::describeStatus(code));
                text = "Other error!";
                break;
        }
        hub_->publish(SharedData::DirectLinkResolved{.code = code, .text = std::move(text)});
    });
}
