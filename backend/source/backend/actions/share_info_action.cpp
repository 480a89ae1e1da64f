#include <backend/actions/share_info_action.hpp>
#include <log/log.hpp>
#include <persistence/settings/action_options.hpp>
#include <storage/storage_error.hpp>

#include <fmt/format.h>

using namespace std::chrono_literals;

namespace
{
    constexpr auto resultDuration = 2999ms;
    constexpr auto timeoutText = "Network timeout! Please retry later.";
    constexpr auto timeoutDuration = 5000ms;
    constexpr auto failureText = "An unexpected error occurred, please retry later.";
    constexpr auto failureDuration = 6000ms;

    std::regex compilePattern(std::string const& pattern)
    {
        try
        {
            return std::regex{pattern};
        }
        catch (std::regex_error const& e)
        {
            Log::error("ShareInfoAction: Invalid link pattern '{}': {}", pattern, e.what());
            return std::regex{std::string{Persistence::ShareLinkOptions::defaultPattern}};
        }
    }

    void reportCode(EventHub const& hub, Storage::StatusCode code, std::string const& password)
    {
        using enum Storage::StatusCode;
        switch (code)
        {
            case Success:
                hub.message("Extracted successfully!", resultDuration, SharedData::MessageLevel::Success);
                break;
            case FileCancelled:
                hub.message("The file does not exist or was deleted!", resultDuration, SharedData::MessageLevel::Error);
                break;
            case UrlInvalid:
                hub.message("Invalid link!", resultDuration, SharedData::MessageLevel::Error);
                break;
            case PasswordError:
                hub.message(
                    fmt::format("Wrong extraction code [{}]!", password),
                    resultDuration,
                    SharedData::MessageLevel::Error);
                break;
            case LackPassword:
                hub.message(
                    "Please append the extraction code to the link, separated by a space!",
                    resultDuration,
                    SharedData::MessageLevel::Warning);
                break;
            case NetworkError:
                hub.message("Network error!", resultDuration, SharedData::MessageLevel::Error);
                break;
            default:
                hub.message(Storage::describeStatus(code), resultDuration, SharedData::MessageLevel::Error);
                break;
        }
    }
}

ShareInfoAction::ShareInfoAction(
    std::shared_ptr<Storage::StorageClient> client,
    std::shared_ptr<EventHub> hub,
    std::string pattern)
    : ClientAction{
          "ShareInfoAction",
          std::move(client),
          std::move(hub),
          ActionMessages{
              .busy = "A background task is still running, please retry later.",
              .busyDuration = 4000ms,
              .timeout = timeoutText,
              .timeoutDuration = timeoutDuration,
              .failure = failureText,
              .failureDuration = failureDuration,
          }}
    , pattern_{compilePattern(pattern)}
{}

std::optional<ShareInfoAction::ShareLink> ShareInfoAction::findLink(std::string const& text) const
{
    std::smatch match;
    if (!std::regex_search(text, match, pattern_) || match.size() < 2)
        return std::nullopt;

    ShareLink link{.url = match[1].str()};
    if (match.size() > 2 && match[2].matched)
        link.password = match[2].str();
    return link;
}

bool ShareInfoAction::lookup(std::string const& text)
{
    if (text.empty())
        return false;

    const auto link = findLink(text);
    if (!link)
    {
        Log::debug("{}: No share link in '{}'.", name(), text);
        return false;
    }

    Storage::ResourceKind kind{Storage::ResourceKind::Unknown};
    try
    {
        kind = client_->classifyUrl(link->url);
    }
    catch (Storage::TimeoutError const& e)
    {
        Log::warn("{}: Network timeout while classifying '{}': {}", name(), link->url, e.what());
        message(timeoutText, timeoutDuration, SharedData::MessageLevel::Error);
        return false;
    }
    catch (std::exception const& e)
    {
        Log::error("{}: Classifying '{}' failed: {}", name(), link->url, e.what());
        message(failureText, failureDuration, SharedData::MessageLevel::Error);
        return false;
    }

    switch (kind)
    {
        case Storage::ResourceKind::File:
            message("Fetching file link information...", 20000ms);
            break;
        case Storage::ResourceKind::Folder:
            message("Fetching folder link information, this may take a few seconds...", 30000ms);
            break;
        case Storage::ResourceKind::Unknown:
        default:
            message(fmt::format("{} is not a valid link!", link->url), 0ms, SharedData::MessageLevel::Error);
            return false;
    }
    hub_->publish(SharedData::ShareLookupStarted{.url = link->url});

    return submit([this, link = *link, kind]() {
        if (kind == Storage::ResourceKind::File)
        {
            auto [code, info] = client_->shareInfoByUrl(link.url, link.password);
            Log::info("{}: '{}' resolved with {}.", name(), link.url, Storage::describeStatus(code));
            reportCode(*hub_, code, link.password);
            hub_->publish(SharedData::FileShareResolved{.code = code, .info = std::move(info)});
        }
        else
        {
            auto [code, info] = client_->folderInfoByUrl(link.url, link.password);
            Log::info("{}: '{}' resolved with {}.", name(), link.url, Storage::describeStatus(code));
            reportCode(*hub_, code, link.password);
            hub_->publish(SharedData::FolderShareResolved{.code = code, .info = std::move(info)});
        }
    });
}
