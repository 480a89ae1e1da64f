#pragma once

#include <backend/actions/client_action.hpp>

#include <optional>
#include <regex>
#include <string>

/**
 * @brief Resolves a share link found in free text, e.g. pasted by the user.
 */
class ShareInfoAction : public ClientAction
{
  public:
    struct ShareLink
    {
        std::string url{};
        std::string password{};
    };

    /**
     * @param pattern A regular expression whose first group is the link and whose second, optional group
     * is the extraction code. An invalid pattern is replaced by the default one.
     */
    ShareInfoAction(std::shared_ptr<Storage::StorageClient> client, std::shared_ptr<EventHub> hub, std::string pattern);

    /**
     * @brief Finds the first share link in the text.
     */
    std::optional<ShareLink> findLink(std::string const& text) const;

    /**
     * @brief Looks up the first share link in the text. Publishes FileShareResolved or FolderShareResolved.
     *
     * @return false if there is no valid link or another lookup is still running.
     */
    bool lookup(std::string const& text);

  private:
    std::regex pattern_;
};
