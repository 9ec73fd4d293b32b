#pragma once

#include <string>
#include <vector>

namespace upnote_mcp {

/**
 * @brief Opens URLs with whatever handles their scheme on this machine
 */
class IUrlLauncher {
public:
    virtual ~IUrlLauncher() = default;

    /**
     * @brief Open a URL
     *
     * Throws std::runtime_error if the URL could not be handed off.
     */
    virtual void open(const std::string& url) = 0;
};

/**
 * @brief Launches URLs through the desktop opener ("open" on macOS, "xdg-open" elsewhere)
 */
class SystemUrlLauncher : public IUrlLauncher {
public:
    SystemUrlLauncher();

    void open(const std::string& url) override;

    /**
     * @brief Command line that would be executed for a URL
     */
    std::vector<std::string> command_for(const std::string& url) const;

private:
    std::string opener_;
};

} // namespace upnote_mcp
