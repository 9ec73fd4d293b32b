#pragma once

#include "NoteClient.hpp"
#include "UrlLauncher.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace upnote_mcp {

/**
 * @brief Ordered query parameters of an x-callback-url
 *
 * Null values are dropped, arrays are joined with ',' and booleans become
 * "true"/"false".
 */
class UrlParams {
public:
    UrlParams& add(const std::string& key, const json& value);

    /// Copy args[arg_name] (if present and not empty) under key
    UrlParams& add_from(const json& args, const std::string& arg_name, const std::string& key);
    UrlParams& add_from(const json& args, const std::string& arg_name);

    /// Append x-success / x-error / x-cancel callbacks found in args
    UrlParams& add_callbacks(const json& args);

    const std::vector<std::pair<std::string, std::string>>& items() const { return items_; }

private:
    std::vector<std::pair<std::string, std::string>> items_;
};

/**
 * @brief INoteClient driving UpNote through its upnote://x-callback-url scheme
 */
class UpNoteClient : public INoteClient {
public:
    static constexpr const char* kBaseScheme = "upnote://x-callback-url";

    explicit UpNoteClient(std::shared_ptr<IUrlLauncher> launcher);

    json create_note(const json& args) override;
    json create_markdown_note(const json& args) override;
    json create_task_note(const json& args) override;
    json create_meeting_note(const json& args) override;
    json create_project_note(const json& args) override;
    json create_daily_note(const json& args) override;
    json search_notes(const json& args) override;
    json open_note(const json& args) override;
    json create_notebook(const json& args) override;
    json open_notebook(const json& args) override;
    json open_upnote(const json& args) override;
    json import_note(const json& args) override;
    json export_note(const json& args) override;

    /**
     * @brief Build an x-callback-url
     * @param action Endpoint such as "note/new" or "view"
     * @param params Query parameters
     * @return Full URL with percent-encoded query
     */
    static std::string build_url(const std::string& action, const UrlParams& params);

    /// Percent-encode everything outside the RFC 3986 unreserved set
    static std::string percent_encode(const std::string& text);

private:
    json open_url(const std::string& action, const UrlParams& params);

    std::shared_ptr<IUrlLauncher> launcher_;
};

} // namespace upnote_mcp
