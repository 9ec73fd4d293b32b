#pragma once

#include "mcp/JsonRpc.hpp"

namespace upnote_mcp {

/**
 * @brief Note-taking application operations exposed as MCP tools
 *
 * Each method takes the tool arguments as a JSON object of named parameters,
 * returns a payload on success and throws a descriptive exception on failure.
 */
class INoteClient {
public:
    virtual ~INoteClient() = default;

    virtual json create_note(const json& args) = 0;
    virtual json create_markdown_note(const json& args) = 0;
    virtual json create_task_note(const json& args) = 0;
    virtual json create_meeting_note(const json& args) = 0;
    virtual json create_project_note(const json& args) = 0;
    virtual json create_daily_note(const json& args) = 0;
    virtual json search_notes(const json& args) = 0;
    virtual json open_note(const json& args) = 0;
    virtual json create_notebook(const json& args) = 0;
    virtual json open_notebook(const json& args) = 0;
    virtual json open_upnote(const json& args) = 0;
    virtual json import_note(const json& args) = 0;
    virtual json export_note(const json& args) = 0;
};

} // namespace upnote_mcp
