#pragma once

#include "core/NoteClient.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace upnote_mcp {

/**
 * @brief Entries of the note tool catalog
 */
enum class NoteAction {
    CreateNote,
    CreateMarkdownNote,
    CreateTaskNote,
    CreateMeetingNote,
    CreateProjectNote,
    CreateDailyNote,
    SearchNotes,
    OpenNote,
    CreateNotebook,
    OpenNotebook,
    OpenUpNote,
    ImportNote,
    ExportNote
};

/**
 * @brief MCP tool binding one catalog entry to the note client
 */
class NoteTool {
public:
    /**
     * @brief Construct tool for a catalog entry
     * @param action Catalog entry
     * @param client Note client the tool calls into
     */
    NoteTool(NoteAction action, std::shared_ptr<INoteClient> client);

    /**
     * @brief Get tool metadata and JSON schema for a catalog entry
     */
    static ToolInfo get_info(NoteAction action);

    /**
     * @brief Every catalog entry, in catalog order
     */
    static const std::vector<NoteAction>& catalog();

    /**
     * @brief Look up a catalog entry by tool name
     */
    static std::optional<NoteAction> from_name(std::string_view name);

    /**
     * @brief Execute tool with arguments
     * @param args JSON object of named parameters
     * @return Client payload; throws on invalid arguments or client failure
     */
    json execute(const json& args);

    NoteAction action() const { return action_; }

private:
    NoteAction action_;
    std::shared_ptr<INoteClient> client_;
};

/**
 * @brief Register the whole note tool catalog on a server
 */
void register_note_tools(MCPServer& server, const std::shared_ptr<INoteClient>& client);

} // namespace upnote_mcp
