#include "NoteTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace upnote_mcp {

namespace {
    json string_prop() {
        return {{"type", "string"}};
    }

    json string_array_prop() {
        return {{"type", "array"}, {"items", {{"type", "string"}}}};
    }

    json enum_prop(std::initializer_list<const char*> values) {
        json options = json::array();
        for (const char* value : values) {
            options.push_back(value);
        }
        return {{"type", "string"}, {"enum", options}};
    }

    json object_schema(json properties, std::initializer_list<const char*> required = {}) {
        json schema = {{"type", "object"}, {"properties", std::move(properties)}};
        if (required.size() > 0) {
            json names = json::array();
            for (const char* name : required) {
                names.push_back(name);
            }
            schema["required"] = names;
        }
        return schema;
    }
}

NoteTool::NoteTool(NoteAction action, std::shared_ptr<INoteClient> client)
    : action_(action), client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("Note client cannot be null");
    }
}

const std::vector<NoteAction>& NoteTool::catalog() {
    static const std::vector<NoteAction> kCatalog = {
        NoteAction::CreateNote,
        NoteAction::CreateMarkdownNote,
        NoteAction::CreateTaskNote,
        NoteAction::CreateMeetingNote,
        NoteAction::CreateProjectNote,
        NoteAction::CreateDailyNote,
        NoteAction::SearchNotes,
        NoteAction::OpenNote,
        NoteAction::CreateNotebook,
        NoteAction::OpenNotebook,
        NoteAction::OpenUpNote,
        NoteAction::ImportNote,
        NoteAction::ExportNote
    };
    return kCatalog;
}

std::optional<NoteAction> NoteTool::from_name(std::string_view name) {
    for (NoteAction action : catalog()) {
        if (get_info(action).name == name) {
            return action;
        }
    }
    return std::nullopt;
}

ToolInfo NoteTool::get_info(NoteAction action) {
    switch (action) {
        case NoteAction::CreateNote: {
            json schema = object_schema({
                {"title", string_prop()},
                {"text", string_prop()},
                {"notebook", string_prop()},
                {"tags", string_array_prop()},
                {"pinned", {{"type", "boolean"}}},
                {"favorite", {{"type", "boolean"}}}
            });
            // Either field alone makes a note
            schema["anyOf"] = json::array({
                json{{"required", json::array({"title"})}},
                json{{"required", json::array({"text"})}}
            });
            return {"create_note", "Create a new note in UpNote", schema};
        }
        case NoteAction::CreateMarkdownNote:
            return {
                "create_markdown_note",
                "Create a markdown formatted note in UpNote",
                object_schema({
                    {"title", string_prop()},
                    {"content", string_prop()},
                    {"notebook", string_prop()},
                    {"tags", string_array_prop()},
                    {"add_timestamp", {{"type", "boolean"}}}
                }, {"title", "content"})
            };
        case NoteAction::CreateTaskNote:
            return {
                "create_task_note",
                "Create a task list note in UpNote",
                object_schema({
                    {"title", string_prop()},
                    {"tasks", string_array_prop()},
                    {"notebook", string_prop()},
                    {"due_date", string_prop()},
                    {"priority", enum_prop({"low", "medium", "high"})}
                }, {"title", "tasks"})
            };
        case NoteAction::CreateMeetingNote:
            return {
                "create_meeting_note",
                "Create a meeting note in UpNote",
                object_schema({
                    {"title", string_prop()},
                    {"date", string_prop()},
                    {"attendees", string_array_prop()},
                    {"agenda", string_array_prop()},
                    {"notebook", string_prop()},
                    {"location", string_prop()}
                }, {"title", "date"})
            };
        case NoteAction::CreateProjectNote:
            return {
                "create_project_note",
                "Create a project note in UpNote",
                object_schema({
                    {"project_name", string_prop()},
                    {"description", string_prop()},
                    {"milestones", string_array_prop()},
                    {"team_members", string_array_prop()},
                    {"due_date", string_prop()},
                    {"priority", enum_prop({"low", "medium", "high"})}
                }, {"project_name", "description"})
            };
        case NoteAction::CreateDailyNote:
            return {
                "create_daily_note",
                "Create a daily journal note in UpNote",
                object_schema({
                    {"date", string_prop()},
                    {"mood", string_prop()},
                    {"weather", string_prop()},
                    {"goals", string_array_prop()},
                    {"reflections", string_prop()},
                    {"notebook", string_prop()}
                })
            };
        case NoteAction::SearchNotes:
            return {
                "search_notes",
                "Search for notes in UpNote",
                object_schema({
                    {"query", string_prop()},
                    {"mode", enum_prop({"all_notes", "notebooks", "tags", "filters"})},
                    {"notebook_id", string_prop()},
                    {"tag_id", string_prop()},
                    {"filter_id", string_prop()},
                    {"space_id", string_prop()}
                }, {"query"})
            };
        case NoteAction::OpenNote:
            return {
                "open_note",
                "Open a specific note in UpNote",
                object_schema({
                    {"note_id", string_prop()},
                    {"title", string_prop()},
                    {"edit", {{"type", "boolean"}}}
                })
            };
        case NoteAction::CreateNotebook:
            return {
                "create_notebook",
                "Create a new notebook in UpNote",
                object_schema({
                    {"title", string_prop()},
                    {"color", string_prop()},
                    {"parent", string_prop()}
                }, {"title"})
            };
        case NoteAction::OpenNotebook:
            return {
                "open_notebook",
                "Open a notebook in UpNote",
                object_schema({
                    {"name", string_prop()},
                    {"notebook_id", string_prop()}
                })
            };
        case NoteAction::OpenUpNote:
            return {
                "open_upnote",
                "Open the UpNote application",
                object_schema(json::object())
            };
        case NoteAction::ImportNote:
            return {
                "import_note",
                "Import a note into UpNote",
                object_schema({
                    {"path", string_prop()},
                    {"notebook", string_prop()},
                    {"tags", string_array_prop()}
                }, {"path"})
            };
        case NoteAction::ExportNote:
            return {
                "export_note",
                "Export a note from UpNote",
                object_schema({
                    {"note_id", string_prop()},
                    {"format", enum_prop({"md", "html", "pdf"})},
                    {"dest_path", string_prop()}
                }, {"note_id", "format", "dest_path"})
            };
    }
    throw std::invalid_argument("Unknown note action");
}

json NoteTool::execute(const json& args) {
    if (!args.is_object()) {
        throw std::invalid_argument("Tool arguments must be an object");
    }

    spdlog::debug("NoteTool: {} with args: {}", get_info(action_).name, args.dump());

    switch (action_) {
        case NoteAction::CreateNote:
            return client_->create_note(args);
        case NoteAction::CreateMarkdownNote:
            return client_->create_markdown_note(args);
        case NoteAction::CreateTaskNote:
            return client_->create_task_note(args);
        case NoteAction::CreateMeetingNote:
            return client_->create_meeting_note(args);
        case NoteAction::CreateProjectNote:
            return client_->create_project_note(args);
        case NoteAction::CreateDailyNote:
            return client_->create_daily_note(args);
        case NoteAction::SearchNotes:
            return client_->search_notes(args);
        case NoteAction::OpenNote:
            return client_->open_note(args);
        case NoteAction::CreateNotebook:
            return client_->create_notebook(args);
        case NoteAction::OpenNotebook:
            return client_->open_notebook(args);
        case NoteAction::OpenUpNote:
            return client_->open_upnote(args);
        case NoteAction::ImportNote:
            return client_->import_note(args);
        case NoteAction::ExportNote:
            return client_->export_note(args);
    }
    throw std::invalid_argument("Unknown note action");
}

void register_note_tools(MCPServer& server, const std::shared_ptr<INoteClient>& client) {
    for (NoteAction action : NoteTool::catalog()) {
        auto tool = std::make_shared<NoteTool>(action, client);
        server.register_tool(
            NoteTool::get_info(action),
            [tool](const json& args) {
                return tool->execute(args);
            }
        );
    }
}

} // namespace upnote_mcp
