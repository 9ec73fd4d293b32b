#include "UpNoteClient.hpp"
#include "Markdown.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace upnote_mcp {

namespace {
    // Parameters create_note forwards to note/new unchanged
    const std::vector<std::string> kNoteParams = {
        "folder", "category", "markdown", "pinned", "favorite", "starred", "color",
        "priority", "reminder", "due_date", "created_date", "modified_date", "location",
        "attachment", "attachments", "template", "author", "source", "url", "encrypted",
        "password", "readonly", "shared", "public", "format", "encoding"
    };

    bool has_value(const json& args, const std::string& name) {
        if (!args.is_object() || !args.contains(name)) {
            return false;
        }
        const json& value = args[name];
        if (value.is_null()) {
            return false;
        }
        if (value.is_string() || value.is_array()) {
            return !value.empty();
        }
        return true;
    }

    std::string require_string(const json& args, const std::string& name) {
        if (!has_value(args, name) || !args[name].is_string()) {
            throw std::invalid_argument("Missing required parameter: " + name);
        }
        return args[name].get<std::string>();
    }

    std::string optional_string(const json& args, const std::string& name, const std::string& fallback = "") {
        if (has_value(args, name) && args[name].is_string()) {
            return args[name].get<std::string>();
        }
        return fallback;
    }

    std::vector<std::string> string_list(const json& args, const std::string& name) {
        std::vector<std::string> items;
        if (!has_value(args, name)) {
            return items;
        }
        const json& value = args[name];
        if (value.is_string()) {
            items.push_back(value.get<std::string>());
            return items;
        }
        if (!value.is_array()) {
            throw std::invalid_argument("Parameter " + name + " must be an array of strings");
        }
        for (const auto& item : value) {
            items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        return items;
    }

    std::string join(const std::vector<std::string>& items, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out += separator;
            }
            out += items[i];
        }
        return out;
    }

    json tags_or(const json& args, std::vector<std::string> fallback) {
        if (has_value(args, "tags")) {
            return args["tags"];
        }
        return json(fallback);
    }
}

UrlParams& UrlParams::add(const std::string& key, const json& value) {
    if (value.is_null()) {
        return *this;
    }

    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_boolean()) {
        text = value.get<bool>() ? "true" : "false";
    } else if (value.is_array()) {
        std::vector<std::string> parts;
        for (const auto& item : value) {
            parts.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        text = join(parts, ",");
    } else {
        text = value.dump();
    }

    items_.emplace_back(key, std::move(text));
    return *this;
}

UrlParams& UrlParams::add_from(const json& args, const std::string& arg_name, const std::string& key) {
    if (has_value(args, arg_name)) {
        add(key, args[arg_name]);
    }
    return *this;
}

UrlParams& UrlParams::add_from(const json& args, const std::string& arg_name) {
    return add_from(args, arg_name, arg_name);
}

UrlParams& UrlParams::add_callbacks(const json& args) {
    add_from(args, "x_success", "x-success");
    add_from(args, "x_error", "x-error");
    add_from(args, "x_cancel", "x-cancel");
    return *this;
}

UpNoteClient::UpNoteClient(std::shared_ptr<IUrlLauncher> launcher)
    : launcher_(std::move(launcher)) {
    if (!launcher_) {
        throw std::invalid_argument("URL launcher cannot be null");
    }
}

std::string UpNoteClient::percent_encode(const std::string& text) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());

    for (unsigned char c : text) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string UpNoteClient::build_url(const std::string& action, const UrlParams& params) {
    std::string url = std::string(kBaseScheme) + "/" + action;

    char separator = '?';
    for (const auto& [key, value] : params.items()) {
        url += separator;
        url += percent_encode(key) + "=" + percent_encode(value);
        separator = '&';
    }
    return url;
}

json UpNoteClient::open_url(const std::string& action, const UrlParams& params) {
    std::string url = build_url(action, params);
    spdlog::debug("UpNoteClient: {}", url);
    launcher_->open(url);
    return {{"url", url}, {"opened", true}};
}

json UpNoteClient::create_note(const json& args) {
    if (!has_value(args, "text") && !has_value(args, "title")) {
        throw std::invalid_argument("Missing required parameter: title or text");
    }

    UrlParams params;
    params.add_from(args, "text")
          .add_from(args, "title")
          .add_from(args, "notebook")
          .add_from(args, "tags");
    if (!has_value(args, "markdown")) {
        params.add("markdown", true);
    }
    for (const auto& name : kNoteParams) {
        params.add_from(args, name);
    }
    params.add_callbacks(args);

    return open_url("note/new", params);
}

json UpNoteClient::create_markdown_note(const json& args) {
    std::string title = require_string(args, "title");
    std::string content = require_string(args, "content");

    if (args.value("add_timestamp", false)) {
        content = Markdown::with_timestamp(content, Markdown::now_timestamp());
    }

    json note = {{"title", title}, {"text", content}, {"markdown", true}};
    for (const char* name : {"notebook", "tags", "pinned", "favorite", "color", "reminder"}) {
        if (has_value(args, name)) {
            note[name] = args[name];
        }
    }
    return create_note(note);
}

json UpNoteClient::create_task_note(const json& args) {
    std::string title = require_string(args, "title");
    std::vector<std::string> tasks = string_list(args, "tasks");
    if (tasks.empty()) {
        throw std::invalid_argument("Missing required parameter: tasks");
    }
    std::string due_date = optional_string(args, "due_date");

    std::string text = "# " + title + "\n\n" + Markdown::checklist(tasks);
    if (!due_date.empty()) {
        text += "\n\n**Due Date**: " + due_date;
    }

    json note = {
        {"title", title},
        {"text", text},
        {"tags", tags_or(args, {"todo", "tasks"})},
        {"priority", optional_string(args, "priority", "medium")},
        {"markdown", true}
    };
    for (const char* name : {"notebook", "due_date", "reminder"}) {
        if (has_value(args, name)) {
            note[name] = args[name];
        }
    }
    return create_note(note);
}

json UpNoteClient::create_meeting_note(const json& args) {
    std::string title = require_string(args, "title");
    std::string date = require_string(args, "date");
    std::vector<std::string> attendees = string_list(args, "attendees");
    std::vector<std::string> agenda = string_list(args, "agenda");
    std::string location = optional_string(args, "location");

    std::string text = "# " + title + "\n\n";
    text += "**Time**: " + date + "\n";
    text += "**Attendees**: " + join(attendees, ", ") + "\n";
    if (!location.empty()) {
        text += "**Location**: " + location + "\n";
    }
    text += "\n## Agenda\n" + Markdown::numbered_list(agenda) + "\n";
    text += "\n## Discussion Points\n[Write discussion points here]\n";
    text += "\n## Decisions Made\n" + Markdown::bullet_list({"[Decision 1]", "[Decision 2]"}) + "\n";
    text += "\n## Action Items\n" + Markdown::checklist({
        "[Task Description] (Person, Due Date)",
        "[Task Description] (Person, Due Date)"
    }) + "\n";
    text += "\n## Next Meeting\n**Schedule**: [Next meeting schedule]\n";

    json note = {
        {"title", title},
        {"text", text},
        {"notebook", optional_string(args, "notebook", "Meeting Notes")},
        {"tags", tags_or(args, {"meeting", "meeting-notes"})},
        {"markdown", true},
        {"template", "meeting"}
    };
    if (!location.empty()) {
        note["location"] = location;
    }
    return create_note(note);
}

json UpNoteClient::create_project_note(const json& args) {
    std::string project_name = require_string(args, "project_name");
    std::string description = require_string(args, "description");
    std::vector<std::string> milestones = string_list(args, "milestones");
    std::vector<std::string> team_members = string_list(args, "team_members");
    std::string due_date = optional_string(args, "due_date");
    std::string priority = optional_string(args, "priority", "medium");

    std::string text = "# " + project_name + "\n\n";
    text += "## Project Overview\n" + description + "\n";
    text += "\n## Team Composition\n" + Markdown::bullet_list(team_members) + "\n";
    text += "\n## Key Milestones\n" + Markdown::checklist(milestones) + "\n";
    text += "\n## Progress\n- **Start Date**: " + Markdown::today() + "\n";
    if (!due_date.empty()) {
        text += "- **Due Date**: " + due_date + "\n";
    }
    text += "- **Current Status**: Planning Phase\n";
    text += "\n## Next Steps\n" + Markdown::checklist({
        "Requirements analysis",
        "Technology stack decision",
        "Development schedule establishment"
    }) + "\n";

    json note = {
        {"title", project_name},
        {"text", text},
        {"notebook", optional_string(args, "notebook", "Projects")},
        {"tags", json::array({"project", "plan", priority})},
        {"priority", priority},
        {"markdown", true},
        {"template", "project"}
    };
    if (!due_date.empty()) {
        note["due_date"] = due_date;
    }
    return create_note(note);
}

json UpNoteClient::create_daily_note(const json& args) {
    static const std::string kCalendar = "\xF0\x9F\x93\x85";

    std::string date = optional_string(args, "date", Markdown::today());
    std::vector<std::string> goals = string_list(args, "goals");
    if (goals.empty()) {
        goals = {"Goal 1", "Goal 2", "Goal 3"};
    }

    std::string text = "# " + kCalendar + " " + date + "\n\n";
    text += "## Today's Status\n";
    text += "**Mood**: " + optional_string(args, "mood") + "\n";
    text += "**Weather**: " + optional_string(args, "weather") + "\n";
    text += "\n## Today's Goals\n" + Markdown::checklist(goals) + "\n";
    text += "\n## Important Things\n" + Markdown::bullet_list({
        "[Important Thing 1]", "[Important Thing 2]"
    }) + "\n";
    text += "\n## Things Learned\n" + Markdown::bullet_list({
        "[Thing Learned 1]", "[Thing Learned 2]"
    }) + "\n";
    text += "\n## Things I'm Grateful For\n" + Markdown::bullet_list({
        "[Thing I'm Grateful For 1]", "[Thing I'm Grateful For 2]", "[Thing I'm Grateful For 3]"
    }) + "\n";
    text += "\n## Daily Reflection\n" +
        optional_string(args, "reflections", "[Write about your thoughts on today's day]") + "\n";
    text += "\n## Tomorrow's Plan\n" + Markdown::checklist({
        "Tomorrow's Task 1", "Tomorrow's Task 2"
    }) + "\n";

    std::string compact_date = date;
    compact_date.erase(std::remove(compact_date.begin(), compact_date.end(), '-'), compact_date.end());

    json note = {
        {"title", kCalendar + " " + date},
        {"text", text},
        {"notebook", optional_string(args, "notebook", "Diary")},
        {"tags", json::array({"diary", "daily", compact_date})},
        {"created_date", date},
        {"markdown", true},
        {"template", "daily"}
    };
    return create_note(note);
}

json UpNoteClient::search_notes(const json& args) {
    std::string query = require_string(args, "query");
    query.erase(0, query.find_first_not_of(" \t\r\n"));
    query.erase(query.find_last_not_of(" \t\r\n") + 1);
    if (query.empty()) {
        throw std::invalid_argument("Search query cannot be empty");
    }

    UrlParams params;
    params.add("action", "search")
          .add("query", query)
          .add_from(args, "mode")
          .add_from(args, "notebook_id", "notebookId")
          .add_from(args, "tag_id", "tagId")
          .add_from(args, "filter_id", "filterId")
          .add_from(args, "space_id", "spaceId")
          .add_callbacks(args);

    return open_url("view", params);
}

json UpNoteClient::open_note(const json& args) {
    if (!has_value(args, "note_id") && !has_value(args, "title")) {
        throw std::invalid_argument("Missing required parameter: note_id or title");
    }

    UrlParams params;
    params.add_from(args, "note_id", "id")
          .add_from(args, "title")
          .add_from(args, "edit")
          .add_callbacks(args);

    return open_url("note/open", params);
}

json UpNoteClient::create_notebook(const json& args) {
    UrlParams params;
    params.add("title", require_string(args, "title"))
          .add_from(args, "color")
          .add_from(args, "parent")
          .add_callbacks(args);

    return open_url("notebook/new", params);
}

json UpNoteClient::open_notebook(const json& args) {
    if (!has_value(args, "name") && !has_value(args, "notebook_id")) {
        throw std::invalid_argument("Missing required parameter: name or notebook_id");
    }

    UrlParams params;
    params.add_from(args, "name")
          .add_from(args, "notebook_id", "id")
          .add_callbacks(args);

    return open_url("notebook/open", params);
}

json UpNoteClient::open_upnote(const json& args) {
    UrlParams params;
    params.add_from(args, "x_success", "x-success")
          .add_from(args, "x_error", "x-error");

    return open_url("open", params);
}

json UpNoteClient::import_note(const json& args) {
    UrlParams params;
    params.add("file", require_string(args, "path"))
          .add_from(args, "notebook")
          .add_from(args, "tags")
          .add_from(args, "format")
          .add_callbacks(args);

    return open_url("import", params);
}

json UpNoteClient::export_note(const json& args) {
    if (!has_value(args, "note_id") && !has_value(args, "title")) {
        throw std::invalid_argument("Missing required parameter: note_id or title");
    }

    UrlParams params;
    params.add("format", optional_string(args, "format", "markdown"))
          .add_from(args, "note_id", "id")
          .add_from(args, "title")
          .add_from(args, "dest_path", "destination")
          .add_callbacks(args);

    return open_url("export", params);
}

} // namespace upnote_mcp
