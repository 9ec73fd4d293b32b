#include "tools/NoteTool.hpp"
#include "core/UpNoteClient.hpp"
#include "../core/RecordingLauncher.hpp"
#include "../mcp/MockTransport.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace upnote_mcp;

namespace {

// Records which client operation each tool reached
class FakeNoteClient : public INoteClient {
public:
    json create_note(const json& args) override { return record("create_note", args); }
    json create_markdown_note(const json& args) override { return record("create_markdown_note", args); }
    json create_task_note(const json& args) override { return record("create_task_note", args); }
    json create_meeting_note(const json& args) override { return record("create_meeting_note", args); }
    json create_project_note(const json& args) override { return record("create_project_note", args); }
    json create_daily_note(const json& args) override { return record("create_daily_note", args); }
    json search_notes(const json& args) override { return record("search_notes", args); }
    json open_note(const json& args) override { return record("open_note", args); }
    json create_notebook(const json& args) override { return record("create_notebook", args); }
    json open_notebook(const json& args) override { return record("open_notebook", args); }
    json open_upnote(const json& args) override { return record("open_upnote", args); }
    json import_note(const json& args) override { return record("import_note", args); }
    json export_note(const json& args) override { return record("export_note", args); }

    std::vector<std::string> calls;

private:
    json record(const std::string& name, const json& args) {
        calls.push_back(name);
        return {{"called", name}, {"args", args}};
    }
};

} // namespace

class NoteToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<FakeNoteClient>();
    }

    std::shared_ptr<FakeNoteClient> client;
};

TEST_F(NoteToolTest, CatalogHasThirteenUniqueTools) {
    const auto& catalog = NoteTool::catalog();
    ASSERT_EQ(catalog.size(), 13u);

    std::set<std::string> names;
    for (NoteAction action : catalog) {
        ToolInfo info = NoteTool::get_info(action);
        EXPECT_FALSE(info.description.empty()) << info.name;
        EXPECT_EQ(info.input_schema["type"], "object") << info.name;
        EXPECT_TRUE(info.input_schema.contains("properties")) << info.name;
        names.insert(info.name);
    }
    EXPECT_EQ(names.size(), 13u);
}

TEST_F(NoteToolTest, FromNameRoundTrips) {
    for (NoteAction action : NoteTool::catalog()) {
        auto found = NoteTool::from_name(NoteTool::get_info(action).name);
        ASSERT_TRUE(found.has_value());
        EXPECT_EQ(*found, action);
    }
    EXPECT_FALSE(NoteTool::from_name("delete_everything").has_value());
}

TEST_F(NoteToolTest, SchemaRequiredFields) {
    json schema = NoteTool::get_info(NoteAction::SearchNotes).input_schema;
    ASSERT_TRUE(schema.contains("required"));
    EXPECT_EQ(schema["required"], json::array({"query"}));

    json open_schema = NoteTool::get_info(NoteAction::OpenUpNote).input_schema;
    EXPECT_FALSE(open_schema.contains("required"));
}

TEST_F(NoteToolTest, CreateNoteAcceptsTitleOrText) {
    json schema = NoteTool::get_info(NoteAction::CreateNote).input_schema;
    EXPECT_FALSE(schema.contains("required"));
    ASSERT_TRUE(schema.contains("anyOf"));
    EXPECT_EQ(schema["anyOf"][0]["required"], json::array({"title"}));
    EXPECT_EQ(schema["anyOf"][1]["required"], json::array({"text"}));

    auto launcher = std::make_shared<RecordingLauncher>();
    NoteTool tool(NoteAction::CreateNote, std::make_shared<UpNoteClient>(launcher));
    EXPECT_NO_THROW(tool.execute({{"title", "Only a title"}}));
    EXPECT_NO_THROW(tool.execute({{"text", "Only text"}}));
    EXPECT_THROW(tool.execute({{"notebook", "Inbox"}}), std::invalid_argument);
    EXPECT_EQ(launcher->urls.size(), 2u);
}

TEST_F(NoteToolTest, ExecuteDispatchesToMatchingOperation) {
    for (NoteAction action : NoteTool::catalog()) {
        NoteTool tool(action, client);
        json result = tool.execute({{"title", "x"}});
        EXPECT_EQ(result["called"], NoteTool::get_info(action).name);
        EXPECT_EQ(result["args"]["title"], "x");
    }
    EXPECT_EQ(client->calls.size(), 13u);
}

TEST_F(NoteToolTest, NonObjectArgumentsRejected) {
    NoteTool tool(NoteAction::CreateNote, client);

    EXPECT_THROW(tool.execute(json::array()), std::invalid_argument);
    EXPECT_THROW(tool.execute("text"), std::invalid_argument);
    EXPECT_TRUE(client->calls.empty());
}

TEST_F(NoteToolTest, NullClientRejected) {
    EXPECT_THROW(NoteTool(NoteAction::OpenUpNote, nullptr), std::invalid_argument);
}

TEST_F(NoteToolTest, RegisteredCatalogIsListed) {
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();
    MCPServer server(std::move(transport));
    register_note_tools(server, client);

    mock->push_request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    server.run();

    ASSERT_EQ(mock->response_count(), 1u);
    json tools = mock->pop_response()["result"]["tools"];
    ASSERT_EQ(tools.size(), 13u);
    for (const auto& tool : tools) {
        EXPECT_TRUE(NoteTool::from_name(tool["name"].get<std::string>()).has_value());
        EXPECT_TRUE(tool.contains("inputSchema"));
    }
}

TEST_F(NoteToolTest, ToolCallReachesUpNote) {
    auto launcher = std::make_shared<RecordingLauncher>();
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();
    MCPServer server(std::move(transport));
    register_note_tools(server, std::make_shared<UpNoteClient>(launcher));

    mock->push_request({
        {"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"},
        {"params", {{"name", "search_notes"}, {"arguments", {{"query", "ideas"}}}}}
    });
    server.run();

    ASSERT_EQ(launcher->urls.size(), 1u);
    EXPECT_EQ(launcher->urls[0], "upnote://x-callback-url/view?action=search&query=ideas");
    EXPECT_FALSE(mock->pop_response()["result"]["isError"].get<bool>());
}
