#include "tool_registry.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <set>

using namespace ddcore;
using namespace ddcore::test;

namespace {

const char* ECHO_PLUGIN = "input=$(cat)\necho \"plugin got: $input\"\n";

void add_plugin(const TempDir& dir, const std::string& rel, const std::string& manifest,
                const std::string& script_name = "run.sh", const std::string& script = ECHO_PLUGIN) {
    write_file(dir.sub("skills/" + rel + "/manifest.json"), manifest);
    if (!script_name.empty()) write_script(dir.sub("skills/" + rel + "/" + script_name), script);
}

void add_skill(const TempDir& dir, const std::string& rel, const std::string& frontmatter) {
    write_file(dir.sub("skills/" + rel + "/SKILL.md"), "---\n" + frontmatter + "---\n\n# Body\n");
}

nlohmann::json find_summary(const nlohmann::json& all, const std::string& name) {
    for (auto& t : all) {
        if (t["name"] == name) return t;
    }
    return nullptr;
}

std::set<std::string> names_of(const nlohmann::json& all) {
    std::set<std::string> out;
    for (auto& t : all) out.insert(t["name"].get<std::string>());
    return out;
}

} // namespace

TEST(ToolRegistryTest, BuiltinListedOnceAsBuiltin) {
    TempDir dir;
    ToolRegistry reg(test_config(dir));
    reg.register_builtin("ping", [](const nlohmann::json&) { return std::string("pong"); });

    auto all = reg.list_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0]["name"], "ping");
    EXPECT_EQ(all[0]["type"], "builtin");
    EXPECT_EQ(all[0]["dangerLevel"], "safe");
    EXPECT_EQ(all[0]["version"], "1.0.0");
    EXPECT_FALSE(all[0].contains("server"));
    EXPECT_TRUE(reg.is_registered("ping"));

    auto r = reg.dispatch("ping", nlohmann::json::object());
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.result, "pong");
}

TEST(ToolRegistryTest, DuplicateBuiltinKeepsFirst) {
    TempDir dir;
    ToolRegistry reg(test_config(dir));
    reg.register_builtin("ping", [](const nlohmann::json&) { return std::string("first"); });
    reg.register_builtin("ping", [](const nlohmann::json&) { return std::string("second"); });
    EXPECT_EQ(reg.builtin_count(), 1u);
    EXPECT_EQ(reg.dispatch("ping", nullptr).result, "first");
}

TEST(ToolRegistryTest, BuiltinExceptionBecomesErrorResult) {
    TempDir dir;
    ToolRegistry reg(test_config(dir));
    reg.register_builtin("explode", [](const nlohmann::json&) -> std::string {
        throw std::runtime_error("kaboom");
    });
    auto r = reg.dispatch("explode", nlohmann::json::object());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.result, "kaboom");
    EXPECT_EQ(r.to_json()["status"], "error");
}

TEST(ToolRegistryTest, UnknownToolIsAnErrorResult) {
    TempDir dir;
    ToolRegistry reg(test_config(dir));
    auto r = reg.dispatch("nope", nlohmann::json::object());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.result, "Unknown tool: nope");
}

TEST(ToolRegistryTest, OutputIsCappedNotFailed) {
    TempDir dir;
    auto cfg = test_config(dir);
    cfg.max_tool_output = 100;
    ToolRegistry reg(cfg);
    reg.register_builtin("big", [](const nlohmann::json&) { return std::string(1000, 'x'); });

    auto r = reg.dispatch("big", nlohmann::json::object());
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.result, std::string(100, 'x') + "\n...[truncated]");
}

TEST(ToolRegistryTest, ScanRegistersPluginsAndInstructions) {
    TempDir dir;
    add_plugin(dir, "text-tools", R"({"tools": [
        {"toolName": "hello", "executable": "run.sh", "runtime": "sh",
         "description": "Says hello", "dangerLevel": "low", "version": "2.0.0",
         "keywords": ["greet"], "inputs": {"name": {"type": "string", "required": true}}},
        {"toolName": "ghost", "executable": "missing.sh", "runtime": "sh"}
    ]})");
    add_skill(dir, "review", "name: Code Review!\ndescription: Reviews code\n");
    add_skill(dir, "nested/deeper/plain", "description: No name given\n");

    ToolRegistry reg(test_config(dir));
    EXPECT_EQ(reg.scan_plugins(), 3u);
    EXPECT_EQ(reg.plugin_count(), 1u);
    EXPECT_EQ(reg.instruction_count(), 2u);

    auto all = reg.list_all();
    auto hello = find_summary(all, "hello");
    ASSERT_FALSE(hello.is_null());
    EXPECT_EQ(hello["type"], "plugin");
    EXPECT_EQ(hello["description"], "Says hello");
    EXPECT_EQ(hello["dangerLevel"], "low");
    EXPECT_EQ(hello["version"], "2.0.0");
    EXPECT_TRUE(hello["inputs"]["name"]["required"].get<bool>());

    EXPECT_TRUE(find_summary(all, "ghost").is_null());

    auto review = find_summary(all, "code_review");
    ASSERT_FALSE(review.is_null());
    EXPECT_EQ(review["type"], "instruction");
    EXPECT_EQ(review["description"], "Reviews code");

    EXPECT_FALSE(find_summary(all, "plain").is_null());
}

TEST(ToolRegistryTest, SingleObjectManifestAndClaimedSkillDirectory) {
    TempDir dir;
    add_plugin(dir, "solo", R"({"toolName": "solo", "executable": "run.sh", "runtime": "sh"})");
    add_skill(dir, "solo", "name: solo-instructions\n");

    ToolRegistry reg(test_config(dir));
    reg.scan_plugins();
    EXPECT_EQ(reg.plugin_count(), 1u);
    EXPECT_EQ(reg.instruction_count(), 0u);
    EXPECT_FALSE(reg.is_registered("solo_instructions"));
}

TEST(ToolRegistryTest, MalformedManifestIsSkipped) {
    TempDir dir;
    add_plugin(dir, "bad", "{ not json", "");
    add_plugin(dir, "good", R"({"toolName": "good", "executable": "run.sh", "runtime": "sh"})");

    ToolRegistry reg(test_config(dir));
    EXPECT_EQ(reg.scan_plugins(), 1u);
    EXPECT_TRUE(reg.is_registered("good"));
}

TEST(ToolRegistryTest, PluginCannotShadowBuiltin) {
    TempDir dir;
    add_plugin(dir, "impostor", R"({"toolName": "ping", "executable": "run.sh", "runtime": "sh"})");

    ToolRegistry reg(test_config(dir));
    reg.register_builtin("ping", [](const nlohmann::json&) { return std::string("pong"); });
    EXPECT_EQ(reg.scan_plugins(), 0u);

    auto spec = reg.find("ping");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->kind(), ToolKind::builtin);
    EXPECT_EQ(reg.dispatch("ping", nullptr).result, "pong");
}

TEST(ToolRegistryTest, DuplicatePluginNameKeepsFirstInPathOrder) {
    TempDir dir;
    add_plugin(dir, "a-first", R"({"toolName": "dup", "executable": "run.sh", "runtime": "sh"})",
               "run.sh", "echo first\n");
    add_plugin(dir, "b-second", R"({"toolName": "dup", "executable": "run.sh", "runtime": "sh"})",
               "run.sh", "echo second\n");

    ToolRegistry reg(test_config(dir));
    EXPECT_EQ(reg.scan_plugins(), 1u);
    EXPECT_EQ(reg.dispatch("dup", nullptr).result, "first\n");
}

TEST(ToolRegistryTest, ScanTwiceIsIdempotent) {
    TempDir dir;
    add_plugin(dir, "text-tools", R"({"toolName": "hello", "executable": "run.sh", "runtime": "sh"})");
    add_skill(dir, "review", "name: review\n");

    ToolRegistry reg(test_config(dir));
    reg.register_builtin("ping", [](const nlohmann::json&) { return std::string("pong"); });
    reg.scan_plugins();
    auto first = reg.list_all();
    reg.scan_plugins();
    EXPECT_EQ(reg.list_all(), first);

    auto counts = reg.reload();
    EXPECT_EQ(counts["builtins"], 1);
    EXPECT_EQ(counts["plugins"], 1);
    EXPECT_EQ(counts["instructions"], 1);
    EXPECT_EQ(counts["mcpServers"], 0);
    EXPECT_EQ(reg.list_all(), first);
}

TEST(ToolRegistryTest, RescanDropsRemovedPlugins) {
    TempDir dir;
    add_plugin(dir, "temp", R"({"toolName": "temp", "executable": "run.sh", "runtime": "sh"})");
    ToolRegistry reg(test_config(dir));
    reg.scan_plugins();
    ASSERT_TRUE(reg.is_registered("temp"));

    fs::remove_all(dir.sub("skills/temp"));
    reg.scan_plugins();
    EXPECT_FALSE(reg.is_registered("temp"));
}

TEST(ToolRegistryTest, DispatchPluginSendsToolAndArgs) {
    TempDir dir;
    add_plugin(dir, "text-tools", R"({"toolName": "hello", "executable": "run.sh", "runtime": "sh"})");
    ToolRegistry reg(test_config(dir));
    reg.scan_plugins();

    auto r = reg.dispatch("hello", {{"x", 1}});
    ASSERT_TRUE(r.ok) << r.result;
    EXPECT_EQ(r.result, "plugin got: {\"args\":{\"x\":1},\"tool\":\"hello\"}\n");
}

TEST(ToolRegistryTest, PluginRunsInItsDirectory) {
    TempDir dir;
    add_plugin(dir, "where", R"({"toolName": "where", "executable": "run.sh", "runtime": "sh"})",
               "run.sh", "cat >/dev/null\npwd -P\n");
    ToolRegistry reg(test_config(dir));
    reg.scan_plugins();

    auto r = reg.dispatch("where", nlohmann::json::object());
    ASSERT_TRUE(r.ok) << r.result;
    EXPECT_EQ(r.result, fs::canonical(dir.sub("skills/where")).string() + "\n");
}

TEST(ToolRegistryTest, PluginFailureCarriesStderr) {
    TempDir dir;
    add_plugin(dir, "failing", R"({"toolName": "failing", "executable": "run.sh", "runtime": "sh"})",
               "run.sh", "cat >/dev/null\necho 'bad input' >&2\nexit 2\n");
    ToolRegistry reg(test_config(dir));
    reg.scan_plugins();

    auto r = reg.dispatch("failing", nlohmann::json::object());
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.result.find("exit 2"), std::string::npos);
    EXPECT_NE(r.result.find("bad input"), std::string::npos);
}

TEST(ToolRegistryTest, BinaryRuntimeExecutesFileDirectly) {
    TempDir dir;
    add_plugin(dir, "direct", R"({"toolName": "direct", "executable": "run.sh", "runtime": "binary"})",
               "run.sh", "cat >/dev/null\necho direct\n");
    ToolRegistry reg(test_config(dir));
    reg.scan_plugins();
    EXPECT_EQ(reg.dispatch("direct", nullptr).result, "direct\n");
}

TEST(ToolRegistryTest, PluginTimeoutIsAnError) {
    TempDir dir;
    auto cfg = test_config(dir);
    cfg.tool_timeout = 1;
    add_plugin(dir, "sleepy", R"({"toolName": "sleepy", "executable": "run.sh", "runtime": "sh"})",
               "run.sh", "sleep 4\n");
    ToolRegistry reg(cfg);
    reg.scan_plugins();

    auto start = std::chrono::steady_clock::now();
    auto r = reg.dispatch("sleepy", nlohmann::json::object());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.result.find("timed out"), std::string::npos);
    EXPECT_LT(elapsed, 3000);
}

TEST(ToolRegistryTest, InstructionUsesSkillExecutor) {
    TempDir dir;
    auto cfg = test_config(dir);
    write_script(dir.sub("executor.sh"),
                 "cat > \"$(dirname \"$0\")/last_input.json\"\n"
                 "echo '{\"success\": true, \"instructions\": \"Step 1: read the diff\"}'\n");
    cfg.skill_executor = {"/bin/sh", dir.sub("executor.sh")};
    add_skill(dir, "review", "name: Code Review!\ndescription: Reviews code\n");

    ToolRegistry reg(cfg);
    reg.scan_plugins();
    auto r = reg.dispatch("code_review", {{"file", "a.cpp"}});
    ASSERT_TRUE(r.ok) << r.result;
    EXPECT_EQ(r.result, "Step 1: read the diff");

    auto sent = nlohmann::json::parse(read_file(dir.sub("last_input.json")));
    EXPECT_EQ(sent["tool"], "run_skill");
    EXPECT_EQ(sent["args"]["skill_name"], "Code Review!");
    EXPECT_EQ(sent["args"]["args"]["file"], "a.cpp");
    EXPECT_EQ(sent["args"]["project_root"], dir.path());
}

TEST(ToolRegistryTest, InstructionFailureAndRawOutput) {
    TempDir dir;
    auto cfg = test_config(dir);
    write_script(dir.sub("executor.sh"),
                 "input=$(cat)\n"
                 "case \"$input\" in\n"
                 "  *broken*) echo '{\"success\": false, \"error\": \"skill crashed\"}' ;;\n"
                 "  *) echo 'plain text instructions' ;;\n"
                 "esac\n");
    cfg.skill_executor = {"/bin/sh", dir.sub("executor.sh")};
    add_skill(dir, "broken", "name: broken\n");
    add_skill(dir, "plain", "name: plain\n");

    ToolRegistry reg(cfg);
    reg.scan_plugins();

    auto bad = reg.dispatch("broken", nlohmann::json::object());
    EXPECT_FALSE(bad.ok);
    EXPECT_EQ(bad.result, "skill crashed");

    auto raw = reg.dispatch("plain", nlohmann::json::object());
    EXPECT_TRUE(raw.ok);
    EXPECT_EQ(raw.result, "plain text instructions\n");
}

TEST(ToolRegistryTest, McpToolsJoinTheCatalog) {
    TempDir dir;
    std::string server = DDCORE_FAKE_MCP_SERVER;
    write_file(dir.sub("mcp-servers.json"), nlohmann::json{
        {"servers", {{"alpha", {{"command", server}, {"args", {"--label", "alpha", "--tools", "echo,search"}}}}}}
    }.dump());

    ToolRegistry reg(test_config(dir));
    reg.register_builtin("echo", [](const nlohmann::json&) { return std::string("builtin echo"); });
    EXPECT_EQ(reg.scan_mcp_servers(), 1);

    auto all = reg.list_all();
    auto search = find_summary(all, "search");
    ASSERT_FALSE(search.is_null());
    EXPECT_EQ(search["type"], "mcp");
    EXPECT_EQ(search["server"], "alpha");

    EXPECT_EQ(find_summary(all, "echo")["type"], "builtin");
    auto qualified = find_summary(all, "mcp_alpha_echo");
    ASSERT_FALSE(qualified.is_null());
    EXPECT_TRUE(qualified["inputs"]["text"]["required"].get<bool>());

    EXPECT_EQ(reg.dispatch("echo", {{"text", "x"}}).result, "builtin echo");
    EXPECT_EQ(reg.dispatch("mcp_alpha_echo", {{"text", "x"}}).result, "x");
    EXPECT_EQ(reg.dispatch("search", {{"query", "q"}}).result, "alpha results for q");

    auto names = names_of(all);
    EXPECT_EQ(names.size(), all.size());
}

TEST(ToolRegistryTest, PluginSkipsNameOwnedByMcp) {
    TempDir dir;
    std::string server = DDCORE_FAKE_MCP_SERVER;
    write_file(dir.sub("mcp-servers.json"), nlohmann::json{
        {"servers", {{"alpha", {{"command", server}, {"args", {"--tools", "search"}}}}}}
    }.dump());
    add_plugin(dir, "search", R"({"toolName": "search", "executable": "run.sh", "runtime": "sh"})");

    ToolRegistry reg(test_config(dir));
    reg.scan_mcp_servers();
    EXPECT_EQ(reg.scan_plugins(), 0u);
    EXPECT_EQ(reg.find("search")->kind(), ToolKind::mcp);
}

TEST(ToolRegistryTest, LateBuiltinMovesMcpToolAside) {
    TempDir dir;
    std::string server = DDCORE_FAKE_MCP_SERVER;
    write_file(dir.sub("mcp-servers.json"), nlohmann::json{
        {"servers", {{"alpha", {{"command", server}, {"args", {"--tools", "echo,search"}}}}}}
    }.dump());

    ToolRegistry reg(test_config(dir));
    reg.scan_mcp_servers();
    ASSERT_EQ(reg.find("echo")->kind(), ToolKind::mcp);

    reg.register_builtin("echo", [](const nlohmann::json&) { return std::string("from builtin"); });

    auto all = reg.list_all();
    EXPECT_EQ(names_of(all).size(), all.size());
    EXPECT_EQ(find_summary(all, "echo")["type"], "builtin");
    EXPECT_EQ(find_summary(all, "mcp_alpha_echo")["type"], "mcp");
    EXPECT_EQ(find_summary(all, "search")["type"], "mcp");

    EXPECT_EQ(reg.dispatch("echo", {{"text", "x"}}).result, "from builtin");
    EXPECT_EQ(reg.dispatch("mcp_alpha_echo", {{"text", "x"}}).result, "x");
}

TEST(ToolRegistryTest, ReloadMatchesFreshStart) {
    TempDir dir;
    std::string server = DDCORE_FAKE_MCP_SERVER;
    write_file(dir.sub("mcp-servers.json"), nlohmann::json{
        {"servers", {{"alpha", {{"command", server}, {"args", {"--tools", "search"}}}}}}
    }.dump());

    ToolRegistry reg(test_config(dir));
    reg.scan_plugins();
    reg.scan_mcp_servers();
    ASSERT_EQ(reg.find("search")->kind(), ToolKind::mcp);

    // A plugin with the same name appears while MCP owns it.
    add_plugin(dir, "search", R"({"toolName": "search", "executable": "run.sh", "runtime": "sh"})");
    reg.reload();

    ToolRegistry fresh(test_config(dir));
    fresh.scan_plugins();
    fresh.scan_mcp_servers();

    EXPECT_EQ(reg.find("search")->kind(), ToolKind::plugin);
    EXPECT_EQ(fresh.find("search")->kind(), ToolKind::plugin);
    EXPECT_EQ(names_of(reg.list_all()), names_of(fresh.list_all()));
    EXPECT_TRUE(reg.is_registered("mcp_alpha_search"));
}

TEST(ToolRegistryTest, McpErrorsBecomeErrorResults) {
    TempDir dir;
    std::string server = DDCORE_FAKE_MCP_SERVER;
    write_file(dir.sub("mcp-servers.json"), nlohmann::json{
        {"servers", {{"alpha", {{"command", server}, {"args", {"--tools", "fail"}}}}}}
    }.dump());

    ToolRegistry reg(test_config(dir));
    reg.scan_mcp_servers();
    auto r = reg.dispatch("fail", nlohmann::json::object());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.result, "boom\nsecond line");
}
