#include "config.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <cstdlib>

using namespace ddcore;
using namespace ddcore::test;

TEST(ConfigTest, DefaultsWhenFileMissing) {
    TempDir dir;
    Config cfg = Config::load(dir.sub("nope.json"));
    EXPECT_EQ(cfg.tool_timeout, 60);
    EXPECT_EQ(cfg.max_tool_output, 512u * 1024u);
    EXPECT_EQ(cfg.mcp_call_timeout, 30);
    EXPECT_EQ(cfg.mcp_connect_timeout, 15);
    EXPECT_EQ(cfg.max_subagents, 5);
    EXPECT_EQ(cfg.port, 3001);
    EXPECT_EQ(cfg.runtimes.at("python"), "python3");
}

TEST(ConfigTest, MalformedFileFallsBackToDefaults) {
    TempDir dir;
    write_file(dir.sub("config.json"), "{ broken");
    Config cfg = Config::load(dir.sub("config.json"));
    EXPECT_EQ(cfg.max_subagents, 5);
}

TEST(ConfigTest, LoadsOverridesAndDerivedPaths) {
    TempDir dir;
    write_file(dir.sub("config.json"), R"({
        "data_dir": ")" + dir.path() + R"(",
        "max_subagents": 2,
        "tool_timeout": 9,
        "runtimes": {"ruby": "ruby"},
        "port": 4000
    })");
    Config cfg = Config::load(dir.sub("config.json"));
    EXPECT_EQ(cfg.max_subagents, 2);
    EXPECT_EQ(cfg.tool_timeout, 9);
    EXPECT_EQ(cfg.port, 4000);
    EXPECT_EQ(cfg.runtimes.at("ruby"), "ruby");
    EXPECT_EQ(cfg.runtimes.at("node"), "node");
    EXPECT_EQ(cfg.mcp_config_path(), dir.path() + "/mcp-servers.json");
    ASSERT_EQ(cfg.skill_paths().size(), 1u);
    EXPECT_EQ(cfg.skill_paths()[0], dir.path() + "/skills");
}

TEST(ConfigTest, SaveThenLoadKeepsValues) {
    TempDir dir;
    Config cfg;
    cfg.data_dir = dir.path();
    cfg.subagent_retention = 42;
    cfg.skill_executor = {"/bin/sh", "exec.sh"};
    cfg.save(dir.sub("conf/config.json"));

    Config loaded = Config::load(dir.sub("conf/config.json"));
    EXPECT_EQ(loaded.subagent_retention, 42);
    EXPECT_EQ(loaded.skill_executor_argv(), (std::vector<std::string>{"/bin/sh", "exec.sh"}));
}

TEST(ConfigTest, ExpandsHomePrefix) {
    std::string home = home_dir();
    EXPECT_EQ(expand_path("~/x/y"), home + "/x/y");
    EXPECT_EQ(expand_path("/abs"), "/abs");
}

TEST(McpServerFileTest, KeepsFileOrderAndSkipsInvalid) {
    auto configs = parse_mcp_servers(R"({
        "servers": {
            "zeta": {"command": "zeta-server", "args": ["--a", "1"], "env": {"TOKEN": "${HOME}"}},
            "alpha": {"command": "alpha-server"},
            "off": {"command": "x", "enabled": false},
            "broken": {"args": ["y"]}
        }
    })");
    ASSERT_EQ(configs.size(), 2u);
    EXPECT_EQ(configs[0].name, "zeta");
    EXPECT_EQ(configs[0].args, (std::vector<std::string>{"--a", "1"}));
    EXPECT_EQ(configs[0].env.at("TOKEN"), "${HOME}");
    EXPECT_EQ(configs[1].name, "alpha");
}

TEST(McpServerFileTest, WrongFieldTypesSkipOnlyThatServer) {
    auto configs = parse_mcp_servers(R"({
        "servers": {
            "bad": {"command": 123},
            "flag": {"command": "x", "enabled": "yes"},
            "good": {"command": "/bin/cat"}
        }
    })");
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].name, "good");
    EXPECT_EQ(configs[0].command, "/bin/cat");
}

TEST(McpServerFileTest, AcceptsMcpServersAlias) {
    auto configs = parse_mcp_servers(R"({"mcpServers": {"one": {"command": "srv"}}})");
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].command, "srv");
}

TEST(McpServerFileTest, MissingOrInvalidFileYieldsNothing) {
    TempDir dir;
    EXPECT_TRUE(load_mcp_servers(dir.sub("missing.json")).empty());
    EXPECT_TRUE(parse_mcp_servers("][").empty());
}

TEST(UtilsTest, ExpandEnvVars) {
    ::setenv("DDCORE_TEST_VAR", "value", 1);
    ::unsetenv("DDCORE_TEST_UNSET");
    EXPECT_EQ(expand_env_vars("a-${DDCORE_TEST_VAR}-b"), "a-value-b");
    EXPECT_EQ(expand_env_vars("${DDCORE_TEST_UNSET}x"), "x");
    EXPECT_EQ(expand_env_vars("keep ${open"), "keep ${open");
}

TEST(UtilsTest, SecondsToMsIsClamped) {
    EXPECT_EQ(seconds_to_ms(1.5, 3600.0), 1500);
    EXPECT_EQ(seconds_to_ms(-5.0, 3600.0), 0);
    EXPECT_EQ(seconds_to_ms(1e300, 3600.0), 3600000);
    EXPECT_EQ(seconds_to_ms(std::nan(""), 3600.0), 0);
}

TEST(UtilsTest, TruncateOutputAppendsMarker) {
    EXPECT_EQ(truncate_output("short", 10), "short");
    EXPECT_EQ(truncate_output("0123456789abc", 10), "0123456789\n...[truncated]");
}
