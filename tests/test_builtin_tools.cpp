#include "tools/builtin_tools.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using namespace ddcore;
using namespace ddcore::test;

class BuiltinToolsTest : public ::testing::Test {
protected:
    TempDir dir;
    Config cfg = test_config(dir);
    ToolRegistry reg{cfg};

    void SetUp() override {
        register_builtin_tools(reg, cfg);
    }
};

TEST_F(BuiltinToolsTest, RegistersTheFileAndCommandSet) {
    for (auto name : {"readFile", "writeFile", "appendFile", "listDir", "runCmd"}) {
        auto spec = reg.find(name);
        ASSERT_TRUE(spec.has_value()) << name;
        EXPECT_EQ(spec->kind(), ToolKind::builtin);
        EXPECT_FALSE(spec->description.empty());
    }
    EXPECT_EQ(reg.find("runCmd")->danger_level, "high");
}

TEST_F(BuiltinToolsTest, WriteAppendAndReadInsideDataDir) {
    auto w = reg.dispatch("writeFile", {{"path", "notes/today.md"}, {"content", "line one\n"}});
    ASSERT_TRUE(w.ok) << w.result;
    auto a = reg.dispatch("appendFile", {{"path", "/notes/today.md"}, {"content", "line two\n"}});
    ASSERT_TRUE(a.ok) << a.result;

    EXPECT_EQ(read_file(dir.sub("notes/today.md")), "line one\nline two\n");

    auto r = reg.dispatch("readFile", {{"path", "notes/today.md"}});
    ASSERT_TRUE(r.ok) << r.result;
    EXPECT_EQ(r.result, "line one\nline two\n");
}

TEST_F(BuiltinToolsTest, RefusesPathsOutsideDataDir) {
    auto r = reg.dispatch("readFile", {{"path", "../../etc/passwd"}});
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.result.find("Access denied"), std::string::npos);

    auto w = reg.dispatch("writeFile", {{"path", "../escape.txt"}, {"content", "x"}});
    EXPECT_FALSE(w.ok);
    EXPECT_FALSE(fs::exists(fs::path(dir.path()).parent_path() / "escape.txt"));
}

TEST_F(BuiltinToolsTest, ReadFileOutsideOnlyWhenAllowed) {
    TempDir other;
    write_file(other.sub("outside.txt"), "outside");

    EXPECT_FALSE(reg.dispatch("readFile", {{"path", other.sub("outside.txt")}}).ok);
    auto r = reg.dispatch("readFile", {{"path", other.sub("outside.txt")}, {"allowOutside", true}});
    ASSERT_TRUE(r.ok) << r.result;
    EXPECT_EQ(r.result, "outside");
}

TEST_F(BuiltinToolsTest, ReadMissingFileFails) {
    auto r = reg.dispatch("readFile", {{"path", "absent.txt"}});
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.result.find("File not found"), std::string::npos);
}

TEST_F(BuiltinToolsTest, ListDirReturnsSortedEntries) {
    write_file(dir.sub("docs/b.txt"), "bb");
    write_file(dir.sub("docs/a.txt"), "a");
    fs::create_directories(dir.sub("docs/sub"));

    auto r = reg.dispatch("listDir", {{"path", "docs"}});
    ASSERT_TRUE(r.ok) << r.result;
    auto items = nlohmann::json::parse(r.result);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]["name"], "a.txt");
    EXPECT_EQ(items[0]["size"], 1);
    EXPECT_EQ(items[1]["name"], "b.txt");
    EXPECT_EQ(items[2]["name"], "sub");
    EXPECT_EQ(items[2]["type"], "dir");
}

TEST_F(BuiltinToolsTest, RunCmdReportsStreamsAndExitCode) {
    auto r = reg.dispatch("runCmd", {{"command", "echo out; echo err >&2; exit 3"}});
    ASSERT_TRUE(r.ok) << r.result;
    EXPECT_EQ(r.result, "STDOUT:\nout\n\nSTDERR:\nerr\n\nExit Code: 3");
}

TEST_F(BuiltinToolsTest, RunCmdDefaultsToDataDir) {
    auto r = reg.dispatch("runCmd", {{"command", "pwd -P"}});
    ASSERT_TRUE(r.ok) << r.result;
    EXPECT_NE(r.result.find(fs::canonical(dir.path()).string()), std::string::npos);
}

TEST_F(BuiltinToolsTest, RunCmdBlocksDestructiveCommands) {
    for (auto cmd : {"rm -rf /", "sudo shutdown now", "rm -r -f /home", "mkfs.ext4 /dev/sda"}) {
        auto r = reg.dispatch("runCmd", {{"command", cmd}});
        EXPECT_FALSE(r.ok) << cmd;
        EXPECT_NE(r.result.find("Dangerous command blocked"), std::string::npos) << cmd;
    }
    EXPECT_TRUE(reg.dispatch("runCmd", {{"command", "rm -rf ./scratch"}}).ok);
}

TEST_F(BuiltinToolsTest, RunCmdTimesOut) {
    auto r = reg.dispatch("runCmd", {{"command", "sleep 5"}, {"timeout", 1}});
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.result, "Command timed out after 1s");
}

TEST_F(BuiltinToolsTest, RunCmdRejectsEmptyCommand) {
    auto r = reg.dispatch("runCmd", nlohmann::json::object());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.result, "Command cannot be empty");
}
