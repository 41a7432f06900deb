#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace ddcore {

// A directory that holds manifest.json. `tools` is always a list of tool
// objects, whether the file held a {"tools": [...]} list or a single tool.
struct ManifestInfo {
    std::string dir;
    std::string path;
    nlohmann::json tools = nlohmann::json::array();
};

// A directory that holds SKILL.md.
struct SkillInfo {
    std::string name;          // front-matter name, or the directory name
    std::string description;
    std::string path;          // full path to SKILL.md
    std::string dir;
};

class SkillsLoader {
public:
    explicit SkillsLoader(std::vector<std::string> roots);

    // Walks every root recursively, in sorted path order
    void discover();

    const std::vector<ManifestInfo>& manifests() const { return manifests_; }
    const std::vector<SkillInfo>& skills() const { return skills_; }

    static SkillInfo parse_skill(const std::string& skill_dir);

    // YAML frontmatter parsing
    static std::map<std::string, std::string> parse_frontmatter(const std::string& content);

    // Lower-cases, collapses each run of non-alphanumerics to '_', trims '_'
    static std::string normalize_tool_name(const std::string& raw);

private:
    std::vector<std::string> roots_;
    std::vector<ManifestInfo> manifests_;
    std::vector<SkillInfo> skills_;

    void scan_directory(const std::string& dir);
    bool load_manifest(const std::string& dir, ManifestInfo& out) const;
};

} // namespace ddcore
