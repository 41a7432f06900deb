#include "skills_loader.hpp"
#include "utils.hpp"
#include <iostream>
#include <algorithm>

namespace ddcore {

// ── Constructor ──────────────────────────────────────────────────────

SkillsLoader::SkillsLoader(std::vector<std::string> roots)
    : roots_(std::move(roots))
{}

// ── Discovery ────────────────────────────────────────────────────────

void SkillsLoader::discover() {
    manifests_.clear();
    skills_.clear();

    for (auto& root : roots_) {
        scan_directory(root);
    }

    std::cerr << "[tools] Discovered " << manifests_.size() << " manifest(s), "
              << skills_.size() << " skill file(s)\n";
}

void SkillsLoader::scan_directory(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return;

    std::vector<fs::path> dirs;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[tools] Warning: cannot scan " << dir << ": " << ec.message() << "\n";
        return;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[tools] Warning: error while scanning " << dir << ": " << ec.message() << "\n";
            break;
        }
        if (it->is_directory(ec)) dirs.push_back(it->path());
    }
    std::sort(dirs.begin(), dirs.end());

    for (auto& d : dirs) {
        std::string path = d.string();

        if (fs::exists(d / "manifest.json", ec)) {
            ManifestInfo manifest;
            if (load_manifest(path, manifest)) manifests_.push_back(std::move(manifest));
        }
        if (fs::exists(d / "SKILL.md", ec)) {
            auto info = parse_skill(path);
            if (!info.name.empty()) skills_.push_back(std::move(info));
        }
    }
}

bool SkillsLoader::load_manifest(const std::string& dir, ManifestInfo& out) const {
    out.dir = dir;
    out.path = dir + "/manifest.json";

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(read_file(out.path));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[tools] Warning: malformed manifest " << out.path << ": " << e.what() << "\n";
        return false;
    }

    if (j.is_object() && j.contains("tools") && j["tools"].is_array()) {
        out.tools = j["tools"];
    } else if (j.is_object() && j.contains("toolName")) {
        out.tools = nlohmann::json::array({j});
    } else {
        std::cerr << "[tools] Warning: manifest " << out.path << " declares no tools\n";
        return false;
    }
    return true;
}

// ── Parsing ──────────────────────────────────────────────────────────

SkillInfo SkillsLoader::parse_skill(const std::string& skill_dir) {
    SkillInfo info;
    std::string path = skill_dir + "/SKILL.md";
    std::string content = read_file(path);

    info.path = path;
    info.dir = skill_dir;
    info.name = fs::path(skill_dir).filename().string();

    auto meta = parse_frontmatter(content);
    if (!meta["name"].empty()) info.name = meta["name"];
    info.description = meta["description"];
    return info;
}

std::map<std::string, std::string> SkillsLoader::parse_frontmatter(const std::string& content) {
    std::map<std::string, std::string> result;
    if (content.size() < 4 || content.substr(0, 3) != "---") return result;

    // Find closing ---
    auto end_pos = content.find("\n---", 3);
    if (end_pos == std::string::npos) return result;

    std::string yaml = content.substr(3, end_pos - 3);

    // Only top-level "key: value" lines; nested blocks (inputs:, outputs:)
    // are indented and skipped.
    std::istringstream stream(yaml);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty() || line[0] == ' ' || line[0] == '\t' || line[0] == '#') continue;
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        // Trim
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        size_t vstart = value.find_first_not_of(" \t");
        value = vstart == std::string::npos ? "" : value.substr(vstart);

        // Remove surrounding quotes
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        result[key] = value;
    }

    return result;
}

std::string SkillsLoader::normalize_tool_name(const std::string& raw) {
    std::string out;
    bool pending_sep = false;
    for (char c : raw) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            if (pending_sep && !out.empty()) out += '_';
            pending_sep = false;
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            pending_sep = true;
        }
    }
    return out;
}

} // namespace ddcore
