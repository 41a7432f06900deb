#include "builtin_tools.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>

namespace ddcore {

static constexpr uintmax_t MAX_FILE_SIZE = 10 * 1024 * 1024;

static std::string string_arg(const nlohmann::json& args, const char* key, const std::string& fallback = "") {
    if (args.contains(key) && args[key].is_string()) return args[key].get<std::string>();
    return fallback;
}

// Resolves a tool path against the data dir. Leading slashes are dropped so
// "/notes/a.md" means <data>/notes/a.md; anything escaping the data dir is
// refused unless allow_outside is set for an absolute path.
static fs::path resolve_data_path(const std::string& data_dir, const std::string& path,
                                  bool allow_outside = false) {
    if (path.empty()) throw std::runtime_error("Path cannot be empty");

    fs::path base = fs::weakly_canonical(fs::path(data_dir));
    if (allow_outside && fs::path(path).is_absolute()) {
        return fs::weakly_canonical(fs::path(path));
    }

    auto start = path.find_first_not_of('/');
    std::string clean = start == std::string::npos ? "" : path.substr(start);
    fs::path resolved = fs::weakly_canonical(base / clean);

    auto rel = resolved.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..") {
        throw std::runtime_error("Access denied: path outside allowed directory");
    }
    return resolved;
}

static ToolSpec make_spec(const std::string& name, const std::string& description,
                          const char* inputs_json, const std::string& danger) {
    ToolSpec spec;
    spec.name = name;
    spec.description = description;
    spec.inputs = inputs_from_json(nlohmann::json::parse(inputs_json));
    spec.danger_level = danger;
    return spec;
}

void register_fs_tools(ToolRegistry& reg, const Config& cfg) {
    auto data_dir = std::make_shared<std::string>(cfg.data_path());

    // ── readFile ──
    reg.register_builtin(
        make_spec("readFile", "Read a file from the data directory.", R"JSON({
            "path": {"type": "string", "required": true, "description": "Path relative to the data directory"},
            "allowOutside": {"type": "boolean", "description": "Allow an absolute path outside the data directory"}
        })JSON", "safe"),
        [data_dir](const nlohmann::json& args) -> std::string {
            std::string path = string_arg(args, "path");
            bool allow_outside = args.contains("allowOutside") && args["allowOutside"].is_boolean()
                                 && args["allowOutside"].get<bool>();
            fs::path file = resolve_data_path(*data_dir, path, allow_outside);

            if (!fs::exists(file)) throw std::runtime_error("File not found: " + path);
            if (!fs::is_regular_file(file)) throw std::runtime_error("Not a file: " + path);
            if (fs::file_size(file) > MAX_FILE_SIZE) {
                throw std::runtime_error("File too large (>" + std::to_string(MAX_FILE_SIZE) + " bytes)");
            }

            std::ifstream f(file, std::ios::binary);
            if (!f) throw std::runtime_error("Cannot read file: " + path);
            std::ostringstream ss;
            ss << f.rdbuf();
            return ss.str();
        });

    // ── writeFile ──
    reg.register_builtin(
        make_spec("writeFile", "Create or overwrite a file in the data directory.", R"JSON({
            "path": {"type": "string", "required": true},
            "content": {"type": "string", "required": true}
        })JSON", "medium"),
        [data_dir](const nlohmann::json& args) -> std::string {
            std::string content = string_arg(args, "content");
            fs::path file = resolve_data_path(*data_dir, string_arg(args, "path"));

            std::error_code ec;
            fs::create_directories(file.parent_path(), ec);

            std::ofstream f(file, std::ios::binary | std::ios::trunc);
            if (!f) throw std::runtime_error("Cannot write file: " + file.string());
            f << content;
            return "Written " + std::to_string(content.size()) + " bytes to " + file.filename().string();
        });

    // ── appendFile ──
    reg.register_builtin(
        make_spec("appendFile", "Append text to a file in the data directory.", R"JSON({
            "path": {"type": "string", "required": true},
            "content": {"type": "string", "required": true}
        })JSON", "medium"),
        [data_dir](const nlohmann::json& args) -> std::string {
            std::string content = string_arg(args, "content");
            fs::path file = resolve_data_path(*data_dir, string_arg(args, "path"));

            std::error_code ec;
            fs::create_directories(file.parent_path(), ec);

            std::ofstream f(file, std::ios::binary | std::ios::app);
            if (!f) throw std::runtime_error("Cannot write file: " + file.string());
            f << content;
            return "Appended " + std::to_string(content.size()) + " bytes to " + file.filename().string();
        });

    // ── listDir ──
    reg.register_builtin(
        make_spec("listDir", "List a directory inside the data directory.", R"JSON({
            "path": {"type": "string", "description": "Defaults to the data directory itself"}
        })JSON", "safe"),
        [data_dir](const nlohmann::json& args) -> std::string {
            std::string path = string_arg(args, "path", ".");
            fs::path dir = path == "." ? fs::weakly_canonical(fs::path(*data_dir))
                                       : resolve_data_path(*data_dir, path);

            if (!fs::exists(dir)) throw std::runtime_error("Directory not found: " + path);
            if (!fs::is_directory(dir)) throw std::runtime_error("Not a directory: " + path);

            std::vector<fs::directory_entry> entries;
            for (auto& entry : fs::directory_iterator(dir)) entries.push_back(entry);
            std::sort(entries.begin(), entries.end(),
                      [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

            nlohmann::json items = nlohmann::json::array();
            for (auto& entry : entries) {
                std::error_code ec;
                bool is_dir = entry.is_directory(ec);
                uintmax_t size = 0;
                if (!is_dir && entry.is_regular_file(ec)) size = entry.file_size(ec);
                items.push_back({
                    {"name", entry.path().filename().string()},
                    {"type", is_dir ? "dir" : "file"},
                    {"size", size}
                });
            }
            return items.dump();
        });
}

} // namespace ddcore
