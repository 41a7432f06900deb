#pragma once
#include <string>
#include <cstdlib>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace ddcore {

namespace fs = std::filesystem;

inline constexpr const char* DDCORE_VERSION = "0.1.0";

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_data_dir() {
    return home_dir() + "/.ddcore";
}

inline std::string default_config_path() {
    return default_data_dir() + "/config.json";
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Replaces every ${VAR} with the value of VAR from the process environment.
// Unset variables expand to an empty string; a "${" without a closing brace
// is kept literally.
inline std::string expand_env_vars(const std::string& value) {
    std::string out;
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            auto close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out += value.substr(i);
                break;
            }
            std::string var = value.substr(i + 2, close - i - 2);
            const char* v = std::getenv(var.c_str());
            if (v) out += v;
            i = close + 1;
            continue;
        }
        out += value[i++];
    }
    return out;
}

// Cuts text down to max_chars and appends a marker; never errors.
inline std::string truncate_output(const std::string& text, size_t max_chars) {
    if (max_chars == 0 || text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "\n...[truncated]";
}

// Converts a client-supplied timeout in seconds to milliseconds, clamped to
// [0, max_s]. NaN maps to 0.
inline int seconds_to_ms(double s, double max_s) {
    if (!(s > 0)) return 0;
    if (s > max_s) s = max_s;
    return static_cast<int>(s * 1000);
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline int64_t epoch_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace ddcore
