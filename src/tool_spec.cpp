#include "tool_spec.hpp"

namespace ddcore {

const char* kind_name(ToolKind kind) {
    switch (kind) {
        case ToolKind::builtin:     return "builtin";
        case ToolKind::plugin:      return "plugin";
        case ToolKind::instruction: return "instruction";
        case ToolKind::mcp:         return "mcp";
    }
    return "unknown";
}

static InputField field_from(const std::string& name, const nlohmann::json& def) {
    InputField f;
    f.name = name;
    if (!def.is_object()) return f;
    if (def.contains("type") && def["type"].is_string()) f.type = def["type"].get<std::string>();
    if (def.contains("required") && def["required"].is_boolean()) f.required = def["required"].get<bool>();
    if (def.contains("description") && def["description"].is_string()) {
        f.description = def["description"].get<std::string>();
    }
    return f;
}

std::vector<InputField> inputs_from_json(const nlohmann::json& j) {
    std::vector<InputField> out;

    if (j.is_array()) {
        for (auto& item : j) {
            if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) continue;
            out.push_back(field_from(item["name"].get<std::string>(), item));
        }
        return out;
    }
    if (!j.is_object()) return out;

    // JSON Schema form
    if (j.contains("properties") && j["properties"].is_object()) {
        std::vector<std::string> required;
        if (j.contains("required") && j["required"].is_array()) {
            for (auto& r : j["required"]) {
                if (r.is_string()) required.push_back(r.get<std::string>());
            }
        }
        for (auto& [name, def] : j["properties"].items()) {
            auto f = field_from(name, def);
            for (auto& r : required) {
                if (r == name) f.required = true;
            }
            out.push_back(std::move(f));
        }
        return out;
    }

    for (auto& [name, def] : j.items()) {
        out.push_back(field_from(name, def));
    }
    return out;
}

nlohmann::json inputs_to_json(const std::vector<InputField>& inputs) {
    nlohmann::json out = nlohmann::json::object();
    for (auto& f : inputs) {
        nlohmann::json def = {{"type", f.type}, {"required", f.required}};
        if (!f.description.empty()) def["description"] = f.description;
        out[f.name] = def;
    }
    return out;
}

nlohmann::json ToolSpec::summary() const {
    nlohmann::json j = {
        {"name", name},
        {"type", kind_name(kind())},
        {"description", description},
        {"inputs", inputs_to_json(inputs)},
        {"dangerLevel", danger_level},
        {"version", version}
    };
    if (auto* mcp = std::get_if<McpSource>(&source)) {
        j["server"] = mcp->server;
    }
    return j;
}

} // namespace ddcore
