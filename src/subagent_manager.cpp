#include "subagent_manager.hpp"
#include <iostream>
#include <sstream>
#include <set>
#include <algorithm>
#include <cctype>

namespace ddcore {

const char* status_name(AgentStatus status) {
    switch (status) {
        case AgentStatus::pending:   return "pending";
        case AgentStatus::queued:    return "queued";
        case AgentStatus::running:   return "running";
        case AgentStatus::completed: return "completed";
        case AgentStatus::failed:    return "failed";
    }
    return "unknown";
}

nlohmann::json AgentRecord::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"type", type},
        {"task", task},
        {"tools", tools},
        {"context", context},
        {"status", status_name(status)},
        {"startedAt", started_at ? nlohmann::json(started_at) : nlohmann::json()},
        {"completedAt", completed_at ? nlohmann::json(completed_at) : nlohmann::json()}
    };
    if (!result.empty()) j["result"] = result;
    if (!error.empty()) j["error"] = error;
    return j;
}

// ── Argument heuristics ──────────────────────────────────────────────

static bool has_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (auto* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

static bool looks_like_symbol(const std::string& word) {
    if (word.find('_') != std::string::npos) return true;
    for (size_t i = 1; i < word.size(); ++i) {
        if (std::islower(static_cast<unsigned char>(word[i - 1])) &&
            std::isupper(static_cast<unsigned char>(word[i]))) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> extract_keywords(const std::string& text, size_t max_count) {
    static const std::set<std::string> stopwords = {
        "the", "and", "for", "with", "that", "this", "from", "into", "find", "search",
        "show", "look", "where", "what", "which", "how", "all", "are", "was", "use",
        "used", "uses", "file", "files", "code", "function", "about", "please", "any",
        "each", "its", "our", "your", "there", "them", "then", "when", "who", "why",
        "does", "did", "can", "should", "would", "could", "has", "have", "not", "get"
    };

    std::vector<std::string> words;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= 3 && !stopwords.count(to_lower(current)) &&
            std::find(words.begin(), words.end(), current) == words.end()) {
            words.push_back(current);
        }
        current.clear();
    };
    for (char c : text) {
        bool word_char = std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        if (word_char && (!current.empty() || !std::isdigit(static_cast<unsigned char>(c)))) {
            current += c;
        } else {
            flush();
        }
    }
    flush();

    // Identifiers first, plain words after, each in order of appearance
    std::stable_partition(words.begin(), words.end(), looks_like_symbol);
    if (words.size() > max_count) words.resize(max_count);
    return words;
}

std::string extract_path(const std::string& text) {
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        auto start = token.find_first_not_of("\"'`([{<");
        auto end = token.find_last_not_of("\"'`)]}>,;:.?!");
        if (start == std::string::npos || end == std::string::npos || end < start) continue;
        token = token.substr(start, end - start + 1);
        if (token.find("://") != std::string::npos) continue;

        if (token.find('/') != std::string::npos) return token;

        auto dot = token.rfind('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 >= token.size()) continue;
        std::string ext = token.substr(dot + 1);
        if (ext.size() > 5) continue;
        bool alnum = std::all_of(ext.begin(), ext.end(),
                                 [](char c) { return std::isalnum(static_cast<unsigned char>(c)); });
        bool alpha = std::any_of(ext.begin(), ext.end(),
                                 [](char c) { return std::isalpha(static_cast<unsigned char>(c)); });
        if (alnum && alpha) return token;
    }
    return "";
}

nlohmann::json build_tool_args(const std::string& tool, const std::string& task,
                               const std::string& context) {
    std::string lower = to_lower(tool);

    if (has_any(lower, {"search", "grep", "find", "query"})) {
        auto keywords = extract_keywords(task + " " + context);
        std::string query;
        for (size_t i = 0; i < keywords.size() && i < 3; ++i) {
            if (!query.empty()) query += " ";
            query += keywords[i];
        }
        if (query.empty()) query = task;
        return {{"query", query}, {"keywords", keywords}};
    }
    if (has_any(lower, {"read", "file", "open", "cat"})) {
        std::string path = extract_path(task);
        if (path.empty()) path = extract_path(context);
        if (path.empty()) return nullptr;
        return {{"path", path}};
    }
    if (has_any(lower, {"list", "dir"})) {
        std::string path = extract_path(task);
        return {{"path", path.empty() ? "." : path}};
    }
    return {{"query", task}, {"task", task}, {"context", context}};
}

// ── Manager ──────────────────────────────────────────────────────────

SubagentManager::SubagentManager(ToolRegistry& registry, int max_concurrent,
                                 int retention_s, int sweep_interval_s)
    : registry_(registry)
    , max_concurrent_(max_concurrent < 1 ? 1 : max_concurrent)
    , retention_s_(retention_s)
    , sweep_interval_s_(sweep_interval_s)
    , pool_(static_cast<size_t>(max_concurrent_))
{}

SubagentManager::~SubagentManager() {
    shutdown();
}

std::string SubagentManager::spawn(const std::string& type, const std::string& task,
                                   const std::vector<std::string>& tools, const std::string& context) {
    std::string id = "agent_" + std::to_string(epoch_now_ms()) + "_" + std::to_string(++counter_);

    auto done = std::make_shared<std::promise<void>>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        AgentRecord rec;
        rec.id = id;
        rec.type = type.empty() ? "explore" : type;
        rec.task = task;
        rec.tools = tools;
        rec.context = context;
        rec.status = AgentStatus::pending;

        size_t running = running_count_locked();
        if (running >= static_cast<size_t>(max_concurrent_)) {
            rec.status = AgentStatus::queued;
            rec.error = "capacity reached (" + std::to_string(running) + "/" +
                        std::to_string(max_concurrent_) + " running), agent not scheduled";
            agents_[id] = std::move(rec);
            std::cerr << "[subagent] " << id << " queued: at capacity\n";
            return id;
        }

        rec.status = AgentStatus::running;
        rec.started_at = epoch_now_ms();
        agents_[id] = std::move(rec);
        done_[id] = done->get_future().share();
    }

    try {
        pool_.submit([this, id, done]() {
            run_agent(id);
            done->set_value();
        });
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rec = agents_[id];
        rec.status = AgentStatus::failed;
        rec.error = e.what();
        rec.completed_at = epoch_now_ms();
        done->set_value();
        return id;
    }

    std::cerr << "[subagent] " << id << " started (" << tools.size() << " tools)\n";
    return id;
}

void SubagentManager::run_agent(const std::string& id) {
    AgentRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) return;
        snapshot = it->second;
    }

    std::string output;
    std::string error;
    bool ok = false;
    try {
        output = explore(snapshot);
        ok = true;
    } catch (const std::exception& e) {
        error = e.what();
        std::cerr << "[subagent] " << id << " failed: " << error << "\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return;
    it->second.status = ok ? AgentStatus::completed : AgentStatus::failed;
    it->second.result = output;
    it->second.error = error;
    it->second.completed_at = epoch_now_ms();
}

std::string SubagentManager::explore(const AgentRecord& agent) {
    if (agent.tools.empty()) throw std::runtime_error("no tools assigned");

    std::string buffer;
    for (auto& tool : agent.tools) {
        std::string fragment;
        if (!registry_.is_registered(tool)) {
            fragment = "[" + tool + "] error: tool not registered";
        } else {
            auto args = build_tool_args(tool, agent.task, agent.context);
            if (args.is_null()) {
                fragment = "[" + tool + "] error: no file path found in task";
            } else {
                auto r = registry_.dispatch(tool, args);
                fragment = "[" + tool + "] " + (r.ok ? "" : "error: ") + truncate_output(r.result, 2000);
            }
        }
        if (!buffer.empty()) buffer += "\n\n";
        buffer += fragment;
    }
    return buffer;
}

std::optional<AgentRecord> SubagentManager::get_status(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return std::nullopt;
    return it->second;
}

std::vector<AgentRecord> SubagentManager::get_all_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentRecord> out;
    for (auto& [_, rec] : agents_) out.push_back(rec);
    return out;
}

std::vector<AgentRecord> SubagentManager::collect_results(const std::vector<std::string>& ids, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::vector<AgentRecord> out;

    for (auto& id : ids) {
        std::shared_future<void> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!agents_.count(id)) continue;
            auto it = done_.find(id);
            if (it != done_.end()) done = it->second;
        }
        if (done.valid()) done.wait_until(deadline);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        if (it != agents_.end()) out.push_back(it->second);
    }
    return out;
}

size_t SubagentManager::running_count_locked() const {
    size_t n = 0;
    for (auto& [_, rec] : agents_) {
        if (rec.status == AgentStatus::running) n++;
    }
    return n;
}

size_t SubagentManager::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_count_locked();
}

size_t SubagentManager::cleanup_old_agents(int max_age_s) {
    int64_t cutoff = epoch_now_ms() - static_cast<int64_t>(max_age_s) * 1000;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = agents_.begin(); it != agents_.end();) {
        if (it->second.finished() && it->second.completed_at < cutoff) {
            done_.erase(it->first);
            it = agents_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        std::cerr << "[subagent] Cleaned up " << removed << " finished agent(s)\n";
    }
    return removed;
}

// ── Sweeper ──────────────────────────────────────────────────────────

void SubagentManager::start_sweeper() {
    if (sweeping_.exchange(true)) return;
    sweeper_ = std::thread([this]() { sweep_loop(); });
}

void SubagentManager::sweep_loop() {
    std::cerr << "[subagent] Sweeper started (interval=" << sweep_interval_s_
              << "s, retention=" << retention_s_ << "s)\n";
    while (sweeping_) {
        // Sleep in 1s increments so we can respond to stop quickly
        for (int i = 0; i < sweep_interval_s_ && sweeping_; ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (!sweeping_) break;
        cleanup_old_agents(retention_s_);
    }
}

void SubagentManager::shutdown() {
    sweeping_ = false;
    if (sweeper_.joinable()) sweeper_.join();
    pool_.shutdown();
}

} // namespace ddcore
