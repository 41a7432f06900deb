#pragma once
#include "tool_registry.hpp"
#include "worker_pool.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <future>
#include <optional>
#include <nlohmann/json.hpp>

namespace ddcore {

enum class AgentStatus { pending, queued, running, completed, failed };

const char* status_name(AgentStatus status);

struct AgentRecord {
    std::string id;
    std::string type;
    std::string task;
    std::vector<std::string> tools;
    std::string context;
    AgentStatus status = AgentStatus::pending;
    std::string result;
    std::string error;
    int64_t started_at = 0;      // epoch ms
    int64_t completed_at = 0;    // epoch ms

    bool finished() const {
        return status == AgentStatus::completed || status == AgentStatus::failed;
    }
    nlohmann::json to_json() const;
};

// Runs short tool-driven explorations on a fixed-size pool. Admission is
// decided at spawn time: when every slot is busy the new agent is marked
// queued and never runs.
class SubagentManager {
public:
    SubagentManager(ToolRegistry& registry, int max_concurrent = 5,
                    int retention_s = 3600, int sweep_interval_s = 300);
    ~SubagentManager();

    SubagentManager(const SubagentManager&) = delete;
    SubagentManager& operator=(const SubagentManager&) = delete;

    // Never blocks. Returns the new agent id.
    std::string spawn(const std::string& type, const std::string& task,
                      const std::vector<std::string>& tools, const std::string& context = "");

    std::optional<AgentRecord> get_status(const std::string& id) const;
    std::vector<AgentRecord> get_all_status() const;

    // Waits for each id against one shared deadline. Unknown ids are omitted.
    std::vector<AgentRecord> collect_results(const std::vector<std::string>& ids, int timeout_ms);

    // Removes finished records older than max_age_s; returns how many
    size_t cleanup_old_agents(int max_age_s);

    void start_sweeper();
    void shutdown();

    size_t running_count() const;
    int max_concurrent() const { return max_concurrent_; }

private:
    ToolRegistry& registry_;
    int max_concurrent_;
    int retention_s_;
    int sweep_interval_s_;

    mutable std::mutex mutex_;
    std::map<std::string, AgentRecord> agents_;
    std::map<std::string, std::shared_future<void>> done_;
    std::atomic<uint64_t> counter_{0};

    std::atomic<bool> sweeping_{false};
    std::thread sweeper_;
    WorkerPool pool_;

    size_t running_count_locked() const;
    void run_agent(const std::string& id);
    std::string explore(const AgentRecord& agent);
    void sweep_loop();
};

// Heuristic arguments for one tool, derived from the task text:
// search-like tools get {query, keywords}, file-like tools {path},
// directory-like tools {path} defaulting to ".", anything else
// {query, task, context}. Returns null when a file-like tool has no path
// to work on.
nlohmann::json build_tool_args(const std::string& tool, const std::string& task,
                               const std::string& context);

std::vector<std::string> extract_keywords(const std::string& text, size_t max_count = 8);
std::string extract_path(const std::string& text);

} // namespace ddcore
