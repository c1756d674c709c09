#include "steward/supervisor.hpp"
#include "steward/json_document.hpp"
#include "steward/logging.hpp"
#include "steward/platform.hpp"
#include "steward/process.hpp"

#include <signal.h>

#include <chrono>
#include <thread>

namespace steward {

// ============================================================================
// Process Table
// ============================================================================

Result<std::map<std::string, ServerProcessRecord>> read_process_table(const std::string& path) {
    using TableResult = Result<std::map<std::string, ServerProcessRecord>>;

    auto doc = read_json_document(path);
    if (doc.isErr()) return TableResult::err(doc.error());

    std::map<std::string, ServerProcessRecord> table;
    const auto& d = doc.value();
    for (auto it = d.begin(); it != d.end(); ++it) {
        const auto& v = it.value();
        if (!v.is_object() || !v.contains("pid") || !v["pid"].is_number_integer()) continue;
        ServerProcessRecord rec;
        rec.name = it.key();
        rec.pid = v["pid"].get<int>();
        rec.started_at = detail::get_string(v, "startedAt");
        table[rec.name] = rec;
    }
    return TableResult::ok(table);
}

Result<void> write_process_table(const std::string& path,
                                 const std::map<std::string, ServerProcessRecord>& table) {
    json doc = json::object();
    for (const auto& [name, rec] : table) {
        doc[name] = {{"pid", rec.pid}, {"startedAt", rec.started_at}};
    }
    return write_json_document(path, doc);
}

// ============================================================================
// Supervisor
// ============================================================================

ProcessSupervisor::ProcessSupervisor(const Config& config)
    : config_(config), servers_(config), log_(component_logger(config, "supervisor")) {}

Result<std::map<std::string, ServerProcessRecord>> ProcessSupervisor::load_table() const {
    return read_process_table(config_.paths.process_table);
}

Result<void> ProcessSupervisor::save_table(const std::map<std::string, ServerProcessRecord>& table) const {
    return write_process_table(config_.paths.process_table, table);
}

ProcessState ProcessSupervisor::state(const std::string& name) const {
    auto table = load_table();
    if (table.isErr()) return ProcessState::Stopped;
    auto it = table.value().find(name);
    if (it == table.value().end()) return ProcessState::Stopped;
    return process_alive(it->second.pid) ? ProcessState::Running : ProcessState::Stopped;
}

OperationResult ProcessSupervisor::start(const std::string& name) {
    auto found = servers_.find(name);
    if (found.isErr()) return OperationResult::failure(found.error());
    if (!found.value()) {
        return OperationResult::failure(ErrorCode::NOT_FOUND, "Server '" + name + "' not found");
    }
    const ServerEntry& server = *found.value();

    auto table_result = load_table();
    if (table_result.isErr()) return OperationResult::failure(table_result.error());
    auto& table = table_result.value();

    auto tracked = table.find(name);
    if (tracked != table.end()) {
        if (process_alive(tracked->second.pid)) {
            return OperationResult::success("Server '" + name + "' already running (pid " +
                                            std::to_string(tracked->second.pid) + ")");
        }
        log_->info("{}: dropping stale pid {}", name, tracked->second.pid);
        table.erase(tracked);
    }

    if (!server.enabled) {
        return OperationResult::failure(ErrorCode::VALIDATION_ERROR,
            "Server '" + name + "' is disabled; enable it first");
    }
    if (server.command.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION_ERROR,
            "Server '" + name + "' has no command (url-only servers are not started locally)");
    }

    std::string path_var = server.env.count("PATH") ? server.env.at("PATH") : get_env("PATH").value_or("");
    auto binary = find_executable(server.command, path_var);
    if (!binary) {
        return OperationResult::failure(ErrorCode::PROCESS_ERROR,
            "Server '" + name + "': command not found: " + server.command);
    }

    log_->debug("{}: {}", name, process_state_to_string(ProcessState::Starting));
    auto spawned = spawn_detached(*binary, server.args, server.env);
    if (!spawned.ok) {
        return OperationResult::failure(ErrorCode::PROCESS_ERROR,
            "Server '" + name + "' failed to spawn: " + spawned.error);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(config_.start_grace_ms));

    if (auto exit_code = try_reap(spawned.pid)) {
        log_->warn("{}: exited during startup with code {}", name, *exit_code);
        return OperationResult::failure(ErrorCode::PROCESS_ERROR,
            "Server '" + name + "' exited immediately with code " + std::to_string(*exit_code));
    }

    ServerProcessRecord rec;
    rec.name = name;
    rec.pid = spawned.pid;
    rec.started_at = get_current_timestamp();
    table[name] = rec;

    auto saved = save_table(table);
    if (saved.isErr()) {
        // An untracked server could never be stopped by steward
        auto killed = send_signal(spawned.pid, SIGKILL, true);
        if (killed.isOk()) wait_for_exit(spawned.pid, config_.kill_wait_ms);
        return OperationResult::failure(saved.error().code(),
            "Server '" + name + "' started but could not be tracked: " + saved.error().message());
    }

    log_->info("{}: {} (pid {})", name, process_state_to_string(ProcessState::Running), spawned.pid);
    return OperationResult::success("Started server '" + name + "' (pid " + std::to_string(spawned.pid) + ")");
}

OperationResult ProcessSupervisor::stop(const std::string& name) {
    auto table_result = load_table();
    if (table_result.isErr()) return OperationResult::failure(table_result.error());
    auto& table = table_result.value();

    auto tracked = table.find(name);
    if (tracked == table.end()) {
        return OperationResult::failure(ErrorCode::NOT_FOUND,
            "Server '" + name + "' was not started by steward");
    }
    int pid = tracked->second.pid;

    if (!process_alive(pid)) {
        table.erase(tracked);
        auto saved = save_table(table);
        if (saved.isErr()) return OperationResult::failure(saved.error());
        log_->info("{}: cleared stale pid {}", name, pid);
        return OperationResult::success("Server '" + name + "' was not running (cleared stale pid " +
                                        std::to_string(pid) + ")");
    }

    log_->debug("{}: {}", name, process_state_to_string(ProcessState::Stopping));
    auto term = send_signal(pid, SIGTERM, true);
    if (term.isErr()) return OperationResult::failure(term.error());

    bool exited = wait_for_exit(pid, config_.stop_grace_ms);
    bool forced = false;
    if (!exited) {
        log_->warn("{}: pid {} ignored SIGTERM, sending SIGKILL", name, pid);
        auto killed = send_signal(pid, SIGKILL, true);
        if (killed.isErr()) return OperationResult::failure(killed.error());
        forced = true;
        exited = wait_for_exit(pid, config_.kill_wait_ms);
    }
    if (!exited) {
        return OperationResult::failure(ErrorCode::PROCESS_ERROR,
            "Server '" + name + "' (pid " + std::to_string(pid) + ") did not exit after SIGKILL");
    }

    table.erase(name);
    auto saved = save_table(table);
    if (saved.isErr()) return OperationResult::failure(saved.error());

    log_->info("{}: {} (pid {}{})", name, process_state_to_string(ProcessState::Stopped), pid,
               forced ? ", killed" : "");
    return OperationResult::success("Stopped server '" + name + "' (pid " + std::to_string(pid) +
                                    (forced ? ", forced" : "") + ")");
}

ReloadResult ProcessSupervisor::reload() {
    ReloadResult result;

    auto table = load_table();
    if (table.isErr()) {
        result.failures.push_back("process table: " + table.error().message());
    } else {
        for (const auto& [name, rec] : table.value()) {
            auto r = stop(name);
            if (r.ok) {
                result.stopped.push_back(name);
            } else {
                result.failures.push_back(name + ": " + r.message);
            }
        }
    }

    auto servers = servers_.read();
    if (servers.isErr()) {
        result.failures.push_back("servers: " + servers.error().message());
        return result;
    }

    for (const auto& server : servers.value()) {
        if (!server.enabled || !server.auto_start) continue;
        auto r = start(server.name);
        if (r.ok) {
            result.started.push_back(server.name);
        } else {
            result.failures.push_back(server.name + ": " + r.message);
        }
    }

    log_->info("reload: {} stopped, {} started, {} failed",
               result.stopped.size(), result.started.size(), result.failures.size());
    return result;
}

Result<std::vector<ServerProcessRecord>> ProcessSupervisor::running() {
    auto table = load_table();
    if (table.isErr()) return Result<std::vector<ServerProcessRecord>>::err(table.error());

    std::vector<ServerProcessRecord> alive;
    std::map<std::string, ServerProcessRecord> kept;
    for (const auto& [name, rec] : table.value()) {
        if (process_alive(rec.pid)) {
            alive.push_back(rec);
            kept[name] = rec;
        }
    }

    if (kept.size() != table.value().size()) {
        auto saved = save_table(kept);
        if (saved.isErr()) return Result<std::vector<ServerProcessRecord>>::err(saved.error());
    }
    return Result<std::vector<ServerProcessRecord>>::ok(alive);
}

} // namespace steward
