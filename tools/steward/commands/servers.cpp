/**
 * steward CLI - servers command
 *
 * Server entries plus the lifecycle of the processes steward starts.
 */

#include "../common.hpp"

#include <steward/registrar.hpp>
#include <steward/supervisor.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

struct ServerAddOptions {
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::string url;
    std::vector<std::string> tags;
    std::vector<std::string> env;
    bool enabled = false;
    bool auto_start = false;
};

struct ServerNameOptions {
    std::string name;
};

int cmd_server_add(const GlobalOptions& opts, const ServerAddOptions& add_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    ServerEntry entry;
    entry.name = add_opts.name;
    entry.description = add_opts.description;
    entry.command = add_opts.command;
    entry.args = add_opts.args;
    entry.url = add_opts.url;
    entry.tags = add_opts.tags;
    entry.enabled = add_opts.enabled;
    entry.auto_start = add_opts.auto_start;

    for (const auto& kv : add_opts.env) {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            print_error("Invalid --env '" + kv + "': expected KEY=VALUE", opts.json);
            return 1;
        }
        entry.env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }

    return report_operation(Registrar(*config).add_server(entry), opts);
}

int cmd_server_start(const GlobalOptions& opts, const ServerNameOptions& name_opts) {
    auto config = make_config(opts);
    if (!config) return 1;
    return report_operation(ProcessSupervisor(*config).start(name_opts.name), opts);
}

int cmd_server_stop(const GlobalOptions& opts, const ServerNameOptions& name_opts) {
    auto config = make_config(opts);
    if (!config) return 1;
    return report_operation(ProcessSupervisor(*config).stop(name_opts.name), opts);
}

int cmd_server_reload(const GlobalOptions& opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto result = ProcessSupervisor(*config).reload();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok();
        j["stopped"] = result.stopped;
        j["started"] = result.started;
        j["failures"] = result.failures;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Stopped: " << result.stopped.size() << ", started: " << result.started.size()
                  << std::endl;
        for (const auto& name : result.started) {
            std::cout << "  started " << name << std::endl;
        }
        for (const auto& failure : result.failures) {
            std::cerr << "  failed  " << failure << std::endl;
        }
    }
    return result.ok() ? 0 : 1;
}

int cmd_server_running(const GlobalOptions& opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto running = ProcessSupervisor(*config).running();
    if (running.isErr()) {
        print_error(running.error().message(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& rec : running.value()) {
            j.push_back({{"name", rec.name}, {"pid", rec.pid}, {"startedAt", rec.started_at}});
        }
        output_json(j);
        return 0;
    }

    if (running.value().empty()) {
        std::cout << "No servers running." << std::endl;
        return 0;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& rec : running.value()) {
        rows.push_back({rec.name, std::to_string(rec.pid), rec.started_at});
    }
    print_table({"NAME", "PID", "STARTED"}, rows);
    return 0;
}

} // anonymous namespace

void setup_servers(CLI::App* app, GlobalOptions& opts) {
    static ServerAddOptions add_opts;
    static ServerNameOptions start_opts;
    static ServerNameOptions stop_opts;

    app->require_subcommand(1);
    setup_resource_commands(app, ResourceKind::Server, opts);

    auto* add_cmd = app->add_subcommand("add", "Add a server entry");
    add_cmd->add_option("name", add_opts.name, "Server name")->required();
    add_cmd->add_option("--command", add_opts.command, "Executable to run");
    add_cmd->add_option("--arg", add_opts.args, "Argument (repeatable)")->allow_extra_args(false);
    add_cmd->add_option("--url", add_opts.url, "Remote endpoint");
    add_cmd->add_option("--tag", add_opts.tags, "Tag (repeatable)");
    add_cmd->add_option("--env", add_opts.env, "KEY=VALUE (repeatable)");
    add_cmd->add_option("--description", add_opts.description, "What it provides");
    add_cmd->add_flag("--enabled", add_opts.enabled, "Enable immediately");
    add_cmd->add_flag("--auto-start", add_opts.auto_start, "Start on reload");
    add_cmd->callback([&opts]() {
        std::exit(cmd_server_add(opts, add_opts));
    });

    auto* start_cmd = app->add_subcommand("start", "Start a server process");
    start_cmd->add_option("name", start_opts.name, "Server name")->required();
    start_cmd->callback([&opts]() {
        std::exit(cmd_server_start(opts, start_opts));
    });

    auto* stop_cmd = app->add_subcommand("stop", "Stop a server steward started");
    stop_cmd->add_option("name", stop_opts.name, "Server name")->required();
    stop_cmd->callback([&opts]() {
        std::exit(cmd_server_stop(opts, stop_opts));
    });

    auto* reload_cmd = app->add_subcommand("reload", "Stop all tracked servers, start auto-start ones");
    reload_cmd->callback([&opts]() {
        std::exit(cmd_server_reload(opts));
    });

    auto* running_cmd = app->add_subcommand("running", "List tracked server processes");
    running_cmd->callback([&opts]() {
        std::exit(cmd_server_running(opts));
    });
}

} // namespace steward::cli::commands
