/**
 * steward CLI - commands shared by every resource kind
 *
 * list, remove, enable, disable and verify behave the same for hooks,
 * capabilities, servers and instructions.
 */

#include "../common.hpp"

#include <steward/reconciler.hpp>
#include <steward/registrar.hpp>
#include <steward/supervisor.hpp>

#include <CLI/CLI.hpp>

#include <memory>

namespace steward::cli::commands {

namespace {

struct ResourceOptions {
    std::string id;
};

int cmd_list(const GlobalOptions& opts, ResourceKind kind) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto status = Reconciler(*config).status(kind);
    if (status.isErr()) {
        print_error(status.error().message(), opts.json);
        return 1;
    }
    const auto& records = status.value().records;

    if (opts.json) {
        nlohmann::json j;
        j["kind"] = kind_to_string(kind);
        j["items"] = nlohmann::json::array();
        for (const auto& r : records) j["items"].push_back(record_to_json(r));
        output_json(j);
        return 0;
    }

    if (records.empty()) {
        std::cout << "No " << kind_display_name(kind) << " found." << std::endl;
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& r : records) {
        rows.push_back({r.id, status_to_string(r.status), r.enabled ? "yes" : "no", r.summary()});
    }
    print_table({"ID", "STATUS", "ENABLED", "DETAILS"}, rows);
    return 0;
}

// A server steward started must not outlive its removal or disabling
bool stop_if_running(const Config& config, const std::string& name, const GlobalOptions& opts) {
    ProcessSupervisor supervisor(config);
    if (supervisor.state(name) != ProcessState::Running) return true;

    auto stopped = supervisor.stop(name);
    if (!stopped.ok) {
        print_error(stopped.message, opts.json);
        return false;
    }
    print_success(stopped.message, opts);
    return true;
}

int cmd_remove(const GlobalOptions& opts, ResourceKind kind, const ResourceOptions& ropts) {
    auto config = make_config(opts);
    if (!config) return 1;

    if (kind == ResourceKind::Server && !stop_if_running(*config, ropts.id, opts)) return 1;
    return report_operation(Registrar(*config).remove(kind, ropts.id), opts);
}

int cmd_enable(const GlobalOptions& opts, ResourceKind kind, const ResourceOptions& ropts) {
    auto config = make_config(opts);
    if (!config) return 1;
    return report_operation(Registrar(*config).enable(kind, ropts.id), opts);
}

int cmd_disable(const GlobalOptions& opts, ResourceKind kind, const ResourceOptions& ropts) {
    auto config = make_config(opts);
    if (!config) return 1;

    if (kind == ResourceKind::Server && !stop_if_running(*config, ropts.id, opts)) return 1;
    return report_operation(Registrar(*config).disable(kind, ropts.id), opts);
}

int cmd_verify(const GlobalOptions& opts, ResourceKind kind) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto result = Doctor(*config).verify(kind);

    if (opts.json) {
        nlohmann::json j;
        j["kind"] = kind_to_string(kind);
        j["healthy"] = result.healthy;
        j["issues"] = nlohmann::json::array();
        for (const auto& issue : result.issues) j["issues"].push_back(issue_to_json(issue));
        output_json(j);
    } else {
        std::cout << kind_display_name(kind) << ": " << result.healthy.size() << " healthy, "
                  << result.issues.size() << " issue(s)" << std::endl;
        for (const auto& issue : result.issues) print_issue(issue);
    }

    bool needs_action = std::any_of(result.issues.begin(), result.issues.end(), [](const Issue& i) {
        return fix_action_for(i.code) != FixAction::None;
    });
    return needs_action ? 1 : 0;
}

} // anonymous namespace

void setup_resource_commands(CLI::App* app, ResourceKind kind, GlobalOptions& opts) {
    std::string noun = kind_to_string(kind);

    auto* list_cmd = app->add_subcommand("list", "List " + noun + "s with derived status");
    list_cmd->callback([&opts, kind]() { std::exit(cmd_list(opts, kind)); });

    auto remove_opts = std::make_shared<ResourceOptions>();
    auto* remove_cmd = app->add_subcommand("remove", "Remove a " + noun + " (archived, not deleted)");
    remove_cmd->add_option("id", remove_opts->id, noun + " id")->required();
    remove_cmd->callback([&opts, kind, remove_opts]() { std::exit(cmd_remove(opts, kind, *remove_opts)); });

    auto enable_opts = std::make_shared<ResourceOptions>();
    auto* enable_cmd = app->add_subcommand("enable", "Enable a " + noun);
    enable_cmd->add_option("id", enable_opts->id, noun + " id")->required();
    enable_cmd->callback([&opts, kind, enable_opts]() { std::exit(cmd_enable(opts, kind, *enable_opts)); });

    auto disable_opts = std::make_shared<ResourceOptions>();
    auto* disable_cmd = app->add_subcommand("disable", "Disable a " + noun);
    disable_cmd->add_option("id", disable_opts->id, noun + " id")->required();
    disable_cmd->callback([&opts, kind, disable_opts]() { std::exit(cmd_disable(opts, kind, *disable_opts)); });

    auto* verify_cmd = app->add_subcommand("verify", "Check " + noun + "s for problems");
    verify_cmd->callback([&opts, kind]() { std::exit(cmd_verify(opts, kind)); });
}

} // namespace steward::cli::commands
