/**
 * steward CLI - hooks command
 *
 * Event hooks in the host settings document and their registry.
 */

#include "../common.hpp"

#include <steward/hook_store.hpp>
#include <steward/registrar.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

struct HookAddOptions {
    std::string id;
    std::string event;
    std::string command;
    std::string matcher;
    std::string description;
    bool async = false;
};

int cmd_hook_add(const GlobalOptions& opts, const HookAddOptions& add_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    HookEntry entry;
    entry.id = add_opts.id;
    entry.event = add_opts.event;
    entry.command = add_opts.command;
    entry.matcher = add_opts.matcher;
    entry.description = add_opts.description;
    entry.async = add_opts.async;

    return report_operation(Registrar(*config).add_hook(entry), opts);
}

} // anonymous namespace

void setup_hooks(CLI::App* app, GlobalOptions& opts) {
    static HookAddOptions add_opts;

    app->require_subcommand(1);
    setup_resource_commands(app, ResourceKind::Hook, opts);

    std::string events;
    for (const auto& e : valid_hook_events()) {
        events += (events.empty() ? "" : ", ") + e;
    }

    auto* add_cmd = app->add_subcommand("add", "Register a hook and push it live");
    add_cmd->add_option("id", add_opts.id, "Hook id (derived from the command when omitted)");
    add_cmd->add_option("--event", add_opts.event, "One of: " + events)->required();
    add_cmd->add_option("--command", add_opts.command, "Shell command to run")->required();
    add_cmd->add_option("--matcher", add_opts.matcher, "Tool matcher (default '*' where supported)");
    add_cmd->add_option("--description", add_opts.description, "Free-form description");
    add_cmd->add_flag("--async", add_opts.async, "Run without blocking the host");
    add_cmd->callback([&opts]() {
        std::exit(cmd_hook_add(opts, add_opts));
    });
}

} // namespace steward::cli::commands
