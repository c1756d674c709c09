/**
 * steward CLI - capabilities command
 */

#include "../common.hpp"

#include <steward/registrar.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

struct CapabilityAddOptions {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> keywords;
    std::string path;
    bool disabled = false;
};

int cmd_capability_add(const GlobalOptions& opts, const CapabilityAddOptions& add_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    CapabilityEntry entry;
    entry.id = add_opts.id;
    entry.name = add_opts.name;
    entry.description = add_opts.description;
    entry.keywords = add_opts.keywords;
    entry.path = add_opts.path;
    entry.enabled = !add_opts.disabled;

    return report_operation(Registrar(*config).add_capability(entry), opts);
}

} // anonymous namespace

void setup_capabilities(CLI::App* app, GlobalOptions& opts) {
    static CapabilityAddOptions add_opts;

    app->require_subcommand(1);
    setup_resource_commands(app, ResourceKind::Capability, opts);

    auto* add_cmd = app->add_subcommand("add", "Register a capability");
    add_cmd->add_option("id", add_opts.id, "Capability id (directory name)")->required();
    add_cmd->add_option("--name", add_opts.name, "Display name");
    add_cmd->add_option("--description", add_opts.description, "What it does");
    add_cmd->add_option("--keyword", add_opts.keywords, "Keyword (repeatable)");
    add_cmd->add_option("--path", add_opts.path, "Descriptor path (default <skills>/<id>/SKILL.md)");
    add_cmd->add_flag("--disabled", add_opts.disabled, "Register without enabling");
    add_cmd->callback([&opts]() {
        std::exit(cmd_capability_add(opts, add_opts));
    });
}

} // namespace steward::cli::commands
