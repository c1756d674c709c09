/**
 * steward CLI - Entry Point
 *
 * Keeps the host application's hooks, capabilities, servers and
 * instructions in agreement with steward's registries.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef STEWARD_VERSION
#define STEWARD_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace steward::cli::commands {
    void setup_hooks(CLI::App* app, GlobalOptions& opts);
    void setup_capabilities(CLI::App* app, GlobalOptions& opts);
    void setup_servers(CLI::App* app, GlobalOptions& opts);
    void setup_instructions(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_doctor(CLI::App* app, GlobalOptions& opts);
    void setup_duplicates(CLI::App* app, GlobalOptions& opts);
    void setup_discover(CLI::App* app, GlobalOptions& opts);
    void setup_report(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace steward::cli;

    CLI::App app{"steward - keep host hooks, capabilities, servers and instructions in sync"};
    app.set_version_flag("-V,--version", STEWARD_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Host root directory (default ~/.claude)");
    app.add_option("--state", opts.state, "steward state directory (default <root>/steward)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Log to stderr as well");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Resource kinds
    auto* hooks_cmd = app.add_subcommand("hooks", "Manage event hooks");
    commands::setup_hooks(hooks_cmd, opts);

    auto* capabilities_cmd = app.add_subcommand("capabilities", "Manage capabilities");
    capabilities_cmd->alias("skills");
    commands::setup_capabilities(capabilities_cmd, opts);

    auto* servers_cmd = app.add_subcommand("servers", "Manage servers and their processes");
    servers_cmd->alias("mcp");
    commands::setup_servers(servers_cmd, opts);

    auto* instructions_cmd = app.add_subcommand("instructions", "Manage keyword-triggered instructions");
    commands::setup_instructions(instructions_cmd, opts);

    // Whole-configuration commands
    auto* status_cmd = app.add_subcommand("status", "Dashboard of every resource kind");
    commands::setup_status(status_cmd, opts);

    auto* doctor_cmd = app.add_subcommand("doctor", "Verify everything, optionally fix");
    commands::setup_doctor(doctor_cmd, opts);

    auto* duplicates_cmd = app.add_subcommand("duplicates", "Find likely duplicate capabilities and instructions");
    commands::setup_duplicates(duplicates_cmd, opts);

    auto* discover_cmd = app.add_subcommand("discover", "Register unmanaged hooks and capabilities");
    commands::setup_discover(discover_cmd, opts);

    auto* report_cmd = app.add_subcommand("report", "Write the markdown configuration report");
    commands::setup_report(report_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
