/**
 * steward CLI - report command
 */

#include "../common.hpp"

#include <steward/report.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

int cmd_report(const GlobalOptions& opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto written = write_config_report(*config);
    if (written.isErr()) {
        print_error(written.error().message(), opts.json);
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"path", written.value()}});
    } else {
        print_success("Report written to " + written.value(), opts);
    }
    return 0;
}

} // anonymous namespace

void setup_report(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_report(opts));
    });
}

} // namespace steward::cli::commands
