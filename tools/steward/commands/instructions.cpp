/**
 * steward CLI - instructions command
 */

#include "../common.hpp"

#include <steward/instruction_store.hpp>
#include <steward/registrar.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

struct InstructionAddOptions {
    std::string id;
    std::string name;
    std::vector<std::string> keywords;
    int priority = kDefaultInstructionPriority;
    std::string body;
    bool disabled = false;
};

struct MatchOptions {
    std::string prompt;
};

int cmd_instruction_add(const GlobalOptions& opts, const InstructionAddOptions& add_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    InstructionEntry entry;
    entry.id = add_opts.id;
    entry.name = add_opts.name;
    entry.keywords = add_opts.keywords;
    entry.priority = add_opts.priority;
    entry.body = add_opts.body;
    entry.enabled = !add_opts.disabled;

    return report_operation(Registrar(*config).add_instruction(entry), opts);
}

int cmd_instruction_match(const GlobalOptions& opts, const MatchOptions& match_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto matched = InstructionStore(*config).match(match_opts.prompt);
    if (matched.isErr()) {
        print_error(matched.error().message(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& e : matched.value()) {
            j.push_back({{"id", e.id}, {"name", e.name}, {"priority", e.priority}, {"path", e.file_path}});
        }
        output_json(j);
        return 0;
    }

    if (matched.value().empty()) {
        std::cout << "No instructions match." << std::endl;
        return 0;
    }
    for (const auto& e : matched.value()) {
        std::cout << e.priority << "  " << e.id;
        if (!e.name.empty() && e.name != e.id) std::cout << " (" << e.name << ")";
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_instructions(CLI::App* app, GlobalOptions& opts) {
    static InstructionAddOptions add_opts;
    static MatchOptions match_opts;

    app->require_subcommand(1);
    setup_resource_commands(app, ResourceKind::Instruction, opts);

    auto* add_cmd = app->add_subcommand("add", "Create an instruction file");
    add_cmd->add_option("id", add_opts.id, "Instruction id (file name)")->required();
    add_cmd->add_option("--name", add_opts.name, "Display name")->required();
    add_cmd->add_option("--keyword", add_opts.keywords, "Keyword (repeatable)");
    add_cmd->add_option("--priority", add_opts.priority, "Lower runs first")
        ->check(CLI::Range(0, 1000));
    add_cmd->add_option("--body", add_opts.body, "Instruction text");
    add_cmd->add_flag("--disabled", add_opts.disabled, "Create without enabling");
    add_cmd->callback([&opts]() {
        std::exit(cmd_instruction_add(opts, add_opts));
    });

    auto* match_cmd = app->add_subcommand("match", "Instructions a prompt would trigger");
    match_cmd->add_option("prompt", match_opts.prompt, "Prompt text")->required();
    match_cmd->callback([&opts]() {
        std::exit(cmd_instruction_match(opts, match_opts));
    });
}

} // namespace steward::cli::commands
