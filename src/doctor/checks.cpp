#include "steward/checks.hpp"
#include "steward/platform.hpp"
#include "steward/process.hpp"

#include <sstream>
#include <vector>

namespace steward {

namespace {

std::string first_token(const std::string& command) {
    std::istringstream iss(command);
    std::string tok;
    iss >> tok;
    return tok;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string truncate_message(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) text.pop_back();
    if (text.size() > kCheckMessageLimit) text = text.substr(0, kCheckMessageLimit);
    return text;
}

CheckResult run_check(const std::vector<std::string>& argv, int timeout_ms) {
    CheckResult result;
    auto run = run_command(argv, timeout_ms);
    if (!run.ok) {
        result.outcome = CheckOutcome::ToolFailed;
        result.message = argv[0] + ": " + run.error;
        return result;
    }
    if (run.exit_code == 0) {
        result.outcome = CheckOutcome::Passed;
        return result;
    }
    result.outcome = CheckOutcome::Failed;
    result.message = truncate_message(run.output.empty()
        ? "exit code " + std::to_string(run.exit_code)
        : run.output);
    return result;
}

} // namespace

CheckResult check_script_syntax(const std::string& command, const std::string& script, int timeout_ms) {
    if (script.empty() || !is_regular_file(script)) {
        return CheckResult{};
    }

    std::string interpreter = get_filename(first_token(command));
    if (interpreter == "node" || ends_with(script, ".js") || ends_with(script, ".mjs") || ends_with(script, ".cjs")) {
        return run_check({"node", "--check", script}, timeout_ms);
    }
    if (interpreter == "bash" || interpreter == "sh" || ends_with(script, ".sh")) {
        return run_check({"bash", "-n", script}, timeout_ms);
    }
    return CheckResult{};
}

CheckResult check_command_available(const std::string& command, int timeout_ms) {
    if (command.empty()) return CheckResult{};

    CheckResult result = run_check({"sh", "-c", "command -v \"$1\"", "sh", command}, timeout_ms);
    if (result.outcome == CheckOutcome::Failed) {
        result.message = "'" + command + "' not found in PATH";
    }
    return result;
}

} // namespace steward
