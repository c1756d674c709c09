#include "steward/report.hpp"
#include "steward/platform.hpp"

#include <sstream>

namespace steward {

namespace {

// Table cells cannot contain '|' or line breaks
std::string cell(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c == '|') {
            out += "\\|";
        } else if (c == '\n' || c == '\r') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out.empty() ? "-" : out;
}

} // namespace

std::string render_config_report(const std::vector<KindStatus>& kinds, const std::string& generated_at) {
    std::ostringstream out;
    out << "# Configuration Report\n\n";
    out << "Generated: " << generated_at << "\n\n";

    size_t total = 0;
    size_t healthy = 0;
    for (const auto& k : kinds) {
        total += k.summary.total;
        healthy += k.summary.consistent();
    }

    out << "## Overview\n\n";
    out << total << " resources, " << healthy << " consistent, "
        << (total - healthy) << " need attention\n\n";
    for (const auto& k : kinds) {
        out << "- " << kind_display_name(k.kind) << ": " << k.summary.total << " ("
            << k.summary.needs_attention() << " need attention)\n";
    }
    out << "\n";

    for (const auto& k : kinds) {
        out << "## " << kind_display_name(k.kind) << "\n\n";
        if (k.records.empty()) {
            out << "_None_\n\n";
            continue;
        }
        out << "| ID | Status | Enabled | Details |\n";
        out << "|----|--------|---------|---------|\n";
        for (const auto& r : k.records) {
            out << "| " << cell(r.id) << " | " << status_to_string(r.status) << " | "
                << (r.enabled ? "yes" : "no") << " | " << cell(r.summary()) << " |\n";
        }
        out << "\n";
    }

    return out.str();
}

Result<std::string> write_config_report(const Config& config) {
    Reconciler reconciler(config);
    std::vector<KindStatus> kinds;
    for (ResourceKind kind : all_resource_kinds()) {
        auto status = reconciler.status(kind);
        if (status.isErr()) {
            return Result<std::string>::err(status.error());
        }
        kinds.push_back(status.value());
    }

    std::string path = join_path(config.paths.reports_dir, "config-report.md");
    auto written = atomic_write_file(path, render_config_report(kinds, get_current_timestamp()));
    if (!written.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, written.error));
    }
    return Result<std::string>::ok(path);
}

} // namespace steward
