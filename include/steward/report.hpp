#pragma once

#include "steward/config.hpp"
#include "steward/reconciler.hpp"
#include "steward/result.hpp"

#include <string>
#include <vector>

namespace steward {

// Markdown report: an overview line, then one table per kind
std::string render_config_report(const std::vector<KindStatus>& kinds, const std::string& generated_at);

/**
 * Reconcile every kind and write the report to
 * <reports_dir>/config-report.md. Returns the path written.
 *
 * A kind whose stores cannot be read fails the whole report.
 */
Result<std::string> write_config_report(const Config& config);

} // namespace steward
