#include "steward/duplicates.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include <sys/stat.h>

namespace steward {

namespace fs = std::filesystem;

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const std::vector<std::string>* keywords_of(const ResourceRecord& r) {
    if (r.capability) return &r.capability->keywords;
    if (r.instruction) return &r.instruction->keywords;
    return nullptr;
}

std::set<std::string> keyword_set(const std::vector<std::string>& keywords) {
    std::set<std::string> out;
    for (const auto& k : keywords) {
        std::string norm = to_lower(trim(k));
        if (!norm.empty()) out.insert(norm);
    }
    return out;
}

bool is_skipped_dir(const std::string& name) {
    return name == ".git" || name == "node_modules" || name == "__pycache__" || name == ".next";
}

bool ends_with_any(const std::string& s, std::initializer_list<const char*> suffixes) {
    for (const char* suffix : suffixes) {
        std::string sf(suffix);
        if (s.size() >= sf.size() && s.compare(s.size() - sf.size(), sf.size(), sf) == 0) return true;
    }
    return false;
}

std::optional<std::chrono::system_clock::time_point> modification_time(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return std::nullopt;
    return std::chrono::system_clock::from_time_t(st.st_mtime);
}

} // namespace

// ============================================================================
// Duplicate Detection
// ============================================================================

std::string normalize_resource_name(const std::string& name) {
    std::string out;
    for (char c : to_lower(name)) {
        if (c == '-' || c == '_' || c == ' ') continue;
        out += c;
    }
    for (const char* word : {"skill", "manager", "lite", "api", "mcp"}) {
        std::string w(word);
        size_t pos = 0;
        while ((pos = out.find(w, pos)) != std::string::npos) {
            out.erase(pos, w.size());
        }
    }
    return out;
}

std::vector<DuplicateFinding> find_duplicates(const std::vector<ResourceRecord>& records) {
    std::vector<DuplicateFinding> findings;

    for (size_t i = 0; i < records.size(); ++i) {
        const auto* kw_a = keywords_of(records[i]);
        if (!kw_a) continue;
        std::string norm_a = normalize_resource_name(records[i].id);
        auto set_a = keyword_set(*kw_a);

        for (size_t j = i + 1; j < records.size(); ++j) {
            if (records[j].kind != records[i].kind) continue;
            const auto* kw_b = keywords_of(records[j]);
            if (!kw_b) continue;

            auto set_b = keyword_set(*kw_b);
            std::vector<std::string> shared;
            std::set_intersection(set_a.begin(), set_a.end(), set_b.begin(), set_b.end(),
                                  std::back_inserter(shared));

            DuplicateFinding f;
            f.kind = records[i].kind;
            f.first = records[i].id;
            f.second = records[j].id;
            f.first_path = records[i].backing_path;
            f.second_path = records[j].backing_path;

            bool similar = !norm_a.empty() && norm_a == normalize_resource_name(records[j].id);
            if (similar) {
                f.type = DuplicateType::SimilarName;
                f.reason = "names normalize to '" + norm_a + "'";
            } else if (shared.size() >= kKeywordOverlapThreshold) {
                f.type = DuplicateType::KeywordOverlap;
                f.reason = std::to_string(shared.size()) + " shared keywords";
            } else {
                continue;
            }

            if (shared.size() > 5) shared.resize(5);
            f.shared_keywords = std::move(shared);
            findings.push_back(std::move(f));
        }
    }

    return findings;
}

// ============================================================================
// Project Comparison
// ============================================================================

std::optional<long> ActivityStats::age_days(std::chrono::system_clock::time_point now) const {
    if (!last_modified) return std::nullopt;
    auto hours = std::chrono::duration_cast<std::chrono::hours>(now - *last_modified).count();
    return static_cast<long>(hours / 24);
}

ActivityStats collect_activity(const std::string& dir, std::chrono::system_clock::time_point now) {
    using namespace std::chrono;
    ActivityStats stats;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return stats;

    const auto week = hours(24 * 7);
    const auto month = hours(24 * 30);
    const auto year = hours(24 * 365);

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        if (entry.is_directory(ec)) {
            if (is_skipped_dir(name)) it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;

        auto mtime = modification_time(entry.path().string());
        if (!mtime) continue;

        stats.total_files++;
        if (!stats.last_modified || *mtime > *stats.last_modified) {
            stats.last_modified = mtime;
            stats.last_modified_file = fs::path(entry.path()).lexically_relative(dir).string();
        }
        auto age = now - *mtime;
        if (age < week) stats.modified_last_week++;
        if (age < month) stats.modified_last_month++;
        if (age < year) stats.modified_last_year++;
    }

    return stats;
}

OrganizationScore score_organization(const std::string& dir) {
    OrganizationScore org;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        org.reasons.push_back("Directory does not exist");
        return org;
    }

    std::set<std::string> entries;
    std::vector<std::string> files;
    std::vector<std::string> dirs;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        entries.insert(name);
        if (entry.is_regular_file(ec)) {
            files.push_back(name);
        } else if (entry.is_directory(ec) && !name.empty() && name[0] != '.') {
            dirs.push_back(name);
        }
    }
    org.root_files = files.size();

    org.has_docs = entries.count("README.md") || entries.count("SKILL.md") || entries.count("CLAUDE.md");
    if (org.has_docs) {
        org.score += 20;
        org.reasons.push_back("Has documentation file");
    } else {
        org.reasons.push_back("Missing documentation (README/SKILL.md)");
    }

    org.has_subdirs = !dirs.empty();
    if (org.has_subdirs) {
        org.score += 20;
        org.reasons.push_back(std::to_string(dirs.size()) + " subdirectories");
    } else {
        org.reasons.push_back("No subdirectories (flat structure)");
    }

    if (files.size() <= 5) {
        org.score += 20;
        org.reasons.push_back("Clean root (" + std::to_string(files.size()) + " files)");
    } else if (files.size() <= 10) {
        org.score += 10;
        org.reasons.push_back("Moderate root (" + std::to_string(files.size()) + " files)");
    } else {
        org.reasons.push_back("Cluttered root (" + std::to_string(files.size()) + " files)");
    }

    for (const char* f : {"__init__.py", "setup.py", "pyproject.toml", "package.json", "CMakeLists.txt"}) {
        if (entries.count(f)) org.has_package_file = true;
    }
    if (org.has_package_file) {
        org.score += 20;
        org.reasons.push_back("Proper package structure");
    }

    org.has_config_file = std::any_of(files.begin(), files.end(), [](const std::string& f) {
        return ends_with_any(f, {".yaml", ".yml", ".json", ".toml", ".cfg"});
    });
    if (org.has_config_file) {
        org.score += 10;
        org.reasons.push_back("Has config files");
    }

    org.has_tests = std::find(dirs.begin(), dirs.end(), "tests") != dirs.end() ||
                    std::find(dirs.begin(), dirs.end(), "test") != dirs.end();
    if (org.has_tests) {
        org.score += 10;
        org.reasons.push_back("Has test directory");
    }

    org.score = std::min(org.score, 100);
    return org;
}

ProjectComparison compare_projects(const std::string& first, const std::string& second,
                                   std::chrono::system_clock::time_point now) {
    ProjectComparison cmp;
    cmp.first_path = first;
    cmp.second_path = second;
    cmp.first_activity = collect_activity(first, now);
    cmp.second_activity = collect_activity(second, now);
    cmp.first_org = score_organization(first);
    cmp.second_org = score_organization(second);

    std::string name_a = fs::path(first).filename().string();
    std::string name_b = fs::path(second).filename().string();
    if (name_a == name_b) {
        name_a = first;
        name_b = second;
    }

    auto last_a = cmp.first_activity.last_modified.value_or(std::chrono::system_clock::time_point{});
    auto last_b = cmp.second_activity.last_modified.value_or(std::chrono::system_clock::time_point{});
    if (last_a > last_b) {
        cmp.recommended = first;
        cmp.reasons.push_back(name_a + " was modified more recently");
    } else if (last_b > last_a) {
        cmp.recommended = second;
        cmp.reasons.push_back(name_b + " was modified more recently");
    }

    int org_a = cmp.first_org.score;
    int org_b = cmp.second_org.score;
    if (org_a > org_b) {
        cmp.reasons.push_back(name_a + " has better organization (" + std::to_string(org_a) +
                              " vs " + std::to_string(org_b) + ")");
        if (cmp.recommended.empty()) cmp.recommended = first;
    } else if (org_b > org_a) {
        cmp.reasons.push_back(name_b + " has better organization (" + std::to_string(org_b) +
                              " vs " + std::to_string(org_a) + ")");
        if (cmp.recommended.empty()) cmp.recommended = second;
    }

    size_t ma = cmp.first_activity.modified_last_month;
    size_t mb = cmp.second_activity.modified_last_month;
    if (ma > mb) {
        cmp.reasons.push_back(name_a + " more active this month (" + std::to_string(ma) + " vs " +
                              std::to_string(mb) + " files)");
    } else if (mb > ma) {
        cmp.reasons.push_back(name_b + " more active this month (" + std::to_string(mb) + " vs " +
                              std::to_string(ma) + " files)");
    }

    return cmp;
}

std::optional<ProjectComparison> compare_duplicate_pair(const DuplicateFinding& finding,
                                                  std::chrono::system_clock::time_point now) {
    if (finding.kind != ResourceKind::Capability) return std::nullopt;
    if (finding.first_path.empty() || finding.second_path.empty()) return std::nullopt;

    std::string first = fs::path(finding.first_path).parent_path().string();
    std::string second = fs::path(finding.second_path).parent_path().string();
    std::error_code ec;
    if (first == second || !fs::is_directory(first, ec) || !fs::is_directory(second, ec)) {
        return std::nullopt;
    }
    return compare_projects(first, second, now);
}

} // namespace steward
