#pragma once

#include "steward/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace steward {

// ============================================================================
// Duplicate Detection
// ============================================================================

enum class DuplicateType {
    SimilarName,
    KeywordOverlap
};

inline const char* duplicate_type_to_string(DuplicateType t) {
    switch (t) {
        case DuplicateType::SimilarName: return "similar-name";
        case DuplicateType::KeywordOverlap: return "keyword-overlap";
        default: return "unknown";
    }
}

constexpr size_t kKeywordOverlapThreshold = 3;

struct DuplicateFinding {
    ResourceKind kind = ResourceKind::Capability;
    DuplicateType type = DuplicateType::SimilarName;
    std::string first;
    std::string second;
    std::string first_path;
    std::string second_path;
    std::vector<std::string> shared_keywords;
    std::string reason;
};

// Lowercase, drop '-', '_' and spaces, then drop the generic words
// "skill", "manager", "lite", "api", "mcp"
std::string normalize_resource_name(const std::string& name);

// Pairwise comparison within each kind of records that carry keywords
// (capabilities and instructions). Each pair is reported at most once.
std::vector<DuplicateFinding> find_duplicates(const std::vector<ResourceRecord>& records);

// ============================================================================
// Project Comparison
// ============================================================================

struct ActivityStats {
    size_t total_files = 0;
    std::string last_modified_file;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    size_t modified_last_week = 0;
    size_t modified_last_month = 0;
    size_t modified_last_year = 0;

    // Whole days since last_modified, or nullopt for an empty tree
    std::optional<long> age_days(std::chrono::system_clock::time_point now) const;
};

struct OrganizationScore {
    int score = 0;   // 0-100
    bool has_docs = false;
    bool has_subdirs = false;
    size_t root_files = 0;
    bool has_package_file = false;
    bool has_config_file = false;
    bool has_tests = false;
    std::vector<std::string> reasons;
};

struct ProjectComparison {
    std::string first_path;
    std::string second_path;
    ActivityStats first_activity;
    ActivityStats second_activity;
    OrganizationScore first_org;
    OrganizationScore second_org;
    std::string recommended;   // path of the one to keep, empty on a tie
    std::vector<std::string> reasons;
};

// Walk dir, skipping .git, node_modules, __pycache__ and .next
ActivityStats collect_activity(const std::string& dir, std::chrono::system_clock::time_point now);

OrganizationScore score_organization(const std::string& dir);

// Advisory only: the more recently modified tree wins, then the better
// organized one
ProjectComparison compare_projects(const std::string& first, const std::string& second,
                                   std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// compare_projects over the directories holding a capability pair's
// descriptors. nullopt for other kinds or when either directory is missing.
std::optional<ProjectComparison> compare_duplicate_pair(
    const DuplicateFinding& finding,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace steward
