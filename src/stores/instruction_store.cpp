#include "steward/instruction_store.hpp"
#include "steward/frontmatter.hpp"
#include "steward/logging.hpp"
#include "steward/platform.hpp"

#include <algorithm>
#include <cctype>

namespace steward {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<int> parse_int(const std::string& s) {
    try {
        size_t consumed = 0;
        int v = std::stoi(s, &consumed);
        if (consumed != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

const std::vector<std::string>& required_instruction_fields() {
    static const std::vector<std::string> fields = {"id", "name", "keywords", "enabled"};
    return fields;
}

InstructionEntry parse_instruction(const std::string& file_path, const std::string& content) {
    InstructionEntry e;
    e.id = get_stem(file_path);
    e.file_path = file_path;

    auto fm = parse_frontmatter(content);
    e.body = fm.body;
    e.has_frontmatter = fm.present;
    if (!fm.present) {
        e.missing_fields = required_instruction_fields();
        return e;
    }

    for (const auto& field : required_instruction_fields()) {
        const std::string* v = fm.get(field);
        if (!v || v->empty()) {
            e.missing_fields.push_back(field);
        }
    }

    for (const auto& [key, value] : fm.fields) {
        if (key == "id") {
            // The file stem stays the record id; a differing header id is
            // reported by verification
            if (!value.empty() && value != e.id) e.extra.emplace_back(key, value);
        } else if (key == "name") {
            e.name = value;
        } else if (key == "keywords") {
            e.keywords = parse_list_value(value);
            if (e.keywords.empty() &&
                std::find(e.missing_fields.begin(), e.missing_fields.end(), "keywords") == e.missing_fields.end()) {
                e.missing_fields.push_back("keywords");
            }
        } else if (key == "enabled") {
            std::string lower = to_lower(value);
            if (lower == "true" || lower == "yes") {
                e.enabled = true;
            } else if (lower == "false" || lower == "no") {
                e.enabled = false;
            } else if (!value.empty()) {
                e.missing_fields.push_back("enabled");
            }
        } else if (key == "priority") {
            e.priority = parse_int(value).value_or(kDefaultInstructionPriority);
        } else {
            e.extra.emplace_back(key, value);
        }
    }

    return e;
}

InstructionStore::InstructionStore(const Config& config)
    : config_(config), log_(component_logger(config, "instructions")) {}

std::string InstructionStore::path_for(const std::string& id) const {
    return join_path(config_.paths.instructions_dir, id + ".md");
}

Result<std::vector<InstructionEntry>> InstructionStore::read() const {
    std::vector<InstructionEntry> entries;
    for (const auto& name : list_directory(config_.paths.instructions_dir)) {
        if (!ends_with(name, ".md")) continue;
        std::string path = join_path(config_.paths.instructions_dir, name);
        if (!is_regular_file(path)) continue;

        auto content = read_file(path);
        if (!content) {
            return Result<std::vector<InstructionEntry>>::err(
                Error(ErrorCode::IO_ERROR, "cannot read " + path));
        }
        entries.push_back(parse_instruction(path, *content));
    }
    return Result<std::vector<InstructionEntry>>::ok(entries);
}

Result<std::optional<InstructionEntry>> InstructionStore::find(const std::string& id) const {
    std::string path = path_for(id);
    if (!is_regular_file(path)) {
        return Result<std::optional<InstructionEntry>>::ok(std::nullopt);
    }
    auto content = read_file(path);
    if (!content) {
        return Result<std::optional<InstructionEntry>>::err(Error(ErrorCode::IO_ERROR, "cannot read " + path));
    }
    return Result<std::optional<InstructionEntry>>::ok(parse_instruction(path, *content));
}

Result<void> InstructionStore::create(const InstructionEntry& entry) const {
    std::string path = path_for(entry.id);
    if (path_exists(path)) {
        return Result<void>::err(Error(ErrorCode::DUPLICATE, "instruction '" + entry.id + "' already exists"));
    }

    Frontmatter fm;
    fm.present = true;
    fm.set("id", entry.id);
    fm.set("name", entry.name);
    fm.set("keywords", format_list_value(entry.keywords));
    fm.set("enabled", entry.enabled ? "true" : "false");
    fm.set("priority", std::to_string(entry.priority));
    for (const auto& [k, v] : entry.extra) fm.set(k, v);
    fm.body = entry.body;
    if (!fm.body.empty() && fm.body.back() != '\n') fm.body += "\n";

    auto written = atomic_write_file(path, render_frontmatter(fm));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, path + ": " + written.error));
    }
    log_->info("created instruction {}", entry.id);
    return Result<void>::ok();
}

Result<void> InstructionStore::set_field(const std::string& id, const std::string& key,
                                         const std::string& value) const {
    std::string path = path_for(id);
    auto content = read_file(path);
    if (!content) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "instruction '" + id + "' not found"));
    }

    auto fm = parse_frontmatter(*content);
    if (!fm.present) {
        return Result<void>::err(Error(ErrorCode::VALIDATION_ERROR,
            "instruction '" + id + "' has no frontmatter; add a header before toggling it"));
    }
    fm.set(key, value);

    auto written = atomic_write_file(path, render_frontmatter(fm));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, path + ": " + written.error));
    }
    log_->info("instruction {}: {} = {}", id, key, value);
    return Result<void>::ok();
}

Result<std::vector<InstructionEntry>> InstructionStore::match(const std::string& prompt) const {
    auto all = read();
    if (all.isErr()) return all;

    std::string lower_prompt = to_lower(prompt);
    std::vector<InstructionEntry> matched;
    for (auto& e : all.value()) {
        if (!e.well_formed() || !e.enabled) continue;
        bool hit = std::any_of(e.keywords.begin(), e.keywords.end(), [&](const std::string& kw) {
            return !kw.empty() && lower_prompt.find(to_lower(kw)) != std::string::npos;
        });
        if (hit) matched.push_back(std::move(e));
    }

    std::stable_sort(matched.begin(), matched.end(),
                     [](const InstructionEntry& a, const InstructionEntry& b) { return a.priority < b.priority; });
    return Result<std::vector<InstructionEntry>>::ok(matched);
}

Result<InstructionSnapshot> InstructionStore::snapshot() const {
    auto entries = read();
    if (entries.isErr()) return Result<InstructionSnapshot>::err(entries.error());
    InstructionSnapshot snap;
    snap.instructions = std::move(entries.value());
    return Result<InstructionSnapshot>::ok(std::move(snap));
}

} // namespace steward
