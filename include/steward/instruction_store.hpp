#pragma once

#include "steward/config.hpp"
#include "steward/result.hpp"
#include "steward/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

constexpr int kDefaultInstructionPriority = 50;

// Header fields an instruction must carry to be well-formed
const std::vector<std::string>& required_instruction_fields();

// Interpret one instruction document. file_path names the record (its stem
// is the id) and is stored on the entry.
InstructionEntry parse_instruction(const std::string& file_path, const std::string& content);

struct InstructionSnapshot {
    std::vector<InstructionEntry> instructions;   // sorted by id
};

/**
 * Adapter for the instructions directory. Each `<id>.md` file is both the
 * registry entry and the live content.
 */
class InstructionStore {
public:
    explicit InstructionStore(const Config& config);

    Result<std::vector<InstructionEntry>> read() const;
    Result<std::optional<InstructionEntry>> find(const std::string& id) const;

    std::string path_for(const std::string& id) const;

    // Write a new file from entry (fails if it exists)
    Result<void> create(const InstructionEntry& entry) const;

    // Rewrite one header field in place, keeping the rest of the file
    Result<void> set_field(const std::string& id, const std::string& key, const std::string& value) const;

    // Enabled instructions with a keyword occurring in the prompt
    // (case-insensitive), by ascending priority
    Result<std::vector<InstructionEntry>> match(const std::string& prompt) const;

    Result<InstructionSnapshot> snapshot() const;

private:
    Config config_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace steward
