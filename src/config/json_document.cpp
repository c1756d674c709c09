#include "steward/json_document.hpp"
#include "steward/platform.hpp"

namespace steward {

Result<json> read_json_document(const std::string& path) {
    if (!path_exists(path)) {
        return Result<json>::ok(json::object());
    }

    auto content = read_file(path);
    if (!content) {
        return Result<json>::err(Error(ErrorCode::IO_ERROR, "cannot read " + path));
    }

    try {
        auto doc = json::parse(*content);
        if (!doc.is_object()) {
            return Result<json>::err(Error(ErrorCode::PARSE_ERROR, path + ": expected a JSON object"));
        }
        return Result<json>::ok(std::move(doc));
    } catch (const json::parse_error& e) {
        return Result<json>::err(Error(ErrorCode::PARSE_ERROR, path + ": " + e.what()));
    }
}

Result<void> write_json_document(const std::string& path, const json& doc) {
    auto result = atomic_write_file(path, doc.dump(2) + "\n");
    if (!result.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, path + ": " + result.error));
    }
    return Result<void>::ok();
}

} // namespace steward
