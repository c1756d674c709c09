#include <doctest/doctest.h>
#include <steward/doctor.hpp>
#include <steward/hook_store.hpp>
#include <steward/json_document.hpp>

#include "../test_support.hpp"

#include <algorithm>

using namespace steward;
using steward::testing::TestHostRoot;

namespace {

const VerifyResult& kind_result(const DoctorReport& report, ResourceKind kind) {
    auto it = std::find_if(report.kinds.begin(), report.kinds.end(),
                           [&](const VerifyResult& v) { return v.kind == kind; });
    REQUIRE(it != report.kinds.end());
    return *it;
}

bool has_issue(const VerifyResult& v, const std::string& item, IssueCode code) {
    return std::any_of(v.issues.begin(), v.issues.end(), [&](const Issue& i) {
        return i.item == item && i.code == code;
    });
}

bool is_healthy(const VerifyResult& v, const std::string& item) {
    return std::find(v.healthy.begin(), v.healthy.end(), item) != v.healthy.end();
}

ResourceRecord registered_hook(const std::string& id, const std::string& script, bool exists) {
    ResourceRecord rec;
    rec.kind = ResourceKind::Hook;
    rec.id = id;
    rec.status = Status::Registered;
    rec.in_registry = true;
    rec.backing_path = script;
    rec.backing_exists = exists;
    HookEntry e;
    e.id = id;
    e.event = "Stop";
    e.command = "bash " + script;
    rec.hook = e;
    return rec;
}

} // namespace

TEST_CASE("every issue code has text and a fix action") {
    for (IssueCode code : {IssueCode::OrphanedLive, IssueCode::StaleRegistry, IssueCode::ScriptMissing,
                           IssueCode::ScriptUnresolvable, IssueCode::SyntaxError, IssueCode::CheckFailed,
                           IssueCode::OrphanedRegistry, IssueCode::OrphanedDisk, IssueCode::DisabledOnDisk,
                           IssueCode::CommandNotFound, IssueCode::MissingCommandAndUrl,
                           IssueCode::MissingFrontmatter, IssueCode::MissingFields, IssueCode::DuplicateId,
                           IssueCode::StoreUnreadable}) {
        auto issue = make_issue(ResourceKind::Hook, "x", code);
        CHECK_FALSE(issue.problem.empty());
        CHECK_FALSE(issue.fix.empty());
        CHECK_FALSE(issue.explanation.empty());
        CHECK(std::string(issue_code_to_string(code)) != "unknown");
    }

    CHECK(fix_action_for(IssueCode::OrphanedLive) == FixAction::Register);
    CHECK(fix_action_for(IssueCode::OrphanedDisk) == FixAction::Register);
    CHECK(fix_action_for(IssueCode::StaleRegistry) == FixAction::RemoveRegistry);
    CHECK(fix_action_for(IssueCode::OrphanedRegistry) == FixAction::RemoveRegistry);
    CHECK(fix_action_for(IssueCode::DisabledOnDisk) == FixAction::None);
    CHECK(fix_action_for(IssueCode::SyntaxError) == FixAction::Manual);
    CHECK_FALSE(is_auto_fixable(IssueCode::ScriptMissing));
}

TEST_CASE("registered hooks are judged by their script") {
    TestHostRoot host;
    std::string script = host.write("hooks/done.sh", "#!/bin/sh\necho done\n");
    Doctor doctor(host.config());

    auto v = doctor.verify_records(ResourceKind::Hook,
                                   {registered_hook("done", script, true),
                                    registered_hook("gone", host.root() + "/hooks/gone.sh", false)});
    CHECK(is_healthy(v, "done"));
    CHECK(has_issue(v, "gone", IssueCode::StaleRegistry));
    CHECK_FALSE(is_healthy(v, "gone"));
}

TEST_CASE("doctor --fix never pushes a registered hook live") {
    TestHostRoot host;
    std::string script = host.write("hooks/foo.sh", "#!/bin/sh\necho foo\n");
    host.write_settings(R"({"theme": "dark"})");
    host.write("steward/registries/hook-registry.json",
               R"({"version": "1.0", "items": [{"id": "foo", "key": "k", "event": "Stop", "matcher": "",
                   "command": "bash )" + script + R"(", "async": false, "description": ""}]})");
    const std::string settings_before = TestHostRoot::slurp(host.paths().settings_file);

    Doctor doctor(host.config());
    auto report = doctor.run(true);
    CHECK(is_healthy(kind_result(report, ResourceKind::Hook), "foo"));
    CHECK(report.fixes.empty());
    CHECK(TestHostRoot::slurp(host.paths().settings_file) == settings_before);
}

TEST_CASE("doctor --fix registers an unregistered live hook") {
    TestHostRoot host;
    std::string script = host.write("hooks/notes.sh", "#!/bin/sh\necho notes\n");
    host.write_settings(R"({"hooks": {"Stop": [{"hooks": [{"type": "command", "command": "sh )" +
                        script + R"("}]}]}})");

    Doctor doctor(host.config());
    auto before = doctor.verify(ResourceKind::Hook);
    CHECK(has_issue(before, "notes", IssueCode::OrphanedLive));

    auto report = doctor.run(true);
    REQUIRE(report.fixes.size() == 1);
    CHECK(report.fixes[0].fixed);
    CHECK(report.fixed_count() == 1);

    auto registry = HookStore(host.config()).read_registry();
    REQUIRE(registry.isOk());
    REQUIRE(registry.value().size() == 1);
    CHECK(registry.value()[0].id == "notes");

    auto after = doctor.verify(ResourceKind::Hook);
    CHECK_FALSE(has_issue(after, "notes", IssueCode::OrphanedLive));
}

TEST_CASE("without --fix nothing is changed") {
    TestHostRoot host;
    host.write_settings(R"({"hooks": {"Stop": [{"hooks": [{"type": "command", "command": "bash /nowhere/x.sh"}]}]}})");
    host.write_capability("fresh");

    Doctor doctor(host.config());
    auto report = doctor.run(false);
    CHECK(report.fixes.empty());
    CHECK(report.fixable_count() == 2);
    CHECK(has_issue(kind_result(report, ResourceKind::Hook), "x", IssueCode::ScriptMissing));
    CHECK_FALSE(path_exists(host.paths().hook_registry));
    CHECK_FALSE(path_exists(host.paths().capability_registry));
}

TEST_CASE("capability orphans are fixed in both directions") {
    TestHostRoot host;
    host.write_capability("fresh", "---\nname: Fresh\n---\n");
    host.write("steward/registries/capability-registry.json", R"({"version": "1.0", "items": [
        {"id": "gone", "name": "Gone", "description": "", "keywords": ["gone"], "enabled": true,
         "path": "/nowhere/gone/SKILL.md"}
    ]})");

    Doctor doctor(host.config());
    auto before = doctor.verify(ResourceKind::Capability);
    CHECK(has_issue(before, "fresh", IssueCode::OrphanedDisk));
    CHECK(has_issue(before, "gone", IssueCode::OrphanedRegistry));

    auto report = doctor.run(true);
    CHECK(report.fixed_count() == 2);

    auto after = doctor.verify(ResourceKind::Capability);
    CHECK(has_issue(after, "fresh", IssueCode::DisabledOnDisk));
    CHECK_FALSE(has_issue(after, "gone", IssueCode::OrphanedRegistry));
    CHECK(after.records.size() == 1);
}

TEST_CASE("server entries need a way to be reached") {
    TestHostRoot host;
    host.write("steward/servers.json", R"({
        "empty": {"enabled": true},
        "absent": {"command": "steward-no-such-binary", "enabled": true},
        "off": {"command": "steward-no-such-binary", "enabled": false},
        "remote": {"url": "https://example.com/mcp", "enabled": true}
    })");

    Doctor doctor(host.config());
    auto v = doctor.verify(ResourceKind::Server);
    CHECK(has_issue(v, "empty", IssueCode::MissingCommandAndUrl));
    CHECK(has_issue(v, "absent", IssueCode::CommandNotFound));
    CHECK(is_healthy(v, "off"));
    CHECK(is_healthy(v, "remote"));
}

TEST_CASE("instruction headers are checked") {
    TestHostRoot host;
    host.write("steward/instructions/raw.md", "no header\n");
    host.write("steward/instructions/partial.md", "---\nid: partial\nname: Partial\n---\n");
    host.write("steward/instructions/a.md", "---\nid: shared\nname: A\nkeywords: [a]\nenabled: true\n---\n");
    host.write("steward/instructions/b.md", "---\nid: shared\nname: B\nkeywords: [b]\nenabled: true\n---\n");
    host.write("steward/instructions/ok.md", "---\nid: ok\nname: Ok\nkeywords: [ok]\nenabled: true\n---\n");

    Doctor doctor(host.config());
    auto v = doctor.verify(ResourceKind::Instruction);
    CHECK(has_issue(v, "raw", IssueCode::MissingFrontmatter));
    CHECK(has_issue(v, "partial", IssueCode::MissingFields));
    CHECK(has_issue(v, "a", IssueCode::DuplicateId));
    CHECK(has_issue(v, "b", IssueCode::DuplicateId));
    CHECK_FALSE(is_healthy(v, "a"));
    CHECK(is_healthy(v, "ok"));
}

TEST_CASE("an unreadable store becomes a single issue") {
    TestHostRoot host;
    host.write_settings("{not json");
    Doctor doctor(host.config());
    auto v = doctor.verify(ResourceKind::Hook);
    REQUIRE(v.issues.size() == 1);
    CHECK(v.issues[0].code == IssueCode::StoreUnreadable);
    CHECK(v.records.empty());
}

TEST_CASE("doctor reports duplicate capabilities") {
    TestHostRoot host;
    host.write_capability("pdf-skill");
    host.write_capability("pdf_api");

    Doctor doctor(host.config());
    auto report = doctor.run(false);
    REQUIRE(report.duplicates.size() == 1);
    CHECK(report.duplicates[0].type == DuplicateType::SimilarName);
}
