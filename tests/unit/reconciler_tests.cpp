#include <doctest/doctest.h>
#include <steward/reconciler.hpp>

#include "../test_support.hpp"

#include <algorithm>

using namespace steward;
using steward::testing::TestHostRoot;

namespace {

HookEntry hook(const std::string& id, const std::string& event, const std::string& command) {
    HookEntry e;
    e.id = id;
    e.event = event;
    e.command = command;
    return e;
}

const ResourceRecord* find(const std::vector<ResourceRecord>& records, const std::string& id) {
    auto it = std::find_if(records.begin(), records.end(), [&](const ResourceRecord& r) { return r.id == id; });
    return it == records.end() ? nullptr : &*it;
}

} // namespace

// ============================================================================
// Decision tables
// ============================================================================

TEST_CASE("hook decision table") {
    CHECK(classify_hook(true, true) == Status::Active);
    CHECK(classify_hook(true, false) == Status::OrphanedLive);
    CHECK(classify_hook(false, true) == Status::Registered);
}

TEST_CASE("capability decision table") {
    CHECK(classify_capability(true, true, true) == Status::Managed);
    CHECK(classify_capability(true, true, false) == Status::Registered);
    CHECK(classify_capability(false, true, true) == Status::OrphanedRegistry);
    CHECK(classify_capability(true, false, false) == Status::OrphanedDisk);
}

TEST_CASE("server and instruction decision tables") {
    CHECK(classify_server(true) == Status::Managed);
    CHECK(classify_server(false) == Status::Registered);
    CHECK(classify_instruction(true, true) == Status::Managed);
    CHECK(classify_instruction(true, false) == Status::Registered);
    CHECK(classify_instruction(false, true) == Status::NoFrontmatter);
}

// ============================================================================
// Hooks
// ============================================================================

TEST_CASE("live hooks join registry entries by command") {
    HookSnapshot snap;
    snap.registry = {hook("guard", "PreToolUse", "node /x/guard.js"),
                     hook("idle", "Stop", "bash /x/idle.sh")};
    snap.live = {hook("guard", "PreToolUse", "node /x/guard.js"),
                 hook("notes", "Stop", "bash /x/notes.sh")};

    auto records = reconcile_hooks(snap);
    REQUIRE(records.size() == 3);
    CHECK(find(records, "guard")->status == Status::Active);
    CHECK(find(records, "idle")->status == Status::Registered);
    CHECK(find(records, "notes")->status == Status::OrphanedLive);
    CHECK(find(records, "guard")->enabled);
    CHECK_FALSE(find(records, "idle")->enabled);

    // sorted by id
    CHECK(records[0].id == "guard");
    CHECK(records[2].id == "notes");
}

TEST_CASE("registry entry with a different event does not match") {
    HookSnapshot snap;
    snap.registry = {hook("fmt", "PostToolUse", "bash /x/fmt.sh")};
    snap.live = {hook("fmt", "Stop", "bash /x/fmt.sh")};

    auto records = reconcile_hooks(snap);
    REQUIRE(records.size() == 2);
    CHECK(find(records, "fmt")->status == Status::Registered);
    REQUIRE(find(records, "fmt@Stop"));
    CHECK(find(records, "fmt@Stop")->status == Status::OrphanedLive);
}

TEST_CASE("unregistered live hooks with the same derived id each keep a record") {
    HookSnapshot snap;
    snap.live = {hook("guard", "PreToolUse", "node /a/guard.js"),
                 hook("guard", "Stop", "bash /b/guard.sh"),
                 hook("guard", "Stop", "sh /c/guard.sh"),
                 hook("guard", "Stop", "bash /b/guard.sh")};

    auto records = reconcile_hooks(snap);
    REQUIRE(records.size() == 3);
    REQUIRE(find(records, "guard"));
    CHECK(find(records, "guard")->hook->command == "node /a/guard.js");
    REQUIRE(find(records, "guard@Stop"));
    CHECK(find(records, "guard@Stop")->hook->command == "bash /b/guard.sh");
    REQUIRE(find(records, "guard@Stop-2"));
    CHECK(find(records, "guard@Stop-2")->hook->command == "sh /c/guard.sh");
    for (const auto& r : records) {
        CHECK(r.status == Status::OrphanedLive);
        CHECK(r.hook->id == r.id);
    }
}

TEST_CASE("derived ids are made usable as resource ids") {
    HookSnapshot snap;
    snap.live = {hook("", "Stop", "bash \"/x/my hook.sh\""),
                 hook(".hidden", "Stop", "bash /x/.hidden.sh")};

    auto records = reconcile_hooks(snap);
    REQUIRE(records.size() == 2);
    CHECK(find(records, "my-hook"));
    CHECK(find(records, "hidden"));
}

TEST_CASE("every id is classified exactly once") {
    HookSnapshot snap;
    snap.registry = {hook("a", "Stop", "bash /a.sh"), hook("b", "Stop", "bash /b.sh")};
    snap.live = {hook("a", "Stop", "bash /a.sh"), hook("c", "Stop", "bash /c.sh"),
                 hook("a", "Stop", "bash /a.sh")};

    auto records = reconcile_hooks(snap);
    auto summary = summarize(ResourceKind::Hook, records);
    CHECK(summary.total == 3);
    CHECK(summary.count(Status::Active) == 1);
    CHECK(summary.count(Status::Registered) == 1);
    CHECK(summary.count(Status::OrphanedLive) == 1);
    CHECK(summary.consistent() == 2);
    CHECK(summary.needs_attention() == 1);
}

// ============================================================================
// Capabilities
// ============================================================================

TEST_CASE("capability reconciliation over registry and disk") {
    CapabilitySnapshot snap;
    CapabilityEntry enabled;
    enabled.id = "pdf";
    enabled.path = "/skills/pdf/SKILL.md";
    CapabilityEntry disabled;
    disabled.id = "xlsx";
    disabled.enabled = false;
    disabled.path = "/skills/xlsx/SKILL.md";
    CapabilityEntry gone;
    gone.id = "gone";
    gone.path = "/skills/gone/SKILL.md";
    snap.registry = {enabled, disabled, gone};
    snap.on_disk = {{"pdf", "/skills/pdf/SKILL.md"},
                    {"xlsx", "/skills/xlsx/SKILL.md"},
                    {"new-one", "/skills/new-one/SKILL.md"}};

    auto records = reconcile_capabilities(snap);
    REQUIRE(records.size() == 4);
    CHECK(find(records, "pdf")->status == Status::Managed);
    CHECK(find(records, "xlsx")->status == Status::Registered);
    CHECK(find(records, "gone")->status == Status::OrphanedRegistry);

    const auto* fresh = find(records, "new-one");
    REQUIRE(fresh);
    CHECK(fresh->status == Status::OrphanedDisk);
    REQUIRE(fresh->capability);
    CHECK(fresh->capability->keywords == std::vector<std::string>{"new one", "new-one"});
}

TEST_CASE("a recorded path outside the capabilities dir counts as present") {
    CapabilitySnapshot snap;
    CapabilityEntry e;
    e.id = "elsewhere";
    e.path = "/opt/elsewhere/SKILL.md";
    snap.registry = {e};
    snap.recorded_path_exists = {"elsewhere"};

    auto records = reconcile_capabilities(snap);
    REQUIRE(records.size() == 1);
    CHECK(records[0].status == Status::Managed);
    CHECK(records[0].backing_path == "/opt/elsewhere/SKILL.md");
}

// ============================================================================
// Reconciler over real stores
// ============================================================================

TEST_CASE("Reconciler reads each kind from its stores") {
    TestHostRoot host;
    host.write_capability("pdf");
    host.write("steward/servers.json", R"({"db": {"command": "db-server", "enabled": true},
                                          "remote": {"url": "https://x", "enabled": false}})");
    host.write("steward/instructions/raw.md", "no header\n");

    Reconciler reconciler(host.config());

    auto caps = reconciler.status(ResourceKind::Capability);
    REQUIRE(caps.isOk());
    CHECK(caps.value().summary.count(Status::OrphanedDisk) == 1);

    auto servers = reconciler.status(ResourceKind::Server);
    REQUIRE(servers.isOk());
    CHECK(servers.value().summary.total == 2);
    CHECK(servers.value().summary.count(Status::Managed) == 1);
    CHECK(servers.value().summary.count(Status::Registered) == 1);

    auto instructions = reconciler.status(ResourceKind::Instruction);
    REQUIRE(instructions.isOk());
    CHECK(instructions.value().summary.count(Status::NoFrontmatter) == 1);

    auto hooks = reconciler.status(ResourceKind::Hook);
    REQUIRE(hooks.isOk());
    CHECK(hooks.value().summary.total == 0);
}

TEST_CASE("an unreadable store fails that kind only") {
    TestHostRoot host;
    host.write("steward/servers.json", "{broken");
    Reconciler reconciler(host.config());

    auto servers = reconciler.status(ResourceKind::Server);
    REQUIRE(servers.isErr());
    CHECK(servers.error().code() == ErrorCode::PARSE_ERROR);
    CHECK(reconciler.status(ResourceKind::Hook).isOk());
}
