#include <doctest/doctest.h>
#include <steward/capability_store.hpp>
#include <steward/hook_store.hpp>
#include <steward/json_document.hpp>
#include <steward/reconciler.hpp>
#include <steward/registrar.hpp>
#include <steward/server_store.hpp>

#include "../test_support.hpp"

using namespace steward;
using steward::testing::TestHostRoot;

namespace {

HookEntry new_hook(const std::string& id, const std::string& event, const std::string& command) {
    HookEntry e;
    e.id = id;
    e.event = event;
    e.command = command;
    return e;
}

Status status_of(const Config& config, ResourceKind kind, const std::string& id) {
    auto s = Reconciler(config).status(kind);
    REQUIRE(s.isOk());
    for (const auto& r : s.value().records) {
        if (r.id == id) return r.status;
    }
    FAIL("no record " << id);
    return Status::Registered;
}

} // namespace

TEST_CASE("resource ids are restricted to a safe alphabet") {
    CHECK(is_valid_resource_id("guard"));
    CHECK(is_valid_resource_id("fmt@Stop"));
    CHECK(is_valid_resource_id("a.b_c-d"));
    CHECK_FALSE(is_valid_resource_id(""));
    CHECK_FALSE(is_valid_resource_id(".hidden"));
    CHECK_FALSE(is_valid_resource_id("../escape"));
    CHECK_FALSE(is_valid_resource_id("has space"));
    CHECK_FALSE(is_valid_resource_id(std::string(129, 'a')));
}

// ============================================================================
// Hooks
// ============================================================================

TEST_CASE("add_hook validates event and matcher") {
    TestHostRoot host;
    Registrar registrar(host.config());

    auto bad_event = registrar.add_hook(new_hook("x", "OnSave", "bash /x.sh"));
    CHECK_FALSE(bad_event.ok);
    CHECK(bad_event.code == ErrorCode::VALIDATION_ERROR);

    auto h = new_hook("x", "Stop", "bash /x.sh");
    h.matcher = "Bash";
    auto bad_matcher = registrar.add_hook(h);
    CHECK_FALSE(bad_matcher.ok);
    CHECK(bad_matcher.code == ErrorCode::VALIDATION_ERROR);

    auto empty = registrar.add_hook(new_hook("x", "Stop", "   "));
    CHECK_FALSE(empty.ok);
}

TEST_CASE("add_hook writes live and registry, warning about a missing script") {
    TestHostRoot host;
    host.write_settings(R"({"model": "opus"})");
    Registrar registrar(host.config());

    auto r = registrar.add_hook(new_hook("", "PreToolUse", "node /nowhere/guard.js"));
    REQUIRE(r.ok);
    CHECK(r.message.find("[WARNING: script file not found: /nowhere/guard.js]") != std::string::npos);

    HookStore store(host.config());
    auto registry = store.read_registry();
    REQUIRE(registry.isOk());
    REQUIRE(registry.value().size() == 1);
    CHECK(registry.value()[0].id == "guard");
    CHECK(registry.value()[0].matcher == "*");
    CHECK(registry.value()[0].key.size() == 36);

    auto settings = read_json_document(host.paths().settings_file);
    REQUIRE(settings.isOk());
    CHECK(settings.value()["model"] == "opus");
    CHECK(settings.value()["hooks"]["PreToolUse"][0]["matcher"] == "*");

    CHECK(status_of(host.config(), ResourceKind::Hook, "guard") == Status::Active);
}

TEST_CASE("add_hook rejects a duplicate id") {
    TestHostRoot host;
    Registrar registrar(host.config());
    REQUIRE(registrar.add_hook(new_hook("guard", "Stop", "bash /a.sh")).ok);

    auto dup = registrar.add_hook(new_hook("guard", "Stop", "bash /b.sh"));
    CHECK_FALSE(dup.ok);
    CHECK(dup.code == ErrorCode::DUPLICATE);
    CHECK(dup.message == "Hook 'guard' already exists in registry (event=Stop)");

    auto same_command = registrar.add_hook(new_hook("other", "Stop", "bash /a.sh"));
    CHECK_FALSE(same_command.ok);
    CHECK(same_command.code == ErrorCode::DUPLICATE);
}

TEST_CASE("add then remove restores the registry byte for byte and archives the script") {
    TestHostRoot host;
    Registrar registrar(host.config());
    REQUIRE(registrar.add_hook(new_hook("keep", "Stop", "bash /elsewhere/keep.sh")).ok);
    const std::string before = TestHostRoot::slurp(host.paths().hook_registry);

    std::string script = host.write("hooks/temp.sh", "#!/bin/sh\necho hi\n");
    auto added = registrar.add_hook(new_hook("temp", "SessionStart", "bash " + script));
    REQUIRE(added.ok);
    CHECK(added.warning.empty());
    CHECK(TestHostRoot::slurp(host.paths().hook_registry) != before);

    auto removed = registrar.remove(ResourceKind::Hook, "temp");
    REQUIRE(removed.ok);
    CHECK(TestHostRoot::slurp(host.paths().hook_registry) == before);
    CHECK_FALSE(path_exists(script));
    CHECK(is_regular_file(removed.archived_path));
    CHECK(host.archive_count() == 1);

    auto settings = read_json_document(host.paths().settings_file);
    REQUIRE(settings.isOk());
    CHECK_FALSE(settings.value()["hooks"].contains("SessionStart"));
}

TEST_CASE("add then remove leaves hand-written stores byte for byte") {
    TestHostRoot host;
    const std::string servers = host.write("steward/servers.json",
        "{\n"
        "  \"$schema\": \"https://example.com/servers.schema.json\",\n"
        "  \"db\": {\n"
        "    \"command\": \"true\",\n"
        "    \"enabled\": true\n"
        "  },\n"
        "  \"_comment\": \"edited by hand\"\n"
        "}\n");
    const std::string capabilities = host.write("steward/registries/capability-registry.json",
        "{\n"
        "  \"items\": [\n"
        "    {\n"
        "      \"id\": \"old\",\n"
        "      \"path\": \"/x/SKILL.md\"\n"
        "    },\n"
        "    {\n"
        "      \"note\": \"no id\"\n"
        "    }\n"
        "  ]\n"
        "}\n");
    const std::string servers_before = TestHostRoot::slurp(servers);
    const std::string capabilities_before = TestHostRoot::slurp(capabilities);

    Registrar registrar(host.config());

    SUBCASE("servers") {
        ServerEntry web;
        web.name = "web";
        web.url = "https://example.com/mcp";
        REQUIRE(registrar.add_server(web).ok);

        auto doc = read_json_document(servers);
        REQUIRE(doc.isOk());
        CHECK(doc.value()["$schema"] == "https://example.com/servers.schema.json");
        CHECK(doc.value()["_comment"] == "edited by hand");
        CHECK_FALSE(doc.value()["db"].contains("args"));
        CHECK(doc.value()["web"]["url"] == "https://example.com/mcp");

        REQUIRE(registrar.remove(ResourceKind::Server, "web").ok);
        CHECK(TestHostRoot::slurp(servers) == servers_before);
    }

    SUBCASE("server toggle only touches its entry") {
        REQUIRE(registrar.disable(ResourceKind::Server, "db").ok);
        auto doc = read_json_document(servers);
        REQUIRE(doc.isOk());
        CHECK(doc.value()["db"]["enabled"] == false);
        CHECK(doc.value()["db"].size() == 2);
        CHECK(doc.value()["_comment"] == "edited by hand");

        REQUIRE(registrar.enable(ResourceKind::Server, "db").ok);
        CHECK(TestHostRoot::slurp(servers) == servers_before);
    }

    SUBCASE("capabilities") {
        CapabilityEntry tmp;
        tmp.id = "tmp";
        REQUIRE(registrar.add_capability(tmp).ok);
        auto doc = read_json_document(capabilities);
        REQUIRE(doc.isOk());
        CHECK(doc.value()["items"].size() == 3);
        CHECK_FALSE(doc.value()["items"][0].contains("name"));

        REQUIRE(registrar.remove(ResourceKind::Capability, "tmp").ok);
        CHECK(TestHostRoot::slurp(capabilities) == capabilities_before);
    }
}

TEST_CASE("remove, enable and disable reject ids that could leave the store") {
    TestHostRoot host;
    const std::string claude = host.write("CLAUDE.md", "---\nid: CLAUDE\nname: Top\nenabled: true\n---\nbody\n");
    Registrar registrar(host.config());

    for (ResourceKind kind : all_resource_kinds()) {
        for (const std::string id : {"../../CLAUDE", "a/b", ".hidden", ""}) {
            CAPTURE(id);
            for (const auto& r : {registrar.remove(kind, id), registrar.enable(kind, id),
                                  registrar.disable(kind, id)}) {
                CHECK_FALSE(r.ok);
                CHECK(r.code == ErrorCode::VALIDATION_ERROR);
            }
        }
    }
    CHECK(TestHostRoot::slurp(claude) == "---\nid: CLAUDE\nname: Top\nenabled: true\n---\nbody\n");
    CHECK(host.archive_count() == 0);
}

TEST_CASE("removing a hook leaves scripts outside the host root in place") {
    TestHostRoot host;
    TestHostRoot other;
    std::string script = other.write("outside.sh", "#!/bin/sh\n");

    Registrar registrar(host.config());
    REQUIRE(registrar.add_hook(new_hook("outside", "Stop", "bash " + script)).ok);
    auto removed = registrar.remove(ResourceKind::Hook, "outside");
    REQUIRE(removed.ok);
    CHECK(path_exists(script));
    CHECK(removed.archived_path.empty());
}

TEST_CASE("remove of an unknown id is not found") {
    TestHostRoot host;
    Registrar registrar(host.config());
    for (ResourceKind kind : all_resource_kinds()) {
        auto r = registrar.remove(kind, "ghost");
        CHECK_FALSE(r.ok);
        CHECK(r.code == ErrorCode::NOT_FOUND);
    }
}

TEST_CASE("hook disable then enable round trips the live store") {
    TestHostRoot host;
    host.write_settings(R"({"theme": "dark"})");
    Registrar registrar(host.config());
    REQUIRE(registrar.add_hook(new_hook("done", "Stop", "bash /x/done.sh")).ok);
    const std::string enabled_settings = TestHostRoot::slurp(host.paths().settings_file);

    auto disabled = registrar.disable(ResourceKind::Hook, "done");
    REQUIRE(disabled.ok);
    CHECK(status_of(host.config(), ResourceKind::Hook, "done") == Status::Registered);
    auto settings = read_json_document(host.paths().settings_file);
    REQUIRE(settings.isOk());
    CHECK_FALSE(settings.value()["hooks"].contains("Stop"));
    CHECK(settings.value()["theme"] == "dark");

    auto again = registrar.disable(ResourceKind::Hook, "done");
    REQUIRE(again.ok);
    CHECK(again.message == "Hook 'done' already disabled");

    REQUIRE(registrar.enable(ResourceKind::Hook, "done").ok);
    CHECK(status_of(host.config(), ResourceKind::Hook, "done") == Status::Active);
    CHECK(TestHostRoot::slurp(host.paths().settings_file) == enabled_settings);

    auto registry = read_json_document(host.paths().hook_registry);
    REQUIRE(registry.isOk());
    CHECK(registry.value()["items"][0]["managed"] == true);
}

TEST_CASE("enabling an unregistered hook points at discovery") {
    TestHostRoot host;
    Registrar registrar(host.config());
    auto r = registrar.enable(ResourceKind::Hook, "nobody");
    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::NOT_FOUND);
}

// ============================================================================
// Capabilities
// ============================================================================

TEST_CASE("add_capability fills defaults and warns without a descriptor") {
    TestHostRoot host;
    Registrar registrar(host.config());

    CapabilityEntry e;
    e.id = "pdf-tools";
    auto r = registrar.add_capability(e);
    REQUIRE(r.ok);
    CHECK(r.warning.find("SKILL.md not found at") == 0);

    auto reg = CapabilityStore(host.config()).read_registry();
    REQUIRE(reg.isOk());
    REQUIRE(reg.value().size() == 1);
    CHECK(reg.value()[0].name == "pdf-tools");
    CHECK(reg.value()[0].keywords == std::vector<std::string>{"pdf tools", "pdf-tools"});
    CHECK(reg.value()[0].enabled);
    CHECK(status_of(host.config(), ResourceKind::Capability, "pdf-tools") == Status::OrphanedRegistry);
}

TEST_CASE("capability removal archives the whole directory") {
    TestHostRoot host;
    host.write_capability("pdf");
    host.write("skills/pdf/scripts/run.py", "print(1)\n");
    Registrar registrar(host.config());

    CapabilityEntry e;
    e.id = "pdf";
    REQUIRE(registrar.add_capability(e).ok);
    CHECK(status_of(host.config(), ResourceKind::Capability, "pdf") == Status::Managed);

    auto removed = registrar.remove(ResourceKind::Capability, "pdf");
    REQUIRE(removed.ok);
    CHECK_FALSE(path_exists(host.root() + "/skills/pdf"));
    CHECK(is_regular_file(removed.archived_path + "/scripts/run.py"));
}

TEST_CASE("register_disk_capability reads the descriptor header") {
    TestHostRoot host;
    std::string descriptor = host.write_capability("charts",
        "---\nname: Chart Builder\ndescription: Draws charts\n---\n# Charts\n");
    Registrar registrar(host.config());

    auto r = registrar.register_disk_capability("charts", descriptor);
    REQUIRE(r.ok);
    auto reg = CapabilityStore(host.config()).read_registry();
    REQUIRE(reg.isOk());
    REQUIRE(reg.value().size() == 1);
    CHECK(reg.value()[0].name == "Chart Builder");
    CHECK(reg.value()[0].description == "Draws charts");
    CHECK_FALSE(reg.value()[0].enabled);
    CHECK(status_of(host.config(), ResourceKind::Capability, "charts") == Status::Registered);

    CHECK(registrar.register_disk_capability("charts", descriptor).code == ErrorCode::DUPLICATE);
}

// ============================================================================
// Servers and instructions
// ============================================================================

TEST_CASE("add_server needs a command or url and keeps unknown fields") {
    TestHostRoot host;
    host.write("steward/servers.json", R"({"old": {"command": "sh", "enabled": true, "timeout": 30}})");
    Registrar registrar(host.config());

    ServerEntry empty;
    empty.name = "nothing";
    CHECK(registrar.add_server(empty).code == ErrorCode::VALIDATION_ERROR);

    ServerEntry remote;
    remote.name = "remote";
    remote.url = "https://example.com/mcp";
    REQUIRE(registrar.add_server(remote).ok);

    ServerEntry local;
    local.name = "local";
    local.command = "steward-no-such-binary";
    auto r = registrar.add_server(local);
    REQUIRE(r.ok);
    CHECK(r.warning == "command not found in PATH: steward-no-such-binary");

    auto doc = read_json_document(host.paths().servers_file);
    REQUIRE(doc.isOk());
    CHECK(doc.value()["old"]["timeout"] == 30);
    CHECK(doc.value().size() == 3);

    REQUIRE(registrar.disable(ResourceKind::Server, "old").ok);
    CHECK(status_of(host.config(), ResourceKind::Server, "old") == Status::Registered);
    CHECK(registrar.enable(ResourceKind::Server, "old").ok);
}

TEST_CASE("server removal archives the entry") {
    TestHostRoot host;
    Registrar registrar(host.config());
    ServerEntry s;
    s.name = "db";
    s.command = "sh";
    REQUIRE(registrar.add_server(s).ok);

    auto removed = registrar.remove(ResourceKind::Server, "db");
    REQUIRE(removed.ok);
    auto archived = read_json_document(removed.archived_path);
    REQUIRE(archived.isOk());
    CHECK(archived.value()["db"]["command"] == "sh");

    auto servers = ServerStore(host.config()).read();
    REQUIRE(servers.isOk());
    CHECK(servers.value().empty());
}

TEST_CASE("instruction add, toggle and remove") {
    TestHostRoot host;
    Registrar registrar(host.config());

    InstructionEntry e;
    e.id = "testing";
    e.name = "Testing";
    e.keywords = {"test"};
    e.enabled = true;
    e.priority = 20;
    REQUIRE(registrar.add_instruction(e).ok);
    CHECK(registrar.add_instruction(e).code == ErrorCode::DUPLICATE);
    CHECK(status_of(host.config(), ResourceKind::Instruction, "testing") == Status::Managed);

    REQUIRE(registrar.disable(ResourceKind::Instruction, "testing").ok);
    CHECK(status_of(host.config(), ResourceKind::Instruction, "testing") == Status::Registered);

    auto removed = registrar.remove(ResourceKind::Instruction, "testing");
    REQUIRE(removed.ok);
    CHECK(is_regular_file(removed.archived_path));
}
