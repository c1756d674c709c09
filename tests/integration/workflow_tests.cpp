#include <doctest/doctest.h>
#include <steward/doctor.hpp>
#include <steward/hook_store.hpp>
#include <steward/instruction_store.hpp>
#include <steward/json_document.hpp>
#include <steward/reconciler.hpp>
#include <steward/registrar.hpp>
#include <steward/report.hpp>

#include "../test_support.hpp"

using namespace steward;
using steward::testing::TestHostRoot;

namespace {

size_t total_records(const Config& config) {
    Reconciler reconciler(config);
    size_t n = 0;
    for (ResourceKind kind : all_resource_kinds()) {
        auto s = reconciler.status(kind);
        REQUIRE(s.isOk());
        n += s.value().summary.total;
    }
    return n;
}

size_t needing_attention(const Config& config) {
    Reconciler reconciler(config);
    size_t n = 0;
    for (ResourceKind kind : all_resource_kinds()) {
        auto s = reconciler.status(kind);
        REQUIRE(s.isOk());
        n += s.value().summary.needs_attention();
    }
    return n;
}

// A host whose settings and skills were edited by hand
void seed_unmanaged_host(TestHostRoot& host) {
    std::string guard = host.write("hooks/guard.sh", "#!/bin/sh\nexit 0\n");
    host.write_settings(R"({"model": "opus", "hooks": {"PreToolUse": [
        {"matcher": "Bash", "hooks": [{"type": "command", "command": "bash )" + guard + R"("}]}
    ]}})");
    host.write_capability("foo", "---\nname: Foo\ndescription: Does foo\n---\n");
}

} // namespace

TEST_CASE("discovery registers hand-made resources once") {
    TestHostRoot host;
    seed_unmanaged_host(host);
    Registrar registrar(host.config());

    SUBCASE("dry run changes nothing") {
        auto preview = registrar.discover(false);
        CHECK_FALSE(preview.applied);
        CHECK(preview.items.size() == 2);
        CHECK(preview.registered_count() == 0);
        CHECK_FALSE(path_exists(host.paths().hook_registry));
    }

    SUBCASE("applied twice") {
        auto first = registrar.discover(true);
        CHECK(first.errors.empty());
        CHECK(first.registered_count() == 2);

        auto second = registrar.discover(true);
        CHECK(second.items.empty());
        CHECK(second.registered_count() == 0);

        auto caps = Reconciler(host.config()).status(ResourceKind::Capability);
        REQUIRE(caps.isOk());
        REQUIRE(caps.value().records.size() == 1);
        CHECK(caps.value().records[0].id == "foo");
        CHECK(caps.value().records[0].status == Status::Registered);

        auto hooks = Reconciler(host.config()).status(ResourceKind::Hook);
        REQUIRE(hooks.isOk());
        REQUIRE(hooks.value().records.size() == 1);
        CHECK(hooks.value().records[0].status == Status::Active);
    }
}

TEST_CASE("discovery registers every command that derives the same id") {
    TestHostRoot host;
    host.write_settings(R"({"hooks": {"Stop": [{"hooks": [
        {"type": "command", "command": "bash /a/guard.sh"},
        {"type": "command", "command": "node /b/guard.js"}
    ]}]}})");
    Registrar registrar(host.config());

    auto first = registrar.discover(true);
    CHECK(first.errors.empty());
    CHECK(first.registered_count() == 2);

    auto second = registrar.discover(true);
    CHECK(second.items.empty());
    CHECK(second.registered_count() == 0);

    auto registry = HookStore(host.config()).read_registry();
    REQUIRE(registry.isOk());
    REQUIRE(registry.value().size() == 2);
    CHECK(registry.value()[0].id == "guard");
    CHECK(registry.value()[0].command == "bash /a/guard.sh");
    CHECK(registry.value()[1].id == "guard@Stop");
    CHECK(registry.value()[1].command == "node /b/guard.js");

    auto hooks = Reconciler(host.config()).status(ResourceKind::Hook);
    REQUIRE(hooks.isOk());
    CHECK(hooks.value().summary.total == 2);
    CHECK(hooks.value().summary.count(Status::Active) == 2);
}

TEST_CASE("a managed host has nothing needing attention") {
    TestHostRoot host;
    seed_unmanaged_host(host);
    CHECK(needing_attention(host.config()) == 2);

    Registrar registrar(host.config());
    REQUIRE(registrar.discover(true).registered_count() == 2);
    REQUIRE(registrar.enable(ResourceKind::Capability, "foo").ok);

    ServerEntry server;
    server.name = "remote";
    server.url = "https://example.com/mcp";
    REQUIRE(registrar.add_server(server).ok);

    InstructionEntry instruction;
    instruction.id = "style";
    instruction.keywords = {"style", "lint"};
    instruction.enabled = true;
    REQUIRE(registrar.add_instruction(instruction).ok);

    CHECK(total_records(host.config()) == 4);
    CHECK(needing_attention(host.config()) == 0);

    Doctor doctor(host.config());
    auto report = doctor.run(false);
    CHECK(report.issue_count() == 0);
    CHECK(report.healthy_count() == 4);

    auto matched = InstructionStore(host.config()).match("check the lint output");
    REQUIRE(matched.isOk());
    REQUIRE(matched.value().size() == 1);
    CHECK(matched.value()[0].id == "style");
}

TEST_CASE("hook lifecycle leaves unrelated settings alone") {
    TestHostRoot host;
    seed_unmanaged_host(host);
    Registrar registrar(host.config());
    REQUIRE(registrar.discover(true).registered_count() == 2);

    REQUIRE(registrar.disable(ResourceKind::Hook, "guard").ok);
    REQUIRE(registrar.enable(ResourceKind::Hook, "guard").ok);
    auto removed = registrar.remove(ResourceKind::Hook, "guard");
    REQUIRE(removed.ok);
    CHECK_FALSE(removed.archived_path.empty());

    auto settings = read_json_document(host.paths().settings_file);
    REQUIRE(settings.isOk());
    CHECK(settings.value()["model"] == "opus");

    auto live = HookStore(host.config()).read_live();
    REQUIRE(live.isOk());
    CHECK(live.value().empty());
}

TEST_CASE("configuration report covers every kind") {
    TestHostRoot host;
    seed_unmanaged_host(host);
    host.write("steward/instructions/raw.md", "no header | pipes\n");

    auto written = write_config_report(host.config());
    REQUIRE(written.isOk());
    CHECK(written.value() == host.paths().reports_dir + "/config-report.md");

    std::string report = TestHostRoot::slurp(written.value());
    CHECK(report.find("# Configuration Report") == 0);
    CHECK(report.find("3 resources, 0 consistent, 3 need attention") != std::string::npos);
    CHECK(report.find("## Hooks") != std::string::npos);
    CHECK(report.find("| guard | orphaned-live | yes |") != std::string::npos);
    CHECK(report.find("| foo | orphaned-disk | no |") != std::string::npos);
    CHECK(report.find("## Servers\n\n_None_") != std::string::npos);
    CHECK(report.find("| raw | no-frontmatter |") != std::string::npos);
}

TEST_CASE("a broken store fails the report") {
    TestHostRoot host;
    host.write("steward/servers.json", "[]");
    auto written = write_config_report(host.config());
    REQUIRE(written.isErr());
    CHECK(written.error().code() == ErrorCode::PARSE_ERROR);
}
