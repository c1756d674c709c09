#include <doctest/doctest.h>
#include <steward/json_document.hpp>
#include <steward/process.hpp>
#include <steward/supervisor.hpp>

#include "../test_support.hpp"

using namespace steward;
using steward::testing::TestHostRoot;

namespace {

// servers.json with a single entry
void write_server(TestHostRoot& host, const std::string& name, const std::string& command,
                  const std::string& args_json, bool enabled = true, bool auto_start = false) {
    host.write("steward/servers.json",
               "{\"" + name + "\": {\"command\": \"" + command + "\", \"args\": " + args_json +
               ", \"enabled\": " + (enabled ? "true" : "false") +
               ", \"auto_start\": " + (auto_start ? "true" : "false") + "}}");
}

} // namespace

TEST_CASE("process table round trips through disk") {
    TestHostRoot host;
    std::map<std::string, ServerProcessRecord> table;
    table["db"] = ServerProcessRecord{"db", 4242, "2026-01-01T00:00:00Z"};
    REQUIRE(write_process_table(host.paths().process_table, table).isOk());

    auto doc = read_json_document(host.paths().process_table);
    REQUIRE(doc.isOk());
    CHECK(doc.value()["db"]["pid"] == 4242);
    CHECK(doc.value()["db"]["startedAt"] == "2026-01-01T00:00:00Z");

    auto back = read_process_table(host.paths().process_table);
    REQUIRE(back.isOk());
    CHECK(back.value().at("db").pid == 4242);
}

TEST_CASE("start then stop leaves nothing tracked") {
    TestHostRoot host;
    write_server(host, "sleeper", "sleep", "[\"30\"]");
    ProcessSupervisor supervisor(host.config());

    auto started = supervisor.start("sleeper");
    REQUIRE(started.ok);
    CHECK(supervisor.state("sleeper") == ProcessState::Running);

    auto again = supervisor.start("sleeper");
    REQUIRE(again.ok);
    CHECK(again.message.find("already running") != std::string::npos);

    auto running = supervisor.running();
    REQUIRE(running.isOk());
    REQUIRE(running.value().size() == 1);
    int pid = running.value()[0].pid;
    CHECK(process_alive(pid));

    auto stopped = supervisor.stop("sleeper");
    REQUIRE(stopped.ok);
    CHECK(stopped.message.find("forced") == std::string::npos);
    CHECK_FALSE(process_alive(pid));
    CHECK(supervisor.state("sleeper") == ProcessState::Stopped);

    auto table = read_process_table(host.paths().process_table);
    REQUIRE(table.isOk());
    CHECK(table.value().empty());
}

TEST_CASE("stopping an untracked server is not found") {
    TestHostRoot host;
    ProcessSupervisor supervisor(host.config());
    auto r = supervisor.stop("ghost");
    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::NOT_FOUND);
}

TEST_CASE("a server that exits during startup is reported with its code") {
    TestHostRoot host;
    write_server(host, "flaky", "sh", "[\"-c\", \"exit 3\"]");
    ProcessSupervisor supervisor(host.config());

    auto r = supervisor.start("flaky");
    CHECK_FALSE(r.ok);
    CHECK(r.message.find("exited immediately with code 3") != std::string::npos);
    CHECK(supervisor.state("flaky") == ProcessState::Stopped);
}

TEST_CASE("a server ignoring SIGTERM is killed") {
    TestHostRoot host;
    write_server(host, "stubborn", "sh", "[\"-c\", \"trap '' TERM; sleep 30\"]");
    ProcessSupervisor supervisor(host.config());

    REQUIRE(supervisor.start("stubborn").ok);
    auto stopped = supervisor.stop("stubborn");
    REQUIRE(stopped.ok);
    CHECK(stopped.message.find("forced") != std::string::npos);
}

TEST_CASE("start refuses disabled, url-only and unknown servers") {
    TestHostRoot host;
    host.write("steward/servers.json", R"({
        "off": {"command": "sleep", "args": ["30"], "enabled": false},
        "remote": {"url": "https://example.com/mcp", "enabled": true},
        "missing": {"command": "steward-no-such-binary", "enabled": true}
    })");
    ProcessSupervisor supervisor(host.config());

    auto off = supervisor.start("off");
    CHECK_FALSE(off.ok);
    CHECK(off.code == ErrorCode::VALIDATION_ERROR);

    CHECK(supervisor.start("remote").code == ErrorCode::VALIDATION_ERROR);
    CHECK(supervisor.start("missing").code == ErrorCode::PROCESS_ERROR);
    CHECK(supervisor.start("nobody").code == ErrorCode::NOT_FOUND);
}

TEST_CASE("a stale pid is cleared on stop") {
    TestHostRoot host;
    // A pid far above any default pid_max
    std::map<std::string, ServerProcessRecord> table;
    table["gone"] = ServerProcessRecord{"gone", 99999999, "2026-01-01T00:00:00Z"};
    REQUIRE(write_process_table(host.paths().process_table, table).isOk());

    ProcessSupervisor supervisor(host.config());
    auto running = supervisor.running();
    REQUIRE(running.isOk());
    CHECK(running.value().empty());

    REQUIRE(write_process_table(host.paths().process_table, table).isOk());
    auto r = supervisor.stop("gone");
    REQUIRE(r.ok);
    CHECK(r.message.find("cleared stale pid") != std::string::npos);
}

TEST_CASE("reload restarts auto-start servers once") {
    TestHostRoot host;
    write_server(host, "db-sync", "sleep", "[\"30\"]", true, true);
    ProcessSupervisor supervisor(host.config());

    REQUIRE(supervisor.start("db-sync").ok);
    auto before = supervisor.running();
    REQUIRE(before.isOk());
    REQUIRE(before.value().size() == 1);
    int old_pid = before.value()[0].pid;

    auto reloaded = supervisor.reload();
    CHECK(reloaded.ok());
    CHECK(reloaded.stopped == std::vector<std::string>{"db-sync"});
    CHECK(reloaded.started == std::vector<std::string>{"db-sync"});
    CHECK_FALSE(process_alive(old_pid));

    auto after = supervisor.running();
    REQUIRE(after.isOk());
    REQUIRE(after.value().size() == 1);
    CHECK(after.value()[0].pid != old_pid);
    CHECK(process_alive(after.value()[0].pid));

    REQUIRE(supervisor.stop("db-sync").ok);
}

TEST_CASE("reload on an empty process table starts auto-start servers") {
    TestHostRoot host;
    write_server(host, "db-sync", "sleep", "[\"30\"]", true, true);
    CHECK_FALSE(path_exists(host.paths().process_table));
    ProcessSupervisor supervisor(host.config());

    auto reloaded = supervisor.reload();
    CHECK(reloaded.ok());
    CHECK(reloaded.stopped.empty());
    CHECK(reloaded.started == std::vector<std::string>{"db-sync"});

    auto running = supervisor.running();
    REQUIRE(running.isOk());
    REQUIRE(running.value().size() == 1);
    CHECK(running.value()[0].name == "db-sync");
    CHECK(process_alive(running.value()[0].pid));

    REQUIRE(supervisor.stop("db-sync").ok);
}
