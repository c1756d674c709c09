#include <doctest/doctest.h>
#include <steward/platform.hpp>
#include <steward/process.hpp>

#include "../test_support.hpp"

#include <signal.h>

using namespace steward;
using steward::testing::TestHostRoot;

TEST_CASE("atomic_write_file replaces content and creates parents") {
    TestHostRoot host;
    std::string path = host.root() + "/deep/er/file.json";

    auto first = atomic_write_file(path, "one");
    REQUIRE(first.ok);
    CHECK(TestHostRoot::slurp(path) == "one");

    auto second = atomic_write_file(path, "two");
    REQUIRE(second.ok);
    CHECK(TestHostRoot::slurp(path) == "two");

    // No temp files left behind
    CHECK(list_directory(host.root() + "/deep/er").size() == 1);
}

TEST_CASE("archive_path moves the original aside") {
    TestHostRoot host;
    std::string script = host.write("hooks/guard.sh", "#!/bin/sh\n");

    auto archived = archive_path(script, host.paths().archive_dir, "removed-hook-guard");
    REQUIRE(archived.isOk());
    CHECK_FALSE(path_exists(script));
    CHECK(is_regular_file(archived.value()));
    CHECK(get_filename(archived.value()).find("guard.sh_") == 0);
    CHECK(archived.value().find("removed-hook-guard") != std::string::npos);

    SUBCASE("a second archive of the same name does not collide") {
        host.write("hooks/guard.sh", "#!/bin/sh\necho again\n");
        auto again = archive_path(script, host.paths().archive_dir, "removed-hook-guard");
        REQUIRE(again.isOk());
        CHECK(again.value() != archived.value());
        CHECK(host.archive_count() == 2);
    }
}

TEST_CASE("archive_path of a missing file is not found") {
    TestHostRoot host;
    auto r = archive_path(host.root() + "/missing", host.paths().archive_dir, "x");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("path helpers") {
    CHECK(get_stem("/a/b/guard.test.js") == "guard.test");
    CHECK(get_filename("/a/b/c.md") == "c.md");
    CHECK(get_parent_directory("/a/b/c.md") == "/a/b");
    CHECK(join_path("/a", "b") == "/a/b");
}

TEST_CASE("generate_uuid gives distinct v4 identifiers") {
    auto a = generate_uuid();
    auto b = generate_uuid();
    CHECK(a != b);
    CHECK(a.size() == 36);
    CHECK(a[14] == '4');
}

TEST_CASE("run_command captures output and exit code") {
    auto ok = run_command({"sh", "-c", "echo hi; exit 3"}, 5000);
    REQUIRE(ok.ok);
    CHECK(ok.exit_code == 3);
    CHECK(ok.output.find("hi") != std::string::npos);

    auto missing = run_command({"steward-no-such-tool-xyz"}, 5000);
    CHECK_FALSE(missing.ok);
}

TEST_CASE("run_command kills a command that runs too long") {
    auto r = run_command({"sleep", "5"}, 200);
    CHECK_FALSE(r.ok);
    CHECK(r.timed_out);
}

TEST_CASE("find_executable searches the given PATH") {
    auto sh = find_executable("sh", "/usr/bin:/bin");
    REQUIRE(sh.has_value());
    CHECK(sh->back() == 'h');
    CHECK_FALSE(find_executable("steward-no-such-tool-xyz", "/usr/bin:/bin").has_value());
    CHECK_FALSE(find_executable("sh", "").has_value());
}

TEST_CASE("spawned process can be signalled and reaped") {
    auto sleep_bin = find_executable("sleep", get_env("PATH").value_or("/usr/bin:/bin"));
    REQUIRE(sleep_bin.has_value());

    auto spawned = spawn_detached(*sleep_bin, {"30"}, {});
    REQUIRE(spawned.ok);
    CHECK(process_alive(spawned.pid));
    CHECK_FALSE(try_reap(spawned.pid).has_value());

    REQUIRE(send_signal(spawned.pid, SIGTERM, true).isOk());
    CHECK(wait_for_exit(spawned.pid, 2000));
    CHECK_FALSE(process_alive(spawned.pid));
}
