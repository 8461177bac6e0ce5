#include <doctest/doctest.h>
#include <altb/runner.hpp>

#include "test_support.hpp"

#include <algorithm>

using namespace altb;
using altb::testing::TempDir;
using altb::testing::slurp;

namespace {

Registry with_command(const std::string& app, const CommandEntry& command, bool active = true) {
    Registry registry;
    Application a;
    a.name = app;
    a.entries["1"] = Entry{command, std::nullopt};
    if (active) a.active_tag = "1";
    registry.applications[app] = a;
    return registry;
}

} // namespace

TEST_CASE("build_command_argv forwards arguments through sh") {
    CommandEntry c;
    c.command_line = "./deploy.sh --prod";

    auto argv = build_command_argv("deploy", c, {"--dry-run", "two words"});
    REQUIRE(argv.size() == 6);
    CHECK(argv[0] == "/bin/sh");
    CHECK(argv[1] == "-c");
    CHECK(argv[2] == "./deploy.sh --prod \"$@\"");
    CHECK(argv[3] == "deploy");
    CHECK(argv[4] == "--dry-run");
    CHECK(argv[5] == "two words");
}

TEST_CASE("build_command_environment layers entry variables over the inherited ones") {
    setenv("ALTB_RUNNER_TEST", "inherited", 1);
    CommandEntry c;
    c.command_line = "true";
    c.environment["ALTB_RUNNER_TEST"] = "override";

    auto env = build_command_environment(c);
    CHECK(std::count(env.begin(), env.end(), "ALTB_RUNNER_TEST=override") == 1);
    CHECK(std::count(env.begin(), env.end(), "ALTB_RUNNER_TEST=inherited") == 0);
    unsetenv("ALTB_RUNNER_TEST");
}

TEST_CASE("run returns the exit status of the command") {
    TempDir dir;
    CommandEntry c;
    c.command_line = "exit 3";
    c.working_directory = dir.path();

    auto status = run(with_command("fail", c), "fail", {});
    REQUIRE(status.isOk());
    CHECK(status.value() == 3);
}

TEST_CASE("run uses the working directory, environment and arguments") {
    TempDir dir;
    CommandEntry c;
    // Relative redirect lands in the working directory
    c.command_line = "printf '%s|%s' \"$GREETING\" \"$1\" > out.txt; true";
    c.working_directory = dir.path();
    c.environment["GREETING"] = "hello";

    auto status = run(with_command("greet", c), "greet", {"world"});
    REQUIRE(status.isOk());
    CHECK(status.value() == 0);
    CHECK(slurp(dir.file("out.txt")) == "hello|world");
}

TEST_CASE("run rejects path entries") {
    Registry registry;
    Application a;
    a.name = "python";
    PathEntry p;
    p.source_path = "/usr/bin/python3";
    a.entries["3"] = Entry{p, std::nullopt};
    a.active_tag = "3";
    registry.applications["python"] = a;

    auto status = run(registry, "python", {});
    REQUIRE(status.isErr());
    CHECK(status.error().code() == ErrorCode::NOT_RUNNABLE);
}

TEST_CASE("run reports missing applications, tags and directories") {
    CommandEntry c;
    c.command_line = "true";

    auto unknown = run(Registry{}, "ghost", {});
    REQUIRE(unknown.isErr());
    CHECK(unknown.error().code() == ErrorCode::UNKNOWN_APPLICATION);

    auto inactive = run(with_command("idle", c, false), "idle", {});
    REQUIRE(inactive.isErr());
    CHECK(inactive.error().code() == ErrorCode::NO_ACTIVE_TAG);

    c.working_directory = "/nonexistent/altb/dir";
    auto gone = run(with_command("gone", c), "gone", {});
    REQUIRE(gone.isErr());
    CHECK(gone.error().code() == ErrorCode::TARGET_MISSING);
}
