#include <doctest/doctest.h>
#include <altb/platform.hpp>
#include <altb/switch_engine.hpp>
#include <altb/tag_resolver.hpp>

#include "test_support.hpp"

#include <unistd.h>

using namespace altb;
using altb::testing::TempDir;
using altb::testing::slurp;
using altb::testing::write_file;

namespace {

Entry path_entry(const std::string& path) {
    auto p = make_path_entry(path);
    REQUIRE(p.isOk());
    return Entry{p.value(), std::nullopt};
}

Entry command_entry(const std::string& cmd, const std::optional<std::string>& wd) {
    auto c = make_command_entry(cmd, wd);
    REQUIRE(c.isOk());
    return Entry{c.value(), std::nullopt};
}

Registry must(Result<Registry> result) {
    if (result.isErr()) FAIL(result.error().message());
    return std::move(result.value());
}

// Apply a mutation the way the facade does after a successful save
Registry must(Result<Mutation> result) {
    if (result.isErr()) FAIL(result.error().message());
    REQUIRE(promote_staged_copies(result.value()).isOk());
    return std::move(result.value().registry);
}

} // namespace

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("switching between two interpreters") {
    TempDir dir;
    Layout layout = dir.layout();
    auto py27 = write_file(dir.file("usr/bin/python2.7"), "#!/bin/sh\necho 2.7\n");
    auto py38 = write_file(dir.file("usr/bin/python3.8"), "#!/bin/sh\necho 3.8\n");
    std::string link = launch_entry_path(layout, "python");

    Registry registry;
    registry = must(track(std::move(registry), layout, "python", "2.7", path_entry(py27)));
    registry = must(track(std::move(registry), layout, "python", "3.8", path_entry(py38)));
    CHECK_FALSE(registry.find("python")->active_tag.has_value());
    CHECK_FALSE(entry_exists(link));

    registry = must(use(std::move(registry), layout, "python", std::string("3.8")));
    CHECK(registry.find("python")->active_tag == std::optional<std::string>("3.8"));
    CHECK(read_symlink(link) == std::optional<std::string>(py38));

    registry = must(use(std::move(registry), layout, "python", std::string("2.7")));
    CHECK(registry.find("python")->active_tag == std::optional<std::string>("2.7"));
    CHECK(read_symlink(link) == std::optional<std::string>(py27));
}

TEST_CASE("command entries install a launcher script") {
    TempDir dir;
    Layout layout = dir.layout();

    Registry registry;
    registry = must(track(std::move(registry), layout, "deploy", "prod",
                          command_entry("./deploy.sh --prod", std::string("/srv/app"))));
    registry = must(use(std::move(registry), layout, "deploy", std::string("prod")));

    std::string script = slurp(launch_entry_path(layout, "deploy"));
    CHECK(script.rfind("#!/bin/sh\n", 0) == 0);
    CHECK(script.find("cd '/srv/app'") != std::string::npos);
    CHECK(script.find("./deploy.sh --prod") != std::string::npos);
    CHECK(access(launch_entry_path(layout, "deploy").c_str(), X_OK) == 0);
}

TEST_CASE("copied entries survive removal of the source") {
    TempDir dir;
    Layout layout = dir.layout();
    auto helm = write_file(dir.file("downloads/helm"), "helm v3", 0644);

    Registry registry;
    registry = must(track(std::move(registry), layout, "helm", "3", path_entry(helm), true));

    const auto& entry = std::get<PathEntry>(registry.find("helm")->entries.at("3").details);
    REQUIRE(entry.managed_copy_path.has_value());
    CHECK(*entry.managed_copy_path == managed_copy_path_for(layout, "helm", "3"));
    CHECK(entry.source_path == helm);
    CHECK(slurp(*entry.managed_copy_path) == "helm v3");
    CHECK(access(entry.managed_copy_path->c_str(), X_OK) == 0);

    REQUIRE(remove_file(helm));
    registry = must(use(std::move(registry), layout, "helm", std::string("3")));
    CHECK(read_symlink(launch_entry_path(layout, "helm")) == entry.managed_copy_path);
}

// ============================================================================
// use
// ============================================================================

TEST_CASE("use with an unknown tag changes nothing") {
    TempDir dir;
    Layout layout = dir.layout();
    auto py38 = write_file(dir.file("python3.8"), "3.8");

    Registry registry;
    registry = must(track(std::move(registry), layout, "python", "3.8", path_entry(py38)));
    registry = must(use(std::move(registry), layout, "python", std::string("3.8")));
    Registry snapshot = registry;

    auto result = use(registry, layout, "python", std::string("4.0"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::UNKNOWN_TAG);
    CHECK(registry.find("python")->active_tag == snapshot.find("python")->active_tag);
    CHECK(read_symlink(launch_entry_path(layout, "python")) == std::optional<std::string>(py38));
}

TEST_CASE("use with a vanished target fails and keeps the old link") {
    TempDir dir;
    Layout layout = dir.layout();
    auto v1 = write_file(dir.file("v1/tool"), "one");
    auto v2 = write_file(dir.file("v2/tool"), "two");

    Registry registry;
    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(v1)));
    registry = must(track(std::move(registry), layout, "tool", "2", path_entry(v2)));
    registry = must(use(std::move(registry), layout, "tool", std::string("1")));

    REQUIRE(remove_file(v2));
    auto result = use(registry, layout, "tool", std::string("2"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TARGET_MISSING);
    CHECK(read_symlink(launch_entry_path(layout, "tool")) == std::optional<std::string>(v1));
}

TEST_CASE("use refuses to replace a foreign launch entry") {
    TempDir dir;
    Layout layout = dir.layout();
    auto tool = write_file(dir.file("tool"), "tool");
    auto foreign = write_file(launch_entry_path(layout, "tool"), "someone else's binary");

    Registry registry;
    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(tool)));

    auto refused = use(registry, layout, "tool", std::string("1"));
    REQUIRE(refused.isErr());
    CHECK(refused.error().code() == ErrorCode::INSTALL_FAILED);
    CHECK(slurp(foreign) == "someone else's binary");

    auto forced = must(use(registry, layout, "tool", std::string("1"), true));
    CHECK(forced.find("tool")->active_tag == std::optional<std::string>("1"));
}

TEST_CASE("use refuses a symlink the application never installed") {
    TempDir dir;
    Layout layout = dir.layout();
    auto tool = write_file(dir.file("tool"), "tool");
    auto elsewhere = write_file(dir.file("opt/tool-custom"), "custom");
    REQUIRE(create_directories(layout.bin_dir));
    REQUIRE(atomic_update_symlink(launch_entry_path(layout, "tool"), elsewhere).ok);

    Registry registry = must(track(Registry{}, layout, "tool", "1", path_entry(tool)));

    auto refused = use(registry, layout, "tool", std::string("1"));
    REQUIRE(refused.isErr());
    CHECK(refused.error().code() == ErrorCode::INSTALL_FAILED);
    CHECK(read_symlink(launch_entry_path(layout, "tool")) == std::optional<std::string>(elsewhere));

    auto unlinked = unlink(must(use(registry, layout, "tool", std::string("1"), true)),
                           layout, "tool");
    CHECK(unlinked.isOk());
}

TEST_CASE("use replaces a symlink to one of the application's own targets") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");
    auto b = write_file(dir.file("b"), "b");
    REQUIRE(create_directories(layout.bin_dir));
    REQUIRE(atomic_update_symlink(launch_entry_path(layout, "tool"), a).ok);

    Registry registry = must(track(Registry{}, layout, "tool", "1", path_entry(a)));
    registry = must(track(std::move(registry), layout, "tool", "2", path_entry(b)));
    registry = must(use(std::move(registry), layout, "tool", std::string("2")));
    CHECK(read_symlink(launch_entry_path(layout, "tool")) == std::optional<std::string>(b));
}

TEST_CASE("use without a tag reinstalls the active tag") {
    TempDir dir;
    Layout layout = dir.layout();
    auto tool = write_file(dir.file("tool"), "tool");

    Registry registry;
    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(tool)));

    auto none = use(registry, layout, "tool");
    REQUIRE(none.isErr());
    CHECK(none.error().code() == ErrorCode::NO_ACTIVE_TAG);

    registry = must(use(std::move(registry), layout, "tool", std::string("1")));
    REQUIRE(remove_file(launch_entry_path(layout, "tool")));
    registry = must(use(std::move(registry), layout, "tool"));
    CHECK(read_symlink(launch_entry_path(layout, "tool")) == std::optional<std::string>(tool));
}

TEST_CASE("use on an untracked application") {
    TempDir dir;
    auto result = use(Registry{}, dir.layout(), "ghost", std::string("1"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::UNKNOWN_APPLICATION);
}

// ============================================================================
// track
// ============================================================================

TEST_CASE("re-tracking the same path is idempotent") {
    TempDir dir;
    Layout layout = dir.layout();
    auto tool = write_file(dir.file("tool"), "tool");

    Registry once = must(track(Registry{}, layout, "tool", "1", path_entry(tool)));
    Registry twice = must(track(once, layout, "tool", "1", path_entry(tool)));
    CHECK(twice.find("tool")->entries == once.find("tool")->entries);
    CHECK(twice.find("tool")->active_tag == once.find("tool")->active_tag);
}

TEST_CASE("overwriting one tag leaves the others alone") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");
    auto b = write_file(dir.file("b"), "b");
    auto c = write_file(dir.file("c"), "c");

    Registry registry;
    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(a)));
    registry = must(track(std::move(registry), layout, "tool", "2", path_entry(b)));
    Entry second = registry.find("tool")->entries.at("2");

    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(c)));
    CHECK(std::get<PathEntry>(registry.find("tool")->entries.at("1").details).source_path == c);
    CHECK(registry.find("tool")->entries.at("2") == second);
}

TEST_CASE("re-tracking the active tag updates the launch entry") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");
    auto b = write_file(dir.file("b"), "b");

    Registry registry;
    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(a)));
    registry = must(use(std::move(registry), layout, "tool", std::string("1")));
    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(b)));
    CHECK(read_symlink(launch_entry_path(layout, "tool")) == std::optional<std::string>(b));
}

TEST_CASE("re-tracking without a description keeps the previous one") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");

    Entry described = path_entry(a);
    described.description = "stable build";
    Registry registry = must(track(Registry{}, layout, "tool", "1", described));
    registry = must(track(std::move(registry), layout, "tool", "1", path_entry(a)));
    CHECK(registry.find("tool")->entries.at("1").description ==
          std::optional<std::string>("stable build"));
}

TEST_CASE("track rejects invalid names") {
    TempDir dir;
    auto a = write_file(dir.file("a"), "a");

    auto bad_app = track(Registry{}, dir.layout(), "py@thon", "1", path_entry(a));
    REQUIRE(bad_app.isErr());
    CHECK(bad_app.error().code() == ErrorCode::INVALID_NAME);

    auto bad_tag = track(Registry{}, dir.layout(), "python", "a/b", path_entry(a));
    REQUIRE(bad_tag.isErr());
    CHECK(bad_tag.error().code() == ErrorCode::INVALID_NAME);
}

TEST_CASE("track --copy stages the copy until it is promoted") {
    TempDir dir;
    Layout layout = dir.layout();
    auto helm = write_file(dir.file("helm"), "helm v3", 0644);
    std::string final_path = managed_copy_path_for(layout, "helm", "3");

    auto mutation = track(Registry{}, layout, "helm", "3", path_entry(helm), true);
    REQUIRE(mutation.isOk());
    REQUIRE(mutation.value().staged_copies.size() == 1);
    const StagedCopy& staged = mutation.value().staged_copies[0];
    CHECK(staged.final_path == final_path);
    CHECK(is_path_under(staged.staging_path, managed_app_directory(layout, "helm")));
    CHECK(slurp(staged.staging_path) == "helm v3");
    CHECK_FALSE(entry_exists(final_path));

    discard_staged_copies(mutation.value());
    CHECK_FALSE(entry_exists(staged.staging_path));
    CHECK_FALSE(entry_exists(final_path));
}

TEST_CASE("re-tracking an active copied tag keeps the old bytes until promotion") {
    TempDir dir;
    Layout layout = dir.layout();
    auto helm = write_file(dir.file("helm"), "helm v3.0", 0644);
    std::string final_path = managed_copy_path_for(layout, "helm", "3");

    Registry registry = must(track(Registry{}, layout, "helm", "3", path_entry(helm), true));
    registry = must(use(std::move(registry), layout, "helm", std::string("3")));

    write_file(helm, "helm v3.1", 0644);
    auto mutation = track(registry, layout, "helm", "3", path_entry(helm), true);
    REQUIRE(mutation.isOk());
    CHECK(slurp(final_path) == "helm v3.0");
    CHECK(read_symlink(launch_entry_path(layout, "helm")) == std::optional<std::string>(final_path));

    REQUIRE(promote_staged_copies(mutation.value()).isOk());
    CHECK(slurp(final_path) == "helm v3.1");
}

// ============================================================================
// unlink / untrack / rename / describe
// ============================================================================

TEST_CASE("unlink removes the launch entry and clears the active tag") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");

    Registry registry = must(track(Registry{}, layout, "tool", "1", path_entry(a)));
    registry = must(use(std::move(registry), layout, "tool", std::string("1")));
    registry = must(unlink(std::move(registry), layout, "tool"));

    CHECK_FALSE(registry.find("tool")->active_tag.has_value());
    CHECK_FALSE(entry_exists(launch_entry_path(layout, "tool")));
    CHECK(registry.find("tool")->entries.size() == 1);

    // Nothing active: no-op
    registry = must(unlink(std::move(registry), layout, "tool"));
}

TEST_CASE("untrack of the active tag removes the launch entry") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");
    auto b = write_file(dir.file("b"), "b");

    Registry registry = must(track(Registry{}, layout, "tool", "1", path_entry(a)));
    registry = must(track(std::move(registry), layout, "tool", "2", path_entry(b)));
    registry = must(use(std::move(registry), layout, "tool", std::string("1")));

    auto mutation = untrack(std::move(registry), layout, "tool", "1");
    REQUIRE(mutation.isOk());
    const Application* app = mutation.value().registry.find("tool");
    REQUIRE(app != nullptr);
    CHECK_FALSE(app->active_tag.has_value());
    CHECK(app->entries.count("1") == 0);
    CHECK_FALSE(entry_exists(launch_entry_path(layout, "tool")));
    CHECK(mutation.value().stale_files.empty());
}

TEST_CASE("untrack of the last tag removes the application and reports its copy") {
    TempDir dir;
    Layout layout = dir.layout();
    auto helm = write_file(dir.file("helm"), "helm");

    Registry registry = must(track(Registry{}, layout, "helm", "3", path_entry(helm), true));
    auto mutation = untrack(std::move(registry), layout, "helm", "3");
    REQUIRE(mutation.isOk());
    CHECK(mutation.value().registry.find("helm") == nullptr);
    REQUIRE(mutation.value().stale_files.size() == 1);
    CHECK(mutation.value().stale_files[0] == managed_copy_path_for(layout, "helm", "3"));
}

TEST_CASE("untrack of an unknown tag") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");
    Registry registry = must(track(Registry{}, layout, "tool", "1", path_entry(a)));

    auto result = untrack(registry, layout, "tool", "9");
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::UNKNOWN_TAG);
}

TEST_CASE("rename moves the entry, its copy and the active tag") {
    TempDir dir;
    Layout layout = dir.layout();
    auto helm = write_file(dir.file("helm"), "helm");

    Registry registry = must(track(Registry{}, layout, "helm", "3", path_entry(helm), true));
    registry = must(use(std::move(registry), layout, "helm", std::string("3")));

    auto mutation = rename_tag(std::move(registry), layout, "helm", "3", "3.12");
    REQUIRE(mutation.isOk());
    REQUIRE(promote_staged_copies(mutation.value()).isOk());
    const Application* app = mutation.value().registry.find("helm");
    REQUIRE(app != nullptr);
    CHECK(app->entries.count("3") == 0);
    CHECK(app->active_tag == std::optional<std::string>("3.12"));

    std::string new_copy = managed_copy_path_for(layout, "helm", "3.12");
    CHECK(std::get<PathEntry>(app->entries.at("3.12").details).managed_copy_path ==
          std::optional<std::string>(new_copy));
    CHECK(slurp(new_copy) == "helm");
    CHECK(read_symlink(launch_entry_path(layout, "helm")) == std::optional<std::string>(new_copy));
    REQUIRE(mutation.value().stale_files.size() == 1);
    CHECK(mutation.value().stale_files[0] == managed_copy_path_for(layout, "helm", "3"));
}

TEST_CASE("rename onto an existing tag fails") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");
    auto b = write_file(dir.file("b"), "b");
    Registry registry = must(track(Registry{}, layout, "tool", "1", path_entry(a)));
    registry = must(track(std::move(registry), layout, "tool", "2", path_entry(b)));

    auto result = rename_tag(registry, layout, "tool", "1", "2");
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_NAME);
}

TEST_CASE("describe sets and clears descriptions") {
    TempDir dir;
    Layout layout = dir.layout();
    auto a = write_file(dir.file("a"), "a");
    Registry registry = must(track(Registry{}, layout, "tool", "1", path_entry(a)));

    registry = must(describe(std::move(registry), "tool", "1", std::string("nightly")));
    CHECK(registry.find("tool")->entries.at("1").description == std::optional<std::string>("nightly"));

    registry = must(describe(std::move(registry), "tool", "1", std::nullopt));
    CHECK_FALSE(registry.find("tool")->entries.at("1").description.has_value());

    auto missing = describe(registry, "tool", "2", std::string("x"));
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::UNKNOWN_TAG);
}
