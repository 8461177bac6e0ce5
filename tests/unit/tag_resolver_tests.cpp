#include <doctest/doctest.h>
#include <altb/registry.hpp>
#include <altb/tag_resolver.hpp>

#include "test_support.hpp"

using namespace altb;
using altb::testing::TempDir;
using altb::testing::write_file;

// ============================================================================
// Fingerprints
// ============================================================================

TEST_CASE("fingerprint_file hashes whole file content with SHA-256") {
    TempDir dir;
    auto file = write_file(dir.file("abc"), "abc");

    auto fp = fingerprint_file(file);
    REQUIRE(fp.isOk());
    CHECK(fp.value() ==
          "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("fingerprint_file of an empty file") {
    TempDir dir;
    auto file = write_file(dir.file("empty"), "");

    auto fp = fingerprint_file(file);
    REQUIRE(fp.isOk());
    CHECK(fp.value() ==
          "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("fingerprint_file fails for a missing file") {
    TempDir dir;
    CHECK(fingerprint_file(dir.file("nope")).isErr());
}

TEST_CASE("tag_from_fingerprint takes the first eight hex digits") {
    CHECK(tag_from_fingerprint(
              "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") ==
          "ba7816bf");
}

// ============================================================================
// Tag Derivation
// ============================================================================

TEST_CASE("derive_tag is stable for identical content") {
    TempDir dir;
    auto a = write_file(dir.file("a/tool"), "same bytes");
    auto b = write_file(dir.file("b/tool"), "same bytes");
    Registry registry;

    auto tag_a = derive_tag(registry, "tool", a);
    auto tag_b = derive_tag(registry, "tool", b);
    REQUIRE(tag_a.isOk());
    REQUIRE(tag_b.isOk());
    CHECK(tag_a.value() == tag_b.value());
    CHECK(tag_a.value().size() == kDerivedTagLength);
}

TEST_CASE("derive_tag differs for different content") {
    TempDir dir;
    auto a = write_file(dir.file("a/tool"), "version one");
    auto b = write_file(dir.file("b/tool"), "version two");
    Registry registry;

    auto tag_a = derive_tag(registry, "tool", a);
    auto tag_b = derive_tag(registry, "tool", b);
    REQUIRE(tag_a.isOk());
    REQUIRE(tag_b.isOk());
    CHECK(tag_a.value() != tag_b.value());
}

TEST_CASE("derive_tag reuses the tag of the same source path") {
    TempDir dir;
    auto file = write_file(dir.file("tool"), "content");
    auto entry = make_path_entry(file);
    REQUIRE(entry.isOk());

    Registry registry;
    auto tag = derive_tag(registry, "tool", entry.value());
    REQUIRE(tag.isOk());

    Application& app = registry.applications["tool"];
    app.name = "tool";
    app.entries[tag.value()] = Entry{entry.value(), std::nullopt};

    auto again = derive_tag(registry, "tool", file);
    REQUIRE(again.isOk());
    CHECK(again.value() == tag.value());
}

TEST_CASE("derive_tag is ambiguous when another path already holds the tag") {
    TempDir dir;
    auto first = write_file(dir.file("a/tool"), "content");
    auto second = write_file(dir.file("b/tool"), "content");
    auto entry = make_path_entry(first);
    REQUIRE(entry.isOk());

    Registry registry;
    auto tag = derive_tag(registry, "tool", entry.value());
    REQUIRE(tag.isOk());
    Application& app = registry.applications["tool"];
    app.name = "tool";
    app.entries[tag.value()] = Entry{entry.value(), std::nullopt};

    auto clash = derive_tag(registry, "tool", second);
    REQUIRE(clash.isErr());
    CHECK(clash.error().code() == ErrorCode::AMBIGUOUS_TAG);
}

// ============================================================================
// Names and References
// ============================================================================

TEST_CASE("validate_app_name accepts ordinary names") {
    CHECK(validate_app_name("python").isOk());
    CHECK(validate_app_name("kubectl-1.21").isOk());
    CHECK(validate_app_name("g++").isOk());
}

TEST_CASE("validate_app_name rejects reserved and unsafe names") {
    CHECK(validate_app_name("").isErr());
    CHECK(validate_app_name(".").isErr());
    CHECK(validate_app_name("..").isErr());
    CHECK(validate_app_name("py@3").isErr());
    CHECK(validate_app_name("bin/python").isErr());
    CHECK(validate_app_name("my app").isErr());
    CHECK(validate_app_name("$schema").isErr());
    CHECK(validate_app_name(std::string("a\0b", 3)).isErr());
    CHECK(validate_app_name("bad/name").error().code() == ErrorCode::INVALID_NAME);
}

TEST_CASE("validate_tag rejects path separators and whitespace") {
    CHECK(validate_tag("3.8").isOk());
    CHECK(validate_tag("1.0.0-rc.1").isOk());
    CHECK(validate_tag("").isErr());
    CHECK(validate_tag("..").isErr());
    CHECK(validate_tag("a/b").isErr());
    CHECK(validate_tag("a b").isErr());
}

TEST_CASE("parse_app_ref splits name and tag") {
    auto bare = parse_app_ref("python");
    REQUIRE(bare.isOk());
    CHECK(bare.value().name == "python");
    CHECK_FALSE(bare.value().tag.has_value());

    auto tagged = parse_app_ref("python@3.9.8");
    REQUIRE(tagged.isOk());
    CHECK(tagged.value().name == "python");
    REQUIRE(tagged.value().tag.has_value());
    CHECK(*tagged.value().tag == "3.9.8");
}

TEST_CASE("parse_app_ref with an empty tag is missing a tag") {
    auto ref = parse_app_ref("python@");
    REQUIRE(ref.isErr());
    CHECK(ref.error().code() == ErrorCode::MISSING_TAG);
}

TEST_CASE("parse_app_ref rejects an empty name") {
    auto ref = parse_app_ref("@3.8");
    REQUIRE(ref.isErr());
    CHECK(ref.error().code() == ErrorCode::INVALID_NAME);
}
