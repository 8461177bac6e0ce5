#pragma once

#include "altb/entry.hpp"
#include "altb/types.hpp"

#include <optional>
#include <string>

namespace altb {

struct Registry;

// ============================================================================
// Content Fingerprints
// ============================================================================

/// Prefix of every stored fingerprint
constexpr const char* kFingerprintPrefix = "sha256:";

/// Number of hex digits of the fingerprint used as an auto-derived tag
constexpr size_t kDerivedTagLength = 8;

/// Whole-file SHA-256, returned as "sha256:<64 lowercase hex>"
Result<std::string> fingerprint_file(const std::string& path);

/// Short deterministic tag for a fingerprint (first 8 hex digits)
std::string tag_from_fingerprint(const std::string& fingerprint);

// ============================================================================
// Tag Derivation
// ============================================================================

/**
 * Derive a tag for tracking source_path under app_name without an explicit tag.
 * The tag is taken from the file's content fingerprint, so it is stable for
 * identical content. Fails with AMBIGUOUS_TAG if the derived tag is already
 * used in that application by an entry with a different source path; an
 * entry with the same source path is reused.
 */
Result<std::string> derive_tag(const Registry& registry, const std::string& app_name,
                               const std::string& source_path);

/// Same as above for an entry whose fingerprint is already computed
Result<std::string> derive_tag(const Registry& registry, const std::string& app_name,
                               const PathEntry& entry);

// ============================================================================
// Names
// ============================================================================

/// Application names: non-empty, no '@', '/', whitespace or NUL, not "." or "..",
/// not starting with '$'. Fails with INVALID_NAME.
Result<void> validate_app_name(const std::string& name);

/// Tags: non-empty, no '/', whitespace or NUL, not "." or "..". Fails with INVALID_NAME.
Result<void> validate_tag(const std::string& tag);

/// Environment variable names exported by launchers: [A-Za-z_][A-Za-z0-9_]*.
/// Fails with INVALID_NAME.
Result<void> validate_env_name(const std::string& name);

/// "name" or "name@tag"
struct AppRef {
    std::string name;
    std::optional<std::string> tag;
};

/// Split at the first '@'. "name@" fails with MISSING_TAG; invalid parts with INVALID_NAME.
Result<AppRef> parse_app_ref(const std::string& ref);

} // namespace altb
