#pragma once

#include "altb/entry.hpp"
#include "altb/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace altb {

// ============================================================================
// Registry Model
// ============================================================================

/// Schema identifier written to "$schema"
constexpr const char* kRegistrySchema = "altb.registry.v1";

struct Application {
    std::string name;
    std::map<std::string, Entry> entries;   // tag -> entry
    std::optional<std::string> active_tag;  // always a key of entries when set

    const Entry* find(const std::string& tag) const {
        auto it = entries.find(tag);
        return it == entries.end() ? nullptr : &it->second;
    }
};

/// Full application name -> Application mapping. A plain value: engine
/// operations take it by value and hand back the mutated copy.
struct Registry {
    std::map<std::string, Application> applications;

    const Application* find(const std::string& name) const {
        auto it = applications.find(name);
        return it == applications.end() ? nullptr : &it->second;
    }
    Application* find(const std::string& name) {
        auto it = applications.find(name);
        return it == applications.end() ? nullptr : &it->second;
    }
};

// ============================================================================
// Serialization
// ============================================================================

struct RegistryParseResult {
    bool ok = false;
    std::string error;
    Registry registry;
    bool legacy_import = false;     // read from the older YAML config
    std::vector<std::string> warnings;
};

/**
 * Parse a registry document: application name -> application, plus "$"
 * metadata keys. Unknown fields are ignored. versions_dir is passed on to
 * validate_registry.
 */
RegistryParseResult parse_registry(const std::string& json_str,
                                   const std::string& versions_dir = "");

/**
 * Import the YAML config file of older releases:
 * {"binaries": {app: {"tags": {tag: {"kind", "spec", "description"}}, "selected"}},
 *  "version": "..."}. An empty file is an empty registry.
 * versions_dir (when non-empty) marks imported links under <versions_dir>/<app>
 * as managed copies; without it the spec.is_copy flag of versions before 0.1.0
 * decides.
 */
RegistryParseResult parse_legacy_config(const std::string& yaml_str,
                                        const std::string& versions_dir = "");

/// Serialize a registry to a pretty-printed JSON document
std::string serialize_registry(const Registry& registry);

/**
 * Check structural invariants: names valid and consistent, active tag
 * tracked, environment variable names valid, and (when versions_dir is
 * non-empty) managed copies under <versions_dir>/<app>.
 * Fails with CORRUPT_REGISTRY.
 */
Result<void> validate_registry(const Registry& registry, const std::string& versions_dir = "");

} // namespace altb
