#include "altb/registry.hpp"
#include "altb/platform.hpp"
#include "altb/tag_resolver.hpp"

// cpp-semver requires <cstdint> but may not include it on all compilers
#include <cstdint>
#include <nlohmann/json.hpp>
#include <semver/semver.hpp>
#include <yaml-cpp/yaml.h>

#include <optional>

namespace altb {

namespace {

using json = nlohmann::json;

// Thrown inside the parser only; converted to RegistryParseResult::error
struct ShapeError {
    std::string message;
};

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string require_string(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key)) {
        throw ShapeError{where + "." + key + " missing"};
    }
    if (!j[key].is_string()) {
        throw ShapeError{where + "." + key + " must be a string"};
    }
    return j[key].get<std::string>();
}

// Optional string that may also be written as null
std::optional<std::string> optional_string(const json& j, const std::string& key,
                                           const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) {
        throw ShapeError{where + "." + key + " must be a string"};
    }
    return j[key].get<std::string>();
}

EnvMap parse_env(const json& j, const std::string& key, const std::string& where) {
    EnvMap env;
    if (!j.contains(key) || j[key].is_null()) return env;
    if (!j[key].is_object()) {
        throw ShapeError{where + "." + key + " must be an object"};
    }
    for (auto it = j[key].begin(); it != j[key].end(); ++it) {
        if (!it.value().is_string()) {
            throw ShapeError{where + "." + key + "." + it.key() + " must be a string"};
        }
        env[it.key()] = it.value().get<std::string>();
    }
    return env;
}

Entry parse_entry(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw ShapeError{where + " must be an object"};
    }

    Entry entry;
    entry.description = optional_string(j, "description", where);

    std::string kind = require_string(j, "kind", where);
    if (kind == "path") {
        PathEntry p;
        p.source_path = require_string(j, "source_path", where);
        p.managed_copy_path = optional_string(j, "managed_copy_path", where);
        p.content_fingerprint = get_string(j, "content_fingerprint").value_or("");
        entry.details = p;
    } else if (kind == "command") {
        CommandEntry c;
        c.command_line = require_string(j, "command_line", where);
        c.working_directory = optional_string(j, "working_directory", where);
        c.environment = parse_env(j, "environment", where);
        entry.details = c;
    } else {
        throw ShapeError{where + ".kind has unknown value '" + kind + "'"};
    }
    return entry;
}

Application parse_application(const std::string& name, const json& j) {
    if (!j.is_object()) {
        throw ShapeError{"application " + name + " must be an object"};
    }

    Application app;
    app.name = name;

    if (j.contains("entries")) {
        const auto& entries = j["entries"];
        if (!entries.is_object()) {
            throw ShapeError{name + ".entries must be an object"};
        }
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            app.entries[it.key()] = parse_entry(it.value(), name + ".entries." + it.key());
        }
    }

    app.active_tag = optional_string(j, "active_tag", name);
    return app;
}

// Older layout: {"binaries": {app: {"name", "tags": {tag: {"kind", "spec", "description"}},
// "selected"}}, "version": "..."}. Documents before version 0.1.0 mark copied
// links with spec.is_copy; later ones dropped the flag.
constexpr const char* kLegacyNewestVersion = "0.1.0";

struct LegacyImport {
    std::string versions_dir;
    bool honor_is_copy = true;
    std::vector<std::string>* warnings = nullptr;
};

std::optional<semver::version> parse_legacy_version(const std::string& str) {
    try {
        return semver::version::parse(str);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

// Every binaries.<app> is an object carrying "tags"
bool is_legacy_document(const json& j) {
    if (!j.contains("binaries") || !j["binaries"].is_object()) return false;
    for (const auto& app : j["binaries"]) {
        if (!app.is_object() || !app.contains("tags")) return false;
    }
    return true;
}

PathEntry import_legacy_link(const std::string& name, const json& spec, const std::string& where,
                             const LegacyImport& import) {
    PathEntry p;
    p.source_path = require_string(spec, "path", where + ".spec");

    bool is_copy = import.honor_is_copy && spec.contains("is_copy") &&
                   spec["is_copy"].is_boolean() && spec["is_copy"].get<bool>();
    if (import.versions_dir.empty()) {
        if (is_copy) p.managed_copy_path = p.source_path;
        return p;
    }

    std::string app_versions = join_path(import.versions_dir, name);
    if (is_path_under(p.source_path, app_versions)) {
        p.managed_copy_path = p.source_path;
    } else if (is_copy) {
        import.warnings->push_back(where + " is marked as a copy outside " + app_versions +
                                   "; importing it as a plain link");
    }
    return p;
}

Application import_legacy_application(const std::string& name, const json& j,
                                      const LegacyImport& import) {
    Application app;
    app.name = name;

    const auto& tags = j["tags"];
    if (!tags.is_object()) {
        throw ShapeError{"binaries." + name + ".tags must be an object"};
    }
    for (auto it = tags.begin(); it != tags.end(); ++it) {
        std::string where = "binaries." + name + ".tags." + it.key();
        const auto& tag = it.value();
        if (!tag.is_object()) {
            throw ShapeError{where + " must be an object"};
        }
        if (!tag.contains("spec") || !tag["spec"].is_object()) {
            throw ShapeError{where + ".spec missing"};
        }
        const auto& spec = tag["spec"];

        Entry entry;
        entry.description = optional_string(tag, "description", where);

        std::string kind = require_string(tag, "kind", where);
        if (kind == "link") {
            entry.details = import_legacy_link(name, spec, where, import);
        } else if (kind == "command") {
            CommandEntry c;
            c.command_line = require_string(spec, "command", where + ".spec");
            c.working_directory = optional_string(spec, "working_directory", where + ".spec");
            c.environment = parse_env(spec, "env", where + ".spec");
            entry.details = c;
        } else {
            throw ShapeError{where + ".kind has unknown value '" + kind + "'"};
        }
        app.entries[it.key()] = entry;
    }

    app.active_tag = optional_string(j, "selected", "binaries." + name);
    return app;
}

void import_legacy_document(const json& j, const std::string& versions_dir,
                            RegistryParseResult& result) {
    // A document without "version" predates versioning
    std::string version_str = get_string(j, "version").value_or("0.0.0");

    auto version = parse_legacy_version(version_str);
    if (!version) {
        throw ShapeError{"unrecognized registry version '" + version_str + "'"};
    }

    auto newest = semver::version::parse(kLegacyNewestVersion);
    if (newest < *version) {
        result.warnings.push_back("registry version " + version_str + " is newer than " +
                                  kLegacyNewestVersion + "; importing it as " +
                                  kLegacyNewestVersion);
    }

    LegacyImport import;
    import.versions_dir = versions_dir;
    import.honor_is_copy = *version < newest;
    import.warnings = &result.warnings;

    for (auto it = j["binaries"].begin(); it != j["binaries"].end(); ++it) {
        result.registry.applications[it.key()] =
            import_legacy_application(it.key(), it.value(), import);
    }
    result.legacy_import = true;
    result.warnings.push_back("imported registry from the older 'binaries' layout (version " +
                              version_str + ")");
}

void drop_empty_applications(RegistryParseResult& result) {
    auto& applications = result.registry.applications;
    for (auto it = applications.begin(); it != applications.end();) {
        if (it->second.entries.empty() && !it->second.active_tag) {
            result.warnings.push_back("ignoring application without entries: " + it->first);
            it = applications.erase(it);
        } else {
            ++it;
        }
    }
}

// Plain (unquoted) true/false become booleans; every other scalar stays a string
json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar: {
            const std::string& value = node.Scalar();
            if (node.Tag() == "?") {
                if (value == "true" || value == "True" || value == "TRUE") return true;
                if (value == "false" || value == "False" || value == "FALSE") return false;
            }
            return value;
        }
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            json object = json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

json entry_to_json(const Entry& entry) {
    json j = std::visit(overloaded{
        [](const PathEntry& p) {
            json o;
            o["kind"] = "path";
            o["source_path"] = p.source_path;
            if (p.managed_copy_path) o["managed_copy_path"] = *p.managed_copy_path;
            if (!p.content_fingerprint.empty()) o["content_fingerprint"] = p.content_fingerprint;
            return o;
        },
        [](const CommandEntry& c) {
            json o;
            o["kind"] = "command";
            o["command_line"] = c.command_line;
            if (c.working_directory) o["working_directory"] = *c.working_directory;
            if (!c.environment.empty()) o["environment"] = c.environment;
            return o;
        },
    }, entry.details);

    if (entry.description) j["description"] = *entry.description;
    return j;
}

} // namespace

RegistryParseResult parse_registry(const std::string& json_str, const std::string& versions_dir) {
    RegistryParseResult result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "registry document must be a JSON object";
            return result;
        }

        if (j.contains("$schema")) {
            auto schema = get_string(j, "$schema");
            if (!schema || *schema != kRegistrySchema) {
                result.error = std::string("$schema mismatch: expected ") + kRegistrySchema;
                return result;
            }
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.key().empty() && it.key()[0] == '$') continue;  // metadata
            result.registry.applications[it.key()] = parse_application(it.key(), it.value());
        }

        drop_empty_applications(result);

        auto valid = validate_registry(result.registry, versions_dir);
        if (valid.isErr()) {
            result.error = valid.error().message();
            return result;
        }

        result.ok = true;
    } catch (const ShapeError& e) {
        result.error = e.message;
    } catch (const json::exception& e) {
        result.error = std::string("invalid JSON: ") + e.what();
    }

    return result;
}

RegistryParseResult parse_legacy_config(const std::string& yaml_str,
                                        const std::string& versions_dir) {
    RegistryParseResult result;

    try {
        json j = yaml_to_json(YAML::Load(yaml_str));
        if (j.is_null()) {
            result.legacy_import = true;
            result.ok = true;
            return result;
        }
        if (!j.is_object()) {
            result.error = "config document must be a mapping";
            return result;
        }
        if (!j.contains("binaries")) {
            j["binaries"] = json::object();
        }
        if (!is_legacy_document(j)) {
            result.error = "config document does not use the 'binaries' layout";
            return result;
        }

        import_legacy_document(j, versions_dir, result);
        drop_empty_applications(result);

        auto valid = validate_registry(result.registry, versions_dir);
        if (valid.isErr()) {
            result.error = valid.error().message();
            return result;
        }
        result.ok = true;
    } catch (const ShapeError& e) {
        result.error = e.message;
    } catch (const YAML::Exception& e) {
        result.error = std::string("invalid YAML: ") + e.what();
    } catch (const json::exception& e) {
        result.error = std::string("invalid config: ") + e.what();
    }

    return result;
}

std::string serialize_registry(const Registry& registry) {
    json j = json::object();
    j["$schema"] = kRegistrySchema;

    for (const auto& [name, app] : registry.applications) {
        json a = json::object();
        json entries = json::object();
        for (const auto& [tag, entry] : app.entries) {
            entries[tag] = entry_to_json(entry);
        }
        a["entries"] = entries;
        if (app.active_tag) a["active_tag"] = *app.active_tag;
        j[name] = a;
    }

    return j.dump(2) + "\n";
}

Result<void> validate_registry(const Registry& registry, const std::string& versions_dir) {
    auto corrupt = [](const std::string& message) {
        return Result<void>::err(Error(ErrorCode::CORRUPT_REGISTRY, message));
    };

    for (const auto& [name, app] : registry.applications) {
        auto name_check = validate_app_name(name);
        if (name_check.isErr()) return corrupt(name_check.error().message());
        if (app.name != name) {
            return corrupt("application key " + name + " holds application " + app.name);
        }
        if (app.entries.empty()) {
            return corrupt("application " + name + " has no entries");
        }
        for (const auto& [tag, entry] : app.entries) {
            auto tag_check = validate_tag(tag);
            if (tag_check.isErr()) return corrupt(name + ": " + tag_check.error().message());

            if (const auto* command = std::get_if<CommandEntry>(&entry.details)) {
                for (const auto& [key, value] : command->environment) {
                    auto env_check = validate_env_name(key);
                    if (env_check.isErr()) {
                        return corrupt(name + "@" + tag + ": " + env_check.error().message());
                    }
                }
            }

            const auto* path = std::get_if<PathEntry>(&entry.details);
            if (path && path->managed_copy_path && !versions_dir.empty() &&
                !is_path_under(*path->managed_copy_path, join_path(versions_dir, name))) {
                return corrupt(name + "@" + tag + ": managed copy " + *path->managed_copy_path +
                               " is outside " + join_path(versions_dir, name));
            }
        }
        if (app.active_tag && app.entries.count(*app.active_tag) == 0) {
            return corrupt("application " + name + " has active tag " + *app.active_tag +
                           " which is not tracked");
        }
    }
    return Result<void>::ok();
}

} // namespace altb
