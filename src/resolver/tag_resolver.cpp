#include "altb/tag_resolver.hpp"
#include "altb/registry.hpp"

#include <algorithm>
#include <cctype>

namespace altb {

namespace {

bool has_forbidden_char(const std::string& s, const std::string& extra) {
    return std::any_of(s.begin(), s.end(), [&extra](char c) {
        return c == '\0' || c == '/' || std::isspace(static_cast<unsigned char>(c)) ||
               extra.find(c) != std::string::npos;
    });
}

Result<void> invalid(const std::string& message) {
    return Result<void>::err(Error(ErrorCode::INVALID_NAME, message));
}

} // namespace

Result<std::string> derive_tag(const Registry& registry, const std::string& app_name,
                               const PathEntry& entry) {
    std::string tag = tag_from_fingerprint(entry.content_fingerprint);
    if (tag.empty()) {
        return Result<std::string>::err(Error(ErrorCode::MISSING_TAG,
            "cannot derive a tag for " + entry.source_path + " without a fingerprint"));
    }

    const Application* app = registry.find(app_name);
    if (!app) {
        return Result<std::string>::ok(tag);
    }

    const Entry* existing = app->find(tag);
    if (!existing) {
        return Result<std::string>::ok(tag);
    }

    const auto* existing_path = std::get_if<PathEntry>(&existing->details);
    if (existing_path && existing_path->source_path == entry.source_path) {
        return Result<std::string>::ok(tag);
    }

    std::string other = existing_path ? existing_path->source_path
                                      : std::string("a command entry");
    return Result<std::string>::err(Error(ErrorCode::AMBIGUOUS_TAG,
        "derived tag " + tag + " of " + app_name + " is already used by " + other +
        "; pass an explicit tag"));
}

Result<std::string> derive_tag(const Registry& registry, const std::string& app_name,
                               const std::string& source_path) {
    auto fingerprint = fingerprint_file(source_path);
    if (fingerprint.isErr()) {
        return Result<std::string>::err(fingerprint.error());
    }

    PathEntry entry;
    entry.source_path = source_path;
    entry.content_fingerprint = fingerprint.value();
    return derive_tag(registry, app_name, entry);
}

Result<void> validate_app_name(const std::string& name) {
    if (name.empty()) return invalid("application name is empty");
    if (name == "." || name == "..") return invalid("invalid application name: " + name);
    if (name[0] == '$') return invalid("application name must not start with '$': " + name);
    if (has_forbidden_char(name, "@")) {
        return invalid("application name must not contain '@', '/' or whitespace: " + name);
    }
    return Result<void>::ok();
}

Result<void> validate_tag(const std::string& tag) {
    if (tag.empty()) return invalid("tag is empty");
    if (tag == "." || tag == "..") return invalid("invalid tag: " + tag);
    if (has_forbidden_char(tag, "")) {
        return invalid("tag must not contain '/' or whitespace: " + tag);
    }
    return Result<void>::ok();
}

Result<void> validate_env_name(const std::string& name) {
    bool valid = !name.empty() && !std::isdigit(static_cast<unsigned char>(name[0])) &&
                 std::all_of(name.begin(), name.end(), [](unsigned char c) {
                     return std::isalnum(c) || c == '_';
                 });
    if (!valid) return invalid("invalid environment variable name: " + name);
    return Result<void>::ok();
}

Result<AppRef> parse_app_ref(const std::string& ref) {
    AppRef result;

    auto at_pos = ref.find('@');
    if (at_pos == std::string::npos) {
        result.name = ref;
    } else {
        result.name = ref.substr(0, at_pos);
        std::string tag = ref.substr(at_pos + 1);
        if (tag.empty()) {
            return Result<AppRef>::err(Error(ErrorCode::MISSING_TAG,
                "tag missing after '@' in " + ref));
        }
        result.tag = tag;
    }

    auto name_check = validate_app_name(result.name);
    if (name_check.isErr()) {
        return Result<AppRef>::err(name_check.error());
    }
    if (result.tag) {
        auto tag_check = validate_tag(*result.tag);
        if (tag_check.isErr()) {
            return Result<AppRef>::err(tag_check.error());
        }
    }

    return Result<AppRef>::ok(result);
}

} // namespace altb
