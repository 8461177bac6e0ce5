#include "altb/switch_engine.hpp"
#include "altb/launcher.hpp"
#include "altb/platform.hpp"
#include "altb/tag_resolver.hpp"

#include <spdlog/spdlog.h>

#include <sys/stat.h>

namespace altb {

namespace {

template<typename T>
Result<T> fail(ErrorCode code, const std::string& message) {
    return Result<T>::err(Error(code, message));
}

template<typename T>
Result<T> fail(const Error& error) {
    return Result<T>::err(error);
}

Result<void> check_names(const std::string& app_name, const std::string& tag) {
    auto name_check = validate_app_name(app_name);
    if (name_check.isErr()) return name_check;
    return validate_tag(tag);
}

// Resolve entries[tag] and atomically install its launch entry
Result<void> install_tag(const Application& app, const Layout& layout, const std::string& tag,
                         const LaunchOwnership& ownership, bool force) {
    const Entry* entry = app.find(tag);
    if (!entry) {
        return Result<void>::err(Error(ErrorCode::UNKNOWN_TAG,
            "tag " + tag + " doesn't exist in application " + app.name));
    }

    auto target = resolve_target(*entry);
    if (target.isErr()) {
        return Result<void>::err(target.error().withContext(app.name + "@" + tag));
    }

    auto artifact = make_launch_artifact(app.name, tag, target.value());
    return install_launch_entry(layout, app.name, artifact, ownership, force);
}

std::string staging_path_for(const Layout& layout, const std::string& app_name,
                             const std::string& tag) {
    return join_path(managed_app_directory(layout, app_name),
                     "." + app_name + "_" + tag + ".staged");
}

// Copy source into managed storage under a staging name
Result<StagedCopy> stage_copy(const std::string& source, const Layout& layout,
                              const std::string& app_name, const std::string& tag,
                              unsigned extra_mode) {
    std::string directory = managed_app_directory(layout, app_name);
    if (!create_directories(directory)) {
        return Result<StagedCopy>::err(Error(ErrorCode::IO_ERROR,
                                             "cannot create managed storage " + directory));
    }

    StagedCopy staged{staging_path_for(layout, app_name, tag),
                      managed_copy_path_for(layout, app_name, tag)};
    auto copied = atomic_copy_file(source, staged.staging_path, extra_mode);
    if (!copied.ok) {
        return Result<StagedCopy>::err(Error(ErrorCode::IO_ERROR, copied.error));
    }

    spdlog::debug("staged {} as {}", source, staged.staging_path);
    return Result<StagedCopy>::ok(staged);
}

void discard(const StagedCopy& staged) {
    if (entry_exists(staged.staging_path) && !remove_file(staged.staging_path)) {
        spdlog::warn("could not remove staged copy {}", staged.staging_path);
    }
}

// Managed copy owned by an entry, if it lives in the application's storage
std::optional<std::string> owned_copy(const Entry& entry, const Layout& layout,
                                      const std::string& app_name) {
    const auto* path = std::get_if<PathEntry>(&entry.details);
    if (!path || !path->managed_copy_path) return std::nullopt;
    if (!is_path_under(*path->managed_copy_path, managed_app_directory(layout, app_name))) {
        return std::nullopt;
    }
    return path->managed_copy_path;
}

} // namespace

Result<Mutation> track(Registry registry, const Layout& layout, const std::string& app_name,
                       const std::string& tag, Entry entry, bool copy) {
    auto names = check_names(app_name, tag);
    if (names.isErr()) return fail<Mutation>(names.error());

    auto ownership = launch_ownership(layout, app_name, registry.find(app_name));

    Mutation mutation;
    if (copy) {
        if (auto* path = std::get_if<PathEntry>(&entry.details)) {
            auto staged = stage_copy(path->source_path, layout, app_name, tag, S_IXUSR);
            if (staged.isErr()) return fail<Mutation>(staged.error());
            path->managed_copy_path = staged.value().final_path;
            mutation.staged_copies.push_back(staged.value());
        }
    }

    Application& app = registry.applications[app_name];
    app.name = app_name;

    if (const Entry* previous = app.find(tag)) {
        if (!entry.description && previous->description) {
            entry.description = previous->description;
        }
    }
    app.entries[tag] = std::move(entry);

    if (app.active_tag && *app.active_tag == tag) {
        // A staged copy only reaches its final name after promotion
        auto installed = mutation.staged_copies.empty()
            ? install_tag(app, layout, tag, ownership, false)
            : install_launch_entry(layout, app_name,
                                   LaunchArtifact{LaunchArtifact::Kind::Symlink,
                                                  mutation.staged_copies.front().final_path},
                                   ownership);
        if (installed.isErr()) {
            discard_staged_copies(mutation);
            return fail<Mutation>(installed.error());
        }
    }

    spdlog::debug("tracked {}@{}", app_name, tag);
    mutation.registry = std::move(registry);
    return Result<Mutation>::ok(std::move(mutation));
}

Result<Registry> use(Registry registry, const Layout& layout, const std::string& app_name,
                     const std::optional<std::string>& tag, bool force) {
    Application* app = registry.find(app_name);
    if (!app) {
        return fail<Registry>(ErrorCode::UNKNOWN_APPLICATION, "app " + app_name + " isn't tracked");
    }

    std::string selected;
    if (tag) {
        if (!app->find(*tag)) {
            return fail<Registry>(ErrorCode::UNKNOWN_TAG,
                "tag " + *tag + " doesn't exist in application " + app_name);
        }
        selected = *tag;
    } else if (app->active_tag) {
        selected = *app->active_tag;
    } else {
        return fail<Registry>(ErrorCode::NO_ACTIVE_TAG,
            "app " + app_name + " doesn't have an active tag; specify one");
    }

    auto ownership = launch_ownership(layout, app_name, app);
    auto installed = install_tag(*app, layout, selected, ownership, force);
    if (installed.isErr()) return fail<Registry>(installed.error());

    app->active_tag = selected;
    spdlog::debug("using {}@{}", app_name, selected);
    return Result<Registry>::ok(std::move(registry));
}

Result<Registry> unlink(Registry registry, const Layout& layout, const std::string& app_name,
                        bool force) {
    Application* app = registry.find(app_name);
    if (!app) {
        return fail<Registry>(ErrorCode::UNKNOWN_APPLICATION, "app " + app_name + " isn't tracked");
    }
    if (!app->active_tag) {
        return Result<Registry>::ok(std::move(registry));
    }

    auto removed = remove_launch_entry(layout, app_name,
                                       launch_ownership(layout, app_name, app), force);
    if (removed.isErr()) return fail<Registry>(removed.error());

    app->active_tag.reset();
    return Result<Registry>::ok(std::move(registry));
}

Result<Mutation> untrack(Registry registry, const Layout& layout, const std::string& app_name,
                         const std::string& tag) {
    Application* app = registry.find(app_name);
    if (!app) {
        return fail<Mutation>(ErrorCode::UNKNOWN_APPLICATION, "app " + app_name + " isn't tracked");
    }
    const Entry* entry = app->find(tag);
    if (!entry) {
        return fail<Mutation>(ErrorCode::UNKNOWN_TAG,
            "tag " + tag + " doesn't exist in application " + app_name);
    }

    if (app->active_tag && *app->active_tag == tag) {
        auto removed = remove_launch_entry(layout, app_name,
                                           launch_ownership(layout, app_name, app));
        if (removed.isErr()) return fail<Mutation>(removed.error());
        app->active_tag.reset();
    }

    Mutation mutation;
    if (auto copy = owned_copy(*entry, layout, app_name)) {
        mutation.stale_files.push_back(*copy);
    }

    app->entries.erase(tag);
    if (app->entries.empty()) {
        registry.applications.erase(app_name);
    }

    spdlog::debug("untracked {}@{}", app_name, tag);
    mutation.registry = std::move(registry);
    return Result<Mutation>::ok(std::move(mutation));
}

Result<Mutation> rename_tag(Registry registry, const Layout& layout, const std::string& app_name,
                            const std::string& tag, const std::string& new_tag) {
    Application* app = registry.find(app_name);
    if (!app) {
        return fail<Mutation>(ErrorCode::UNKNOWN_APPLICATION, "app " + app_name + " isn't tracked");
    }
    if (!app->find(tag)) {
        return fail<Mutation>(ErrorCode::UNKNOWN_TAG,
            "tag " + tag + " doesn't exist in application " + app_name);
    }
    auto tag_check = validate_tag(new_tag);
    if (tag_check.isErr()) return fail<Mutation>(tag_check.error());

    Mutation mutation;
    if (new_tag == tag) {
        mutation.registry = std::move(registry);
        return Result<Mutation>::ok(std::move(mutation));
    }
    if (app->find(new_tag)) {
        return fail<Mutation>(ErrorCode::INVALID_NAME,
            "tag " + new_tag + " already exists in application " + app_name);
    }

    auto ownership = launch_ownership(layout, app_name, app);
    Entry entry = app->entries[tag];

    if (auto old_copy = owned_copy(entry, layout, app_name)) {
        auto staged = stage_copy(*old_copy, layout, app_name, new_tag, 0);
        if (staged.isErr()) return fail<Mutation>(staged.error());
        std::get<PathEntry>(entry.details).managed_copy_path = staged.value().final_path;
        mutation.staged_copies.push_back(staged.value());
        mutation.stale_files.push_back(*old_copy);
    }

    app->entries.erase(tag);
    app->entries[new_tag] = std::move(entry);

    if (app->active_tag && *app->active_tag == tag) {
        app->active_tag = new_tag;
        auto installed = mutation.staged_copies.empty()
            ? install_tag(*app, layout, new_tag, ownership, false)
            : install_launch_entry(layout, app_name,
                                   LaunchArtifact{LaunchArtifact::Kind::Symlink,
                                                  mutation.staged_copies.front().final_path},
                                   ownership);
        if (installed.isErr()) {
            discard_staged_copies(mutation);
            return fail<Mutation>(installed.error());
        }
    }

    spdlog::debug("renamed {}@{} to {}@{}", app_name, tag, app_name, new_tag);
    mutation.registry = std::move(registry);
    return Result<Mutation>::ok(std::move(mutation));
}

Result<void> promote_staged_copies(const Mutation& mutation) {
    for (const auto& staged : mutation.staged_copies) {
        if (!rename_file(staged.staging_path, staged.final_path)) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                "cannot move " + staged.staging_path + " to " + staged.final_path));
        }
        spdlog::debug("promoted {} to {}", staged.staging_path, staged.final_path);
    }
    return Result<void>::ok();
}

void discard_staged_copies(const Mutation& mutation) {
    for (const auto& staged : mutation.staged_copies) {
        discard(staged);
    }
}

LaunchOwnership launch_ownership(const Layout& layout, const std::string& app_name,
                                 const Application* app) {
    LaunchOwnership ownership;
    ownership.managed_directory = managed_app_directory(layout, app_name);
    if (app) {
        for (const auto& [tag, entry] : app->entries) {
            if (const auto* path = std::get_if<PathEntry>(&entry.details)) {
                ownership.known_targets.push_back(launch_path(*path));
            }
        }
    }
    return ownership;
}

Result<Registry> describe(Registry registry, const std::string& app_name, const std::string& tag,
                          const std::optional<std::string>& description) {
    Application* app = registry.find(app_name);
    if (!app) {
        return fail<Registry>(ErrorCode::UNKNOWN_APPLICATION, "app " + app_name + " isn't tracked");
    }
    auto it = app->entries.find(tag);
    if (it == app->entries.end()) {
        return fail<Registry>(ErrorCode::UNKNOWN_TAG,
            "tag " + tag + " doesn't exist in application " + app_name);
    }

    it->second.description = description;
    return Result<Registry>::ok(std::move(registry));
}

} // namespace altb
