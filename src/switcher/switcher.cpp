#include "altb/switcher.hpp"
#include "altb/platform.hpp"
#include "altb/runner.hpp"
#include "altb/switch_engine.hpp"
#include "altb/tag_resolver.hpp"

#include <spdlog/spdlog.h>

namespace altb {

namespace {

void remove_stale_files(const std::vector<std::string>& files) {
    for (const auto& file : files) {
        if (entry_exists(file) && !remove_file(file)) {
            spdlog::warn("could not remove managed copy {}", file);
        }
    }
}

} // namespace

Result<void> Switcher::commit(const std::string& app_name, const Mutation& mutation,
                              const InstalledEntry& before) {
    auto saved = store_.save(mutation.registry);
    if (saved.isErr()) {
        auto restored = restore_launch_entry(layout_, app_name, before);
        if (restored.isErr()) {
            spdlog::warn("could not restore launch entry of {}: {}", app_name,
                         restored.error().message());
        }
        discard_staged_copies(mutation);
        return saved;
    }

    auto promoted = promote_staged_copies(mutation);
    if (promoted.isErr()) return promoted;

    remove_stale_files(mutation.stale_files);
    return saved;
}

Result<std::string> Switcher::track_path(const std::string& app_name,
                                         const std::optional<std::string>& tag,
                                         const std::string& path,
                                         bool copy,
                                         const std::optional<std::string>& description) {
    auto name_check = validate_app_name(app_name);
    if (name_check.isErr()) return Result<std::string>::err(name_check.error());

    auto loaded = store_.load();
    if (loaded.isErr()) return Result<std::string>::err(loaded.error());

    auto path_entry = make_path_entry(path, layout_.home_dir);
    if (path_entry.isErr()) return Result<std::string>::err(path_entry.error());

    std::string resolved_tag;
    if (tag) {
        resolved_tag = *tag;
    } else {
        auto derived = derive_tag(loaded.value(), app_name, path_entry.value());
        if (derived.isErr()) return Result<std::string>::err(derived.error());
        resolved_tag = derived.value();
    }

    Entry entry{path_entry.value(), description};
    auto before = read_launch_entry(layout_, app_name);

    auto mutation = altb::track(std::move(loaded.value()), layout_, app_name, resolved_tag,
                                std::move(entry), copy);
    if (mutation.isErr()) return Result<std::string>::err(mutation.error());

    auto committed = commit(app_name, mutation.value(), before);
    if (committed.isErr()) return Result<std::string>::err(committed.error());

    return Result<std::string>::ok(resolved_tag);
}

Result<void> Switcher::track_command(const std::string& app_name,
                                     const std::optional<std::string>& tag,
                                     const std::string& command_line,
                                     const std::optional<std::string>& working_directory,
                                     const EnvMap& environment,
                                     const std::optional<std::string>& description) {
    auto name_check = validate_app_name(app_name);
    if (name_check.isErr()) return name_check;

    if (!tag || tag->empty()) {
        return Result<void>::err(Error(ErrorCode::MISSING_TAG,
            "command entries need an explicit tag: " + app_name + "@<tag>"));
    }

    auto command = make_command_entry(command_line, working_directory, environment);
    if (command.isErr()) return Result<void>::err(command.error());

    auto loaded = store_.load();
    if (loaded.isErr()) return Result<void>::err(loaded.error());

    Entry entry{command.value(), description};
    auto before = read_launch_entry(layout_, app_name);

    auto mutation = altb::track(std::move(loaded.value()), layout_, app_name, *tag,
                                std::move(entry));
    if (mutation.isErr()) return Result<void>::err(mutation.error());

    return commit(app_name, mutation.value(), before);
}

Result<std::string> Switcher::use(const std::string& app_name,
                                  const std::optional<std::string>& tag,
                                  bool force) {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<std::string>::err(loaded.error());

    auto before = read_launch_entry(layout_, app_name);

    auto updated = altb::use(std::move(loaded.value()), layout_, app_name, tag, force);
    if (updated.isErr()) return Result<std::string>::err(updated.error());

    std::string active = *updated.value().find(app_name)->active_tag;
    auto committed = commit(app_name, Mutation{std::move(updated.value()), {}, {}}, before);
    if (committed.isErr()) return Result<std::string>::err(committed.error());

    return Result<std::string>::ok(active);
}

Result<void> Switcher::unlink(const std::string& app_name, bool force) {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<void>::err(loaded.error());

    auto before = read_launch_entry(layout_, app_name);

    auto updated = altb::unlink(std::move(loaded.value()), layout_, app_name, force);
    if (updated.isErr()) return Result<void>::err(updated.error());

    return commit(app_name, Mutation{std::move(updated.value()), {}, {}}, before);
}

Result<void> Switcher::untrack(const std::string& app_name, const std::string& tag) {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<void>::err(loaded.error());

    auto before = read_launch_entry(layout_, app_name);

    auto mutation = altb::untrack(std::move(loaded.value()), layout_, app_name, tag);
    if (mutation.isErr()) return Result<void>::err(mutation.error());

    return commit(app_name, mutation.value(), before);
}

Result<void> Switcher::rename_tag(const std::string& app_name, const std::string& tag,
                                  const std::string& new_tag) {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<void>::err(loaded.error());

    auto before = read_launch_entry(layout_, app_name);

    auto mutation = altb::rename_tag(std::move(loaded.value()), layout_, app_name, tag, new_tag);
    if (mutation.isErr()) return Result<void>::err(mutation.error());

    return commit(app_name, mutation.value(), before);
}

Result<void> Switcher::describe(const std::string& app_name, const std::string& tag,
                                const std::optional<std::string>& description) {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<void>::err(loaded.error());

    auto updated = altb::describe(std::move(loaded.value()), app_name, tag, description);
    if (updated.isErr()) return Result<void>::err(updated.error());

    return store_.save(updated.value());
}

Result<std::vector<ListRow>> Switcher::list(const std::optional<std::string>& app_name,
                                            bool all) const {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<std::vector<ListRow>>::err(loaded.error());
    return altb::list(loaded.value(), app_name, all);
}

Result<std::string> Switcher::current(const std::string& app_name) const {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<std::string>::err(loaded.error());
    return altb::current(loaded.value(), app_name);
}

Result<int> Switcher::run(const std::string& app_name, const std::vector<std::string>& args) const {
    auto loaded = store_.load();
    if (loaded.isErr()) return Result<int>::err(loaded.error());
    return altb::run(loaded.value(), app_name, args);
}

Result<Registry> Switcher::registry() const {
    return store_.load();
}

} // namespace altb
