#include "altb/registry_store.hpp"
#include "altb/platform.hpp"

#include <spdlog/spdlog.h>

namespace altb {

Result<Registry> FileRegistryStore::load() {
    if (!entry_exists(path_)) {
        if (!legacy_path_.empty() && entry_exists(legacy_path_)) {
            return load_legacy();
        }
        spdlog::debug("no registry at {}, starting empty", path_);
        return Result<Registry>::ok(Registry{});
    }

    auto content = read_file(path_);
    if (!content) {
        return Result<Registry>::err(Error(ErrorCode::IO_ERROR, "cannot read registry " + path_));
    }

    auto parsed = parse_registry(*content, versions_dir_);
    if (!parsed.ok) {
        return Result<Registry>::err(Error(ErrorCode::CORRUPT_REGISTRY, parsed.error)
                                         .withContext(path_));
    }

    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", path_, warning);
    }

    spdlog::debug("loaded {} application(s) from {}", parsed.registry.applications.size(), path_);
    return Result<Registry>::ok(std::move(parsed.registry));
}

Result<Registry> FileRegistryStore::load_legacy() {
    auto content = read_file(legacy_path_);
    if (!content) {
        return Result<Registry>::err(Error(ErrorCode::IO_ERROR,
                                           "cannot read registry " + legacy_path_));
    }

    auto parsed = parse_legacy_config(*content, versions_dir_);
    if (!parsed.ok) {
        return Result<Registry>::err(Error(ErrorCode::CORRUPT_REGISTRY, parsed.error)
                                         .withContext(legacy_path_));
    }

    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", legacy_path_, warning);
    }

    spdlog::debug("imported {} application(s) from {}; the next change is saved to {}",
                  parsed.registry.applications.size(), legacy_path_, path_);
    return Result<Registry>::ok(std::move(parsed.registry));
}

Result<void> FileRegistryStore::save(const Registry& registry) {
    auto valid = validate_registry(registry, versions_dir_);
    if (valid.isErr()) return valid;

    std::string directory = get_parent_directory(path_);
    if (!directory.empty() && !create_directories(directory)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create directory " + directory));
    }

    auto written = atomic_write_file(path_, serialize_registry(registry));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error).withContext(path_));
    }

    spdlog::debug("saved registry to {}", path_);
    return Result<void>::ok();
}

Result<Registry> MemoryRegistryStore::load() {
    return Result<Registry>::ok(registry_);
}

Result<void> MemoryRegistryStore::save(const Registry& registry) {
    if (fail_next_save_) {
        fail_next_save_ = false;
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "simulated save failure"));
    }
    auto valid = validate_registry(registry);
    if (valid.isErr()) return valid;

    registry_ = registry;
    ++save_count_;
    return Result<void>::ok();
}

} // namespace altb
