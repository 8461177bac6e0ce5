#pragma once

#include "altb/registry.hpp"
#include "altb/types.hpp"

#include <optional>
#include <string>

namespace altb {

// ============================================================================
// Registry Store
// ============================================================================

/**
 * Loads and persists the registry.
 *
 * Concurrent modification between load() and save() is not detected: the
 * last writer wins.
 */
class RegistryStore {
public:
    virtual ~RegistryStore() = default;

    /// Empty registry when nothing is persisted; CORRUPT_REGISTRY on a bad document
    virtual Result<Registry> load() = 0;

    /// Replace the persisted registry atomically
    virtual Result<void> save(const Registry& registry) = 0;
};

/**
 * The JSON document at a fixed path, replaced by temp file + rename.
 *
 * While that document does not exist, a YAML config of older releases at
 * legacy_path (if given and present) is imported instead; the first save
 * then writes the JSON document and leaves the YAML file untouched.
 */
class FileRegistryStore : public RegistryStore {
public:
    /// versions_dir is used to recognise managed copies when importing older documents
    explicit FileRegistryStore(std::string path, std::string versions_dir = "",
                               std::string legacy_path = "")
        : path_(std::move(path)), versions_dir_(std::move(versions_dir)),
          legacy_path_(std::move(legacy_path)) {}

    const std::string& path() const { return path_; }

    Result<Registry> load() override;
    Result<void> save(const Registry& registry) override;

private:
    Result<Registry> load_legacy();

    std::string path_;
    std::string versions_dir_;
    std::string legacy_path_;
};

/// In-memory store for tests and embedding
class MemoryRegistryStore : public RegistryStore {
public:
    MemoryRegistryStore() = default;
    explicit MemoryRegistryStore(Registry initial) : registry_(std::move(initial)) {}

    Result<Registry> load() override;
    Result<void> save(const Registry& registry) override;

    /// Make the next save() fail with IO_ERROR
    void failNextSave() { fail_next_save_ = true; }

    const Registry& current() const { return registry_; }
    int saveCount() const { return save_count_; }

private:
    Registry registry_;
    bool fail_next_save_ = false;
    int save_count_ = 0;
};

} // namespace altb
