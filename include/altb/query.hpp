#pragma once

#include "altb/entry.hpp"
#include "altb/registry.hpp"
#include "altb/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace altb {

struct ListRow {
    std::string app_name;
    std::string tag;
    EntryKind kind = EntryKind::Path;
    std::string target_summary;
    bool is_active = false;
    std::optional<std::string> description;
};

/**
 * Read-only listing, ordered by application name then natural tag order.
 * Without all, only each application's active row is returned.
 * Fails with UNKNOWN_APPLICATION when app_name is given and not tracked.
 */
Result<std::vector<ListRow>> list(const Registry& registry,
                                  const std::optional<std::string>& app_name = std::nullopt,
                                  bool all = false);

/// Active tag of an application; NO_ACTIVE_TAG or UNKNOWN_APPLICATION otherwise
Result<std::string> current(const Registry& registry, const std::string& app_name);

/// Tags of an application in natural order (empty if not tracked)
std::vector<std::string> sorted_tags(const Application& app);

} // namespace altb
