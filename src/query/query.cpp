#include "altb/query.hpp"
#include "altb/tag_order.hpp"

namespace altb {

std::vector<std::string> sorted_tags(const Application& app) {
    std::vector<std::string> tags;
    tags.reserve(app.entries.size());
    for (const auto& [tag, entry] : app.entries) {
        tags.push_back(tag);
    }
    sort_tags(tags);
    return tags;
}

Result<std::vector<ListRow>> list(const Registry& registry,
                                  const std::optional<std::string>& app_name,
                                  bool all) {
    std::vector<const Application*> apps;
    if (app_name) {
        const Application* app = registry.find(*app_name);
        if (!app) {
            return Result<std::vector<ListRow>>::err(Error(ErrorCode::UNKNOWN_APPLICATION,
                "app " + *app_name + " isn't tracked"));
        }
        apps.push_back(app);
    } else {
        // std::map keeps application names sorted
        for (const auto& [name, app] : registry.applications) {
            apps.push_back(&app);
        }
    }

    std::vector<ListRow> rows;
    for (const Application* app : apps) {
        for (const auto& tag : sorted_tags(*app)) {
            bool active = app->active_tag && *app->active_tag == tag;
            if (!all && !active) continue;

            const Entry& entry = app->entries.at(tag);
            ListRow row;
            row.app_name = app->name;
            row.tag = tag;
            row.kind = entry.kind();
            row.target_summary = target_summary(entry);
            row.is_active = active;
            row.description = entry.description;
            rows.push_back(std::move(row));
        }
    }

    return Result<std::vector<ListRow>>::ok(std::move(rows));
}

Result<std::string> current(const Registry& registry, const std::string& app_name) {
    const Application* app = registry.find(app_name);
    if (!app) {
        return Result<std::string>::err(Error(ErrorCode::UNKNOWN_APPLICATION,
                                              "app " + app_name + " isn't tracked"));
    }
    if (!app->active_tag) {
        return Result<std::string>::err(Error(ErrorCode::NO_ACTIVE_TAG,
                                              "app " + app_name + " doesn't have an active tag"));
    }
    return Result<std::string>::ok(*app->active_tag);
}

} // namespace altb
