#include <romcat/import/overrides.hpp>

#include <romcat/util/dev_log.hpp>

#include <set>

namespace romcat::import {

namespace grp {

    struct overrides {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Overrides";
    };

} // namespace grp

bool GlobMatch(std::string_view pattern, std::string_view text) {
    // Iterative matcher with single-star backtracking
    size_t p = 0;
    size_t t = 0;
    size_t starPos = std::string_view::npos;
    size_t starText = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starPos = p++;
            starText = t;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            t = ++starText;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::optional<uint64> ApplyOverrides(catalog::CatalogDB &db, std::span<const catalog::Override> overrides,
                                     std::error_code &error) {
    auto tx = db.BeginTransaction(error);
    if (!tx.IsActive()) {
        return std::nullopt;
    }

    uint64 updates = 0;
    for (const catalog::Override &ovr : overrides) {
        if (ovr.entityId) {
            if (!db.SetField(ovr.entityType, *ovr.entityId, ovr.field, ovr.value, error)) {
                if (error != catalog::CatalogError::NotFound) {
                    return std::nullopt;
                }
                devlog::warn<grp::overrides>("Override target {} #{} does not exist",
                                             catalog::ToString(ovr.entityType), *ovr.entityId);
                error.clear();
                continue;
            }
            ++updates;
            continue;
        }

        if (!ovr.datNamePattern) {
            continue;
        }

        std::optional<std::string_view> platformId{};
        if (ovr.platformId) {
            platformId = *ovr.platformId;
        }
        const auto media = db.ListMediaWithDatName(platformId, error);
        if (error) {
            return std::nullopt;
        }

        // A release owning several matching media is updated once
        std::set<EntityID> updatedReleases{};
        uint64 matched = 0;
        for (const catalog::Media &m : media) {
            if (!m.datName || !GlobMatch(*ovr.datNamePattern, *m.datName)) {
                continue;
            }
            ++matched;

            EntityID targetId = m.id;
            if (ovr.entityType == catalog::EntityType::Release) {
                if (!updatedReleases.insert(m.releaseId).second) {
                    continue;
                }
                targetId = m.releaseId;
            }
            if (!db.SetField(ovr.entityType, targetId, ovr.field, ovr.value, error)) {
                return std::nullopt;
            }
            ++updates;
        }

        devlog::debug<grp::overrides>("Override \"{}\" on {} matched {} media", *ovr.datNamePattern, ovr.field,
                                      matched);
    }

    if (!tx.Commit(error)) {
        return std::nullopt;
    }
    return updates;
}

} // namespace romcat::import
