#include <romcat/import/merge.hpp>

#include <romcat/util/dev_log.hpp>

namespace romcat::import {

namespace grp {

    struct merge {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Merge";
    };

} // namespace grp

static bool IsBlank(const std::optional<std::string> &value) {
    return !value || value->empty();
}

bool CheckField(catalog::CatalogDB &db, catalog::EntityType type, EntityID entityId, std::string_view field,
                std::string_view sourceA, const std::optional<std::string> &existing, std::string_view sourceB,
                const std::optional<std::string> &proposed, std::error_code &error) {
    error.clear();
    if (IsBlank(existing) || !proposed || *existing == *proposed) {
        return false;
    }

    const catalog::Disagreement disagreement{
        .entityType = type,
        .entityId = entityId,
        .field = std::string(field),
        .sourceA = std::string(sourceA),
        .valueA = existing,
        .sourceB = std::string(sourceB),
        .valueB = proposed,
    };
    if (!db.InsertDisagreement(disagreement, error)) {
        return false;
    }

    devlog::debug<grp::merge>("{} #{} {}: {} says \"{}\", {} says \"{}\"", catalog::ToString(type), entityId, field,
                              sourceA, *existing, sourceB, *proposed);
    return true;
}

std::optional<uint64> MergeReleaseFields(catalog::CatalogDB &db, EntityID releaseId, std::string_view existingSource,
                                         std::string_view newSource, const ReleaseFields &fields,
                                         std::error_code &error) {
    auto tx = db.BeginTransaction(error);
    if (!tx.IsActive()) {
        return std::nullopt;
    }

    auto release = db.GetRelease(releaseId, error);
    if (!release) {
        if (!error) {
            error = catalog::CatalogError::NotFound;
        }
        return std::nullopt;
    }

    uint64 disagreements = 0;
    bool filled = false;

    // Fills an empty field or records a disagreement with its current value
    auto merge = [&](std::string_view field, std::optional<std::string> &current,
                     const std::optional<std::string> &proposed) -> bool {
        if (IsBlank(current)) {
            if (!IsBlank(proposed)) {
                current = proposed;
                filled = true;
            }
            return true;
        }
        if (CheckField(db, catalog::EntityType::Release, releaseId, field, existingSource, current, newSource,
                       proposed, error)) {
            ++disagreements;
        }
        return !error;
    };

    std::optional<std::string> title{};
    if (!release->title.empty()) {
        title = release->title;
    }

    if (!merge("title", title, fields.title) || !merge("alt_title", release->altTitle, fields.altTitle) ||
        !merge("release_date", release->releaseDate, fields.releaseDate) ||
        !merge("genre", release->genre, fields.genre) || !merge("players", release->players, fields.players) ||
        !merge("description", release->description, fields.description)) {
        return std::nullopt;
    }

    if (filled) {
        release->title = title.value_or(std::string{});
        if (!db.UpdateRelease(*release, error)) {
            return std::nullopt;
        }
    }

    if (!tx.Commit(error)) {
        return std::nullopt;
    }
    return disagreements;
}

} // namespace romcat::import
