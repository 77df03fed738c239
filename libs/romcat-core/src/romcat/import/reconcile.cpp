#include <romcat/import/reconcile.hpp>

#include <romcat/catalog/name_parser.hpp>

#include <romcat/util/dev_log.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <utility>
#include <variant>

namespace romcat::import {

namespace grp {

    struct reconcile {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Reconcile";
    };

} // namespace grp

namespace {

    // -------------------------------------------------------------------------
    // Planned mutations

    struct ReassignRelease {
        EntityID releaseId;
        EntityID workId;
    };

    struct FoldRelease {
        EntityID fromReleaseId;
        EntityID toReleaseId;
    };

    struct DeleteWork {
        EntityID workId;
        EntityID survivorId;
    };

    using Operation = std::variant<ReassignRelease, FoldRelease, DeleteWork>;

    struct ReleaseRef {
        EntityID id;
        std::string platformId;
        std::string region;
    };

    // Plans the merges over a snapshot of the catalog. The catalog is only read while planning, so a dry run and a real
    // run see the same data and produce the same statistics.
    class Planner {
    public:
        explicit Planner(catalog::CatalogDB &db)
            : m_db(db) {}

        bool PlanGroup(const std::string &platformId, const std::set<EntityID> &workIds, ReconcileResult &result,
                       std::error_code &error) {
            std::set<EntityID> resolved{};
            for (EntityID workId : workIds) {
                resolved.insert(Resolve(workId));
            }
            if (resolved.size() < 2) {
                return true;
            }

            // Pick the survivor: most releases, then lowest ID
            EntityID survivorId = kInvalidEntityID;
            uint64 survivorCount = 0;
            uint64 totalReleases = 0;
            for (EntityID workId : resolved) {
                const auto *releases = Releases(workId, error);
                if (releases == nullptr) {
                    return false;
                }
                totalReleases += releases->size();
                if (survivorId == kInvalidEntityID || releases->size() > survivorCount) {
                    survivorId = workId;
                    survivorCount = releases->size();
                }
            }

            MergeDetail detail{
                .platformId = platformId,
                .survivorId = survivorId,
                .totalReleases = totalReleases,
            };
            if (!Title(survivorId, detail.survivorTitle, error)) {
                return false;
            }

            ++result.stats.groupsFound;
            for (EntityID absorbedId : resolved) {
                if (absorbedId == survivorId) {
                    continue;
                }
                std::string absorbedTitle{};
                if (!Title(absorbedId, absorbedTitle, error)) {
                    return false;
                }
                if (!PlanAbsorb(absorbedId, survivorId, result.stats, error)) {
                    return false;
                }
                detail.absorbedIds.push_back(absorbedId);
                detail.absorbedTitles.push_back(std::move(absorbedTitle));
            }

            devlog::debug<grp::reconcile>("{}: merging {} works into #{} \"{}\"", platformId,
                                          detail.absorbedIds.size(), survivorId, detail.survivorTitle);
            result.details.push_back(std::move(detail));
            return true;
        }

        const std::vector<Operation> &Operations() const {
            return m_operations;
        }

    private:
        catalog::CatalogDB &m_db;

        std::map<EntityID, EntityID> m_redirects;
        std::map<EntityID, std::vector<ReleaseRef>> m_releasesByWork;
        std::map<EntityID, uint64> m_mediaCounts;
        std::map<EntityID, std::string> m_titles;
        std::vector<Operation> m_operations;

        EntityID Resolve(EntityID workId) const {
            auto it = m_redirects.find(workId);
            while (it != m_redirects.end()) {
                workId = it->second;
                it = m_redirects.find(workId);
            }
            return workId;
        }

        std::vector<ReleaseRef> *Releases(EntityID workId, std::error_code &error) {
            if (auto it = m_releasesByWork.find(workId); it != m_releasesByWork.end()) {
                return &it->second;
            }
            const auto releases = m_db.ReleasesForWork(workId, error);
            if (error) {
                return nullptr;
            }
            auto &refs = m_releasesByWork[workId];
            for (const catalog::Release &release : releases) {
                refs.push_back({.id = release.id, .platformId = release.platformId, .region = release.region});
            }
            return &refs;
        }

        std::optional<uint64> MediaCount(EntityID releaseId, std::error_code &error) {
            if (auto it = m_mediaCounts.find(releaseId); it != m_mediaCounts.end()) {
                return it->second;
            }
            const auto media = m_db.MediaForRelease(releaseId, error);
            if (error) {
                return std::nullopt;
            }
            m_mediaCounts[releaseId] = media.size();
            return media.size();
        }

        bool Title(EntityID workId, std::string &title, std::error_code &error) {
            if (auto it = m_titles.find(workId); it != m_titles.end()) {
                title = it->second;
                return true;
            }
            auto work = m_db.GetWork(workId, error);
            if (!work) {
                if (!error) {
                    error = catalog::CatalogError::NotFound;
                }
                return false;
            }
            title = m_titles[workId] = work->title;
            return true;
        }

        bool PlanAbsorb(EntityID absorbedId, EntityID survivorId, ReconcileStats &stats, std::error_code &error) {
            auto *absorbed = Releases(absorbedId, error);
            if (absorbed == nullptr) {
                return false;
            }
            auto *survivor = Releases(survivorId, error);
            if (survivor == nullptr) {
                return false;
            }

            for (ReleaseRef &release : *absorbed) {
                auto collision = std::find_if(survivor->begin(), survivor->end(), [&](const ReleaseRef &existing) {
                    return existing.platformId == release.platformId && existing.region == release.region;
                });
                if (collision != survivor->end()) {
                    const auto fromCount = MediaCount(release.id, error);
                    const auto toCount = MediaCount(collision->id, error);
                    if (!fromCount || !toCount) {
                        return false;
                    }
                    m_operations.push_back(FoldRelease{.fromReleaseId = release.id, .toReleaseId = collision->id});
                    m_mediaCounts[collision->id] = *toCount + *fromCount;
                    m_mediaCounts[release.id] = 0;
                    ++stats.releasesMerged;
                    stats.mediaMoved += *fromCount;
                } else {
                    m_operations.push_back(ReassignRelease{.releaseId = release.id, .workId = survivorId});
                    survivor->push_back(std::move(release));
                    ++stats.releasesReassigned;
                }
            }
            absorbed->clear();

            m_operations.push_back(DeleteWork{.workId = absorbedId, .survivorId = survivorId});
            m_redirects[absorbedId] = survivorId;
            ++stats.worksMerged;
            ++stats.worksDeleted;
            return true;
        }
    };

    bool Apply(catalog::CatalogDB &db, const Operation &operation, std::error_code &error) {
        if (const auto *reassign = std::get_if<ReassignRelease>(&operation)) {
            return db.ReassignRelease(reassign->releaseId, reassign->workId, error);
        }
        if (const auto *fold = std::get_if<FoldRelease>(&operation)) {
            return db.MoveMedia(fold->fromReleaseId, fold->toReleaseId, error) &&
                   db.MoveDisagreements(catalog::EntityType::Release, fold->fromReleaseId, fold->toReleaseId, error) &&
                   db.DeleteRelease(fold->fromReleaseId, error);
        }
        const auto &deleteWork = std::get<DeleteWork>(operation);
        return db.MoveDisagreements(catalog::EntityType::Work, deleteWork.workId, deleteWork.survivorId, error) &&
               db.DeleteWork(deleteWork.workId, error);
    }

} // namespace

std::optional<ReconcileResult> ReconcileWorks(catalog::CatalogDB &db, const ReconcileOptions &options,
                                              std::error_code &error) {
    error.clear();

    std::vector<std::string> platformIds = options.platformIds;
    if (platformIds.empty()) {
        for (const catalog::Platform &platform : db.ListPlatforms(error)) {
            platformIds.push_back(platform.id);
        }
        if (error) {
            return std::nullopt;
        }
    }

    // Group the works of each platform by normalized release title
    std::map<std::pair<std::string, std::string>, std::set<EntityID>> groups{};
    for (const std::string &platformId : platformIds) {
        const auto releases = db.ReleasesForPlatform(platformId, error);
        if (error) {
            return std::nullopt;
        }
        for (const catalog::Release &release : releases) {
            std::string key = catalog::NormalizeTitleKey(release.title);
            if (key.empty()) {
                devlog::debug<grp::reconcile>("{}: release #{} has no comparable title", platformId, release.id);
                continue;
            }
            groups[{platformId, std::move(key)}].insert(release.workId);
        }
    }

    ReconcileResult result{};
    Planner planner{db};
    for (const auto &[key, workIds] : groups) {
        if (workIds.size() < 2) {
            continue;
        }
        if (!planner.PlanGroup(key.first, workIds, result, error)) {
            return std::nullopt;
        }
    }

    if (options.dryRun || planner.Operations().empty()) {
        return result;
    }

    auto tx = db.BeginTransaction(error);
    if (!tx.IsActive()) {
        return std::nullopt;
    }
    for (const Operation &operation : planner.Operations()) {
        if (!Apply(db, operation, error)) {
            devlog::error<grp::reconcile>("Reconciliation failed, rolling back: {}", error.message());
            return std::nullopt;
        }
    }
    if (!tx.Commit(error)) {
        return std::nullopt;
    }

    devlog::info<grp::reconcile>("Merged {} works in {} groups", result.stats.worksMerged, result.stats.groupsFound);
    return result;
}

} // namespace romcat::import
