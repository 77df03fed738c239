#include <romcat/import/reference_import.hpp>

#include <romcat/import/merge.hpp>

#include <romcat/util/dev_log.hpp>
#include <romcat/util/string_ops.hpp>

namespace romcat::import {

namespace grp {

    struct import {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Import";
    };

} // namespace grp

static bool StartsWithIgnoreCase(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && util::EqualsIgnoreCase(str.substr(0, prefix.size()), prefix);
}

catalog::MediaStatus StatusFromName(const catalog::ParsedName &name) {
    switch (name.dumpStatus) {
    case catalog::DumpStatus::BadDump: return catalog::MediaStatus::Bad;
    case catalog::DumpStatus::Overdump: return catalog::MediaStatus::Overdump;
    case catalog::DumpStatus::Verified: break;
    }

    for (const std::string &flag : name.flags) {
        if (StartsWithIgnoreCase(flag, "Proto")) {
            return catalog::MediaStatus::Prototype;
        }
        if (StartsWithIgnoreCase(flag, "Beta")) {
            return catalog::MediaStatus::Beta;
        }
        if (util::EqualsIgnoreCase(flag, "Sample")) {
            return catalog::MediaStatus::Sample;
        }
    }
    return catalog::MediaStatus::Verified;
}

namespace {

    enum class Outcome { Created, Updated, Unchanged };

    std::optional<std::string> LowerOpt(const std::optional<std::string> &value) {
        if (value) {
            return util::ToLower(*value);
        }
        return std::nullopt;
    }

    class RecordImporter {
    public:
        RecordImporter(catalog::CatalogDB &db, std::string_view platformId, const ImportSource &source)
            : m_db(db)
            , m_platformId(platformId)
            , m_source(source) {}

        std::optional<Outcome> Import(const db::ReferenceRecord &record, const catalog::ParsedName &parsed,
                                      uint64 &disagreements, std::error_code &error) {
            const std::string title = record.title.empty() ? parsed.title : record.title;

            // Work
            EntityID workId = kInvalidEntityID;
            if (auto work = m_db.FindWorkByTitle(title, error)) {
                workId = work->id;
            } else if (error) {
                return std::nullopt;
            } else if (auto id = m_db.InsertWork(title, error)) {
                workId = *id;
            } else {
                return std::nullopt;
            }

            // Release
            std::string region = "unknown";
            if (!parsed.regions.empty()) {
                region = catalog::RegionToSlug(parsed.regions.front());
            } else if (record.region) {
                region = catalog::RegionToSlug(*record.region);
            }

            EntityID releaseId = kInvalidEntityID;
            if (auto release = m_db.FindRelease(workId, m_platformId, region, error)) {
                releaseId = release->id;
                const ReleaseFields fields{
                    .title = parsed.title.empty() ? std::nullopt : std::optional{parsed.title},
                    .releaseDate = record.releaseDate,
                    .genre = record.genre,
                    .players = record.players,
                };
                auto count = MergeReleaseFields(m_db, releaseId, kDatImportSource, m_source.name, fields, error);
                if (!count) {
                    return std::nullopt;
                }
                disagreements += *count;
            } else if (error) {
                return std::nullopt;
            } else {
                catalog::Release newRelease{
                    .workId = workId,
                    .platformId = std::string(m_platformId),
                    .region = region,
                    .title = parsed.title.empty() ? title : parsed.title,
                    .releaseDate = record.releaseDate,
                    .serial = record.serial,
                    .genre = record.genre,
                    .players = record.players,
                };
                if (record.publisher && !(newRelease.publisherId = ResolveCompany(*record.publisher, error))) {
                    if (error) {
                        return std::nullopt;
                    }
                }
                if (record.developer && !(newRelease.developerId = ResolveCompany(*record.developer, error))) {
                    if (error) {
                        return std::nullopt;
                    }
                }
                auto id = m_db.InsertRelease(newRelease, error);
                if (!id) {
                    return std::nullopt;
                }
                releaseId = *id;
            }

            // Media
            catalog::Media media{
                .releaseId = releaseId,
                .serial = record.serial,
                .discNumber = parsed.discNumber,
                .discLabel = parsed.discLabel,
                .revision = parsed.revision ? parsed.revision : parsed.version,
                .status = StatusFromName(parsed),
                .datName = record.name,
                .datSource = m_source.name,
                .fileSize = record.expectedLength,
                .crc32 = LowerOpt(record.secondaryHash),
                .sha1 = LowerOpt(record.primaryHash),
                .md5 = LowerOpt(record.md5),
            };

            auto existing = m_db.FindMediaByDatName(record.name, error);
            if (error) {
                return std::nullopt;
            }
            if (!existing) {
                if (!m_db.InsertMedia(media, error)) {
                    return std::nullopt;
                }
                return Outcome::Created;
            }

            // Existing media keep their release; the dump facts come from the reference
            media.id = existing->id;
            media.releaseId = existing->releaseId;
            if (existing->crc32 == media.crc32 && existing->sha1 == media.sha1 && existing->md5 == media.md5 &&
                existing->fileSize == media.fileSize && existing->status == media.status &&
                existing->serial == media.serial && existing->datSource == media.datSource) {
                return Outcome::Unchanged;
            }
            if (!m_db.UpdateMedia(media, error)) {
                return std::nullopt;
            }
            return Outcome::Updated;
        }

    private:
        catalog::CatalogDB &m_db;
        std::string_view m_platformId;
        const ImportSource &m_source;

        std::optional<std::string> ResolveCompany(const std::string &name, std::error_code &error) {
            return m_db.FindCompanyByAlias(name, error);
        }
    };

} // namespace

std::optional<ImportStats> ImportReferenceRecords(catalog::CatalogDB &db, std::string_view platformId,
                                                  std::span<const db::ReferenceRecord> records,
                                                  const ImportSource &source, IImportListener *listener,
                                                  std::error_code &error) {
    auto tx = db.BeginTransaction(error);
    if (!tx.IsActive()) {
        return std::nullopt;
    }

    if (!db.GetPlatform(platformId, error)) {
        if (!error) {
            error = catalog::CatalogError::MissingPlatform;
        }
        return std::nullopt;
    }

    ImportStats stats{};
    RecordImporter importer{db, platformId, source};

    auto skip = [&](const db::ReferenceRecord &record, std::string_view reason) {
        ++stats.skipped;
        devlog::debug<grp::import>("Skipping {}: {}", record.name, reason);
        if (listener != nullptr) {
            listener->OnSkipped(record.name, reason);
        }
    };

    for (size_t i = 0; i < records.size(); ++i) {
        const db::ReferenceRecord &record = records[i];
        ++stats.records;
        if (listener != nullptr) {
            listener->OnRecord(i, records.size(), record.name);
        }

        const catalog::ParsedName parsed = catalog::ParseName(record.name);
        if (parsed.dumpStatus == catalog::DumpStatus::BadDump) {
            skip(record, "bad dump");
            continue;
        }
        if (record.name.empty() || (record.title.empty() && parsed.title.empty())) {
            skip(record, "record has no name");
            continue;
        }

        // Each record commits into the batch or rolls back on its own
        auto recordTx = db.BeginTransaction(error);
        if (!recordTx.IsActive()) {
            return std::nullopt;
        }

        uint64 disagreements = 0;
        const auto outcome = importer.Import(record, parsed, disagreements, error);
        if (!outcome || !recordTx.Commit(error)) {
            const std::string reason = error.message();
            error.clear();
            skip(record, reason);
            continue;
        }

        stats.disagreements += disagreements;
        switch (*outcome) {
        case Outcome::Created: ++stats.created; break;
        case Outcome::Updated: ++stats.updated; break;
        case Outcome::Unchanged: ++stats.unchanged; break;
        }
    }

    const catalog::ImportLog log{
        .sourceType = source.type,
        .sourceName = source.name,
        .sourceVersion = source.version,
        .recordsCreated = stats.created,
        .recordsUpdated = stats.updated,
        .recordsUnchanged = stats.unchanged,
        .disagreementsFound = stats.disagreements,
    };
    if (!db.InsertImportLog(log, error)) {
        return std::nullopt;
    }
    if (!tx.Commit(error)) {
        return std::nullopt;
    }

    devlog::info<grp::import>("Imported {} records into {}: {} created, {} updated, {} unchanged, {} skipped",
                              stats.records, platformId, stats.created, stats.updated, stats.unchanged,
                              stats.skipped);
    if (listener != nullptr) {
        listener->OnComplete(stats);
    }
    return stats;
}

} // namespace romcat::import
