#include <romcat/import/scan.hpp>

#include <romcat/util/dev_log.hpp>
#include <romcat/util/string_ops.hpp>

#include <algorithm>

namespace romcat::import {

namespace grp {

    // Hierarchy:
    //
    // base
    //   collect

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Scan";
    };

    struct collect : public base {
        static constexpr std::string_view name = "Scan-Collect";
    };

} // namespace grp

namespace fs = std::filesystem;

// Finds the catalog media with the same SHA-1, or else the same CRC32 and a compatible size
static std::optional<catalog::Media> FindCatalogMedia(catalog::CatalogDB &db, const FileDigests &digests,
                                                      std::error_code &error) {
    auto bySHA1 = db.FindMediaBySHA1(ToString(digests.sha1), error);
    if (error) {
        return std::nullopt;
    }
    if (!bySHA1.empty()) {
        return bySHA1.front();
    }

    auto byCRC32 = db.FindMediaByCRC32(ToString(digests.crc32), error);
    if (error) {
        return std::nullopt;
    }
    for (catalog::Media &media : byCRC32) {
        if (!media.fileSize || *media.fileSize == digests.dataSize) {
            return std::move(media);
        }
    }
    return std::nullopt;
}

std::optional<ClassifiedFile> ClassifyFile(const fs::path &path, const db::HashIndex &index, catalog::CatalogDB &db,
                                           const ScanOptions &options, std::error_code &error) {
    const uint64 skip = media::DeriveHeaderSkip(options.headerFormat, path, error);
    if (error) {
        return std::nullopt;
    }

    auto digests = media::HashFile(path, skip, {}, options.chunkSize, error);
    if (!digests) {
        return std::nullopt;
    }

    ClassifiedFile result{
        .path = path,
        .headerSkip = skip,
        .digests = *digests,
        .classification = ScanUnmatched{},
    };

    auto media = FindCatalogMedia(db, *digests, error);
    if (error) {
        return std::nullopt;
    }
    if (media) {
        result.classification = ScanMatched{.mediaId = media->id};
        return result;
    }

    if (const db::ReferenceRecord *record = index.LookupDigests(*digests)) {
        auto byName = db.FindMediaByDatName(record->name, error);
        if (error) {
            return std::nullopt;
        }
        if (byName) {
            result.classification = ScanMatched{.mediaId = byName->id};
        } else {
            devlog::debug<grp::base>("{}: {} is not in the catalog", path.string(), record->name);
            result.classification = ScanUnmatched{.record = record};
        }
        return result;
    }

    if (options.tryRepair) {
        const repair::RepairQuery query{
            .headerSkip = skip,
            .sourceKind = options.sourceKind,
            .chunkSize = options.chunkSize,
        };
        auto match = repair::FindRepairAny(path, query, index, error);
        if (error) {
            return std::nullopt;
        }
        if (match) {
            result.classification = ScanNeedsRepair{.repair = std::move(*match)};
        }
    }
    return result;
}

ScanStats ScanFiles(std::span<const fs::path> paths, const db::HashIndex &index, catalog::CatalogDB &db,
                    const ScanOptions &options, IScanListener *listener, const std::atomic_bool *cancel) {
    ScanStats stats{};

    for (size_t i = 0; i < paths.size(); ++i) {
        if (cancel != nullptr && cancel->load()) {
            devlog::info<grp::base>("Scan cancelled after {} of {} files", i, paths.size());
            stats.cancelled = true;
            break;
        }

        const fs::path &path = paths[i];
        ++stats.files;
        if (listener != nullptr) {
            listener->OnFile(i, paths.size(), path);
        }

        std::error_code error{};
        auto file = ClassifyFile(path, index, db, options, error);
        if (!file) {
            devlog::warn<grp::base>("Could not classify {}: {}", path.string(), error.message());
            ++stats.errors;
            if (listener != nullptr) {
                listener->OnError(path, error);
            }
            continue;
        }

        if (const auto *matched = std::get_if<ScanMatched>(&file->classification)) {
            ++stats.matched;
            if (listener != nullptr) {
                std::string title{};
                auto media = db.GetMedia(matched->mediaId, error);
                if (error) {
                    devlog::warn<grp::base>("Could not read media #{} matched by {}: {}", matched->mediaId,
                                            path.string(), error.message());
                }
                if (media && media->datName) {
                    title = *media->datName;
                } else {
                    title = path.filename().string();
                }
                listener->OnMatch(*file, title);
            }
        } else if (const auto *needsRepair = std::get_if<ScanNeedsRepair>(&file->classification)) {
            ++stats.repairable;
            if (listener != nullptr) {
                listener->OnRepairable(*file, needsRepair->repair);
            }
        } else {
            ++stats.unmatched;
            if (listener != nullptr) {
                listener->OnNoMatch(*file);
            }
        }
    }

    devlog::info<grp::base>("Scanned {} files: {} matched, {} repairable, {} unmatched, {} errors", stats.files,
                            stats.matched, stats.repairable, stats.unmatched, stats.errors);
    if (listener != nullptr) {
        listener->OnComplete(stats);
    }
    return stats;
}

static bool AcceptsExtension(const fs::path &path, const std::vector<std::string> &extensions) {
    if (extensions.empty()) {
        return true;
    }
    const std::string ext = util::ToLower(path.extension().string());
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

template <typename TIterator>
static bool CollectFrom(TIterator it, const Configuration::Scan &config, std::vector<fs::path> &files,
                        std::error_code &error) {
    for (; it != TIterator{}; it.increment(error)) {
        if (error) {
            return false;
        }
        const bool isFile = it->is_regular_file(error);
        if (error) {
            devlog::warn<grp::collect>("Could not stat {}: {}", it->path().string(), error.message());
            error.clear();
            continue;
        }
        if (isFile && AcceptsExtension(it->path(), config.extensions)) {
            files.push_back(it->path());
        }
    }
    return !error;
}

std::vector<fs::path> CollectScanFiles(const fs::path &root, const Configuration::Scan &config,
                                       std::error_code &error) {
    error.clear();
    std::vector<fs::path> files{};

    bool ok;
    if (config.recursive) {
        fs::recursive_directory_iterator it{root, fs::directory_options::skip_permission_denied, error};
        ok = !error && CollectFrom(std::move(it), config, files, error);
    } else {
        fs::directory_iterator it{root, fs::directory_options::skip_permission_denied, error};
        ok = !error && CollectFrom(std::move(it), config, files, error);
    }
    if (!ok) {
        return {};
    }

    std::sort(files.begin(), files.end());
    devlog::debug<grp::collect>("Collected {} files from {}", files.size(), root.string());
    return files;
}

} // namespace romcat::import
