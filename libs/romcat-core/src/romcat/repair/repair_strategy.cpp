#include <romcat/repair/repair_strategy.hpp>

#include <romcat/util/dev_log.hpp>
#include <romcat/util/scope_guard.hpp>
#include <romcat/util/size_ops.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <vector>

namespace romcat::repair {

namespace grp {

    // Hierarchy:
    //
    // base
    //   apply

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Repair";
    };

    struct apply : public base {
        static constexpr devlog::Level level = devlog::level::info;
        static constexpr std::string_view name = "Repair-Apply";
    };

} // namespace grp

namespace fs = std::filesystem;

std::string RepairStrategy::Describe() const {
    if (padding.prependSize > 0) {
        return fmt::format("prepend {} of 0x{:02X}", util::FormatByteCount(padding.prependSize), padding.fillByte);
    }
    return fmt::format("append {} of 0x{:02X}", util::FormatByteCount(padding.appendSize), padding.fillByte);
}

std::vector<RepairStrategy> BuildStrategies(uint64 actualSize, std::optional<uint64> expectedSize,
                                            db::SourceKind sourceKind) {
    std::vector<RepairStrategy> strategies{};

    if (expectedSize && *expectedSize > actualSize) {
        const uint64 diff = *expectedSize - actualSize;
        strategies.push_back({.padding = {.appendSize = diff, .fillByte = 0x00}});
        strategies.push_back({.padding = {.appendSize = diff, .fillByte = 0xFF}});
    }

    if (sourceKind == db::SourceKind::OpticalDisc) {
        strategies.push_back({.padding = {.prependSize = kCDPregapSize, .fillByte = 0x00}});
    }

    if (!expectedSize && sourceKind == db::SourceKind::Cartridge && !util::IsPowerOfTwo(actualSize)) {
        const uint64 diff = util::NextPowerOfTwo(actualSize) - actualSize;
        strategies.push_back({.padding = {.appendSize = diff, .fillByte = 0x00}});
        strategies.push_back({.padding = {.appendSize = diff, .fillByte = 0xFF}});
    }

    return strategies;
}

// Computes the size of the data that is hashed, i.e. the file size minus the header
static std::optional<uint64> DataSize(const fs::path &path, uint64 headerSkip, std::error_code &error) {
    const uintmax_t fileSize = fs::file_size(path, error);
    if (error) {
        return std::nullopt;
    }
    return fileSize - std::min<uint64>(fileSize, headerSkip);
}

namespace {

    // Hashes the file once per untested hypothesis and looks the result up in the index
    class StrategyRunner {
    public:
        StrategyRunner(const fs::path &path, uint64 actualSize, const RepairQuery &query, const db::HashIndex &index)
            : m_path(path)
            , m_actualSize(actualSize)
            , m_query(query)
            , m_index(index)
            , m_filterBySize(index.Size() > 0 && index.UnsizedCount() == 0) {}

        std::optional<RepairMatch> Run(const std::vector<RepairStrategy> &strategies, std::error_code &error) {
            error.clear();
            for (const RepairStrategy &strategy : strategies) {
                if (std::find(m_tried.begin(), m_tried.end(), strategy) != m_tried.end()) {
                    continue;
                }
                m_tried.push_back(strategy);

                // A record without a length matches any size
                const uint64 targetSize = m_actualSize + strategy.BytesAdded();
                if (m_filterBySize && m_index.CandidatesBySize(targetSize).empty()) {
                    continue;
                }

                devlog::trace<grp::base>("{}: trying {}", m_path.string(), strategy.Describe());
                auto digests = media::HashFile(m_path, m_query.headerSkip, strategy.padding, m_query.chunkSize, error);
                if (!digests) {
                    return std::nullopt;
                }
                if (const db::ReferenceRecord *record = m_index.LookupDigests(*digests)) {
                    devlog::debug<grp::base>("{}: matched {} after {}", m_path.string(), record->name,
                                             strategy.Describe());
                    return RepairMatch{
                        .record = record,
                        .padding = strategy.padding,
                        .method = strategy.Describe(),
                        .bytesAdded = strategy.BytesAdded(),
                        .digests = *digests,
                    };
                }
            }
            return std::nullopt;
        }

    private:
        const fs::path &m_path;
        uint64 m_actualSize;
        const RepairQuery &m_query;
        const db::HashIndex &m_index;
        bool m_filterBySize;
        std::vector<RepairStrategy> m_tried;
    };

} // namespace

std::optional<RepairMatch> FindRepair(const fs::path &path, std::optional<uint64> expectedSize,
                                      const RepairQuery &query, const db::HashIndex &index, std::error_code &error) {
    const auto actualSize = DataSize(path, query.headerSkip, error);
    if (!actualSize) {
        return std::nullopt;
    }

    StrategyRunner runner{path, *actualSize, query, index};
    return runner.Run(BuildStrategies(*actualSize, expectedSize, query.sourceKind), error);
}

std::optional<RepairMatch> FindRepairAny(const fs::path &path, const RepairQuery &query, const db::HashIndex &index,
                                         std::error_code &error) {
    const auto actualSize = DataSize(path, query.headerSkip, error);
    if (!actualSize) {
        return std::nullopt;
    }

    StrategyRunner runner{path, *actualSize, query, index};
    return runner.Run(BuildStrategies(*actualSize, std::nullopt, query.sourceKind), error);
}

fs::path BackupPath(const fs::path &path) {
    fs::path backup = path;
    backup += ".bak";
    return backup;
}

static std::error_code LastIOError() {
    std::error_code error{errno, std::generic_category()};
    if (!error) {
        error = std::make_error_code(std::errc::io_error);
    }
    return error;
}

static bool WriteFill(std::ofstream &out, uint8 fillByte, uint64 count) {
    const std::vector<char> fill(static_cast<size_t>(std::min<uint64>(count, media::kDefaultChunkSize)),
                                 static_cast<char>(fillByte));
    while (count > 0 && out) {
        const size_t len = static_cast<size_t>(std::min<uint64>(count, fill.size()));
        out.write(fill.data(), static_cast<std::streamsize>(len));
        count -= len;
    }
    return static_cast<bool>(out);
}

bool ApplyRepair(const fs::path &path, const media::PaddingSpec &padding, bool createBackup, std::error_code &error) {
    error.clear();
    if (!fs::is_regular_file(path, error)) {
        if (!error) {
            error = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return false;
    }

    if (createBackup) {
        const fs::path backup = BackupPath(path);
        if (!fs::exists(backup, error)) {
            if (error || !fs::copy_file(path, backup, error)) {
                devlog::error<grp::apply>("Could not back up {}: {}", path.string(), error.message());
                return false;
            }
            devlog::info<grp::apply>("Backed up {} to {}", path.string(), backup.string());
        }
    }

    if (padding.prependSize > 0) {
        fs::path tmpPath = path;
        tmpPath += ".repair_tmp";
        util::ScopeGuard sgRemoveTmp{[&] {
            std::error_code removeError{};
            fs::remove(tmpPath, removeError);
        }};

        {
            std::ofstream out{tmpPath, std::ios::binary | std::ios::trunc};
            std::ifstream in{path, std::ios::binary};
            if (!out || !in) {
                error = LastIOError();
                return false;
            }
            if (!WriteFill(out, padding.fillByte, padding.prependSize)) {
                error = LastIOError();
                return false;
            }
            // operator<< on an empty file sets failbit without writing anything
            if (in.peek() != std::ifstream::traits_type::eof()) {
                out << in.rdbuf();
            }
            if (!WriteFill(out, padding.fillByte, padding.appendSize)) {
                error = LastIOError();
                return false;
            }
            out.flush();
            if (!out || in.bad()) {
                error = LastIOError();
                return false;
            }
        }

        fs::rename(tmpPath, path, error);
        if (error) {
            return false;
        }
        sgRemoveTmp.Cancel();
    } else if (padding.appendSize > 0) {
        std::ofstream out{path, std::ios::binary | std::ios::app};
        if (!out) {
            error = LastIOError();
            return false;
        }
        if (!WriteFill(out, padding.fillByte, padding.appendSize)) {
            error = LastIOError();
            return false;
        }
        out.flush();
        if (!out) {
            error = LastIOError();
            return false;
        }
    }

    devlog::info<grp::apply>("Repaired {}: added {} bytes", path.string(), padding.TotalSize());
    return true;
}

} // namespace romcat::repair
