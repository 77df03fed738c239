#include <romcat/db/hash_index.hpp>

#include <romcat/util/dev_log.hpp>
#include <romcat/util/string_ops.hpp>

#include <algorithm>

namespace romcat::db {

namespace grp {

    struct index {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "HashIndex";
    };

} // namespace grp

std::string NormalizeSerial(std::string_view serial) {
    std::string result{};
    result.reserve(serial.size());
    for (char ch : serial) {
        if (ch == ' ' || ch == '-') {
            continue;
        }
        result += util::ToUpperAscii(ch);
    }
    return result;
}

HashIndex::HashIndex(std::vector<ReferenceRecord> records)
    : m_records(std::move(records)) {

    for (size_t i = 0; i < m_records.size(); ++i) {
        const ReferenceRecord &record = m_records[i];
        if (!record.expectedLength) {
            ++m_unsizedCount;
        }
        if (record.primaryHash && !record.primaryHash->empty()) {
            m_byPrimary.try_emplace(util::ToLower(*record.primaryHash), i);
        }
        if (record.secondaryHash && !record.secondaryHash->empty()) {
            m_bySecondary.try_emplace(util::ToLower(*record.secondaryHash), i);
        }
        if (record.serial) {
            for (std::string_view serial : util::SplitTrimmed(*record.serial, ',')) {
                std::string key = NormalizeSerial(serial);
                if (!key.empty()) {
                    m_bySerial.try_emplace(std::move(key), i);
                }
            }
        }
    }

    devlog::debug<grp::index>("Indexed {} records: {} primary hashes, {} secondary hashes, {} serials",
                              m_records.size(), m_byPrimary.size(), m_bySecondary.size(), m_bySerial.size());
}

const ReferenceRecord *HashIndex::Find(const std::unordered_map<std::string, size_t> &map,
                                       const std::string &key) const {
    if (auto it = map.find(key); it != map.end()) {
        return &m_records[it->second];
    }
    return nullptr;
}

const ReferenceRecord *HashIndex::LookupPrimary(std::string_view hash) const {
    return Find(m_byPrimary, util::ToLower(hash));
}

const ReferenceRecord *HashIndex::LookupSecondary(std::string_view hash) const {
    return Find(m_bySecondary, util::ToLower(hash));
}

const ReferenceRecord *HashIndex::LookupSerial(std::string_view serial) const {
    return Find(m_bySerial, NormalizeSerial(serial));
}

const ReferenceRecord *HashIndex::LookupDigests(const FileDigests &digests) const {
    if (const ReferenceRecord *record = LookupPrimary(ToString(digests.sha1))) {
        return record;
    }
    const ReferenceRecord *record = LookupSecondary(ToString(digests.crc32));
    if (record != nullptr && record->expectedLength && *record->expectedLength != digests.dataSize) {
        return nullptr;
    }
    return record;
}

std::vector<const ReferenceRecord *> HashIndex::CandidatesBySize(uint64 length) const {
    std::vector<const ReferenceRecord *> result{};
    for (const ReferenceRecord &record : m_records) {
        if (record.expectedLength == length) {
            result.push_back(&record);
        }
    }
    return result;
}

std::vector<uint64> HashIndex::ExpectedLengths() const {
    std::vector<uint64> result{};
    for (const ReferenceRecord &record : m_records) {
        if (record.expectedLength) {
            result.push_back(*record.expectedLength);
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

} // namespace romcat::db
