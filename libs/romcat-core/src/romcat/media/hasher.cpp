#include <romcat/media/hasher.hpp>

#include <romcat/util/dev_log.hpp>

#include <openssl/evp.h>
#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <istream>
#include <limits>
#include <vector>

namespace romcat::media {

namespace grp {

    struct hasher {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Hasher";
    };

} // namespace grp

using EVPContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

struct Hasher::Impl {
    Impl()
        : sha1(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
        , md5(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {

        crc = ::crc32(0L, Z_NULL, 0);
        if (!sha1 || !md5) {
            initError = std::make_error_code(std::errc::not_enough_memory);
            return;
        }
        if (EVP_DigestInit_ex(sha1.get(), EVP_sha1(), nullptr) != 1 ||
            EVP_DigestInit_ex(md5.get(), EVP_md5(), nullptr) != 1) {
            devlog::error<grp::hasher>("Could not initialize digest contexts");
            initError = std::make_error_code(std::errc::not_supported);
        }
    }

    uLong crc;
    EVPContext sha1;
    EVPContext md5;
    uint64 dataSize = 0;
    std::error_code initError{};
    bool finished = false;
};

Hasher::Hasher()
    : m_impl(std::make_unique<Impl>()) {}

Hasher::~Hasher() = default;

bool Hasher::Update(std::span<const uint8> data, std::error_code &error) {
    error.clear();
    if (m_impl->initError) {
        error = m_impl->initError;
        return false;
    }
    if (m_impl->finished) {
        error = std::make_error_code(std::errc::operation_not_permitted);
        return false;
    }

    // zlib takes 32-bit lengths
    static constexpr size_t kMaxBlock = std::numeric_limits<uInt>::max();
    for (size_t offset = 0; offset < data.size(); offset += kMaxBlock) {
        const auto block = data.subspan(offset, std::min(kMaxBlock, data.size() - offset));
        m_impl->crc = ::crc32(m_impl->crc, block.data(), static_cast<uInt>(block.size()));
    }

    if (EVP_DigestUpdate(m_impl->sha1.get(), data.data(), data.size()) != 1 ||
        EVP_DigestUpdate(m_impl->md5.get(), data.data(), data.size()) != 1) {
        error = std::make_error_code(std::errc::io_error);
        return false;
    }
    m_impl->dataSize += data.size();
    return true;
}

bool Hasher::UpdateFill(uint8 fillByte, uint64 count, size_t chunkSize, std::error_code &error) {
    error.clear();
    if (count == 0) {
        return true;
    }
    chunkSize = std::max<size_t>(chunkSize, 1);
    const std::vector<uint8> fill(static_cast<size_t>(std::min<uint64>(count, chunkSize)), fillByte);
    while (count > 0) {
        const size_t len = static_cast<size_t>(std::min<uint64>(count, fill.size()));
        if (!Update(std::span{fill}.first(len), error)) {
            return false;
        }
        count -= len;
    }
    return true;
}

std::optional<FileDigests> Hasher::Finish(std::error_code &error) {
    error.clear();
    if (m_impl->initError) {
        error = m_impl->initError;
        return std::nullopt;
    }
    if (m_impl->finished) {
        error = std::make_error_code(std::errc::operation_not_permitted);
        return std::nullopt;
    }
    m_impl->finished = true;

    FileDigests digests{};
    digests.crc32 = static_cast<uint32>(m_impl->crc);
    digests.dataSize = m_impl->dataSize;

    unsigned int sha1Len = 0;
    unsigned int md5Len = 0;
    if (EVP_DigestFinal_ex(m_impl->sha1.get(), digests.sha1.data(), &sha1Len) != 1 ||
        EVP_DigestFinal_ex(m_impl->md5.get(), digests.md5.data(), &md5Len) != 1 ||
        sha1Len != digests.sha1.size() || md5Len != digests.md5.size()) {
        error = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    return digests;
}

std::optional<FileDigests> HashBuffer(std::span<const uint8> data, const PaddingSpec &padding,
                                      std::error_code &error) {
    Hasher hasher{};
    if (!hasher.UpdateFill(padding.fillByte, padding.prependSize, kDefaultChunkSize, error)) {
        return std::nullopt;
    }
    if (!hasher.Update(data, error)) {
        return std::nullopt;
    }
    if (!hasher.UpdateFill(padding.fillByte, padding.appendSize, kDefaultChunkSize, error)) {
        return std::nullopt;
    }
    return hasher.Finish(error);
}

std::optional<FileDigests> HashStream(std::istream &in, uint64 skip, const PaddingSpec &padding, size_t chunkSize,
                                      std::error_code &error) {
    error.clear();
    chunkSize = std::max<size_t>(chunkSize, 1);

    if (skip > 0) {
        in.ignore(static_cast<std::streamsize>(skip));
        if (in.bad()) {
            error = std::make_error_code(std::errc::io_error);
            return std::nullopt;
        }
    }

    Hasher hasher{};
    if (!hasher.UpdateFill(padding.fillByte, padding.prependSize, chunkSize, error)) {
        return std::nullopt;
    }

    std::vector<uint8> buffer(chunkSize);
    while (in) {
        in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (in.bad()) {
            devlog::debug<grp::hasher>("Stream read failed");
            error = std::make_error_code(std::errc::io_error);
            return std::nullopt;
        }
        const auto count = static_cast<size_t>(in.gcount());
        if (count == 0) {
            break;
        }
        if (!hasher.Update(std::span{buffer}.first(count), error)) {
            return std::nullopt;
        }
    }

    if (!hasher.UpdateFill(padding.fillByte, padding.appendSize, chunkSize, error)) {
        return std::nullopt;
    }
    return hasher.Finish(error);
}

std::optional<FileDigests> HashFile(const std::filesystem::path &path, uint64 skip, const PaddingSpec &padding,
                                    size_t chunkSize, std::error_code &error) {
    error.clear();
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        error = std::error_code{errno, std::generic_category()};
        if (!error) {
            error = std::make_error_code(std::errc::io_error);
        }
        devlog::debug<grp::hasher>("Could not open {}: {}", path.string(), error.message());
        return std::nullopt;
    }
    return HashStream(in, skip, padding, chunkSize, error);
}

} // namespace romcat::media
