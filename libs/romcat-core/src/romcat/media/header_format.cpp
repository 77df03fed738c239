#include <romcat/media/header_format.hpp>

#include <romcat/util/string_ops.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>

namespace romcat::media {

static bool HasSignature(std::span<const uint8> head, size_t offset, std::string_view signature) {
    if (head.size() < offset + signature.size()) {
        return false;
    }
    return std::equal(signature.begin(), signature.end(), head.begin() + offset,
                      [](char a, uint8 b) { return static_cast<uint8>(a) == b; });
}

uint64 DeriveHeaderSkip(HeaderFormat format, std::span<const uint8> head, uint64 fileSize) {
    using namespace std::string_view_literals;

    uint64 skip = 0;
    switch (format) {
    case HeaderFormat::None: break;
    case HeaderFormat::INES: skip = HasSignature(head, 0, "NES\x1A"sv) ? 16 : 0; break;
    case HeaderFormat::FDS: skip = HasSignature(head, 0, "FDS\x1A"sv) ? 16 : 0; break;
    case HeaderFormat::SNESCopier: skip = fileSize % 1024 == 512 ? 512 : 0; break;
    case HeaderFormat::AtariLynx: skip = HasSignature(head, 0, "LYNX"sv) ? 64 : 0; break;
    case HeaderFormat::Atari7800: skip = HasSignature(head, 1, "ATARI7800"sv) ? 128 : 0; break;
    }
    return std::min(skip, fileSize);
}

uint64 DeriveHeaderSkip(HeaderFormat format, const std::filesystem::path &path, std::error_code &error) {
    error.clear();
    if (format == HeaderFormat::None) {
        return 0;
    }

    const uint64 fileSize = std::filesystem::file_size(path, error);
    if (error) {
        return 0;
    }

    std::ifstream in{path, std::ios::binary};
    if (!in) {
        error.assign(errno != 0 ? errno : EIO, std::generic_category());
        return 0;
    }

    std::array<uint8, kHeaderProbeSize> head{};
    in.read(reinterpret_cast<char *>(head.data()), head.size());
    const auto count = static_cast<size_t>(in.gcount());
    if (in.bad()) {
        error.assign(EIO, std::generic_category());
        return 0;
    }
    return DeriveHeaderSkip(format, std::span<const uint8>{head.data(), count}, fileSize);
}

std::string_view ToString(HeaderFormat format) {
    switch (format) {
    case HeaderFormat::None: return "none";
    case HeaderFormat::INES: return "ines";
    case HeaderFormat::FDS: return "fds";
    case HeaderFormat::SNESCopier: return "snes-copier";
    case HeaderFormat::AtariLynx: return "lynx";
    case HeaderFormat::Atari7800: return "a78";
    }
    return "none";
}

std::optional<HeaderFormat> ParseHeaderFormat(std::string_view str) {
    static constexpr HeaderFormat kFormats[] = {HeaderFormat::None,       HeaderFormat::INES,      HeaderFormat::FDS,
                                                HeaderFormat::SNESCopier, HeaderFormat::AtariLynx, HeaderFormat::Atari7800};
    for (HeaderFormat format : kFormats) {
        if (util::EqualsIgnoreCase(ToString(format), str)) {
            return format;
        }
    }
    return std::nullopt;
}

} // namespace romcat::media
