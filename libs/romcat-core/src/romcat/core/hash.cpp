#include <romcat/core/hash.hpp>

#include <fmt/format.h>

#include <span>

namespace romcat {

static std::string ToHexString(std::span<const uint8> bytes) {
    fmt::memory_buffer buf{};
    auto inserter = std::back_inserter(buf);
    for (uint8 b : bytes) {
        fmt::format_to(inserter, "{:02x}", b);
    }
    return fmt::to_string(buf);
}

std::string ToString(uint32 crc32) {
    return fmt::format("{:08x}", crc32);
}

std::string ToString(const SHA1Hash &hash) {
    return ToHexString(hash);
}

std::string ToString(const MD5Hash &hash) {
    return ToHexString(hash);
}

} // namespace romcat
