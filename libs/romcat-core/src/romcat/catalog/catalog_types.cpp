#include <romcat/catalog/catalog_types.hpp>

#include <romcat/util/string_ops.hpp>

namespace romcat::catalog {

std::string_view ToString(MediaType type) {
    switch (type) {
    case MediaType::Cartridge: return "cartridge";
    case MediaType::Disc: return "disc";
    case MediaType::Card: return "card";
    case MediaType::Digital: return "digital";
    }
    return "cartridge";
}

std::string_view ToString(PlatformRelationship rel) {
    switch (rel) {
    case PlatformRelationship::RegionalVariant: return "regional_variant";
    case PlatformRelationship::Successor: return "successor";
    case PlatformRelationship::Addon: return "addon";
    case PlatformRelationship::Compatible: return "compatible";
    }
    return "regional_variant";
}

std::string_view ToString(MediaStatus status) {
    switch (status) {
    case MediaStatus::Verified: return "verified";
    case MediaStatus::Bad: return "bad";
    case MediaStatus::Overdump: return "overdump";
    case MediaStatus::Prototype: return "prototype";
    case MediaStatus::Beta: return "beta";
    case MediaStatus::Sample: return "sample";
    }
    return "verified";
}

std::string_view ToString(EntityType type) {
    switch (type) {
    case EntityType::Work: return "work";
    case EntityType::Release: return "release";
    case EntityType::Media: return "media";
    }
    return "release";
}

std::optional<MediaType> ParseMediaType(std::string_view str) {
    const std::string lower = util::ToLower(str);
    if (lower == "cartridge") {
        return MediaType::Cartridge;
    } else if (lower == "disc") {
        return MediaType::Disc;
    } else if (lower == "card") {
        return MediaType::Card;
    } else if (lower == "digital") {
        return MediaType::Digital;
    }
    return std::nullopt;
}

std::optional<PlatformRelationship> ParsePlatformRelationship(std::string_view str) {
    const std::string lower = util::ToLower(str);
    if (lower == "regional_variant") {
        return PlatformRelationship::RegionalVariant;
    } else if (lower == "successor") {
        return PlatformRelationship::Successor;
    } else if (lower == "addon") {
        return PlatformRelationship::Addon;
    } else if (lower == "compatible") {
        return PlatformRelationship::Compatible;
    }
    return std::nullopt;
}

std::optional<EntityType> ParseEntityType(std::string_view str) {
    const std::string lower = util::ToLower(str);
    if (lower == "work") {
        return EntityType::Work;
    } else if (lower == "release") {
        return EntityType::Release;
    } else if (lower == "media") {
        return EntityType::Media;
    }
    return std::nullopt;
}

MediaStatus ParseMediaStatus(std::string_view str) {
    const std::string lower = util::ToLower(str);
    if (lower == "bad") {
        return MediaStatus::Bad;
    } else if (lower == "overdump") {
        return MediaStatus::Overdump;
    } else if (lower == "prototype" || lower == "proto") {
        return MediaStatus::Prototype;
    } else if (lower == "beta") {
        return MediaStatus::Beta;
    } else if (lower == "sample") {
        return MediaStatus::Sample;
    }
    return MediaStatus::Verified;
}

} // namespace romcat::catalog
