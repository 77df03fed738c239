#include <romcat/catalog/name_parser.hpp>

#include <romcat/util/string_ops.hpp>

#include <algorithm>
#include <array>
#include <charconv>

namespace romcat::catalog {

// Region names recognized in parenthesised tags
static constexpr std::array<std::string_view, 41> kKnownRegions = {
    "USA",          "Japan",          "Europe",      "World",       "Australia",   "Korea",        "China",
    "Taiwan",       "Brazil",         "France",      "Germany",     "Spain",       "Italy",        "Netherlands",
    "Sweden",       "Norway",         "Denmark",     "Finland",     "Portugal",    "Russia",       "Hong Kong",
    "Asia",         "Canada",         "Mexico",      "Argentina",   "Chile",       "Colombia",     "India",
    "South Africa", "United Kingdom", "New Zealand", "Poland",      "Czech Republic", "Hungary",  "Greece",
    "Turkey",       "Israel",         "Saudi Arabia", "UAE",        "Scandinavia", "Latin America",
};

struct RegionAlias {
    std::string_view alias;
    std::string_view slug;
};

// Alternate spellings and abbreviations; all keys are lowercase
static constexpr RegionAlias kRegionAliases[] = {
    {"us", "usa"},           {"united states", "usa"},   {"jp", "japan"},
    {"jpn", "japan"},         {"eu", "europe"},        {"eur", "europe"},          {"wld", "world"},
    {"aus", "australia"},     {"kor", "korea"},        {"kr", "korea"},            {"chn", "china"},
    {"cn", "china"},          {"twn", "taiwan"},       {"tw", "taiwan"},           {"bra", "brazil"},
    {"br", "brazil"},         {"fra", "france"},       {"fr", "france"},           {"ger", "germany"},
    {"de", "germany"},        {"deu", "germany"},      {"esp", "spain"},           {"es", "spain"},
    {"ita", "italy"},         {"it", "italy"},         {"ned", "netherlands"},     {"nl", "netherlands"},
    {"nld", "netherlands"},   {"holland", "netherlands"}, {"swe", "sweden"},       {"se", "sweden"},
    {"nor", "norway"},        {"no", "norway"},        {"den", "denmark"},         {"dk", "denmark"},
    {"dnk", "denmark"},       {"fin", "finland"},      {"fi", "finland"},          {"por", "portugal"},
    {"pt", "portugal"},       {"prt", "portugal"},     {"rus", "russia"},          {"ru", "russia"},
    {"hk", "hong-kong"},      {"hkg", "hong-kong"},    {"can", "canada"},          {"ca", "canada"},
    {"uk", "united-kingdom"}, {"gb", "united-kingdom"}, {"gbr", "united-kingdom"},
};

// -----------------------------------------------------------------------------
// Tag extraction

namespace {

    struct Tag {
        bool bracket;
        std::string_view content;
    };

    struct TitleAndTags {
        std::string_view title;
        std::vector<Tag> tags;
    };

} // namespace

static TitleAndTags ExtractTitleAndTags(std::string_view name) {
    TitleAndTags result{};
    size_t titleEnd = std::string_view::npos;

    size_t pos = 0;
    while (pos < name.size()) {
        const char ch = name[pos];
        if (ch != '(' && ch != '[') {
            ++pos;
            continue;
        }
        const char open = ch;
        const char close = ch == '(' ? ')' : ']';
        if (titleEnd == std::string_view::npos) {
            titleEnd = pos;
        }

        // Find the matching close character, keeping nested groups intact
        uint32 depth = 1;
        const size_t start = pos + 1;
        size_t end = name.size();
        for (size_t i = start; i < name.size(); ++i) {
            if (name[i] == open) {
                ++depth;
            } else if (name[i] == close && --depth == 0) {
                end = i;
                break;
            }
        }

        const std::string_view content = util::Trim(name.substr(start, end - start));
        if (!content.empty()) {
            result.tags.push_back({.bracket = open == '[', .content = content});
        }
        pos = end + 1;
    }

    result.title = util::Trim(name.substr(0, titleEnd));
    return result;
}

// -----------------------------------------------------------------------------
// Tag classification

static bool IsKnownRegion(std::string_view str) {
    return std::any_of(kKnownRegions.begin(), kKnownRegions.end(),
                       [&](std::string_view region) { return util::EqualsIgnoreCase(region, str); });
}

bool IsRegionList(std::string_view str) {
    const auto parts = util::SplitTrimmed(str, ',');
    return std::all_of(parts.begin(), parts.end(), [](std::string_view part) { return IsKnownRegion(part); });
}

// "Rev A", "Rev 1", "Rev 1A"
static bool IsRevision(std::string_view str) {
    if (!str.starts_with("Rev ")) {
        return false;
    }
    const std::string_view token = str.substr(4);
    return !token.empty() && std::all_of(token.begin(), token.end(), [](char ch) { return util::IsAsciiAlnum(ch); });
}

// "v1.0", "v1.1a", "V2"
static bool IsVersion(std::string_view str) {
    return str.size() > 1 && (str[0] == 'v' || str[0] == 'V') && util::IsAsciiDigit(str[1]);
}

// "En,Fr,De"
static bool IsLanguageList(std::string_view str) {
    const auto parts = util::SplitTrimmed(str, ',');
    if (parts.size() < 2) {
        return false;
    }
    return std::all_of(parts.begin(), parts.end(), [](std::string_view part) {
        return part.size() >= 2 && part.size() <= 3 && util::IsAsciiUpper(part[0]) &&
               std::all_of(part.begin() + 1, part.end(), [](char ch) { return util::IsAsciiLower(ch); });
    });
}

// "Disc 1", "Disc 2 - Claire"
static bool ParseDiscSpec(std::string_view str, ParsedName &result) {
    if (!str.starts_with("Disc ")) {
        return false;
    }
    std::string_view rest = str.substr(5);
    std::string_view label{};
    if (const size_t sep = rest.find(" - "); sep != std::string_view::npos) {
        label = util::Trim(rest.substr(sep + 3));
        rest = rest.substr(0, sep);
    }
    rest = util::Trim(rest);

    uint32 number = 0;
    const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), number);
    if (ec != std::errc{} || ptr != rest.data() + rest.size()) {
        return false;
    }
    result.discNumber = number;
    if (!label.empty()) {
        result.discLabel = std::string{label};
    }
    return true;
}

static void ClassifyParenTag(std::string_view content, ParsedName &result) {
    if (IsRegionList(content)) {
        for (std::string_view part : util::SplitTrimmed(content, ',')) {
            if (std::find(result.regions.begin(), result.regions.end(), part) == result.regions.end()) {
                result.regions.emplace_back(part);
            }
        }
        return;
    }
    if (IsRevision(content)) {
        result.revision = std::string{content};
        return;
    }
    if (IsVersion(content)) {
        result.version = std::string{content};
        return;
    }
    if (ParseDiscSpec(content, result)) {
        return;
    }
    if (IsLanguageList(content)) {
        for (std::string_view lang : util::SplitTrimmed(content, ',')) {
            result.languages.emplace_back(lang);
        }
        return;
    }
    result.flags.emplace_back(content);
}

static void ClassifyBracketTag(std::string_view content, ParsedName &result) {
    if (content == "!") {
        result.dumpStatus = DumpStatus::Verified;
    } else if (content == "b") {
        result.dumpStatus = DumpStatus::BadDump;
    } else if (content == "o") {
        result.dumpStatus = DumpStatus::Overdump;
    } else {
        result.flags.push_back(std::string{"["}.append(content).append("]"));
    }
}

// -----------------------------------------------------------------------------
// Public API

bool ParsedName::HasFlag(std::string_view flag) const {
    return std::any_of(flags.begin(), flags.end(), [&](const std::string &f) { return util::EqualsIgnoreCase(f, flag); });
}

ParsedName ParseName(std::string_view name) {
    auto [title, tags] = ExtractTitleAndTags(name);

    ParsedName result{};
    result.title = std::string{title};
    for (const Tag &tag : tags) {
        if (tag.bracket) {
            ClassifyBracketTag(tag.content, result);
        } else {
            ClassifyParenTag(tag.content, result);
        }
    }
    return result;
}

std::string Slugify(std::string_view text) {
    std::string slug{};
    bool pendingHyphen = false;
    for (char ch : text) {
        if (util::IsAsciiAlnum(ch)) {
            if (pendingHyphen && !slug.empty()) {
                slug.push_back('-');
            }
            pendingHyphen = false;
            slug.push_back(util::ToLowerAscii(ch));
        } else {
            pendingHyphen = true;
        }
    }
    return slug;
}

std::string RegionToSlug(std::string_view region) {
    const std::string lower = util::ToLower(util::Trim(region));
    for (const RegionAlias &alias : kRegionAliases) {
        if (alias.alias == lower) {
            return std::string{alias.slug};
        }
    }
    std::string slug = Slugify(lower);
    if (slug.empty()) {
        return "unknown";
    }
    return slug;
}

// Moves a trailing article of a title segment to the front: "Legend of Zelda, The" -> "The Legend of Zelda"
static std::string MoveTrailingArticle(std::string_view segment) {
    static constexpr std::string_view kArticles[] = {", The", ", A", ", An"};
    for (std::string_view article : kArticles) {
        if (segment.size() > article.size() && segment.ends_with(article)) {
            std::string out{article.substr(2)};
            out.push_back(' ');
            out.append(segment.substr(0, segment.size() - article.size()));
            return out;
        }
    }
    return std::string{segment};
}

std::string NormalizeTitleKey(std::string_view title) {
    const std::string_view stripped = ExtractTitleAndTags(title).title;

    // The article may close the main title ahead of a subtitle: "Legend of Zelda, The - Ocarina of Time"
    std::string reordered{};
    if (const size_t sep = stripped.find(" - "); sep != std::string_view::npos) {
        reordered = MoveTrailingArticle(stripped.substr(0, sep));
        reordered.append(stripped.substr(sep));
    } else {
        reordered = MoveTrailingArticle(stripped);
    }

    std::string key{};
    key.reserve(reordered.size());
    for (char ch : reordered) {
        // Bytes of UTF-8 sequences are kept as they are
        if (static_cast<uint8>(ch) >= 0x80) {
            key.push_back(ch);
        } else if (util::IsAsciiAlnum(ch)) {
            key.push_back(util::ToLowerAscii(ch));
        }
    }
    return key;
}

} // namespace romcat::catalog
