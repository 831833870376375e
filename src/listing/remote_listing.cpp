/**
 * @file remote_listing.cpp
 * @brief MLSD and LIST parsing
 */

#include <ftp_bridge/listing/remote_listing.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

#include <ftp_bridge/core/error_codes.h>
#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/core/path_utils.h>

namespace ftp_bridge {

namespace {

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto all_digits(std::string_view s) -> bool {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

/**
 * @brief Decimal size column; nullopt when it is not a number or overflows 64 bits
 */
auto parse_size(std::string_view s) -> std::optional<uint64_t> {
    if (!all_digits(s)) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

auto entry_path(const std::string& dir, const std::string& name) -> std::string {
    if (dir.empty() || dir == ".") {
        return name;
    }
    return path_utils::join(dir, name);
}

auto is_dot_entry(const std::string& name) -> bool {
    return name == "." || name == "..";
}

auto parse_unix_line(std::string_view line, const std::string& dir) -> std::optional<file_entry> {
    // perms links owner group size month day time-or-year name...
    std::size_t pos = 0;
    std::vector<std::string_view> tokens;
    std::size_t name_start = std::string_view::npos;
    while (pos < line.size() && tokens.size() < 8) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        auto start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        if (start < pos) {
            tokens.push_back(line.substr(start, pos - start));
        }
    }
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    if (tokens.size() < 8 || pos >= line.size()) {
        return std::nullopt;
    }
    name_start = pos;

    const char kind = tokens[0].empty() ? '?' : tokens[0].front();
    if (std::string_view("-dlcbps").find(kind) == std::string_view::npos) {
        return std::nullopt;
    }

    std::string name(line.substr(name_start));
    if (kind == 'l') {
        auto arrow = name.find(" -> ");
        if (arrow != std::string::npos) {
            name.erase(arrow);
        }
    }
    if (name.empty() || is_dot_entry(name)) {
        return std::nullopt;
    }

    file_entry entry;
    entry.name = name;
    entry.path = entry_path(dir, name);
    entry.is_directory = kind == 'd';
    entry.size = parse_size(tokens[4]);
    entry.modified_text =
        std::string(tokens[5]) + " " + std::string(tokens[6]) + " " + std::string(tokens[7]);
    return entry;
}

auto dos_pattern() -> const std::regex& {
    static const std::regex pattern(
        R"(^\s*(\d{2}-\d{2}-\d{2,4})\s+(\d{1,2}:\d{2}\s*[AaPp][Mm])\s+(<DIR>|\d+)\s+(.+)$)");
    return pattern;
}

auto parse_dos_line(std::string_view line, const std::string& dir) -> std::optional<file_entry> {
    std::string text(line);
    std::smatch match;
    if (!std::regex_match(text, match, dos_pattern())) {
        return std::nullopt;
    }

    std::string name = match[4].str();
    if (is_dot_entry(name)) {
        return std::nullopt;
    }

    file_entry entry;
    entry.name = name;
    entry.path = entry_path(dir, name);
    entry.is_directory = match[3].str() == "<DIR>";
    if (!entry.is_directory) {
        entry.size = parse_size(match[3].str());
    }
    entry.modified_text = match[1].str() + " " + match[2].str();
    return entry;
}

template <typename Parser>
auto parse_lines(const std::vector<std::string>& lines, const std::string& dir, Parser parser)
    -> std::vector<file_entry> {
    std::vector<file_entry> entries;
    entries.reserve(lines.size());
    for (const auto& line : lines) {
        if (auto entry = parser(line, dir)) {
            entries.push_back(std::move(*entry));
        } else {
            FB_LOG_TRACE(log_category::listing, "Skipping unparsable listing line: " + line);
        }
    }
    return entries;
}

}  // namespace

auto mlsd_time_to_iso(std::string_view value) -> std::string {
    auto digits = value.substr(0, std::min<std::size_t>(value.size(), 14));
    auto rest = value.substr(digits.size());
    bool fraction_ok = rest.empty() || (rest.front() == '.' && all_digits(rest.substr(1)));
    if (digits.size() != 14 || !all_digits(digits) || !fraction_ok) {
        return std::string(value);
    }

    std::string iso;
    iso.reserve(19);
    iso.append(digits.substr(0, 4)).append("-");
    iso.append(digits.substr(4, 2)).append("-");
    iso.append(digits.substr(6, 2)).append("T");
    iso.append(digits.substr(8, 2)).append(":");
    iso.append(digits.substr(10, 2)).append(":");
    iso.append(digits.substr(12, 2));
    return iso;
}

auto parse_mlsd_line(std::string_view line, const std::string& dir) -> std::optional<file_entry> {
    auto space = line.find(' ');
    if (space == std::string_view::npos || space + 1 >= line.size()) {
        return std::nullopt;
    }
    auto facts = line.substr(0, space);
    std::string name(line.substr(space + 1));
    if (name.empty() || is_dot_entry(name)) {
        return std::nullopt;
    }

    file_entry entry;
    entry.name = name;
    entry.path = entry_path(dir, name);

    std::size_t start = 0;
    while (start < facts.size()) {
        auto end = facts.find(';', start);
        if (end == std::string_view::npos) {
            end = facts.size();
        }
        auto fact = facts.substr(start, end - start);
        start = end + 1;

        auto eq = fact.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        auto key = to_lower(fact.substr(0, eq));
        auto value = fact.substr(eq + 1);

        if (key == "type") {
            auto type = to_lower(value);
            if (type == "cdir" || type == "pdir") {
                return std::nullopt;
            }
            entry.is_directory = type == "dir";
        } else if (key == "size") {
            entry.size = parse_size(value);
        } else if (key == "modify") {
            entry.modified_text = mlsd_time_to_iso(value);
        }
    }
    return entry;
}

auto parse_list_line(std::string_view line, const std::string& dir) -> std::optional<file_entry> {
    if (auto entry = parse_unix_line(line, dir)) {
        return entry;
    }
    return parse_dos_line(line, dir);
}

auto list_remote(ftp_session& session, const std::string& path) -> result<remote_listing> {
    auto dir = path_utils::normalize(path);
    auto target = dir.empty() ? std::string(".") : dir;

    auto mlsd_lines = session.mlsd(target);
    if (mlsd_lines) {
        remote_listing listing;
        listing.source = listing_source::mlsd;
        listing.entries = parse_lines(mlsd_lines.value(), dir, parse_mlsd_line);
        return listing;
    }

    if (is_transient(mlsd_lines.error().code)) {
        return unexpected{error{error_code::remote_list_error,
                                "Listing " + target + " failed: " + mlsd_lines.error().message}};
    }

    FB_LOG_DEBUG(log_category::listing,
                 "MLSD " + target + " unavailable (" + mlsd_lines.error().message +
                     "), falling back to LIST");

    auto list_lines = session.list(target);
    if (!list_lines) {
        return unexpected{error{error_code::remote_list_error,
                                "Listing " + target + " failed: MLSD: " +
                                    mlsd_lines.error().message +
                                    "; LIST: " + list_lines.error().message}};
    }

    remote_listing listing;
    listing.source = listing_source::list;
    listing.entries = parse_lines(list_lines.value(), dir, parse_list_line);
    return listing;
}

}  // namespace ftp_bridge
