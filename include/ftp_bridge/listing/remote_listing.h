/**
 * @file remote_listing.h
 * @brief Remote directory listing with MLSD and LIST fallback
 */

#ifndef FTP_BRIDGE_LISTING_REMOTE_LISTING_H
#define FTP_BRIDGE_LISTING_REMOTE_LISTING_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <ftp_bridge/core/types.h>
#include <ftp_bridge/ftp/ftp_session.h>
#include <ftp_bridge/listing/file_entry.h>

namespace ftp_bridge {

/**
 * @brief Which listing command produced a result
 */
enum class listing_source {
    mlsd,
    list
};

[[nodiscard]] constexpr auto to_string(listing_source source) -> const char* {
    switch (source) {
        case listing_source::mlsd: return "MLSD";
        case listing_source::list: return "LIST";
        default: return "unknown";
    }
}

struct remote_listing {
    std::vector<file_entry> entries;
    listing_source source = listing_source::mlsd;
};

/**
 * @brief List a remote directory
 *
 * MLSD is tried first. If it fails for any reason other than a dropped
 * link, LIST is tried and its output parsed (unix "ls -l" and DOS formats).
 * Unparsable lines are skipped. Entries keep the server's order and
 * include hidden names; callers answering a command filter those.
 *
 * @param path Directory to list; empty or "." lists the working directory
 * @return listing, or remote_list_error when both strategies fail
 */
[[nodiscard]] auto list_remote(ftp_session& session, const std::string& path)
    -> result<remote_listing>;

/**
 * @brief Parse one MLSD line ("fact=value;...; name")
 * @return entry, or nullopt for cdir/pdir and malformed lines
 */
[[nodiscard]] auto parse_mlsd_line(std::string_view line, const std::string& dir)
    -> std::optional<file_entry>;

/**
 * @brief Parse one LIST line in unix or DOS format
 */
[[nodiscard]] auto parse_list_line(std::string_view line, const std::string& dir)
    -> std::optional<file_entry>;

/**
 * @brief Convert an MLSD modify fact (YYYYMMDDHHMMSS[.sss]) to ISO-8601
 *
 * Values that do not match are returned unchanged.
 */
[[nodiscard]] auto mlsd_time_to_iso(std::string_view value) -> std::string;

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_LISTING_REMOTE_LISTING_H
