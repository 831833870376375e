/**
 * @file local_listing.h
 * @brief Lists a directory on the bridge host
 */

#ifndef FTP_BRIDGE_LISTING_LOCAL_LISTING_H
#define FTP_BRIDGE_LISTING_LOCAL_LISTING_H

#include <filesystem>
#include <vector>

#include <ftp_bridge/core/types.h>
#include <ftp_bridge/listing/file_entry.h>

namespace ftp_bridge {

/**
 * @brief List the immediate children of a local directory
 *
 * Directories report size 0, files their exact byte size, and both their
 * last write time in epoch seconds. Entries are sorted by name because the
 * filesystem gives no stable order.
 *
 * @return entries, path_not_found if @p dir does not exist or is not a
 *         directory, permission_denied if it cannot be opened
 */
[[nodiscard]] auto list_local(const std::filesystem::path& dir)
    -> result<std::vector<file_entry>>;

/**
 * @brief Convert a filesystem timestamp to unix seconds
 */
[[nodiscard]] auto to_epoch_seconds(std::filesystem::file_time_type time) -> int64_t;

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_LISTING_LOCAL_LISTING_H
