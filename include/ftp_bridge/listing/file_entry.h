/**
 * @file file_entry.h
 * @brief Normalized file-tree entry shared by local and remote listings
 */

#ifndef FTP_BRIDGE_LISTING_FILE_ENTRY_H
#define FTP_BRIDGE_LISTING_FILE_ENTRY_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace ftp_bridge {

/**
 * @brief Which wire shape an entry is serialized into
 *
 * Local listings use {name, is_dir, size, modified(epoch)}; remote
 * listings use {name, path, type, size, mtime(string)}.
 */
enum class entry_format {
    local,
    remote
};

/**
 * @brief One listed file or directory
 */
struct file_entry {
    std::string name;
    std::string path;
    bool is_directory = false;
    std::optional<uint64_t> size;
    std::optional<int64_t> modified_epoch;  ///< local listings
    std::string modified_text;              ///< remote listings, ISO or raw LIST date

    [[nodiscard]] auto is_hidden() const -> bool {
        return !name.empty() && name.front() == '.';
    }
};

/**
 * @brief Serialize one entry in the requested wire shape
 */
[[nodiscard]] auto to_json(const file_entry& entry, entry_format format) -> Json::Value;

/**
 * @brief Serialize a sequence of entries, keeping their order
 */
[[nodiscard]] auto to_json(const std::vector<file_entry>& entries, entry_format format)
    -> Json::Value;

/**
 * @brief Drop dot-prefixed names
 */
[[nodiscard]] auto without_hidden(std::vector<file_entry> entries) -> std::vector<file_entry>;

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_LISTING_FILE_ENTRY_H
