/**
 * @file path_utils.h
 * @brief Remote path helpers shared by listing, engine and dispatcher
 */

#ifndef FTP_BRIDGE_CORE_PATH_UTILS_H
#define FTP_BRIDGE_CORE_PATH_UTILS_H

#include <string>
#include <string_view>

namespace ftp_bridge::path_utils {

/**
 * @brief Normalize a slash-separated path
 *
 * Backslashes become '/', runs of '/' collapse to one and a trailing '/' is
 * dropped unless the whole path is "/". An empty input stays empty.
 */
[[nodiscard]] auto normalize(std::string_view path) -> std::string;

/**
 * @brief Join a directory and a child name with exactly one separator
 *
 * An empty or "." directory yields the bare name.
 */
[[nodiscard]] auto join(std::string_view dir, std::string_view name) -> std::string;

/**
 * @brief Parent of a normalized path ("" for a bare name, "/" for "/x")
 */
[[nodiscard]] auto parent(std::string_view path) -> std::string;

/**
 * @brief Last component of a normalized path
 */
[[nodiscard]] auto basename(std::string_view path) -> std::string;

/**
 * @brief Check if the raw path names a directory target ("/" or trailing '/')
 */
[[nodiscard]] auto is_directory_like(std::string_view raw_path) -> bool;

[[nodiscard]] auto is_absolute(std::string_view path) -> bool;

}  // namespace ftp_bridge::path_utils

#endif  // FTP_BRIDGE_CORE_PATH_UTILS_H
