/**
 * @file local_listing.cpp
 * @brief Local directory listing
 */

#include <ftp_bridge/listing/local_listing.h>

#include <algorithm>
#include <chrono>
#include <system_error>

#include <ftp_bridge/core/logging.h>

namespace ftp_bridge {

auto to_epoch_seconds(std::filesystem::file_time_type time) -> int64_t {
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - std::filesystem::file_time_type::clock::now() +
        std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sctp.time_since_epoch()).count();
}

auto list_local(const std::filesystem::path& dir) -> result<std::vector<file_entry>> {
    std::error_code ec;
    const auto status = std::filesystem::status(dir, ec);
    if (ec == std::errc::permission_denied) {
        return unexpected{error{error_code::permission_denied,
                                "Permission denied: " + dir.string()}};
    }
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        return unexpected{error{error_code::local_io_error,
                                "Cannot stat " + dir.string() + ": " + ec.message()}};
    }
    if (!std::filesystem::exists(status)) {
        return unexpected{error{error_code::path_not_found,
                                "Directory not found: " + dir.string()}};
    }
    if (!std::filesystem::is_directory(status)) {
        return unexpected{error{error_code::path_not_found,
                                "Not a directory: " + dir.string()}};
    }

    ec.clear();
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::permission_denied) {
            return unexpected{error{error_code::permission_denied,
                                    "Permission denied: " + dir.string()}};
        }
        return unexpected{error{error_code::local_io_error,
                                "Cannot open directory " + dir.string() + ": " + ec.message()}};
    }

    std::vector<file_entry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& de = *it;

        file_entry entry;
        entry.name = de.path().filename().string();
        entry.path = de.path().string();

        std::error_code entry_ec;
        entry.is_directory = de.is_directory(entry_ec);
        if (entry.is_directory) {
            entry.size = 0;
        } else {
            auto size = de.file_size(entry_ec);
            entry.size = entry_ec ? 0 : size;
        }

        entry_ec.clear();
        auto last_write = de.last_write_time(entry_ec);
        entry.modified_epoch = entry_ec ? 0 : to_epoch_seconds(last_write);

        entries.push_back(std::move(entry));
    }

    if (ec) {
        FB_LOG_WARN(log_category::listing,
                    "Local listing of " + dir.string() + " stopped early: " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const file_entry& a, const file_entry& b) { return a.name < b.name; });
    return entries;
}

}  // namespace ftp_bridge
