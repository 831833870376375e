/**
 * @file file_entry.cpp
 * @brief File-tree entry serialization
 */

#include <ftp_bridge/listing/file_entry.h>

#include <algorithm>

namespace ftp_bridge {

auto to_json(const file_entry& entry, entry_format format) -> Json::Value {
    Json::Value out(Json::objectValue);
    out["name"] = entry.name;
    if (format == entry_format::local) {
        out["is_dir"] = entry.is_directory;
        out["size"] = static_cast<Json::UInt64>(entry.size.value_or(0));
        out["modified"] = static_cast<Json::Int64>(entry.modified_epoch.value_or(0));
        return out;
    }

    out["path"] = entry.path;
    out["type"] = entry.is_directory ? "directory" : "file";
    out["size"] = entry.size ? Json::Value(static_cast<Json::UInt64>(*entry.size)) : Json::Value();
    out["mtime"] = entry.modified_text;
    return out;
}

auto to_json(const std::vector<file_entry>& entries, entry_format format) -> Json::Value {
    Json::Value out(Json::arrayValue);
    for (const auto& e : entries) {
        out.append(to_json(e, format));
    }
    return out;
}

auto without_hidden(std::vector<file_entry> entries) -> std::vector<file_entry> {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const file_entry& e) { return e.is_hidden(); }),
                  entries.end());
    return entries;
}

}  // namespace ftp_bridge
