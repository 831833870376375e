/**
 * @file transfer_types.cpp
 * @brief Progress record serialization and tracking
 */

#include <ftp_bridge/engine/transfer_types.h>

#include <algorithm>

namespace ftp_bridge {

auto to_json(const progress_record& record) -> Json::Value {
    Json::Value out(Json::objectValue);
    out["file"] = record.file;
    out["bytes_sent"] = static_cast<Json::UInt64>(record.bytes_sent);
    out["total_bytes"] = static_cast<Json::UInt64>(record.total_bytes);
    out["percent"] = record.percent;
    if (record.file_index) {
        out["file_index"] = static_cast<Json::UInt64>(*record.file_index);
    }
    if (record.total_files) {
        out["total_files"] = static_cast<Json::UInt64>(*record.total_files);
    }
    return out;
}

progress_tracker::progress_tracker(std::string file,
                                   std::optional<uint64_t> total_bytes,
                                   progress_callback callback,
                                   std::optional<std::size_t> file_index,
                                   std::optional<std::size_t> total_files)
    : file_(std::move(file)),
      total_(total_bytes),
      callback_(std::move(callback)),
      file_index_(file_index),
      total_files_(total_files) {}

void progress_tracker::restart() {
    bytes_ = 0;
}

void progress_tracker::advance(uint64_t bytes) {
    bytes_ += bytes;
    if (reported_complete_ || bytes_ <= high_water_) {
        return;
    }
    high_water_ = bytes_;

    if (!total_) {
        emit(bytes_, bytes_, 0);
        return;
    }

    const uint64_t total = *total_;
    if (total == 0) {
        return;
    }
    const uint64_t capped = std::min(bytes_, total);
    const auto percent = static_cast<int>(capped * 100 / total);
    emit(bytes_, total, percent);
}

void progress_tracker::complete() {
    if (reported_complete_) {
        return;
    }
    const uint64_t total = total_.value_or(bytes_);
    emit(std::max(bytes_, total), total, 100);
}

void progress_tracker::emit(uint64_t bytes, uint64_t total, int percent) {
    if (percent >= 100) {
        percent = 100;
        reported_complete_ = true;
    }
    if (callback_) {
        callback_(progress_record{file_, file_index_, total_files_, bytes, total, percent});
    }
}

}  // namespace ftp_bridge
