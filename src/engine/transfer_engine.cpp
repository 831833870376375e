/**
 * @file transfer_engine.cpp
 * @brief Transfer engine implementation
 */

#include <ftp_bridge/engine/transfer_engine.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>
#include <vector>

#include <ftp_bridge/core/error_codes.h>
#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/core/path_utils.h>
#include <ftp_bridge/listing/remote_listing.h>

namespace ftp_bridge {

namespace fs = std::filesystem;

namespace {

auto upload_target(const std::string& remote_path, const std::string& file_name) -> std::string {
    if (remote_path.empty() || path_utils::is_directory_like(remote_path)) {
        return path_utils::join(remote_path, file_name);
    }
    return path_utils::normalize(remote_path);
}

auto download_target(const fs::path& local_path, const std::string& remote_path) -> fs::path {
    const auto raw = local_path.string();
    std::error_code ec;
    if (raw.empty() || path_utils::is_directory_like(raw) || fs::is_directory(local_path, ec)) {
        return local_path / path_utils::basename(remote_path);
    }
    return local_path;
}

/**
 * @brief Collapse protocol-level failures of a finished retry into transfer_error
 */
auto as_transfer_error(const error& err, const std::string& what, bool keep_not_found) -> error {
    if (is_local_error(err.code) || err.code == error_code::transfer_error) {
        return err;
    }
    if (keep_not_found && err.code == error_code::remote_file_not_found) {
        return err;
    }
    return error{error_code::transfer_error, what + " failed: " + err.message};
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

struct upload_step {
    bool is_directory = false;
    fs::path local;
    std::string remote;
};

auto enumerate_local_tree(const fs::path& dir,
                          const std::string& remote_dir,
                          std::vector<upload_step>& steps) -> result<void> {
    std::error_code ec;
    std::vector<fs::directory_entry> children;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        return unexpected{error{error_code::local_io_error,
                                "Cannot read directory " + dir.string() + ": " + ec.message()}};
    }
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    std::vector<const fs::directory_entry*> subdirs;
    for (const auto& child : children) {
        std::error_code type_ec;
        if (child.is_directory(type_ec)) {
            subdirs.push_back(&child);
        } else if (child.is_regular_file(type_ec)) {
            steps.push_back({false, child.path(),
                             path_utils::join(remote_dir, child.path().filename().string())});
        }
    }

    for (const auto* sub : subdirs) {
        auto remote_sub = path_utils::join(remote_dir, sub->path().filename().string());
        steps.push_back({true, sub->path(), remote_sub});
        if (auto nested = enumerate_local_tree(sub->path(), remote_sub, steps); !nested) {
            return nested;
        }
    }
    return {};
}

struct download_job {
    std::string remote;
    fs::path local;
    std::optional<uint64_t> size;
};

auto enumerate_remote_tree(ftp_session& session,
                           const std::string& remote_dir,
                           const fs::path& local_dir,
                           std::vector<fs::path>& directories,
                           std::vector<download_job>& jobs) -> result<void> {
    auto listing = list_remote(session, remote_dir);
    if (!listing) {
        return unexpected{listing.error()};
    }
    for (const auto& entry : listing.value().entries) {
        auto local = local_dir / entry.name;
        if (entry.is_directory) {
            directories.push_back(local);
            if (auto nested = enumerate_remote_tree(session, entry.path, local, directories, jobs);
                !nested) {
                return nested;
            }
        } else {
            jobs.push_back({entry.path, local, entry.size});
        }
    }
    return {};
}

auto collect_remote_tree(ftp_session& session,
                         const std::string& dir,
                         std::vector<std::string>& files,
                         std::vector<std::string>& directories) -> result<void> {
    auto listing = list_remote(session, dir);
    if (!listing) {
        return unexpected{error{error_code::remote_delete_error,
                                "Cannot delete " + dir + ": " + listing.error().message}};
    }
    for (const auto& entry : listing.value().entries) {
        if (entry.is_directory) {
            directories.push_back(entry.path);
            if (auto nested = collect_remote_tree(session, entry.path, files, directories);
                !nested) {
                return nested;
            }
        } else {
            files.push_back(entry.path);
        }
    }
    return {};
}

auto is_remote_directory(ftp_session& session, const std::string& path) -> result<bool> {
    scoped_remote_directory guard(session);
    auto entered = guard.enter(path);
    if (entered) {
        return true;
    }
    if (is_transient(entered.error().code)) {
        return unexpected{entered.error()};
    }
    return false;
}

}  // namespace

transfer_engine::transfer_engine(connection_manager& connections, engine_options options)
    : connections_(connections), options_(options) {}

auto transfer_engine::state() const -> transfer_state {
    return state_;
}

auto transfer_engine::options() const -> const engine_options& {
    return options_;
}

void transfer_engine::transition(transfer_state to) {
    if (!is_valid_transition(state_, to)) {
        FB_LOG_WARN(log_category::engine,
                    "Ignoring state change " + std::string(to_string(state_)) + " -> " +
                        std::string(to_string(to)));
        return;
    }
    state_ = to;
}

auto transfer_engine::fail(const error& err) -> unexpected {
    transition(transfer_state::failed);
    bridge_log_context ctx;
    ctx.error_message = err.message;
    FB_LOG_ERROR_CTX(log_category::engine, "Transfer failed", ctx);
    return unexpected{err};
}

auto transfer_engine::begin(const peripheral_ref& peripheral, const started_callback& on_started)
    -> result<std::unique_ptr<peripheral_connection>> {
    transition(transfer_state::connecting);
    auto conn = connections_.open(peripheral);
    if (!conn) {
        return unexpected{conn.error()};
    }
    if (on_started) {
        on_started();
    }
    return conn;
}

auto transfer_engine::send_file(peripheral_connection& connection,
                                const file_job& job,
                                progress_tracker& tracker) -> result<uint64_t> {
    const auto chunk_size = options_.chunk_size;

    auto attempt = [&](ftp_session& session) -> result<void> {
        return with_parent_directory_fallback(
            session, job.remote, [&](const std::string& target) -> result<void> {
                std::ifstream in(job.local, std::ios::binary);
                if (!in) {
                    return unexpected{error{error_code::local_io_error,
                                            "Cannot open " + job.local.string()}};
                }
                tracker.restart();

                data_source source = [&](std::span<std::byte> buffer) -> result<std::size_t> {
                    const auto want = std::min(buffer.size(), chunk_size);
                    in.read(reinterpret_cast<char*>(buffer.data()),
                            static_cast<std::streamsize>(want));
                    if (in.bad()) {
                        return unexpected{error{error_code::local_io_error,
                                                "Read failed: " + job.local.string()}};
                    }
                    const auto got = static_cast<std::size_t>(in.gcount());
                    if (got > 0) {
                        tracker.advance(got);
                    }
                    return got;
                };
                return session.store(target, source);
            });
    };

    auto what = "Upload of " + job.local.string() + " to " + job.remote;
    auto sent = connection.run_with_retry(what, attempt);
    if (!sent) {
        return unexpected{as_transfer_error(sent.error(), what, false)};
    }
    return tracker.bytes();
}

auto transfer_engine::receive_file(peripheral_connection& connection,
                                   const file_job& job,
                                   std::optional<uint64_t> size,
                                   progress_tracker& tracker) -> result<uint64_t> {
    std::error_code ec;
    if (job.local.has_parent_path()) {
        fs::create_directories(job.local.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::local_io_error,
                                    "Cannot create " + job.local.parent_path().string() + ": " +
                                        ec.message()}};
        }
    }

    auto attempt = [&](ftp_session& session) -> result<void> {
        return with_parent_directory_fallback(
            session, job.remote, [&](const std::string& target) -> result<void> {
                std::ofstream out(job.local, std::ios::binary | std::ios::trunc);
                if (!out) {
                    return unexpected{error{error_code::local_io_error,
                                            "Cannot write " + job.local.string()}};
                }
                tracker.restart();

                data_sink sink = [&](std::span<const std::byte> data) -> result<void> {
                    out.write(reinterpret_cast<const char*>(data.data()),
                              static_cast<std::streamsize>(data.size()));
                    if (!out) {
                        return unexpected{error{error_code::local_io_error,
                                                "Write failed: " + job.local.string()}};
                    }
                    tracker.advance(data.size());
                    return {};
                };
                auto received = session.retrieve(target, sink);
                out.close();
                if (received && !out) {
                    return unexpected{error{error_code::local_io_error,
                                            "Write failed: " + job.local.string()}};
                }
                return received;
            });
    };

    auto what = "Download of " + job.remote + " to " + job.local.string();
    auto received = connection.run_with_retry(what, attempt);
    if (received && size && tracker.bytes() != *size) {
        FB_LOG_WARN(log_category::engine,
                    job.remote + ": received " + std::to_string(tracker.bytes()) +
                        " bytes, server reported " + std::to_string(*size));
    }
    if (!received) {
        std::error_code rm_ec;
        fs::remove(job.local, rm_ec);
        if (rm_ec) {
            FB_LOG_WARN(log_category::engine,
                        "Could not remove partial file " + job.local.string() + ": " +
                            rm_ec.message());
        }
        return unexpected{as_transfer_error(received.error(), what, true)};
    }
    return tracker.bytes();
}

auto transfer_engine::upload_file(const peripheral_ref& peripheral,
                                  const fs::path& local_path,
                                  const std::string& remote_path,
                                  const progress_callback& on_progress,
                                  const started_callback& on_started)
    -> result<transfer_summary> {
    state_ = transfer_state::init;
    const auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        return fail(error{error_code::local_file_not_found,
                          "Local file not found: " + local_path.string()});
    }
    const auto total = fs::file_size(local_path, ec);
    if (ec) {
        return fail(error{error_code::local_io_error,
                          "Cannot stat " + local_path.string() + ": " + ec.message()});
    }

    file_job job{local_path, upload_target(remote_path, local_path.filename().string())};

    auto conn = begin(peripheral, on_started);
    if (!conn) {
        return fail(conn.error());
    }
    transition(transfer_state::transferring);

    progress_tracker tracker(local_path.string(), total, on_progress);
    auto sent = send_file(*conn.value(), job, tracker);
    if (!sent) {
        return fail(sent.error());
    }
    tracker.complete();
    transition(transfer_state::complete);

    bridge_log_context ctx;
    ctx.peripheral_index = peripheral.index;
    ctx.file = job.remote;
    ctx.total_bytes = sent.value();
    ctx.duration_ms = elapsed_ms(start);
    FB_LOG_INFO_CTX(log_category::engine, "Upload completed", ctx);

    return transfer_summary{1, sent.value(), conn.value()->retry_count()};
}

auto transfer_engine::download_file(const peripheral_ref& peripheral,
                                    const std::string& remote_path,
                                    const fs::path& local_path,
                                    const progress_callback& on_progress,
                                    const started_callback& on_started)
    -> result<transfer_summary> {
    state_ = transfer_state::init;
    const auto start = std::chrono::steady_clock::now();

    auto remote = path_utils::normalize(remote_path);
    if (remote.empty() || remote == "/") {
        return fail(error{error_code::invalid_payload, "Download needs a remote file path"});
    }
    file_job job{download_target(local_path, remote), remote};

    auto conn = begin(peripheral, on_started);
    if (!conn) {
        return fail(conn.error());
    }
    transition(transfer_state::transferring);

    std::optional<uint64_t> size;
    auto sized = conn.value()->session().size(remote);
    if (sized) {
        size = sized.value();
    } else if (sized.error().code == error_code::remote_file_not_found) {
        return fail(error{error_code::remote_file_not_found,
                          "Remote file not found: " + remote});
    }

    progress_tracker tracker(remote, size, on_progress);
    auto received = receive_file(*conn.value(), job, size, tracker);
    if (!received) {
        return fail(received.error());
    }
    tracker.complete();
    transition(transfer_state::complete);

    bridge_log_context ctx;
    ctx.peripheral_index = peripheral.index;
    ctx.file = remote;
    ctx.total_bytes = received.value();
    ctx.duration_ms = elapsed_ms(start);
    FB_LOG_INFO_CTX(log_category::engine, "Download completed", ctx);

    return transfer_summary{1, received.value(), conn.value()->retry_count()};
}

auto transfer_engine::upload_directory(const peripheral_ref& peripheral,
                                       const fs::path& local_dir,
                                       const std::string& remote_dir,
                                       const progress_callback& on_progress,
                                       const started_callback& on_started)
    -> result<transfer_summary> {
    state_ = transfer_state::init;
    const auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!fs::is_directory(local_dir, ec)) {
        return fail(error{error_code::path_not_found,
                          "Local directory not found: " + local_dir.string()});
    }

    const auto remote_base = path_utils::normalize(remote_dir);
    std::vector<upload_step> steps;
    if (auto listed = enumerate_local_tree(local_dir, remote_base, steps); !listed) {
        return fail(listed.error());
    }
    const auto total_files = static_cast<std::size_t>(
        std::count_if(steps.begin(), steps.end(), [](const upload_step& s) {
            return !s.is_directory;
        }));

    auto conn = begin(peripheral, on_started);
    if (!conn) {
        return fail(conn.error());
    }
    auto& connection = *conn.value();
    transition(transfer_state::transferring);

    if (auto made = ensure_remote_directory(connection.session(), remote_base); !made) {
        return fail(error{error_code::transfer_error,
                          "Cannot create " + remote_base + ": " + made.error().message});
    }

    transfer_summary summary;
    std::size_t file_index = 0;
    for (const auto& step : steps) {
        if (step.is_directory) {
            auto made = connection.session().make_directory(step.remote);
            if (!made && is_transient(made.error().code)) {
                return fail(error{error_code::transfer_error,
                                  "Cannot create " + step.remote + ": " + made.error().message});
            }
            continue;
        }

        ++file_index;
        std::error_code size_ec;
        auto size = fs::file_size(step.local, size_ec);
        progress_tracker tracker(step.local.string(),
                                 size_ec ? std::optional<uint64_t>{} : std::optional<uint64_t>{size},
                                 on_progress, file_index, total_files);

        auto sent = send_file(connection, file_job{step.local, step.remote}, tracker);
        if (!sent) {
            return fail(error{sent.error().code,
                              "Upload of " + step.local.string() + " failed after " +
                                  std::to_string(summary.files_transferred) + " of " +
                                  std::to_string(total_files) +
                                  " files: " + sent.error().message});
        }
        tracker.complete();
        ++summary.files_transferred;
        summary.bytes_transferred += sent.value();
    }
    summary.retries = connection.retry_count();
    transition(transfer_state::complete);

    bridge_log_context ctx;
    ctx.peripheral_index = peripheral.index;
    ctx.file = remote_base;
    ctx.total_files = total_files;
    ctx.total_bytes = summary.bytes_transferred;
    ctx.duration_ms = elapsed_ms(start);
    FB_LOG_INFO_CTX(log_category::engine, "Directory upload completed", ctx);

    return summary;
}

auto transfer_engine::download_directory(const peripheral_ref& peripheral,
                                         const std::string& remote_dir,
                                         const fs::path& local_dir,
                                         const progress_callback& on_progress,
                                         const started_callback& on_started)
    -> result<transfer_summary> {
    state_ = transfer_state::init;
    const auto start = std::chrono::steady_clock::now();

    const auto remote_base = path_utils::normalize(remote_dir);

    auto conn = begin(peripheral, on_started);
    if (!conn) {
        return fail(conn.error());
    }
    auto& connection = *conn.value();
    transition(transfer_state::listing);

    std::vector<fs::path> directories;
    std::vector<download_job> jobs;
    if (auto listed = enumerate_remote_tree(connection.session(), remote_base, local_dir,
                                            directories, jobs);
        !listed) {
        return fail(listed.error());
    }

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    for (const auto& dir : directories) {
        if (ec) {
            break;
        }
        fs::create_directories(dir, ec);
    }
    if (ec) {
        return fail(error{error_code::local_io_error,
                          "Cannot create local directories under " + local_dir.string() + ": " +
                              ec.message()});
    }

    transition(transfer_state::transferring);

    transfer_summary summary;
    const auto total_files = jobs.size();
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        const auto& job = jobs[i];
        progress_tracker tracker(job.remote, job.size, on_progress, i + 1, total_files);
        auto received = receive_file(connection, file_job{job.local, job.remote}, job.size, tracker);
        if (!received) {
            return fail(error{received.error().code,
                              "Download of " + job.remote + " failed after " +
                                  std::to_string(summary.files_transferred) + " of " +
                                  std::to_string(total_files) +
                                  " files: " + received.error().message});
        }
        tracker.complete();
        ++summary.files_transferred;
        summary.bytes_transferred += received.value();
    }
    summary.retries = connection.retry_count();
    transition(transfer_state::complete);

    bridge_log_context ctx;
    ctx.peripheral_index = peripheral.index;
    ctx.file = remote_base;
    ctx.total_files = total_files;
    ctx.total_bytes = summary.bytes_transferred;
    ctx.duration_ms = elapsed_ms(start);
    FB_LOG_INFO_CTX(log_category::engine, "Directory download completed", ctx);

    return summary;
}

auto transfer_engine::delete_remote_file(peripheral_connection& connection,
                                         const std::string& path) -> result<void> {
    auto target = path_utils::normalize(path);
    if (target.empty() || target == "/") {
        return unexpected{error{error_code::invalid_payload, "Delete needs a remote file path"}};
    }

    auto& session = connection.session();
    auto deleted = with_parent_directory_fallback(
        session, target, [&](const std::string& t) { return session.delete_file(t); });
    if (!deleted) {
        return unexpected{error{error_code::remote_delete_error,
                                "Cannot delete " + target + ": " + deleted.error().message}};
    }
    FB_LOG_INFO(log_category::engine, "Deleted remote file " + target);
    return {};
}

auto transfer_engine::delete_remote_path(peripheral_connection& connection,
                                         const std::string& path) -> result<delete_summary> {
    auto target = path_utils::normalize(path);
    if (target.empty() || target == "/" || target == ".") {
        return unexpected{error{error_code::invalid_payload,
                                "Refusing to delete remote path '" + path + "'"}};
    }

    auto& session = connection.session();
    auto directory = is_remote_directory(session, target);
    if (!directory) {
        return unexpected{error{error_code::remote_delete_error,
                                "Cannot delete " + target + ": " + directory.error().message}};
    }

    delete_summary summary;
    if (!directory.value()) {
        if (auto deleted = delete_remote_file(connection, target); !deleted) {
            return unexpected{deleted.error()};
        }
        summary.files_deleted = 1;
        return summary;
    }

    std::vector<std::string> files;
    std::vector<std::string> directories;
    if (auto collected = collect_remote_tree(session, target, files, directories); !collected) {
        return unexpected{collected.error()};
    }

    for (const auto& file : files) {
        auto deleted = with_parent_directory_fallback(
            session, file, [&](const std::string& t) { return session.delete_file(t); });
        if (!deleted) {
            return unexpected{error{error_code::remote_delete_error,
                                    "Cannot delete " + file + ": " + deleted.error().message}};
        }
        ++summary.files_deleted;
    }

    // Pre-order reversed: every directory comes after all of its descendants
    directories.push_back(target);
    std::reverse(directories.begin(), directories.end() - 1);
    for (const auto& dir : directories) {
        auto removed = with_parent_directory_fallback(
            session, dir, [&](const std::string& t) { return session.remove_directory(t); });
        if (!removed) {
            return unexpected{error{error_code::remote_delete_error,
                                    "Cannot remove " + dir + ": " + removed.error().message}};
        }
        if (dir != target) {
            ++summary.directories_removed;
        }
    }

    bridge_log_context ctx;
    ctx.peripheral_index = connection.peripheral().index;
    ctx.file = target;
    FB_LOG_INFO_CTX(log_category::engine,
                    "Deleted remote tree (" + std::to_string(summary.files_deleted) + " files, " +
                        std::to_string(summary.directories_removed) + " subdirectories)",
                    ctx);
    return summary;
}

}  // namespace ftp_bridge
