/**
 * @file transfer_engine.h
 * @brief Single-file and directory transfers against one peripheral
 */

#ifndef FTP_BRIDGE_ENGINE_TRANSFER_ENGINE_H
#define FTP_BRIDGE_ENGINE_TRANSFER_ENGINE_H

#include <filesystem>
#include <string>

#include <ftp_bridge/core/types.h>
#include <ftp_bridge/engine/transfer_types.h>
#include <ftp_bridge/ftp/connection_manager.h>

namespace ftp_bridge {

/**
 * @brief Transfer engine
 *
 * Each transfer operation opens its own connection through the
 * connection_manager, walks the state machine in transfer_types.h, and
 * closes the connection before returning. One engine serves one
 * peripheral worker and runs one operation at a time.
 *
 * @code
 * transfer_engine engine(connections, engine_options{});
 * auto done = engine.upload_file(peripheral, "/tmp/job.txt", "/", [](const progress_record& p) {
 *     std::cout << p.percent << "%\n";
 * });
 * @endcode
 */
class transfer_engine {
public:
    transfer_engine(connection_manager& connections, engine_options options);

    /**
     * @brief Upload one file
     *
     * A @p remote_path that is empty, "/" or ends in '/' names a directory;
     * the file is stored there under its own name.
     *
     * @return summary, local_file_not_found if the source is missing,
     *         connection_error if the peripheral is unreachable, or
     *         transfer_error once the retry is exhausted
     */
    [[nodiscard]] auto upload_file(const peripheral_ref& peripheral,
                                   const std::filesystem::path& local_path,
                                   const std::string& remote_path,
                                   const progress_callback& on_progress,
                                   const started_callback& on_started = {})
        -> result<transfer_summary>;

    /**
     * @brief Download one file, creating local parent directories
     *
     * A @p local_path that ends in '/' or names an existing directory
     * receives the file under its remote name. A partial local file is
     * removed on failure.
     *
     * @return summary, remote_file_not_found if the peripheral has no such
     *         file, or transfer_error once the retry is exhausted
     */
    [[nodiscard]] auto download_file(const peripheral_ref& peripheral,
                                     const std::string& remote_path,
                                     const std::filesystem::path& local_path,
                                     const progress_callback& on_progress,
                                     const started_callback& on_started = {})
        -> result<transfer_summary>;

    /**
     * @brief Upload a local tree depth-first
     *
     * Each remote directory is created before its files are sent. The file
     * count is fixed when the tree is enumerated. The first failing file
     * aborts the rest; the error names it and the number already sent.
     */
    [[nodiscard]] auto upload_directory(const peripheral_ref& peripheral,
                                        const std::filesystem::path& local_dir,
                                        const std::string& remote_dir,
                                        const progress_callback& on_progress,
                                        const started_callback& on_started = {})
        -> result<transfer_summary>;

    /**
     * @brief Download a remote tree depth-first, one listing per level
     */
    [[nodiscard]] auto download_directory(const peripheral_ref& peripheral,
                                          const std::string& remote_dir,
                                          const std::filesystem::path& local_dir,
                                          const progress_callback& on_progress,
                                          const started_callback& on_started = {})
        -> result<transfer_summary>;

    /**
     * @brief Delete a remote file or directory tree
     *
     * A directory is listed recursively; every file is deleted, then the
     * subdirectories are removed bottom-up, then @p path itself. Deletion
     * is not transactional: removed entries stay removed when a later one
     * fails.
     *
     * @return summary, or remote_delete_error naming the first sub-path
     *         that could not be removed
     */
    [[nodiscard]] auto delete_remote_path(peripheral_connection& connection,
                                          const std::string& path) -> result<delete_summary>;

    /**
     * @brief Delete one remote file
     */
    [[nodiscard]] auto delete_remote_file(peripheral_connection& connection,
                                          const std::string& path) -> result<void>;

    /**
     * @brief State of the current or last operation
     */
    [[nodiscard]] auto state() const -> transfer_state;

    [[nodiscard]] auto options() const -> const engine_options&;

private:
    struct file_job {
        std::filesystem::path local;
        std::string remote;
    };

    void transition(transfer_state to);
    auto fail(const error& err) -> unexpected;

    auto begin(const peripheral_ref& peripheral, const started_callback& on_started)
        -> result<std::unique_ptr<peripheral_connection>>;

    auto send_file(peripheral_connection& connection,
                   const file_job& job,
                   progress_tracker& tracker) -> result<uint64_t>;

    auto receive_file(peripheral_connection& connection,
                      const file_job& job,
                      std::optional<uint64_t> size,
                      progress_tracker& tracker) -> result<uint64_t>;

    connection_manager& connections_;
    engine_options options_;
    transfer_state state_ = transfer_state::init;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_ENGINE_TRANSFER_ENGINE_H
