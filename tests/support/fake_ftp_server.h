/**
 * @file fake_ftp_server.h
 * @brief In-memory FTP peripheral for tests
 *
 * Implements session_factory over a shared in-memory tree. Every session it
 * creates talks to the same tree, so a reconnect sees earlier writes.
 * Failure injection covers the cases the bridge must survive: MLSD missing,
 * refused login, unreachable host, a dropped link on the n-th STOR/RETR,
 * refused deletes and servers that reject full paths.
 */

#ifndef FTP_BRIDGE_TESTS_SUPPORT_FAKE_FTP_SERVER_H
#define FTP_BRIDGE_TESTS_SUPPORT_FAKE_FTP_SERVER_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <ftp_bridge/core/path_utils.h>
#include <ftp_bridge/ftp/ftp_session.h>

namespace ftp_bridge::test {

class fake_ftp_server : public session_factory {
public:
    struct failure_plan {
        bool mlsd_supported = true;
        bool refuse_login = false;
        bool unreachable = false;
        /// Reject STOR/RETR/DELE/RMD arguments that contain '/'
        bool reject_full_paths = false;
        /// 1-based STOR / RETR attempts that lose the connection midway
        std::set<int> drop_store_on;
        std::set<int> drop_retrieve_on;
        /// Paths whose DELE / RMD is refused
        std::set<std::string> refuse_delete;
        /// Answer SIZE with 502
        bool size_supported = true;
    };

    fake_ftp_server() { nodes_["/"] = node{true, {}}; }

    auto create(const peripheral_ref& peripheral) -> std::unique_ptr<ftp_session> override;

    // ========================================================================
    // Tree setup and inspection
    // ========================================================================

    void add_directory(const std::string& path) {
        std::lock_guard lock(mutex_);
        auto norm = path_utils::normalize(path);
        std::string current = "/";
        std::size_t start = 1;
        while (start <= norm.size()) {
            auto end = norm.find('/', start);
            if (end == std::string::npos) {
                end = norm.size();
            }
            if (end > start) {
                current = path_utils::join(current, norm.substr(start, end - start));
                nodes_.try_emplace(current, node{true, {}});
            }
            start = end + 1;
        }
    }

    void add_file(const std::string& path, const std::string& content) {
        add_directory(path_utils::parent(path));
        std::lock_guard lock(mutex_);
        nodes_[path_utils::normalize(path)] = node{false, content};
    }

    [[nodiscard]] auto exists(const std::string& path) const -> bool {
        std::lock_guard lock(mutex_);
        return nodes_.count(path_utils::normalize(path)) > 0;
    }

    [[nodiscard]] auto is_directory(const std::string& path) const -> bool {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path_utils::normalize(path));
        return it != nodes_.end() && it->second.is_dir;
    }

    [[nodiscard]] auto content(const std::string& path) const -> std::string {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path_utils::normalize(path));
        return it == nodes_.end() ? std::string{} : it->second.data;
    }

    /**
     * @brief How many times @p verb (STOR, RETR, DELE, RMD, MKD, MLSD,
     *        LIST, SIZE, CWD, CONNECT) was issued
     */
    [[nodiscard]] auto count(const std::string& verb) const -> int {
        std::lock_guard lock(mutex_);
        auto it = counts_.find(verb);
        return it == counts_.end() ? 0 : it->second;
    }

    /**
     * @brief Successful DELE / RMD in order, as "DELE /path" / "RMD /path"
     */
    [[nodiscard]] auto deletions() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return deletions_;
    }

    [[nodiscard]] auto plan() -> failure_plan& { return plan_; }

    /**
     * @brief Peripheral pointing at this server
     */
    [[nodiscard]] static auto peripheral(int32_t index) -> peripheral_ref {
        peripheral_ref p;
        p.index = index;
        p.name = "fake-" + std::to_string(index);
        p.server = endpoint{"fake.invalid", 21};
        p.user = "bridge";
        p.password = "secret";
        return p;
    }

private:
    friend class fake_ftp_session;

    struct node {
        bool is_dir = false;
        std::string data;
    };

    auto children(const std::string& dir) const -> std::vector<std::pair<std::string, node>> {
        std::vector<std::pair<std::string, node>> out;
        const auto prefix = dir == "/" ? std::string("/") : dir + "/";
        for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) {
                break;
            }
            auto rest = it->first.substr(prefix.size());
            if (!rest.empty() && rest.find('/') == std::string::npos) {
                out.emplace_back(rest, it->second);
            }
        }
        return out;
    }

    void bump(const std::string& verb) { ++counts_[verb]; }

    mutable std::mutex mutex_;
    std::map<std::string, node> nodes_;
    std::map<std::string, int> counts_;
    std::vector<std::string> deletions_;
    failure_plan plan_;
};

class fake_ftp_session : public ftp_session {
public:
    explicit fake_ftp_session(fake_ftp_server& server) : server_(server) {}

    auto connect() -> result<void> override {
        std::lock_guard lock(server_.mutex_);
        server_.bump("CONNECT");
        if (server_.plan_.unreachable) {
            return fail(error_code::connection_error, "Could not resolve host fake.invalid");
        }
        if (server_.plan_.refuse_login) {
            return fail(error_code::login_failed, "530 Login incorrect");
        }
        open_ = true;
        cwd_ = "/";
        return {};
    }

    void close() override { open_ = false; }

    auto is_open() const -> bool override { return open_; }

    auto pwd() -> result<std::string> override {
        if (!open_) {
            return lost();
        }
        return cwd_;
    }

    auto cwd(const std::string& path) -> result<void> override {
        std::lock_guard lock(server_.mutex_);
        if (!open_) {
            return lost();
        }
        server_.bump("CWD");
        auto target = resolve(path);
        auto it = server_.nodes_.find(target);
        if (it == server_.nodes_.end() || !it->second.is_dir) {
            return fail(error_code::remote_command_failed, "550 " + target + ": No such directory");
        }
        cwd_ = target;
        return {};
    }

    auto mlsd(const std::string& path) -> result<std::vector<std::string>> override {
        std::lock_guard lock(server_.mutex_);
        if (!open_) {
            return lost();
        }
        server_.bump("MLSD");
        if (!server_.plan_.mlsd_supported) {
            return fail(error_code::command_not_supported, "500 MLSD not understood");
        }
        auto dir = resolve(path);
        if (!is_dir(dir)) {
            return fail(error_code::remote_command_failed, "550 " + dir + ": No such directory");
        }
        std::vector<std::string> lines{"type=cdir;modify=20240101120000; ."};
        for (const auto& [name, n] : server_.children(dir)) {
            if (n.is_dir) {
                lines.push_back("type=dir;modify=20240101120000; " + name);
            } else {
                lines.push_back("type=file;size=" + std::to_string(n.data.size()) +
                                ";modify=20240101120000; " + name);
            }
        }
        return lines;
    }

    auto list(const std::string& path) -> result<std::vector<std::string>> override {
        std::lock_guard lock(server_.mutex_);
        if (!open_) {
            return lost();
        }
        server_.bump("LIST");
        auto dir = resolve(path);
        if (!is_dir(dir)) {
            return fail(error_code::remote_command_failed, "550 " + dir + ": No such directory");
        }
        std::vector<std::string> lines{"total 0"};
        for (const auto& [name, n] : server_.children(dir)) {
            if (n.is_dir) {
                lines.push_back("drwxr-xr-x    2 ftp      ftp          4096 Jan 01 12:00 " + name);
            } else {
                lines.push_back("-rw-r--r--    1 ftp      ftp      " +
                                std::to_string(n.data.size()) + " Jan 01 12:00 " + name);
            }
        }
        return lines;
    }

    auto size(const std::string& path) -> result<uint64_t> override {
        std::lock_guard lock(server_.mutex_);
        if (!open_) {
            return lost();
        }
        server_.bump("SIZE");
        if (!server_.plan_.size_supported) {
            return fail(error_code::command_not_supported, "502 SIZE not implemented");
        }
        auto it = server_.nodes_.find(resolve(path));
        if (it == server_.nodes_.end() || it->second.is_dir) {
            return fail(error_code::remote_file_not_found, "550 " + path + ": No such file");
        }
        return static_cast<uint64_t>(it->second.data.size());
    }

    auto make_directory(const std::string& path) -> result<void> override {
        std::lock_guard lock(server_.mutex_);
        if (!open_) {
            return lost();
        }
        server_.bump("MKD");
        auto target = resolve(path);
        if (server_.nodes_.count(target) > 0) {
            return fail(error_code::remote_command_failed, "550 " + target + ": File exists");
        }
        if (!is_dir(path_utils::parent(target))) {
            return fail(error_code::remote_command_failed, "550 " + target + ": No parent");
        }
        server_.nodes_[target] = fake_ftp_server::node{true, {}};
        return {};
    }

    auto delete_file(const std::string& path) -> result<void> override {
        std::lock_guard lock(server_.mutex_);
        if (!open_) {
            return lost();
        }
        server_.bump("DELE");
        if (auto refused = refuse_full_path(path); !refused) {
            return refused;
        }
        auto target = resolve(path);
        if (server_.plan_.refuse_delete.count(target) > 0) {
            return fail(error_code::remote_command_failed, "550 " + target + ": Permission denied");
        }
        auto it = server_.nodes_.find(target);
        if (it == server_.nodes_.end() || it->second.is_dir) {
            return fail(error_code::remote_file_not_found, "550 " + target + ": No such file");
        }
        server_.nodes_.erase(it);
        server_.deletions_.push_back("DELE " + target);
        return {};
    }

    auto remove_directory(const std::string& path) -> result<void> override {
        std::lock_guard lock(server_.mutex_);
        if (!open_) {
            return lost();
        }
        server_.bump("RMD");
        if (auto refused = refuse_full_path(path); !refused) {
            return refused;
        }
        auto target = resolve(path);
        if (server_.plan_.refuse_delete.count(target) > 0 || target == "/") {
            return fail(error_code::remote_command_failed, "550 " + target + ": Permission denied");
        }
        if (!is_dir(target)) {
            return fail(error_code::remote_command_failed, "550 " + target + ": No such directory");
        }
        if (!server_.children(target).empty()) {
            return fail(error_code::remote_command_failed, "550 " + target + ": Directory not empty");
        }
        server_.nodes_.erase(target);
        server_.deletions_.push_back("RMD " + target);
        return {};
    }

    auto store(const std::string& path, const data_source& source) -> result<void> override {
        int attempt = 0;
        std::string target;
        {
            std::lock_guard lock(server_.mutex_);
            if (!open_) {
                return lost();
            }
            server_.bump("STOR");
            attempt = server_.counts_["STOR"];
            if (auto refused = refuse_full_path(path); !refused) {
                return refused;
            }
            target = resolve(path);
            if (!is_dir(path_utils::parent(target))) {
                return fail(error_code::remote_command_failed, "553 " + target + ": No parent");
            }
        }

        const bool drop = server_.plan_.drop_store_on.count(attempt) > 0;
        std::string data;
        std::array<std::byte, 16 * 1024> buffer{};
        for (;;) {
            auto got = source(std::span<std::byte>(buffer));
            if (!got) {
                return unexpected{got.error()};
            }
            if (got.value() == 0) {
                break;
            }
            data.append(reinterpret_cast<const char*>(buffer.data()), got.value());
            if (drop) {
                open_ = false;
                std::lock_guard lock(server_.mutex_);
                server_.nodes_[target] = fake_ftp_server::node{false, data};
                return fail(error_code::connection_lost, "Connection reset by peer");
            }
        }

        std::lock_guard lock(server_.mutex_);
        server_.nodes_[target] = fake_ftp_server::node{false, std::move(data)};
        return {};
    }

    auto retrieve(const std::string& path, const data_sink& sink) -> result<void> override {
        int attempt = 0;
        std::string data;
        {
            std::lock_guard lock(server_.mutex_);
            if (!open_) {
                return lost();
            }
            server_.bump("RETR");
            attempt = server_.counts_["RETR"];
            if (auto refused = refuse_full_path(path); !refused) {
                return refused;
            }
            auto it = server_.nodes_.find(resolve(path));
            if (it == server_.nodes_.end() || it->second.is_dir) {
                return fail(error_code::remote_file_not_found, "550 " + path + ": No such file");
            }
            data = it->second.data;
        }

        const bool drop = server_.plan_.drop_retrieve_on.count(attempt) > 0;
        constexpr std::size_t piece = 16 * 1024;
        for (std::size_t offset = 0; offset < data.size(); offset += piece) {
            const auto len = std::min(piece, data.size() - offset);
            auto written = sink(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(data.data() + offset), len));
            if (!written) {
                return written;
            }
            if (drop) {
                open_ = false;
                return fail(error_code::connection_lost, "Connection reset by peer");
            }
        }
        return {};
    }

private:
    static auto fail(error_code code, std::string message) -> unexpected {
        return unexpected{error{code, std::move(message)}};
    }

    static auto lost() -> unexpected {
        return fail(error_code::connection_lost, "Not connected");
    }

    auto resolve(const std::string& path) const -> std::string {
        if (path.empty() || path == ".") {
            return cwd_;
        }
        if (path_utils::is_absolute(path)) {
            return path_utils::normalize(path);
        }
        return path_utils::join(cwd_, path);
    }

    auto is_dir(const std::string& path) const -> bool {
        auto it = server_.nodes_.find(path);
        return it != server_.nodes_.end() && it->second.is_dir;
    }

    auto refuse_full_path(const std::string& path) const -> result<void> {
        if (server_.plan_.reject_full_paths && path.find('/') != std::string::npos) {
            return fail(error_code::remote_file_not_found, "550 Full paths not accepted");
        }
        return {};
    }

    fake_ftp_server& server_;
    bool open_ = false;
    std::string cwd_ = "/";
};

inline auto fake_ftp_server::create(const peripheral_ref& /*peripheral*/)
    -> std::unique_ptr<ftp_session> {
    return std::make_unique<fake_ftp_session>(*this);
}

}  // namespace ftp_bridge::test

#endif  // FTP_BRIDGE_TESTS_SUPPORT_FAKE_FTP_SERVER_H
