#include "FileServer.hpp"
#include "ClientSession.hpp"
#include "DataChannel.hpp"
#include "DbSqlite.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>
#include <chrono>

using namespace std;

namespace {
string peer_name(const sockaddr_in &cli) {
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &cli.sin_addr, ip, sizeof(ip));
    return string(ip) + ":" + to_string(ntohs(cli.sin_port));
}
} // namespace

FileServer::FileServer(const ServerConfig &cfg)
    : cfg_(cfg),
      logger_(cfg.log_path, cfg.log_to_stdout) {}

FileServer::~FileServer() {
    stop();
    if (listen_fd_ >= 0) ::close(listen_fd_);
}

bool FileServer::start(string &err) {
    if (!utils::ensure_dir(cfg_.storage_dir)) {
        err = "Cannot create storage directory " + cfg_.storage_dir;
        return false;
    }

    if (!cfg_.db_path.empty()) {
        auto db = make_unique<DbSqlite>(cfg_.db_path);
        string db_err;
        if (db->init_schema(db_err)) {
            db_ = move(db);
            db_ok_ = true;
        } else {
            logger_.warn("server", "Audit DB disabled: " + db_err);
        }
    }

    listen_fd_ = open_listener(cfg_.host, cfg_.control_port, 16, err);
    if (listen_fd_ < 0) return false;
    port_ = bound_port(listen_fd_);
    running_ = true;

    logger_.log("server", "Control connection on " + cfg_.host + ":" + to_string(port_));
    if (cfg_.mode == TransferMode::Dual) {
        logger_.log("server", cfg_.data_port == 0
                        ? string("Data connections on ephemeral ports")
                        : "Data connection on port " + to_string(cfg_.data_port));
    } else {
        logger_.log("server", "Single-port mode, data on control connection");
    }
    logger_.log("server", "Storage: " + cfg_.storage_dir +
                          " chunk=" + to_string(cfg_.chunk_size));
    return true;
}

void FileServer::run() {
    while (running_) {
        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        int connfd = ::accept(listen_fd_, (sockaddr*)&cli, &len);
        if (connfd < 0) {
            int e = errno;
            if (!running_) break;
            if (e == EINTR || e == ECONNABORTED) continue;
            logger_.error("server", string("accept: ") + strerror(e));
            if (e == EBADF || e == EINVAL) break;
            this_thread::sleep_for(chrono::milliseconds(50));
            continue;
        }
        reap_finished();
        spawn_session(connfd, peer_name(cli));
    }
    logger_.log("server", "Accept loop stopped");
}

void FileServer::spawn_session(int connfd, const string &peer) {
    lock_guard<mutex> lock(sessions_mtx_);
    if (!running_) {
        ::close(connfd);
        return;
    }

    int active = 0;
    for (auto &p : sessions_)
        if (!p.second.finished) active++;

    if (cfg_.max_sessions > 0 && active >= cfg_.max_sessions) {
        proto::send_line(connfd, proto::error_line(proto::reason::ServerBusy));
        ::close(connfd);
        logger_.warn("server", "Rejected " + peer + ": " + to_string(active) +
                               " sessions active (cap " + to_string(cfg_.max_sessions) + ")");
        return;
    }

    int id = next_session_id_++;
    SessionEntry &entry = sessions_[id];
    entry.sockfd = connfd;
    entry.peer = peer;
    total_sessions_++;
    logger_.log("server", "New connection " + peer + " as #" + to_string(id) +
                          ", active=" + to_string(active + 1));

    entry.worker = thread([this, id, connfd, peer]() {
        try {
            ClientSession session(id, connfd, peer, *this);
            session.run();
        } catch (const exception &e) {
            logger_.error("#" + to_string(id) + " " + peer,
                          string("Session aborted: ") + e.what());
        } catch (...) {
            logger_.error("#" + to_string(id) + " " + peer,
                          "Session aborted: unknown exception");
        }
        session_finished(id);
        ::close(connfd);
    });
}

void FileServer::session_finished(int id) {
    int active = 0;
    string peer;
    {
        lock_guard<mutex> lock(sessions_mtx_);
        auto it = sessions_.find(id);
        if (it != sessions_.end()) {
            it->second.finished = true;
            it->second.sockfd = -1;
            peer = it->second.peer;
        }
        for (auto &p : sessions_)
            if (!p.second.finished) active++;
    }
    release_data_port(id);
    logger_.log("server", "Disconnected #" + to_string(id) + " " + peer +
                          ", active=" + to_string(active));
}

void FileServer::reap_finished() {
    vector<thread> done;
    {
        lock_guard<mutex> lock(sessions_mtx_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.finished) {
                done.push_back(move(it->second.worker));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto &t : done)
        if (t.joinable()) t.join();
}

void FileServer::stop() {
    vector<thread> workers;
    {
        lock_guard<mutex> lock(sessions_mtx_);
        if (!running_ && sessions_.empty()) return;
        running_ = false;
        if (listen_fd_ >= 0) ::shutdown(listen_fd_, SHUT_RDWR);
        for (auto &p : sessions_) {
            if (p.second.sockfd >= 0) ::shutdown(p.second.sockfd, SHUT_RDWR);
            workers.push_back(move(p.second.worker));
        }
        sessions_.clear();
    }
    for (auto &t : workers)
        if (t.joinable()) t.join();
}

int FileServer::active_sessions() const {
    lock_guard<mutex> lock(sessions_mtx_);
    int active = 0;
    for (auto &p : sessions_)
        if (!p.second.finished) active++;
    return active;
}

void FileServer::bind_data_port(int session_id, int port) {
    lock_guard<mutex> lock(ports_mtx_);
    data_ports_[session_id] = port;
}

void FileServer::release_data_port(int session_id) {
    lock_guard<mutex> lock(ports_mtx_);
    data_ports_.erase(session_id);
}

int FileServer::data_port_of(int session_id) const {
    lock_guard<mutex> lock(ports_mtx_);
    auto it = data_ports_.find(session_id);
    return it == data_ports_.end() ? 0 : it->second;
}

size_t FileServer::pending_data_ports() const {
    lock_guard<mutex> lock(ports_mtx_);
    return data_ports_.size();
}

bool FileServer::lock_data_port(unique_lock<timed_mutex> &lease) {
    if (cfg_.data_port == 0) return true;
    // A holder keeps the lease for at most the READY wait plus the accept
    // wait, each bounded by data_timeout_ms.
    lease = unique_lock<timed_mutex>(shared_port_mtx_, defer_lock);
    return lease.try_lock_for(chrono::milliseconds(2 * cfg_.data_timeout_ms + 1000));
}
