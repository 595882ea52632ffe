#pragma once
#include <string>
#include <atomic>
#include <memory>
#include <mutex>
#include <map>
#include <thread>
#include <cstdint>
#include "Logger.hpp"
#include "Db.hpp"
#include "ServerConfig.hpp"

using namespace std;

class FileServer {
public:
    explicit FileServer(const ServerConfig &cfg);
    ~FileServer();

    // Create the storage directory, open the audit DB and bind the control
    // port. Must succeed before run().
    bool start(string &err);

    // Accept loop; returns after stop()
    void run();

    // Stop accepting, hang up every live session and join their threads.
    void stop();

    int port() const { return port_; }
    const ServerConfig &config() const { return cfg_; }
    const string &root_dir() const { return cfg_.storage_dir; }

    Logger &logger() { return logger_; }

    // nullptr when the audit DB is disabled or failed to open
    Db *audit() { return db_ok_ ? db_.get() : nullptr; }

    void add_bytes_in(uint64_t n)  { bytes_in_  += n; }
    void add_bytes_out(uint64_t n) { bytes_out_ += n; }
    uint64_t bytes_in()  const { return bytes_in_.load(); }
    uint64_t bytes_out() const { return bytes_out_.load(); }

    // ===== SESSION REGISTRY =====
    int active_sessions() const;
    uint64_t total_sessions() const { return total_sessions_.load(); }

    // ===== DATA PORT TABLE =====
    // session id -> data port while a transfer waits for its peer
    void bind_data_port(int session_id, int port);
    void release_data_port(int session_id);
    int data_port_of(int session_id) const;   // 0 = none
    size_t pending_data_ports() const;

    // Fixed data port mode: only one session may have the shared port open.
    // Ephemeral mode: always true and lease stays empty.
    bool lock_data_port(unique_lock<timed_mutex> &lease);

private:
    struct SessionEntry {
        int sockfd = -1;
        string peer;
        bool finished = false;
        thread worker;
    };

    void spawn_session(int connfd, const string &peer);
    void session_finished(int id);
    void reap_finished();

    ServerConfig cfg_;
    int port_ = 0;
    int listen_fd_ = -1;
    atomic<bool> running_{false};

    Logger logger_;
    unique_ptr<Db> db_;
    bool db_ok_ = false;

    atomic<uint64_t> bytes_in_{0};
    atomic<uint64_t> bytes_out_{0};
    atomic<uint64_t> total_sessions_{0};

    mutable mutex sessions_mtx_;
    map<int, SessionEntry> sessions_;
    int next_session_id_ = 1;

    mutable mutex ports_mtx_;
    map<int, int> data_ports_;
    timed_mutex shared_port_mtx_;
};
