#pragma once
#include <string>

using namespace std;

// One-shot listening endpoint for a single file transfer.
// open() -> port() goes into the OK line -> accept_one() -> conn_fd().
// The listener is closed as soon as one peer has been accepted.
class DataChannel {
public:
    DataChannel() = default;
    ~DataChannel();

    DataChannel(const DataChannel &) = delete;
    DataChannel &operator=(const DataChannel &) = delete;

    // port 0 = let the kernel pick an ephemeral port
    bool open(const string &host, int port, string &err);

    // Wait up to timeout_ms for the peer. If watch_fd is given and that
    // socket hangs up while waiting, give up early.
    // On timeout err is "DataChannelTimeout".
    bool accept_one(int timeout_ms, string &err, int watch_fd = -1);

    int port() const { return port_; }
    int conn_fd() const { return conn_fd_; }
    bool listening() const { return listen_fd_ >= 0; }

    void close();

private:
    void close_listener();

    int listen_fd_ = -1;
    int conn_fd_ = -1;
    int port_ = 0;
};

// Create, bind and listen on host:port. Returns the fd or -1 with err set.
int open_listener(const string &host, int port, int backlog, string &err);

// Actual port a bound socket ended up on
int bound_port(int fd);
