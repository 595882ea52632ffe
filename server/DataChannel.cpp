#include "DataChannel.hpp"
#include "../common/Protocol.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>

using namespace std;

int open_listener(const string &host, int port, int backlog, string &err) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons((uint16_t)port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        err = "invalid listen address: " + host;
        return -1;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        err = string("socket: ") + strerror(errno);
        return -1;
    }
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (::bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        err = "bind " + host + ":" + to_string(port) + ": " + strerror(errno);
        ::close(fd);
        return -1;
    }
    if (::listen(fd, backlog) < 0) {
        err = string("listen: ") + strerror(errno);
        ::close(fd);
        return -1;
    }
    return fd;
}

int bound_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, (sockaddr*)&addr, &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

DataChannel::~DataChannel() {
    close();
}

bool DataChannel::open(const string &host, int port, string &err) {
    close();
    listen_fd_ = open_listener(host, port, 1, err);
    if (listen_fd_ < 0) return false;
    port_ = bound_port(listen_fd_);
    return true;
}

bool DataChannel::accept_one(int timeout_ms, string &err, int watch_fd) {
    if (listen_fd_ < 0) {
        err = "data channel not open";
        return false;
    }

    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    while (true) {
        auto left = chrono::duration_cast<chrono::milliseconds>(
                        deadline - chrono::steady_clock::now()).count();
        if (left <= 0) {
            err = proto::reason::DataChannelTimeout;
            close_listener();
            return false;
        }

        pollfd fds[2]{};
        fds[0].fd = listen_fd_;
        fds[0].events = POLLIN;
        nfds_t nfds = 1;
        if (watch_fd >= 0) {
            fds[1].fd = watch_fd;
            fds[1].events = POLLRDHUP;
            nfds = 2;
        }

        int rc = ::poll(fds, nfds, (int)left);
        if (rc < 0) {
            if (errno == EINTR) continue;
            err = string("poll: ") + strerror(errno);
            close_listener();
            return false;
        }
        if (rc == 0) continue;   // deadline check at loop top

        if (nfds == 2 && (fds[1].revents & (POLLRDHUP | POLLHUP | POLLERR))) {
            err = "control connection closed";
            close_listener();
            return false;
        }

        if (fds[0].revents & POLLIN) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (errno == EINTR || errno == ECONNABORTED) continue;
                err = string("accept: ") + strerror(errno);
                close_listener();
                return false;
            }
            conn_fd_ = fd;
            close_listener();   // single use
            return true;
        }
    }
}

void DataChannel::close_listener() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void DataChannel::close() {
    close_listener();
    if (conn_fd_ >= 0) {
        ::shutdown(conn_fd_, SHUT_RDWR);
        ::close(conn_fd_);
        conn_fd_ = -1;
    }
}
