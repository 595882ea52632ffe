#include "NetworkClient.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

using namespace std;
using namespace proto;

int tcp_connect(const string &host, int port, string &err) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), to_string(port).c_str(), &hints, &res);
    if (rc != 0) {
        err = "Resolve " + host + ": " + gai_strerror(rc);
        return -1;
    }

    int fd = -1;
    int last_errno = 0;
    for (addrinfo *ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    if (fd < 0) err = "Connect " + host + ":" + to_string(port) + ": " + strerror(last_errno);
    ::freeaddrinfo(res);
    return fd;
}

NetworkClient::NetworkClient() {}

NetworkClient::~NetworkClient() {
    close();
}

bool NetworkClient::connect_to(const string &host, int port) {
    close();
    string err;
    sockfd_ = tcp_connect(host, port, err);
    if (sockfd_ < 0) return false;
    host_ = host;
    return true;
}

void NetworkClient::close() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
}

int NetworkClient::connect_data(int port, string &err) {
    return tcp_connect(host_, port, err);
}

// After a failed data connection the server still ends the command with one
// control line (DONE or ERROR ...). Read it so the next command starts clean.
void NetworkClient::consume_final_reply(string &err) {
    string line;
    if (!recv_line(sockfd_, line)) {
        close();
        err += " (connection closed)";
        return;
    }
    err += " (server: " + line + ")";
}

bool NetworkClient::upload_file(const string &local_path,
                                const string &remote_name,
                                string &err,
                                const xfer::ProgressFn &progress) {
    if (sockfd_ < 0) {
        err = "Not connected";
        return false;
    }
    if (!utils::file_exists(local_path)) {
        err = "Local file not found: " + local_path;
        return false;
    }
    uint64_t size = utils::file_size(local_path);

    Command cmd;
    cmd.type = CommandType::Upload;
    cmd.filename = remote_name;
    cmd.size = size;
    if (!send_line(sockfd_, format_command(cmd))) {
        err = "Send error";
        return false;
    }

    string line;
    if (!recv_line(sockfd_, line)) {
        err = "No response";
        return false;
    }
    Response resp = parse_response(line);
    if (!resp.ok || resp.values.size() > 1) {
        err = line;
        return false;
    }

    int data_fd = sockfd_;
    if (resp.values.size() == 1) {
        data_fd = connect_data((int)resp.values[0], err);
        if (data_fd < 0) {
            consume_final_reply(err);
            return false;
        }
    }

    xfer::TransferResult res = xfer::send_file(data_fd, local_path, size, chunk_size_, progress);
    if (data_fd != sockfd_) ::close(data_fd);

    if (!res.complete()) {
        err = "Upload " + string(xfer::status_name(res.status)) + ": " + res.error;
        // The server is still waiting for the rest on the control socket
        if (data_fd == sockfd_) close();
        else consume_final_reply(err);
        return false;
    }

    if (!recv_line(sockfd_, line)) {
        err = "No final response";
        return false;
    }
    if (!parse_response(line).done) {
        err = line;
        return false;
    }
    return true;
}

bool NetworkClient::download_file(const string &remote_name,
                                  const string &local_path,
                                  string &err,
                                  const xfer::ProgressFn &progress) {
    if (sockfd_ < 0) {
        err = "Not connected";
        return false;
    }

    Command cmd;
    cmd.type = CommandType::Download;
    cmd.filename = remote_name;
    if (!send_line(sockfd_, format_command(cmd))) {
        err = "Send error";
        return false;
    }

    string line;
    if (!recv_line(sockfd_, line)) {
        err = "No response";
        return false;
    }
    Response resp = parse_response(line);
    if (!resp.ok || resp.values.empty() || resp.values.size() > 2) {
        err = line;
        return false;
    }
    uint64_t size = resp.values[0];

    int data_fd = sockfd_;
    if (resp.values.size() == 2) {
        if (!send_line(sockfd_, "READY")) {
            err = "Send error";
            return false;
        }
        data_fd = connect_data((int)resp.values[1], err);
        if (data_fd < 0) {
            consume_final_reply(err);
            return false;
        }
    }

    xfer::TransferResult res = xfer::receive_file(data_fd, local_path, size, chunk_size_, progress);
    if (data_fd != sockfd_) ::close(data_fd);

    if (!res.complete()) {
        err = "Download " + string(xfer::status_name(res.status)) + ": " + res.error;
        if (data_fd == sockfd_) close();
        else consume_final_reply(err);
        return false;
    }

    if (!recv_line(sockfd_, line)) {
        err = "No final response";
        return false;
    }
    if (!parse_response(line).done) {
        err = line;
        return false;
    }
    return true;
}

bool NetworkClient::list_files(vector<string> &names, string &err) {
    names.clear();
    if (sockfd_ < 0) {
        err = "Not connected";
        return false;
    }
    if (!send_line(sockfd_, "LIST")) {
        err = "Send error";
        return false;
    }

    string line;
    if (!recv_line(sockfd_, line)) {
        err = "No response";
        return false;
    }
    if (!parse_response(line).ok) {
        err = line;
        return false;
    }

    while (true) {
        if (!recv_line(sockfd_, line)) {
            err = "Connection closed during LIST";
            return false;
        }
        if (line == "DONE") break;
        names.push_back(line);
    }
    return true;
}

bool NetworkClient::quit(string &err) {
    if (sockfd_ < 0) {
        err = "Not connected";
        return false;
    }
    string line;
    bool ok = send_line(sockfd_, "QUIT") && recv_line(sockfd_, line);
    close();
    if (!ok) {
        err = "No response";
        return false;
    }
    if (!parse_response(line).ok) {
        err = line;
        return false;
    }
    return true;
}

bool NetworkClient::send_raw_command(const string &cmd, string &out, string &err) {
    if (sockfd_ < 0) {
        err = "Not connected";
        return false;
    }
    if (!send_line(sockfd_, cmd)) {
        err = "Send error";
        return false;
    }
    if (!recv_line(sockfd_, out)) {
        err = "No response";
        return false;
    }
    return true;
}
