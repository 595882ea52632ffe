#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "../common/Transfer.hpp"

using namespace std;

// Client side of the control protocol. Works against both server modes: the
// shape of the OK reply tells whether bytes go over the control socket or a
// separate data connection.
class NetworkClient {
public:
    NetworkClient();
    ~NetworkClient();

    NetworkClient(const NetworkClient &) = delete;
    NetworkClient &operator=(const NetworkClient &) = delete;

    bool connect_to(const string &host, int port);
    void close();
    bool connected() const { return sockfd_ >= 0; }

    void set_chunk_size(size_t n) { chunk_size_ = n; }

    // Upload local_path under remote_name
    bool upload_file(const string &local_path,
                     const string &remote_name,
                     string &err,
                     const xfer::ProgressFn &progress = nullptr);

    bool download_file(const string &remote_name,
                       const string &local_path,
                       string &err,
                       const xfer::ProgressFn &progress = nullptr);

    bool list_files(vector<string> &names, string &err);

    bool quit(string &err);

    // Send one line and read one reply line
    bool send_raw_command(const string &cmd, string &out, string &err);

    int control_fd() const { return sockfd_; }

private:
    int connect_data(int port, string &err);
    void consume_final_reply(string &err);

    int sockfd_ = -1;
    string host_;
    size_t chunk_size_ = xfer::DEFAULT_CHUNK_SIZE;
};

// TCP connect to host:port (IPv4 dotted or resolvable name). -1 on failure.
int tcp_connect(const string &host, int port, string &err);
