#include "Transfer.hpp"
#include "Protocol.hpp"
#include <sys/socket.h>
#include <fstream>
#include <vector>
#include <cerrno>
#include <cstring>

using namespace std;

namespace xfer {

const char *status_name(TransferStatus s) {
    switch (s) {
    case TransferStatus::Complete:  return "complete";
    case TransferStatus::Truncated: return "truncated";
    case TransferStatus::IoError:   return "io_error";
    }
    return "unknown";
}

TransferResult send_file(int sockfd,
                         const string &path,
                         uint64_t expected_size,
                         size_t chunk_size,
                         const ProgressFn &progress) {
    TransferResult res;
    res.expected = expected_size;
    if (chunk_size == 0) chunk_size = DEFAULT_CHUNK_SIZE;

    ifstream ifs(path, ios::binary);
    if (!ifs) {
        res.status = TransferStatus::IoError;
        res.error = "Cannot open " + path;
        return res;
    }

    vector<char> buf(chunk_size);
    while (res.bytes < expected_size) {
        uint64_t remaining = expected_size - res.bytes;
        size_t chunk = remaining > chunk_size ? chunk_size : (size_t)remaining;
        ifs.read(buf.data(), (streamsize)chunk);
        streamsize got = ifs.gcount();
        if (got <= 0) {
            // File shrank under us
            if (ifs.bad()) {
                res.status = TransferStatus::IoError;
                res.error = "Read error on " + path;
            } else {
                res.status = TransferStatus::Truncated;
                res.error = "Source file ended early";
            }
            return res;
        }
        if (!proto::send_all(sockfd, buf.data(), (size_t)got)) {
            res.status = TransferStatus::Truncated;
            res.error = "Peer closed during send";
            return res;
        }
        res.bytes += (uint64_t)got;
        res.wire_bytes = res.bytes;
        if (progress) progress(res.bytes, expected_size);
    }

    res.status = TransferStatus::Complete;
    return res;
}

TransferResult receive_file(int sockfd,
                            const string &path,
                            uint64_t expected_size,
                            size_t chunk_size,
                            const ProgressFn &progress) {
    TransferResult res;
    res.expected = expected_size;
    if (chunk_size == 0) chunk_size = DEFAULT_CHUNK_SIZE;

    ofstream ofs(path, ios::binary | ios::trunc);
    if (!ofs) {
        res.status = TransferStatus::IoError;
        res.error = "Cannot open " + path + " for writing";
        return res;
    }

    vector<char> buf(chunk_size);
    while (res.bytes < expected_size) {
        uint64_t remaining = expected_size - res.bytes;
        size_t want = remaining > chunk_size ? chunk_size : (size_t)remaining;
        ssize_t n = ::recv(sockfd, buf.data(), want, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            res.status = TransferStatus::Truncated;
            res.error = n == 0 ? "Peer closed early"
                               : string("recv: ") + strerror(errno);
            ofs.flush();
            return res;
        }
        res.wire_bytes += (uint64_t)n;
        ofs.write(buf.data(), (streamsize)n);
        if (!ofs) {
            res.status = TransferStatus::IoError;
            res.error = "Write error on " + path;
            return res;
        }
        res.bytes += (uint64_t)n;
        if (progress) progress(res.bytes, expected_size);
    }

    ofs.flush();
    if (!ofs) {
        res.status = TransferStatus::IoError;
        res.error = "Write error on " + path;
        return res;
    }
    res.status = TransferStatus::Complete;
    return res;
}

} // namespace xfer
