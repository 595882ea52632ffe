#pragma once
#include <string>
#include <cstdint>
#include <functional>

using namespace std;

namespace xfer {

constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

enum class TransferStatus {
    Complete,   // bytes == expected
    Truncated,  // peer closed (or socket failed) before expected bytes
    IoError     // local file could not be opened / read / written
};

struct TransferResult {
    TransferStatus status = TransferStatus::Complete;
    uint64_t bytes = 0;       // bytes delivered to the destination
    uint64_t wire_bytes = 0;  // bytes moved on the socket; > bytes only after a local write error
    uint64_t expected = 0;
    string error;

    bool complete() const { return status == TransferStatus::Complete; }
};

const char *status_name(TransferStatus s);

// Called after every chunk with (bytes so far, expected total).
using ProgressFn = function<void(uint64_t, uint64_t)>;

// Stream expected_size bytes of path to sockfd, chunk_size at a time.
TransferResult send_file(int sockfd,
                         const string &path,
                         uint64_t expected_size,
                         size_t chunk_size = DEFAULT_CHUNK_SIZE,
                         const ProgressFn &progress = nullptr);

// Create/truncate path and write exactly expected_size bytes read from
// sockfd. Stops early if the peer closes; the partial file stays on disk.
TransferResult receive_file(int sockfd,
                            const string &path,
                            uint64_t expected_size,
                            size_t chunk_size = DEFAULT_CHUNK_SIZE,
                            const ProgressFn &progress = nullptr);

} // namespace xfer
