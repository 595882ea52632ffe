#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <sys/socket.h>
#include <unistd.h>

using namespace std;

namespace proto {

// Read one line terminated by '\n'. Reads byte by byte so that raw file bytes
// following the line on the same socket are left untouched.
// '\r' and trailing whitespace are stripped. false = EOF/error before '\n'.
bool recv_line(int sockfd, string &line);

// recv_line bounded by timeout_ms for the whole line. On expiry returns
// false with timed_out set; bytes already read are dropped.
bool recv_line_within(int sockfd, string &line, int timeout_ms, bool &timed_out);

// Send exactly len bytes
bool send_all(int sockfd, const void *buf, size_t len);

// Receive exactly len bytes
bool recv_exact(int sockfd, void *buf, size_t len);

// Send one text line; exactly one '\n' is appended
bool send_line(int sockfd, const string &line);

// Split on space/tab
vector<string> split_tokens(const string &s);

// ===== Commands =====
enum class CommandType { Upload, Download, List, Quit, Unknown };

struct Command {
    CommandType type = CommandType::Unknown;
    string filename;
    uint64_t size = 0;
    string raw;
};

// Error reasons carried in "ERROR <reason>" lines
namespace reason {
constexpr const char *UnknownCommand     = "UnknownCommand";
constexpr const char *BadSyntax          = "BadSyntax";
constexpr const char *InvalidSize        = "InvalidSize";
constexpr const char *InvalidFilename    = "InvalidFilename";
constexpr const char *FileNotFound       = "FileNotFound";
constexpr const char *TransferShortfall  = "TransferShortfall";
constexpr const char *WriteFailed        = "WriteFailed";
constexpr const char *ReadFailed         = "ReadFailed";
constexpr const char *DataChannelTimeout = "DataChannelTimeout";
constexpr const char *DataChannelFailed  = "DataChannelFailed";
constexpr const char *DataChannelBusy    = "DataChannelBusy";
constexpr const char *NotReady           = "NotReady";
constexpr const char *ServerBusy         = "ServerBusy";
} // namespace reason

// Parse one command line. Unknown verbs give CommandType::Unknown and true.
// A known verb with missing or malformed arguments returns false and puts the
// reason (BadSyntax / InvalidSize) in err.
bool parse_command(const string &line, Command &cmd, string &err);

// Non-negative decimal integer, no sign, no trailing garbage
bool parse_size(const string &s, uint64_t &out);

string format_command(const Command &cmd);

// ===== Responses =====
string ok_line();
string ok_line(uint64_t value);
string ok_line(uint64_t size, int data_port);
string done_line();
string error_line(const string &reason);

struct Response {
    bool ok = false;
    bool done = false;
    bool error = false;
    string reason;            // ERROR <reason>
    vector<uint64_t> values;  // numbers after OK
    string raw;
};

// Classify a server line. Lines that are none of OK/DONE/ERROR have all
// flags false (LIST entries).
Response parse_response(const string &line);

} // namespace proto
