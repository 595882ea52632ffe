#include "Protocol.hpp"
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cctype>

using namespace std;

namespace proto {

namespace {
const char *verb_of(CommandType t) {
    switch (t) {
    case CommandType::Upload:   return "UPLOAD";
    case CommandType::Download: return "DOWNLOAD";
    case CommandType::List:     return "LIST";
    case CommandType::Quit:     return "QUIT";
    default:                    return "";
    }
}
} // namespace

bool recv_line(int sockfd, string &line) {
    line.clear();
    char c;
    while (true) {
        ssize_t n = ::recv(sockfd, &c, 1, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;      // error or peer closed
        if (c == '\n') break;
        if (c != '\r') line.push_back(c);
    }
    while (!line.empty() && isspace((unsigned char)line.back())) line.pop_back();
    return true;
}

bool recv_line_within(int sockfd, string &line, int timeout_ms, bool &timed_out) {
    line.clear();
    timed_out = false;
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    char c;
    while (true) {
        auto left = chrono::duration_cast<chrono::milliseconds>(
                        deadline - chrono::steady_clock::now()).count();
        if (left <= 0) {
            timed_out = true;
            return false;
        }
        pollfd pfd{};
        pfd.fd = sockfd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, (int)left);
        if (rc < 0 && errno == EINTR) continue;
        if (rc < 0) return false;
        if (rc == 0) continue;   // deadline check at loop top

        ssize_t n = ::recv(sockfd, &c, 1, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        if (c == '\n') break;
        if (c != '\r') line.push_back(c);
    }
    while (!line.empty() && isspace((unsigned char)line.back())) line.pop_back();
    return true;
}

bool send_all(int sockfd, const void *buf, size_t len) {
    const char *p = static_cast<const char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::send(sockfd, p + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += (size_t)n;
    }
    return true;
}

bool recv_exact(int sockfd, void *buf, size_t len) {
    char *p = static_cast<char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::recv(sockfd, p + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += (size_t)n;
    }
    return true;
}

bool send_line(int sockfd, const string &line) {
    string tmp = line;
    while (!tmp.empty() && (tmp.back() == '\n' || tmp.back() == '\r')) tmp.pop_back();
    tmp.push_back('\n');
    return send_all(sockfd, tmp.data(), tmp.size());
}

vector<string> split_tokens(const string &s) {
    vector<string> tokens;
    string cur;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

bool parse_size(const string &s, uint64_t &out) {
    if (s.empty() || s.size() > 20) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        uint64_t d = (uint64_t)(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool parse_command(const string &line, Command &cmd, string &err) {
    cmd = Command{};
    cmd.raw = line;
    vector<string> tokens = split_tokens(line);
    if (tokens.empty()) {
        err = reason::BadSyntax;
        return false;
    }

    const string &verb = tokens[0];
    if (verb == "UPLOAD") {
        cmd.type = CommandType::Upload;
        if (tokens.size() != 3) {
            err = reason::BadSyntax;
            return false;
        }
        cmd.filename = tokens[1];
        if (!parse_size(tokens[2], cmd.size)) {
            err = reason::InvalidSize;
            return false;
        }
        return true;
    }
    if (verb == "DOWNLOAD") {
        cmd.type = CommandType::Download;
        if (tokens.size() != 2) {
            err = reason::BadSyntax;
            return false;
        }
        cmd.filename = tokens[1];
        return true;
    }
    if (verb == "LIST") {
        cmd.type = CommandType::List;
        return true;
    }
    if (verb == "QUIT") {
        cmd.type = CommandType::Quit;
        return true;
    }

    cmd.type = CommandType::Unknown;
    return true;
}

string format_command(const Command &cmd) {
    switch (cmd.type) {
    case CommandType::Upload:
        return string(verb_of(cmd.type)) + " " + cmd.filename + " " + to_string(cmd.size);
    case CommandType::Download:
        return string(verb_of(cmd.type)) + " " + cmd.filename;
    case CommandType::List:
    case CommandType::Quit:
        return verb_of(cmd.type);
    default:
        return cmd.raw;
    }
}

string ok_line() { return "OK"; }
string ok_line(uint64_t value) { return "OK " + to_string(value); }
string ok_line(uint64_t size, int data_port) {
    return "OK " + to_string(size) + " " + to_string(data_port);
}
string done_line() { return "DONE"; }
string error_line(const string &reason) { return "ERROR " + reason; }

Response parse_response(const string &line) {
    Response r;
    r.raw = line;
    vector<string> tok = split_tokens(line);
    if (tok.empty()) return r;

    if (tok[0] == "OK") {
        r.ok = true;
        for (size_t i = 1; i < tok.size(); ++i) {
            uint64_t v = 0;
            if (!parse_size(tok[i], v)) {
                r.ok = false;   // not a well-formed OK line
                return r;
            }
            r.values.push_back(v);
        }
    } else if (tok[0] == "DONE" && tok.size() == 1) {
        r.done = true;
    } else if (tok[0] == "ERROR") {
        r.error = true;
        if (tok.size() > 1) r.reason = tok[1];
    }
    return r;
}

} // namespace proto
