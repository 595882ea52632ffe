#include "ServerConfig.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace std;

namespace {

bool parse_int(const string &s, int lo, int hi, int &out) {
    try {
        size_t pos = 0;
        long v = stol(s, &pos);
        if (pos != s.size() || v < lo || v > hi) return false;
        out = (int)v;
        return true;
    } catch (const exception &) {
        return false;
    }
}

// One key -> setter, shared by env and argv loading
bool apply_option(const string &key, const string &value, ServerConfig &cfg, string &err) {
    int n = 0;
    if (key == "host") {
        if (value.empty()) { err = "host must not be empty"; return false; }
        cfg.host = value;
    } else if (key == "port") {
        if (!parse_int(value, 0, 65535, n)) { err = "invalid port: " + value; return false; }
        cfg.control_port = n;
    } else if (key == "data-port") {
        if (!parse_int(value, 0, 65535, n)) { err = "invalid data port: " + value; return false; }
        cfg.data_port = n;
    } else if (key == "mode") {
        if (!parse_mode(value, cfg.mode)) { err = "invalid mode: " + value + " (single|dual)"; return false; }
    } else if (key == "chunk-size") {
        if (!parse_int(value, 1, 16 * 1024 * 1024, n)) { err = "invalid chunk size: " + value; return false; }
        cfg.chunk_size = (size_t)n;
    } else if (key == "storage") {
        if (value.empty()) { err = "storage dir must not be empty"; return false; }
        cfg.storage_dir = value;
    } else if (key == "max-sessions") {
        if (!parse_int(value, 0, 1000000, n)) { err = "invalid max sessions: " + value; return false; }
        cfg.max_sessions = n;
    } else if (key == "data-timeout-ms") {
        if (!parse_int(value, 1, 3600 * 1000, n)) { err = "invalid data timeout: " + value; return false; }
        cfg.data_timeout_ms = n;
    } else if (key == "log") {
        cfg.log_path = value;
    } else if (key == "db") {
        cfg.db_path = value;
    } else if (key == "quiet") {
        cfg.log_to_stdout = !(value == "1" || value == "true");
    } else {
        err = "unknown option: " + key;
        return false;
    }
    return true;
}

} // namespace

const char *mode_name(TransferMode m) {
    return m == TransferMode::Single ? "single" : "dual";
}

bool parse_mode(const string &s, TransferMode &out) {
    if (s == "single") { out = TransferMode::Single; return true; }
    if (s == "dual")   { out = TransferMode::Dual;   return true; }
    return false;
}

bool load_config_from_env(ServerConfig &cfg, string &err) {
    static const pair<const char*, const char*> vars[] = {
        {"FSH_HOST",            "host"},
        {"FSH_PORT",            "port"},
        {"FSH_DATA_PORT",       "data-port"},
        {"FSH_MODE",            "mode"},
        {"FSH_CHUNK_SIZE",      "chunk-size"},
        {"FSH_STORAGE_DIR",     "storage"},
        {"FSH_MAX_SESSIONS",    "max-sessions"},
        {"FSH_DATA_TIMEOUT_MS", "data-timeout-ms"},
        {"FSH_LOG_PATH",        "log"},
        {"FSH_DB_PATH",         "db"},
        {"FSH_QUIET",           "quiet"},
    };
    for (const auto &v : vars) {
        const char *p = ::getenv(v.first);
        if (!p) continue;
        if (!apply_option(v.second, p, cfg, err)) {
            err = string(v.first) + ": " + err;
            return false;
        }
    }
    return true;
}

bool load_config_from_args(const vector<string> &args, ServerConfig &cfg, string &err) {
    for (size_t i = 0; i < args.size(); ++i) {
        const string &a = args[i];
        if (a.rfind("--", 0) != 0) {
            err = "unexpected argument: " + a;
            return false;
        }
        string key = a.substr(2);
        if (key == "quiet") {
            cfg.log_to_stdout = false;
            continue;
        }
        if (i + 1 >= args.size()) {
            err = "missing value for " + a;
            return false;
        }
        if (!apply_option(key, args[++i], cfg, err)) return false;
    }
    return true;
}

string config_usage() {
    return "Options (env FSH_* equivalents):\n"
           "  --host <addr>            listen address (0.0.0.0)\n"
           "  --port <n>               control port (5001)\n"
           "  --data-port <n>          fixed data port, 0 = ephemeral per transfer (0)\n"
           "  --mode single|dual       transfer over control socket or data channel (dual)\n"
           "  --chunk-size <n>         transfer chunk size in bytes (4096)\n"
           "  --storage <dir>          storage directory (server_files)\n"
           "  --max-sessions <n>       concurrent session cap, 0 = unlimited (0)\n"
           "  --data-timeout-ms <n>    data channel accept timeout (10000)\n"
           "  --log <path>             log file, empty = none (server.log)\n"
           "  --db <path>              SQLite audit database (fileshuttle.db)\n"
           "  --quiet                  do not echo log lines to stdout\n";
}
