#pragma once
#include <string>
#include <cstdint>
#include <vector>

using namespace std;

enum class TransferMode {
    Single, // file bytes follow the OK line on the control socket
    Dual    // file bytes go over a one-shot data connection
};

struct ServerConfig {
    string host          = "0.0.0.0";
    int control_port     = 5001;
    int data_port        = 0;        // 0 = fresh ephemeral port per transfer
    TransferMode mode    = TransferMode::Dual;
    size_t chunk_size    = 4096;
    string storage_dir   = "server_files";
    int max_sessions     = 0;        // 0 = unlimited
    int data_timeout_ms  = 10000;
    string log_path      = "server.log";
    string db_path       = "fileshuttle.db";
    bool log_to_stdout   = true;
};

const char *mode_name(TransferMode m);
bool parse_mode(const string &s, TransferMode &out);

// Apply FSH_* environment variables on top of cfg.
bool load_config_from_env(ServerConfig &cfg, string &err);

// Apply "--flag value" options on top of cfg.
bool load_config_from_args(const vector<string> &args, ServerConfig &cfg, string &err);

string config_usage();
