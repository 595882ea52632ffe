#pragma once
#include <string>
#include <vector>
#include <cstdint>

using namespace std;

struct TransferRecord {
    int id = 0;
    int session_id = 0;
    string direction;        // "upload" / "download"
    string filename;
    uint64_t declared_bytes = 0;
    uint64_t transferred_bytes = 0;
    string outcome;          // complete / truncated / io_error / timeout ...
};

// Audit store for sessions and transfers. Every call reports failure through
// the return value and err; callers log and carry on.
class Db {
public:
    virtual ~Db() = default;

    virtual bool init_schema(string &err) = 0;

    virtual bool begin_session(const string &remote_addr,
                               int &session_id,
                               string &err) = 0;

    virtual bool end_session(int session_id, string &err) = 0;

    virtual bool insert_transfer(const TransferRecord &rec, string &err) = 0;

    // Newest last
    virtual bool list_transfers(vector<TransferRecord> &out, string &err) = 0;

    virtual bool count_open_sessions(int &count, string &err) = 0;
};
