#pragma once
#include "Db.hpp"
#include <sqlite3.h>
#include <mutex>

using namespace std;

class DbSqlite : public Db {
public:
    explicit DbSqlite(const string &db_path);
    ~DbSqlite() override;

    bool is_open() const { return db_ != nullptr; }
    const string &open_error() const { return open_err_; }

    bool init_schema(string &err) override;

    bool begin_session(const string &remote_addr,
                       int &session_id,
                       string &err) override;

    bool end_session(int session_id, string &err) override;

    bool insert_transfer(const TransferRecord &rec, string &err) override;

    bool list_transfers(vector<TransferRecord> &out, string &err) override;

    bool count_open_sessions(int &count, string &err) override;

private:
    string db_path_;
    string open_err_;
    sqlite3 *db_ = nullptr;
    mutex mtx_;
};
