#include "DbSqlite.hpp"

DbSqlite::DbSqlite(const string &db_path) : db_path_(db_path) {
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        open_err_ = db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(db_, 2000);
    char *errmsg = nullptr;
    sqlite3_exec(db_, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &errmsg);
    if (errmsg) sqlite3_free(errmsg);
}

DbSqlite::~DbSqlite() {
    if (db_) sqlite3_close(db_);
}

bool DbSqlite::init_schema(string &err) {
    if (!db_) {
        err = "Cannot open SQLite: " + open_err_;
        return false;
    }

    const char *sql_tables = R"SQL(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS client_session (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    remote_addr TEXT NOT NULL,
    started_at  DATETIME DEFAULT CURRENT_TIMESTAMP,
    ended_at    DATETIME
);

CREATE TABLE IF NOT EXISTS transfer_log (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id        INTEGER,
    direction         TEXT NOT NULL,
    filename          TEXT NOT NULL,
    declared_bytes    INTEGER NOT NULL,
    transferred_bytes INTEGER NOT NULL,
    outcome           TEXT NOT NULL,
    created_at        DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY(session_id) REFERENCES client_session(id) ON DELETE SET NULL
);

CREATE INDEX IF NOT EXISTS idx_transfer_log_filename
    ON transfer_log(filename);
)SQL";

    lock_guard<mutex> lock(mtx_);
    char *errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql_tables, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        err = errmsg ? errmsg : "Unknown SQLite error";
        if (errmsg) sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool DbSqlite::begin_session(const string &remote_addr,
                             int &session_id,
                             string &err) {
    if (!db_) { err = "DB not open"; return false; }
    const char *sql =
        "INSERT INTO client_session (remote_addr) VALUES (?);";

    lock_guard<mutex> lock(mtx_);
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, remote_addr.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    session_id = (int)sqlite3_last_insert_rowid(db_);
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::end_session(int session_id, string &err) {
    if (!db_) { err = "DB not open"; return false; }
    const char *sql =
        "UPDATE client_session SET ended_at = CURRENT_TIMESTAMP WHERE id = ?;";

    lock_guard<mutex> lock(mtx_);
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_int(stmt, 1, session_id);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::insert_transfer(const TransferRecord &rec, string &err) {
    if (!db_) { err = "DB not open"; return false; }
    const char *sql =
        "INSERT INTO transfer_log (session_id, direction, filename, "
        "declared_bytes, transferred_bytes, outcome) "
        "VALUES (?, ?, ?, ?, ?, ?);";

    lock_guard<mutex> lock(mtx_);
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    if (rec.session_id > 0)
        sqlite3_bind_int(stmt, 1, rec.session_id);
    else
        sqlite3_bind_null(stmt, 1);
    sqlite3_bind_text(stmt, 2, rec.direction.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, rec.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, (sqlite3_int64)rec.declared_bytes);
    sqlite3_bind_int64(stmt, 5, (sqlite3_int64)rec.transferred_bytes);
    sqlite3_bind_text(stmt, 6, rec.outcome.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::list_transfers(vector<TransferRecord> &out, string &err) {
    if (!db_) { err = "DB not open"; return false; }
    const char *sql =
        "SELECT id, IFNULL(session_id, 0), direction, filename, "
        "declared_bytes, transferred_bytes, outcome "
        "FROM transfer_log ORDER BY id ASC;";

    lock_guard<mutex> lock(mtx_);
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    out.clear();
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        TransferRecord r;
        r.id                = sqlite3_column_int(stmt, 0);
        r.session_id        = sqlite3_column_int(stmt, 1);
        r.direction         = (const char*)sqlite3_column_text(stmt, 2);
        r.filename          = (const char*)sqlite3_column_text(stmt, 3);
        r.declared_bytes    = (uint64_t)sqlite3_column_int64(stmt, 4);
        r.transferred_bytes = (uint64_t)sqlite3_column_int64(stmt, 5);
        r.outcome           = (const char*)sqlite3_column_text(stmt, 6);
        out.push_back(r);
    }
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::count_open_sessions(int &count, string &err) {
    if (!db_) { err = "DB not open"; return false; }
    const char *sql =
        "SELECT COUNT(*) FROM client_session WHERE ended_at IS NULL;";

    lock_guard<mutex> lock(mtx_);
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }
    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    count = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    return true;
}
