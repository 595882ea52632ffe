#include "ClientSession.hpp"
#include "FileServer.hpp"
#include "DataChannel.hpp"
#include "../common/Utils.hpp"
#include <memory>
#include <mutex>
#include <vector>

using namespace std;
using namespace proto;

namespace {

// Feeds per-chunk progress into the server-wide byte counters
xfer::ProgressFn byte_counter(FileServer &server, bool inbound) {
    auto last = make_shared<uint64_t>(0);
    return [&server, inbound, last](uint64_t done, uint64_t) {
        uint64_t delta = done - *last;
        *last = done;
        if (inbound) server.add_bytes_in(delta);
        else         server.add_bytes_out(delta);
    };
}

// Releases the session's entry in the data port table
struct PortBinding {
    FileServer &server;
    int session_id;
    ~PortBinding() { release(); }
    void release() { server.release_data_port(session_id); }
};

} // namespace

const char *state_name(SessionState s) {
    switch (s) {
    case SessionState::AwaitingCommand:    return "AWAITING_COMMAND";
    case SessionState::ProcessingUpload:   return "PROCESSING_UPLOAD";
    case SessionState::ProcessingDownload: return "PROCESSING_DOWNLOAD";
    case SessionState::ProcessingList:     return "PROCESSING_LIST";
    case SessionState::Closed:             return "CLOSED";
    }
    return "?";
}

ClientSession::ClientSession(int id, int sockfd, const string &peer, FileServer &server)
    : id_(id),
      sockfd_(sockfd),
      peer_(peer),
      tag_("#" + to_string(id) + " " + peer),
      server_(server) {
    if (Db *db = server_.audit()) {
        string err;
        if (!db->begin_session(peer_, audit_session_id_, err))
            server_.logger().warn(tag_, "Audit begin_session failed: " + err);
    }
}

ClientSession::~ClientSession() {
    if (Db *db = server_.audit()) {
        string err;
        if (audit_session_id_ > 0 && !db->end_session(audit_session_id_, err))
            server_.logger().warn(tag_, "Audit end_session failed: " + err);
    }
}

void ClientSession::run() {
    string line;
    while (state_ != SessionState::Closed) {
        if (!recv_line(sockfd_, line)) {
            server_.logger().log(tag_, "Connection closed by peer");
            break;
        }
        // Blank line at the start of a command cycle = client hung up
        if (line.empty()) {
            server_.logger().log(tag_, "Empty command line, closing");
            break;
        }
        if (!handle_command(line)) {
            if (state_ != SessionState::Closed)
                server_.logger().log(tag_, string("Session ended in ") + state_name(state_));
            break;
        }
        state_ = SessionState::AwaitingCommand;
    }
    state_ = SessionState::Closed;
}

bool ClientSession::handle_command(const string &line) {
    Command cmd;
    string err;
    if (!parse_command(line, cmd, err)) {
        server_.logger().warn(tag_, "Bad command \"" + line + "\": " + err);
        return reply_error(err);
    }

    switch (cmd.type) {
    case CommandType::Upload:   return cmd_upload(cmd);
    case CommandType::Download: return cmd_download(cmd);
    case CommandType::List:     return cmd_list();
    case CommandType::Quit:     return cmd_quit();
    case CommandType::Unknown:  break;
    }

    server_.logger().warn(tag_, "Unknown command: " + split_tokens(line)[0]);
    return reply_error(reason::UnknownCommand);
}

bool ClientSession::reply(const string &line) {
    if (send_line(sockfd_, line)) return true;
    server_.logger().warn(tag_, "Send failed, dropping session");
    return false;
}

bool ClientSession::reply_error(const string &reason) {
    return reply(error_line(reason));
}

string ClientSession::storage_path(const string &filename) const {
    return utils::join_path(server_.root_dir(), filename);
}

bool ClientSession::drain(uint64_t n) {
    vector<char> buf(server_.config().chunk_size);
    while (n > 0) {
        size_t chunk = n > buf.size() ? buf.size() : (size_t)n;
        if (!recv_exact(sockfd_, buf.data(), chunk)) return false;
        n -= chunk;
    }
    return true;
}

bool ClientSession::open_data_channel(DataChannel &ch, bool &alive) {
    string err;
    if (!ch.open(server_.config().host, server_.config().data_port, err)) {
        server_.logger().error(tag_, "Data channel open failed: " + err);
        alive = reply_error(reason::DataChannelFailed);
        return false;
    }
    server_.bind_data_port(id_, ch.port());
    return true;
}

bool ClientSession::accept_data_peer(DataChannel &ch, bool &alive) {
    string err;
    if (ch.accept_one(server_.config().data_timeout_ms, err, sockfd_)) return true;
    server_.release_data_port(id_);

    if (err == reason::DataChannelTimeout) {
        server_.logger().warn(tag_, "Data connection timeout on port " + to_string(ch.port()));
        alive = reply_error(reason::DataChannelTimeout);
    } else {
        server_.logger().warn(tag_, "Data connection failed: " + err);
        alive = false;
    }
    return false;
}

void ClientSession::record_transfer(const char *direction,
                                    const string &filename,
                                    uint64_t declared,
                                    uint64_t transferred,
                                    const string &outcome) {
    Db *db = server_.audit();
    if (!db) return;
    TransferRecord rec;
    rec.session_id = audit_session_id_;
    rec.direction = direction;
    rec.filename = filename;
    rec.declared_bytes = declared;
    rec.transferred_bytes = transferred;
    rec.outcome = outcome;
    string err;
    if (!db->insert_transfer(rec, err))
        server_.logger().warn(tag_, "Audit insert_transfer failed: " + err);
}

bool ClientSession::cmd_upload(const Command &cmd) {
    if (!utils::is_plain_filename(cmd.filename)) {
        server_.logger().warn(tag_, "UPLOAD rejected, bad filename: " + cmd.filename);
        return reply_error(reason::InvalidFilename);
    }

    const ServerConfig &cfg = server_.config();
    const bool dual = cfg.mode == TransferMode::Dual;
    const string full_path = storage_path(cmd.filename);
    server_.logger().log(tag_, "UPLOAD " + cmd.filename + " (" + to_string(cmd.size) + " bytes)");

    state_ = SessionState::ProcessingUpload;

    unique_lock<timed_mutex> lease;
    DataChannel ch;
    PortBinding binding{server_, id_};
    int data_fd = sockfd_;

    if (dual) {
        if (!server_.lock_data_port(lease)) {
            server_.logger().warn(tag_, "Shared data port busy");
            return reply_error(reason::DataChannelBusy);
        }
        bool alive = true;
        if (!open_data_channel(ch, alive)) return alive;
        if (!reply(ok_line((uint64_t)ch.port()))) return false;
        if (!accept_data_peer(ch, alive)) {
            record_transfer("upload", cmd.filename, cmd.size, 0, "timeout");
            return alive;
        }
        if (lease.owns_lock()) lease.unlock();   // listener is gone, port free
        data_fd = ch.conn_fd();
    } else {
        if (!reply(ok_line())) return false;
    }

    xfer::TransferResult res = xfer::receive_file(data_fd, full_path, cmd.size,
                                                  cfg.chunk_size,
                                                  byte_counter(server_, true));
    ch.close();
    binding.release();
    record_transfer("upload", cmd.filename, cmd.size, res.bytes, xfer::status_name(res.status));

    if (res.complete()) {
        server_.logger().log(tag_, "UPLOAD complete: " + cmd.filename +
                                   " saved (" + to_string(res.bytes) + " bytes)");
        return reply(done_line());
    }

    // Never leave a half-written file under the client's name
    if (utils::file_exists(full_path) && !utils::remove_file(full_path))
        server_.logger().error(tag_, "Cannot remove partial file " + full_path);

    if (res.status == xfer::TransferStatus::Truncated) {
        server_.logger().warn(tag_, "UPLOAD short: " + cmd.filename + " " +
                                    to_string(res.bytes) + "/" + to_string(res.expected) +
                                    " (" + res.error + ")");
        if (!dual) return false;   // the control connection itself is gone
        return reply_error(reason::TransferShortfall);
    }

    server_.logger().error(tag_, "UPLOAD failed: " + res.error);
    if (!dual && !drain(cmd.size - res.wire_bytes)) return false;
    return reply_error(reason::WriteFailed);
}

bool ClientSession::cmd_download(const Command &cmd) {
    if (!utils::is_plain_filename(cmd.filename)) {
        server_.logger().warn(tag_, "DOWNLOAD rejected, bad filename: " + cmd.filename);
        return reply_error(reason::InvalidFilename);
    }

    const string full_path = storage_path(cmd.filename);
    if (!utils::file_exists(full_path)) {
        server_.logger().log(tag_, "DOWNLOAD file not found: " + cmd.filename);
        return reply_error(reason::FileNotFound);
    }

    const ServerConfig &cfg = server_.config();
    const bool dual = cfg.mode == TransferMode::Dual;
    const uint64_t size = utils::file_size(full_path);
    server_.logger().log(tag_, "DOWNLOAD " + cmd.filename + " (" + to_string(size) + " bytes)");

    state_ = SessionState::ProcessingDownload;

    unique_lock<timed_mutex> lease;
    DataChannel ch;
    PortBinding binding{server_, id_};
    int data_fd = sockfd_;

    if (dual) {
        if (!server_.lock_data_port(lease)) {
            server_.logger().warn(tag_, "Shared data port busy");
            return reply_error(reason::DataChannelBusy);
        }
        bool alive = true;
        if (!open_data_channel(ch, alive)) return alive;
        if (!reply(ok_line(size, ch.port()))) return false;

        // Client opens its local file first, then says READY. The wait is
        // bounded: on a fixed data port the lease is held meanwhile.
        string ready;
        bool timed_out = false;
        if (!recv_line_within(sockfd_, ready, cfg.data_timeout_ms, timed_out)) {
            if (!timed_out) return false;
            binding.release();
            ch.close();
            server_.logger().warn(tag_, "DOWNLOAD aborted, no READY within " +
                                        to_string(cfg.data_timeout_ms) + " ms");
            record_transfer("download", cmd.filename, size, 0, "timeout");
            return reply_error(reason::DataChannelTimeout);
        }
        if (ready != "READY") {
            binding.release();
            server_.logger().warn(tag_, "DOWNLOAD aborted, expected READY, got \"" + ready + "\"");
            return reply_error(reason::NotReady);
        }
        if (!accept_data_peer(ch, alive)) {
            record_transfer("download", cmd.filename, size, 0, "timeout");
            return alive;
        }
        if (lease.owns_lock()) lease.unlock();
        data_fd = ch.conn_fd();
    } else {
        if (!reply(ok_line(size))) return false;
    }

    xfer::TransferResult res = xfer::send_file(data_fd, full_path, size,
                                               cfg.chunk_size,
                                               byte_counter(server_, false));
    ch.close();
    binding.release();
    record_transfer("download", cmd.filename, size, res.bytes, xfer::status_name(res.status));

    if (res.complete()) {
        server_.logger().log(tag_, "DOWNLOAD complete: " + cmd.filename +
                                   " sent (" + to_string(res.bytes) + " bytes)");
        return reply(done_line());
    }

    server_.logger().warn(tag_, "DOWNLOAD short: " + cmd.filename + " " +
                                to_string(res.bytes) + "/" + to_string(res.expected) +
                                " (" + res.error + ")");
    // Single port: the client still expects the announced byte count, the
    // stream cannot be resynchronised.
    if (!dual) return false;
    return reply_error(res.status == xfer::TransferStatus::IoError
                           ? reason::ReadFailed
                           : reason::TransferShortfall);
}

bool ClientSession::cmd_list() {
    state_ = SessionState::ProcessingList;

    vector<string> names;
    string err;
    if (!utils::list_regular_files(server_.root_dir(), names, err)) {
        server_.logger().error(tag_, "LIST failed: " + err);
        return reply_error(reason::ReadFailed);
    }

    if (!reply(ok_line())) return false;
    for (const auto &name : names) {
        if (!reply(name)) return false;
    }
    server_.logger().log(tag_, "LIST sent " + to_string(names.size()) + " filenames");
    return reply(done_line());
}

bool ClientSession::cmd_quit() {
    server_.logger().log(tag_, "QUIT");
    reply(ok_line());
    state_ = SessionState::Closed;
    return false;
}
