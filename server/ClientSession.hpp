#pragma once
#include <cstdint>
#include <string>
#include "../common/Protocol.hpp"
#include "../common/Transfer.hpp"

using namespace std;

class FileServer;
class DataChannel;

enum class SessionState {
    AwaitingCommand,
    ProcessingUpload,
    ProcessingDownload,
    ProcessingList,
    Closed
};

const char *state_name(SessionState s);

// Serves one control connection: one command at a time, strictly in order.
// Command handlers return false when the session must end (QUIT, EOF,
// broken socket); protocol-level errors are answered and return true.
class ClientSession {
public:
    ClientSession(int id, int sockfd, const string &peer, FileServer &server);
    ~ClientSession();

    void run();

private:
    bool handle_command(const string &line);
    bool cmd_upload(const proto::Command &cmd);
    bool cmd_download(const proto::Command &cmd);
    bool cmd_list();
    bool cmd_quit();

    // Open the per-transfer data channel and record its port.
    // On failure the ERROR line has already been sent.
    bool open_data_channel(DataChannel &ch, bool &alive);

    // Wait for the client on the data channel.
    // On failure the ERROR line (if any) has already been sent.
    bool accept_data_peer(DataChannel &ch, bool &alive);

    bool reply(const string &line);
    bool reply_error(const string &reason);

    // Read and throw away n bytes from the control socket
    bool drain(uint64_t n);

    void record_transfer(const char *direction,
                         const string &filename,
                         uint64_t declared,
                         uint64_t transferred,
                         const string &outcome);

    string storage_path(const string &filename) const;

    int id_;
    int sockfd_;
    string peer_;
    string tag_;
    FileServer &server_;
    SessionState state_ = SessionState::AwaitingCommand;
    int audit_session_id_ = 0;
};
