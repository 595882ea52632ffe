#include "NetworkClient.hpp"
#include "../common/Utils.hpp"
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace std;

namespace {

const char *DOWNLOAD_DIR = "client_downloads";

void usage(const char *prog) {
    cout << "Usage: " << prog << " <host> <port> upload <local_file> [remote_name]\n"
         << "       " << prog << " <host> <port> download <remote_name>\n"
         << "       " << prog << " <host> <port> list\n";
}

xfer::ProgressFn console_progress(const string &verb) {
    return [verb](uint64_t done, uint64_t total) {
        uint64_t pct = total ? done * 100 / total : 100;
        cout << "\r" << verb << ": " << pct << "% [" << done << "/" << total << " bytes]" << flush;
    };
}

string base_name(const string &path) {
    vector<string> parts = utils::split_path(path);
    return parts.empty() ? path : parts.back();
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 4) {
        usage(argv[0]);
        return 1;
    }
    signal(SIGPIPE, SIG_IGN);

    string host = argv[1];
    int port = 0;
    try {
        port = stoi(argv[2]);
    } catch (const exception &) {
        cerr << "Invalid port: " << argv[2] << "\n";
        return 1;
    }
    string action = argv[3];

    NetworkClient client;
    if (!client.connect_to(host, port)) {
        cerr << "Cannot connect to " << host << ":" << port << "\n";
        return 1;
    }

    string err;
    bool ok = false;
    if (action == "upload" && argc >= 5) {
        string local = argv[4];
        string remote = argc >= 6 ? argv[5] : base_name(local);
        ok = client.upload_file(local, remote, err, console_progress("Uploading"));
        cout << "\n";
        if (ok) cout << "Upload complete: " << remote << "\n";
    } else if (action == "download" && argc >= 5) {
        string remote = argv[4];
        if (!utils::ensure_dir(DOWNLOAD_DIR)) {
            cerr << "Cannot create " << DOWNLOAD_DIR << "\n";
            return 1;
        }
        string local = utils::join_path(DOWNLOAD_DIR, base_name(remote));
        ok = client.download_file(remote, local, err, console_progress("Downloading"));
        cout << "\n";
        if (ok) cout << "Saved to " << local << "\n";
    } else if (action == "list") {
        vector<string> names;
        ok = client.list_files(names, err);
        if (ok) {
            if (names.empty()) cout << "No files on server.\n";
            for (size_t i = 0; i < names.size(); ++i)
                cout << "  " << (i + 1) << ". " << names[i] << "\n";
        }
    } else {
        usage(argv[0]);
        return 1;
    }

    if (!ok) {
        cerr << "Failed: " << err << "\n";
        return 1;
    }
    string quit_err;
    if (client.connected() && !client.quit(quit_err))
        cerr << "QUIT: " << quit_err << "\n";
    return 0;
}
