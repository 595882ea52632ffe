#include "FileServer.hpp"
#include "ServerConfig.hpp"
#include <csignal>
#include <pthread.h>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace std;

int main(int argc, char *argv[]) {
    vector<string> args(argv + 1, argv + argc);
    for (const auto &a : args) {
        if (a == "--help" || a == "-h") {
            cout << "Usage: " << argv[0] << " [options]\n" << config_usage();
            return 0;
        }
    }

    ServerConfig cfg;
    string err;
    if (!load_config_from_env(cfg, err) || !load_config_from_args(args, cfg, err)) {
        cerr << err << "\n" << config_usage();
        return 2;
    }

    // SIGINT/SIGTERM are picked up by a dedicated thread; SIGPIPE is ignored
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    FileServer server(cfg);
    if (!server.start(err)) {
        cerr << "Server start failed: " << err << "\n";
        return 1;
    }

    thread waiter([&server, stop_signals]() {
        int sig = 0;
        sigwait(&stop_signals, &sig);
        server.logger().log("server", "Shutting down (signal " + to_string(sig) + ")");
        server.stop();
    });

    server.run();
    // Accept loop can also end on its own; wake the waiter either way
    pthread_kill(waiter.native_handle(), SIGTERM);
    waiter.join();
    return 0;
}
