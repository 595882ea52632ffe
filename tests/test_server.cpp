#include <gtest/gtest.h>
#include "TestHelpers.hpp"
#include "NetworkClient.hpp"
#include "DataChannel.hpp"
#include "DbSqlite.hpp"
#include "Protocol.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <set>
#include <sys/stat.h>
#include <sys/time.h>

using namespace std;
using namespace proto;

namespace {

// Line-level access to the control connection, with a receive timeout so a
// protocol mistake fails the test instead of hanging it.
class RawConn {
public:
    RawConn(int port) {
        string err;
        fd_ = tcp_connect("127.0.0.1", port, err);
        if (fd_ >= 0) set_timeout(fd_);
    }
    ~RawConn() { if (fd_ >= 0) ::close(fd_); }

    static void set_timeout(int fd) {
        timeval tv{};
        tv.tv_sec = 5;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    bool ok() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    bool send(const string &line) { return send_line(fd_, line); }
    bool send_raw(const string &bytes) { return send_all(fd_, bytes.data(), bytes.size()); }
    string recv() {
        string line;
        if (!recv_line(fd_, line)) return "<closed>";
        return line;
    }
    bool peer_closed() {
        char c;
        return ::recv(fd_, &c, 1, 0) == 0;
    }
    void close() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }

private:
    int fd_ = -1;
};

bool wait_until(const function<bool()> &pred, int timeout_ms = 5000) {
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    while (chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    return pred();
}

set<string> as_set(const vector<string> &v) { return set<string>(v.begin(), v.end()); }

} // namespace

class ServerTest : public ::testing::TestWithParam<TransferMode> {
protected:
    void SetUp() override {
        harness_ = make_unique<testutil::ServerHarness>(GetParam());
        string err;
        ASSERT_TRUE(harness_->start(err)) << err;
    }

    void TearDown() override { harness_.reset(); }

    bool dual() const { return GetParam() == TransferMode::Dual; }

    bool connect(NetworkClient &c) { return c.connect_to("127.0.0.1", harness_->port()); }

    unique_ptr<testutil::ServerHarness> harness_;
};

TEST_P(ServerTest, UploadThenDownloadIsByteIdentical) {
    NetworkClient client;
    ASSERT_TRUE(connect(client));
    client.set_chunk_size(1500);   // client and server chunking need not agree

    for (size_t n : {size_t(0), size_t(1), size_t(4095), size_t(4096), size_t(4097), size_t(1000000)}) {
        SCOPED_TRACE("size=" + to_string(n));
        const string name = "blob_" + to_string(n) + ".bin";
        const string data = testutil::pattern_bytes(n, (unsigned)n);
        const string local = harness_->scratch().file("up_" + name);
        const string back = harness_->scratch().file("down_" + name);
        testutil::write_file(local, data);

        string err;
        ASSERT_TRUE(client.upload_file(local, name, err)) << err;
        EXPECT_EQ(testutil::read_file(harness_->stored(name)), data);

        ASSERT_TRUE(client.download_file(name, back, err)) << err;
        EXPECT_EQ(testutil::read_file(back), data);
    }
}

TEST_P(ServerTest, UploadHelloScenario) {
    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("UPLOAD a.txt 5"));

    Response ok = parse_response(c.recv());
    ASSERT_TRUE(ok.ok);
    if (dual()) {
        ASSERT_EQ(ok.values.size(), 1u);
        string err;
        int data = tcp_connect("127.0.0.1", (int)ok.values[0], err);
        ASSERT_GE(data, 0) << err;
        ASSERT_TRUE(send_all(data, "hello", 5));
        ::close(data);
    } else {
        ASSERT_TRUE(ok.values.empty());
        ASSERT_TRUE(c.send_raw("hello"));
    }

    EXPECT_EQ(c.recv(), "DONE");
    EXPECT_EQ(testutil::read_file(harness_->stored("a.txt")), "hello");

    vector<string> names;
    string err;
    ASSERT_TRUE(utils::list_regular_files(harness_->storage(), names, err)) << err;
    EXPECT_EQ(names, vector<string>{"a.txt"});
}

TEST_P(ServerTest, UnknownCommandsKeepTheSessionAlive) {
    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    for (const char *cmd : {"HELLO", "list", "DELETE a.txt", "RETR x", "READY"}) {
        ASSERT_TRUE(c.send(cmd));
        EXPECT_EQ(c.recv(), "ERROR UnknownCommand") << cmd;
    }
    ASSERT_TRUE(c.send("LIST"));
    EXPECT_EQ(c.recv(), "OK");
    EXPECT_EQ(c.recv(), "DONE");

    NetworkClient client;
    ASSERT_TRUE(connect(client));
    string reply, err;
    ASSERT_TRUE(client.send_raw_command("STAT", reply, err)) << err;
    EXPECT_EQ(reply, "ERROR UnknownCommand");
    vector<string> names;
    EXPECT_TRUE(client.list_files(names, err)) << err;
}

TEST_P(ServerTest, DownloadOfMissingFile) {
    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("DOWNLOAD missing.txt"));
    EXPECT_EQ(c.recv(), "ERROR FileNotFound");
    EXPECT_EQ(harness_->server().pending_data_ports(), 0u);

    // Nothing else was queued behind the error
    ASSERT_TRUE(c.send("QUIT"));
    EXPECT_EQ(c.recv(), "OK");
}

TEST_P(ServerTest, ListOnEmptyStorage) {
    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("LIST"));
    EXPECT_EQ(c.recv(), "OK");
    EXPECT_EQ(c.recv(), "DONE");
}

TEST_P(ServerTest, ListTwiceGivesTheSameSet) {
    for (const char *name : {"one.txt", "two.txt", "three.bin"})
        testutil::write_file(harness_->stored(name), name);

    NetworkClient client;
    ASSERT_TRUE(connect(client));
    vector<string> first, second;
    string err;
    ASSERT_TRUE(client.list_files(first, err)) << err;
    ASSERT_TRUE(client.list_files(second, err)) << err;

    EXPECT_EQ(as_set(first), (set<string>{"one.txt", "two.txt", "three.bin"}));
    EXPECT_EQ(as_set(first), as_set(second));
}

TEST_P(ServerTest, ConcurrentUploadsDoNotInterfere) {
    const int kClients = 4;
    vector<thread> workers;
    vector<string> errors(kClients);
    vector<int> results(kClients, 0);

    for (int i = 0; i < kClients; ++i) {
        const string local = harness_->scratch().file("c" + to_string(i));
        testutil::write_file(local, testutil::pattern_bytes(300000 + i * 1000, 100 + i));
    }

    for (int i = 0; i < kClients; ++i) {
        workers.emplace_back([&, i]() {
            NetworkClient client;
            if (!connect(client)) {
                errors[i] = "connect failed";
                return;
            }
            results[i] = client.upload_file(harness_->scratch().file("c" + to_string(i)),
                                            "concurrent_" + to_string(i) + ".bin", errors[i]);
        });
    }
    for (auto &t : workers) t.join();

    for (int i = 0; i < kClients; ++i) {
        ASSERT_TRUE(results[i]) << errors[i];
        EXPECT_EQ(testutil::read_file(harness_->stored("concurrent_" + to_string(i) + ".bin")),
                  testutil::pattern_bytes(300000 + i * 1000, 100 + i));
    }
}

TEST_P(ServerTest, MalformedArgumentsAreReported) {
    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("UPLOAD a.txt"));
    EXPECT_EQ(c.recv(), "ERROR BadSyntax");
    ASSERT_TRUE(c.send("UPLOAD a.txt -1"));
    EXPECT_EQ(c.recv(), "ERROR InvalidSize");
    ASSERT_TRUE(c.send("DOWNLOAD"));
    EXPECT_EQ(c.recv(), "ERROR BadSyntax");
    ASSERT_TRUE(c.send("LIST"));
    EXPECT_EQ(c.recv(), "OK");
    EXPECT_EQ(c.recv(), "DONE");
}

TEST_P(ServerTest, FilenamesAreConfinedToStorage) {
    testutil::write_file(harness_->scratch().file("secret.txt"), "top secret");

    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("DOWNLOAD ../secret.txt"));
    EXPECT_EQ(c.recv(), "ERROR InvalidFilename");
    ASSERT_TRUE(c.send("UPLOAD ../../evil.txt 3"));
    EXPECT_EQ(c.recv(), "ERROR InvalidFilename");
    ASSERT_TRUE(c.send("UPLOAD .. 3"));
    EXPECT_EQ(c.recv(), "ERROR InvalidFilename");
    EXPECT_FALSE(utils::file_exists(harness_->scratch().file("evil.txt")));
}

TEST_P(ServerTest, UnwritableDestinationIsReportedAndStreamStaysInSync) {
    ASSERT_TRUE(utils::ensure_dir(harness_->stored("taken")));

    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("UPLOAD taken 5"));
    Response ok = parse_response(c.recv());
    ASSERT_TRUE(ok.ok);
    if (dual()) {
        string err;
        int data = tcp_connect("127.0.0.1", (int)ok.values[0], err);
        ASSERT_GE(data, 0) << err;
        (void)send_all(data, "hello", 5);
        ::close(data);
    } else {
        ASSERT_TRUE(c.send_raw("hello"));
    }
    EXPECT_EQ(c.recv(), "ERROR WriteFailed");

    // The five payload bytes were not mistaken for a command
    ASSERT_TRUE(c.send("DOWNLOAD taken"));
    EXPECT_EQ(c.recv(), "ERROR FileNotFound");
}

TEST_P(ServerTest, QuitAcknowledgesAndCloses) {
    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("QUIT"));
    EXPECT_EQ(c.recv(), "OK");
    EXPECT_TRUE(c.peer_closed());
    EXPECT_TRUE(wait_until([&]() { return harness_->server().active_sessions() == 0; }));
}

TEST_P(ServerTest, EmptyLineClosesTheSession) {
    RawConn c(harness_->port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send_raw("\n"));
    EXPECT_TRUE(c.peer_closed());
}

TEST_P(ServerTest, ActiveSessionCountTracksConnections) {
    RawConn a(harness_->port());
    RawConn b(harness_->port());
    ASSERT_TRUE(a.ok() && b.ok());
    ASSERT_TRUE(a.send("LIST"));
    EXPECT_EQ(a.recv(), "OK");
    EXPECT_EQ(a.recv(), "DONE");
    ASSERT_TRUE(b.send("LIST"));
    EXPECT_EQ(b.recv(), "OK");
    EXPECT_EQ(b.recv(), "DONE");
    EXPECT_EQ(harness_->server().active_sessions(), 2);
    EXPECT_EQ(harness_->server().total_sessions(), 2u);

    a.close();
    EXPECT_TRUE(wait_until([&]() { return harness_->server().active_sessions() == 1; }));
    EXPECT_EQ(harness_->server().total_sessions(), 2u);
}

TEST_P(ServerTest, TransfersAreAudited) {
    const string local = harness_->scratch().file("audit_src");
    testutil::write_file(local, "payload");

    NetworkClient client;
    ASSERT_TRUE(connect(client));
    string err;
    ASSERT_TRUE(client.upload_file(local, "audited.txt", err)) << err;
    ASSERT_TRUE(client.download_file("audited.txt", harness_->scratch().file("audit_dst"), err)) << err;

    vector<TransferRecord> rows;
    ASSERT_NE(harness_->server().audit(), nullptr);
    ASSERT_TRUE(harness_->server().audit()->list_transfers(rows, err)) << err;
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].direction, "upload");
    EXPECT_EQ(rows[0].filename, "audited.txt");
    EXPECT_EQ(rows[0].transferred_bytes, 7u);
    EXPECT_EQ(rows[0].outcome, "complete");
    EXPECT_EQ(rows[1].direction, "download");
    EXPECT_EQ(harness_->server().bytes_in(), 7u);
    EXPECT_EQ(harness_->server().bytes_out(), 7u);
}

INSTANTIATE_TEST_SUITE_P(Modes, ServerTest,
                         ::testing::Values(TransferMode::Single, TransferMode::Dual),
                         [](const ::testing::TestParamInfo<TransferMode> &info) {
                             return string(mode_name(info.param));
                         });

// ===== single-port specifics =====

class SinglePortTest : public ::testing::Test {
protected:
    void SetUp() override {
        string err;
        ASSERT_TRUE(harness_.start(err)) << err;
    }
    testutil::ServerHarness harness_{TransferMode::Single};
};

TEST_F(SinglePortTest, DownloadBytesFollowTheOkLine) {
    testutil::write_file(harness_.stored("b.txt"), "abcdef");
    RawConn c(harness_.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("DOWNLOAD b.txt"));
    EXPECT_EQ(c.recv(), "OK 6");
    char buf[6];
    ASSERT_TRUE(recv_exact(c.fd(), buf, 6));
    EXPECT_EQ(string(buf, 6), "abcdef");
    EXPECT_EQ(c.recv(), "DONE");
}

TEST_F(SinglePortTest, ShortUploadLeavesNoFileBehind) {
    RawConn c(harness_.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("UPLOAD short.bin 100"));
    EXPECT_EQ(c.recv(), "OK");
    ASSERT_TRUE(c.send_raw("only-a-few"));
    c.close();

    EXPECT_TRUE(wait_until([&]() { return harness_.server().active_sessions() == 0; }));
    EXPECT_FALSE(utils::file_exists(harness_.stored("short.bin")));

    vector<TransferRecord> rows;
    string err;
    ASSERT_TRUE(harness_.server().audit()->list_transfers(rows, err)) << err;
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].outcome, "truncated");
    EXPECT_EQ(rows[0].transferred_bytes, 10u);
}

// ===== data channel specifics =====

class DualPortTest : public ::testing::Test {
protected:
    void start() {
        string err;
        ASSERT_TRUE(harness_.start(err)) << err;
    }
    testutil::ServerHarness harness_{TransferMode::Dual};
};

TEST_F(DualPortTest, ShortUploadIsReportedNotAcknowledged) {
    start();
    RawConn c(harness_.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("UPLOAD short.bin 100"));
    Response ok = parse_response(c.recv());
    ASSERT_TRUE(ok.ok);
    ASSERT_EQ(ok.values.size(), 1u);

    string err;
    int data = tcp_connect("127.0.0.1", (int)ok.values[0], err);
    ASSERT_GE(data, 0) << err;
    ASSERT_TRUE(send_all(data, "abc", 3));
    ::close(data);

    EXPECT_EQ(c.recv(), "ERROR TransferShortfall");
    EXPECT_FALSE(utils::file_exists(harness_.stored("short.bin")));

    ASSERT_TRUE(c.send("LIST"));
    EXPECT_EQ(c.recv(), "OK");
    EXPECT_EQ(c.recv(), "DONE");
}

TEST_F(DualPortTest, DataChannelTimeoutIsReported) {
    harness_.config().data_timeout_ms = 200;
    start();
    RawConn c(harness_.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("UPLOAD never.bin 10"));
    Response ok = parse_response(c.recv());
    ASSERT_TRUE(ok.ok);

    EXPECT_EQ(c.recv(), "ERROR DataChannelTimeout");
    EXPECT_EQ(harness_.server().pending_data_ports(), 0u);

    // Listener is gone after the timeout
    string err;
    int late = tcp_connect("127.0.0.1", (int)ok.values[0], err);
    EXPECT_LT(late, 0);
    if (late >= 0) ::close(late);

    ASSERT_TRUE(c.send("LIST"));
    EXPECT_EQ(c.recv(), "OK");
    EXPECT_EQ(c.recv(), "DONE");
}

TEST_F(DualPortTest, DownloadWaitsForReady) {
    start();
    testutil::write_file(harness_.stored("r.txt"), "ready?");
    RawConn c(harness_.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("DOWNLOAD r.txt"));
    Response ok = parse_response(c.recv());
    ASSERT_TRUE(ok.ok);
    ASSERT_EQ(ok.values.size(), 2u);
    EXPECT_EQ(ok.values[0], 6u);
    EXPECT_EQ(harness_.server().pending_data_ports(), 1u);
    EXPECT_EQ(harness_.server().data_port_of(1), (int)ok.values[1]);

    ASSERT_TRUE(c.send("READY"));
    string err;
    int data = tcp_connect("127.0.0.1", (int)ok.values[1], err);
    ASSERT_GE(data, 0) << err;
    RawConn::set_timeout(data);
    char buf[6];
    ASSERT_TRUE(recv_exact(data, buf, 6));
    EXPECT_EQ(string(buf, 6), "ready?");
    ::close(data);
    EXPECT_EQ(c.recv(), "DONE");
    EXPECT_EQ(harness_.server().pending_data_ports(), 0u);
}

TEST_F(DualPortTest, DownloadWithoutReadyIsRefused) {
    start();
    testutil::write_file(harness_.stored("r.txt"), "x");
    RawConn c(harness_.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("DOWNLOAD r.txt"));
    ASSERT_TRUE(parse_response(c.recv()).ok);
    ASSERT_TRUE(c.send("GO"));
    EXPECT_EQ(c.recv(), "ERROR NotReady");
    ASSERT_TRUE(c.send("QUIT"));
    EXPECT_EQ(c.recv(), "OK");
}

TEST_F(DualPortTest, EachTransferGetsItsOwnPort) {
    start();
    RawConn a(harness_.port());
    RawConn b(harness_.port());
    ASSERT_TRUE(a.ok() && b.ok());
    ASSERT_TRUE(a.send("UPLOAD a.bin 1"));
    ASSERT_TRUE(b.send("UPLOAD b.bin 1"));
    Response ra = parse_response(a.recv());
    Response rb = parse_response(b.recv());
    ASSERT_TRUE(ra.ok && rb.ok);
    EXPECT_NE(ra.values[0], rb.values[0]);
    EXPECT_EQ(harness_.server().pending_data_ports(), 2u);

    string err;
    int db = tcp_connect("127.0.0.1", (int)rb.values[0], err);
    int da = tcp_connect("127.0.0.1", (int)ra.values[0], err);
    ASSERT_GE(da, 0);
    ASSERT_GE(db, 0);
    ASSERT_TRUE(send_all(db, "B", 1));
    ASSERT_TRUE(send_all(da, "A", 1));
    ::close(da);
    ::close(db);
    EXPECT_EQ(a.recv(), "DONE");
    EXPECT_EQ(b.recv(), "DONE");
    EXPECT_EQ(testutil::read_file(harness_.stored("a.bin")), "A");
    EXPECT_EQ(testutil::read_file(harness_.stored("b.bin")), "B");
}

TEST_F(DualPortTest, FixedDataPortServesSequentialTransfers) {
    int fixed = 0;
    {
        DataChannel port_picker;
        string err;
        ASSERT_TRUE(port_picker.open("127.0.0.1", 0, err)) << err;
        fixed = port_picker.port();
    }
    harness_.config().data_port = fixed;
    start();

    NetworkClient client;
    ASSERT_TRUE(client.connect_to("127.0.0.1", harness_.port()));
    const string local = harness_.scratch().file("fixed_src");
    testutil::write_file(local, testutil::pattern_bytes(5000));
    string err;
    ASSERT_TRUE(client.upload_file(local, "f1.bin", err)) << err;
    ASSERT_TRUE(client.upload_file(local, "f2.bin", err)) << err;

    RawConn c(harness_.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("DOWNLOAD f1.bin"));
    Response ok = parse_response(c.recv());
    ASSERT_TRUE(ok.ok);
    ASSERT_EQ(ok.values.size(), 2u);
    EXPECT_EQ((int)ok.values[1], fixed);
    ASSERT_TRUE(c.send("GO"));
    EXPECT_EQ(c.recv(), "ERROR NotReady");
}

TEST_F(DualPortTest, StalledReadyOnFixedPortDoesNotBlockOtherSessions) {
    int fixed = 0;
    {
        DataChannel port_picker;
        string err;
        ASSERT_TRUE(port_picker.open("127.0.0.1", 0, err)) << err;
        fixed = port_picker.port();
    }
    harness_.config().data_port = fixed;
    harness_.config().data_timeout_ms = 300;
    start();
    testutil::write_file(harness_.stored("x.bin"), "xyz");

    // Session A takes the shared port and never says READY
    RawConn stalled(harness_.port());
    ASSERT_TRUE(stalled.ok());
    ASSERT_TRUE(stalled.send("DOWNLOAD x.bin"));
    Response ok = parse_response(stalled.recv());
    ASSERT_TRUE(ok.ok);
    ASSERT_EQ(ok.values.size(), 2u);
    EXPECT_EQ((int)ok.values[1], fixed);

    // Session B still gets its transfer through on the same port
    NetworkClient other;
    ASSERT_TRUE(other.connect_to("127.0.0.1", harness_.port()));
    const string local = harness_.scratch().file("other_src");
    testutil::write_file(local, "from B");
    string err;
    ASSERT_TRUE(other.upload_file(local, "b.txt", err)) << err;
    EXPECT_EQ(testutil::read_file(harness_.stored("b.txt")), "from B");

    EXPECT_EQ(stalled.recv(), "ERROR DataChannelTimeout");
    ASSERT_TRUE(stalled.send("LIST"));
    EXPECT_EQ(stalled.recv(), "OK");
}

TEST_F(DualPortTest, FailedDownloadLeavesControlStreamInSync) {
    start();
    testutil::write_file(harness_.stored("big.bin"), testutil::pattern_bytes(1000000));

    NetworkClient client;
    ASSERT_TRUE(client.connect_to("127.0.0.1", harness_.port()));
    string err;
    EXPECT_FALSE(client.download_file("big.bin",
                                      harness_.scratch().file("no/such/dir/big.bin"), err));
    EXPECT_TRUE(client.connected());

    vector<string> names;
    ASSERT_TRUE(client.list_files(names, err)) << err;
    EXPECT_EQ(names, vector<string>{"big.bin"});

    const string back = harness_.scratch().file("big_back.bin");
    ASSERT_TRUE(client.download_file("big.bin", back, err)) << err;
    EXPECT_EQ(testutil::read_file(back), testutil::pattern_bytes(1000000));
}

// ===== admission control =====

TEST(ServerAdmission, ConnectionsBeyondTheCapAreTurnedAway) {
    testutil::ServerHarness harness(TransferMode::Single, 1);
    string err;
    ASSERT_TRUE(harness.start(err)) << err;

    RawConn first(harness.port());
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(first.send("LIST"));
    EXPECT_EQ(first.recv(), "OK");
    EXPECT_EQ(first.recv(), "DONE");

    RawConn second(harness.port());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.recv(), "ERROR ServerBusy");
    EXPECT_TRUE(second.peer_closed());

    ASSERT_TRUE(first.send("QUIT"));
    EXPECT_EQ(first.recv(), "OK");
    ASSERT_TRUE(wait_until([&]() { return harness.server().active_sessions() == 0; }));

    RawConn third(harness.port());
    ASSERT_TRUE(third.ok());
    ASSERT_TRUE(third.send("LIST"));
    EXPECT_EQ(third.recv(), "OK");
}

TEST(ServerLifecycle, StopHangsUpLiveSessions) {
    testutil::ServerHarness harness(TransferMode::Dual);
    string err;
    ASSERT_TRUE(harness.start(err)) << err;

    RawConn c(harness.port());
    ASSERT_TRUE(c.ok());
    ASSERT_TRUE(c.send("LIST"));
    EXPECT_EQ(c.recv(), "OK");
    EXPECT_EQ(c.recv(), "DONE");

    harness.stop();
    EXPECT_TRUE(c.peer_closed());
}

TEST(ServerLifecycle, StartCreatesStorageDirectory) {
    testutil::ServerHarness harness(TransferMode::Single);
    harness.config().storage_dir = harness.scratch().file("nested/deeper/store");
    string err;
    ASSERT_TRUE(harness.start(err)) << err;
    struct stat st{};
    ASSERT_EQ(::stat(harness.config().storage_dir.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
}
