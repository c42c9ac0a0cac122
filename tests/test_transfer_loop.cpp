// ============================================================
// test_transfer_loop.cpp -- Source to socket transfer
// ============================================================

#include "../server/transfer_loop.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <exception>
#include <sstream>
#include <thread>

using namespace std::chrono_literals;
using testutil::Pipe;
using testutil::SocketPair;
using testutil::TempFile;

namespace {

class IgnoreSigpipe : public ::testing::Environment {
public:
    void SetUp() override { platform::init(); }
};

::testing::Environment* const sigpipe_env =
    ::testing::AddGlobalTestEnvironment(new IgnoreSigpipe);

struct LoopResult {
    std::string       wire;      // everything the client received
    std::string       progress;  // everything drawn on the terminal
    std::exception_ptr error;
    double            elapsed_s{0.0};
};

// Run one complete response (head + loop) while a second thread drains
// the client end of the connection.
LoopResult serve(TransferSession& session, ByteSource& source,
                 size_t threshold = TcpWriteBuffer::DEFAULT_THRESHOLD,
                 std::chrono::milliseconds refresh = TransferLoop::DEFAULT_REFRESH) {
    LoopResult r;
    SocketPair sp;
    int client = sp.client();
    std::thread reader([&r, client] { r.wire = testutil::read_all(client); });

    std::ostringstream term;
    try {
        TcpSocket sock(sp.release_server());
        TcpWriteBuffer out(sock, threshold);
        ResponseFramer framer(out, session);
        framer.send_head();

        ProgressRenderer progress(term, 80);
        TransferLoop loop(session, source, framer, progress, refresh);
        loop.run();
        r.elapsed_s = loop.elapsed_s();
    } catch (...) {
        r.error = std::current_exception();
    }

    reader.join();
    r.progress = term.str();
    return r;
}

std::string head_of(const TransferSession& s) {
    return ResponseFramer::build_head(s.mode, s.mime_type, s.total_bytes);
}

} // namespace

// ---- fixed length ----

TEST(TransferLoop, FixedLengthSizes) {
    for (size_t n : {1u, 100u, 16383u, 16384u, 16385u, 250000u}) {
        std::string payload = testutil::make_payload(n, (u32)n);
        TempFile f(payload);
        ByteSource src = ByteSource::open_file(f.path());
        TransferSession session(TransferMode::FixedLength, src.total_bytes(), 16384,
                                "application/octet-stream");

        LoopResult r = serve(session, src);
        ASSERT_FALSE(r.error) << "size " << n;
        EXPECT_EQ(r.wire, head_of(session) + payload) << "size " << n;
        EXPECT_EQ(session.sent_bytes, n);
        EXPECT_EQ(session.digest.digest(), hash::xxh3_64(payload.data(), payload.size()));
    }
}

TEST(TransferLoop, EmptyFile) {
    TempFile f("");
    ByteSource src = ByteSource::open_file(f.path());
    TransferSession session(TransferMode::FixedLength, 0, 16384, "text/plain");

    LoopResult r = serve(session, src);
    ASSERT_FALSE(r.error);
    EXPECT_NE(r.wire.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_EQ(r.wire, head_of(session));
    EXPECT_EQ(session.sent_bytes, 0u);
    EXPECT_EQ(session.write_cycles, 0u);
}

TEST(TransferLoop, ReadsAreCappedAtBufferSize) {
    std::string payload = testutil::make_payload(100000);
    TempFile f(payload);
    ByteSource src = ByteSource::open_file(f.path());
    TransferSession session(TransferMode::FixedLength, 100000, 16384, "application/zip");

    LoopResult r = serve(session, src);
    ASSERT_FALSE(r.error);
    EXPECT_EQ(session.sent_bytes, 100000u);
    EXPECT_EQ(session.write_cycles, 7u);  // 6 x 16384 + 1696
    EXPECT_EQ(r.wire.size(), head_of(session).size() + 100000u);
}

TEST(TransferLoop, FinalProgressLineIsTerminated) {
    TempFile f(testutil::make_payload(5000));
    ByteSource src = ByteSource::open_file(f.path());
    TransferSession session(TransferMode::FixedLength, 5000, 1024, "text/plain");

    LoopResult r = serve(session, src);
    ASSERT_FALSE(r.error);
    ASSERT_FALSE(r.progress.empty());
    EXPECT_EQ(r.progress.back(), '\n');
    EXPECT_NE(r.progress.find(" 100% ["), std::string::npos);
    EXPECT_NE(r.progress.find("5,000"), std::string::npos);
    EXPECT_GE(r.elapsed_s, 0.0);
}

TEST(TransferLoop, DebugLineFollowsFinishedProgressLine) {
    TempFile f(testutil::make_payload(3000));
    ByteSource src = ByteSource::open_file(f.path());
    TransferSession session(TransferMode::FixedLength, 3000, 1024, "text/plain");

    // progress and log share one terminal
    std::ostringstream term;
    Logger::get().set_streams(&term, &term);
    Logger::get().set_level(LogLevel::DEBUG);

    SocketPair sp;
    int client = sp.client();
    std::string wire;
    std::thread reader([&wire, client] { wire = testutil::read_all(client); });
    {
        TcpSocket sock(sp.release_server());
        TcpWriteBuffer out(sock);
        ResponseFramer framer(out, session);
        framer.send_head();
        ProgressRenderer progress(term, 80);
        TransferLoop loop(session, src, framer, progress);
        loop.run();
    }
    reader.join();

    Logger::get().set_level(LogLevel::INFO);
    Logger::get().set_streams(nullptr, nullptr);

    std::string out = term.str();
    size_t debug = out.find("debug: Source exhausted after 3 write cycles\n");
    ASSERT_NE(debug, std::string::npos);
    EXPECT_EQ(debug + std::string("debug: Source exhausted after 3 write cycles\n").size(),
              out.size());
    ASSERT_GT(debug, 0u);
    EXPECT_EQ(out[debug - 1], '\n');
    EXPECT_EQ(out.find('\r', debug), std::string::npos);
}

TEST(TransferLoop, ShortFileIsATransportError) {
    TempFile f(testutil::make_payload(100));
    ByteSource src = ByteSource::open_file(f.path());
    TransferSession session(TransferMode::FixedLength, 200, 64, "text/plain");

    LoopResult r = serve(session, src);
    ASSERT_TRUE(r.error);
    try {
        std::rethrow_exception(r.error);
    } catch (const TransportError& e) {
        EXPECT_STREQ(e.what(), "Input ended after 100 of 200 bytes");
    }
    EXPECT_EQ(session.sent_bytes, 100u);
}

TEST(TransferLoop, PeerGoneIsATransportError) {
    TempFile f(testutil::make_payload(4 * 1024 * 1024));
    ByteSource src = ByteSource::open_file(f.path());
    TransferSession session(TransferMode::FixedLength, src.total_bytes(), 16384,
                            "application/octet-stream");

    SocketPair sp;
    sp.close_client();

    std::ostringstream term;
    TcpSocket sock(sp.release_server());
    TcpWriteBuffer out(sock, 0);
    ResponseFramer framer(out, session);
    ProgressRenderer progress(term, 80);
    TransferLoop loop(session, src, framer, progress);

    EXPECT_THROW({
        framer.send_head();
        loop.run();
    }, TransportError);
    EXPECT_LT(session.sent_bytes, (u64)src.total_bytes());
}

TEST(TransferLoop, RunBeforeHeadIsALogicError) {
    TempFile f("abc");
    ByteSource src = ByteSource::open_file(f.path());
    TransferSession session(TransferMode::FixedLength, 3, 16, "text/plain");

    SocketPair sp;
    std::ostringstream term;
    TcpSocket sock(sp.release_server());
    TcpWriteBuffer out(sock);
    ResponseFramer framer(out, session);
    ProgressRenderer progress(term, 80);
    TransferLoop loop(session, src, framer, progress);

    EXPECT_THROW(loop.run(), std::logic_error);
    EXPECT_EQ(session.sent_bytes, 0u);
}

// ---- streaming ----

TEST(TransferLoop, StreamingChunksFollowWrites) {
    Pipe p;
    ByteSource src = ByteSource::from_stream(p.read_end(), false);
    TransferSession session(TransferMode::Streaming, -1, 16384, "text/plain");

    const std::string first(10, 'a');
    const std::string second(20, 'b');
    const std::string head = head_of(session);
    const std::string after_first = head + "a\r\n" + first + "\r\n";

    testutil::write_all(p.write_end(), first);
    testutil::write_all(p.write_end(), "");  // an empty write adds nothing

    // The client sends the second piece only after the first chunk
    // arrived, so the two can never be merged into one read.
    SocketPair sp;
    int client = sp.client();
    std::string wire;
    std::thread peer([&] {
        char buf[4096];
        while (wire.size() < after_first.size()) {
            ssize_t n = ::read(client, buf, sizeof(buf));
            if (n <= 0) return;
            wire.append(buf, (size_t)n);
        }
        testutil::write_all(p.write_end(), second);
        p.close_write();
        wire += testutil::read_all(client);
    });

    std::ostringstream term;
    {
        TcpSocket sock(sp.release_server());
        TcpWriteBuffer out(sock, 0);
        ResponseFramer framer(out, session);
        framer.send_head();
        ProgressRenderer progress(term, 80);
        TransferLoop loop(session, src, framer, progress, 20ms);
        loop.run();
    }
    peer.join();

    ASSERT_EQ(wire.compare(0, head.size(), head), 0);
    std::vector<std::string> chunks;
    bool terminated = false;
    ASSERT_TRUE(testutil::decode_chunked(wire.substr(head.size()), chunks, terminated));
    EXPECT_TRUE(terminated);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], first);
    EXPECT_EQ(chunks[1], second);
    EXPECT_EQ(session.sent_bytes, 30u);
    EXPECT_EQ(wire.substr(wire.size() - 5), "0\r\n\r\n");
    EXPECT_EQ(wire.find("0\r\n\r\n"), wire.size() - 5);
}

TEST(TransferLoop, StreamingLargePayload) {
    Pipe p;
    ByteSource src = ByteSource::from_stream(p.read_end(), false);
    TransferSession session(TransferMode::Streaming, -1, 4096, "application/x-bzip2");

    std::string payload = testutil::make_payload(1000000);
    int wfd = p.write_end();
    std::thread producer([&] {
        testutil::write_all(wfd, payload);
        p.close_write();
    });

    LoopResult r = serve(session, src);
    producer.join();
    ASSERT_FALSE(r.error);

    std::string head = head_of(session);
    ASSERT_EQ(r.wire.compare(0, head.size(), head), 0);

    std::vector<std::string> chunks;
    bool terminated = false;
    ASSERT_TRUE(testutil::decode_chunked(r.wire.substr(head.size()), chunks, terminated));
    EXPECT_TRUE(terminated);

    std::string body;
    for (const auto& c : chunks) {
        EXPECT_FALSE(c.empty());
        EXPECT_LE(c.size(), 4096u);
        body += c;
    }
    EXPECT_EQ(body, payload);
    EXPECT_EQ(session.sent_bytes, payload.size());
    EXPECT_EQ(session.write_cycles, chunks.size());
    EXPECT_EQ(session.digest.digest(), hash::xxh3_64(payload.data(), payload.size()));
    EXPECT_EQ(r.progress.find('%'), std::string::npos);
}

TEST(TransferLoop, EmptyStreamSendsOnlyTerminator) {
    Pipe p;
    ByteSource src = ByteSource::from_stream(p.read_end(), false);
    TransferSession session(TransferMode::Streaming, -1, 16384, "text/plain");
    p.close_write();

    LoopResult r = serve(session, src);
    ASSERT_FALSE(r.error);
    EXPECT_EQ(r.wire, head_of(session) + "0\r\n\r\n");
    EXPECT_EQ(session.write_cycles, 0u);
}

TEST(TransferLoop, IdleStreamKeepsRedrawing) {
    Pipe p;
    ByteSource src = ByteSource::from_stream(p.read_end(), false);
    TransferSession session(TransferMode::Streaming, -1, 16384, "text/plain");

    int wfd = p.write_end();
    std::thread producer([&] {
        std::this_thread::sleep_for(200ms);
        testutil::write_all(wfd, "late");
        p.close_write();
    });

    LoopResult r = serve(session, src, 0, 20ms);
    producer.join();
    ASSERT_FALSE(r.error);

    EXPECT_GE(session.interval_count, 3u);
    EXPECT_EQ(session.sent_bytes, 4u);
    EXPECT_NE(r.progress.find("<=>"), std::string::npos);
    EXPECT_EQ(r.wire, head_of(session) + "4\r\nlate\r\n0\r\n\r\n");
}
