#include "support/memory_transport.hpp"

#include <gtest/gtest.h>

#include <chrono>

using tsync::ErrorKind;
using tsync::test_support::MemoryTransport;
using Op = MemoryTransport::Op;

namespace {

tsync::transport::TransportOptions three_quick_attempts() {
    tsync::transport::TransportOptions options;
    options.retry = tsync::RetryPolicy::fixed(3, std::chrono::milliseconds(0));
    return options;
}

} // namespace

TEST(TransportRetryTest, TransientErrorsAreRetried) {
    MemoryTransport transport("remote", three_quick_attempts());
    transport.put_file("a.txt", "abc");
    transport.fail(Op::Read, ErrorKind::Io, "a.txt", 2);

    auto data = transport.read_range("a.txt", 0, 10);
    ASSERT_TRUE(data.is_ok());
    EXPECT_EQ(data.value().size(), 3u);
    EXPECT_EQ(transport.calls(Op::Read), 3u);
}

TEST(TransportRetryTest, NotFoundIsNotRetried) {
    MemoryTransport transport("remote", three_quick_attempts());

    auto data = transport.read_range("missing.txt", 0, 10);
    ASSERT_TRUE(data.is_error());
    EXPECT_EQ(data.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(transport.calls(Op::Read), 1u);
}

TEST(TransportRetryTest, ConnectionLossReconnectsBeforeRetrying) {
    MemoryTransport transport("remote", three_quick_attempts());
    transport.put_file("a.txt", "abc");
    transport.fail(Op::Stat, ErrorKind::Connection, "a.txt", 1);

    auto info = transport.stat("a.txt");
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(transport.connects(), 2u);
    EXPECT_TRUE(transport.is_connected());
}

TEST(TransportRetryTest, ExhaustedAttemptsReturnLastError) {
    MemoryTransport transport("remote", three_quick_attempts());
    transport.fail(Op::Connect, ErrorKind::Connection);

    auto connected = transport.connect();
    ASSERT_TRUE(connected.is_error());
    EXPECT_EQ(connected.error().kind, ErrorKind::Connection);
    EXPECT_EQ(transport.connects(), 3u);
}
