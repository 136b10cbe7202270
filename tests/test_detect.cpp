#include "async_test.hpp"
#include "detector.hpp"
#include "header.hpp"
#include "header.pb.h"
#include "test_common.hpp"

#include <atomic>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

using namespace conn_header;

namespace {

const std::string kHttpRequest = "GET / HTTP/1.1\r\nHost: example.com\r\n\r\n";

Header example_header() {
    return Header(4040, Name::parse("foo.bar.example.com"));
}

std::string frame_bytes(const Header& header) {
    ByteBuffer buf;
    header.encode_prefaced(buf);
    return std::string(buf.view());
}

std::string be32(uint32_t v) {
    ByteBuffer buf;
    buf.put_u32(v);
    return std::string(buf.view());
}

std::optional<Header> detect_over(ScriptedTransport& io, ByteBuffer& buf) {
    boost::asio::io_context ctx;
    DetectHeader detector;
    return run_awaitable(ctx, detector.detect(io, buf));
}

} // namespace

int main() {
    auto test_detect_prefaced = [] {
        const auto header = example_header();
        ScriptedTransport io({frame_bytes(header) + "12345"});
        ByteBuffer buf;
        auto detected = detect_over(io, buf);
        EXPECT_TRUE(detected.has_value());
        EXPECT_TRUE(*detected == header);
        EXPECT_EQ(std::string(buf.view()), "12345");
    };

    auto test_detect_no_header = [] {
        ScriptedTransport io({kHttpRequest});
        ByteBuffer buf;
        auto detected = detect_over(io, buf);
        EXPECT_FALSE(detected.has_value());
        EXPECT_EQ(std::string(buf.view()), kHttpRequest);
        EXPECT_EQ(io.reads(), 1u);
    };

    auto test_no_header_fragmented = [] {
        ScriptedTransport io(chunked(kHttpRequest, 1));
        ByteBuffer buf;
        auto detected = detect_over(io, buf);
        EXPECT_FALSE(detected.has_value());
        // Only enough bytes to rule out the preface were pulled off the stream.
        EXPECT_EQ(std::string(buf.view()), kHttpRequest.substr(0, kPrefaceLen));
        EXPECT_EQ(io.chunks_left(), kHttpRequest.size() - kPrefaceLen);
    };

    auto test_many_reads = [] {
        const auto header = example_header();
        const auto msg = header.encode();
        ScriptedTransport io({"proxy.l5d", ".io/connect", "\r\n\r\n", be32(static_cast<uint32_t>(msg.size())), msg, "12345"});
        ByteBuffer buf;
        auto detected = detect_over(io, buf);
        EXPECT_TRUE(detected.has_value());
        EXPECT_TRUE(*detected == header);
        // The trailing chunk is still on the transport, not in the buffer.
        EXPECT_TRUE(buf.empty());
        EXPECT_EQ(io.chunks_left(), 1u);
    };

    auto test_one_byte_reads = [] {
        const auto header = example_header();
        ScriptedTransport io(chunked(frame_bytes(header) + "12345", 1));
        ByteBuffer buf;
        auto detected = detect_over(io, buf);
        EXPECT_TRUE(detected.has_value());
        EXPECT_TRUE(*detected == header);
        EXPECT_TRUE(buf.empty());
        EXPECT_EQ(io.chunks_left(), 5u);
    };

    auto test_every_split_point = [] {
        const auto header = example_header();
        const auto bytes = frame_bytes(header) + "tail";
        for (std::size_t split = 1; split < bytes.size(); ++split) {
            ScriptedTransport io({bytes.substr(0, split), bytes.substr(split)});
            ByteBuffer buf;
            auto detected = detect_over(io, buf);
            EXPECT_TRUE(detected.has_value());
            EXPECT_TRUE(*detected == header);
            std::string rest(buf.view());
            if (io.chunks_left() == 1) rest += bytes.substr(split);
            EXPECT_EQ(rest, "tail");
        }
    };

    auto test_short_stream_is_absent = [] {
        ScriptedTransport io({"proxy.l5d"});
        ByteBuffer buf;
        EXPECT_FALSE(detect_over(io, buf).has_value());
        EXPECT_EQ(std::string(buf.view()), "proxy.l5d");

        ScriptedTransport empty(std::vector<std::string>{});
        ByteBuffer empty_buf;
        EXPECT_FALSE(detect_over(empty, empty_buf).has_value());
        EXPECT_TRUE(empty_buf.empty());
    };

    auto test_prebuffered_bytes = [] {
        // A previous consumer already pulled the whole frame off the wire.
        const auto header = example_header();
        ScriptedTransport io(std::vector<std::string>{});
        ByteBuffer buf;
        buf.append(frame_bytes(header) + "xyz");
        auto detected = detect_over(io, buf);
        EXPECT_TRUE(*detected == header);
        EXPECT_EQ(std::string(buf.view()), "xyz");
        EXPECT_EQ(io.reads(), 0u);
    };

    auto test_oversized_length = [] {
        ScriptedTransport io({std::string(kPreface) + be32(0xFFFFFFFFu), std::string(1024, 'x')});
        ByteBuffer buf(64);
        EXPECT_THROWS_CODE(detect_over(io, buf), make_error_code(HeaderErrc::oversized_frame));
        EXPECT_EQ(io.reads(), 1u);
        EXPECT_TRUE(buf.capacity() <= 128u);
    };

    auto test_capacity_bound = [] {
        // After the 28 framing bytes, 36 bytes of capacity remain; with the
        // preface allowance a 64-byte allocation admits 64 bytes.
        ScriptedTransport over({std::string(kPreface) + be32(65)});
        ByteBuffer over_buf(64);
        EXPECT_THROWS_CODE(detect_over(over, over_buf), make_error_code(HeaderErrc::oversized_frame));

        ScriptedTransport at({std::string(kPreface) + be32(64)});
        ByteBuffer at_buf(64);
        EXPECT_THROWS_CODE(detect_over(at, at_buf), make_error_code(HeaderErrc::truncated_frame));
    };

    auto test_bound_ignores_read_split = [] {
        // 31-byte name: a 36-byte payload, exactly at the bound.
        const Header fits(4040, Name::parse(std::string(27, 'a') + ".com"));
        // 75-byte name: an 80-byte payload, past it.
        const Header too_big(4040, Name::parse(std::string(40, 'a') + "." + std::string(30, 'b') + ".com"));
        EXPECT_EQ(fits.encode().size(), 36u);
        EXPECT_EQ(too_big.encode().size(), 80u);

        const auto fits_bytes = frame_bytes(fits);
        for (std::size_t split : {kPrefaceLen, fits_bytes.size()}) {
            std::vector<std::string> chunks{fits_bytes.substr(0, split)};
            if (split < fits_bytes.size()) chunks.push_back(fits_bytes.substr(split));
            ScriptedTransport io(chunks);
            ByteBuffer buf(64);
            auto detected = detect_over(io, buf);
            EXPECT_TRUE(detected.has_value());
            EXPECT_TRUE(*detected == fits);
        }

        const auto big_bytes = frame_bytes(too_big);
        for (std::size_t split : {kPrefaceLen, std::size_t{64}}) {
            ScriptedTransport io({big_bytes.substr(0, split), big_bytes.substr(split)});
            ByteBuffer buf(64);
            EXPECT_THROWS_CODE(detect_over(io, buf), make_error_code(HeaderErrc::oversized_frame));
        }
    };

    auto test_truncated_payload = [] {
        const auto frame = frame_bytes(example_header());
        ScriptedTransport io(chunked(frame.substr(0, frame.size() - 3), 7));
        ByteBuffer buf;
        EXPECT_THROWS_CODE(detect_over(io, buf), make_error_code(HeaderErrc::truncated_frame));
    };

    auto test_malformed_payload = [] {
        const std::string garbage("\xff\xff\xff\xff", 4);
        ScriptedTransport io({std::string(kPreface) + be32(4) + garbage + "rest"});
        ByteBuffer buf;
        EXPECT_THROWS_CODE(detect_over(io, buf), make_error_code(HeaderErrc::malformed_payload));
    };

    auto test_invalid_name = [] {
        wire::Header msg;
        msg.set_port(80);
        msg.set_name("bad name");
        const auto payload = msg.SerializeAsString();
        ScriptedTransport io({std::string(kPreface) + be32(static_cast<uint32_t>(payload.size())) + payload});
        ByteBuffer buf;
        EXPECT_THROWS_CODE(detect_over(io, buf), make_error_code(HeaderErrc::invalid_name));
    };

    auto test_transport_error_propagates = [] {
        ScriptedTransport io({"proxy"}, boost::asio::error::connection_reset);
        ByteBuffer buf;
        EXPECT_THROWS_CODE(detect_over(io, buf), make_error_code(boost::asio::error::connection_reset));
        EXPECT_EQ(std::string(buf.view()), "proxy");
    };

    auto test_stream_transport = [] {
        using boost::asio::local::stream_protocol;
        boost::asio::io_context ctx;
        stream_protocol::socket client(ctx);
        stream_protocol::socket server(ctx);
        boost::asio::local::connect_pair(client, server);

        const auto header = example_header();
        const auto bytes = frame_bytes(header) + "payload";
        boost::asio::write(client, boost::asio::buffer(bytes));
        client.shutdown(stream_protocol::socket::shutdown_send);

        StreamTransport<stream_protocol::socket> socket_io(server);
        std::atomic<uint64_t> counted{0};
        CountingTransport io(socket_io, counted);
        ByteBuffer buf;
        const auto detector = make_header_detector();
        auto detected = run_awaitable(ctx, detector->detect(io, buf));
        EXPECT_TRUE(detected.has_value());
        EXPECT_TRUE(*detected == header);

        // Whatever the detector read past the frame is still in the buffer;
        // the remainder is still on the socket.
        std::string rest(buf.view());
        ByteBuffer more;
        while (run_awaitable(ctx, socket_io.read_into(more)) != 0) {
        }
        rest += std::string(more.view());
        EXPECT_EQ(rest, "payload");
        EXPECT_TRUE(counted.load() >= kPrefaceLen);
    };

    auto test_detector_is_reusable = [] {
        DetectHeader detector;
        EXPECT_EQ(detector.name(), "connection-header");
        boost::asio::io_context ctx;
        for (int i = 0; i < 3; ++i) {
            ScriptedTransport with({frame_bytes(Header(static_cast<uint16_t>(1000 + i)))});
            ByteBuffer buf;
            auto detected = run_awaitable(ctx, detector.detect(with, buf));
            EXPECT_EQ(detected->port(), 1000 + i);

            ScriptedTransport without({kHttpRequest});
            ByteBuffer other;
            EXPECT_FALSE(run_awaitable(ctx, detector.detect(without, other)).has_value());
        }
    };

    return run_tests({
        {"detect_prefaced", test_detect_prefaced},
        {"detect_no_header", test_detect_no_header},
        {"no_header_fragmented", test_no_header_fragmented},
        {"many_reads", test_many_reads},
        {"one_byte_reads", test_one_byte_reads},
        {"every_split_point", test_every_split_point},
        {"short_stream_is_absent", test_short_stream_is_absent},
        {"prebuffered_bytes", test_prebuffered_bytes},
        {"oversized_length", test_oversized_length},
        {"capacity_bound", test_capacity_bound},
        {"bound_ignores_read_split", test_bound_ignores_read_split},
        {"truncated_payload", test_truncated_payload},
        {"malformed_payload", test_malformed_payload},
        {"invalid_name", test_invalid_name},
        {"transport_error_propagates", test_transport_error_propagates},
        {"stream_transport", test_stream_transport},
        {"detector_is_reusable", test_detector_is_reusable},
    });
}
