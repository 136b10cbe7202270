#pragma once

#include "byte_buffer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

namespace conn_header {

// Read side of a byte stream as seen by detectors.
class Transport {
public:
    virtual ~Transport() = default;

    // Appends whatever the peer has made available to `buf` and returns the
    // number of bytes appended. Returns 0 once the peer has closed. Transport
    // faults are thrown as boost::system::system_error; bytes already in `buf`
    // are never touched on failure.
    virtual boost::asio::awaitable<std::size_t> read_into(ByteBuffer& buf) = 0;
};

// Adapts any Asio AsyncReadStream (tcp::socket, local socket, ...).
template <class AsyncReadStream>
class StreamTransport : public Transport {
public:
    // Growth step once the buffer is full. A buffer with spare room is read
    // into as is, so its allocation does not depend on how the peer chunks.
    static constexpr std::size_t kGrowSize = 64;

    explicit StreamTransport(AsyncReadStream& stream) : stream_(stream) {}

    boost::asio::awaitable<std::size_t> read_into(ByteBuffer& buf) override {
        boost::system::error_code ec;
        const auto n = co_await stream_.async_read_some(
            buf.prepare(buf.spare() > 0 ? buf.spare() : kGrowSize),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        buf.commit(n);
        if (ec == boost::asio::error::eof && n == 0) {
            co_return 0;
        }
        if (ec && ec != boost::asio::error::eof) {
            throw boost::system::system_error(ec);
        }
        co_return n;
    }

private:
    AsyncReadStream& stream_;
};

// Counts every byte pulled through the wrapped transport.
class CountingTransport : public Transport {
public:
    CountingTransport(Transport& inner, std::atomic<std::uint64_t>& counter)
        : inner_(inner), counter_(counter) {}

    boost::asio::awaitable<std::size_t> read_into(ByteBuffer& buf) override {
        const auto n = co_await inner_.read_into(buf);
        counter_.fetch_add(n, std::memory_order_relaxed);
        co_return n;
    }

private:
    Transport& inner_;
    std::atomic<std::uint64_t>& counter_;
};

} // namespace conn_header
