#pragma once

#include "byte_buffer.hpp"
#include "errors.hpp"
#include "name.hpp"
#include "transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace conn_header {

// Magic bytes that open a connection-header frame.
inline constexpr std::string_view kPreface{"proxy.l5d.io/connect\r\n\r\n"};
// Preface plus the 4-byte length: bytes needed before anything can be decided.
inline constexpr std::size_t kPrefaceLen = kPreface.size() + 4;

// Routing metadata a client may send ahead of its own protocol.
class Header {
public:
    explicit Header(std::uint16_t port, std::optional<Name> name = std::nullopt)
        : port_(port), name_(std::move(name)) {}

    std::uint16_t port() const noexcept { return port_; }
    const std::optional<Name>& name() const noexcept { return name_; }

    friend bool operator==(const Header& a, const Header& b) noexcept {
        return a.port_ == b.port_ && a.name_ == b.name_;
    }
    friend bool operator!=(const Header& a, const Header& b) noexcept { return !(a == b); }

    // Serialized header message, without preface or length.
    std::string encode() const;

    // Appends preface, big-endian payload length and payload to `buf`.
    // `buf` is left unchanged on failure.
    void encode_prefaced(ByteBuffer& buf, boost::system::error_code& ec) const;
    void encode_prefaced(ByteBuffer& buf) const;

    // Decodes a header message payload. Wire ports outside 0..65535 are
    // truncated to 16 bits.
    static std::optional<Header> decode(std::string_view payload, boost::system::error_code& ec);

    // Reads a prefaced header from `io`, accumulating into `buf`.
    //
    // Returns std::nullopt when the stream does not start with the preface (or
    // closes before enough bytes arrive to tell); `buf` then still holds every
    // byte that was read. On success the frame is removed from `buf` and any
    // bytes after it are left in place. Once the preface has matched, any
    // problem with the frame is thrown as a system_error in header_category().
    static boost::asio::awaitable<std::optional<Header>> read_prefaced(Transport& io, ByteBuffer& buf);

private:
    std::uint16_t port_;
    std::optional<Name> name_;
};

std::ostream& operator<<(std::ostream& os, const Header& header);

} // namespace conn_header
