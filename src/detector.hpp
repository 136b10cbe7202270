#pragma once

#include "byte_buffer.hpp"
#include "header.hpp"
#include "transport.hpp"

#include <memory>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>

namespace conn_header {

// A sniffer tried against the first bytes of a fresh connection. It either
// claims the stream as `Protocol` or returns std::nullopt and leaves `buf`
// exactly as it found it, apart from newly read bytes appended to the end.
template <class Protocol>
class Detect {
public:
    using protocol_type = Protocol;

    virtual ~Detect() = default;
    virtual std::string name() const = 0;
    virtual boost::asio::awaitable<std::optional<Protocol>> detect(Transport& io, ByteBuffer& buf) const = 0;
};

// Detects the connection-header preface. Stateless; one instance can serve
// every connection.
class DetectHeader : public Detect<Header> {
public:
    std::string name() const override { return "connection-header"; }

    boost::asio::awaitable<std::optional<Header>> detect(Transport& io, ByteBuffer& buf) const override;
};

std::shared_ptr<const Detect<Header>> make_header_detector();

} // namespace conn_header
