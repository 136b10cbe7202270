#include "header.hpp"

#include "header.pb.h"

#include <limits>
#include <ostream>

namespace conn_header {

std::string Header::encode() const {
    wire::Header msg;
    msg.set_port(static_cast<std::int32_t>(port_));
    if (name_) {
        msg.set_name(name_->str());
    }
    return msg.SerializeAsString();
}

void Header::encode_prefaced(ByteBuffer& buf, boost::system::error_code& ec) const {
    ec.clear();
    const auto payload = encode();
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        ec = HeaderErrc::frame_too_large;
        return;
    }
    buf.reserve(kPrefaceLen + payload.size());
    buf.append(kPreface);
    buf.put_u32(static_cast<std::uint32_t>(payload.size()));
    buf.append(payload);
}

void Header::encode_prefaced(ByteBuffer& buf) const {
    boost::system::error_code ec;
    encode_prefaced(buf, ec);
    if (ec) throw boost::system::system_error(ec);
}

std::optional<Header> Header::decode(std::string_view payload, boost::system::error_code& ec) {
    ec.clear();
    wire::Header msg;
    if (payload.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
        !msg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        ec = HeaderErrc::malformed_payload;
        return std::nullopt;
    }

    std::optional<Name> name;
    if (!msg.name().empty()) {
        name = Name::parse(msg.name());
        if (!name) {
            ec = HeaderErrc::invalid_name;
            return std::nullopt;
        }
    }

    // Narrowing is modulo 2^16, matching the sender-side cast.
    return Header(static_cast<std::uint16_t>(msg.port()), std::move(name));
}

boost::asio::awaitable<std::optional<Header>> Header::read_prefaced(Transport& io, ByteBuffer& buf) {
    while (buf.size() < kPrefaceLen) {
        if (co_await io.read_into(buf) == 0) {
            co_return std::nullopt;
        }
    }

    if (buf.view().substr(0, kPreface.size()) != kPreface) {
        co_return std::nullopt;
    }
    buf.consume(kPreface.size());

    // A peer that declares more than we are willing to buffer is not trusted.
    const std::size_t msg_len = buf.get_u32();
    if (msg_len > buf.capacity() + kPrefaceLen) {
        throw boost::system::system_error(make_error_code(HeaderErrc::oversized_frame));
    }

    buf.reserve(msg_len > buf.size() ? msg_len - buf.size() : 0);
    while (buf.size() < msg_len) {
        if (co_await io.read_into(buf) == 0) {
            throw boost::system::system_error(make_error_code(HeaderErrc::truncated_frame));
        }
    }

    const auto msg = buf.split_to(msg_len);
    boost::system::error_code ec;
    auto header = decode(msg, ec);
    if (ec) {
        throw boost::system::system_error(ec);
    }
    co_return header;
}

std::ostream& operator<<(std::ostream& os, const Header& header) {
    os << "port=" << header.port();
    if (header.name()) {
        os << " name=" << *header.name();
    }
    return os;
}

} // namespace conn_header
