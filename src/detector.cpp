#include "detector.hpp"

namespace conn_header {

boost::asio::awaitable<std::optional<Header>> DetectHeader::detect(Transport& io, ByteBuffer& buf) const {
    co_return co_await Header::read_prefaced(io, buf);
}

std::shared_ptr<const Detect<Header>> make_header_detector() {
    return std::make_shared<DetectHeader>();
}

} // namespace conn_header
