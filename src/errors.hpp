#pragma once

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>

namespace conn_header {

// Failures of a connection-header frame. A missing header is not an error.
enum class HeaderErrc {
    oversized_frame = 1,   // declared length exceeds the buffer bound
    truncated_frame,       // stream ended inside the payload
    malformed_payload,     // payload is not a valid header message
    invalid_name,          // name field failed DNS-name validation
    frame_too_large,       // encoded payload does not fit a 32-bit length
};

const boost::system::error_category& header_category() noexcept;

boost::system::error_code make_error_code(HeaderErrc e) noexcept;

} // namespace conn_header

namespace boost {
namespace system {

template <>
struct is_error_code_enum<conn_header::HeaderErrc> : std::true_type {};

} // namespace system
} // namespace boost
