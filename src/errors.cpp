#include "errors.hpp"

namespace conn_header {

namespace {

class HeaderCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "conn_header"; }

    std::string message(int ev) const override {
        switch (static_cast<HeaderErrc>(ev)) {
            case HeaderErrc::oversized_frame: return "Message length exceeds capacity";
            case HeaderErrc::truncated_frame: return "Full header message not provided";
            case HeaderErrc::malformed_payload: return "Invalid header message";
            case HeaderErrc::invalid_name: return "Invalid name";
            case HeaderErrc::frame_too_large: return "Header message length exceeds 32 bits";
        }
        return "Unknown connection header error";
    }

    boost::system::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<HeaderErrc>(ev)) {
            case HeaderErrc::truncated_frame:
                return boost::system::errc::make_error_condition(boost::system::errc::io_error);
            case HeaderErrc::frame_too_large:
                return boost::system::errc::make_error_condition(boost::system::errc::message_size);
            default:
                return boost::system::errc::make_error_condition(boost::system::errc::invalid_argument);
        }
    }
};

} // namespace

const boost::system::error_category& header_category() noexcept {
    static const HeaderCategory category;
    return category;
}

boost::system::error_code make_error_code(HeaderErrc e) noexcept {
    return {static_cast<int>(e), header_category()};
}

} // namespace conn_header
