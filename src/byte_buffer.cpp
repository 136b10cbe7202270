#include "byte_buffer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace conn_header {

ByteBuffer::ByteBuffer(std::size_t capacity) : storage_(capacity) {}

void ByteBuffer::reserve(std::size_t additional) {
    if (spare() >= additional) return;
    compact();
    if (spare() >= additional) return;
    const auto needed = end_ + additional;
    storage_.resize(std::max(needed, storage_.size() * 2));
}

boost::asio::mutable_buffer ByteBuffer::prepare(std::size_t min_size) {
    reserve(min_size);
    return boost::asio::buffer(storage_.data() + end_, spare());
}

void ByteBuffer::commit(std::size_t n) {
    if (n > spare()) {
        throw std::out_of_range("ByteBuffer::commit past capacity");
    }
    end_ += n;
}

void ByteBuffer::append(const void* bytes, std::size_t n) {
    if (n == 0) return;
    reserve(n);
    std::memcpy(storage_.data() + end_, bytes, n);
    end_ += n;
}

void ByteBuffer::put_u32(std::uint32_t value) {
    const unsigned char be[4] = {
        static_cast<unsigned char>(value >> 24),
        static_cast<unsigned char>(value >> 16),
        static_cast<unsigned char>(value >> 8),
        static_cast<unsigned char>(value),
    };
    append(be, sizeof(be));
}

void ByteBuffer::consume(std::size_t n) {
    if (n > size()) {
        throw std::out_of_range("ByteBuffer::consume past readable bytes");
    }
    begin_ += n;
}

std::string ByteBuffer::split_to(std::size_t n) {
    if (n > size()) {
        throw std::out_of_range("ByteBuffer::split_to past readable bytes");
    }
    std::string out(data(), n);
    consume(n);
    return out;
}

std::uint32_t ByteBuffer::get_u32() {
    if (size() < 4) {
        throw std::out_of_range("ByteBuffer::get_u32 needs 4 bytes");
    }
    const auto* p = reinterpret_cast<const unsigned char*>(data());
    const std::uint32_t value = (static_cast<std::uint32_t>(p[0]) << 24) |
                                (static_cast<std::uint32_t>(p[1]) << 16) |
                                (static_cast<std::uint32_t>(p[2]) << 8) |
                                static_cast<std::uint32_t>(p[3]);
    consume(4);
    return value;
}

void ByteBuffer::compact() noexcept {
    if (begin_ == 0) return;
    const auto n = size();
    if (n > 0) {
        std::memmove(storage_.data(), storage_.data() + begin_, n);
    }
    begin_ = 0;
    end_ = n;
}

} // namespace conn_header
