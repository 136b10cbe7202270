#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/buffer.hpp>

namespace conn_header {

// Growable byte buffer with a read cursor at the front and a write cursor at
// the back. Bytes between the two are "readable"; everything after the write
// cursor is spare capacity that a transport can fill in place.
//
// capacity() is measured from the read cursor, so consuming bytes from the
// front shrinks it until the next compaction. Only reserve() compacts; an
// emptied buffer keeps its cursor until clear().
class ByteBuffer {
public:
    ByteBuffer() = default;
    explicit ByteBuffer(std::size_t capacity);

    std::size_t size() const noexcept { return end_ - begin_; }
    bool empty() const noexcept { return begin_ == end_; }
    std::size_t capacity() const noexcept { return storage_.size() - begin_; }
    std::size_t spare() const noexcept { return storage_.size() - end_; }

    const char* data() const noexcept { return storage_.data() + begin_; }
    std::string_view view() const noexcept { return {data(), size()}; }

    // Ensures at least `additional` bytes of spare capacity.
    void reserve(std::size_t additional);

    // Spare region of at least `min_size` bytes for a transport to write into.
    // Nothing becomes readable until commit().
    boost::asio::mutable_buffer prepare(std::size_t min_size);
    void commit(std::size_t n);

    void append(const void* bytes, std::size_t n);
    void append(std::string_view bytes) { append(bytes.data(), bytes.size()); }
    void put_u32(std::uint32_t value);

    // Drops `n` readable bytes from the front.
    void consume(std::size_t n);

    // Removes and returns the first `n` readable bytes.
    std::string split_to(std::size_t n);

    // Reads a big-endian u32 from the front and consumes it.
    std::uint32_t get_u32();

    void clear() noexcept { begin_ = end_ = 0; }

private:
    void compact() noexcept;

    std::vector<char> storage_;
    std::size_t begin_ = 0;
    std::size_t end_ = 0;
};

} // namespace conn_header
