/**
 * @file byte_source.hpp
 * @brief Sequential byte sources feeding the decoder.
 *
 * The decoder needs nothing more than "read up to N bytes and say how
 * many arrived". Files, pipes and decompression streams are adapted to
 * this interface by the caller.
 */

#ifndef FLOWTUPLE_BYTE_SOURCE_HPP
#define FLOWTUPLE_BYTE_SOURCE_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>
#include <iosfwd>

namespace flowtuple {

/**
 * @brief Abstract sequential byte source.
 *
 * No seeking and no peeking. Implementations may return fewer bytes than
 * requested; a successful read of zero bytes means the data is exhausted.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to @p len bytes.
     *
     * @param dst Destination buffer (at least @p len bytes)
     * @param len Number of bytes requested
     * @param[out] got Number of bytes actually stored in @p dst
     * @return Error::Ok (possibly with got < len), or Error::Io
     */
    virtual Error read(std::uint8_t* dst, std::size_t len, std::size_t& got) noexcept = 0;
};

/**
 * @brief Byte source over a caller-owned memory buffer.
 *
 * The buffer must outlive the source.
 */
class MemorySource final : public ByteSource {
public:
    MemorySource(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    Error read(std::uint8_t* dst, std::size_t len, std::size_t& got) noexcept override {
        std::size_t avail = remaining();
        got = (len < avail) ? len : avail;
        if (got > 0) {
            std::memcpy(dst, data_ + pos_, got);
            pos_ += got;
        }
        return Error::Ok;
    }

    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

/**
 * @brief Byte source over a caller-owned std::istream.
 *
 * End of file maps to a short (or zero-length) read; a stream in the
 * bad state maps to Error::Io.
 */
class StreamSource final : public ByteSource {
public:
    explicit StreamSource(std::istream& in) noexcept : in_(in) {}

    Error read(std::uint8_t* dst, std::size_t len, std::size_t& got) noexcept override;

private:
    std::istream& in_;
};

} // namespace flowtuple

#endif // FLOWTUPLE_BYTE_SOURCE_HPP
