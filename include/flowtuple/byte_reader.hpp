/**
 * @file byte_reader.hpp
 * @brief Big-endian field reader over a ByteSource.
 *
 * The byte reader turns the raw "up to N bytes" reads of a ByteSource
 * into whole fixed-width fields, tracking how many bytes have been
 * consumed from the stream.
 */

#ifndef FLOWTUPLE_BYTE_READER_HPP
#define FLOWTUPLE_BYTE_READER_HPP

#include "byte_source.hpp"
#include "config.hpp"
#include "error.hpp"

namespace flowtuple {

/**
 * @brief Sequential big-endian reader.
 *
 * Every read either fills the whole field or fails. Partial reads from
 * the source are retried until the field is complete or the source
 * reports no more data, in which case the field fails with ShortRead.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param source Byte source (must outlive the reader)
     */
    explicit ByteReader(ByteSource& source) noexcept : source_(source), offset_(0) {}

    /**
     * @brief Read exactly @p len bytes.
     *
     * @param dst Destination buffer
     * @param len Number of bytes required
     * @return Error::Ok, Error::ShortRead, or Error::Io from the source
     */
    Error read_exact(std::uint8_t* dst, std::size_t len) noexcept {
        std::size_t filled = 0;
        while (filled < len) {
            std::size_t got = 0;
            auto result = source_.read(dst + filled, len - filled, got);
            offset_ += got;
            filled += got;
            if (result != Error::Ok) [[unlikely]] {
                return result;
            }
            if (got == 0) [[unlikely]] {
                return Error::ShortRead;
            }
        }
        return Error::Ok;
    }

    Error read_u8(std::uint8_t& value) noexcept {
        return read_exact(&value, 1);
    }

    Error read_u16(std::uint16_t& value) noexcept {
        std::uint8_t buf[2];
        auto result = read_exact(buf, sizeof(buf));
        if (result != Error::Ok) {
            return result;
        }
        value = static_cast<std::uint16_t>((buf[0] << 8) | buf[1]);
        return Error::Ok;
    }

    Error read_u32(std::uint32_t& value) noexcept {
        std::uint8_t buf[4];
        auto result = read_exact(buf, sizeof(buf));
        if (result != Error::Ok) {
            return result;
        }
        value = load_u32(buf);
        return Error::Ok;
    }

    /**
     * @brief Decode 4 big-endian bytes.
     */
    [[nodiscard]] static constexpr std::uint32_t load_u32(const std::uint8_t* p) noexcept {
        return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
               (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
    }

    /**
     * @brief Get number of bytes consumed so far.
     *
     * Includes the bytes of a field that failed part way.
     */
    [[nodiscard]] std::size_t offset() const noexcept {
        return offset_;
    }

private:
    ByteSource& source_;
    std::size_t offset_;
};

} // namespace flowtuple

#endif // FLOWTUPLE_BYTE_READER_HPP
