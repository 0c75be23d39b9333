/**
 * @file record_decoder.hpp
 * @brief Fixed-width flow tuple record decoding.
 *
 * Wire layout of one record (20 bytes, big-endian):
 *
 *     src_ip(4) dst_ip(3) src_port(2) dst_port(2) protocol(1)
 *     tcp_flags(1) ttl(1) ip_len(2) packet_count(4)
 *
 * The destination address is only 3 octets wide on the wire. They become
 * the low-order octets of the 32-bit value; the high-order octet is zero.
 */

#ifndef FLOWTUPLE_RECORD_DECODER_HPP
#define FLOWTUPLE_RECORD_DECODER_HPP

#include "byte_reader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "record.hpp"

#include <array>

namespace flowtuple {

/**
 * @brief Decodes records from a byte reader; knows nothing of framing.
 */
class RecordDecoder {
public:
    /**
     * @brief Decode one record.
     *
     * The record is only written when all 20 bytes were decoded.
     *
     * @param reader Reader positioned at the start of a record
     * @param[out] record Decoded record
     * @return Error::Ok, Error::ShortRead, or Error::Io
     */
    Error decode(ByteReader& reader, FlowRecord& record) noexcept;

private:
    std::array<std::uint8_t, 4> dst_scratch_{};
};

} // namespace flowtuple

#endif // FLOWTUPLE_RECORD_DECODER_HPP
