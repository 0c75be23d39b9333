/**
 * @file record_decoder.cpp
 * @brief RecordDecoder implementation.
 */

#include <flowtuple/record_decoder.hpp>

namespace flowtuple {

Error RecordDecoder::decode(ByteReader& reader, FlowRecord& record) noexcept {
    FlowRecord rec;

    auto result = reader.read_u32(rec.src_ip);
    if (result != Error::Ok) {
        return result;
    }

    // High octet must never carry bytes from a previous record
    dst_scratch_.fill(0);
    result = reader.read_exact(&dst_scratch_[4 - DST_IP_WIRE_SIZE], DST_IP_WIRE_SIZE);
    if (result != Error::Ok) {
        return result;
    }
    rec.dst_ip = ByteReader::load_u32(dst_scratch_.data());

    if ((result = reader.read_u16(rec.src_port)) != Error::Ok ||
        (result = reader.read_u16(rec.dst_port)) != Error::Ok ||
        (result = reader.read_u8(rec.protocol)) != Error::Ok ||
        (result = reader.read_u8(rec.tcp_flags)) != Error::Ok ||
        (result = reader.read_u8(rec.ttl)) != Error::Ok ||
        (result = reader.read_u16(rec.ip_len)) != Error::Ok ||
        (result = reader.read_u32(rec.packet_count)) != Error::Ok) {
        return result;
    }

    record = rec;
    return Error::Ok;
}

} // namespace flowtuple
