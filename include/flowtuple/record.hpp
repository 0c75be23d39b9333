/**
 * @file record.hpp
 * @brief Flow tuple record and its display format.
 */

#ifndef FLOWTUPLE_RECORD_HPP
#define FLOWTUPLE_RECORD_HPP

#include "config.hpp"

#include <string>

namespace flowtuple {

/**
 * @brief One flow tuple: an aggregated traffic pattern and its packet count.
 *
 * Addresses are held in host byte order. The destination address only
 * carries 3 octets on the wire, so its most-significant octet is always
 * zero after decoding.
 */
struct FlowRecord {
    std::uint32_t src_ip = 0;
    std::uint32_t dst_ip = 0;
    std::uint16_t src_port = 0;
    std::uint16_t dst_port = 0;
    std::uint8_t protocol = 0;
    std::uint8_t tcp_flags = 0;
    std::uint8_t ttl = 0;
    std::uint16_t ip_len = 0;
    std::uint32_t packet_count = 0;

    bool operator==(const FlowRecord&) const = default;
};

/**
 * @brief Class identifiers written by the corsaro flowtuple plugin.
 */
enum class FlowtupleClass : std::uint16_t {
    Backscatter = 0,
    IcmpRequest = 1,
    Other = 2
};

/**
 * @brief Name of a class id ("backscatter", "icmpreq", "other" or "unknown").
 */
const char* class_name(std::uint16_t class_id) noexcept;

/**
 * @brief Format an address as dotted quad, most-significant octet first.
 */
std::string format_ipv4(std::uint32_t ip);

/**
 * @brief Pipe-delimited display string.
 *
 * src|dst|sport|dport|proto|flags|ttl|len|count, with the TTL in
 * hexadecimal carrying a 0x prefix and everything else in decimal.
 */
std::string to_string(const FlowRecord& record);

} // namespace flowtuple

#endif // FLOWTUPLE_RECORD_HPP
