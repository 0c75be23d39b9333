/**
 * @file record.cpp
 * @brief FlowRecord display helpers.
 */

#include <flowtuple/record.hpp>

#include <cstdio>

namespace flowtuple {

const char* class_name(std::uint16_t class_id) noexcept {
    switch (static_cast<FlowtupleClass>(class_id)) {
    case FlowtupleClass::Backscatter:
        return "backscatter";
    case FlowtupleClass::IcmpRequest:
        return "icmpreq";
    case FlowtupleClass::Other:
        return "other";
    default:
        return "unknown";
    }
}

std::string format_ipv4(std::uint32_t ip) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", (ip >> 24) & 0xFFU, (ip >> 16) & 0xFFU,
                  (ip >> 8) & 0xFFU, ip & 0xFFU);
    return buf;
}

std::string to_string(const FlowRecord& record) {
    // 2 addresses (15) + 8 separators + numeric fields, well under 96
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s|%s|%u|%u|%u|%u|0x%x|%u|%u",
                  format_ipv4(record.src_ip).c_str(), format_ipv4(record.dst_ip).c_str(),
                  static_cast<unsigned>(record.src_port), static_cast<unsigned>(record.dst_port),
                  static_cast<unsigned>(record.protocol), static_cast<unsigned>(record.tcp_flags),
                  static_cast<unsigned>(record.ttl), static_cast<unsigned>(record.ip_len),
                  static_cast<unsigned>(record.packet_count));
    return buf;
}

} // namespace flowtuple
