/**
 * @file wire_builder.hpp
 * @brief Test helpers: flowtuple stream builder and instrumented sources.
 */

#ifndef FLOWTUPLE_TESTS_WIRE_BUILDER_HPP
#define FLOWTUPLE_TESTS_WIRE_BUILDER_HPP

#include <flowtuple/byte_source.hpp>
#include <flowtuple/config.hpp>
#include <flowtuple/diagnostics.hpp>
#include <flowtuple/record.hpp>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace flowtuple::testing {

/**
 * @brief Appends big-endian flowtuple structures to a byte vector.
 */
class WireBuilder {
public:
    WireBuilder& u8(std::uint8_t v) {
        bytes_.push_back(v);
        return *this;
    }

    WireBuilder& u16(std::uint16_t v) {
        bytes_.push_back(static_cast<std::uint8_t>(v >> 8));
        bytes_.push_back(static_cast<std::uint8_t>(v));
        return *this;
    }

    WireBuilder& u24(std::uint32_t v) {
        bytes_.push_back(static_cast<std::uint8_t>(v >> 16));
        bytes_.push_back(static_cast<std::uint8_t>(v >> 8));
        bytes_.push_back(static_cast<std::uint8_t>(v));
        return *this;
    }

    WireBuilder& u32(std::uint32_t v) {
        u16(static_cast<std::uint16_t>(v >> 16));
        return u16(static_cast<std::uint16_t>(v));
    }

    WireBuilder& interval_header(std::uint16_t number, std::uint32_t start = 1000) {
        return u32(OUTER_MAGIC).u32(INTERVAL_MAGIC).u16(number).u32(start);
    }

    WireBuilder& class_header(std::uint16_t id, std::uint32_t key_count) {
        return u32(CLASS_MAGIC).u16(id).u32(key_count);
    }

    /// Only the low 3 octets of dst_ip are written, as on the wire.
    WireBuilder& record(const FlowRecord& r) {
        u32(r.src_ip).u24(r.dst_ip & 0x00FFFFFFU);
        u16(r.src_port).u16(r.dst_port);
        u8(r.protocol).u8(r.tcp_flags).u8(r.ttl);
        return u16(r.ip_len).u32(r.packet_count);
    }

    WireBuilder& class_tail(std::uint16_t id) {
        return u32(CLASS_MAGIC).u16(id);
    }

    WireBuilder& interval_tail(std::uint16_t number, std::uint32_t end = 1060) {
        return u32(OUTER_MAGIC).u32(INTERVAL_MAGIC).u16(number).u32(end);
    }

    WireBuilder& end_of_stream() {
        return u32(END_OF_STREAM_MAGIC);
    }

    [[nodiscard]] std::size_t size() const {
        return bytes_.size();
    }

    std::vector<std::uint8_t>& bytes() {
        return bytes_;
    }

private:
    std::vector<std::uint8_t> bytes_;
};

/**
 * @brief Sample record with every field distinct.
 */
inline FlowRecord sample_record(std::uint32_t n = 0) {
    FlowRecord r;
    r.src_ip = 0xC0A80001U + n;  // 192.168.0.1
    r.dst_ip = 0x000A0B0CU + n;  // 0.10.11.12
    r.src_port = static_cast<std::uint16_t>(40000 + n);
    r.dst_port = 443;
    r.protocol = 6;
    r.tcp_flags = 0x12;
    r.ttl = 64;
    r.ip_len = 1500;
    r.packet_count = 7 + n;
    return r;
}

/**
 * @brief Memory source returning at most `chunk` bytes per read.
 */
class ChunkedSource final : public ByteSource {
public:
    ChunkedSource(const std::vector<std::uint8_t>& data, std::size_t chunk)
        : data_(data), chunk_(chunk) {}

    Error read(std::uint8_t* dst, std::size_t len, std::size_t& got) noexcept override {
        got = std::min({len, chunk_, data_.size() - pos_});
        std::memcpy(dst, data_.data() + pos_, got);
        pos_ += got;
        ++calls_;
        return Error::Ok;
    }

    [[nodiscard]] std::size_t calls() const {
        return calls_;
    }

private:
    const std::vector<std::uint8_t>& data_;
    std::size_t chunk_;
    std::size_t pos_ = 0;
    std::size_t calls_ = 0;
};

/**
 * @brief Source that delivers `limit` bytes and then fails with Error::Io.
 */
class FailingSource final : public ByteSource {
public:
    FailingSource(const std::vector<std::uint8_t>& data, std::size_t limit)
        : data_(data), limit_(limit) {}

    Error read(std::uint8_t* dst, std::size_t len, std::size_t& got) noexcept override {
        got = std::min(len, limit_ - pos_);
        std::memcpy(dst, data_.data() + pos_, got);
        pos_ += got;
        return pos_ >= limit_ ? Error::Io : Error::Ok;
    }

private:
    const std::vector<std::uint8_t>& data_;
    std::size_t limit_;
    std::size_t pos_ = 0;
};

/**
 * @brief Sink keeping every line it receives.
 */
class CollectingSink final : public DiagnosticSink {
public:
    void write(const char* line) noexcept override {
        lines.emplace_back(line);
    }

    std::vector<std::string> lines;
};

} // namespace flowtuple::testing

#endif // FLOWTUPLE_TESTS_WIRE_BUILDER_HPP
