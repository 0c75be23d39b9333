/**
 * @file stream_decoder.hpp
 * @brief Flowtuple framing state machine.
 *
 * A flowtuple stream is a sequence of intervals, each holding a sequence
 * of classes, each holding a declared number of records:
 *
 *     interval header   EDGR INTR number(2) start(4)
 *       class header    SIXT id(2) key_count(4)
 *         record * key_count
 *       class tail      SIXT id(2)
 *       ...
 *     interval tail     EDGR INTR number(2) end(4)
 *     ...
 *     end of stream     00000000
 *
 * The outer EDGR of an interval tail is what read_class_header() sees
 * when the interval has no more classes.
 *
 * Consumers drive the decoder with nested loops:
 *
 * @code
 * while (dec.read_interval_header() == Error::Ok) {
 *     while (dec.read_class_header() == Error::Ok) {
 *         while (dec.read_record(rec) == Error::Ok) { ... }
 *         dec.read_class_tail();
 *     }
 *     dec.read_interval_tail();
 * }
 * @endcode
 *
 * (error checks omitted; see decode_stream() for the complete loop).
 *
 * @see http://www.caida.org/tools/measurement/corsaro/docs/formats.html
 */

#ifndef FLOWTUPLE_STREAM_DECODER_HPP
#define FLOWTUPLE_STREAM_DECODER_HPP

#include "byte_reader.hpp"
#include "byte_source.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "error.hpp"
#include "record.hpp"
#include "record_decoder.hpp"

namespace flowtuple {

/**
 * @brief Bookkeeping for the interval and class being decoded.
 *
 * Invariant: records_read <= key_count.
 */
struct DecoderState {
    std::uint16_t interval_number = 0;
    std::uint16_t class_id = 0;
    std::uint32_t key_count = 0;
    std::uint32_t records_read = 0;
};

/**
 * @brief Streaming decoder for flowtuple files.
 *
 * Validates the magic numbers at each nesting boundary and checks that
 * every tail repeats the identifier of its header. The call order is a
 * contract with the caller and is not checked at runtime.
 *
 * Every operation returns Error::Ok, one of the End* signals closing the
 * level it reads, or a failure. After a failure, last_error() describes
 * it and the decoder state is unchanged. Not thread-safe.
 */
class StreamDecoder {
public:
    /**
     * @brief Construct a decoder.
     *
     * @param source Byte source positioned at the start of the stream
     * @param sink Optional diagnostic sink (may be nullptr)
     */
    explicit StreamDecoder(ByteSource& source, DiagnosticSink* sink = nullptr) noexcept
        : reader_(source), sink_(sink) {}

    /**
     * @brief Read an interval header.
     *
     * @return Error::Ok, Error::EndOfStream at the zero sentinel,
     *         Error::StructuralMismatch, Error::ShortRead or Error::Io
     */
    Error read_interval_header() noexcept;

    /**
     * @brief Read a class header.
     *
     * @return Error::Ok, Error::EndOfInterval when the outer magic of the
     *         interval tail is found, or a failure
     */
    Error read_class_header() noexcept;

    /**
     * @brief Read the next record of the current class.
     *
     * Consumes nothing once the declared key count has been read.
     *
     * @param[out] record Record storage, overwritten on success only
     * @return Error::Ok, Error::EndOfClass, or a failure
     */
    Error read_record(FlowRecord& record) noexcept;

    /**
     * @brief Read a class tail and check its id against the header.
     */
    Error read_class_tail() noexcept;

    /**
     * @brief Read the rest of an interval tail and check its number.
     */
    Error read_interval_tail() noexcept;

    [[nodiscard]] std::uint16_t interval_number() const noexcept {
        return state_.interval_number;
    }

    [[nodiscard]] std::uint16_t class_id() const noexcept {
        return state_.class_id;
    }

    [[nodiscard]] std::uint32_t key_count() const noexcept {
        return state_.key_count;
    }

    [[nodiscard]] std::uint32_t records_read() const noexcept {
        return state_.records_read;
    }

    [[nodiscard]] const DecoderState& state() const noexcept {
        return state_;
    }

    /// Bytes consumed from the source so far.
    [[nodiscard]] std::size_t offset() const noexcept {
        return reader_.offset();
    }

    [[nodiscard]] const ErrorInfo& last_error() const noexcept {
        return last_error_;
    }

private:
    Error fail_read(Error result, std::size_t at, const char* field) noexcept;
    Error fail_magic(std::size_t at, const char* field, std::uint32_t expected,
                     std::uint32_t actual) noexcept;
    Error fail_mismatch(std::size_t at, const char* field, std::uint32_t expected,
                        std::uint32_t actual) noexcept;

    [[gnu::format(printf, 2, 3)]] void note(const char* fmt, ...) noexcept;

    ByteReader reader_;
    RecordDecoder record_decoder_;
    DiagnosticSink* sink_;
    DecoderState state_;
    ErrorInfo last_error_;
};

} // namespace flowtuple

#endif // FLOWTUPLE_STREAM_DECODER_HPP
