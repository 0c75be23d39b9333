/**
 * @file flowtuple.hpp
 * @brief High-level flowtuple decoding API.
 *
 * Provides decode_stream(), which runs the complete interval / class /
 * record loop over a byte source and hands every record to a visitor.
 *
 * @see http://www.caida.org/tools/measurement/corsaro/docs/formats.html
 */

#ifndef FLOWTUPLE_HPP
#define FLOWTUPLE_HPP

#include "byte_reader.hpp"
#include "byte_source.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "error.hpp"
#include "record.hpp"
#include "record_decoder.hpp"
#include "stream_decoder.hpp"

#include <utility>

namespace flowtuple {

/**
 * @brief Totals collected by decode_stream().
 */
struct DecodeSummary {
    std::size_t intervals = 0;
    std::size_t classes = 0;
    std::size_t records = 0;
    std::size_t bytes = 0;
    ErrorInfo error; ///< Failure context, code is Error::Ok on success
};

/**
 * @brief Decode a whole stream.
 *
 * The visitor is invoked as visitor(decoder, record) for every record,
 * with the decoder exposing the current interval number and class id.
 *
 * @tparam Visitor Callable taking (const StreamDecoder&, const FlowRecord&)
 * @param source Byte source positioned at the start of the stream
 * @param visitor Record callback
 * @param sink Optional diagnostic sink
 * @param[out] summary Optional totals, filled on success and on failure
 * @return Error::Ok once the end-of-stream sentinel is reached, otherwise
 *         the first failure
 */
template <typename Visitor>
Error decode_stream(ByteSource& source, Visitor&& visitor, DiagnosticSink* sink = nullptr,
                    DecodeSummary* summary = nullptr) {
    StreamDecoder decoder(source, sink);
    DecodeSummary totals;
    FlowRecord record;

    auto finish = [&](Error result) {
        totals.bytes = decoder.offset();
        totals.error = decoder.last_error();
        if (summary != nullptr) {
            *summary = totals;
        }
        return result;
    };

    for (;;) {
        auto result = decoder.read_interval_header();
        if (result == Error::EndOfStream) {
            return finish(Error::Ok);
        }
        if (result != Error::Ok) {
            return finish(result);
        }
        ++totals.intervals;

        for (;;) {
            result = decoder.read_class_header();
            if (result == Error::EndOfInterval) {
                break;
            }
            if (result != Error::Ok) {
                return finish(result);
            }
            ++totals.classes;

            while ((result = decoder.read_record(record)) == Error::Ok) {
                ++totals.records;
                visitor(static_cast<const StreamDecoder&>(decoder),
                        static_cast<const FlowRecord&>(record));
            }
            if (result != Error::EndOfClass) {
                return finish(result);
            }

            result = decoder.read_class_tail();
            if (result != Error::Ok) {
                return finish(result);
            }
        }

        result = decoder.read_interval_tail();
        if (result != Error::Ok) {
            return finish(result);
        }
    }
}

#if !FLOWTUPLE_NO_EXCEPTIONS

/**
 * @brief Decode a whole stream, throwing on failure.
 *
 * @return Totals of the decoded stream
 * @throws FlowtupleException subclass matching the failure
 */
template <typename Visitor>
DecodeSummary decode_stream_or_throw(ByteSource& source, Visitor&& visitor,
                                     DiagnosticSink* sink = nullptr) {
    DecodeSummary summary;
    if (decode_stream(source, std::forward<Visitor>(visitor), sink, &summary) != Error::Ok) {
        throw_on_error(summary.error);
    }
    return summary;
}

#endif // !FLOWTUPLE_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace flowtuple

#endif // FLOWTUPLE_HPP
