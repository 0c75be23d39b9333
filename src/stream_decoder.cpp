/**
 * @file stream_decoder.cpp
 * @brief StreamDecoder implementation.
 */

#include <flowtuple/stream_decoder.hpp>

#include <cstdarg>
#include <cstdio>

namespace flowtuple {

Error StreamDecoder::read_interval_header() noexcept {
    last_error_.clear();

    std::size_t at = reader_.offset();
    std::uint32_t magic = 0;
    auto result = reader_.read_u32(magic);
    if (result != Error::Ok) {
        return fail_read(result, at, "outer magic");
    }
    if (magic == END_OF_STREAM_MAGIC) {
        return Error::EndOfStream;
    }
    if (magic != OUTER_MAGIC) {
        return fail_magic(at, "outer", OUTER_MAGIC, magic);
    }

    at = reader_.offset();
    result = reader_.read_u32(magic);
    if (result != Error::Ok) {
        return fail_read(result, at, "interval magic");
    }
    // Some writers terminate with an outer magic followed by a zero word
    if (magic == END_OF_STREAM_MAGIC) {
        return Error::EndOfStream;
    }
    if (magic != INTERVAL_MAGIC) {
        return fail_magic(at, "interval", INTERVAL_MAGIC, magic);
    }

    at = reader_.offset();
    std::uint16_t number = 0;
    result = reader_.read_u16(number);
    if (result != Error::Ok) {
        return fail_read(result, at, "interval number");
    }

    at = reader_.offset();
    std::uint32_t start_time = 0;
    result = reader_.read_u32(start_time);
    if (result != Error::Ok) {
        return fail_read(result, at, "interval start time");
    }

    state_ = DecoderState{};
    state_.interval_number = number;

    note("Interval number: %u", static_cast<unsigned>(number));
    note("Interval start time: %u", static_cast<unsigned>(start_time));
    return Error::Ok;
}

Error StreamDecoder::read_class_header() noexcept {
    last_error_.clear();

    std::size_t at = reader_.offset();
    std::uint32_t magic = 0;
    auto result = reader_.read_u32(magic);
    if (result != Error::Ok) {
        return fail_read(result, at, "class magic");
    }
    if (magic == OUTER_MAGIC) {
        return Error::EndOfInterval;
    }
    if (magic != CLASS_MAGIC) {
        return fail_magic(at, "class", CLASS_MAGIC, magic);
    }

    at = reader_.offset();
    std::uint16_t id = 0;
    result = reader_.read_u16(id);
    if (result != Error::Ok) {
        return fail_read(result, at, "class id");
    }

    at = reader_.offset();
    std::uint32_t keys = 0;
    result = reader_.read_u32(keys);
    if (result != Error::Ok) {
        return fail_read(result, at, "key count");
    }

    state_.class_id = id;
    state_.key_count = keys;
    state_.records_read = 0;

    note("Class id: %u", static_cast<unsigned>(id));
    note("Key count: %u", static_cast<unsigned>(keys));
    return Error::Ok;
}

Error StreamDecoder::read_record(FlowRecord& record) noexcept {
    last_error_.clear();

    if (state_.records_read >= state_.key_count) {
        return Error::EndOfClass;
    }

    std::size_t at = reader_.offset();
    auto result = record_decoder_.decode(reader_, record);
    if (result != Error::Ok) {
        return fail_read(result, at, "record");
    }

    ++state_.records_read;
    return Error::Ok;
}

Error StreamDecoder::read_class_tail() noexcept {
    last_error_.clear();

    std::size_t at = reader_.offset();
    std::uint32_t magic = 0;
    auto result = reader_.read_u32(magic);
    if (result != Error::Ok) {
        return fail_read(result, at, "class tail magic");
    }
    if (magic != CLASS_MAGIC) {
        return fail_magic(at, "class tail", CLASS_MAGIC, magic);
    }

    at = reader_.offset();
    std::uint16_t id = 0;
    result = reader_.read_u16(id);
    if (result != Error::Ok) {
        return fail_read(result, at, "class tail id");
    }
    if (id != state_.class_id) {
        return fail_mismatch(at, "class id", state_.class_id, id);
    }

    return Error::Ok;
}

Error StreamDecoder::read_interval_tail() noexcept {
    last_error_.clear();

    std::size_t at = reader_.offset();
    std::uint32_t magic = 0;
    auto result = reader_.read_u32(magic);
    if (result != Error::Ok) {
        return fail_read(result, at, "interval tail magic");
    }
    if (magic != INTERVAL_MAGIC) {
        return fail_magic(at, "interval tail", INTERVAL_MAGIC, magic);
    }

    at = reader_.offset();
    std::uint16_t number = 0;
    result = reader_.read_u16(number);
    if (result != Error::Ok) {
        return fail_read(result, at, "interval tail number");
    }
    note("Interval number: %u", static_cast<unsigned>(number));
    if (number != state_.interval_number) {
        return fail_mismatch(at, "interval number", state_.interval_number, number);
    }

    at = reader_.offset();
    std::uint32_t end_time = 0;
    result = reader_.read_u32(end_time);
    if (result != Error::Ok) {
        return fail_read(result, at, "interval end time");
    }
    note("Interval end time: %u", static_cast<unsigned>(end_time));

    return Error::Ok;
}

Error StreamDecoder::fail_read(Error result, std::size_t at, const char* field) noexcept {
    if (result == Error::ShortRead) {
        last_error_.set(result, at, "Short read in %s at offset %zu (%zu bytes available)", field,
                        at, reader_.offset() - at);
    } else {
        last_error_.set(result, at, "%s reading %s at offset %zu", error_string(result), field,
                        at);
    }
    return result;
}

Error StreamDecoder::fail_magic(std::size_t at, const char* field, std::uint32_t expected,
                                std::uint32_t actual) noexcept {
    last_error_.expected = expected;
    last_error_.actual = actual;
    last_error_.set(Error::StructuralMismatch, at,
                    "Incorrect %s magic number 0x%08x at offset %zu (expected 0x%08x)", field,
                    static_cast<unsigned>(actual), at, static_cast<unsigned>(expected));
    return Error::StructuralMismatch;
}

Error StreamDecoder::fail_mismatch(std::size_t at, const char* field, std::uint32_t expected,
                                   std::uint32_t actual) noexcept {
    last_error_.expected = expected;
    last_error_.actual = actual;
    last_error_.set(Error::ConsistencyMismatch, at, "Incorrect %s at offset %zu: %u != %u", field,
                    at, static_cast<unsigned>(expected), static_cast<unsigned>(actual));
    return Error::ConsistencyMismatch;
}

void StreamDecoder::note(const char* fmt, ...) noexcept {
    if (sink_ == nullptr) {
        return;
    }

    char line[96];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(line, sizeof(line), fmt, ap);
    va_end(ap);
    sink_->write(line);
}

} // namespace flowtuple
