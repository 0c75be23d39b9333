/**
 * @file error.hpp
 * @brief Flowtuple error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * Decoder operations return codes; the exception types are available
 * unless FLOWTUPLE_NO_EXCEPTIONS=1.
 */

#ifndef FLOWTUPLE_ERROR_HPP
#define FLOWTUPLE_ERROR_HPP

#include "config.hpp"

#include <array>
#include <cstdarg>
#include <cstdio>

#if !FLOWTUPLE_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace flowtuple {

/**
 * @brief Result codes returned by every decoding operation.
 *
 * The End* codes are expected in-band signals closing one nesting level,
 * not failures.
 */
enum class Error {
    Ok = 0,                   ///< Success
    EndOfStream = 1,          ///< No more intervals
    EndOfInterval = 2,        ///< No more classes in this interval
    EndOfClass = 3,           ///< No more records in this class
    ShortRead = -1,           ///< Source ran out of bytes inside a field
    StructuralMismatch = -2,  ///< Unexpected magic number
    ConsistencyMismatch = -3, ///< Tail identifier differs from its header
    Io = -4                   ///< Underlying source failure
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::EndOfStream:
        return "End of stream";
    case Error::EndOfInterval:
        return "End of interval";
    case Error::EndOfClass:
        return "End of class";
    case Error::ShortRead:
        return "Short read";
    case Error::StructuralMismatch:
        return "Structural mismatch";
    case Error::ConsistencyMismatch:
        return "Consistency mismatch";
    case Error::Io:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

/// True for EndOfStream, EndOfInterval and EndOfClass.
[[nodiscard]] constexpr bool is_end_signal(Error error) noexcept {
    return error == Error::EndOfStream || error == Error::EndOfInterval ||
           error == Error::EndOfClass;
}

/// True for hard failures (anything that is neither Ok nor an end signal).
[[nodiscard]] constexpr bool is_failure(Error error) noexcept {
    return static_cast<int>(error) < 0;
}

/**
 * @brief Context of the most recent failure.
 *
 * Filled by StreamDecoder whenever an operation returns a failure code.
 * `expected`/`actual` hold the magic numbers or identifiers involved
 * for StructuralMismatch and ConsistencyMismatch.
 */
struct ErrorInfo {
    Error code = Error::Ok;
    std::size_t offset = 0; ///< Stream offset where the failing field starts
    std::uint32_t expected = 0;
    std::uint32_t actual = 0;
    std::array<char, 160> text{};

    void clear() noexcept {
        code = Error::Ok;
        offset = 0;
        expected = 0;
        actual = 0;
        text[0] = '\0';
    }

    /**
     * @brief Record a failure with a printf-style description.
     */
    [[gnu::format(printf, 4, 5)]] void set(Error err, std::size_t at, const char* fmt,
                                            ...) noexcept {
        code = err;
        offset = at;
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(text.data(), text.size(), fmt, ap);
        va_end(ap);
    }

    [[nodiscard]] const char* message() const noexcept {
        return text[0] != '\0' ? text.data() : error_string(code);
    }
};

#if !FLOWTUPLE_NO_EXCEPTIONS

/**
 * @brief Base exception for flowtuple errors.
 */
class FlowtupleException : public std::runtime_error {
public:
    explicit FlowtupleException(const std::string& message, Error code = Error::Io)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for truncated input.
 */
class ShortReadException : public FlowtupleException {
public:
    explicit ShortReadException(const std::string& message)
        : FlowtupleException(message, Error::ShortRead) {}
};

/**
 * @brief Exception for an unexpected magic number.
 */
class StructuralException : public FlowtupleException {
public:
    explicit StructuralException(const std::string& message)
        : FlowtupleException(message, Error::StructuralMismatch) {}
};

/**
 * @brief Exception for a header/tail identifier mismatch.
 */
class ConsistencyException : public FlowtupleException {
public:
    explicit ConsistencyException(const std::string& message)
        : FlowtupleException(message, Error::ConsistencyMismatch) {}
};

/**
 * @brief Exception for a failing byte source.
 */
class IoException : public FlowtupleException {
public:
    explicit IoException(const std::string& message)
        : FlowtupleException(message, Error::Io) {}
};

/**
 * @brief Throw the exception matching a failure; no-op otherwise.
 */
inline void throw_on_error(const ErrorInfo& info) {
    if (!is_failure(info.code)) {
        return;
    }

    switch (info.code) {
    case Error::ShortRead:
        throw ShortReadException(info.message());
    case Error::StructuralMismatch:
        throw StructuralException(info.message());
    case Error::ConsistencyMismatch:
        throw ConsistencyException(info.message());
    default:
        throw IoException(info.message());
    }
}

#endif // !FLOWTUPLE_NO_EXCEPTIONS

} // namespace flowtuple

#endif // FLOWTUPLE_ERROR_HPP
