/**
 * @file diagnostics.hpp
 * @brief Optional diagnostic sink for decoder progress lines.
 *
 * The decoder reports interval numbers and times, class ids and key
 * counts to a sink when one is supplied. Sinks never influence decoding.
 */

#ifndef FLOWTUPLE_DIAGNOSTICS_HPP
#define FLOWTUPLE_DIAGNOSTICS_HPP

#include <cstdio>

namespace flowtuple {

/**
 * @brief Receives one human-readable line per call (no trailing newline).
 */
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void write(const char* line) noexcept = 0;
};

/**
 * @brief Sink writing timestamped lines to a stdio stream.
 *
 * Lines look like "14:03:27 Class id: 0". The stream is not owned.
 */
class FileSink final : public DiagnosticSink {
public:
    explicit FileSink(std::FILE* out) noexcept : out_(out) {}

    void write(const char* line) noexcept override;

private:
    std::FILE* out_;
};

} // namespace flowtuple

#endif // FLOWTUPLE_DIAGNOSTICS_HPP
