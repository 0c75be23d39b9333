/**
 * @file test_diagnostics.cpp
 * @brief Unit tests for diagnostic sinks.
 */

#include <catch2/catch_test_macros.hpp>
#include <flowtuple/diagnostics.hpp>
#include <flowtuple/stream_decoder.hpp>

#include "wire_builder.hpp"

#include <cstdio>
#include <string>

using namespace flowtuple;
using flowtuple::testing::CollectingSink;
using flowtuple::testing::sample_record;
using flowtuple::testing::WireBuilder;

TEST_CASE("StreamDecoder reports progress to sink", "[diagnostics]") {
    WireBuilder wb;
    wb.interval_header(4, 1400000000U).class_header(1, 1).record(sample_record()).class_tail(1);
    wb.interval_tail(4, 1400000060U).end_of_stream();

    MemorySource source(wb.bytes().data(), wb.size());
    CollectingSink sink;
    StreamDecoder dec(source, &sink);
    FlowRecord rec;

    REQUIRE(dec.read_interval_header() == Error::Ok);
    REQUIRE(dec.read_class_header() == Error::Ok);
    REQUIRE(dec.read_record(rec) == Error::Ok);
    REQUIRE(dec.read_record(rec) == Error::EndOfClass);
    REQUIRE(dec.read_class_tail() == Error::Ok);
    REQUIRE(dec.read_class_header() == Error::EndOfInterval);
    REQUIRE(dec.read_interval_tail() == Error::Ok);
    REQUIRE(dec.read_interval_header() == Error::EndOfStream);

    REQUIRE(sink.lines.size() == 6);
    REQUIRE(sink.lines[0] == "Interval number: 4");
    REQUIRE(sink.lines[1] == "Interval start time: 1400000000");
    REQUIRE(sink.lines[2] == "Class id: 1");
    REQUIRE(sink.lines[3] == "Key count: 1");
    REQUIRE(sink.lines[4] == "Interval number: 4");
    REQUIRE(sink.lines[5] == "Interval end time: 1400000060");
}

TEST_CASE("Sink presence does not change results", "[diagnostics]") {
    WireBuilder wb;
    wb.interval_header(1).class_header(0, 2).record(sample_record(0)).record(sample_record(1));
    wb.class_tail(5);

    auto run = [&](DiagnosticSink* sink) {
        MemorySource source(wb.bytes().data(), wb.size());
        StreamDecoder dec(source, sink);
        FlowRecord rec;
        std::string trace;
        trace += error_string(dec.read_interval_header());
        trace += error_string(dec.read_class_header());
        for (int i = 0; i < 3; ++i) {
            trace += error_string(dec.read_record(rec));
            trace += to_string(rec);
        }
        trace += error_string(dec.read_class_tail());
        trace += dec.last_error().message();
        trace += std::to_string(dec.offset());
        return trace;
    };

    CollectingSink sink;
    REQUIRE(run(nullptr) == run(&sink));
    REQUIRE_FALSE(sink.lines.empty());
}

TEST_CASE("FileSink writes timestamped lines", "[diagnostics]") {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);

    FileSink sink(tmp);
    sink.write("Class id: 2");
    sink.write("Key count: 9");

    std::rewind(tmp);
    char line[64];

    REQUIRE(std::fgets(line, sizeof(line), tmp) != nullptr);
    std::string first(line);
    // "HH:MM:SS Class id: 2\n"
    REQUIRE(first.size() == 21);
    REQUIRE(first[2] == ':');
    REQUIRE(first[5] == ':');
    REQUIRE(first.substr(8) == " Class id: 2\n");

    REQUIRE(std::fgets(line, sizeof(line), tmp) != nullptr);
    REQUIRE(std::string(line).substr(8) == " Key count: 9\n");

    std::fclose(tmp);
}

TEST_CASE("FileSink without stream is inert", "[diagnostics]") {
    FileSink sink(nullptr);
    sink.write("ignored");
    SUCCEED();
}
