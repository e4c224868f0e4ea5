// ShredPipeline.hh
#ifndef SHREDPIPELINE_H
#define SHREDPIPELINE_H
#pragma once
#include <chrono>
#include <cstdint>
#include <vector>
#include "DetectionReporter.hh"
#include "InstructionScanner.hh"
#include "Reassembler.hh"

struct PipelineOptions {
    size_t max_pending = 1024;
    std::chrono::milliseconds max_age{2000};
};

/*
Everything that happens to one datagram stream after the socket: reassembly, decoding,
scanning and reporting. Meant to be driven by a single worker; the reassembler's own
lock covers the case where eviction runs from somewhere else.
*/
class ShredPipeline {
public:
    using Clock = Reassembler::Clock;
    using TimePoint = Reassembler::TimePoint;

    ShredPipeline(const PipelineOptions& options, ScannerConfig config, DetectionReporter& reporter);

    // Never throws for malformed input, the outcome says what happened to the datagram.
    Outcome handle_datagram(const uint8_t* data, size_t size, TimePoint now = Clock::now());
    Outcome handle_datagram(const std::vector<uint8_t>& datagram, TimePoint now = Clock::now());

    // Decodes, scans and reports one complete payload. Returns the number of detections.
    size_t process_payload(const std::vector<uint8_t>& payload);

    size_t evict_stale(TimePoint now = Clock::now());

    // Counters since the previous call, with the current pending totals filled in.
    FeedStats take_stats();
    void report_stats();

    const Reassembler& reassembler() const { return m_reassembler; }
    uint64_t next_sequence() const { return m_next_sequence; }

private:
    PipelineOptions m_options;
    Reassembler m_reassembler;
    InstructionScanner m_scanner;
    DetectionReporter& m_reporter;
    FeedStats m_stats;
    uint64_t m_next_sequence = 0;
};
#endif // SHREDPIPELINE_H
