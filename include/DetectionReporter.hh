// DetectionReporter.hh
#ifndef DETECTIONREPORTER_H
#define DETECTIONREPORTER_H
#pragma once
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "InstructionScanner.hh"

// Counters for one decoded batch
struct BatchSummary {
    uint64_t sequence = 0;
    size_t payload_size = 0;
    size_t entry_count = 0;
    size_t transaction_count = 0;
    size_t detection_count = 0;
};

// Feed counters over one reporting interval
struct FeedStats {
    uint64_t datagrams = 0;
    uint64_t bytes = 0;
    uint64_t messages = 0;
    uint64_t rejected = 0;
    uint64_t decode_errors = 0;
    uint64_t entries = 0;
    uint64_t transactions = 0;
    uint64_t detections = 0;
    size_t pending_messages = 0;
    size_t pending_bytes = 0;
};

class DetectionReporter {
public:
    virtual ~DetectionReporter() = default;
    virtual void report_detection(const DetectionRecord& record) = 0;
    virtual void report_batch(const BatchSummary& summary) = 0;
    virtual void report_decode_error(uint64_t sequence, size_t payload_size, const std::string& what) = 0;
    virtual void report_stats(const FeedStats& stats) = 0;
};

// Prints detections and stats as text lines
class ConsoleReporter : public DetectionReporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : m_out(out), m_err(err) {}

    void report_detection(const DetectionRecord& record) override;
    void report_batch(const BatchSummary& summary) override;
    void report_decode_error(uint64_t sequence, size_t payload_size, const std::string& what) override;
    void report_stats(const FeedStats& stats) override;

private:
    std::ostream& m_out;
    std::ostream& m_err;
    bool m_first_batch_seen = false;
};

// Keeps everything it is given, for tests and replay summaries
class CollectingReporter : public DetectionReporter {
public:
    void report_detection(const DetectionRecord& record) override { detections.push_back(record); }
    void report_batch(const BatchSummary& summary) override { batches.push_back(summary); }
    void report_decode_error(uint64_t sequence, size_t, const std::string& what) override {
        decode_errors.emplace_back(sequence, what);
    }
    void report_stats(const FeedStats& s) override { stats.push_back(s); }

    std::vector<DetectionRecord> detections;
    std::vector<BatchSummary> batches;
    std::vector<std::pair<uint64_t, std::string>> decode_errors;
    std::vector<FeedStats> stats;
};

#endif
