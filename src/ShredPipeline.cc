#include "ShredPipeline.hh"
#include "EntryDecoder.hh"
#include "Log.hh"

#include <iostream>
#include <utility>

ShredPipeline::ShredPipeline(const PipelineOptions& options, ScannerConfig config, DetectionReporter& reporter)
    : m_options(options),
      m_reassembler(options.max_pending),
      m_scanner(std::move(config)),
      m_reporter(reporter) {}

Outcome ShredPipeline::handle_datagram(const std::vector<uint8_t>& datagram, TimePoint now) {
    return handle_datagram(datagram.data(), datagram.size(), now);
}

Outcome ShredPipeline::handle_datagram(const uint8_t* data, size_t size, TimePoint now) {
    m_stats.datagrams++;
    m_stats.bytes += size;

    AcceptResult result = m_reassembler.accept(data, size, now);
    switch (result.status) {
        case Outcome::Pending:
            break;
        case Outcome::Rejected:
            m_stats.rejected++;
            if (log_enabled(LogLevel::Debug)) {
                std::cout << "[Pipeline] Datagram rejected: " << reject_reason_to_string(result.reason) << std::endl;
            }
            break;
        case Outcome::Ready:
            process_payload(result.payload);
            break;
    }
    return result.status;
}

size_t ShredPipeline::process_payload(const std::vector<uint8_t>& payload) {
    const uint64_t sequence = m_next_sequence++;
    m_stats.messages++;

    std::vector<LedgerEntry> entries;
    try {
        entries = decode_entries(payload);
    } catch (const DecodeError& e) {
        // The payload is dropped, reassembly already forgot it
        m_stats.decode_errors++;
        m_reporter.report_decode_error(sequence, payload.size(), e.what());
        return 0;
    }

    const std::vector<DetectionRecord> records = m_scanner.scan(entries, sequence);

    BatchSummary summary;
    summary.sequence = sequence;
    summary.payload_size = payload.size();
    summary.entry_count = entries.size();
    summary.transaction_count = count_transactions(entries);
    summary.detection_count = records.size();

    m_stats.entries += summary.entry_count;
    m_stats.transactions += summary.transaction_count;
    m_stats.detections += records.size();

    m_reporter.report_batch(summary);
    for (const auto& record : records) {
        m_reporter.report_detection(record);
    }
    return records.size();
}

size_t ShredPipeline::evict_stale(TimePoint now) {
    return m_reassembler.evict_stale(now, m_options.max_age);
}

FeedStats ShredPipeline::take_stats() {
    FeedStats stats = m_stats;
    stats.pending_messages = m_reassembler.pending_count();
    stats.pending_bytes = m_reassembler.buffered_bytes();
    m_stats = FeedStats();
    return stats;
}

void ShredPipeline::report_stats() {
    m_reporter.report_stats(take_stats());
}
