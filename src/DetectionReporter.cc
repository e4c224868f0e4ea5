#include "DetectionReporter.hh"
#include "Base58.hh"
#include "Log.hh"

#include <iomanip>

void ConsoleReporter::report_detection(const DetectionRecord& record) {
    m_out << "[Detector] Event '" << record.event_name << "' detected in message " << record.sequence
          << " (" << record.entry_count << " entries, " << record.transaction_count << " transactions)\n"
          << "   Token:         " << base58_encode(record.token) << "\n"
          << "   Bonding Curve: " << base58_encode(record.bonding_curve) << "\n"
          << "   Creator:       " << base58_encode(record.creator) << "\n"
          << "   Signature:     " << base58_encode(record.signature.data(), record.signature.size())
          << std::endl;
}

void ConsoleReporter::report_batch(const BatchSummary& summary) {
    if (!m_first_batch_seen) {
        m_first_batch_seen = true;
        m_out << "[Detector] First batch received: message " << summary.sequence << ", "
              << summary.payload_size << " bytes" << std::endl;
    }
    if (log_enabled(LogLevel::Debug)) {
        m_out << "[Detector] Message " << summary.sequence << ": " << summary.entry_count << " entries, "
              << summary.transaction_count << " transactions, " << summary.detection_count
              << " detections" << std::endl;
    }
}

void ConsoleReporter::report_decode_error(uint64_t sequence, size_t payload_size, const std::string& what) {
    if (log_enabled(LogLevel::Warn)) {
        m_err << "[Detector] Message " << sequence << " (" << payload_size
              << " bytes): failed to decode entries: " << what << std::endl;
    }
}

void ConsoleReporter::report_stats(const FeedStats& stats) {
    if (!log_enabled(LogLevel::Info)) {
        return;
    }
    const std::streamsize precision = m_out.precision();
    m_out << "[Stats] " << stats.datagrams << " datagrams, " << std::fixed << std::setprecision(2)
          << static_cast<double>(stats.bytes) / 1000000.0 << " MB, " << stats.messages << " messages, "
          << stats.entries << " entries, " << stats.transactions << " transactions, "
          << stats.detections << " detections, " << stats.rejected << " rejected, "
          << stats.decode_errors << " decode errors, " << stats.pending_messages << " pending ("
          << stats.pending_bytes << " bytes)" << std::endl;
    m_out.unsetf(std::ios::floatfield);
    m_out.precision(precision);
}
