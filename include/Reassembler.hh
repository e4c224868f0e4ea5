// Reassembler.hh
#ifndef REASSEMBLER_H
#define REASSEMBLER_H
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>
#include "FragmentBuffer.hh"

enum class Outcome {
    Ready,    // payload holds a complete message
    Pending,  // fragment stored, message still incomplete
    Rejected  // datagram dropped, see RejectReason
};

enum class RejectReason {
    None,
    MalformedHeader,   // magic present but the datagram is shorter than the header
    IndexOutOfRange,   // fragment_index >= fragment_count
    MetadataMismatch,  // fragment_count / total_size differ from the pending message
    SizeMismatch       // assembled length differs from total_size
};

struct AcceptResult {
    Outcome status = Outcome::Pending;
    RejectReason reason = RejectReason::None;
    std::vector<uint8_t> payload;
};

struct ReassemblerStats {
    uint64_t unfragmented = 0;
    uint64_t fragments = 0;
    uint64_t completed = 0;
    uint64_t duplicates = 0;
    uint64_t rejected_header = 0;
    uint64_t rejected_index = 0;
    uint64_t rejected_mismatch = 0;
    uint64_t rejected_size = 0;
    uint64_t evicted_stale = 0;
    uint64_t evicted_capacity = 0;
};

const char* reject_reason_to_string(RejectReason reason);

/*
Owns every in-flight message keyed by message id. A single mutex guards the table so
accept() and evict_stale() may come from different threads, but they are never
interleaved inside one call.
*/
class Reassembler {
public:
    using Clock = FragmentBuffer::Clock;
    using TimePoint = FragmentBuffer::TimePoint;

    // max_pending == 0 disables the cap on concurrently pending message ids.
    explicit Reassembler(size_t max_pending = 0) : m_max_pending(max_pending) {}

    AcceptResult accept(const std::vector<uint8_t>& datagram, TimePoint now = Clock::now());
    AcceptResult accept(const uint8_t* data, size_t size, TimePoint now = Clock::now());

    // Drops every message created more than max_age before now. Returns how many went.
    size_t evict_stale(TimePoint now, std::chrono::nanoseconds max_age);

    size_t pending_count() const;
    size_t buffered_bytes() const;
    bool has_pending(uint32_t message_id) const;
    // Distinct fragments held for the message, 0 when it is not pending.
    size_t received_count(uint32_t message_id) const;
    size_t max_pending() const { return m_max_pending; }
    ReassemblerStats stats() const;

private:
    void erase_locked(std::map<uint32_t, FragmentBuffer>::iterator it);
    bool evict_oldest_locked();
    // Turns a fully received message into Ready, or Rejected(SizeMismatch) when !assembled.
    void finish_locked(const FragmentHeader& header, bool assembled, AcceptResult& result);

    size_t m_max_pending;
    std::map<uint32_t, FragmentBuffer> m_pending;
    // Creation order of pending messages, oldest first.
    std::multimap<TimePoint, uint32_t> m_by_age;
    ReassemblerStats m_stats;
    mutable std::mutex m_mutex;
};
#endif // REASSEMBLER_H
