#include "Reassembler.hh"
#include "Log.hh"

#include <iostream>

const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::MalformedHeader: return "truncated fragment header";
        case RejectReason::IndexOutOfRange: return "fragment index out of range";
        case RejectReason::MetadataMismatch: return "fragment metadata mismatch";
        case RejectReason::SizeMismatch: return "assembled size mismatch";
        default: return "unknown";
    }
}

AcceptResult Reassembler::accept(const std::vector<uint8_t>& datagram, TimePoint now) {
    return accept(datagram.data(), datagram.size(), now);
}

AcceptResult Reassembler::accept(const uint8_t* data, size_t size, TimePoint now) {
    AcceptResult result;

    if (!is_fragmented(data, size)) {
        // No magic, the datagram is a whole payload and never touches the table
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.unfragmented++;
        result.status = Outcome::Ready;
        if (size > 0) {
            result.payload.assign(data, data + size);
        }
        return result;
    }

    FragmentHeader header;
    const bool parsed = parse_fragment_header(data, size, header);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.fragments++;

    if (!parsed) {
        m_stats.rejected_header++;
        if (log_enabled(LogLevel::Debug)) {
            std::cout << "[Reassembler] Dropping " << size << " byte datagram: truncated fragment header" << std::endl;
        }
        result.status = Outcome::Rejected;
        result.reason = RejectReason::MalformedHeader;
        return result;
    }

    if (header.fragment_index >= header.fragment_count) {
        m_stats.rejected_index++;
        if (log_enabled(LogLevel::Debug)) {
            std::cout << "[Reassembler] Dropping fragment " << header.fragment_index << "/" << header.fragment_count
                      << " of message " << header.message_id << ": index out of range" << std::endl;
        }
        result.status = Outcome::Rejected;
        result.reason = RejectReason::IndexOutOfRange;
        return result;
    }

    auto it = m_pending.find(header.message_id);
    if (it == m_pending.end() && header.fragment_count == 1) {
        // Completes in this call, so it never takes a slot in the pending table
        result.payload.assign(data + kFragmentHeaderSize, data + size);
        finish_locked(header, result.payload.size() == header.total_size, result);
        return result;
    }

    if (it == m_pending.end()) {
        if (m_max_pending > 0) {
            while (m_pending.size() >= m_max_pending && evict_oldest_locked()) {
            }
        }
        it = m_pending.emplace(header.message_id,
                               FragmentBuffer(header.fragment_count, header.total_size, now)).first;
        m_by_age.emplace(now, header.message_id);
    } else if (!it->second.matches(header)) {
        // Keep the partial message as it was, only this fragment is bad
        m_stats.rejected_mismatch++;
        if (log_enabled(LogLevel::Debug)) {
            std::cout << "[Reassembler] Dropping fragment for message " << header.message_id
                      << ": declares " << header.fragment_count << " fragments / " << header.total_size
                      << " bytes, pending message has " << it->second.fragment_count() << " / "
                      << it->second.total_size() << std::endl;
        }
        result.status = Outcome::Rejected;
        result.reason = RejectReason::MetadataMismatch;
        return result;
    }

    FragmentBuffer& buffer = it->second;
    std::vector<uint8_t> chunk(data + kFragmentHeaderSize, data + size);
    if (!buffer.store(header.fragment_index, std::move(chunk))) {
        m_stats.duplicates++;
        result.status = Outcome::Pending;
        return result;
    }

    if (!buffer.is_complete()) {
        result.status = Outcome::Pending;
        return result;
    }

    const bool assembled = buffer.assemble(result.payload);
    erase_locked(it);
    finish_locked(header, assembled, result);
    return result;
}

void Reassembler::finish_locked(const FragmentHeader& header, bool assembled, AcceptResult& result) {
    if (!assembled) {
        m_stats.rejected_size++;
        std::cerr << "[Reassembler] Message " << header.message_id << " assembled to a size other than the declared "
                  << header.total_size << " bytes. Discarding." << std::endl;
        result.payload.clear();
        result.status = Outcome::Rejected;
        result.reason = RejectReason::SizeMismatch;
        return;
    }

    m_stats.completed++;
    result.status = Outcome::Ready;
}

size_t Reassembler::evict_stale(TimePoint now, std::chrono::nanoseconds max_age) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t evicted = 0;

    // m_by_age is sorted by creation time, so stop at the first message still young enough
    while (!m_by_age.empty()) {
        auto oldest = m_by_age.begin();
        if (now - oldest->first <= max_age) {
            break;
        }
        const uint32_t message_id = oldest->second;
        auto it = m_pending.find(message_id);
        if (it != m_pending.end()) {
            if (log_enabled(LogLevel::Debug)) {
                std::cout << "[Reassembler] Evicting stale message " << message_id << " ("
                          << it->second.received_count() << "/" << it->second.fragment_count()
                          << " fragments)" << std::endl;
            }
            erase_locked(it);
            ++evicted;
        } else {
            m_by_age.erase(oldest);
        }
    }

    m_stats.evicted_stale += evicted;
    return evicted;
}

size_t Reassembler::pending_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

size_t Reassembler::buffered_bytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t total = 0;
    for (const auto& pair : m_pending) {
        total += pair.second.buffered_bytes();
    }
    return total;
}

bool Reassembler::has_pending(uint32_t message_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.find(message_id) != m_pending.end();
}

size_t Reassembler::received_count(uint32_t message_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(message_id);
    return it == m_pending.end() ? 0 : it->second.received_count();
}

ReassemblerStats Reassembler::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void Reassembler::erase_locked(std::map<uint32_t, FragmentBuffer>::iterator it) {
    auto range = m_by_age.equal_range(it->second.created_at());
    for (auto age_it = range.first; age_it != range.second; ++age_it) {
        if (age_it->second == it->first) {
            m_by_age.erase(age_it);
            break;
        }
    }
    m_pending.erase(it);
}

bool Reassembler::evict_oldest_locked() {
    if (m_by_age.empty()) {
        return false;
    }
    auto oldest = m_by_age.begin();
    const uint32_t message_id = oldest->second;
    m_by_age.erase(oldest);
    m_pending.erase(message_id);
    m_stats.evicted_capacity++;
    if (log_enabled(LogLevel::Debug)) {
        std::cout << "[Reassembler] Pending table full, evicted oldest message " << message_id << std::endl;
    }
    return true;
}
