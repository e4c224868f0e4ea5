// FragmentBuffer.hh
#ifndef FRAGMENTBUFFER_H
#define FRAGMENTBUFFER_H
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <vector>
#include "Fragment.hh"

// Slots received so far for one in-flight message. The declared fragment_count and
// total_size are fixed by the first fragment seen for the message id.
class FragmentBuffer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    FragmentBuffer(uint16_t fragment_count, uint32_t total_size, TimePoint created_at)
        : m_fragment_count(fragment_count), m_total_size(total_size), m_created_at(created_at) {}

    uint16_t fragment_count() const { return m_fragment_count; }
    uint32_t total_size() const { return m_total_size; }
    TimePoint created_at() const { return m_created_at; }
    size_t received_count() const { return m_slots.size(); }
    size_t buffered_bytes() const { return m_buffered_bytes; }

    bool is_complete() const { return m_slots.size() == m_fragment_count; }

    bool has_slot(uint16_t index) const { return m_slots.find(index) != m_slots.end(); }

    // Later fragments must agree with the metadata of the first one.
    bool matches(const FragmentHeader& header) const {
        return header.fragment_count == m_fragment_count && header.total_size == m_total_size;
    }

    /*
    Stores the chunk for an index. A repeated index replaces the earlier chunk and does
    not count twice, so the return value tells whether the slot was new.
    */
    bool store(uint16_t index, std::vector<uint8_t>&& chunk) {
        auto it = m_slots.find(index);
        if (it != m_slots.end()) {
            m_buffered_bytes -= it->second.size();
            m_buffered_bytes += chunk.size();
            it->second = std::move(chunk);
            return false;
        }
        m_buffered_bytes += chunk.size();
        m_slots.emplace(index, std::move(chunk));
        return true;
    }

    /*
    Concatenates slots 0..fragment_count-1 in index order. Returns false when a slot is
    missing or the result does not have the declared total_size.
    */
    bool assemble(std::vector<uint8_t>& out) const {
        if (!is_complete() || m_buffered_bytes != m_total_size) {
            return false;
        }
        out.clear();
        out.reserve(m_total_size);
        for (uint16_t i = 0; i < m_fragment_count; ++i) {
            auto it = m_slots.find(i);
            if (it == m_slots.end()) {
                return false;
            }
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
        return true;
    }

private:
    uint16_t m_fragment_count;
    uint32_t m_total_size;
    TimePoint m_created_at;
    size_t m_buffered_bytes = 0;
    std::map<uint16_t, std::vector<uint8_t>> m_slots;
};
#endif // FRAGMENTBUFFER_H
