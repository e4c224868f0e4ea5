// Fragment.hh
#ifndef FRAGMENT_H
#define FRAGMENT_H
#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

// Tag at the start of every fragmented datagram.
constexpr uint8_t kFragmentMagic[4] = {'S', 'H', 'R', 'D'};
constexpr size_t kFragmentHeaderSize = 16;

/*
Wire layout of the fragment header, all integers little-endian:
  0..3   magic "SHRD"
  4..7   message_id
  8..9   fragment_index
  10..11 fragment_count
  12..15 total_size
The chunk follows immediately after byte 15.
*/
struct FragmentHeader {
    uint32_t message_id = 0;
    uint16_t fragment_index = 0;
    uint16_t fragment_count = 0;
    uint32_t total_size = 0;
};

// Represents a single fragment taken off the wire
struct DataFragment {
    FragmentHeader header;
    std::vector<uint8_t> payload; // Chunk bytes after the header
};

// True when the datagram starts with the fragment magic. Anything else is an
// unfragmented payload.
bool is_fragmented(const uint8_t* data, size_t size);

// Parses the header of a fragmented datagram. Returns false when the magic is missing
// or the datagram is shorter than kFragmentHeaderSize.
bool parse_fragment_header(const uint8_t* data, size_t size, FragmentHeader& header);

// Header followed by the chunk, ready to send.
std::vector<uint8_t> encode_fragment(const FragmentHeader& header, const std::vector<uint8_t>& chunk);

// Splits a payload into datagrams of at most max_chunk data bytes each.
// An empty payload still produces one (empty) fragment.
std::vector<std::vector<uint8_t>> split_into_fragments(uint32_t message_id,
                                                       const std::vector<uint8_t>& payload,
                                                       size_t max_chunk);

#endif
