#include "Fragment.hh"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <stdexcept>

namespace {

uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void write_le16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void write_le32(std::vector<uint8_t>& out, uint32_t v) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

} // namespace

bool is_fragmented(const uint8_t* data, size_t size) {
    if (data == nullptr || size < sizeof(kFragmentMagic)) {
        return false;
    }
    return std::memcmp(data, kFragmentMagic, sizeof(kFragmentMagic)) == 0;
}

bool parse_fragment_header(const uint8_t* data, size_t size, FragmentHeader& header) {
    if (!is_fragmented(data, size) || size < kFragmentHeaderSize) {
        return false;
    }
    header.message_id = read_le32(data + 4);
    header.fragment_index = read_le16(data + 8);
    header.fragment_count = read_le16(data + 10);
    header.total_size = read_le32(data + 12);
    return true;
}

std::vector<uint8_t> encode_fragment(const FragmentHeader& header, const std::vector<uint8_t>& chunk) {
    std::vector<uint8_t> buffer;
    buffer.reserve(kFragmentHeaderSize + chunk.size());
    buffer.insert(buffer.end(), std::begin(kFragmentMagic), std::end(kFragmentMagic));
    write_le32(buffer, header.message_id);
    write_le16(buffer, header.fragment_index);
    write_le16(buffer, header.fragment_count);
    write_le32(buffer, header.total_size);
    buffer.insert(buffer.end(), chunk.begin(), chunk.end());
    return buffer;
}

std::vector<std::vector<uint8_t>> split_into_fragments(uint32_t message_id,
                                                       const std::vector<uint8_t>& payload,
                                                       size_t max_chunk) {
    if (max_chunk == 0) {
        throw std::invalid_argument("Fragment chunk size must be positive");
    }
    const size_t count = std::max<size_t>(1, (payload.size() + max_chunk - 1) / max_chunk);
    if (count > 0xFFFF) {
        throw std::length_error("Payload needs more than 65535 fragments");
    }
    if (payload.size() > 0xFFFFFFFFull) {
        throw std::length_error("Payload larger than 4 GiB cannot be fragmented");
    }

    std::vector<std::vector<uint8_t>> datagrams;
    datagrams.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const size_t offset = i * max_chunk;
        const size_t length = std::min(max_chunk, payload.size() - std::min(offset, payload.size()));

        FragmentHeader header;
        header.message_id = message_id;
        header.fragment_index = static_cast<uint16_t>(i);
        header.fragment_count = static_cast<uint16_t>(count);
        header.total_size = static_cast<uint32_t>(payload.size());

        std::vector<uint8_t> chunk(payload.begin() + offset, payload.begin() + offset + length);
        datagrams.push_back(encode_fragment(header, chunk));
    }
    return datagrams;
}
