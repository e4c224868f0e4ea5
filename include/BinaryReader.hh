// BinaryReader.hh
#ifndef BINARYREADER_H
#define BINARYREADER_H
#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t size)
        : m_data(data), m_size(size), m_pos(0) {}

    explicit BinaryReader(const std::vector<uint8_t>& buffer)
        : m_data(buffer.data()), m_size(buffer.size()), m_pos(0) {}

    /*
    Reads an unsigned little-endian integer of type T. The value is assembled byte by byte
    so the result does not depend on host byte order. A bounds check is performed to
    prevent reading beyond the buffer.
    */
    template <typename T>
    T read_le() {
        require(sizeof(T));
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(static_cast<T>(m_data[m_pos + i]) << (8 * i));
        }
        m_pos += sizeof(T);
        return value;
    }

    uint8_t read_u8() {
        require(1);
        return m_data[m_pos++];
    }

    template <size_t N>
    void read(std::array<uint8_t, N>& value) {
        require(N);
        std::memcpy(value.data(), m_data + m_pos, N);
        m_pos += N;
    }

    void read_bytes(std::vector<uint8_t>& out, size_t count) {
        require(count);
        out.assign(m_data + m_pos, m_data + m_pos + count);
        m_pos += count;
    }

    /*
    Compact-u16 length prefix: seven bits per byte, low group first, high bit set when
    another byte follows. At most three bytes, and the value must fit in 16 bits.
    */
    uint16_t read_short_vec_len() {
        uint32_t value = 0;
        for (int i = 0; i < 3; ++i) {
            const uint8_t byte = read_u8();
            value |= static_cast<uint32_t>(byte & 0x7F) << (7 * i);
            if ((byte & 0x80) == 0) {
                if (byte == 0 && i > 0) {
                    throw std::out_of_range("Non-canonical short vec length");
                }
                if (value > 0xFFFF) {
                    throw std::out_of_range("Short vec length overflows u16");
                }
                return static_cast<uint16_t>(value);
            }
        }
        throw std::out_of_range("Short vec length longer than three bytes");
    }

    uint8_t peek_u8() const {
        if (m_pos >= m_size) {
            throw std::out_of_range("Buffer read out of bounds.");
        }
        return m_data[m_pos];
    }

    size_t get_position() const { return m_pos; }
    size_t remaining() const { return m_size - m_pos; }
    bool at_end() const { return m_pos == m_size; }

private:
    void require(size_t count) const {
        if (count > m_size - m_pos) {
            throw std::out_of_range("Buffer read out of bounds.");
        }
    }

    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};
#endif // BINARYREADER_H
