#include "DatagramCapture.hh"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace {
constexpr uint32_t kMaxRecordSize = 65536;
}

bool CaptureReader::next(std::vector<uint8_t>& datagram) {
    uint8_t prefix[4];
    m_in.read(reinterpret_cast<char*>(prefix), sizeof(prefix));
    if (m_in.gcount() == 0 && m_in.eof()) {
        return false;
    }
    if (m_in.gcount() != static_cast<std::streamsize>(sizeof(prefix))) {
        throw std::runtime_error("Truncated length prefix in capture");
    }

    const uint32_t length = static_cast<uint32_t>(prefix[0]) |
                            (static_cast<uint32_t>(prefix[1]) << 8) |
                            (static_cast<uint32_t>(prefix[2]) << 16) |
                            (static_cast<uint32_t>(prefix[3]) << 24);
    if (length > kMaxRecordSize) {
        throw std::runtime_error("Capture record of " + std::to_string(length) + " bytes exceeds datagram size");
    }

    datagram.resize(length);
    if (length > 0) {
        m_in.read(reinterpret_cast<char*>(datagram.data()), length);
        if (m_in.gcount() != static_cast<std::streamsize>(length)) {
            throw std::runtime_error("Truncated datagram in capture");
        }
    }
    return true;
}

void write_capture_record(std::ostream& out, const std::vector<uint8_t>& datagram) {
    if (datagram.size() > kMaxRecordSize) {
        throw std::length_error("Datagram too large for capture");
    }
    const uint32_t length = static_cast<uint32_t>(datagram.size());
    const char prefix[4] = {
        static_cast<char>(length & 0xFF),
        static_cast<char>((length >> 8) & 0xFF),
        static_cast<char>((length >> 16) & 0xFF),
        static_cast<char>((length >> 24) & 0xFF),
    };
    out.write(prefix, sizeof(prefix));
    out.write(reinterpret_cast<const char*>(datagram.data()), static_cast<std::streamsize>(datagram.size()));
    if (!out) {
        throw std::runtime_error("Failed to write capture record");
    }
}
