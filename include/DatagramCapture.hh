// DatagramCapture.hh
#ifndef DATAGRAMCAPTURE_H
#define DATAGRAMCAPTURE_H
#pragma once
#include <cstdint>
#include <iosfwd>
#include <vector>

/*
Capture files hold datagrams back to back, each as a u32 little-endian length followed
by that many bytes. Used to replay a recorded feed through the pipeline offline.
*/
class CaptureReader {
public:
    explicit CaptureReader(std::istream& in) : m_in(in) {}

    // Returns false at a clean end of file. Throws std::runtime_error on a truncated record.
    bool next(std::vector<uint8_t>& datagram);

private:
    std::istream& m_in;
};

void write_capture_record(std::ostream& out, const std::vector<uint8_t>& datagram);

#endif
