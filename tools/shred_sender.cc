// Sends synthetic fragmented batches to a running scanner, or writes them to a capture file.
#include <boost/asio.hpp>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "DatagramCapture.hh"
#include "EntryDecoder.hh"
#include "FeedSimulator.hh"
#include "Fragment.hh"
#include "InstructionScanner.hh"

using boost::asio::ip::udp;

class DatagramSender {
public:
    DatagramSender(boost::asio::io_context& io_context, const std::string& host, const std::string& port)
        : m_socket(io_context) {
        udp::resolver resolver(io_context);
        m_endpoint = *resolver.resolve(udp::v4(), host, port).begin();
        m_socket.open(udp::v4());
    }

    void send(const std::vector<uint8_t>& datagram) {
        m_socket.send_to(boost::asio::buffer(datagram), m_endpoint);
    }

private:
    udp::socket m_socket;
    udp::endpoint m_endpoint;
};

struct SenderOptions {
    std::string host = "127.0.0.1";
    std::string port = "8001";
    std::string capture_file;
    unsigned batches = 5;
    unsigned entries = 4;
    unsigned txs_per_entry = 8;
    unsigned events = 1;
    unsigned chunk = 1200;
    unsigned interval_ms = 400;
    bool shuffle = false;
};

void usage(const char* progname) {
    std::cerr << "Usage: " << progname << " [-H host] [-p port] [-o capture_file] [-n batches] [-e entries]\n"
              << "       [-t txs_per_entry] [-d events_per_batch] [-c chunk_bytes] [-i interval_ms] [-s]" << std::endl;
}

int main(int argc, char* argv[]) {
    SenderOptions opts;
    for (int i = 1; i < argc; i++) {
        const bool has_value = i + 1 < argc;
        if (strcmp(argv[i], "-h") == 0) { usage(argv[0]); return 0; }
        else if (strcmp(argv[i], "-s") == 0) { opts.shuffle = true; }
        else if (!has_value) { usage(argv[0]); return 1; }
        else if (strcmp(argv[i], "-H") == 0) { opts.host = argv[++i]; }
        else if (strcmp(argv[i], "-p") == 0) { opts.port = argv[++i]; }
        else if (strcmp(argv[i], "-o") == 0) { opts.capture_file = argv[++i]; }
        else if (strcmp(argv[i], "-n") == 0) { opts.batches = static_cast<unsigned>(atoi(argv[++i])); }
        else if (strcmp(argv[i], "-e") == 0) { opts.entries = static_cast<unsigned>(atoi(argv[++i])); }
        else if (strcmp(argv[i], "-t") == 0) { opts.txs_per_entry = static_cast<unsigned>(atoi(argv[++i])); }
        else if (strcmp(argv[i], "-d") == 0) { opts.events = static_cast<unsigned>(atoi(argv[++i])); }
        else if (strcmp(argv[i], "-c") == 0) { opts.chunk = static_cast<unsigned>(atoi(argv[++i])); }
        else if (strcmp(argv[i], "-i") == 0) { opts.interval_ms = static_cast<unsigned>(atoi(argv[++i])); }
        else { usage(argv[0]); return 1; }
    }
    if (opts.chunk == 0) {
        std::cerr << "Chunk size must be positive" << std::endl;
        return 1;
    }

    try {
        const EventRule rule = ScannerConfig::pump_create().rules.front();
        FeedSimulator simulator(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::mt19937 gen(std::random_device{}());

        boost::asio::io_context io_context;
        std::unique_ptr<DatagramSender> sender;
        std::ofstream capture;
        if (opts.capture_file.empty()) {
            sender.reset(new DatagramSender(io_context, opts.host, opts.port));
        } else {
            capture.open(opts.capture_file, std::ios::binary);
            if (!capture) {
                std::cerr << "Error: Could not create capture file: " << opts.capture_file << std::endl;
                return 2;
            }
        }

        for (unsigned b = 0; b < opts.batches; ++b) {
            const auto entries = simulator.make_batch(rule, opts.entries, opts.txs_per_entry, opts.events);
            const auto payload = encode_entries(entries);
            auto datagrams = split_into_fragments(b + 1, payload, opts.chunk);
            if (opts.shuffle) {
                std::shuffle(datagrams.begin(), datagrams.end(), gen);
            }

            std::cout << "[Sender] Batch " << b + 1 << ": " << payload.size() << " bytes in " << datagrams.size()
                      << " fragments" << std::endl;
            for (const auto& datagram : datagrams) {
                if (sender) {
                    sender->send(datagram);
                } else {
                    write_capture_record(capture, datagram);
                }
            }
            if (sender && opts.interval_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(opts.interval_ms));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Sender error: " << e.what() << std::endl;
        return 3;
    }
    return 0;
}
