#include <boost/asio.hpp>
#include <csignal>
#include <fstream>
#include <iostream>

#include "Base58.hh"
#include "Config.hh"
#include "DatagramCapture.hh"
#include "DetectionReporter.hh"
#include "Log.hh"
#include "ShredPipeline.hh"
#include "ShredReceiver.hh"

namespace {

// Pushes every datagram of a capture file through the pipeline, then prints the totals.
int run_replay(const FeedConfig& config, ShredPipeline& pipeline) {
    std::ifstream in(config.replay_file, std::ios::binary);
    if (!in) {
        std::cerr << "Error: Could not open capture file: " << config.replay_file << std::endl;
        return 2;
    }

    CaptureReader reader(in);
    std::vector<uint8_t> datagram;
    while (reader.next(datagram)) {
        pipeline.handle_datagram(datagram);
    }
    pipeline.report_stats();
    return 0;
}

int run_live(const FeedConfig& config, ShredPipeline& pipeline) {
    boost::asio::io_context io_context;
    ShredReceiver receiver(io_context, config, pipeline);

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
        if (error) {
            return;
        }
        std::cout << "[Main] Caught signal " << signal_number << ", shutting down" << std::endl;
        receiver.stop();
    });

    receiver.start();
    io_context.run();

    pipeline.report_stats();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        FeedConfig config = load_config(argc, argv);
        if (config.show_help) {
            print_usage(std::cout, argv[0]);
            return 0;
        }
        set_log_level(config.log_level);

        std::cout << "===========================================" << std::endl;
        std::cout << "  Shred Scanner" << std::endl;
        std::cout << "===========================================" << std::endl;

        ScannerConfig scanner_config = config.scanner_config();
        for (const auto& rule : scanner_config.rules) {
            std::cout << "Watching '" << rule.name << "' on program "
                      << (rule.program_id ? base58_encode(*rule.program_id) : std::string("<any>")) << std::endl;
        }

        ConsoleReporter reporter;
        ShredPipeline pipeline(config.pipeline_options(), std::move(scanner_config), reporter);

        if (!config.replay_file.empty()) {
            return run_replay(config, pipeline);
        }
        return run_live(config, pipeline);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(std::cerr, argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nAn error occurred: " << e.what() << std::endl;
        return 3;
    }
}
