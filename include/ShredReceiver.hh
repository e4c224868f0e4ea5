// ShredReceiver.hh
#ifndef SHREDRECEIVER_H
#define SHREDRECEIVER_H
#pragma once
#include <array>
#include <boost/asio.hpp>
#include <chrono>
#include "Config.hh"
#include "ShredPipeline.hh"

using boost::asio::ip::udp;

/*
Reads datagrams off a UDP socket and hands them to the pipeline. Receives, stale
eviction and stats all run as handlers on the same io_context, so with one thread
calling run() they never overlap.
*/
class ShredReceiver {
public:
    static constexpr size_t kMaxDatagramSize = 65536;

    ShredReceiver(boost::asio::io_context& io_context, const FeedConfig& config, ShredPipeline& pipeline);

    void start();
    void stop();

    udp::endpoint local_endpoint() const { return m_socket.local_endpoint(); }

private:
    void start_receive();
    void handle_receive(const boost::system::error_code& error, std::size_t bytes_transferred);
    void schedule_evict();
    void handle_evict(const boost::system::error_code& error);
    void schedule_stats();
    void handle_stats(const boost::system::error_code& error);

    udp::socket m_socket;
    udp::endpoint m_remote;
    std::array<uint8_t, kMaxDatagramSize> m_buffer;
    boost::asio::steady_timer m_evict_timer;
    boost::asio::steady_timer m_stats_timer;
    std::chrono::milliseconds m_evict_interval;
    std::chrono::seconds m_stats_interval;
    ShredPipeline& m_pipeline;
    uint64_t m_receive_errors = 0;
    bool m_running = false;
};
#endif
