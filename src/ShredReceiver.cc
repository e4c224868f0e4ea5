#include "ShredReceiver.hh"
#include "Log.hh"

#include <boost/bind/bind.hpp>
#include <iostream>

namespace {
constexpr int kReceiveBufferBytes = 8 * 1024 * 1024;
}

ShredReceiver::ShredReceiver(boost::asio::io_context& io_context, const FeedConfig& config, ShredPipeline& pipeline)
    : m_socket(io_context),
      m_evict_timer(io_context),
      m_stats_timer(io_context),
      m_evict_interval(config.evict_interval_ms),
      m_stats_interval(config.stats_interval_s),
      m_pipeline(pipeline) {
    const udp::endpoint endpoint(boost::asio::ip::make_address(config.bind_address), config.port);
    m_socket.open(endpoint.protocol());
    m_socket.set_option(udp::socket::reuse_address(true));

    // A larger kernel buffer rides out bursts, not being allowed one is not fatal
    boost::system::error_code ec;
    m_socket.set_option(boost::asio::socket_base::receive_buffer_size(kReceiveBufferBytes), ec);
    if (ec && log_enabled(LogLevel::Warn)) {
        std::cerr << "[Receiver] Could not raise receive buffer: " << ec.message() << std::endl;
    }

    m_socket.bind(endpoint);
}

void ShredReceiver::start() {
    m_running = true;
    if (log_enabled(LogLevel::Info)) {
        std::cout << "[Receiver] Listening on " << local_endpoint() << std::endl;
    }
    start_receive();
    schedule_evict();
    if (m_stats_interval.count() > 0) {
        schedule_stats();
    }
}

void ShredReceiver::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    boost::system::error_code ec;
    m_evict_timer.cancel();
    m_stats_timer.cancel();
    m_socket.close(ec);
    if (ec && log_enabled(LogLevel::Warn)) {
        std::cerr << "[Receiver] Error closing socket: " << ec.message() << std::endl;
    }
    if (log_enabled(LogLevel::Info)) {
        std::cout << "[Receiver] Stopped, " << m_receive_errors << " receive errors" << std::endl;
    }
}

void ShredReceiver::start_receive() {
    m_socket.async_receive_from(
        boost::asio::buffer(m_buffer), m_remote,
        boost::bind(&ShredReceiver::handle_receive, this,
                    boost::asio::placeholders::error,
                    boost::asio::placeholders::bytes_transferred));
}

void ShredReceiver::handle_receive(const boost::system::error_code& error, std::size_t bytes_transferred) {
    if (!m_running || error == boost::asio::error::operation_aborted) {
        return;
    }
    if (error) {
        // UDP errors (e.g. ICMP port unreachable) only affect one read, keep going
        m_receive_errors++;
        if (log_enabled(LogLevel::Warn)) {
            std::cerr << "[Receiver] Receive error: " << error.message() << std::endl;
        }
    } else {
        m_pipeline.handle_datagram(m_buffer.data(), bytes_transferred);
    }
    start_receive();
}

void ShredReceiver::schedule_evict() {
    m_evict_timer.expires_after(m_evict_interval);
    m_evict_timer.async_wait(boost::bind(&ShredReceiver::handle_evict, this, boost::asio::placeholders::error));
}

void ShredReceiver::handle_evict(const boost::system::error_code& error) {
    if (!m_running || error == boost::asio::error::operation_aborted) {
        return;
    }
    const size_t evicted = m_pipeline.evict_stale();
    if (evicted > 0 && log_enabled(LogLevel::Debug)) {
        std::cout << "[Receiver] Evicted " << evicted << " stale messages" << std::endl;
    }
    schedule_evict();
}

void ShredReceiver::schedule_stats() {
    m_stats_timer.expires_after(m_stats_interval);
    m_stats_timer.async_wait(boost::bind(&ShredReceiver::handle_stats, this, boost::asio::placeholders::error));
}

void ShredReceiver::handle_stats(const boost::system::error_code& error) {
    if (!m_running || error == boost::asio::error::operation_aborted) {
        return;
    }
    m_pipeline.report_stats();
    schedule_stats();
}
