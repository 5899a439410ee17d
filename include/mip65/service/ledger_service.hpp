#pragma once
#include <mip65/service/command_processor.hpp>
#include <mip65/service/service_config.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <zmq.hpp>

namespace mip65::service {

// Serves CommandProcessor over a ZeroMQ REP socket on a dedicated thread.
// Requests are handled strictly one at a time, in arrival order.
class LedgerService {
private:
    zmq::context_t& context_;
    CommandProcessor& processor_;
    ServiceConfiguration config_;
    zmq::socket_t socket_;

    std::thread serve_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> requests_served_{0};

    void serve_loop();

public:
    LedgerService(zmq::context_t& context, CommandProcessor& processor, const ServiceConfiguration& config);
    ~LedgerService();

    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    // Binds the endpoint on the calling thread (bind errors propagate as
    // zmq::error_t), then starts serving.
    void start();
    void stop();
    bool is_running() const { return running_; }

    uint64_t requests_served() const { return requests_served_; }
    const std::string& endpoint() const { return config_.endpoint; }
};

} // namespace mip65::service
