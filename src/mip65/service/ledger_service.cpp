#include <mip65/service/ledger_service.hpp>
#include <mip65/utils/logger.hpp>

namespace mip65::service {

LedgerService::LedgerService(zmq::context_t& context, CommandProcessor& processor,
                             const ServiceConfiguration& config)
    : context_(context),
      processor_(processor),
      config_(config),
      socket_(context_, zmq::socket_type::rep) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::rcvtimeo, config_.poll_timeout_ms);
}

LedgerService::~LedgerService() {
    stop();
}

void LedgerService::start() {
    if (running_) {
        utils::Logger::warn() << "Ledger service already running" << utils::Logger::endl;
        return;
    }

    socket_.bind(config_.endpoint);
    running_ = true;
    serve_thread_ = std::thread([this]() { serve_loop(); });

    utils::Logger::info() << "Ledger service listening on " << config_.endpoint << utils::Logger::endl;
}

void LedgerService::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    if (serve_thread_.joinable()) {
        serve_thread_.join();
    }

    utils::Logger::info() << "Ledger service stopped after " << requests_served_
                          << " requests" << utils::Logger::endl;
}

void LedgerService::serve_loop() {
    while (running_) {
        zmq::message_t request;
        try {
            // Times out after poll_timeout_ms so running_ is re-checked
            if (!socket_.recv(request, zmq::recv_flags::none)) {
                continue;
            }

            std::string line(static_cast<const char*>(request.data()), request.size());
            utils::Logger::debug() << "Request: " << line << utils::Logger::endl;

            std::string reply = processor_.handle(line);
            if (!socket_.send(zmq::buffer(reply), zmq::send_flags::none)) {
                utils::Logger::error() << "Reply to '" << line << "' was not sent" << utils::Logger::endl;
                continue;
            }
            ++requests_served_;
        } catch (const zmq::error_t& e) {
            if (e.num() == ETERM) {
                break;
            }
            utils::Logger::error() << "Ledger service transport error: " << e.what() << utils::Logger::endl;
        }
    }
}

} // namespace mip65::service
