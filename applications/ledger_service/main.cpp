// applications/ledger_service/main.cpp
#include "mip65/access/access_control.hpp"
#include "mip65/audit/audit_sink.hpp"
#include "mip65/core/ledger.hpp"
#include "mip65/service/command_processor.hpp"
#include "mip65/service/ledger_service.hpp"
#include "mip65/service/publishing_audit_sink.hpp"
#include "mip65/service/service_config.hpp"
#include "mip65/utils/config.hpp"
#include "mip65/utils/logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <zmq.hpp>

namespace {

std::atomic<bool> g_running = true;

void signal_handler(int) {
    g_running = false;
}

} // namespace

int main(int argc, char** argv) {
    using namespace mip65;

    try {
        std::string config_file = argc > 1 ? argv[1] : "mip65.conf";
        auto config = utils::Config::instance();
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        service::ServiceConfiguration settings = service::ServiceConfiguration::from_config(*config);
        if (!utils::Logger::set_level(settings.log_level)) {
            utils::Logger::warn() << "Unknown log level '" << settings.log_level << "', keeping info" << utils::Logger::endl;
        }

        // History first: the file sink resumes numbering after it
        std::vector<audit::AuditRecord> history = audit::FileAuditLog::load(settings.audit_log);
        audit::FileAuditLog file_log(settings.audit_log);

        zmq::context_t context(1);
        std::unique_ptr<zmq::socket_t> publisher;
        std::unique_ptr<service::PublishingAuditSink> publishing_sink;
        audit::AuditSink* sink = &file_log;

        if (!settings.publish_endpoint.empty()) {
            publisher = std::make_unique<zmq::socket_t>(context, zmq::socket_type::pub);
            publisher->set(zmq::sockopt::linger, 0);
            publisher->bind(settings.publish_endpoint);
            publishing_sink = std::make_unique<service::PublishingAuditSink>(file_log, *publisher);
            sink = publishing_sink.get();
            utils::Logger::info() << "Publishing audit records on " << settings.publish_endpoint << utils::Logger::endl;
        }

        access::AccessControl access(settings.root_principal, sink);
        for (const auto& record : history) {
            access.restore(record);
        }
        access.seal();

        core::Ledger ledger(access, *sink);
        ledger.restore(history);

        service::CommandProcessor processor(ledger, access);
        service::LedgerService ledger_service(context, processor, settings);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        ledger_service.start();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        ledger_service.stop();

        utils::Logger::info() << "Final cash " << core::fixed::format(ledger.cash())
                              << ", value " << core::fixed::format(ledger.value()) << utils::Logger::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
