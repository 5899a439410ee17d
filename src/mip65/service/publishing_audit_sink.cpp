#include <mip65/service/publishing_audit_sink.hpp>
#include <mip65/audit/audit_codec.hpp>
#include <mip65/utils/logger.hpp>

namespace mip65::service {

PublishingAuditSink::PublishingAuditSink(audit::AuditSink& inner, zmq::socket_t& publisher)
    : inner_(inner), publisher_(publisher) {}

audit::AuditRecord PublishingAuditSink::append(const audit::Principal& caller, audit::AuditEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    audit::AuditRecord record = inner_.append(caller, std::move(event));

    std::string line = audit::encode(record);
    try {
        if (publisher_.send(zmq::buffer(line), zmq::send_flags::dontwait)) {
            ++published_;
        } else {
            utils::Logger::warn() << "Audit publisher busy, record " << record.sequence
                                  << " not published" << utils::Logger::endl;
        }
    } catch (const zmq::error_t& e) {
        utils::Logger::error() << "Failed to publish audit record " << record.sequence
                               << ": " << e.what() << utils::Logger::endl;
    }

    return record;
}

uint64_t PublishingAuditSink::published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace mip65::service
