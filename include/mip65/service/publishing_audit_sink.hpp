#pragma once
#include <mip65/audit/audit_sink.hpp>
#include <mutex>
#include <zmq.hpp>

namespace mip65::service {

// Forwards every record to an inner sink and then publishes its encoded
// line on a ZeroMQ PUB socket. The inner sink stays authoritative: a
// failed publish is logged and does not fail the append.
class PublishingAuditSink : public audit::AuditSink {
public:
    PublishingAuditSink(audit::AuditSink& inner, zmq::socket_t& publisher);

    audit::AuditRecord append(const audit::Principal& caller, audit::AuditEvent event) override;
    uint64_t next_sequence() const override { return inner_.next_sequence(); }

    uint64_t published() const;

private:
    audit::AuditSink& inner_;
    zmq::socket_t& publisher_;
    uint64_t published_ = 0;
    mutable std::mutex mutex_;
};

} // namespace mip65::service
