#pragma once
#include <mip65/utils/config.hpp>
#include <string>

namespace mip65::service {

struct ServiceConfiguration {
    // Request/reply endpoint the ledger binds
    std::string endpoint = "tcp://*:5565";

    // Audit records are re-published here when set
    std::string publish_endpoint;

    std::string audit_log = "mip65_audit.log";

    // Genesis holder of ADMIN and GUARDIAN
    std::string root_principal = "deployer";

    std::string log_level = "info";

    // Receive timeout of the serve loop, bounds how long stop() waits
    int poll_timeout_ms = 100;

    static ServiceConfiguration from_config(const utils::Config& config);
};

} // namespace mip65::service
