#include <mip65/service/service_config.hpp>

namespace mip65::service {

ServiceConfiguration ServiceConfiguration::from_config(const utils::Config& config) {
    ServiceConfiguration defaults;
    ServiceConfiguration out;
    out.endpoint = config.get("endpoint", defaults.endpoint);
    out.publish_endpoint = config.get("publish_endpoint", defaults.publish_endpoint);
    out.audit_log = config.get("audit_log", defaults.audit_log);
    out.root_principal = config.get("root_principal", defaults.root_principal);
    out.log_level = config.get("log_level", defaults.log_level);
    out.poll_timeout_ms = config.get("poll_timeout_ms", defaults.poll_timeout_ms);
    if (out.poll_timeout_ms <= 0) {
        out.poll_timeout_ms = defaults.poll_timeout_ms;
    }
    return out;
}

} // namespace mip65::service
