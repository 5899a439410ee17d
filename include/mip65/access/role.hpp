#pragma once
#include <optional>
#include <string>

namespace mip65::access {

enum class Role {
    ADMIN,
    GUARDIAN,
    DATA,
    OPS
};

// Opaque caller identity handed in by the transport.
using Principal = std::string;

const char* to_string(Role role);

// Accepts the enumerator name in any letter case.
std::optional<Role> parse_role(const std::string& name);

} // namespace mip65::access
