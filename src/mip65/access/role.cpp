#include <mip65/access/role.hpp>
#include <algorithm>
#include <cctype>

namespace mip65::access {

const char* to_string(Role role) {
    switch (role) {
        case Role::ADMIN:    return "ADMIN";
        case Role::GUARDIAN: return "GUARDIAN";
        case Role::DATA:     return "DATA";
        case Role::OPS:      return "OPS";
    }
    return "UNKNOWN";
}

std::optional<Role> parse_role(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (Role role : {Role::ADMIN, Role::GUARDIAN, Role::DATA, Role::OPS}) {
        if (upper == to_string(role)) {
            return role;
        }
    }
    return std::nullopt;
}

} // namespace mip65::access
