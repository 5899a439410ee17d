#include <mip65/access/access_control.hpp>
#include <mip65/core/errors.hpp>
#include <mip65/utils/logger.hpp>
#include <stdexcept>

namespace mip65::access {

AccessControl::AccessControl(Principal root, audit::AuditSink* sink)
    : root_(std::move(root)), sink_(sink) {
    if (root_.empty()) {
        throw std::invalid_argument("root principal must not be empty");
    }

    admins_[Role::ADMIN] = Role::ADMIN;
    admins_[Role::GUARDIAN] = Role::ADMIN;
    admins_[Role::DATA] = Role::GUARDIAN;
    admins_[Role::OPS] = Role::GUARDIAN;

    members_[Role::ADMIN].insert(root_);
    members_[Role::GUARDIAN].insert(root_);
}

bool AccessControl::has_role(Role role, const Principal& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_role_locked(role, principal);
}

bool AccessControl::has_role_locked(Role role, const Principal& principal) const {
    auto it = members_.find(role);
    return it != members_.end() && it->second.count(principal) > 0;
}

Role AccessControl::admin_role(Role role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admins_.at(role);
}

std::vector<Principal> AccessControl::members(Role role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(role);
    if (it == members_.end()) {
        return {};
    }
    return std::vector<Principal>(it->second.begin(), it->second.end());
}

void AccessControl::check_role(Role role, const Principal& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    check_role_locked(role, principal);
}

void AccessControl::check_role_locked(Role role, const Principal& principal) const {
    if (!has_role_locked(role, principal)) {
        throw core::Unauthorized("principal '" + principal + "' lacks role " + to_string(role));
    }
}

void AccessControl::require_admin_locked(const Principal& caller, Role role) const {
    try {
        check_role_locked(admins_.at(role), caller);
    } catch (const core::Unauthorized& e) {
        utils::Logger::warn() << "Role change on " << to_string(role) << " by " << caller
                              << " rejected: " << e.what() << utils::Logger::endl;
        throw;
    }
}

void AccessControl::grant_role(const Principal& caller, Role role, const Principal& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_admin_locked(caller, role);
    if (account.empty()) {
        throw std::invalid_argument("cannot grant a role to an empty principal");
    }
    if (has_role_locked(role, account)) {
        return;
    }

    if (sink_) {
        sink_->append(caller, audit::RoleGranted{role, account});
    }
    members_[role].insert(account);

    utils::Logger::info() << caller << " granted " << to_string(role) << " to " << account << utils::Logger::endl;
}

void AccessControl::revoke_role(const Principal& caller, Role role, const Principal& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_admin_locked(caller, role);
    if (!has_role_locked(role, account)) {
        return;
    }

    if (sink_) {
        sink_->append(caller, audit::RoleRevoked{role, account});
    }
    members_[role].erase(account);

    utils::Logger::info() << caller << " revoked " << to_string(role) << " from " << account << utils::Logger::endl;
}

void AccessControl::renounce_role(const Principal& caller, Role role) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_role_locked(role, caller)) {
        return;
    }

    if (sink_) {
        sink_->append(caller, audit::RoleRevoked{role, caller});
    }
    members_[role].erase(caller);

    utils::Logger::info() << caller << " renounced " << to_string(role) << utils::Logger::endl;
}

void AccessControl::set_role_admin(const Principal& caller, Role role, Role admin) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_ || caller != root_) {
        throw core::Unauthorized("role hierarchy can only be changed by the root principal during setup");
    }
    admins_[role] = admin;

    utils::Logger::info() << "Admin role of " << to_string(role) << " set to " << to_string(admin) << utils::Logger::endl;
}

void AccessControl::seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
}

bool AccessControl::sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

void AccessControl::restore(const audit::AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* granted = std::get_if<audit::RoleGranted>(&record.event)) {
        members_[granted->role].insert(granted->account);
    } else if (auto* revoked = std::get_if<audit::RoleRevoked>(&record.event)) {
        members_[revoked->role].erase(revoked->account);
    }
}

} // namespace mip65::access
