#pragma once
#include <mip65/access/role.hpp>
#include <mip65/audit/audit_sink.hpp>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mip65::access {

// Role membership registry.
//
// Genesis: the root principal holds ADMIN and GUARDIAN. ADMIN administers
// ADMIN and GUARDIAN, GUARDIAN administers DATA and OPS. A principal may
// grant or revoke a role only while holding that role's admin role.
//
// When an audit sink is attached, every effective grant or revoke is
// appended as RoleGranted / RoleRevoked so membership survives a restart
// through restore().
class AccessControl {
public:
    explicit AccessControl(Principal root, audit::AuditSink* sink = nullptr);

    bool has_role(Role role, const Principal& principal) const;
    Role admin_role(Role role) const;
    std::vector<Principal> members(Role role) const;
    const Principal& root() const { return root_; }

    void grant_role(const Principal& caller, Role role, const Principal& account);
    void revoke_role(const Principal& caller, Role role, const Principal& account);

    // Drops one of the caller's own roles. No admin role required.
    void renounce_role(const Principal& caller, Role role);

    // Setup only: root may rewire the hierarchy until seal() is called.
    void set_role_admin(const Principal& caller, Role role, Role admin);
    void seal();
    bool sealed() const;

    // Throws Unauthorized unless principal holds role.
    void check_role(Role role, const Principal& principal) const;

    // Replays a RoleGranted / RoleRevoked record without authorization
    // or re-emission. Other events are ignored.
    void restore(const audit::AuditRecord& record);

private:
    void check_role_locked(Role role, const Principal& principal) const;
    void require_admin_locked(const Principal& caller, Role role) const;
    bool has_role_locked(Role role, const Principal& principal) const;

    Principal root_;
    audit::AuditSink* sink_;
    std::map<Role, std::set<Principal>> members_;
    std::map<Role, Role> admins_;
    bool sealed_ = false;
    mutable std::mutex mutex_;
};

} // namespace mip65::access
