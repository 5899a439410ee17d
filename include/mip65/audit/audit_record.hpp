#pragma once
#include <mip65/access/role.hpp>
#include <mip65/core/fixed_point.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace mip65::audit {

using core::Amount;
using access::Principal;
using access::Role;

struct AssetInit {
    std::string asset;
};

struct AssetBuy {
    std::string asset;
    uint64_t date = 0;
    Amount qty = 0;
    Amount price = 0;
};

struct AssetSell {
    std::string asset;
    uint64_t date = 0;
    Amount qty = 0;
    Amount price = 0;
};

struct AssetUpdate {
    std::string asset;
    uint64_t date = 0;
    Amount nav = 0;
    Amount yield = 0;
    Amount duration = 0;
    Amount maturity = 0;
};

struct CapitalIn {
    uint64_t date = 0;
    Amount amount = 0;
};

struct CapitalOut {
    uint64_t date = 0;
    Amount amount = 0;
};

struct Expense {
    uint64_t date = 0;
    Amount amount = 0;
    std::string reason;
};

struct Income {
    uint64_t date = 0;
    Amount amount = 0;
    std::string reason;
};

struct RoleGranted {
    Role role = Role::OPS;
    Principal account;
};

struct RoleRevoked {
    Role role = Role::OPS;
    Principal account;
};

using AuditEvent = std::variant<AssetInit, AssetBuy, AssetSell, AssetUpdate,
                                CapitalIn, CapitalOut, Expense, Income,
                                RoleGranted, RoleRevoked>;

// One immutable log entry. Sequence numbers start at 1 and define emission order.
struct AuditRecord {
    uint64_t sequence = 0;
    Principal caller;
    AuditEvent event;
};

// Tag of the event alternative, e.g. "AssetBuy".
const char* event_name(const AuditEvent& event);

bool operator==(const AssetInit& a, const AssetInit& b);
bool operator==(const AssetBuy& a, const AssetBuy& b);
bool operator==(const AssetSell& a, const AssetSell& b);
bool operator==(const AssetUpdate& a, const AssetUpdate& b);
bool operator==(const CapitalIn& a, const CapitalIn& b);
bool operator==(const CapitalOut& a, const CapitalOut& b);
bool operator==(const Expense& a, const Expense& b);
bool operator==(const Income& a, const Income& b);
bool operator==(const RoleGranted& a, const RoleGranted& b);
bool operator==(const RoleRevoked& a, const RoleRevoked& b);
bool operator==(const AuditRecord& a, const AuditRecord& b);

} // namespace mip65::audit
