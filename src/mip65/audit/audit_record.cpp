#include <mip65/audit/audit_record.hpp>
#include <type_traits>

namespace mip65::audit {

const char* event_name(const AuditEvent& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, AssetInit>)        return "AssetInit";
        else if constexpr (std::is_same_v<T, AssetBuy>)    return "AssetBuy";
        else if constexpr (std::is_same_v<T, AssetSell>)   return "AssetSell";
        else if constexpr (std::is_same_v<T, AssetUpdate>) return "AssetUpdate";
        else if constexpr (std::is_same_v<T, CapitalIn>)   return "CapitalIn";
        else if constexpr (std::is_same_v<T, CapitalOut>)  return "CapitalOut";
        else if constexpr (std::is_same_v<T, Expense>)     return "Expense";
        else if constexpr (std::is_same_v<T, Income>)      return "Income";
        else if constexpr (std::is_same_v<T, RoleGranted>) return "RoleGranted";
        else                                               return "RoleRevoked";
    }, event);
}

bool operator==(const AssetInit& a, const AssetInit& b) {
    return a.asset == b.asset;
}

bool operator==(const AssetBuy& a, const AssetBuy& b) {
    return a.asset == b.asset && a.date == b.date && a.qty == b.qty && a.price == b.price;
}

bool operator==(const AssetSell& a, const AssetSell& b) {
    return a.asset == b.asset && a.date == b.date && a.qty == b.qty && a.price == b.price;
}

bool operator==(const AssetUpdate& a, const AssetUpdate& b) {
    return a.asset == b.asset && a.date == b.date && a.nav == b.nav &&
           a.yield == b.yield && a.duration == b.duration && a.maturity == b.maturity;
}

bool operator==(const CapitalIn& a, const CapitalIn& b) {
    return a.date == b.date && a.amount == b.amount;
}

bool operator==(const CapitalOut& a, const CapitalOut& b) {
    return a.date == b.date && a.amount == b.amount;
}

bool operator==(const Expense& a, const Expense& b) {
    return a.date == b.date && a.amount == b.amount && a.reason == b.reason;
}

bool operator==(const Income& a, const Income& b) {
    return a.date == b.date && a.amount == b.amount && a.reason == b.reason;
}

bool operator==(const RoleGranted& a, const RoleGranted& b) {
    return a.role == b.role && a.account == b.account;
}

bool operator==(const RoleRevoked& a, const RoleRevoked& b) {
    return a.role == b.role && a.account == b.account;
}

bool operator==(const AuditRecord& a, const AuditRecord& b) {
    return a.sequence == b.sequence && a.caller == b.caller && a.event == b.event;
}

} // namespace mip65::audit
