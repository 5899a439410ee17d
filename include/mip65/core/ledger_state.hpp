#pragma once
#include <mip65/audit/audit_record.hpp>
#include <mip65/core/fixed_point.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mip65::core {

struct Asset {
    std::string name;
    Amount qty = 0;
    uint64_t last_update_date = 0;
    Amount nav = 0;
    Amount yield = 0;
    Amount duration = 0;
    Amount maturity = 0;
};

// Result of a details() query; all zero for an asset that was never initialized.
struct AssetDetails {
    Amount qty = 0;
    Amount nav = 0;
    Amount yield = 0;
    Amount duration = 0;
    Amount maturity = 0;
};

bool operator==(const Asset& a, const Asset& b);
bool operator==(const AssetDetails& a, const AssetDetails& b);

// Aggregate state derived from the audit trail. apply() is the only
// transition, used both by live operations and by replay.
class LedgerState {
public:
    // Outcome of one event, computed without touching the state.
    struct Delta {
        std::optional<Asset> asset;
        bool new_asset = false;
        Amount cash = 0;
    };

    // Throws UnknownAsset, AlreadyExists or Overflow. Role events yield an empty delta.
    Delta plan(const audit::AuditEvent& event) const;
    void commit(Delta delta);

    void apply(const audit::AuditEvent& event) { commit(plan(event)); }

    Amount cash() const { return cash_; }
    const std::vector<std::string>& asset_order() const { return order_; }
    const Asset* find(const std::string& name) const;

    // cash + sum(qty * nav) over assets in insertion order
    Amount value() const;

    bool operator==(const LedgerState& other) const;
    bool operator!=(const LedgerState& other) const { return !(*this == other); }

private:
    const Asset& require(const std::string& name) const;

    std::unordered_map<std::string, Asset> assets_;
    std::vector<std::string> order_;
    Amount cash_ = 0;
};

// Rebuilds ledger state from records in emission order.
LedgerState replay(const std::vector<audit::AuditRecord>& records);

} // namespace mip65::core
