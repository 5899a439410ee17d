#include <mip65/core/ledger_state.hpp>
#include <mip65/core/errors.hpp>
#include <type_traits>

namespace mip65::core {

bool operator==(const Asset& a, const Asset& b) {
    return a.name == b.name && a.qty == b.qty && a.last_update_date == b.last_update_date &&
           a.nav == b.nav && a.yield == b.yield && a.duration == b.duration && a.maturity == b.maturity;
}

bool operator==(const AssetDetails& a, const AssetDetails& b) {
    return a.qty == b.qty && a.nav == b.nav && a.yield == b.yield &&
           a.duration == b.duration && a.maturity == b.maturity;
}

const Asset* LedgerState::find(const std::string& name) const {
    auto it = assets_.find(name);
    return it != assets_.end() ? &it->second : nullptr;
}

const Asset& LedgerState::require(const std::string& name) const {
    const Asset* asset = find(name);
    if (!asset) {
        throw UnknownAsset(name);
    }
    return *asset;
}

LedgerState::Delta LedgerState::plan(const audit::AuditEvent& event) const {
    Delta delta;
    delta.cash = cash_;

    std::visit([&](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, audit::AssetInit>) {
            if (e.asset.empty()) {
                throw LedgerError(ErrorCode::INVALID_ARGUMENT, "asset id must not be empty");
            }
            if (find(e.asset)) {
                throw AlreadyExists(e.asset);
            }
            Asset asset;
            asset.name = e.asset;
            delta.asset = asset;
            delta.new_asset = true;
        } else if constexpr (std::is_same_v<T, audit::AssetBuy>) {
            Asset asset = require(e.asset);
            asset.qty = fixed::checked_add(asset.qty, e.qty);
            delta.cash = fixed::checked_sub(cash_, fixed::mul(e.qty, e.price));
            delta.asset = asset;
        } else if constexpr (std::is_same_v<T, audit::AssetSell>) {
            Asset asset = require(e.asset);
            asset.qty = fixed::checked_sub(asset.qty, e.qty);
            delta.cash = fixed::checked_add(cash_, fixed::mul(e.qty, e.price));
            delta.asset = asset;
        } else if constexpr (std::is_same_v<T, audit::AssetUpdate>) {
            Asset asset = require(e.asset);
            asset.last_update_date = e.date;
            asset.nav = e.nav;
            asset.yield = e.yield;
            asset.duration = e.duration;
            asset.maturity = e.maturity;
            delta.asset = asset;
        } else if constexpr (std::is_same_v<T, audit::CapitalIn> || std::is_same_v<T, audit::Income>) {
            delta.cash = fixed::checked_add(cash_, e.amount);
        } else if constexpr (std::is_same_v<T, audit::CapitalOut> || std::is_same_v<T, audit::Expense>) {
            delta.cash = fixed::checked_sub(cash_, e.amount);
        }
        // Role events leave ledger state untouched
    }, event);

    return delta;
}

void LedgerState::commit(Delta delta) {
    if (delta.asset) {
        const std::string name = delta.asset->name;
        if (delta.new_asset) {
            order_.push_back(name);
        }
        assets_[name] = std::move(*delta.asset);
    }
    cash_ = delta.cash;
}

Amount LedgerState::value() const {
    Amount total = cash_;
    for (const auto& name : order_) {
        const Asset& asset = assets_.at(name);
        total = fixed::checked_add(total, fixed::mul(asset.qty, asset.nav));
    }
    return total;
}

bool LedgerState::operator==(const LedgerState& other) const {
    return cash_ == other.cash_ && order_ == other.order_ && assets_ == other.assets_;
}

LedgerState replay(const std::vector<audit::AuditRecord>& records) {
    LedgerState state;
    for (const auto& record : records) {
        state.apply(record.event);
    }
    return state;
}

} // namespace mip65::core
