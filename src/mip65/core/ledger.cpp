#include <mip65/core/ledger.hpp>
#include <mip65/core/errors.hpp>
#include <mip65/utils/logger.hpp>

namespace mip65::core {

Ledger::Ledger(access::AccessControl& access, audit::AuditSink& sink, Clock clock)
    : access_(access), sink_(sink), clock_(std::move(clock)) {}

uint64_t Ledger::submit(const Principal& caller, Role role, std::optional<uint64_t> date, audit::AuditEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* name = audit::event_name(event);

    try {
        access_.check_role(role, caller);
        if (date) {
            validate_date(*date, clock_());
        }

        LedgerState::Delta delta = state_.plan(event);
        audit::AuditRecord record = sink_.append(caller, std::move(event));
        state_.commit(std::move(delta));

        utils::Logger::debug() << "#" << record.sequence << " " << name << " by " << caller
                               << ", cash " << fixed::format(state_.cash()) << utils::Logger::endl;
        return record.sequence;
    } catch (const LedgerError& e) {
        utils::Logger::warn() << name << " by " << caller << " rejected: " << e.what() << utils::Logger::endl;
        throw;
    }
}

uint64_t Ledger::init(const Principal& caller, const std::string& asset) {
    return submit(caller, Role::GUARDIAN, std::nullopt, audit::AssetInit{asset});
}

uint64_t Ledger::buy(const Principal& caller, const std::string& asset, uint64_t date, Amount qty, Amount price) {
    return submit(caller, Role::OPS, date, audit::AssetBuy{asset, date, qty, price});
}

uint64_t Ledger::sell(const Principal& caller, const std::string& asset, uint64_t date, Amount qty, Amount price) {
    return submit(caller, Role::OPS, date, audit::AssetSell{asset, date, qty, price});
}

uint64_t Ledger::update(const Principal& caller, const std::string& asset, uint64_t date,
                        Amount nav, Amount yield, Amount duration, Amount maturity) {
    return submit(caller, Role::DATA, date, audit::AssetUpdate{asset, date, nav, yield, duration, maturity});
}

uint64_t Ledger::add_capital(const Principal& caller, uint64_t date, Amount amount) {
    return submit(caller, Role::OPS, date, audit::CapitalIn{date, amount});
}

uint64_t Ledger::remove_capital(const Principal& caller, uint64_t date, Amount amount) {
    return submit(caller, Role::OPS, date, audit::CapitalOut{date, amount});
}

uint64_t Ledger::expense(const Principal& caller, uint64_t date, Amount amount, const std::string& reason) {
    return submit(caller, Role::OPS, date, audit::Expense{date, amount, reason});
}

uint64_t Ledger::income(const Principal& caller, uint64_t date, Amount amount, const std::string& reason) {
    return submit(caller, Role::OPS, date, audit::Income{date, amount, reason});
}

Amount Ledger::value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.value();
}

Amount Ledger::cash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.cash();
}

std::vector<std::string> Ledger::assets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.asset_order();
}

AssetDetails Ledger::details(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    AssetDetails details;
    if (const Asset* a = state_.find(asset)) {
        details.qty = a->qty;
        details.nav = a->nav;
        details.yield = a->yield;
        details.duration = a->duration;
        details.maturity = a->maturity;
    }
    return details;
}

std::optional<Asset> Ledger::find_asset(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const Asset* a = state_.find(asset)) {
        return *a;
    }
    return std::nullopt;
}

LedgerState Ledger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t Ledger::record_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_.next_sequence() - 1;
}

void Ledger::restore(const std::vector<audit::AuditRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerState rebuilt = replay(records);
    state_ = std::move(rebuilt);

    utils::Logger::info() << "Ledger restored from " << records.size() << " records, "
                          << state_.asset_order().size() << " assets, cash "
                          << fixed::format(state_.cash()) << utils::Logger::endl;
}

} // namespace mip65::core
