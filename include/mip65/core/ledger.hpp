#pragma once
#include <mip65/access/access_control.hpp>
#include <mip65/audit/audit_sink.hpp>
#include <mip65/core/date.hpp>
#include <mip65/core/fixed_point.hpp>
#include <mip65/core/ledger_state.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mip65::core {

using access::Principal;
using access::Role;

// The MIP65 portfolio ledger.
//
// Every mutation checks the caller's role, validates its date, plans the
// state change, appends one audit record and only then commits the change.
// A call that throws leaves assets, cash and the audit trail untouched.
// Mutations return the sequence number of the record they emitted.
//
// All amounts are signed 18-decimal fixed point; a correction is the same
// call with the quantity or amount negated.
class Ledger {
public:
    Ledger(access::AccessControl& access, audit::AuditSink& sink, Clock clock = system_clock_seconds);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // GUARDIAN. Throws AlreadyExists for a known asset.
    uint64_t init(const Principal& caller, const std::string& asset);

    // OPS
    uint64_t buy(const Principal& caller, const std::string& asset, uint64_t date, Amount qty, Amount price);
    uint64_t sell(const Principal& caller, const std::string& asset, uint64_t date, Amount qty, Amount price);

    // DATA
    uint64_t update(const Principal& caller, const std::string& asset, uint64_t date,
                    Amount nav, Amount yield, Amount duration, Amount maturity);

    // OPS
    uint64_t add_capital(const Principal& caller, uint64_t date, Amount amount);
    uint64_t remove_capital(const Principal& caller, uint64_t date, Amount amount);
    uint64_t expense(const Principal& caller, uint64_t date, Amount amount, const std::string& reason);
    uint64_t income(const Principal& caller, uint64_t date, Amount amount, const std::string& reason);

    // cash + sum(qty * nav). Throws Overflow if the total leaves the 128-bit range.
    Amount value() const;
    Amount cash() const;
    std::vector<std::string> assets() const;
    AssetDetails details(const std::string& asset) const;
    std::optional<Asset> find_asset(const std::string& asset) const;
    LedgerState snapshot() const;

    // Records in the audit trail so far, role changes included.
    uint64_t record_count() const;

    // Startup only: rebuilds state from a persisted trail without role
    // checks or re-emission. Role events are skipped.
    void restore(const std::vector<audit::AuditRecord>& records);

private:
    uint64_t submit(const Principal& caller, Role role, std::optional<uint64_t> date, audit::AuditEvent event);

    access::AccessControl& access_;
    audit::AuditSink& sink_;
    Clock clock_;
    LedgerState state_;
    mutable std::mutex mutex_;
};

} // namespace mip65::core
