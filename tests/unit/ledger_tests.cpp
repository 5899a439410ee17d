#include <gtest/gtest.h>
#include <mip65/access/access_control.hpp>
#include <mip65/audit/audit_sink.hpp>
#include <mip65/core/errors.hpp>
#include <mip65/core/ledger.hpp>

#include <string>
#include <vector>

using mip65::access::AccessControl;
using mip65::access::Role;
using mip65::audit::MemoryAuditLog;
using mip65::core::Amount;
using mip65::core::AssetDetails;
using mip65::core::Ledger;
using mip65::core::LedgerState;
namespace fixed = mip65::core::fixed;

namespace {

constexpr uint64_t TODAY = 1792368000;      // 2026-10-19 00:00 UTC
constexpr uint64_t NOW = TODAY + 12 * 3600;
constexpr uint64_t YESTERDAY = TODAY - 86400;

Amount units(int64_t n) {
    return fixed::from_units(n);
}

} // namespace

class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        access.grant_role("root", Role::OPS, "ops");
        access.grant_role("root", Role::DATA, "oracle");
        log_size_after_setup = log.size();
    }

    size_t ledger_records() const {
        return log.size() - log_size_after_setup;
    }

    MemoryAuditLog log;
    AccessControl access{"root", &log};
    Ledger ledger{access, log, [] { return NOW; }};
    size_t log_size_after_setup = 0;
};

TEST_F(LedgerTest, InitRegistersAssetWithZeroState) {
    uint64_t seq = ledger.init("root", "UST-2Y");

    EXPECT_EQ(seq, log.size());
    ASSERT_EQ(ledger.assets(), std::vector<std::string>{"UST-2Y"});
    auto asset = ledger.find_asset("UST-2Y");
    ASSERT_TRUE(asset.has_value());
    EXPECT_EQ(asset->name, "UST-2Y");
    EXPECT_TRUE(asset->qty == 0);
    EXPECT_EQ(asset->last_update_date, 0u);
    EXPECT_TRUE(ledger.details("UST-2Y") == AssetDetails{});
}

TEST_F(LedgerTest, InitTwiceFailsWithAlreadyExists) {
    ledger.init("root", "UST-2Y");
    ledger.buy("ops", "UST-2Y", YESTERDAY, units(5), units(100));

    EXPECT_THROW(ledger.init("root", "UST-2Y"), mip65::core::AlreadyExists);
    EXPECT_TRUE(ledger.details("UST-2Y").qty == units(5));
    EXPECT_EQ(ledger_records(), 2u);
}

TEST_F(LedgerTest, InitRejectsEmptyId) {
    try {
        ledger.init("root", "");
        FAIL() << "expected LedgerError";
    } catch (const mip65::core::LedgerError& e) {
        EXPECT_EQ(e.code(), mip65::core::ErrorCode::INVALID_ARGUMENT);
    }
    EXPECT_TRUE(ledger.assets().empty());
}

TEST_F(LedgerTest, BuyAndSellMoveQuantityAndCash) {
    ledger.init("root", "UST-2Y");
    ledger.add_capital("ops", YESTERDAY, units(1000));

    ledger.buy("ops", "UST-2Y", YESTERDAY, units(3), units(99));
    EXPECT_TRUE(ledger.details("UST-2Y").qty == units(3));
    EXPECT_TRUE(ledger.cash() == units(1000 - 297));

    ledger.sell("ops", "UST-2Y", TODAY, units(1), units(101));
    EXPECT_TRUE(ledger.details("UST-2Y").qty == units(2));
    EXPECT_TRUE(ledger.cash() == units(1000 - 297 + 101));
}

TEST_F(LedgerTest, BuyCostTruncatesTowardZero) {
    ledger.init("root", "X");

    // 1e-18 * 0.5 truncates to zero
    ledger.buy("ops", "X", YESTERDAY, 1, fixed::parse("0.5"));
    EXPECT_TRUE(ledger.cash() == 0);

    // -1e-18 * 1.5 = -1.5e-18 truncates to -1e-18, so cash rises by one unit
    ledger.buy("ops", "X", YESTERDAY, -1, fixed::parse("1.5"));
    EXPECT_TRUE(ledger.cash() == 1);
}

TEST_F(LedgerTest, CorrectionRestoresPreviousState) {
    ledger.init("root", "UST-2Y");
    ledger.add_capital("ops", YESTERDAY, units(500));
    ledger.buy("ops", "UST-2Y", YESTERDAY, units(2), units(10));
    const Amount qty_before = ledger.details("UST-2Y").qty;
    const Amount cash_before = ledger.cash();

    Amount q = fixed::parse("7.25");
    Amount p = fixed::parse("98.5");
    ledger.buy("ops", "UST-2Y", YESTERDAY, q, p);
    ledger.buy("ops", "UST-2Y", TODAY, -q, p);

    EXPECT_TRUE(ledger.details("UST-2Y").qty == qty_before);
    EXPECT_TRUE(ledger.cash() == cash_before);
    EXPECT_EQ(ledger_records(), 5u);
}

TEST_F(LedgerTest, CashOperations) {
    ledger.add_capital("ops", YESTERDAY, units(1000));
    ledger.remove_capital("ops", YESTERDAY, units(100));
    ledger.expense("ops", YESTERDAY, units(25), "custody fee");
    ledger.income("ops", TODAY, units(40), "coupon");

    EXPECT_TRUE(ledger.cash() == units(915));

    // Negative amounts correct earlier entries
    ledger.expense("ops", TODAY, units(-25), "custody fee reversal");
    EXPECT_TRUE(ledger.cash() == units(940));
}

TEST_F(LedgerTest, UpdateOverwritesValuation) {
    ledger.init("root", "UST-2Y");
    ledger.update("oracle", "UST-2Y", YESTERDAY, units(100), fixed::parse("0.045"), units(2), units(730));
    ledger.update("oracle", "UST-2Y", TODAY, units(101), fixed::parse("0.044"), units(2), units(729));

    auto asset = ledger.find_asset("UST-2Y");
    ASSERT_TRUE(asset.has_value());
    EXPECT_TRUE(asset->nav == units(101));
    EXPECT_TRUE(asset->yield == fixed::parse("0.044"));
    EXPECT_TRUE(asset->maturity == units(729));
    EXPECT_EQ(asset->last_update_date, TODAY);
    EXPECT_TRUE(asset->qty == 0);
}

TEST_F(LedgerTest, ValueSumsCashAndMarkedPositions) {
    ledger.init("root", "A");
    ledger.init("root", "B");
    ledger.buy("ops", "A", YESTERDAY, units(2), 0);
    ledger.buy("ops", "B", YESTERDAY, units(3), 0);
    ledger.update("oracle", "A", YESTERDAY, units(100), 0, 0, 0);
    ledger.update("oracle", "B", YESTERDAY, units(50), 0, 0, 0);
    ledger.add_capital("ops", YESTERDAY, units(1000));

    EXPECT_TRUE(ledger.value() == units(1350));
    EXPECT_EQ(fixed::format(ledger.value()), "1350.000000000000000000");
}

TEST_F(LedgerTest, UnknownAssetDetailsAreZero) {
    EXPECT_TRUE(ledger.details("ZZZ") == AssetDetails{});
    EXPECT_FALSE(ledger.find_asset("ZZZ").has_value());
}

TEST_F(LedgerTest, MutationsOnUnknownAssetAreRejected) {
    EXPECT_THROW(ledger.buy("ops", "ZZZ", YESTERDAY, units(1), units(1)), mip65::core::UnknownAsset);
    EXPECT_THROW(ledger.sell("ops", "ZZZ", YESTERDAY, units(1), units(1)), mip65::core::UnknownAsset);
    EXPECT_THROW(ledger.update("oracle", "ZZZ", YESTERDAY, 1, 1, 1, 1), mip65::core::UnknownAsset);
    EXPECT_TRUE(ledger.cash() == 0);
    EXPECT_EQ(ledger_records(), 0u);
}

TEST_F(LedgerTest, EnumerationKeepsInitOrder) {
    for (const char* id : {"C", "A", "B"}) {
        ledger.init("root", id);
    }
    ledger.buy("ops", "A", YESTERDAY, units(1), units(1));
    ledger.update("oracle", "C", YESTERDAY, units(1), 0, 0, 0);
    ledger.sell("ops", "A", YESTERDAY, units(1), units(1));

    EXPECT_EQ(ledger.assets(), (std::vector<std::string>{"C", "A", "B"}));
}

TEST_F(LedgerTest, RoleGatingLeavesStateUntouched) {
    ledger.init("root", "A");
    ledger.add_capital("ops", YESTERDAY, units(10));
    const LedgerState before = ledger.snapshot();
    const size_t records_before = log.size();

    EXPECT_THROW(ledger.init("ops", "B"), mip65::core::Unauthorized);
    EXPECT_THROW(ledger.buy("oracle", "A", YESTERDAY, units(1), units(1)), mip65::core::Unauthorized);
    EXPECT_THROW(ledger.sell("root", "A", YESTERDAY, units(1), units(1)), mip65::core::Unauthorized);
    EXPECT_THROW(ledger.update("ops", "A", YESTERDAY, 1, 1, 1, 1), mip65::core::Unauthorized);
    EXPECT_THROW(ledger.add_capital("oracle", YESTERDAY, units(1)), mip65::core::Unauthorized);
    EXPECT_THROW(ledger.remove_capital("mallory", YESTERDAY, units(1)), mip65::core::Unauthorized);
    EXPECT_THROW(ledger.expense("mallory", YESTERDAY, units(1), "x"), mip65::core::Unauthorized);
    EXPECT_THROW(ledger.income("mallory", YESTERDAY, units(1), "x"), mip65::core::Unauthorized);

    EXPECT_TRUE(ledger.snapshot() == before);
    EXPECT_EQ(log.size(), records_before);
    EXPECT_EQ(ledger.record_count(), records_before);
}

TEST_F(LedgerTest, RoleCheckPrecedesDateCheck) {
    EXPECT_THROW(ledger.add_capital("mallory", 0, units(1)), mip65::core::Unauthorized);
}

TEST_F(LedgerTest, DateValidation) {
    ledger.init("root", "A");
    const size_t records_before = log.size();

    EXPECT_THROW(ledger.add_capital("ops", 0, units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.add_capital("ops", YESTERDAY + 3600, units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.add_capital("ops", TODAY + 86400, units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.buy("ops", "A", 24 * 3600 + 1, units(1), units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.update("oracle", "A", 0, 1, 1, 1, 1), mip65::core::InvalidDate);

    // 3600 satisfies (date % 24) * 3600 == 0 but is not a day boundary
    EXPECT_THROW(ledger.add_capital("ops", 3600 * 24 + 3600, units(1)), mip65::core::InvalidDate);

    EXPECT_EQ(log.size(), records_before);
    EXPECT_TRUE(ledger.cash() == 0);

    EXPECT_NO_THROW(ledger.add_capital("ops", YESTERDAY, units(1)));
    EXPECT_NO_THROW(ledger.add_capital("ops", TODAY, units(1)));
    EXPECT_TRUE(ledger.cash() == units(2));
}

TEST_F(LedgerTest, EveryDatedOperationValidatesItsDate) {
    ledger.init("root", "A");
    const LedgerState before = ledger.snapshot();
    const size_t records_before = log.size();
    const uint64_t misaligned = YESTERDAY + 60;

    EXPECT_THROW(ledger.sell("ops", "A", misaligned, units(1), units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.remove_capital("ops", misaligned, units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.expense("ops", misaligned, units(1), "fee"), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.income("ops", misaligned, units(1), "coupon"), mip65::core::InvalidDate);

    EXPECT_THROW(ledger.sell("ops", "A", 0, units(1), units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.remove_capital("ops", TODAY + 86400, units(1)), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.expense("ops", 0, units(1), "fee"), mip65::core::InvalidDate);
    EXPECT_THROW(ledger.income("ops", TODAY + 86400, units(1), "coupon"), mip65::core::InvalidDate);

    EXPECT_TRUE(ledger.snapshot() == before);
    EXPECT_EQ(log.size(), records_before);
}

TEST_F(LedgerTest, SellCorrectionRestoresPreviousState) {
    ledger.init("root", "UST-5Y");
    ledger.add_capital("ops", YESTERDAY, units(100));
    ledger.buy("ops", "UST-5Y", YESTERDAY, units(10), units(9));
    const LedgerState before = ledger.snapshot();

    Amount q = fixed::parse("3.333333333333333333");
    Amount p = fixed::parse("10.07");
    ledger.sell("ops", "UST-5Y", YESTERDAY, q, p);
    EXPECT_FALSE(ledger.snapshot() == before);
    ledger.sell("ops", "UST-5Y", TODAY, -q, p);

    EXPECT_TRUE(ledger.snapshot() == before);
    EXPECT_EQ(ledger_records(), 5u);
}

TEST_F(LedgerTest, DateEqualToNowIsRejected) {
    MemoryAuditLog other_log;
    AccessControl other_access("root", &other_log);
    Ledger at_midnight(other_access, other_log, [] { return TODAY; });
    other_access.grant_role("root", Role::OPS, "ops");

    EXPECT_THROW(at_midnight.add_capital("ops", TODAY, units(1)), mip65::core::InvalidDate);
    EXPECT_NO_THROW(at_midnight.add_capital("ops", YESTERDAY, units(1)));
}

TEST_F(LedgerTest, OverflowIsRejectedWithoutEffect) {
    ledger.init("root", "A");
    const Amount huge = fixed::parse_raw("170141183460469231731687303715884105727");

    EXPECT_THROW(ledger.buy("ops", "A", YESTERDAY, huge, units(2)), mip65::core::Overflow);
    EXPECT_TRUE(ledger.details("A").qty == 0);

    ledger.add_capital("ops", YESTERDAY, huge);
    EXPECT_THROW(ledger.income("ops", YESTERDAY, 1, "one too many"), mip65::core::Overflow);
    EXPECT_TRUE(ledger.cash() == huge);
    EXPECT_EQ(ledger_records(), 2u);
}

TEST_F(LedgerTest, ReplayReproducesState) {
    ledger.init("root", "A");
    ledger.init("root", "B");
    ledger.add_capital("ops", YESTERDAY, units(1000));
    ledger.buy("ops", "A", YESTERDAY, fixed::parse("2.5"), fixed::parse("99.999"));
    ledger.sell("ops", "B", YESTERDAY, fixed::parse("1.333333333333333333"), fixed::parse("3.1"));
    ledger.update("oracle", "A", TODAY, units(101), fixed::parse("0.05"), units(1), units(365));
    ledger.expense("ops", TODAY, units(3), "audit");
    ledger.income("ops", TODAY, units(7), "coupon");
    ledger.remove_capital("ops", TODAY, units(50));
    ledger.buy("ops", "A", TODAY, -fixed::parse("2.5"), fixed::parse("99.999"));

    // Role events in the same log do not disturb the ledger replay
    access.grant_role("root", Role::OPS, "ops-2");

    LedgerState replayed = mip65::core::replay(log.records());
    EXPECT_TRUE(replayed == ledger.snapshot());
    EXPECT_TRUE(replayed.value() == ledger.value());
}

TEST_F(LedgerTest, RestoreRebuildsFromRecords) {
    ledger.init("root", "A");
    ledger.add_capital("ops", YESTERDAY, units(10));
    ledger.buy("ops", "A", YESTERDAY, units(1), units(4));

    MemoryAuditLog fresh_log;
    AccessControl fresh_access("root", &fresh_log);
    Ledger restored(fresh_access, fresh_log, [] { return NOW; });
    restored.restore(log.records());

    EXPECT_TRUE(restored.snapshot() == ledger.snapshot());
    EXPECT_EQ(fresh_log.size(), 0u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
