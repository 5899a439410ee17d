// applications/ledger_replay/main.cpp
#include "mip65/audit/audit_sink.hpp"
#include "mip65/core/date.hpp"
#include "mip65/core/fixed_point.hpp"
#include "mip65/core/ledger_state.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace mip65;
    using core::fixed::format;

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <audit-log>" << std::endl;
        return 2;
    }

    const std::string path = argv[1];
    if (!std::filesystem::exists(path)) {
        std::cerr << "Audit log not found: " << path << std::endl;
        return 1;
    }

    try {
        std::vector<audit::AuditRecord> records = audit::FileAuditLog::load(path);
        core::LedgerState state = core::replay(records);

        std::cout << "Records: " << records.size() << std::endl;
        std::cout << "Cash:    " << format(state.cash()) << std::endl;
        std::cout << "Value:   " << format(state.value()) << std::endl;

        for (const auto& name : state.asset_order()) {
            const core::Asset* asset = state.find(name);
            std::cout << std::left << std::setw(12) << name
                      << " qty " << format(asset->qty)
                      << " nav " << format(asset->nav)
                      << " yield " << format(asset->yield)
                      << " duration " << format(asset->duration)
                      << " maturity " << format(asset->maturity)
                      << " updated " << (asset->last_update_date ? core::format_date(asset->last_update_date) : "never")
                      << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
