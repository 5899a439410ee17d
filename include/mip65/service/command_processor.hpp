#pragma once
#include <mip65/access/access_control.hpp>
#include <mip65/core/ledger.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mip65::service {

// Text front end of the ledger, independent of the transport.
//
// Request:  <caller> <command> [args...]
// Reply:    OK [result]  |  ERR <CODE> <message>
//
// Amounts are decimal ("12.5"), dates are YYYY-MM-DD or unix seconds.
// expense and income take the rest of the line as the reason.
class CommandProcessor {
public:
    struct Request {
        access::Principal caller;
        std::string command;
        std::vector<std::string> args;
        std::string reason;
    };

    CommandProcessor(core::Ledger& ledger, access::AccessControl& access);

    std::string handle(const std::string& line);

    std::vector<std::string> commands() const;

private:
    using Handler = std::function<std::string(const Request&)>;

    void register_command(const std::string& name, size_t arg_count, Handler handler,
                          bool takes_reason = false);
    void register_ledger_commands();
    void register_role_commands();

    struct Entry {
        size_t arg_count;
        bool takes_reason;
        Handler handler;
    };

    core::Ledger& ledger_;
    access::AccessControl& access_;
    std::unordered_map<std::string, Entry> handlers_;
};

} // namespace mip65::service
