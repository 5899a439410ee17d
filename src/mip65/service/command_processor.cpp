#include <mip65/service/command_processor.hpp>
#include <mip65/core/errors.hpp>
#include <mip65/core/fixed_point.hpp>
#include <mip65/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mip65::service {

namespace {

using core::fixed::format;
using core::fixed::parse;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Reads the next whitespace-delimited token starting at pos.
std::string next_token(const std::string& line, size_t& pos) {
    while (pos < line.size() && is_space(line[pos])) {
        ++pos;
    }
    size_t start = pos;
    while (pos < line.size() && !is_space(line[pos])) {
        ++pos;
    }
    return line.substr(start, pos - start);
}

std::string trimmed_rest(const std::string& line, size_t pos) {
    while (pos < line.size() && is_space(line[pos])) {
        ++pos;
    }
    size_t end = line.size();
    while (end > pos && is_space(line[end - 1])) {
        --end;
    }
    return line.substr(pos, end - pos);
}

access::Role role_arg(const std::string& text) {
    auto role = access::parse_role(text);
    if (!role) {
        throw std::invalid_argument("unknown role: " + text);
    }
    return *role;
}

std::string ok(const std::string& result = "") {
    return result.empty() ? "OK" : "OK " + result;
}

std::string ok(uint64_t sequence) {
    return "OK " + std::to_string(sequence);
}

std::string err(const std::string& code, const std::string& message) {
    return "ERR " + code + " " + message;
}

} // namespace

CommandProcessor::CommandProcessor(core::Ledger& ledger, access::AccessControl& access)
    : ledger_(ledger), access_(access) {
    register_ledger_commands();
    register_role_commands();
}

void CommandProcessor::register_command(const std::string& name, size_t arg_count, Handler handler,
                                        bool takes_reason) {
    handlers_[name] = Entry{arg_count, takes_reason, std::move(handler)};
}

void CommandProcessor::register_ledger_commands() {
    using core::parse_date;

    register_command("init", 1, [this](const Request& r) {
        return ok(ledger_.init(r.caller, r.args[0]));
    });
    register_command("buy", 4, [this](const Request& r) {
        return ok(ledger_.buy(r.caller, r.args[0], parse_date(r.args[1]), parse(r.args[2]), parse(r.args[3])));
    });
    register_command("sell", 4, [this](const Request& r) {
        return ok(ledger_.sell(r.caller, r.args[0], parse_date(r.args[1]), parse(r.args[2]), parse(r.args[3])));
    });
    register_command("update", 6, [this](const Request& r) {
        return ok(ledger_.update(r.caller, r.args[0], parse_date(r.args[1]),
                                 parse(r.args[2]), parse(r.args[3]), parse(r.args[4]), parse(r.args[5])));
    });
    register_command("add_capital", 2, [this](const Request& r) {
        return ok(ledger_.add_capital(r.caller, parse_date(r.args[0]), parse(r.args[1])));
    });
    register_command("remove_capital", 2, [this](const Request& r) {
        return ok(ledger_.remove_capital(r.caller, parse_date(r.args[0]), parse(r.args[1])));
    });
    register_command("expense", 2, [this](const Request& r) {
        return ok(ledger_.expense(r.caller, parse_date(r.args[0]), parse(r.args[1]), r.reason));
    }, true);
    register_command("income", 2, [this](const Request& r) {
        return ok(ledger_.income(r.caller, parse_date(r.args[0]), parse(r.args[1]), r.reason));
    }, true);

    register_command("value", 0, [this](const Request&) {
        return ok(format(ledger_.value()));
    });
    register_command("cash", 0, [this](const Request&) {
        return ok(format(ledger_.cash()));
    });
    register_command("assets", 0, [this](const Request&) {
        std::string ids;
        for (const auto& id : ledger_.assets()) {
            if (!ids.empty()) {
                ids += ' ';
            }
            ids += id;
        }
        return ok(ids);
    });
    register_command("details", 1, [this](const Request& r) {
        core::AssetDetails d = ledger_.details(r.args[0]);
        return ok(format(d.qty) + " " + format(d.nav) + " " + format(d.yield) + " " +
                  format(d.duration) + " " + format(d.maturity));
    });
}

void CommandProcessor::register_role_commands() {
    register_command("grant_role", 2, [this](const Request& r) {
        access_.grant_role(r.caller, role_arg(r.args[0]), r.args[1]);
        return ok();
    });
    register_command("revoke_role", 2, [this](const Request& r) {
        access_.revoke_role(r.caller, role_arg(r.args[0]), r.args[1]);
        return ok();
    });
    register_command("renounce_role", 1, [this](const Request& r) {
        access_.renounce_role(r.caller, role_arg(r.args[0]));
        return ok();
    });
    register_command("has_role", 2, [this](const Request& r) {
        return ok(access_.has_role(role_arg(r.args[0]), r.args[1]) ? "true" : "false");
    });
}

std::vector<std::string> CommandProcessor::commands() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : handlers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string CommandProcessor::handle(const std::string& line) {
    size_t pos = 0;
    Request request;
    request.caller = next_token(line, pos);
    request.command = next_token(line, pos);

    if (request.caller.empty() || request.command.empty()) {
        return err("INVALID_ARGUMENT", "expected '<caller> <command> [args...]'");
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        return err("INVALID_ARGUMENT", "unknown command: " + request.command);
    }
    const Entry& entry = it->second;

    for (size_t i = 0; i < entry.arg_count; ++i) {
        std::string arg = next_token(line, pos);
        if (arg.empty()) {
            return err("INVALID_ARGUMENT", request.command + " expects " +
                       std::to_string(entry.arg_count) + " arguments");
        }
        request.args.push_back(std::move(arg));
    }

    if (entry.takes_reason) {
        request.reason = trimmed_rest(line, pos);
    } else if (!trimmed_rest(line, pos).empty()) {
        return err("INVALID_ARGUMENT", request.command + " expects " +
                   std::to_string(entry.arg_count) + " arguments");
    }

    try {
        return entry.handler(request);
    } catch (const core::LedgerError& e) {
        return err(core::to_string(e.code()), e.what());
    } catch (const std::invalid_argument& e) {
        return err("INVALID_ARGUMENT", e.what());
    } catch (const std::exception& e) {
        utils::Logger::error() << "Request '" << request.command << "' from " << request.caller
                               << " failed: " << e.what() << utils::Logger::endl;
        return err("INTERNAL", e.what());
    }
}

} // namespace mip65::service
