#include <mip65/audit/audit_codec.hpp>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace mip65::audit {

namespace {

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t end = line.find(' ', start);
        if (end == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, end - start));
        start = end + 1;
    }
    return fields;
}

uint64_t parse_u64(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        throw std::invalid_argument("malformed unsigned field: '" + text + "'");
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("malformed unsigned field: '" + text + "'");
        }
        uint64_t next = value * 10 + static_cast<uint64_t>(c - '0');
        if (next / 10 != value) {
            throw std::invalid_argument("unsigned field out of range: " + text);
        }
        value = next;
    }
    return value;
}

Role parse_role_field(const std::string& text) {
    auto role = access::parse_role(text);
    if (!role) {
        throw std::invalid_argument("unknown role: " + text);
    }
    return *role;
}

void expect_fields(const std::vector<std::string>& fields, size_t count, const std::string& line) {
    if (fields.size() != count) {
        throw std::invalid_argument("expected " + std::to_string(count) + " fields in audit line: " + line);
    }
}

} // namespace

std::string escape_field(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (char c : field) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ' ':  out += "\\s";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

std::string unescape_field(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] != '\\') {
            out += field[i];
            continue;
        }
        if (++i == field.size()) {
            throw std::invalid_argument("dangling escape in field: " + field);
        }
        switch (field[i]) {
            case '\\': out += '\\'; break;
            case 's':  out += ' ';  break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            default:
                throw std::invalid_argument("unknown escape in field: " + field);
        }
    }
    return out;
}

std::string encode(const AuditRecord& record) {
    std::ostringstream os;
    os << record.sequence << ' ' << escape_field(record.caller) << ' ' << event_name(record.event);

    std::visit([&os](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, AssetInit>) {
            os << ' ' << escape_field(e.asset);
        } else if constexpr (std::is_same_v<T, AssetBuy> || std::is_same_v<T, AssetSell>) {
            os << ' ' << escape_field(e.asset) << ' ' << e.date
               << ' ' << core::fixed::to_string(e.qty) << ' ' << core::fixed::to_string(e.price);
        } else if constexpr (std::is_same_v<T, AssetUpdate>) {
            os << ' ' << escape_field(e.asset) << ' ' << e.date
               << ' ' << core::fixed::to_string(e.nav) << ' ' << core::fixed::to_string(e.yield)
               << ' ' << core::fixed::to_string(e.duration) << ' ' << core::fixed::to_string(e.maturity);
        } else if constexpr (std::is_same_v<T, CapitalIn> || std::is_same_v<T, CapitalOut>) {
            os << ' ' << e.date << ' ' << core::fixed::to_string(e.amount);
        } else if constexpr (std::is_same_v<T, Expense> || std::is_same_v<T, Income>) {
            os << ' ' << e.date << ' ' << core::fixed::to_string(e.amount) << ' ' << escape_field(e.reason);
        } else {
            os << ' ' << access::to_string(e.role) << ' ' << escape_field(e.account);
        }
    }, record.event);

    return os.str();
}

AuditRecord decode(const std::string& line) {
    const std::vector<std::string> f = split_fields(line);
    if (f.size() < 3) {
        throw std::invalid_argument("truncated audit line: " + line);
    }

    AuditRecord record;
    record.sequence = parse_u64(f[0]);
    record.caller = unescape_field(f[1]);
    const std::string& tag = f[2];

    using core::fixed::parse_raw;

    if (tag == "AssetInit") {
        expect_fields(f, 4, line);
        record.event = AssetInit{unescape_field(f[3])};
    } else if (tag == "AssetBuy") {
        expect_fields(f, 7, line);
        record.event = AssetBuy{unescape_field(f[3]), parse_u64(f[4]), parse_raw(f[5]), parse_raw(f[6])};
    } else if (tag == "AssetSell") {
        expect_fields(f, 7, line);
        record.event = AssetSell{unescape_field(f[3]), parse_u64(f[4]), parse_raw(f[5]), parse_raw(f[6])};
    } else if (tag == "AssetUpdate") {
        expect_fields(f, 9, line);
        record.event = AssetUpdate{unescape_field(f[3]), parse_u64(f[4]),
                                   parse_raw(f[5]), parse_raw(f[6]), parse_raw(f[7]), parse_raw(f[8])};
    } else if (tag == "CapitalIn") {
        expect_fields(f, 5, line);
        record.event = CapitalIn{parse_u64(f[3]), parse_raw(f[4])};
    } else if (tag == "CapitalOut") {
        expect_fields(f, 5, line);
        record.event = CapitalOut{parse_u64(f[3]), parse_raw(f[4])};
    } else if (tag == "Expense") {
        expect_fields(f, 6, line);
        record.event = Expense{parse_u64(f[3]), parse_raw(f[4]), unescape_field(f[5])};
    } else if (tag == "Income") {
        expect_fields(f, 6, line);
        record.event = Income{parse_u64(f[3]), parse_raw(f[4]), unescape_field(f[5])};
    } else if (tag == "RoleGranted") {
        expect_fields(f, 5, line);
        record.event = RoleGranted{parse_role_field(f[3]), unescape_field(f[4])};
    } else if (tag == "RoleRevoked") {
        expect_fields(f, 5, line);
        record.event = RoleRevoked{parse_role_field(f[3]), unescape_field(f[4])};
    } else {
        throw std::invalid_argument("unknown audit event: " + tag);
    }

    return record;
}

} // namespace mip65::audit
