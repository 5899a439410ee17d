#pragma once
#include <mip65/audit/audit_record.hpp>
#include <string>

namespace mip65::audit {

// Single-line text form of an audit record:
//   <sequence> <caller> <EventName> <fields...>
// Fields are separated by one space. Amounts are raw scaled integers.
// String fields escape backslash, space, CR and LF so a record never
// spans more than one line.
std::string encode(const AuditRecord& record);

// Inverse of encode. Throws std::invalid_argument on a malformed line.
AuditRecord decode(const std::string& line);

std::string escape_field(const std::string& field);
std::string unescape_field(const std::string& field);

} // namespace mip65::audit
