#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace mip65::core {

constexpr uint64_t SECONDS_PER_DAY = 24 * 3600;

// Source of "now" in unix seconds. Injected so tests can pin the wall clock.
using Clock = std::function<uint64_t()>;

uint64_t system_clock_seconds();

// Throws InvalidDate unless date is a non-zero UTC midnight strictly before now.
void validate_date(uint64_t date, uint64_t now);

// UTC calendar date, e.g. "2026-10-18".
std::string format_date(uint64_t date);

// Accepts "YYYY-MM-DD" (UTC midnight) or plain unix seconds.
// Throws std::invalid_argument otherwise. Alignment is not checked here.
uint64_t parse_date(const std::string& text);

} // namespace mip65::core
