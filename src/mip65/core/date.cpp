#include <mip65/core/date.hpp>
#include <mip65/core/errors.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mip65::core {

uint64_t system_clock_seconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count());
}

void validate_date(uint64_t date, uint64_t now) {
    if (date == 0) {
        throw InvalidDate("date must be non-zero");
    }
    if (date % SECONDS_PER_DAY != 0) {
        throw InvalidDate("date " + std::to_string(date) + " is not a UTC midnight");
    }
    if (date >= now) {
        throw InvalidDate("date " + std::to_string(date) + " is not in the past");
    }
}

std::string format_date(uint64_t date) {
    std::time_t t = static_cast<std::time_t>(date);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

uint64_t parse_date(const std::string& text) {
    if (text.find('-') != std::string::npos) {
        std::tm tm{};
        std::istringstream in(text);
        in >> std::get_time(&tm, "%Y-%m-%d");
        if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("malformed date: '" + text + "'");
        }
        std::time_t t = timegm(&tm);
        if (t <= 0) {
            throw std::invalid_argument("date before the epoch: " + text);
        }
        return static_cast<uint64_t>(t);
    }

    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("malformed date: '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("date out of range: " + text);
    }
}

} // namespace mip65::core
