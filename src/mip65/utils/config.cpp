// src/mip65/utils/config.cpp
#include <mip65/utils/config.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace mip65 {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // namespace

void Config::parse(std::istream& in) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);

        if (!key.empty()) {
            values_[key] = value;
        }
    }
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    parse(file);
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    parse(in);
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::string value = get(key, std::string());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return default_value;
}

} // namespace utils
} // namespace mip65
