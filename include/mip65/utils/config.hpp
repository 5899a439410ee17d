// include/mip65/utils/config.hpp
#pragma once
#include <istream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace mip65 {
namespace utils {

// key=value settings. Lines starting with '#' and blank lines are skipped,
// keys and values are trimmed, later keys override earlier ones.
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    void parse(std::istream& in);

public:
    Config() = default;

    // Shared instance for applications. Library code takes a Config& instead.
    static std::shared_ptr<Config> instance() {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (!instance_) {
            instance_ = std::make_shared<Config>();
        }
        return instance_;
    }

    // Returns false if the file cannot be opened; current values are kept then.
    bool load_from_file(const std::string& filename);
    void load_from_string(const std::string& text);

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    // true/false, yes/no, on/off, 1/0
    bool get_bool(const std::string& key, bool default_value) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }
};

} // namespace utils
} // namespace mip65
