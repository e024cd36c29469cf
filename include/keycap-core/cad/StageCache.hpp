#pragma once

#include <string>
#include <utility>
#include <vector>

namespace keycap::core::cad {

/**
 * @brief Single-slot cache for one pipeline stage
 *
 * Holds the last successful output of a stage, and the warnings it raised,
 * together with the key of the inputs it was computed from. A stage re-runs only when its key changes; a
 * failed run leaves the previous entry in place.
 */
template<typename T>
class StageCache {
public:
    explicit StageCache(std::string stageName) : name_(std::move(stageName)) {}

    const std::string& name() const { return name_; }

    bool hasValue() const { return valid_; }
    bool matches(const std::string& key) const { return valid_ && key_ == key; }

    const std::string& key() const { return key_; }
    const T& value() const { return value_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    void store(const std::string& key, T value, std::vector<std::string> warnings = {}) {
        key_ = key;
        value_ = std::move(value);
        warnings_ = std::move(warnings);
        valid_ = true;
    }

    // Drop the entry and whatever it keeps alive
    void release() {
        key_.clear();
        value_ = T();
        warnings_.clear();
        valid_ = false;
    }

private:
    std::string name_;
    std::string key_;
    T value_{};
    std::vector<std::string> warnings_;
    bool valid_ = false;
};

} // namespace keycap::core::cad
