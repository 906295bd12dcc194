#include "environment.hpp"

#include <cstdlib>
#include <string>

namespace furnilytics::config {
    std::optional<std::string> ProcessEnvironment::get(const std::string& key) const {
        const char* value = std::getenv(key.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    MapEnvironment::MapEnvironment(std::map<std::string, std::string> values) : values_(std::move(values)) {}

    std::optional<std::string> MapEnvironment::get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}  // namespace furnilytics::config
