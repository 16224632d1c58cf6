// ==============================================================================
// registry.cpp - Таблица алиасов реестра конфигов
// ==============================================================================

#include "sgrep/registry.hpp"

namespace sgrep::config {

Registry::Registry(std::map<std::string, std::string> entries) : entries_(std::move(entries)) {}

Registry Registry::defaults() {
    return Registry({
        {"r2c", "https://github.com/returntocorp/sgrep-rules/tarball/master"},
        {"r2c-develop", "https://github.com/returntocorp/sgrep-rules/tarball/develop"},
    });
}

const std::string* Registry::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it != entries_.end() ? &it->second : nullptr;
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [name, url] : entries_) {
        result.push_back(name);
    }
    return result;
}

}  // namespace sgrep::config
