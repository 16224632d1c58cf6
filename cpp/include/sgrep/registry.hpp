// ==============================================================================
// sgrep/registry.hpp - Таблица алиасов реестра конфигов
// ==============================================================================

#ifndef SGREP_REGISTRY_HPP
#define SGREP_REGISTRY_HPP

#include <map>
#include <string>
#include <vector>

namespace sgrep::config {

/// Алиас реестра по умолчанию
constexpr const char* DEFAULT_REGISTRY_KEY = "r2c";

/// Неизменяемая таблица alias -> URL tarball
class Registry {
public:
    Registry() = default;
    explicit Registry(std::map<std::string, std::string> entries);

    /// r2c, r2c-develop
    static Registry defaults();

    /// Точное совпадение имени; nullptr если алиас неизвестен
    const std::string* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// Имена алиасов (отсортированы)
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::string> entries_;
};

}  // namespace sgrep::config

#endif  // SGREP_REGISTRY_HPP
