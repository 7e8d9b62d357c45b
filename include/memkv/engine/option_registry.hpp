#pragma once

#include <memkv/common/status.hpp>
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace memkv {

// Named boolean flags for one command, with mutual-exclusion rules.
// Names are case-insensitive; conflicts are checked in both directions.
class OptionRegistry {
public:
    OptionRegistry() = default;

    void Register(std::string_view name, std::initializer_list<std::string_view> incompatible = {});

    // UnknownOption if unregistered, OptionConflict if an active option excludes it
    Status Activate(std::string_view name);

    [[nodiscard]] bool IsSet(std::string_view name) const;
    [[nodiscard]] bool IsRegistered(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> Active() const;
    void Reset() { active_.clear(); }

private:
    [[nodiscard]] bool Excludes(const std::string& a, const std::string& b) const;

    std::map<std::string, std::set<std::string>> options_;
    std::set<std::string> active_;
};

std::string ToUpper(std::string_view s);

} // namespace memkv
