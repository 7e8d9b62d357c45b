/**
 * @file option_registry.cpp
 * @brief Per-command option flags with incompatibility rules
 */

#include <memkv/engine/option_registry.hpp>

#include <algorithm>
#include <cctype>

namespace memkv {

std::string ToUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

void OptionRegistry::Register(std::string_view name, std::initializer_list<std::string_view> incompatible) {
    auto& excluded = options_[ToUpper(name)];
    for (auto other : incompatible) {
        excluded.insert(ToUpper(other));
    }
}

bool OptionRegistry::Excludes(const std::string& a, const std::string& b) const {
    auto it = options_.find(a);
    return it != options_.end() && it->second.count(b) > 0;
}

Status OptionRegistry::Activate(std::string_view name) {
    std::string upper = ToUpper(name);
    if (options_.find(upper) == options_.end()) {
        return Status::UnknownOption("unknown option: " + upper);
    }

    for (const auto& active : active_) {
        if (active != upper && (Excludes(upper, active) || Excludes(active, upper))) {
            return Status::OptionConflict("option " + upper + " is incompatible with " + active);
        }
    }

    active_.insert(std::move(upper));
    return Status::Ok();
}

bool OptionRegistry::IsSet(std::string_view name) const {
    return active_.count(ToUpper(name)) > 0;
}

bool OptionRegistry::IsRegistered(std::string_view name) const {
    return options_.count(ToUpper(name)) > 0;
}

std::vector<std::string> OptionRegistry::Active() const {
    return {active_.begin(), active_.end()};
}

} // namespace memkv
