#pragma once

#include <string_view>

namespace memkv {

// Glob match over raw bytes: '*', '?', '[...]', '[^...]', ranges 'a-z', '\' escapes.
// The whole subject must match.
[[nodiscard]] bool GlobMatch(std::string_view pattern, std::string_view subject, bool nocase = false);

} // namespace memkv
