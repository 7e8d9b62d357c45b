/**
 * @file glob.cpp
 * @brief Glob-style pattern matching for key enumeration
 */

#include <memkv/engine/glob.hpp>
#include <memkv/config.hpp>

#include <cctype>
#include <utility>

namespace memkv {

namespace {

inline int Fold(unsigned char c, bool nocase) {
    return nocase ? std::tolower(c) : c;
}

// `skip_longer` short-circuits backtracking: once the tail after a '*' failed
// at every offset, no earlier '*' can make it match either.
bool MatchImpl(std::string_view p, std::string_view s, bool nocase, bool& skip_longer, int nesting) {
    if (nesting > kGlobMaxNesting) return false;

    size_t pi = 0;
    size_t si = 0;
    while (pi < p.size() && si < s.size()) {
        switch (p[pi]) {
            case '*': {
                while (pi + 1 < p.size() && p[pi + 1] == '*') pi++;
                if (pi + 1 == p.size()) return true;
                for (; si < s.size(); ++si) {
                    if (MatchImpl(p.substr(pi + 1), s.substr(si), nocase, skip_longer, nesting + 1)) {
                        return true;
                    }
                    if (skip_longer) return false;
                }
                skip_longer = true;
                return false;
            }
            case '?':
                si++;
                break;
            case '[': {
                pi++;
                bool negate = pi < p.size() && p[pi] == '^';
                if (negate) pi++;

                bool matched = false;
                const int c = Fold(static_cast<unsigned char>(s[si]), nocase);
                while (pi < p.size() && p[pi] != ']') {
                    if (p[pi] == '\\' && pi + 1 < p.size()) {
                        pi++;
                        if (Fold(static_cast<unsigned char>(p[pi]), nocase) == c) matched = true;
                    } else if (pi + 2 < p.size() && p[pi + 1] == '-' && p[pi + 2] != ']') {
                        int lo = Fold(static_cast<unsigned char>(p[pi]), nocase);
                        int hi = Fold(static_cast<unsigned char>(p[pi + 2]), nocase);
                        if (lo > hi) std::swap(lo, hi);
                        if (c >= lo && c <= hi) matched = true;
                        pi += 2;
                    } else if (Fold(static_cast<unsigned char>(p[pi]), nocase) == c) {
                        matched = true;
                    }
                    pi++;
                }
                // Unterminated class: the remaining pattern was the class body
                if (pi == p.size()) pi--;
                if (negate) matched = !matched;
                if (!matched) return false;
                si++;
                break;
            }
            case '\\':
                if (pi + 1 < p.size()) pi++;
                [[fallthrough]];
            default:
                if (Fold(static_cast<unsigned char>(p[pi]), nocase) !=
                    Fold(static_cast<unsigned char>(s[si]), nocase)) {
                    return false;
                }
                si++;
                break;
        }
        pi++;
    }

    if (si == s.size()) {
        while (pi < p.size() && p[pi] == '*') pi++;
    }
    return pi == p.size() && si == s.size();
}

} // anonymous namespace

bool GlobMatch(std::string_view pattern, std::string_view subject, bool nocase) {
    bool skip_longer = false;
    return MatchImpl(pattern, subject, nocase, skip_longer, 0);
}

} // namespace memkv
