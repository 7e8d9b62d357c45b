/**
 * @file sorted_set.cpp
 * @brief Sorted set over a hash map and a SkipList
 */

#include <memkv/engine/sorted_set.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace memkv {

bool SortedSet::Add(const std::string& member, double score) {
    auto it = scores_.find(member);
    if (it == scores_.end()) {
        scores_.emplace(member, score);
        index_.Insert(score, member);
        return true;
    }

    if (it->second != score) {
        index_.UpdateScore(it->second, member, score);
        it->second = score;
    }
    return false;
}

bool SortedSet::Remove(std::string_view member) {
    auto it = scores_.find(std::string(member));
    if (it == scores_.end()) return false;
    index_.Delete(it->second, member);
    scores_.erase(it);
    return true;
}

std::optional<double> SortedSet::Score(std::string_view member) const {
    auto it = scores_.find(std::string(member));
    if (it == scores_.end()) return std::nullopt;
    return it->second;
}

std::optional<size_t> SortedSet::Rank(std::string_view member, bool reverse) const {
    auto score = Score(member);
    if (!score) return std::nullopt;
    size_t rank = index_.Rank(*score, member);
    if (rank == 0) return std::nullopt;
    return reverse ? Size() - rank : rank - 1;
}

std::vector<ScoredMember> SortedSet::Collect(const std::vector<const SkipList::Node*>& nodes) {
    std::vector<ScoredMember> out;
    out.reserve(nodes.size());
    for (const auto* node : nodes) {
        out.push_back({node->member, node->score});
    }
    return out;
}

std::vector<ScoredMember> SortedSet::RangeByRank(int64_t start, int64_t stop, bool reverse) const {
    return Collect(index_.RangeByRank(start, stop, reverse));
}

std::vector<ScoredMember> SortedSet::RangeByScore(const ScoreRange& range, bool reverse) const {
    return Collect(index_.RangeByScore(range, reverse));
}

std::vector<ScoredMember> SortedSet::RangeByLex(const LexRange& range, bool reverse) const {
    return Collect(index_.RangeByLex(range, reverse));
}

// ============================================================================
// Bound parsing
// ============================================================================

Result<double> ParseScore(std::string_view text) {
    if (text.empty()) {
        return Status::InvalidArgument("value is not a valid float");
    }
    std::string buf(text);
    char* end = nullptr;
    double value = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || std::isnan(value) || std::isspace(static_cast<unsigned char>(buf[0]))) {
        return Status::InvalidArgument("value is not a valid float");
    }
    return value;
}

namespace {

Result<double> ParseScoreBound(std::string_view text, bool& exclusive) {
    exclusive = false;
    if (!text.empty() && text.front() == '(') {
        exclusive = true;
        text.remove_prefix(1);
    }
    auto value = ParseScore(text);
    if (!value.ok()) {
        return Status::InvalidArgument("min or max is not a float");
    }
    return value;
}

// "-" / "+" are unbounded; anything else needs a '[' or '(' prefix
Status ParseLexBound(std::string_view text, std::string& out, bool& exclusive, bool& unbounded) {
    exclusive = false;
    unbounded = false;
    if (text == "-" || text == "+") {
        unbounded = true;
        return Status::Ok();
    }
    if (text.empty() || (text.front() != '(' && text.front() != '[')) {
        return Status::InvalidArgument("min or max not valid string range item");
    }
    exclusive = text.front() == '(';
    text.remove_prefix(1);
    out.assign(text);
    return Status::Ok();
}

} // anonymous namespace

Result<ScoreRange> ParseScoreRange(std::string_view min, std::string_view max) {
    ScoreRange range;
    auto lo = ParseScoreBound(min, range.min_exclusive);
    if (!lo.ok()) return lo.status();
    auto hi = ParseScoreBound(max, range.max_exclusive);
    if (!hi.ok()) return hi.status();
    range.min = lo.value();
    range.max = hi.value();
    return range;
}

Result<LexRange> ParseLexRange(std::string_view min, std::string_view max) {
    LexRange range;
    MEMKV_RETURN_IF_ERROR(ParseLexBound(min, range.min, range.min_exclusive, range.min_unbounded));
    MEMKV_RETURN_IF_ERROR(ParseLexBound(max, range.max, range.max_exclusive, range.max_unbounded));
    if (min == "+" || max == "-") {
        // (min = +inf) or (max = -inf): an interval nothing falls into
        LexRange empty;
        empty.min_exclusive = true;
        empty.max_exclusive = true;
        return empty;
    }
    return range;
}

} // namespace memkv
