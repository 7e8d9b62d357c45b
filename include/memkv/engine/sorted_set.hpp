#pragma once

#include <memkv/common/status.hpp>
#include <memkv/common/types.hpp>
#include <memkv/engine/skiplist.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memkv {

// Sorted set: member -> score map for O(1) lookups plus one SkipList for order.
// Both structures always hold the same (member, score) pairs.
class SortedSet {
public:
    explicit SortedSet(uint32_t seed = std::random_device{}()) : index_(seed) {}
    SortedSet(SortedSet&&) noexcept = default;
    SortedSet& operator=(SortedSet&&) noexcept = default;
    SortedSet(const SortedSet&) = delete;
    SortedSet& operator=(const SortedSet&) = delete;

    // Upsert; true if the member was not present before
    bool Add(const std::string& member, double score);
    bool Remove(std::string_view member);

    [[nodiscard]] std::optional<double> Score(std::string_view member) const;
    [[nodiscard]] bool Contains(std::string_view member) const { return Score(member).has_value(); }
    // 0-based rank, nullopt if absent
    [[nodiscard]] std::optional<size_t> Rank(std::string_view member, bool reverse = false) const;
    [[nodiscard]] size_t Size() const { return scores_.size(); }
    [[nodiscard]] bool Empty() const { return scores_.empty(); }

    [[nodiscard]] std::vector<ScoredMember> RangeByRank(int64_t start, int64_t stop, bool reverse = false) const;
    [[nodiscard]] std::vector<ScoredMember> RangeByScore(const ScoreRange& range, bool reverse = false) const;
    [[nodiscard]] std::vector<ScoredMember> RangeByLex(const LexRange& range, bool reverse = false) const;

private:
    static std::vector<ScoredMember> Collect(const std::vector<const SkipList::Node*>& nodes);

    std::unordered_map<std::string, double> scores_;
    SkipList index_;
};

// Range bound parsing: "1.5", "(1.5", "-inf", "+inf" / "[a", "(a", "-", "+"
Result<ScoreRange> ParseScoreRange(std::string_view min, std::string_view max);
Result<LexRange> ParseLexRange(std::string_view min, std::string_view max);
// Finite or infinite double; NaN and trailing garbage are rejected
Result<double> ParseScore(std::string_view text);

} // namespace memkv
