#pragma once

#include <memkv/config.hpp>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memkv {

// Score interval; bounds are inclusive unless flagged exclusive
struct ScoreRange {
    double min{0.0};
    double max{0.0};
    bool min_exclusive{false};
    bool max_exclusive{false};

    [[nodiscard]] bool GteMin(double v) const { return min_exclusive ? v > min : v >= min; }
    [[nodiscard]] bool LteMax(double v) const { return max_exclusive ? v < max : v <= max; }
    [[nodiscard]] bool Contains(double v) const { return GteMin(v) && LteMax(v); }
    [[nodiscard]] bool IsEmpty() const {
        return min > max || (min == max && (min_exclusive || max_exclusive));
    }
};

// Byte-lexicographic interval; unbounded ends stand for "-" and "+"
struct LexRange {
    std::string min;
    std::string max;
    bool min_exclusive{false};
    bool max_exclusive{false};
    bool min_unbounded{false};
    bool max_unbounded{false};

    [[nodiscard]] bool GteMin(std::string_view v) const {
        if (min_unbounded) return true;
        return min_exclusive ? v > min : v >= min;
    }
    [[nodiscard]] bool LteMax(std::string_view v) const {
        if (max_unbounded) return true;
        return max_exclusive ? v < max : v <= max;
    }
    [[nodiscard]] bool Contains(std::string_view v) const { return GteMin(v) && LteMax(v); }
};

// Ordered index over (score, member), members unique.
// Forward links carry spans so rank lookups are O(log n); the lowest level
// also keeps a backward link for reverse traversal.
// Not thread-safe: the owning shard serializes access.
class SkipList {
public:
    struct Node {
        struct Level {
            Node* forward{nullptr};
            size_t span{0};
        };

        double score;
        std::string member;
        Node* backward{nullptr};
        std::vector<Level> levels;

        Node(int level, double s, std::string m) : score(s), member(std::move(m)), levels(level) {}
        [[nodiscard]] Node* Next() const { return levels[0].forward; }
        [[nodiscard]] Node* Prev() const { return backward; }
    };

    explicit SkipList(uint32_t seed = std::random_device{}());
    ~SkipList();
    SkipList(const SkipList&) = delete;
    SkipList& operator=(const SkipList&) = delete;
    SkipList(SkipList&& other) noexcept;
    SkipList& operator=(SkipList&& other) noexcept;

    // True if `member` is new; an existing member at another score is moved.
    bool Insert(double score, const std::string& member);
    bool Delete(double score, std::string_view member);
    // Caller guarantees (current, member) is present
    const Node* UpdateScore(double current, std::string_view member, double new_score);

    [[nodiscard]] const Node* Find(std::string_view member) const;
    // 1-based rank, 0 if absent
    [[nodiscard]] size_t Rank(double score, std::string_view member) const;
    // 1-based rank
    [[nodiscard]] const Node* ByRank(size_t rank) const;

    [[nodiscard]] std::vector<const Node*> RangeByRank(int64_t start, int64_t stop, bool reverse = false) const;
    [[nodiscard]] std::vector<const Node*> RangeByScore(const ScoreRange& range, bool reverse = false) const;
    [[nodiscard]] std::vector<const Node*> RangeByLex(const LexRange& range, bool reverse = false) const;

    [[nodiscard]] const Node* FirstInRange(const ScoreRange& range) const;
    [[nodiscard]] const Node* LastInRange(const ScoreRange& range) const;

    [[nodiscard]] const Node* First() const { return head_ ? head_->levels[0].forward : nullptr; }
    [[nodiscard]] const Node* Last() const { return tail_; }
    [[nodiscard]] size_t Length() const { return length_; }
    [[nodiscard]] int Level() const { return level_; }

private:
    static bool Before(const Node* n, double score, std::string_view member) {
        return n->score < score || (n->score == score && std::string_view(n->member) < member);
    }

    int RandomLevel();
    Node* InsertNode(double score, std::string member);
    void UnlinkNode(Node* x, Node** update);
    void Clear();

    std::unique_ptr<Node> head_;
    Node* tail_{nullptr};
    size_t length_{0};
    int level_{1};
    std::mt19937 rng_;
    std::unordered_map<std::string_view, Node*> members_;
};

} // namespace memkv
