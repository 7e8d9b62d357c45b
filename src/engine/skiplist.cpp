/**
 * @file skiplist.cpp
 * @brief Ordered (score, member) index with rank spans
 */

#include <memkv/engine/skiplist.hpp>

#include <algorithm>
#include <utility>

namespace memkv {

SkipList::SkipList(uint32_t seed)
    : head_(std::make_unique<Node>(kSkipListMaxLevel, 0.0, std::string()))
    , rng_(seed) {
}

SkipList::~SkipList() {
    Clear();
}

SkipList::SkipList(SkipList&& other) noexcept
    : head_(std::move(other.head_))
    , tail_(std::exchange(other.tail_, nullptr))
    , length_(std::exchange(other.length_, 0))
    , level_(std::exchange(other.level_, 1))
    , rng_(other.rng_)
    , members_(std::move(other.members_)) {
    other.members_.clear();
}

SkipList& SkipList::operator=(SkipList&& other) noexcept {
    if (this != &other) {
        Clear();
        head_ = std::move(other.head_);
        tail_ = std::exchange(other.tail_, nullptr);
        length_ = std::exchange(other.length_, 0);
        level_ = std::exchange(other.level_, 1);
        rng_ = other.rng_;
        members_ = std::move(other.members_);
        other.members_.clear();
    }
    return *this;
}

void SkipList::Clear() {
    if (!head_) return;
    Node* x = head_->levels[0].forward;
    while (x != nullptr) {
        Node* next = x->levels[0].forward;
        delete x;
        x = next;
    }
    for (auto& lvl : head_->levels) {
        lvl.forward = nullptr;
        lvl.span = 0;
    }
    members_.clear();
    tail_ = nullptr;
    length_ = 0;
    level_ = 1;
}

int SkipList::RandomLevel() {
    int level = 1;
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    while (level < kSkipListMaxLevel && coin(rng_) < kSkipListProbability) level++;
    return level;
}

// ============================================================================
// Mutation
// ============================================================================

SkipList::Node* SkipList::InsertNode(double score, std::string member) {
    Node* update[kSkipListMaxLevel];
    size_t rank[kSkipListMaxLevel];

    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        rank[i] = (i == level_ - 1) ? 0 : rank[i + 1];
        while (x->levels[i].forward && Before(x->levels[i].forward, score, member)) {
            rank[i] += x->levels[i].span;
            x = x->levels[i].forward;
        }
        update[i] = x;
    }

    int level = RandomLevel();
    if (level > level_) {
        for (int i = level_; i < level; ++i) {
            rank[i] = 0;
            update[i] = head_.get();
            update[i]->levels[i].span = length_;
        }
        level_ = level;
    }

    x = new Node(level, score, std::move(member));
    for (int i = 0; i < level; ++i) {
        x->levels[i].forward = update[i]->levels[i].forward;
        update[i]->levels[i].forward = x;
        x->levels[i].span = update[i]->levels[i].span - (rank[0] - rank[i]);
        update[i]->levels[i].span = (rank[0] - rank[i]) + 1;
    }
    for (int i = level; i < level_; ++i) {
        update[i]->levels[i].span++;
    }

    x->backward = (update[0] == head_.get()) ? nullptr : update[0];
    if (x->levels[0].forward) {
        x->levels[0].forward->backward = x;
    } else {
        tail_ = x;
    }
    length_++;
    return x;
}

void SkipList::UnlinkNode(Node* x, Node** update) {
    for (int i = 0; i < level_; ++i) {
        if (update[i]->levels[i].forward == x) {
            update[i]->levels[i].span += x->levels[i].span - 1;
            update[i]->levels[i].forward = x->levels[i].forward;
        } else {
            update[i]->levels[i].span -= 1;
        }
    }
    if (x->levels[0].forward) {
        x->levels[0].forward->backward = x->backward;
    } else {
        tail_ = x->backward;
    }
    while (level_ > 1 && head_->levels[level_ - 1].forward == nullptr) {
        level_--;
    }
    length_--;
}

bool SkipList::Insert(double score, const std::string& member) {
    auto it = members_.find(member);
    if (it != members_.end()) {
        if (it->second->score != score) {
            UpdateScore(it->second->score, member, score);
        }
        return false;
    }

    Node* x = InsertNode(score, member);
    members_.emplace(std::string_view(x->member), x);
    return true;
}

bool SkipList::Delete(double score, std::string_view member) {
    Node* update[kSkipListMaxLevel];
    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward && Before(x->levels[i].forward, score, member)) {
            x = x->levels[i].forward;
        }
        update[i] = x;
    }

    x = x->levels[0].forward;
    if (x == nullptr || x->score != score || x->member != member) {
        return false;
    }

    UnlinkNode(x, update);
    members_.erase(std::string_view(x->member));
    delete x;
    return true;
}

const SkipList::Node* SkipList::UpdateScore(double current, std::string_view member, double new_score) {
    Node* update[kSkipListMaxLevel];
    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward && Before(x->levels[i].forward, current, member)) {
            x = x->levels[i].forward;
        }
        update[i] = x;
    }

    x = x->levels[0].forward;
    if (x == nullptr || x->score != current || x->member != member) {
        return nullptr;
    }

    // Position unchanged: rewrite the score in place
    if ((x->backward == nullptr || x->backward->score < new_score) &&
        (x->levels[0].forward == nullptr || x->levels[0].forward->score > new_score)) {
        x->score = new_score;
        return x;
    }

    UnlinkNode(x, update);
    members_.erase(std::string_view(x->member));
    Node* moved = InsertNode(new_score, std::move(x->member));
    members_.emplace(std::string_view(moved->member), moved);
    delete x;
    return moved;
}

// ============================================================================
// Lookup
// ============================================================================

const SkipList::Node* SkipList::Find(std::string_view member) const {
    auto it = members_.find(member);
    return it == members_.end() ? nullptr : it->second;
}

size_t SkipList::Rank(double score, std::string_view member) const {
    size_t rank = 0;
    const Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward &&
               (x->levels[i].forward->score < score ||
                (x->levels[i].forward->score == score &&
                 std::string_view(x->levels[i].forward->member) <= member))) {
            rank += x->levels[i].span;
            x = x->levels[i].forward;
        }
        if (x != head_.get() && x->member == member) {
            return rank;
        }
    }
    return 0;
}

const SkipList::Node* SkipList::ByRank(size_t rank) const {
    size_t traversed = 0;
    const Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward && traversed + x->levels[i].span <= rank) {
            traversed += x->levels[i].span;
            x = x->levels[i].forward;
        }
        if (traversed == rank) {
            return x == head_.get() ? nullptr : x;
        }
    }
    return nullptr;
}

std::vector<const SkipList::Node*> SkipList::RangeByRank(int64_t start, int64_t stop, bool reverse) const {
    std::vector<const Node*> result;
    const auto len = static_cast<int64_t>(length_);

    if (start < 0) start = len + start;
    if (stop < 0) stop = len + stop;
    if (start < 0) start = 0;
    if (stop >= len) stop = len - 1;
    if (start > stop || start >= len) {
        return result;
    }

    result.reserve(static_cast<size_t>(stop - start + 1));
    if (reverse) {
        const Node* x = ByRank(static_cast<size_t>(len - start));
        for (int64_t i = start; i <= stop && x != nullptr; ++i) {
            result.push_back(x);
            x = x->backward;
        }
    } else {
        const Node* x = ByRank(static_cast<size_t>(start + 1));
        for (int64_t i = start; i <= stop && x != nullptr; ++i) {
            result.push_back(x);
            x = x->levels[0].forward;
        }
    }
    return result;
}

// ============================================================================
// Score and lex ranges
// ============================================================================

const SkipList::Node* SkipList::FirstInRange(const ScoreRange& range) const {
    if (range.IsEmpty() || length_ == 0) return nullptr;
    if (!range.GteMin(tail_->score)) return nullptr;

    const Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward && !range.GteMin(x->levels[i].forward->score)) {
            x = x->levels[i].forward;
        }
    }
    x = x->levels[0].forward;
    if (x == nullptr || !range.LteMax(x->score)) return nullptr;
    return x;
}

const SkipList::Node* SkipList::LastInRange(const ScoreRange& range) const {
    if (range.IsEmpty() || length_ == 0) return nullptr;
    if (!range.LteMax(head_->levels[0].forward->score)) return nullptr;

    const Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward && range.LteMax(x->levels[i].forward->score)) {
            x = x->levels[i].forward;
        }
    }
    if (x == head_.get() || !range.GteMin(x->score)) return nullptr;
    return x;
}

std::vector<const SkipList::Node*> SkipList::RangeByScore(const ScoreRange& range, bool reverse) const {
    std::vector<const Node*> result;
    if (reverse) {
        for (const Node* x = LastInRange(range); x != nullptr && range.GteMin(x->score); x = x->backward) {
            result.push_back(x);
        }
    } else {
        for (const Node* x = FirstInRange(range); x != nullptr && range.LteMax(x->score);
             x = x->levels[0].forward) {
            result.push_back(x);
        }
    }
    return result;
}

std::vector<const SkipList::Node*> SkipList::RangeByLex(const LexRange& range, bool reverse) const {
    // Members are ordered by score first, so a lex interval is not contiguous
    // unless all scores are equal; filter in index order.
    std::vector<const Node*> result;
    if (reverse) {
        for (const Node* x = tail_; x != nullptr; x = x->backward) {
            if (range.Contains(x->member)) result.push_back(x);
        }
    } else {
        for (const Node* x = First(); x != nullptr; x = x->levels[0].forward) {
            if (range.Contains(x->member)) result.push_back(x);
        }
    }
    return result;
}

} // namespace memkv
