#include "index/term_tree.h"

namespace sidx {

TermTree::Builder& TermTree::Builder::add(const SegmentIndexPtr& segment) {
    addSegment(segment);

    if (!min_ || type_->compare(segment->minTerm(), *min_) < 0)
        min_ = segment->minTerm();
    if (!max_ || type_->compare(segment->maxTerm(), *max_) > 0)
        max_ = segment->maxTerm();
    return *this;
}

std::unique_ptr<TermTree::Builder> TermTree::builderFor(const ColumnTypePtr& type) {
    if (type->isTextual())
        return std::make_unique<PrefixTermTree::Builder>(type);
    return std::make_unique<RangeTermTree::Builder>(type);
}

// ---------------- RangeTermTree ----------------

RangeTermTree::RangeTermTree(ColumnTypePtr type, std::optional<std::string> min,
                             std::optional<std::string> max, Tree tree)
    : type_(std::move(type))
    , min_(std::move(min))
    , max_(std::move(max))
    , tree_(std::move(tree)) {}

void RangeTermTree::Builder::addSegment(const SegmentIndexPtr& segment) {
    intervals_.push_back(Tree::Interval{segment->minTerm(), segment->maxTerm(), segment});
}

std::unique_ptr<TermTree> RangeTermTree::Builder::build() {
    return std::make_unique<RangeTermTree>(type_, min_, max_, Tree(std::move(intervals_), ValueLess{type_}));
}

SegmentSet RangeTermTree::searchInterval(const std::string& min, const std::string& max) const {
    auto found = tree_.search(min, max);
    return SegmentSet(found.begin(), found.end());
}

SegmentSet RangeTermTree::all() const {
    if (tree_.empty())
        return {};
    return searchInterval(*min_, *max_);
}

SegmentSet RangeTermTree::search(const Expression& expression) const {
    if (tree_.empty())
        return {};

    switch (expression.op()) {
        case Expression::Op::EQ:
        case Expression::Op::RANGE: {
            const std::string& lo = expression.lower() ? expression.lower()->value : *min_;
            const std::string& hi = expression.upper() ? expression.upper()->value : *max_;
            return searchInterval(lo, hi);
        }
        default:
            return all();
    }
}

// ---------------- PrefixTermTree ----------------

std::unique_ptr<TermTree> PrefixTermTree::Builder::build() {
    return std::make_unique<PrefixTermTree>(type_, min_, max_, Tree(std::move(intervals_), ValueLess{type_}));
}

std::optional<std::string> PrefixTermTree::successor(const std::string& prefix) {
    std::string s = prefix;
    while (!s.empty() && static_cast<unsigned char>(s.back()) == 0xFF)
        s.pop_back();
    if (s.empty())
        return std::nullopt;
    s.back() = static_cast<char>(static_cast<unsigned char>(s.back()) + 1);
    return s;
}

SegmentSet PrefixTermTree::search(const Expression& expression) const {
    if (tree_.empty() || expression.op() != Expression::Op::PREFIX)
        return RangeTermTree::search(expression);

    const std::string& prefix = expression.lower()->value;
    auto upper = successor(prefix);
    return searchInterval(prefix, upper ? *upper : *max_);
}

} // namespace sidx
