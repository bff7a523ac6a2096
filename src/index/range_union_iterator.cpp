#include "index/range_union_iterator.h"

#include <algorithm>

namespace sidx {

void RangeUnionIterator::Builder::updateStatistics(const RangeIterator& range) {
    min_ = std::min(min_, range.getMinimum());
    max_ = std::max(max_, range.getMaximum());
    count_ += range.getCount();
}

RangeIteratorPtr RangeUnionIterator::Builder::buildIterator() {
    return std::make_shared<RangeUnionIterator>(min_, max_, count_, ranges_);
}

RangeIteratorPtr RangeUnionIterator::build(const std::vector<RangeIteratorPtr>& ranges) {
    Builder b;
    b.add(ranges);
    return b.build();
}

RangeUnionIterator::RangeUnionIterator(Token min, Token max, uint64_t count, std::vector<RangeIteratorPtr> ranges)
    : RangeIterator(min, max, count)
    , ranges_(std::move(ranges)) {}

std::optional<Token> RangeUnionIterator::computeNext() {
    std::optional<Token> smallest;
    for (const auto& r : ranges_) {
        if (r->hasNext() && (!smallest || r->peek() < *smallest))
            smallest = r->peek();
    }
    if (!smallest)
        return std::nullopt;

    // Duplikate über alle Kinder hinweg überspringen
    for (const auto& r : ranges_) {
        if (r->hasNext() && r->peek() == *smallest)
            r->next();
    }
    return smallest;
}

void RangeUnionIterator::performSkipTo(Token target) {
    for (const auto& r : ranges_)
        r->skipTo(target);
}

void RangeUnionIterator::close() {
    if (closed_)
        return;
    closed_ = true;
    closeAll(ranges_);
}

} // namespace sidx
