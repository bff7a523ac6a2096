#include "index/range_intersection_iterator.h"

#include <algorithm>

namespace sidx {

void RangeIntersectionIterator::Builder::updateStatistics(const RangeIterator& range) {
    min_ = std::max(min_, range.getMinimum());
    max_ = std::min(max_, range.getMaximum());
    count_ = std::min(count_, range.getCount());
}

RangeIteratorPtr RangeIntersectionIterator::Builder::buildIterator() {
    if (min_ > max_) {
        closeAll(ranges_);
        return VectorRangeIterator::empty();
    }
    return std::make_shared<RangeIntersectionIterator>(min_, max_, count_, ranges_);
}

RangeIntersectionIterator::RangeIntersectionIterator(Token min, Token max, uint64_t count,
                                                     std::vector<RangeIteratorPtr> ranges)
    : RangeIterator(min, max, count)
    , ranges_(std::move(ranges)) {}

std::optional<Token> RangeIntersectionIterator::computeNext() {
    if (ranges_.empty())
        return std::nullopt;

    Token candidate = getMinimum();
    for (const auto& r : ranges_) {
        if (!r->hasNext())
            return std::nullopt;
        candidate = std::max(candidate, r->peek());
    }

    while (true) {
        bool agreed = true;
        for (const auto& r : ranges_) {
            r->skipTo(candidate);
            if (!r->hasNext())
                return std::nullopt;
            if (r->peek() > candidate) {
                candidate = r->peek();
                agreed = false;
                break;
            }
        }
        if (agreed)
            break;
    }

    for (const auto& r : ranges_)
        r->next();
    return candidate;
}

void RangeIntersectionIterator::performSkipTo(Token target) {
    for (const auto& r : ranges_)
        r->skipTo(target);
}

void RangeIntersectionIterator::close() {
    if (closed_)
        return;
    closed_ = true;
    closeAll(ranges_);
}

} // namespace sidx
