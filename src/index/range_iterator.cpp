#include "index/range_iterator.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace sidx {

RangeIterator::RangeIterator(Token min, Token max, uint64_t count)
    : min_(min), max_(max), count_(count) {}

bool RangeIterator::hasNext() {
    if (next_)
        return true;
    if (exhausted_)
        return false;

    next_ = computeNext();
    if (!next_)
        exhausted_ = true;
    return next_.has_value();
}

Token RangeIterator::peek() {
    if (!hasNext())
        throw std::out_of_range("range iterator exhausted");
    return *next_;
}

Token RangeIterator::next() {
    Token t = peek();
    next_.reset();
    return t;
}

void RangeIterator::skipTo(Token target) {
    if (exhausted_)
        return;
    if (target > max_) {
        next_.reset();
        exhausted_ = true;
        return;
    }
    if (next_ && *next_ >= target)
        return;

    next_.reset();
    performSkipTo(target);
}

// ---------------- Builder ----------------

RangeIterator::Builder& RangeIterator::Builder::add(const RangeIteratorPtr& range) {
    if (!range || range->getCount() == 0)
        return *this;

    if (ranges_.empty()) {
        min_ = range->getMinimum();
        max_ = range->getMaximum();
        count_ = range->getCount();
    } else {
        updateStatistics(*range);
    }
    ranges_.push_back(range);
    return *this;
}

RangeIterator::Builder& RangeIterator::Builder::add(const std::vector<RangeIteratorPtr>& ranges) {
    for (const auto& r : ranges)
        add(r);
    return *this;
}

RangeIteratorPtr RangeIterator::Builder::build() {
    RangeIteratorPtr result;
    if (ranges_.size() == 1)
        result = ranges_.front();
    else if (!ranges_.empty())
        result = buildIterator();

    ranges_.clear();
    return result;
}

void RangeIterator::Builder::close() {
    auto pending = std::move(ranges_);
    ranges_.clear();
    closeAll(pending);
}

// ---------------- VectorRangeIterator ----------------

VectorRangeIterator::VectorRangeIterator(std::vector<Token> tokens)
    : RangeIterator(tokens.empty() ? 0 : tokens.front(),
                    tokens.empty() ? 0 : tokens.back(),
                    tokens.size())
    , tokens_(std::move(tokens)) {}

RangeIteratorPtr VectorRangeIterator::empty() {
    return std::make_shared<VectorRangeIterator>(std::vector<Token>{});
}

std::optional<Token> VectorRangeIterator::computeNext() {
    if (pos_ >= tokens_.size())
        return std::nullopt;
    return tokens_[pos_++];
}

void VectorRangeIterator::performSkipTo(Token target) {
    auto it = std::lower_bound(tokens_.begin() + static_cast<std::ptrdiff_t>(pos_), tokens_.end(), target);
    pos_ = static_cast<size_t>(it - tokens_.begin());
}

void closeAll(const std::vector<RangeIteratorPtr>& ranges) {
    std::exception_ptr first;
    for (const auto& r : ranges) {
        try {
            r->close();
        } catch (...) {
            if (!first)
                first = std::current_exception();
        }
    }
    if (first)
        std::rethrow_exception(first);
}

} // namespace sidx
