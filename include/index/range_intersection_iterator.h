#pragma once

#include "index/range_iterator.h"

#include <vector>

namespace sidx {

/// Tokens present in every child. Children are advanced with skipTo() towards
/// the largest current head until all agree.
class RangeIntersectionIterator : public RangeIterator {
public:
    class Builder : public RangeIterator::Builder {
    public:
        Builder() : RangeIterator::Builder(Type::INTERSECTION) {}

    protected:
        void updateStatistics(const RangeIterator& range) override;
        /// Children with disjoint token ranges cannot intersect: they are
        /// closed and an empty iterator is returned.
        RangeIteratorPtr buildIterator() override;
    };

    static RangeBuilderPtr builder() { return std::make_unique<Builder>(); }

    RangeIntersectionIterator(Token min, Token max, uint64_t count, std::vector<RangeIteratorPtr> ranges);

    void close() override;

protected:
    std::optional<Token> computeNext() override;
    void performSkipTo(Token target) override;

private:
    std::vector<RangeIteratorPtr> ranges_;
    bool closed_ = false;
};

} // namespace sidx
