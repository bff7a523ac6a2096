#pragma once

#include "index/range_iterator.h"

#include <vector>

namespace sidx {

/// Sorted, de-duplicated union of its children.
class RangeUnionIterator : public RangeIterator {
public:
    class Builder : public RangeIterator::Builder {
    public:
        Builder() : RangeIterator::Builder(Type::UNION) {}

    protected:
        void updateStatistics(const RangeIterator& range) override;
        RangeIteratorPtr buildIterator() override;
    };

    static RangeBuilderPtr builder() { return std::make_unique<Builder>(); }
    static RangeIteratorPtr build(const std::vector<RangeIteratorPtr>& ranges);

    RangeUnionIterator(Token min, Token max, uint64_t count, std::vector<RangeIteratorPtr> ranges);

    void close() override;

protected:
    std::optional<Token> computeNext() override;
    void performSkipTo(Token target) override;

private:
    std::vector<RangeIteratorPtr> ranges_;
    bool closed_ = false;
};

} // namespace sidx
