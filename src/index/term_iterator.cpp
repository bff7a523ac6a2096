#include "index/term_iterator.h"
#include "index/range_union_iterator.h"
#include "utils/logger.h"

#include <exception>

namespace sidx {

RangeIteratorPtr TermIterator::build(const Expression& expression,
                                     const RangeIteratorPtr& memtableResult,
                                     const SegmentSet& segments) {
    std::vector<RangeIteratorPtr> ranges;
    std::vector<SegmentIndexPtr> referenced;

    try {
        for (const auto& segment : segments) {
            // bereits freigegeben (z. B. durch Kompaktierung) -> überspringen
            if (!segment->reference())
                continue;

            RangeIteratorPtr result;
            try {
                result = segment->search(expression);
            } catch (...) {
                segment->release();
                throw;
            }

            if (!result || result->getCount() == 0) {
                try {
                    if (result)
                        result->close();
                } catch (...) {
                    segment->release();
                    throw;
                }
                segment->release();
                continue;
            }
            ranges.push_back(result);
            referenced.push_back(segment);
        }
    } catch (...) {
        SIDX_WARN("Segment search for {} failed, releasing {} partial results",
                  expression.toString(), referenced.size());
        for (const auto& r : ranges) {
            try {
                r->close();
            } catch (const std::exception& closeError) {
                SIDX_WARN("Closing partial result failed: {}", closeError.what());
            }
        }
        for (const auto& s : referenced)
            s->release();
        throw;
    }

    if (memtableResult && memtableResult->getCount() > 0)
        ranges.push_back(memtableResult);

    if (ranges.empty())
        return nullptr;

    auto merged = RangeUnionIterator::build(ranges);
    return std::make_shared<TermIterator>(merged, std::move(referenced));
}

TermIterator::TermIterator(RangeIteratorPtr merged, std::vector<SegmentIndexPtr> referenced)
    : RangeIterator(merged->getMinimum(), merged->getMaximum(), merged->getCount())
    , merged_(std::move(merged))
    , referenced_(std::move(referenced)) {}

TermIterator::~TermIterator() {
    try {
        close();
    } catch (const std::exception& e) {
        SIDX_WARN("Closing term iterator failed: {}", e.what());
    }
}

std::optional<Token> TermIterator::computeNext() {
    if (closed_ || !merged_->hasNext())
        return std::nullopt;
    return merged_->next();
}

void TermIterator::performSkipTo(Token target) {
    if (!closed_)
        merged_->skipTo(target);
}

void TermIterator::close() {
    if (closed_)
        return;
    closed_ = true;

    try {
        merged_->close();
    } catch (...) {
        releaseSegments();
        throw;
    }
    releaseSegments();
}

void TermIterator::releaseSegments() {
    for (const auto& segment : referenced_) {
        try {
            segment->release();
        } catch (const std::exception& e) {
            SIDX_WARN("Releasing {} failed: {}", segment->toString(), e.what());
        }
    }
}

} // namespace sidx
