#pragma once

#include "index/expression.h"
#include "index/range_iterator.h"
#include "index/segment_index.h"

#include <vector>

namespace sidx {

/// Rows matching one expression: the memtable result merged with the search
/// results of the candidate segments, ordered by token.
///
/// Segments that produced results stay referenced until close().
class TermIterator : public RangeIterator {
public:
    /// Null when neither the memtable nor any segment has a match.
    static RangeIteratorPtr build(const Expression& expression,
                                  const RangeIteratorPtr& memtableResult,
                                  const SegmentSet& segments);

    TermIterator(RangeIteratorPtr merged, std::vector<SegmentIndexPtr> referenced);
    ~TermIterator() override;

    void close() override;

    const std::vector<SegmentIndexPtr>& referencedSegments() const { return referenced_; }

protected:
    std::optional<Token> computeNext() override;
    void performSkipTo(Token target) override;

private:
    void releaseSegments();

    RangeIteratorPtr merged_;
    std::vector<SegmentIndexPtr> referenced_;
    bool closed_ = false;
};

} // namespace sidx
