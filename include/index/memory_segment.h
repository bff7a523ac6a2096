#pragma once

#include "index/segment_index.h"
#include "index/term_postings.h"

#include <memory>

namespace sidx {

/// SegmentReader over postings held in memory.
class MemorySegmentReader : public SegmentReader {
public:
    explicit MemorySegmentReader(std::shared_ptr<const TermPostings> postings);

    RangeIteratorPtr search(const Expression& expression) override;
    void close() override { closed_ = true; }
    bool isClosed() const { return closed_; }

    /// Segment for `dataFile` whose key and term bounds come from the postings.
    /// Throws std::invalid_argument for empty postings.
    static SegmentIndexPtr open(const DataFilePtr& dataFile, std::shared_ptr<const TermPostings> postings);

private:
    std::shared_ptr<const TermPostings> postings_;
    bool closed_ = false;
};

} // namespace sidx
