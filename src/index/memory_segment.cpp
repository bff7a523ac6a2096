#include "index/memory_segment.h"

#include <stdexcept>

namespace sidx {

MemorySegmentReader::MemorySegmentReader(std::shared_ptr<const TermPostings> postings)
    : postings_(std::move(postings)) {}

RangeIteratorPtr MemorySegmentReader::search(const Expression& expression) {
    if (closed_)
        throw std::logic_error("search on closed segment reader");
    return postings_->search(expression);
}

SegmentIndexPtr MemorySegmentReader::open(const DataFilePtr& dataFile, std::shared_ptr<const TermPostings> postings) {
    if (!postings || postings->empty())
        throw std::invalid_argument("cannot open a segment without terms");

    Token minKey = *postings->minToken();
    Token maxKey = *postings->maxToken();
    std::string minTerm = *postings->minTerm();
    std::string maxTerm = *postings->maxTerm();
    return std::make_shared<SegmentIndex>(dataFile, std::make_unique<MemorySegmentReader>(std::move(postings)),
                                          minKey, maxKey, std::move(minTerm), std::move(maxTerm));
}

} // namespace sidx
