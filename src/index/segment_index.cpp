#include "index/segment_index.h"
#include "utils/logger.h"

#include <exception>
#include <stdexcept>

namespace sidx {

SegmentIndex::SegmentIndex(DataFilePtr dataFile, std::unique_ptr<SegmentReader> reader,
                           Token minKey, Token maxKey, std::string minTerm, std::string maxTerm)
    : dataFile_(std::move(dataFile))
    , reader_(std::move(reader))
    , minKey_(minKey)
    , maxKey_(maxKey)
    , minTerm_(std::move(minTerm))
    , maxTerm_(std::move(maxTerm)) {
    if (!dataFile_ || !reader_)
        throw std::invalid_argument("segment requires a data file and a reader");
    if (!dataFile_->tryRef())
        throw std::invalid_argument("data file " + dataFile_->toString() + " is already released");
}

bool SegmentIndex::reference() {
    int n = refs_.load(std::memory_order_acquire);
    while (n > 0) {
        if (refs_.compare_exchange_weak(n, n + 1, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

void SegmentIndex::release() {
    int n = refs_.load(std::memory_order_acquire);
    while (true) {
        if (n <= 0)
            throw std::logic_error("release of unreferenced segment " + toString());
        if (refs_.compare_exchange_weak(n, n - 1, std::memory_order_acq_rel))
            break;
    }
    if (n != 1)
        return;

    try {
        reader_->close();
    } catch (const std::exception& e) {
        SIDX_WARN("Closing segment {} failed: {}", toString(), e.what());
    }
    try {
        dataFile_->release();
    } catch (const std::exception& e) {
        SIDX_WARN("Releasing data file of segment {} failed: {}", toString(), e.what());
    }
    SIDX_TRACE("Segment {} released", toString());
}

RangeIteratorPtr SegmentIndex::search(const Expression& expression) const {
    if (isReleased())
        throw std::logic_error("search on released segment " + toString());
    return reader_->search(expression);
}

std::string SegmentIndex::toString() const {
    return "segment(" + dataFile_->toString() + ", keys=[" + std::to_string(minKey_) + ", "
         + std::to_string(maxKey_) + "])";
}

} // namespace sidx
