#include "storage/data_file.h"
#include "utils/logger.h"

#include <stdexcept>

namespace sidx {

DataFile::DataFile(uint64_t generation, std::string path, Token minKey, Token maxKey)
    : generation_(generation)
    , path_(std::move(path))
    , minKey_(minKey)
    , maxKey_(maxKey) {}

bool DataFile::tryRef() {
    int n = refs_.load(std::memory_order_acquire);
    while (n > 0) {
        if (refs_.compare_exchange_weak(n, n + 1, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

void DataFile::release() {
    int n = refs_.load(std::memory_order_acquire);
    while (true) {
        if (n <= 0)
            throw std::logic_error("release of unreferenced data file " + toString());
        if (refs_.compare_exchange_weak(n, n - 1, std::memory_order_acq_rel))
            break;
    }

    if (n == 1) {
        SIDX_DEBUG("Data file {} fully released{}", toString(), isMarkedCompacted() ? " (compacted)" : "");
    }
}

std::string DataFile::toString() const {
    return path_ + "#" + std::to_string(generation_);
}

} // namespace sidx
