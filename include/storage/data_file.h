#pragma once

#include "storage/key_range.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>

namespace sidx {

/// A stored data file of the base store.
///
/// The store holds the initial reference. Queries and index segments take
/// additional references with tryRef() so the file is not removed underneath
/// them; tryRef() fails once the count dropped to zero.
class DataFile {
public:
    DataFile(uint64_t generation, std::string path, Token minKey, Token maxKey);

    DataFile(const DataFile&) = delete;
    DataFile& operator=(const DataFile&) = delete;

    uint64_t generation() const { return generation_; }
    const std::string& path() const { return path_; }
    Token minKey() const { return minKey_; }
    Token maxKey() const { return maxKey_; }

    bool intersects(const KeyRange& range) const { return range.intersects(minKey_, maxKey_); }

    bool tryRef();
    /// Drops one reference. Throws std::logic_error when the file holds none.
    void release();
    int refCount() const { return refs_.load(std::memory_order_acquire); }

    /// Set by the store once compaction replaced this file.
    void markCompacted() { compacted_.store(true, std::memory_order_release); }
    bool isMarkedCompacted() const { return compacted_.load(std::memory_order_acquire); }

    std::string toString() const;

private:
    const uint64_t generation_;
    const std::string path_;
    const Token minKey_;
    const Token maxKey_;
    std::atomic<int> refs_{1};
    std::atomic<bool> compacted_{false};
};

using DataFilePtr = std::shared_ptr<DataFile>;
using DataFileSet = std::unordered_set<DataFilePtr>;

} // namespace sidx
