#pragma once

#include "index/expression.h"
#include "index/range_iterator.h"
#include "storage/data_file.h"

#include <atomic>
#include <memory>
#include <set>
#include <string>

namespace sidx {

/// Access to the persisted terms of one segment. The physical format lives
/// behind this interface.
class SegmentReader {
public:
    virtual ~SegmentReader() = default;

    /// Null when the segment holds no match.
    virtual RangeIteratorPtr search(const Expression& expression) = 0;
    virtual void close() = 0;
};

/// Reference-counted handle on the index segment of one data file.
///
/// Starts with one reference, owned by whoever built it (normally the view).
/// The final release() closes the reader and drops the segment's reference
/// on its data file. reference() fails once that happened.
class SegmentIndex {
public:
    /// Takes a reference on `dataFile`; throws std::invalid_argument when the
    /// file is already gone.
    SegmentIndex(DataFilePtr dataFile, std::unique_ptr<SegmentReader> reader,
                 Token minKey, Token maxKey, std::string minTerm, std::string maxTerm);
    ~SegmentIndex() = default;

    SegmentIndex(const SegmentIndex&) = delete;
    SegmentIndex& operator=(const SegmentIndex&) = delete;

    const DataFilePtr& dataFile() const { return dataFile_; }
    uint64_t generation() const { return dataFile_->generation(); }
    Token minKey() const { return minKey_; }
    Token maxKey() const { return maxKey_; }
    const std::string& minTerm() const { return minTerm_; }
    const std::string& maxTerm() const { return maxTerm_; }

    bool reference();
    void release();
    int refCount() const { return refs_.load(std::memory_order_acquire); }
    bool isReleased() const { return refCount() <= 0; }

    /// Requires a held reference.
    RangeIteratorPtr search(const Expression& expression) const;

    std::string toString() const;

private:
    DataFilePtr dataFile_;
    std::unique_ptr<SegmentReader> reader_;
    const Token minKey_;
    const Token maxKey_;
    const std::string minTerm_;
    const std::string maxTerm_;
    std::atomic<int> refs_{1};
};

using SegmentIndexPtr = std::shared_ptr<SegmentIndex>;

struct SegmentIndexLess {
    bool operator()(const SegmentIndexPtr& a, const SegmentIndexPtr& b) const {
        return a->generation() < b->generation();
    }
};

/// Candidate segments ordered by data file generation.
using SegmentSet = std::set<SegmentIndexPtr, SegmentIndexLess>;

} // namespace sidx
