#pragma once

#include "index/term_postings.h"

#include <shared_mutex>

namespace sidx {

/// Not yet flushed index entries of one column. Safe for concurrent use.
class MemtableIndex {
public:
    explicit MemtableIndex(ColumnTypePtr type) : postings_(std::move(type)) {}

    void index(Token token, const std::string& value);

    /// Null when nothing matches. The returned iterator is a private copy.
    RangeIteratorPtr search(const Expression& expression) const;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    TermPostings postings_;
};

} // namespace sidx
