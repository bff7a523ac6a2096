#pragma once

#include "index/column_type.h"
#include "index/memtable_index.h"
#include "index/view.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sidx {

/// Secondary index of one column: memtable plus the current on-disk view.
///
/// getView() is a lock-free read of the published snapshot. update() builds a
/// replacement snapshot and publishes it; concurrent updates are serialized,
/// running queries keep whatever snapshot they already hold.
class ColumnIndex {
public:
    ColumnIndex(std::string column, ColumnTypePtr type);
    ~ColumnIndex();

    ColumnIndex(const ColumnIndex&) = delete;
    ColumnIndex& operator=(const ColumnIndex&) = delete;

    const std::string& column() const { return column_; }
    const ColumnTypePtr& type() const { return type_; }

    ViewPtr getView() const;

    /// Replaces the view with (current + newSegments) - droppedFiles.
    /// Ownership of `newSegments` passes to the index; if the new view can't
    /// be built they are released, the old view stays and the error is rethrown.
    void update(const DataFileSet& droppedFiles, const std::vector<SegmentIndexPtr>& newSegments);

    void index(Token token, const std::string& value) { memtable_.index(token, value); }
    RangeIteratorPtr searchMemtable(const Expression& expression) const { return memtable_.search(expression); }
    size_t memtableSize() const { return memtable_.size(); }

private:
    const std::string column_;
    const ColumnTypePtr type_;
    MemtableIndex memtable_;

    std::mutex updateMutex_;
    std::shared_ptr<const View> view_;
};

} // namespace sidx
