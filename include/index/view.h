#pragma once

#include "index/column_type.h"
#include "index/expression.h"
#include "index/interval_tree.h"
#include "index/segment_index.h"
#include "index/term_tree.h"
#include "storage/data_file.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sidx {

/// Thrown when a view's term and key structures disagree on their size.
class InconsistentViewException : public std::logic_error {
public:
    InconsistentViewException(size_t keyIntervals, size_t termIntervals)
        : std::logic_error("mismatched sizes for intervals tree for keys vs terms: "
                           + std::to_string(keyIntervals) + " != " + std::to_string(termIntervals))
        , keyIntervals_(keyIntervals)
        , termIntervals_(termIntervals) {}

    size_t keyIntervals() const { return keyIntervals_; }
    size_t termIntervals() const { return termIntervals_; }

private:
    size_t keyIntervals_;
    size_t termIntervals_;
};

/// Immutable snapshot of the on-disk segments of one column.
///
/// A new view is built from the previous one as
/// (current + added) - (dropped files + compacted files), one segment per data
/// file with the first occurrence winning. Every segment left out is released
/// exactly once, after the snapshot passed its consistency check. If the check
/// fails nothing is released and InconsistentViewException propagates.
/// Views are shared read-only between queries.
class View {
public:
    using KeyTree = IntervalTree<Token, SegmentIndexPtr>;

    View(const ColumnTypePtr& type, const std::vector<SegmentIndexPtr>& segments);

    View(const ColumnTypePtr& type,
         const std::vector<SegmentIndexPtr>& currentView,
         const DataFileSet& droppedFiles,
         const std::vector<SegmentIndexPtr>& newSegments,
         const TermTreeBuilderFactory& termTreeFactory = TermTree::builderFor);

    View(const View&) = delete;
    View& operator=(const View&) = delete;

    /// Term candidates for `expression`, restricted to data files in `scope`.
    SegmentSet match(const DataFileSet& scope, const Expression& expression) const;

    /// Segments whose key interval overlaps [minKey, maxKey], not scoped.
    std::vector<SegmentIndexPtr> match(Token minKey, Token maxKey) const;

    std::vector<SegmentIndexPtr> getIndexes() const;
    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }

    const ColumnTypePtr& type() const { return type_; }

    nlohmann::json toJson() const;

private:
    struct Selection {
        std::map<uint64_t, SegmentIndexPtr> kept;
        std::vector<SegmentIndexPtr> excluded;
    };

    View(const ColumnTypePtr& type, Selection selection, const TermTreeBuilderFactory& termTreeFactory);

    static Selection select(const std::vector<SegmentIndexPtr>& currentView,
                            const DataFileSet& droppedFiles,
                            const std::vector<SegmentIndexPtr>& newSegments);
    static std::unique_ptr<TermTree> buildTermTree(const ColumnTypePtr& type,
                                                   const std::map<uint64_t, SegmentIndexPtr>& segments,
                                                   const TermTreeBuilderFactory& factory);
    static KeyTree buildKeyTree(const std::map<uint64_t, SegmentIndexPtr>& segments);

    ColumnTypePtr type_;
    std::map<uint64_t, SegmentIndexPtr> segments_;
    std::unique_ptr<TermTree> termTree_;
    KeyTree keyIntervalTree_;
};

using ViewPtr = std::shared_ptr<const View>;

} // namespace sidx
