#pragma once

#include "index/column_type.h"
#include "index/expression.h"
#include "index/interval_tree.h"
#include "index/segment_index.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sidx {

/// Maps a predicate to the segments whose [minTerm, maxTerm] could hold a
/// match. Results are candidates, never a guarantee.
class TermTree {
public:
    virtual ~TermTree() = default;

    virtual SegmentSet search(const Expression& expression) const = 0;
    virtual size_t intervalCount() const = 0;

    class Builder {
    public:
        explicit Builder(ColumnTypePtr type) : type_(std::move(type)) {}
        virtual ~Builder() = default;

        Builder& add(const SegmentIndexPtr& segment);
        virtual std::unique_ptr<TermTree> build() = 0;

    protected:
        virtual void addSegment(const SegmentIndexPtr& segment) = 0;

        ColumnTypePtr type_;
        std::optional<std::string> min_;
        std::optional<std::string> max_;
    };

    /// Prefix variant for textual columns, range variant otherwise.
    static std::unique_ptr<Builder> builderFor(const ColumnTypePtr& type);
};

using TermTreeBuilderFactory = std::function<std::unique_ptr<TermTree::Builder>(const ColumnTypePtr&)>;

/// Interval tree over each segment's term range; serves EQ and RANGE.
class RangeTermTree : public TermTree {
public:
    using Tree = IntervalTree<std::string, SegmentIndexPtr, ValueLess>;

    RangeTermTree(ColumnTypePtr type, std::optional<std::string> min, std::optional<std::string> max, Tree tree);

    SegmentSet search(const Expression& expression) const override;
    size_t intervalCount() const override { return tree_.intervalCount(); }

    class Builder : public TermTree::Builder {
    public:
        explicit Builder(ColumnTypePtr type) : TermTree::Builder(std::move(type)) {}
        std::unique_ptr<TermTree> build() override;

    protected:
        void addSegment(const SegmentIndexPtr& segment) override;

        std::vector<Tree::Interval> intervals_;
    };

protected:
    SegmentSet searchInterval(const std::string& min, const std::string& max) const;
    SegmentSet all() const;

    ColumnTypePtr type_;
    std::optional<std::string> min_;
    std::optional<std::string> max_;
    Tree tree_;
};

/// Textual columns: prefix predicates become the term interval
/// [prefix, successor(prefix)]. Substring predicates cannot be narrowed by a
/// term range and return every segment.
class PrefixTermTree : public RangeTermTree {
public:
    using RangeTermTree::RangeTermTree;

    SegmentSet search(const Expression& expression) const override;

    class Builder : public RangeTermTree::Builder {
    public:
        using RangeTermTree::Builder::Builder;
        std::unique_ptr<TermTree> build() override;
    };

    /// Smallest byte string greater than every string starting with `prefix`;
    /// nullopt when no such string exists (empty or all 0xFF).
    static std::optional<std::string> successor(const std::string& prefix);
};

} // namespace sidx
