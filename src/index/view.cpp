#include "index/view.h"
#include "utils/logger.h"

#include <exception>

namespace sidx {

View::View(const ColumnTypePtr& type, const std::vector<SegmentIndexPtr>& segments)
    : View(type, {}, {}, segments) {}

View::View(const ColumnTypePtr& type,
           const std::vector<SegmentIndexPtr>& currentView,
           const DataFileSet& droppedFiles,
           const std::vector<SegmentIndexPtr>& newSegments,
           const TermTreeBuilderFactory& termTreeFactory)
    : View(type, select(currentView, droppedFiles, newSegments), termTreeFactory) {}

View::View(const ColumnTypePtr& type, Selection selection, const TermTreeBuilderFactory& termTreeFactory)
    : type_(type)
    , segments_(std::move(selection.kept))
    , termTree_(buildTermTree(type_, segments_, termTreeFactory))
    , keyIntervalTree_(buildKeyTree(segments_)) {
    if (keyIntervalTree_.intervalCount() != termTree_->intervalCount()) {
        SIDX_ERROR("Refusing inconsistent view: {} key intervals vs {} term intervals",
                   keyIntervalTree_.intervalCount(), termTree_->intervalCount());
        throw InconsistentViewException(keyIntervalTree_.intervalCount(), termTree_->intervalCount());
    }

    for (const auto& segment : selection.excluded) {
        try {
            segment->release();
        } catch (const std::exception& e) {
            SIDX_WARN("Releasing excluded {} failed: {}", segment->toString(), e.what());
        }
    }

    if (!selection.excluded.empty()) {
        SIDX_DEBUG("View built with {} segments, {} released", segments_.size(), selection.excluded.size());
    }
}

View::Selection View::select(const std::vector<SegmentIndexPtr>& currentView,
                             const DataFileSet& droppedFiles,
                             const std::vector<SegmentIndexPtr>& newSegments) {
    Selection selection;

    auto consider = [&](const SegmentIndexPtr& segment) {
        const auto& file = segment->dataFile();
        if (droppedFiles.count(file) > 0
            || file->isMarkedCompacted()
            || selection.kept.count(file->generation()) > 0) {
            selection.excluded.push_back(segment);
            return;
        }
        selection.kept.emplace(file->generation(), segment);
    };

    for (const auto& segment : currentView)
        consider(segment);
    for (const auto& segment : newSegments)
        consider(segment);

    return selection;
}

std::unique_ptr<TermTree> View::buildTermTree(const ColumnTypePtr& type,
                                              const std::map<uint64_t, SegmentIndexPtr>& segments,
                                              const TermTreeBuilderFactory& factory) {
    auto builder = factory(type);
    for (const auto& entry : segments)
        builder->add(entry.second);
    return builder->build();
}

View::KeyTree View::buildKeyTree(const std::map<uint64_t, SegmentIndexPtr>& segments) {
    std::vector<KeyTree::Interval> intervals;
    intervals.reserve(segments.size());
    for (const auto& entry : segments)
        intervals.push_back(KeyTree::Interval{entry.second->minKey(), entry.second->maxKey(), entry.second});
    return KeyTree(std::move(intervals));
}

SegmentSet View::match(const DataFileSet& scope, const Expression& expression) const {
    SegmentSet matched;
    for (const auto& segment : termTree_->search(expression)) {
        if (scope.count(segment->dataFile()) > 0)
            matched.insert(segment);
    }
    return matched;
}

std::vector<SegmentIndexPtr> View::match(Token minKey, Token maxKey) const {
    return keyIntervalTree_.search(minKey, maxKey);
}

std::vector<SegmentIndexPtr> View::getIndexes() const {
    std::vector<SegmentIndexPtr> out;
    out.reserve(segments_.size());
    for (const auto& entry : segments_)
        out.push_back(entry.second);
    return out;
}

nlohmann::json View::toJson() const {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& entry : segments_) {
        const auto& s = entry.second;
        segments.push_back({
            {"generation", s->generation()},
            {"path", s->dataFile()->path()},
            {"min_key", s->minKey()},
            {"max_key", s->maxKey()},
            {"min_term", type_->toString(s->minTerm())},
            {"max_term", type_->toString(s->maxTerm())},
            {"refs", s->refCount()}
        });
    }
    return {
        {"type", type_->name()},
        {"segment_count", segments_.size()},
        {"segments", segments}
    };
}

} // namespace sidx
