#include "index/column_index.h"
#include "utils/logger.h"

#include <exception>

namespace sidx {

ColumnIndex::ColumnIndex(std::string column, ColumnTypePtr type)
    : column_(std::move(column))
    , type_(std::move(type))
    , memtable_(type_)
    , view_(std::make_shared<const View>(type_, std::vector<SegmentIndexPtr>{})) {}

ColumnIndex::~ColumnIndex() {
    auto view = std::atomic_load(&view_);
    for (const auto& segment : view->getIndexes()) {
        try {
            segment->release();
        } catch (const std::exception& e) {
            SIDX_WARN("Index '{}': releasing {} failed: {}", column_, segment->toString(), e.what());
        }
    }
}

ViewPtr ColumnIndex::getView() const {
    return std::atomic_load(&view_);
}

void ColumnIndex::update(const DataFileSet& droppedFiles, const std::vector<SegmentIndexPtr>& newSegments) {
    std::lock_guard<std::mutex> lock(updateMutex_);

    auto current = std::atomic_load(&view_);
    std::shared_ptr<const View> next;
    try {
        next = std::make_shared<const View>(type_, current->getIndexes(), droppedFiles, newSegments);
    } catch (...) {
        for (const auto& segment : newSegments) {
            try {
                segment->release();
            } catch (const std::exception& e) {
                SIDX_WARN("Index '{}': releasing rejected {} failed: {}", column_, segment->toString(), e.what());
            }
        }
        throw;
    }

    std::atomic_store(&view_, next);
    SIDX_DEBUG("Index '{}': view {} -> {} segments (+{}, dropped files {})",
               column_, current->size(), next->size(), newSegments.size(), droppedFiles.size());
}

} // namespace sidx
