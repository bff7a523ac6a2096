#include "storage/data_store.h"
#include "utils/logger.h"

#include <algorithm>
#include <exception>

namespace sidx {

DataStore::DataStore() : live_(std::make_shared<const std::vector<DataFilePtr>>()) {}

DataStore::~DataStore() {
    auto files = std::atomic_load(&live_);
    for (const auto& file : *files) {
        try {
            file->release();
        } catch (const std::exception& e) {
            SIDX_WARN("Failed to release store reference on {}: {}", file->toString(), e.what());
        }
    }
}

void DataStore::addFile(const DataFilePtr& file) {
    replaceFiles({}, {file});
}

void DataStore::replaceFiles(const std::vector<DataFilePtr>& removed, const std::vector<DataFilePtr>& added) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    auto current = std::atomic_load(&live_);
    auto next = std::make_shared<std::vector<DataFilePtr>>();
    next->reserve(current->size() + added.size());

    for (const auto& file : *current) {
        if (std::find(removed.begin(), removed.end(), file) == removed.end())
            next->push_back(file);
    }
    for (const auto& file : added) {
        if (std::find(next->begin(), next->end(), file) == next->end())
            next->push_back(file);
    }

    std::atomic_store(&live_, std::shared_ptr<const std::vector<DataFilePtr>>(std::move(next)));

    // Erst nach dem Publizieren freigeben: neue Queries sehen die Dateien nicht mehr
    for (const auto& file : removed) {
        if (std::find(current->begin(), current->end(), file) == current->end())
            continue;
        file->markCompacted();
        file->release();
    }

    SIDX_DEBUG("Store updated: -{} +{} files", removed.size(), added.size());
}

std::shared_ptr<const std::vector<DataFilePtr>> DataStore::liveFiles() const {
    return std::atomic_load(&live_);
}

DataFileSet DataStore::markReferenced(const std::optional<KeyRange>& range) const {
    if (!range || range->empty())
        return {};

    while (true) {
        auto files = std::atomic_load(&live_);

        DataFileSet referenced;
        bool failed = false;
        for (const auto& file : *files) {
            if (!file->intersects(*range))
                continue;
            if (!file->tryRef()) {
                failed = true;
                break;
            }
            referenced.insert(file);
        }

        if (!failed)
            return referenced;

        // Datei wurde zwischenzeitlich kompaktiert, mit neuem Stand wiederholen
        releaseReferences(referenced);
    }
}

void DataStore::releaseReferences(const DataFileSet& files) {
    for (const auto& file : files) {
        try {
            file->release();
        } catch (const std::exception& e) {
            SIDX_WARN("Failed to release reference on {}: {}", file->toString(), e.what());
        }
    }
}

} // namespace sidx
