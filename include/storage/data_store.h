#pragma once

#include "storage/data_file.h"
#include "storage/key_range.h"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sidx {

/// Live file set of the base store.
///
/// The list is replaced wholesale on every change so readers never observe a
/// partially applied compaction. Writers are serialized by mutex_.
class DataStore {
public:
    DataStore();
    ~DataStore();

    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    void addFile(const DataFilePtr& file);

    /// Compaction result: `removed` leaves the live set (marked compacted, the
    /// store reference is dropped), `added` joins it.
    void replaceFiles(const std::vector<DataFilePtr>& removed, const std::vector<DataFilePtr>& added);

    std::shared_ptr<const std::vector<DataFilePtr>> liveFiles() const;

    /// References every live file overlapping `range`. An absent or empty
    /// range yields an empty set.
    DataFileSet markReferenced(const std::optional<KeyRange>& range) const;

    /// Drops one reference per file. Failures are logged and skipped.
    static void releaseReferences(const DataFileSet& files);

private:
    mutable std::mutex writeMutex_;
    std::shared_ptr<const std::vector<DataFilePtr>> live_;
};

} // namespace sidx
