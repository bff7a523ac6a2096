#pragma once

#include "index/column_index.h"
#include "index/column_type.h"
#include "index/expression.h"
#include "storage/data_store.h"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sidx {

/// SecondaryIndexManager
/// - Spalten-Schema (Name -> ColumnType) der Basistabelle
/// - ein ColumnIndex pro indizierter Spalte (Memtable + View der Segmente)
/// - Zugriff auf den Basis-DataStore für den Query-Scope
/// - Keine Exceptions im API: Status-Objekt mit klaren Fehlermeldungen
class SecondaryIndexManager {
public:
    struct Status {
        bool ok = true;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, std::move(msg)}; }
    };

    explicit SecondaryIndexManager(DataStore& store);

    // Schema
    Status registerColumn(std::string_view column, ColumnTypePtr type);
    ColumnTypePtr getColumnType(std::string_view column) const;

    // Index-Lifecycle
    Status createIndex(std::string_view column);
    Status createIndex(std::string_view column, ColumnTypePtr type);
    Status dropIndex(std::string_view column);
    bool hasIndex(std::string_view column) const;
    std::shared_ptr<ColumnIndex> getIndex(std::string_view column) const;
    std::vector<std::string> indexedColumns() const;

    /// Metadata for building expressions; nullopt for unknown columns.
    std::optional<ColumnRef> column(std::string_view column) const;

    // Datenpflege (Memtable)
    Status index(Token token, std::string_view column, const std::string& value);

    /// Publishes new segments for `column` and drops the segments of
    /// `droppedFiles`. Ownership of `segments` passes to the manager in every
    /// case; rejected segments are released.
    Status attachSegments(std::string_view column, const DataFileSet& droppedFiles,
                          const std::vector<SegmentIndexPtr>& segments);

    DataStore& getBaseStore() const { return store_; }

private:
    static void releaseQuietly(const std::vector<SegmentIndexPtr>& segments);

    DataStore& store_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, ColumnTypePtr, std::less<>> schema_;
    std::map<std::string, std::shared_ptr<ColumnIndex>, std::less<>> indexes_;
};

} // namespace sidx
