// Secondary index manager implementation

#include "index/secondary_index.h"
#include "utils/logger.h"

#include <exception>
#include <mutex>

namespace sidx {

SecondaryIndexManager::SecondaryIndexManager(DataStore& store) : store_(store) {}

SecondaryIndexManager::Status SecondaryIndexManager::registerColumn(std::string_view column, ColumnTypePtr type) {
	if (column.empty())
		return Status::Error("registerColumn: empty column name");
	if (!type)
		return Status::Error("registerColumn: no type for column " + std::string(column));

	std::unique_lock<std::shared_mutex> lock(mutex_);
	auto it = schema_.find(column);
	if (it != schema_.end()) {
		if (it->second->name() != type->name())
			return Status::Error("registerColumn: column " + std::string(column) + " already registered as " + it->second->name());
		return Status::OK();
	}
	schema_.emplace(std::string(column), std::move(type));
	return Status::OK();
}

ColumnTypePtr SecondaryIndexManager::getColumnType(std::string_view column) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	auto it = schema_.find(column);
	return it == schema_.end() ? nullptr : it->second;
}

SecondaryIndexManager::Status SecondaryIndexManager::createIndex(std::string_view column) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	auto type = schema_.find(column);
	if (type == schema_.end())
		return Status::Error("createIndex: unknown column " + std::string(column));
	if (indexes_.find(column) != indexes_.end())
		return Status::Error("createIndex: index on " + std::string(column) + " already exists");

	indexes_.emplace(std::string(column), std::make_shared<ColumnIndex>(std::string(column), type->second));
	SIDX_INFO("Created secondary index on '{}' ({})", column, type->second->name());
	return Status::OK();
}

SecondaryIndexManager::Status SecondaryIndexManager::createIndex(std::string_view column, ColumnTypePtr type) {
	auto st = registerColumn(column, std::move(type));
	if (!st.ok) return st;
	return createIndex(column);
}

SecondaryIndexManager::Status SecondaryIndexManager::dropIndex(std::string_view column) {
	std::shared_ptr<ColumnIndex> dropped;
	{
		std::unique_lock<std::shared_mutex> lock(mutex_);
		auto it = indexes_.find(column);
		if (it == indexes_.end())
			return Status::Error("dropIndex: no index on " + std::string(column));
		dropped = std::move(it->second);
		indexes_.erase(it);
	}
	// Segmente werden freigegeben, sobald keine Query den Index mehr hält
	SIDX_INFO("Dropped secondary index on '{}'", column);
	return Status::OK();
}

bool SecondaryIndexManager::hasIndex(std::string_view column) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return indexes_.find(column) != indexes_.end();
}

std::shared_ptr<ColumnIndex> SecondaryIndexManager::getIndex(std::string_view column) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	auto it = indexes_.find(column);
	return it == indexes_.end() ? nullptr : it->second;
}

std::vector<std::string> SecondaryIndexManager::indexedColumns() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	std::vector<std::string> out;
	out.reserve(indexes_.size());
	for (const auto& entry : indexes_)
		out.push_back(entry.first);
	return out;
}

std::optional<ColumnRef> SecondaryIndexManager::column(std::string_view column) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	auto type = schema_.find(column);
	if (type == schema_.end())
		return std::nullopt;
	auto idx = indexes_.find(column);
	return ColumnRef{std::string(column), type->second, idx == indexes_.end() ? nullptr : idx->second};
}

SecondaryIndexManager::Status SecondaryIndexManager::index(Token token, std::string_view column, const std::string& value) {
	auto idx = getIndex(column);
	if (!idx)
		return Status::Error("index: no index on " + std::string(column));
	idx->index(token, value);
	return Status::OK();
}

SecondaryIndexManager::Status SecondaryIndexManager::attachSegments(std::string_view column,
                                                                    const DataFileSet& droppedFiles,
                                                                    const std::vector<SegmentIndexPtr>& segments) {
	auto idx = getIndex(column);
	if (!idx) {
		releaseQuietly(segments);
		return Status::Error("attachSegments: no index on " + std::string(column));
	}

	try {
		idx->update(droppedFiles, segments);
	} catch (const InconsistentViewException& e) {
		return Status::Error(std::string("attachSegments: ") + e.what());
	} catch (const std::exception& e) {
		// Segmente wurden bereits von update() freigegeben
		SIDX_ERROR("attachSegments on {} failed: {}", std::string(column), e.what());
		return Status::Error(std::string("attachSegments: ") + e.what());
	}
	return Status::OK();
}

// static
void SecondaryIndexManager::releaseQuietly(const std::vector<SegmentIndexPtr>& segments) {
	for (const auto& segment : segments) {
		try {
			segment->release();
		} catch (const std::exception& e) {
			SIDX_WARN("Releasing {} failed: {}", segment->toString(), e.what());
		}
	}
}

} // namespace sidx
