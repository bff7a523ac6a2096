#pragma once

#include "index/secondary_index.h"
#include "query/operation.h"
#include "query/query_controller.h"
#include "query/query_options.h"

#include <functional>
#include <memory>
#include <vector>

namespace sidx {

/**
 * @brief Executes an operation tree against the secondary indexes
 *
 * Every execute() call opens its own QueryController session and finishes it
 * before returning, also when an exception leaves the loop.
 */
class QueryPlan {
public:
    /// Row-level check for predicates the indexes cannot answer (NOT_EQ,
    /// unindexed columns). Returns false to drop the row.
    using RowFilter = std::function<bool(Token)>;
    /// Receives matching rows in token order. Returns false to stop early.
    using Consumer = std::function<bool(Token)>;

    QueryPlan(SecondaryIndexManager& backend, QueryFilter filter,
              std::unique_ptr<Operation> root, query::QueryOptions options = {},
              RowFilter postFilter = nullptr);

    /// @return number of rows handed to `consumer`
    /// @throws TimeQuotaExceededException
    size_t execute(const Consumer& consumer,
                   QueryController::TimeSource now = &QueryController::Clock::now) const;

    std::vector<Token> execute(QueryController::TimeSource now = &QueryController::Clock::now) const;

    const Operation& root() const { return *root_; }
    const query::QueryOptions& options() const { return options_; }

private:
    SecondaryIndexManager& backend_;
    QueryFilter filter_;
    std::unique_ptr<Operation> root_;
    query::QueryOptions options_;
    RowFilter postFilter_;
};

} // namespace sidx
