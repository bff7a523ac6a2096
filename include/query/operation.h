#pragma once

#include "index/expression.h"
#include "index/range_iterator.h"
#include "query/query_controller.h"

#include <memory>
#include <string>

namespace sidx {

/**
 * @brief Node of a boolean query tree
 *
 * Each node combines the expressions of its own group and the results of up
 * to two child nodes with AND or OR.
 */
class Operation {
public:
    Operation(OperationType op, ExpressionGroup expressions,
              std::unique_ptr<Operation> left = nullptr,
              std::unique_ptr<Operation> right = nullptr);

    /// Iterator over the rows of this subtree, null if nothing can match.
    RangeIteratorPtr build(QueryController& controller) const;

    /// Releases the groups this subtree planned.
    void release(QueryController& controller) const;

    OperationType op() const { return op_; }
    const ExpressionGroup& expressions() const { return expressions_; }
    const Operation* left() const { return left_.get(); }
    const Operation* right() const { return right_.get(); }

    std::string toString() const;

private:
    OperationType op_;
    ExpressionGroup expressions_;
    std::unique_ptr<Operation> left_;
    std::unique_ptr<Operation> right_;
};

} // namespace sidx
