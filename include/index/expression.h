#pragma once

#include "index/column_type.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sidx {

class ColumnIndex;

/// Column metadata as handed out by the index manager. `index` is empty for
/// columns without a secondary index.
struct ColumnRef {
    std::string name;
    ColumnTypePtr type;
    std::shared_ptr<ColumnIndex> index;
};

/// Immutable predicate over one column.
///
/// Equality, ordering and hashing only look at column, operator and bounds,
/// so two separately built expressions for the same predicate are
/// interchangeable as map keys.
class Expression {
public:
    enum class Op { EQ, NOT_EQ, RANGE, PREFIX, CONTAINS };

    struct Bound {
        std::string value;
        bool inclusive = true;

        bool operator==(const Bound& o) const { return value == o.value && inclusive == o.inclusive; }
        bool operator<(const Bound& o) const {
            return value != o.value ? value < o.value : (inclusive < o.inclusive);
        }
    };

    static Expression eq(const ColumnRef& column, std::string value);
    static Expression notEq(const ColumnRef& column, std::string value);
    static Expression lessThan(const ColumnRef& column, std::string value, bool inclusive = false);
    static Expression greaterThan(const ColumnRef& column, std::string value, bool inclusive = false);
    static Expression between(const ColumnRef& column, Bound lower, Bound upper);
    // Nur für textuelle Spalten; sonst std::invalid_argument
    static Expression prefix(const ColumnRef& column, std::string value);
    static Expression contains(const ColumnRef& column, std::string value);

    const std::string& column() const { return column_; }
    Op op() const { return op_; }
    const std::optional<Bound>& lower() const { return lower_; }
    const std::optional<Bound>& upper() const { return upper_; }
    const ColumnTypePtr& type() const { return type_; }
    const std::shared_ptr<ColumnIndex>& index() const { return index_; }
    bool isIndexed() const { return index_ != nullptr; }

    bool isSatisfiedBy(std::string_view value) const;

    std::string toString() const;
    static const char* opToString(Op op);

    bool operator==(const Expression& o) const;
    bool operator!=(const Expression& o) const { return !(*this == o); }
    bool operator<(const Expression& o) const;

private:
    Expression(const ColumnRef& column, Op op, std::optional<Bound> lower, std::optional<Bound> upper);

    std::string column_;
    Op op_;
    std::optional<Bound> lower_;
    std::optional<Bound> upper_;
    ColumnTypePtr type_;
    std::shared_ptr<ColumnIndex> index_;
};

struct ExpressionHash {
    size_t operator()(const Expression& e) const;
};

/// Expressions combined by one AND/OR operator at one planning step.
using ExpressionGroup = std::vector<Expression>;

} // namespace sidx
