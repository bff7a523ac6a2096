#include "index/expression.h"

#include <functional>
#include <stdexcept>
#include <tuple>

namespace sidx {

Expression::Expression(const ColumnRef& column, Op op, std::optional<Bound> lower, std::optional<Bound> upper)
    : column_(column.name)
    , op_(op)
    , lower_(std::move(lower))
    , upper_(std::move(upper))
    , type_(column.type)
    , index_(column.index) {
    if (!type_)
        throw std::invalid_argument("column '" + column_ + "' has no type");
}

Expression Expression::eq(const ColumnRef& column, std::string value) {
    Bound b{std::move(value), true};
    return Expression(column, Op::EQ, b, b);
}

Expression Expression::notEq(const ColumnRef& column, std::string value) {
    Bound b{std::move(value), true};
    return Expression(column, Op::NOT_EQ, b, b);
}

Expression Expression::lessThan(const ColumnRef& column, std::string value, bool inclusive) {
    return Expression(column, Op::RANGE, std::nullopt, Bound{std::move(value), inclusive});
}

Expression Expression::greaterThan(const ColumnRef& column, std::string value, bool inclusive) {
    return Expression(column, Op::RANGE, Bound{std::move(value), inclusive}, std::nullopt);
}

Expression Expression::between(const ColumnRef& column, Bound lower, Bound upper) {
    return Expression(column, Op::RANGE, std::move(lower), std::move(upper));
}

Expression Expression::prefix(const ColumnRef& column, std::string value) {
    if (!column.type || !column.type->isTextual())
        throw std::invalid_argument("prefix predicate requires a textual column: " + column.name);
    Bound b{std::move(value), true};
    return Expression(column, Op::PREFIX, b, std::nullopt);
}

Expression Expression::contains(const ColumnRef& column, std::string value) {
    if (!column.type || !column.type->isTextual())
        throw std::invalid_argument("contains predicate requires a textual column: " + column.name);
    Bound b{std::move(value), true};
    return Expression(column, Op::CONTAINS, b, std::nullopt);
}

bool Expression::isSatisfiedBy(std::string_view value) const {
    switch (op_) {
        case Op::EQ:
            return type_->compare(value, lower_->value) == 0;
        case Op::NOT_EQ:
            return type_->compare(value, lower_->value) != 0;
        case Op::PREFIX:
            return value.substr(0, lower_->value.size()) == lower_->value;
        case Op::CONTAINS:
            return value.find(lower_->value) != std::string_view::npos;
        case Op::RANGE:
            break;
    }

    if (lower_) {
        int cmp = type_->compare(value, lower_->value);
        if (cmp < 0 || (cmp == 0 && !lower_->inclusive))
            return false;
    }
    if (upper_) {
        int cmp = type_->compare(value, upper_->value);
        if (cmp > 0 || (cmp == 0 && !upper_->inclusive))
            return false;
    }
    return true;
}

const char* Expression::opToString(Op op) {
    switch (op) {
        case Op::EQ: return "EQ";
        case Op::NOT_EQ: return "NOT_EQ";
        case Op::RANGE: return "RANGE";
        case Op::PREFIX: return "PREFIX";
        case Op::CONTAINS: return "CONTAINS";
    }
    return "UNKNOWN";
}

std::string Expression::toString() const {
    std::string s = column_ + " " + opToString(op_);
    switch (op_) {
        case Op::EQ:
        case Op::NOT_EQ:
        case Op::PREFIX:
        case Op::CONTAINS:
            return s + " '" + type_->toString(lower_->value) + "'";
        case Op::RANGE:
            break;
    }
    s += lower_ ? (lower_->inclusive ? " [" : " (") + type_->toString(lower_->value) : std::string(" (-inf");
    s += ", ";
    s += upper_ ? type_->toString(upper_->value) + (upper_->inclusive ? "]" : ")") : std::string("+inf)");
    return s;
}

bool Expression::operator==(const Expression& o) const {
    return column_ == o.column_ && op_ == o.op_ && lower_ == o.lower_ && upper_ == o.upper_;
}

bool Expression::operator<(const Expression& o) const {
    return std::tie(column_, op_, lower_, upper_) < std::tie(o.column_, o.op_, o.lower_, o.upper_);
}

size_t ExpressionHash::operator()(const Expression& e) const {
    std::hash<std::string> hs;
    size_t h = hs(e.column());
    auto mix = [&h](size_t v) { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
    mix(static_cast<size_t>(e.op()));
    if (e.lower()) { mix(hs(e.lower()->value)); mix(e.lower()->inclusive ? 1 : 2); }
    if (e.upper()) { mix(hs(e.upper()->value)); mix(e.upper()->inclusive ? 3 : 4); }
    return h;
}

} // namespace sidx
