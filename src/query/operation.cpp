#include "query/operation.h"
#include "utils/logger.h"

#include <algorithm>
#include <sstream>

namespace sidx {

namespace {

size_t countEligible(const ExpressionGroup& expressions) {
    ExpressionGroup distinct;
    for (const auto& e : expressions) {
        if (QueryController::isEligible(e) && std::find(distinct.begin(), distinct.end(), e) == distinct.end())
            distinct.push_back(e);
    }
    return distinct.size();
}

} // namespace

Operation::Operation(OperationType op, ExpressionGroup expressions,
                     std::unique_ptr<Operation> left, std::unique_ptr<Operation> right)
    : op_(op)
    , expressions_(std::move(expressions))
    , left_(std::move(left))
    , right_(std::move(right)) {}

RangeIteratorPtr Operation::build(QueryController& controller) const {
    RangeBuilderPtr builder;
    if (expressions_.empty()) {
        builder = QueryController::builderFor(op_);
    } else {
        builder = controller.plan(op_, expressions_);

        // AND: ein Ausdruck ohne Treffer leert die ganze Konjunktion
        if (op_ == OperationType::AND && builder->rangeCount() < countEligible(expressions_)) {
            SIDX_DEBUG("AND group {} has an expression without matches", toString());
            return nullptr;
        }
    }

    for (const auto* child : {left_.get(), right_.get()}) {
        if (!child)
            continue;

        auto range = child->build(controller);
        if (!range && op_ == OperationType::AND)
            return nullptr;
        builder->add(range);
    }

    return builder->build();
}

void Operation::release(QueryController& controller) const {
    if (!expressions_.empty())
        controller.release(expressions_);
    if (left_)
        left_->release(controller);
    if (right_)
        right_->release(controller);
}

std::string Operation::toString() const {
    std::ostringstream out;
    out << operationTypeToString(op_) << '(';

    bool first = true;
    for (const auto& e : expressions_) {
        if (!first)
            out << ", ";
        out << e.toString();
        first = false;
    }
    for (const auto* child : {left_.get(), right_.get()}) {
        if (!child)
            continue;
        if (!first)
            out << ", ";
        out << child->toString();
        first = false;
    }

    out << ')';
    return out.str();
}

} // namespace sidx
