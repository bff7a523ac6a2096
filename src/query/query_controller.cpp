#include "query/query_controller.h"
#include "index/column_index.h"
#include "index/range_intersection_iterator.h"
#include "index/range_union_iterator.h"
#include "index/term_iterator.h"
#include "utils/logger.h"

#include <algorithm>
#include <exception>
#include <unordered_map>

namespace sidx {

const char* operationTypeToString(OperationType op) {
    switch (op) {
        case OperationType::AND: return "AND";
        case OperationType::OR: return "OR";
    }
    return "UNKNOWN";
}

QueryController::QueryController(SecondaryIndexManager& backend, const QueryFilter& filter,
                                 std::chrono::milliseconds timeQuota, TimeSource now)
    : backend_(backend)
    , now_(now ? std::move(now) : TimeSource(&Clock::now))
    , quota_(std::chrono::duration_cast<std::chrono::nanoseconds>(timeQuota))
    , start_(now_())
    , scope_(backend.getBaseStore().markReferenced(filter.keyRange)) {
    SIDX_DEBUG("Query session started: {} data files in scope, quota {} ms",
               scope_.size(), timeQuota.count());
}

QueryController::~QueryController() {
    try {
        finish();
    } catch (const std::exception& e) {
        SIDX_WARN("Finishing query session failed: {}", e.what());
    }
}

bool QueryController::isEligible(const Expression& e) {
    return e.isIndexed() && e.op() != Expression::Op::NOT_EQ;
}

RangeBuilderPtr QueryController::builderFor(OperationType op) {
    return op == OperationType::OR ? RangeUnionIterator::builder()
                                   : RangeIntersectionIterator::builder();
}

RangeBuilderPtr QueryController::plan(OperationType op, const ExpressionGroup& expressions) {
    if (finished_)
        throw std::logic_error("query session already finished");
    if (resources_.count(expressions) > 0)
        throw std::invalid_argument("Can't process the same expressions multiple times.");

    auto builder = builderFor(op);
    std::vector<RangeIteratorPtr> perGroup;

    try {
        for (const auto& [expression, segments] : candidates(op, expressions)) {
            auto memtable = expression.index()->searchMemtable(expression);
            auto term = TermIterator::build(expression, memtable, segments);
            if (!term)
                continue;

            perGroup.push_back(term);
            builder->add(term);
        }
    } catch (...) {
        closeQuietly(perGroup);
        throw;
    }

    SIDX_DEBUG("Planned {} group of {} expressions: {} iterators, ~{} tokens",
               operationTypeToString(op), expressions.size(), perGroup.size(),
               builder->getTokenCount());

    resources_.emplace(expressions, std::move(perGroup));
    return builder;
}

QueryController::CandidateList QueryController::candidates(OperationType op,
                                                           const ExpressionGroup& expressions) const {
    // Primärauswahl und Einengung lesen denselben Snapshot
    ViewCache views;

    std::optional<Candidate> primaryCandidate;
    if (op == OperationType::AND) {
        primaryCandidate = primary(expressions, views);
        if (primaryCandidate)
            SIDX_DEBUG("Primary expression {} matches {} segments",
                       primaryCandidate->first.toString(), primaryCandidate->second.size());
    }

    CandidateList result;
    std::vector<Expression> seen;

    for (const auto& e : expressions) {
        if (!isEligible(e))
            continue;
        if (std::find(seen.begin(), seen.end(), e) != seen.end())
            continue;
        seen.push_back(e);

        const auto& view = viewOf(views, e);

        if (!primaryCandidate || primaryCandidate->second.empty()) {
            result.emplace_back(e, view->match(scope_, e));
            continue;
        }
        if (primaryCandidate->first == e) {
            result.emplace_back(e, primaryCandidate->second);
            continue;
        }

        SegmentSet narrowed;
        for (const auto& p : primaryCandidate->second) {
            for (const auto& segment : view->match(p->minKey(), p->maxKey())) {
                if (scope_.count(segment->dataFile()) > 0)
                    narrowed.insert(segment);
            }
        }
        result.emplace_back(e, std::move(narrowed));
    }

    return result;
}

// static
const ViewPtr& QueryController::viewOf(ViewCache& views, const Expression& e) {
    auto it = views.find(e.column());
    if (it == views.end())
        it = views.emplace(e.column(), e.index()->getView()).first;
    return it->second;
}

std::optional<QueryController::Candidate> QueryController::primary(const ExpressionGroup& expressions) const {
    ViewCache views;
    return primary(expressions, views);
}

std::optional<QueryController::Candidate> QueryController::primary(const ExpressionGroup& expressions,
                                                                   ViewCache& views) const {
    std::optional<Candidate> best;

    for (const auto& e : expressions) {
        if (!isEligible(e))
            continue;

        const auto& view = viewOf(views, e);
        auto matched = view->match(scope_, e);
        if (!best || matched.size() < best->second.size())
            best = Candidate(e, std::move(matched));
    }

    return best;
}

nlohmann::json QueryController::describe(OperationType op, const ExpressionGroup& expressions) const {
    nlohmann::json out;
    out["operation"] = operationTypeToString(op);
    out["scope"] = scope_.size();

    if (op == OperationType::AND) {
        auto p = primary(expressions);
        out["primary"] = p ? nlohmann::json(p->first.toString()) : nlohmann::json(nullptr);
    }

    nlohmann::json list = nlohmann::json::array();
    for (const auto& [expression, segments] : candidates(op, expressions)) {
        nlohmann::json generations = nlohmann::json::array();
        for (const auto& s : segments)
            generations.push_back(s->generation());
        list.push_back({
            {"expression", expression.toString()},
            {"segments", generations}
        });
    }
    out["candidates"] = list;

    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& e : expressions) {
        if (!isEligible(e))
            skipped.push_back(e.toString());
    }
    out["post_filter"] = skipped;

    return out;
}

std::chrono::nanoseconds QueryController::elapsed() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now_() - start_);
}

void QueryController::checkpoint() const {
    auto used = elapsed();
    if (used >= quota_)
        throw TimeQuotaExceededException(used, quota_);
}

void QueryController::closeQuietly(const std::vector<RangeIteratorPtr>& iterators) {
    for (const auto& it : iterators) {
        try {
            it->close();
        } catch (const std::exception& e) {
            SIDX_WARN("Closing iterator failed: {}", e.what());
        } catch (...) {
            SIDX_WARN("Closing iterator failed with unknown error");
        }
    }
}

void QueryController::release(const ExpressionGroup& expressions) {
    auto it = resources_.find(expressions);
    if (it == resources_.end())
        return;

    auto iterators = std::move(it->second);
    resources_.erase(it);
    closeQuietly(iterators);
}

void QueryController::finish() {
    if (finished_)
        return;
    finished_ = true;

    try {
        while (!resources_.empty())
            release(resources_.begin()->first);
    } catch (...) {
        DataStore::releaseReferences(scope_);
        scope_.clear();
        throw;
    }

    DataStore::releaseReferences(scope_);
    scope_.clear();
    SIDX_DEBUG("Query session finished after {} ms",
               std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count());
}

} // namespace sidx
