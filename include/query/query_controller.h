#pragma once

#include "index/expression.h"
#include "index/range_iterator.h"
#include "index/secondary_index.h"
#include "index/segment_index.h"
#include "storage/data_file.h"
#include "storage/key_range.h"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace sidx {

enum class OperationType { AND, OR };

const char* operationTypeToString(OperationType op);

/**
 * @brief Thrown by QueryController::checkpoint() once the time quota is used up
 */
class TimeQuotaExceededException : public std::runtime_error {
public:
    TimeQuotaExceededException(std::chrono::nanoseconds elapsed, std::chrono::nanoseconds quota)
        : std::runtime_error("query exceeded its time quota ("
                             + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count())
                             + " ms >= " + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(quota).count())
                             + " ms)")
        , elapsed_(elapsed)
        , quota_(quota) {}

    std::chrono::nanoseconds elapsed() const { return elapsed_; }
    std::chrono::nanoseconds quota() const { return quota_; }

private:
    std::chrono::nanoseconds elapsed_;
    std::chrono::nanoseconds quota_;
};

struct QueryFilter {
    /// Token range of the query; nullopt if it could not be resolved.
    std::optional<KeyRange> keyRange = KeyRange::full();
};

/// Planning session of one query.
///
/// - pins the data files overlapping the query range once, at construction
/// - plan() turns an expression group into a merge builder and records the
///   opened iterators under that group
/// - checkpoint() is the cooperative cancellation point; callers invoke it
///   between batches, nothing is interrupted otherwise
/// - finish() closes what is still open and then releases the pinned files,
///   exactly once; the destructor does it for sessions nobody finished
///
/// One session is used by one thread at a time.
class QueryController {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using Candidate = std::pair<Expression, SegmentSet>;
    using CandidateList = std::vector<Candidate>;

    QueryController(SecondaryIndexManager& backend, const QueryFilter& filter,
                    std::chrono::milliseconds timeQuota, TimeSource now = &Clock::now);
    ~QueryController();

    QueryController(const QueryController&) = delete;
    QueryController& operator=(const QueryController&) = delete;

    std::shared_ptr<ColumnIndex> getIndex(std::string_view column) const { return backend_.getIndex(column); }
    std::optional<ColumnRef> getColumn(std::string_view column) const { return backend_.column(column); }

    /**
     * Build a merge builder (union for OR, intersection for AND) over the
     * per-expression iterators of `expressions`. Expressions without any
     * result contribute nothing. The iterators stay registered under
     * `expressions` until release() or finish().
     *
     * @throws std::invalid_argument if the same group was already planned
     * @throws std::logic_error after finish()
     */
    RangeBuilderPtr plan(OperationType op, const ExpressionGroup& expressions);

    /// Segment candidates per eligible expression, in group order. For AND the
    /// most selective expression bounds the key range searched for the others.
    CandidateList candidates(OperationType op, const ExpressionGroup& expressions) const;

    /// Eligible expression with the fewest directly matched segments.
    std::optional<Candidate> primary(const ExpressionGroup& expressions) const;

    nlohmann::json describe(OperationType op, const ExpressionGroup& expressions) const;

    /// @throws TimeQuotaExceededException once elapsed() >= quota
    void checkpoint() const;
    std::chrono::nanoseconds elapsed() const;
    std::chrono::nanoseconds quota() const { return quota_; }

    void release(const ExpressionGroup& expressions);
    void finish();

    bool isFinished() const { return finished_; }
    const DataFileSet& scope() const { return scope_; }
    size_t openGroups() const { return resources_.size(); }

    static RangeBuilderPtr builderFor(OperationType op);

    /// Indexed and not NOT_EQ; everything else is left to the row filter.
    static bool isEligible(const Expression& e);

private:
    /// Ein Snapshot pro Spalte für die gesamte Planung.
    using ViewCache = std::unordered_map<std::string, ViewPtr>;

    std::optional<Candidate> primary(const ExpressionGroup& expressions, ViewCache& views) const;
    static const ViewPtr& viewOf(ViewCache& views, const Expression& e);
    static void closeQuietly(const std::vector<RangeIteratorPtr>& iterators);

    SecondaryIndexManager& backend_;
    TimeSource now_;
    const std::chrono::nanoseconds quota_;
    const Clock::time_point start_;
    DataFileSet scope_;
    std::map<ExpressionGroup, std::vector<RangeIteratorPtr>> resources_;
    bool finished_ = false;
};

} // namespace sidx
