#include "query/query_plan.h"
#include "utils/logger.h"

#include <stdexcept>

namespace sidx {

QueryPlan::QueryPlan(SecondaryIndexManager& backend, QueryFilter filter,
                     std::unique_ptr<Operation> root, query::QueryOptions options,
                     RowFilter postFilter)
    : backend_(backend)
    , filter_(std::move(filter))
    , root_(std::move(root))
    , options_(std::move(options))
    , postFilter_(std::move(postFilter)) {
    if (!root_)
        throw std::invalid_argument("query plan requires a root operation");
    if (options_.checkpoint_interval == 0)
        options_.checkpoint_interval = 1;
}

size_t QueryPlan::execute(const Consumer& consumer, QueryController::TimeSource now) const {
    QueryController controller(backend_, filter_, options_.time_quota, std::move(now));

    auto range = root_->build(controller);
    controller.checkpoint();

    size_t emitted = 0;
    size_t scanned = 0;

    if (range && filter_.keyRange && !filter_.keyRange->empty()) {
        const auto& keys = *filter_.keyRange;
        range->skipTo(keys.left);

        while (range->hasNext()) {
            Token token = range->next();
            if (token > keys.right)
                break;

            if (++scanned % options_.checkpoint_interval == 0)
                controller.checkpoint();

            if (token < keys.left || (postFilter_ && !postFilter_(token)))
                continue;

            ++emitted;
            if (!consumer(token))
                break;
            if (options_.result_limit > 0 && emitted >= options_.result_limit)
                break;
        }
    }

    SIDX_DEBUG("{} returned {} rows ({} scanned) in {} ms", root_->toString(), emitted, scanned,
               std::chrono::duration_cast<std::chrono::milliseconds>(controller.elapsed()).count());

    controller.finish();
    return emitted;
}

std::vector<Token> QueryPlan::execute(QueryController::TimeSource now) const {
    std::vector<Token> rows;
    execute([&rows](Token token) {
        rows.push_back(token);
        return true;
    }, std::move(now));
    return rows;
}

} // namespace sidx
