#include "index/memtable_index.h"

#include <mutex>

namespace sidx {

void MemtableIndex::index(Token token, const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    postings_.add(value, token);
}

RangeIteratorPtr MemtableIndex::search(const Expression& expression) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return postings_.search(expression);
}

size_t MemtableIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return postings_.tokenCount();
}

} // namespace sidx
