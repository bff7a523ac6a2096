#pragma once

#include "index/column_type.h"
#include "index/expression.h"
#include "index/range_iterator.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sidx {

/// Term -> sorted token list, ordered by the column comparator.
class TermPostings {
public:
    explicit TermPostings(ColumnTypePtr type);

    void add(const std::string& term, Token token);

    /// Tokens of every term the expression accepts; null when none match.
    RangeIteratorPtr search(const Expression& expression) const;

    bool empty() const { return terms_.empty(); }
    size_t termCount() const { return terms_.size(); }
    size_t tokenCount() const { return tokenCount_; }

    std::optional<std::string> minTerm() const;
    std::optional<std::string> maxTerm() const;
    std::optional<Token> minToken() const { return minToken_; }
    std::optional<Token> maxToken() const { return maxToken_; }

    const ColumnTypePtr& type() const { return type_; }

private:
    using TermMap = std::map<std::string, std::vector<Token>, ValueLess>;

    void collect(TermMap::const_iterator from, TermMap::const_iterator to,
                 const Expression& expression, std::vector<Token>& out) const;

    ColumnTypePtr type_;
    TermMap terms_;
    size_t tokenCount_ = 0;
    std::optional<Token> minToken_;
    std::optional<Token> maxToken_;
};

} // namespace sidx
