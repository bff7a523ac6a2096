#include "index/term_postings.h"

#include <algorithm>

namespace sidx {

TermPostings::TermPostings(ColumnTypePtr type)
    : type_(std::move(type))
    , terms_(ValueLess{type_}) {}

void TermPostings::add(const std::string& term, Token token) {
    auto& tokens = terms_[term];
    auto pos = std::lower_bound(tokens.begin(), tokens.end(), token);
    if (pos != tokens.end() && *pos == token)
        return;
    tokens.insert(pos, token);
    ++tokenCount_;

    minToken_ = minToken_ ? std::min(*minToken_, token) : token;
    maxToken_ = maxToken_ ? std::max(*maxToken_, token) : token;
}

std::optional<std::string> TermPostings::minTerm() const {
    if (terms_.empty()) return std::nullopt;
    return terms_.begin()->first;
}

std::optional<std::string> TermPostings::maxTerm() const {
    if (terms_.empty()) return std::nullopt;
    return terms_.rbegin()->first;
}

void TermPostings::collect(TermMap::const_iterator from, TermMap::const_iterator to,
                           const Expression& expression, std::vector<Token>& out) const {
    for (auto it = from; it != to; ++it) {
        if (expression.isSatisfiedBy(it->first))
            out.insert(out.end(), it->second.begin(), it->second.end());
    }
}

RangeIteratorPtr TermPostings::search(const Expression& expression) const {
    std::vector<Token> tokens;

    switch (expression.op()) {
        case Expression::Op::EQ: {
            auto it = terms_.find(expression.lower()->value);
            if (it != terms_.end())
                tokens = it->second;
            break;
        }
        case Expression::Op::RANGE: {
            auto from = expression.lower() ? terms_.lower_bound(expression.lower()->value) : terms_.begin();
            auto to = expression.upper() ? terms_.upper_bound(expression.upper()->value) : terms_.end();
            // leere oder invertierte Grenzen
            if (from == terms_.end() || (to != terms_.end() && type_->compare(from->first, to->first) > 0))
                break;
            collect(from, to, expression, tokens);
            break;
        }
        case Expression::Op::PREFIX: {
            // Terme mit gleichem Präfix liegen zusammenhängend
            auto it = terms_.lower_bound(expression.lower()->value);
            for (; it != terms_.end() && expression.isSatisfiedBy(it->first); ++it)
                tokens.insert(tokens.end(), it->second.begin(), it->second.end());
            break;
        }
        case Expression::Op::NOT_EQ:
        case Expression::Op::CONTAINS:
            collect(terms_.begin(), terms_.end(), expression, tokens);
            break;
    }

    if (tokens.empty())
        return nullptr;

    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return std::make_shared<VectorRangeIterator>(std::move(tokens));
}

} // namespace sidx
