#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace sidx {

/// Row key. Iterators yield tokens in strictly increasing order.
using Token = int64_t;

/// Inclusive token range [left, right]; left > right means empty.
struct KeyRange {
    Token left = std::numeric_limits<Token>::min();
    Token right = std::numeric_limits<Token>::max();

    static KeyRange full() { return KeyRange{}; }
    static KeyRange of(Token l, Token r) { return KeyRange{l, r}; }

    bool empty() const { return left > right; }
    bool contains(Token t) const { return t >= left && t <= right; }
    bool intersects(Token min, Token max) const {
        return !empty() && min <= right && max >= left;
    }

    std::string toString() const {
        return "[" + std::to_string(left) + ", " + std::to_string(right) + "]";
    }
};

} // namespace sidx
