#pragma once

#include "storage/key_range.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sidx {

/// Pull-based stream of strictly increasing row tokens.
///
/// Implementations provide computeNext() and performSkipTo(); the base class
/// caches one look-ahead token. close() must be idempotent.
class RangeIterator {
public:
    RangeIterator(Token min, Token max, uint64_t count);
    virtual ~RangeIterator() = default;

    RangeIterator(const RangeIterator&) = delete;
    RangeIterator& operator=(const RangeIterator&) = delete;

    Token getMinimum() const { return min_; }
    Token getMaximum() const { return max_; }
    /// Upper estimate of the number of tokens.
    uint64_t getCount() const { return count_; }

    bool hasNext();
    /// Throws std::out_of_range when exhausted.
    Token peek();
    Token next();

    /// After the call the next token returned is >= target.
    void skipTo(Token target);

    virtual void close() {}

    class Builder;

protected:
    virtual std::optional<Token> computeNext() = 0;
    virtual void performSkipTo(Token target) = 0;

private:
    const Token min_;
    const Token max_;
    const uint64_t count_;
    std::optional<Token> next_;
    bool exhausted_ = false;
};

using RangeIteratorPtr = std::shared_ptr<RangeIterator>;

/// Collects child iterators and merges them into one on build().
class RangeIterator::Builder {
public:
    enum class Type { UNION, INTERSECTION };

    explicit Builder(Type type) : type_(type) {}
    virtual ~Builder() = default;

    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;

    /// Null iterators and iterators without tokens are ignored.
    Builder& add(const RangeIteratorPtr& range);
    Builder& add(const std::vector<RangeIteratorPtr>& ranges);

    Type type() const { return type_; }
    size_t rangeCount() const { return ranges_.size(); }
    Token getMinimum() const { return min_; }
    Token getMaximum() const { return max_; }
    uint64_t getTokenCount() const { return count_; }

    /// Null when nothing was added, the child itself when only one was.
    /// The builder is empty afterwards.
    RangeIteratorPtr build();

    /// Closes children that were never built into an iterator.
    void close();

protected:
    virtual void updateStatistics(const RangeIterator& range) = 0;
    virtual RangeIteratorPtr buildIterator() = 0;

    const Type type_;
    std::vector<RangeIteratorPtr> ranges_;
    Token min_ = 0;
    Token max_ = 0;
    uint64_t count_ = 0;
};

using RangeBuilderPtr = std::unique_ptr<RangeIterator::Builder>;

/// Iterator over an already sorted, de-duplicated token list.
class VectorRangeIterator : public RangeIterator {
public:
    explicit VectorRangeIterator(std::vector<Token> tokens);

    static RangeIteratorPtr empty();

protected:
    std::optional<Token> computeNext() override;
    void performSkipTo(Token target) override;

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

/// Closes every iterator, rethrowing the first failure after all were tried.
void closeAll(const std::vector<RangeIteratorPtr>& ranges);

} // namespace sidx
