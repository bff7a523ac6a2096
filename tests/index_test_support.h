#pragma once

#include "index/memory_segment.h"
#include "index/range_iterator.h"
#include "index/segment_index.h"
#include "index/term_postings.h"
#include "storage/data_file.h"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sidx {
namespace test {

using Entries = std::vector<std::pair<std::string, Token>>;

inline std::vector<Token> drain(const RangeIteratorPtr& it) {
    std::vector<Token> out;
    if (!it)
        return out;
    while (it->hasNext())
        out.push_back(it->next());
    return out;
}

inline std::shared_ptr<TermPostings> postingsOf(const ColumnTypePtr& type, const Entries& entries) {
    auto postings = std::make_shared<TermPostings>(type);
    for (const auto& [term, token] : entries)
        postings->add(term, token);
    return postings;
}

inline DataFilePtr makeFile(uint64_t generation, Token minKey, Token maxKey) {
    return std::make_shared<DataFile>(generation, "data-" + std::to_string(generation) + ".db", minKey, maxKey);
}

inline SegmentIndexPtr makeSegment(const DataFilePtr& file, const ColumnTypePtr& type, const Entries& entries) {
    return MemorySegmentReader::open(file, postingsOf(type, entries));
}

/// Reader that counts close() calls; search() always finds the given tokens.
class CountingReader : public SegmentReader {
public:
    CountingReader(std::vector<Token> tokens, std::shared_ptr<std::atomic<int>> closes)
        : tokens_(std::move(tokens)), closes_(std::move(closes)) {}

    RangeIteratorPtr search(const Expression&) override {
        return std::make_shared<VectorRangeIterator>(tokens_);
    }
    void close() override { ++*closes_; }

private:
    std::vector<Token> tokens_;
    std::shared_ptr<std::atomic<int>> closes_;
};

inline SegmentIndexPtr makeCountingSegment(const DataFilePtr& file, Token minKey, Token maxKey,
                                           std::string minTerm, std::string maxTerm,
                                           const std::shared_ptr<std::atomic<int>>& closes,
                                           std::vector<Token> tokens = {}) {
    if (tokens.empty())
        tokens = {minKey, maxKey};
    return std::make_shared<SegmentIndex>(file, std::make_unique<CountingReader>(std::move(tokens), closes),
                                          minKey, maxKey, std::move(minTerm), std::move(maxTerm));
}

/// Iterator whose close() always fails.
class FailingCloseIterator : public VectorRangeIterator {
public:
    explicit FailingCloseIterator(std::vector<Token> tokens) : VectorRangeIterator(std::move(tokens)) {}
    void close() override { throw std::runtime_error("disk gone"); }
};

/// Reader handing out iterators that fail on close().
class FailingCloseReader : public SegmentReader {
public:
    explicit FailingCloseReader(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    RangeIteratorPtr search(const Expression&) override {
        return std::make_shared<FailingCloseIterator>(tokens_);
    }
    void close() override {}

private:
    std::vector<Token> tokens_;
};

/// Reader whose search() hands out an empty iterator that counts close().
class EmptyResultReader : public SegmentReader {
public:
    explicit EmptyResultReader(std::shared_ptr<std::atomic<int>> closes) : closes_(std::move(closes)) {}

    RangeIteratorPtr search(const Expression&) override {
        return std::make_shared<CountingCloseIterator>(closes_);
    }
    void close() override {}

private:
    class CountingCloseIterator : public VectorRangeIterator {
    public:
        explicit CountingCloseIterator(std::shared_ptr<std::atomic<int>> closes)
            : VectorRangeIterator({}), closes_(std::move(closes)) {}
        void close() override { ++*closes_; }

    private:
        std::shared_ptr<std::atomic<int>> closes_;
    };

    std::shared_ptr<std::atomic<int>> closes_;
};

} // namespace test
} // namespace sidx
