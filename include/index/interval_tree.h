#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

namespace sidx {

/// Centered interval tree over closed intervals [min, max].
///
/// Every node stores the intervals containing its center twice, sorted by
/// min ascending and by max descending, so a query only scans the prefix that
/// can overlap. Immutable after construction.
template <typename C, typename D, typename Less = std::less<C>>
class IntervalTree {
public:
    struct Interval {
        C min;
        C max;
        D data;
    };

    explicit IntervalTree(std::vector<Interval> intervals, Less less = Less())
        : less_(std::move(less))
        , count_(intervals.size()) {
        for (const auto& i : intervals) {
            if (less_(i.max, i.min))
                throw std::invalid_argument("interval with max < min");
        }
        root_ = build(std::move(intervals));
    }

    IntervalTree(IntervalTree&&) = default;
    IntervalTree& operator=(IntervalTree&&) = default;

    size_t intervalCount() const { return count_; }
    bool empty() const { return count_ == 0; }

    /// Data of all intervals overlapping [min, max], bounds inclusive.
    std::vector<D> search(const C& min, const C& max) const {
        std::vector<D> out;
        if (less_(max, min))
            return out;
        search(root_.get(), min, max, out);
        return out;
    }

    std::vector<D> search(const C& point) const { return search(point, point); }

private:
    struct Node {
        C center;
        C low;   // kleinstes min im Teilbaum
        C high;  // größtes max im Teilbaum
        std::vector<Interval> byMin;
        std::vector<Interval> byMax;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };

    std::unique_ptr<Node> build(std::vector<Interval> intervals) const {
        if (intervals.empty())
            return nullptr;

        std::vector<C> points;
        points.reserve(intervals.size() * 2);
        for (const auto& i : intervals) {
            points.push_back(i.min);
            points.push_back(i.max);
        }
        std::sort(points.begin(), points.end(), less_);

        auto node = std::make_unique<Node>(Node{points[points.size() / 2], points.front(), points.back(), {}, {}, nullptr, nullptr});

        std::vector<Interval> leftSide, rightSide;
        for (auto& i : intervals) {
            if (less_(i.max, node->center))
                leftSide.push_back(std::move(i));
            else if (less_(node->center, i.min))
                rightSide.push_back(std::move(i));
            else
                node->byMin.push_back(i);
        }

        node->byMax = node->byMin;
        std::sort(node->byMin.begin(), node->byMin.end(),
                  [this](const Interval& a, const Interval& b) { return less_(a.min, b.min); });
        std::sort(node->byMax.begin(), node->byMax.end(),
                  [this](const Interval& a, const Interval& b) { return less_(b.max, a.max); });

        node->left = build(std::move(leftSide));
        node->right = build(std::move(rightSide));
        return node;
    }

    void search(const Node* node, const C& min, const C& max, std::vector<D>& out) const {
        if (!node || less_(max, node->low) || less_(node->high, min))
            return;

        if (less_(max, node->center)) {
            for (const auto& i : node->byMin) {
                if (less_(max, i.min)) break;
                out.push_back(i.data);
            }
        } else if (less_(node->center, min)) {
            for (const auto& i : node->byMax) {
                if (less_(i.max, min)) break;
                out.push_back(i.data);
            }
        } else {
            for (const auto& i : node->byMin)
                out.push_back(i.data);
        }

        if (less_(min, node->center))
            search(node->left.get(), min, max, out);
        if (less_(node->center, max))
            search(node->right.get(), min, max, out);
    }

    Less less_;
    size_t count_ = 0;
    std::unique_ptr<Node> root_;
};

} // namespace sidx
