#pragma once

#include <functional>
#include <initializer_list>
#include <utility>
#include <vector>

// Ordered (predicate, points) table. Rows are evaluated top to bottom and the
// first matching row wins; no match yields the fallback.
template <typename T = double>
class PointLadder {
public:
    using Predicate = std::function<bool(T)>;
    using Row = std::pair<Predicate, int>;

    PointLadder() = default;

    PointLadder(std::initializer_list<Row> rows, int fallback = 0)
        : rows_(rows), fallback_(fallback) {}

    int evaluate(T value) const {
        for (const auto& row : rows_) {
            if (row.first(value)) {
                return row.second;
            }
        }
        return fallback_;
    }

private:
    std::vector<Row> rows_;
    int fallback_ = 0;
};

// Predicate factories for numeric ladders. NaN never matches.
struct When {
    static std::function<bool(double)> between(double lo, double hi) {
        return [lo, hi](double v) { return v >= lo && v <= hi; };
    }
    static std::function<bool(double)> at_least(double lo) {
        return [lo](double v) { return v >= lo; };
    }
    static std::function<bool(double)> at_most(double hi) {
        return [hi](double v) { return v <= hi; };
    }
    static std::function<bool(double)> above(double lo) {
        return [lo](double v) { return v > lo; };
    }
    static std::function<bool(double)> below(double hi) {
        return [hi](double v) { return v < hi; };
    }
};
