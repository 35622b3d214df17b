// TileWorld World System
// sample_grid.hpp - Dense lattice storage over world bounds

#pragma once

#include "types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

namespace tileworld::world {

// Dense 2D array over a stride-N lattice anchored at (min_x, min_y).
// Lattice points are min + i * stride for every i that stays within bounds.
template <typename T>
class SampleGrid {
public:
    SampleGrid() = default;

    SampleGrid(const WorldBounds& bounds, int32_t stride, const T& initial = T{})
        : bounds_(bounds), stride_(std::max(stride, 1)) {
        columns_ = (bounds.max_x - bounds.min_x) / stride_ + 1;
        rows_ = (bounds.max_y - bounds.min_y) / stride_ + 1;
        values_.assign(static_cast<size_t>(columns_) * static_cast<size_t>(rows_), initial);
    }

    [[nodiscard]] bool empty() const { return values_.empty(); }
    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] int32_t columns() const { return columns_; }
    [[nodiscard]] int32_t rows() const { return rows_; }
    [[nodiscard]] int32_t stride() const { return stride_; }
    [[nodiscard]] const WorldBounds& bounds() const { return bounds_; }

    [[nodiscard]] bool is_lattice_point(int32_t x, int32_t y) const {
        return !empty() && bounds_.contains(x, y) && (x - bounds_.min_x) % stride_ == 0 &&
               (y - bounds_.min_y) % stride_ == 0;
    }

    // Index of an exact lattice point
    [[nodiscard]] std::optional<size_t> index_of(int32_t x, int32_t y) const {
        if (!is_lattice_point(x, y)) {
            return std::nullopt;
        }
        return to_index((x - bounds_.min_x) / stride_, (y - bounds_.min_y) / stride_);
    }

    // Index of the closest lattice point; positions outside bounds have none
    [[nodiscard]] std::optional<size_t> nearest_index(int32_t x, int32_t y) const {
        if (empty() || !bounds_.contains(x, y)) {
            return std::nullopt;
        }
        auto snap = [this](int32_t offset, int32_t count) {
            auto cell = static_cast<int32_t>(std::lround(static_cast<double>(offset) / stride_));
            return std::clamp(cell, 0, count - 1);
        };
        return to_index(snap(x - bounds_.min_x, columns_), snap(y - bounds_.min_y, rows_));
    }

    [[nodiscard]] Position position_of(size_t index) const {
        auto column = static_cast<int32_t>(index % static_cast<size_t>(columns_));
        auto row = static_cast<int32_t>(index / static_cast<size_t>(columns_));
        return {bounds_.min_x + column * stride_, bounds_.min_y + row * stride_};
    }

    [[nodiscard]] const T& at(size_t index) const { return values_[index]; }
    [[nodiscard]] T& at(size_t index) { return values_[index]; }

    [[nodiscard]] const std::vector<T>& values() const { return values_; }

    // Visit every lattice point in row-major order
    template <typename Fn>
    void for_each(Fn&& fn) {
        for (size_t i = 0; i < values_.size(); ++i) {
            fn(position_of(i), values_[i]);
        }
    }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (size_t i = 0; i < values_.size(); ++i) {
            fn(position_of(i), values_[i]);
        }
    }

private:
    [[nodiscard]] size_t to_index(int32_t column, int32_t row) const {
        return static_cast<size_t>(row) * static_cast<size_t>(columns_) + static_cast<size_t>(column);
    }

    WorldBounds bounds_{};
    int32_t stride_ = 1;
    int32_t columns_ = 0;
    int32_t rows_ = 0;
    std::vector<T> values_;
};

}  // namespace tileworld::world
