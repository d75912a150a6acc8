#pragma once

#include "geo_mosaic/core/types.hpp"

#include <limits>
#include <vector>

namespace geo_mosaic::pipeline {

// Running bounding box across folded tiles. Default value is the empty
// sentinel {+inf, -inf, +inf, -inf}.
struct MosaicBounds {
    double x_min = std::numeric_limits<double>::infinity();
    double x_max = -std::numeric_limits<double>::infinity();
    double y_min = std::numeric_limits<double>::infinity();
    double y_max = -std::numeric_limits<double>::infinity();
};

MosaicBounds empty_bounds();

// Extends `bounds` by the axis-aligned form of `extent`. Associative and
// commutative; never shrinks.
MosaicBounds fold(const MosaicBounds& bounds, const Extent& extent);

// Combines two partial accumulators (reduction step for split folds).
MosaicBounds merge(const MosaicBounds& a, const MosaicBounds& b);

MosaicBounds fold_all(const std::vector<Extent>& extents,
                      const MosaicBounds& initial = MosaicBounds{});

// True while nothing has been folded (or the range is inverted).
bool is_empty(const MosaicBounds& bounds);

// Returns the bounds as a plot range; throws EmptyMosaicError when empty.
Extent drawable_range(const MosaicBounds& bounds);

inline bool operator==(const MosaicBounds& a, const MosaicBounds& b) {
    return a.x_min == b.x_min && a.x_max == b.x_max &&
           a.y_min == b.y_min && a.y_max == b.y_max;
}

inline bool operator!=(const MosaicBounds& a, const MosaicBounds& b) {
    return !(a == b);
}

} // namespace geo_mosaic::pipeline
