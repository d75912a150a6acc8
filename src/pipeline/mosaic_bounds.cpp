#include "geo_mosaic/pipeline/mosaic_bounds.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/geo/georeference.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace geo_mosaic::pipeline {

MosaicBounds empty_bounds() {
    return MosaicBounds{};
}

MosaicBounds fold(const MosaicBounds& bounds, const Extent& extent) {
    const Extent e = geo::axis_aligned(extent);
    MosaicBounds out;
    out.x_min = std::min(bounds.x_min, e.left);
    out.x_max = std::max(bounds.x_max, e.right);
    out.y_min = std::min(bounds.y_min, e.bottom);
    out.y_max = std::max(bounds.y_max, e.top);
    return out;
}

MosaicBounds merge(const MosaicBounds& a, const MosaicBounds& b) {
    MosaicBounds out;
    out.x_min = std::min(a.x_min, b.x_min);
    out.x_max = std::max(a.x_max, b.x_max);
    out.y_min = std::min(a.y_min, b.y_min);
    out.y_max = std::max(a.y_max, b.y_max);
    return out;
}

MosaicBounds fold_all(const std::vector<Extent>& extents, const MosaicBounds& initial) {
    MosaicBounds acc = initial;
    for (const auto& e : extents) {
        acc = fold(acc, e);
    }
    return acc;
}

bool is_empty(const MosaicBounds& bounds) {
    if (!std::isfinite(bounds.x_min) || !std::isfinite(bounds.x_max) ||
        !std::isfinite(bounds.y_min) || !std::isfinite(bounds.y_max)) {
        return true;
    }
    return bounds.x_min > bounds.x_max || bounds.y_min > bounds.y_max;
}

Extent drawable_range(const MosaicBounds& bounds) {
    if (is_empty(bounds)) {
        std::ostringstream oss;
        oss << "bounds not drawable (x " << bounds.x_min << ".." << bounds.x_max
            << ", y " << bounds.y_min << ".." << bounds.y_max << ")";
        throw EmptyMosaicError(oss.str());
    }
    Extent range;
    range.left = bounds.x_min;
    range.right = bounds.x_max;
    range.bottom = bounds.y_min;
    range.top = bounds.y_max;
    return range;
}

} // namespace geo_mosaic::pipeline
