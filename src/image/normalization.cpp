#include "geo_mosaic/image/normalization.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/utils.hpp"

namespace geo_mosaic::image {

std::string constant_channel_policy_to_string(ConstantChannelPolicy policy) {
  switch (policy) {
  case ConstantChannelPolicy::Zero:
    return "zero";
  case ConstantChannelPolicy::Half:
    return "half";
  case ConstantChannelPolicy::Error:
    return "error";
  default:
    return "unknown";
  }
}

bool string_to_constant_channel_policy(const std::string &s,
                                       ConstantChannelPolicy &out) {
  const std::string norm = core::to_lower(s);
  if (norm == "zero") {
    out = ConstantChannelPolicy::Zero;
    return true;
  }
  if (norm == "half") {
    out = ConstantChannelPolicy::Half;
    return true;
  }
  if (norm == "error") {
    out = ConstantChannelPolicy::Error;
    return true;
  }
  return false;
}

NormalizedImage normalize_pan(const RasterTile &tile) {
  if (tile.bands.empty()) {
    throw NormalizationError("tile has no bands: " + tile.path.string());
  }
  NormalizedImage out;
  out.kind = RasterKind::PAN;
  out.channels.push_back(tile.bands.front());
  return out;
}

NormalizedImage normalize_rgb(const RasterTile &tile,
                              ConstantChannelPolicy policy) {
  if (tile.bands.empty()) {
    throw NormalizationError("tile has no bands: " + tile.path.string());
  }

  NormalizedImage out;
  out.kind = RasterKind::PSRGB;
  out.channels.reserve(tile.bands.size());

  for (size_t c = 0; c < tile.bands.size(); ++c) {
    const Matrix2Df &band = tile.bands[c];
    if (band.size() == 0) {
      throw NormalizationError("empty band " + std::to_string(c) + ": " +
                               tile.path.string());
    }

    const float lo = band.minCoeff();
    const float hi = band.maxCoeff();

    if (!(hi > lo)) {
      switch (policy) {
      case ConstantChannelPolicy::Zero:
        out.channels.push_back(Matrix2Df::Zero(band.rows(), band.cols()));
        break;
      case ConstantChannelPolicy::Half:
        out.channels.push_back(
            Matrix2Df::Constant(band.rows(), band.cols(), 0.5f));
        break;
      case ConstantChannelPolicy::Error:
        throw NormalizationError("channel " + std::to_string(c) +
                                 " is constant (" + std::to_string(lo) +
                                 "): " + tile.path.string());
      }
      continue;
    }

    Matrix2Df scaled = ((band.array() - lo) / (hi - lo)).matrix();
    out.channels.push_back(std::move(scaled));
  }

  return out;
}

NormalizedImage normalize_tile(const RasterTile &tile, RasterKind kind,
                               ConstantChannelPolicy policy) {
  switch (kind) {
  case RasterKind::PAN:
    return normalize_pan(tile);
  case RasterKind::PSRGB:
    return normalize_rgb(tile, policy);
  }
  throw NormalizationError("unknown raster kind");
}

} // namespace geo_mosaic::image
