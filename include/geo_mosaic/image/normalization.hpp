#pragma once

#include "geo_mosaic/core/types.hpp"

#include <string>
#include <vector>

namespace geo_mosaic::image {

// Output for a channel whose min equals its max.
enum class ConstantChannelPolicy {
  Zero,  // channel becomes all 0.0
  Half,  // channel becomes all 0.5
  Error  // throw NormalizationError
};

std::string constant_channel_policy_to_string(ConstantChannelPolicy policy);
bool string_to_constant_channel_policy(const std::string &s,
                                       ConstantChannelPolicy &out);

// PAN: one raw channel. PSRGB: one [0,1] channel per band, in band order.
struct NormalizedImage {
  RasterKind kind = RasterKind::PAN;
  std::vector<Matrix2Df> channels;

  int rows() const {
    return channels.empty() ? 0 : static_cast<int>(channels.front().rows());
  }
  int cols() const {
    return channels.empty() ? 0 : static_cast<int>(channels.front().cols());
  }
};

// Band 0 unmodified.
NormalizedImage normalize_pan(const RasterTile &tile);

// Per-channel min-max rescale into [0,1] using each channel's own range.
NormalizedImage
normalize_rgb(const RasterTile &tile,
              ConstantChannelPolicy policy = ConstantChannelPolicy::Zero);

NormalizedImage
normalize_tile(const RasterTile &tile, RasterKind kind,
               ConstantChannelPolicy policy = ConstantChannelPolicy::Zero);

} // namespace geo_mosaic::image
