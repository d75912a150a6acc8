#pragma once

#include "geo_mosaic/core/types.hpp"
#include "geo_mosaic/image/normalization.hpp"
#include "geo_mosaic/io/overlay_io.hpp"
#include "geo_mosaic/pipeline/mosaic_bounds.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <vector>

namespace geo_mosaic::render {

// Largest canvas side, matching the render.width_px limit.
constexpr int kMaxCanvasSide = 32768;

/**
 * 8-bit BGR canvas covering the drawable range of a MosaicBounds. World
 * pixels are square; the canvas height follows from the bounds' aspect ratio.
 * Tiles are placed into their axis-aligned destination rectangle, so
 * rotated transforms are drawn as their bounding box.
 */
class MosaicCanvas {
public:
  MosaicCanvas(const pipeline::MosaicBounds &bounds, int width_px,
               const std::array<int, 3> &background_rgb = {0, 0, 0});

  void draw_tile(const image::NormalizedImage &img, const Extent &extent);

  void draw_roads(const io::RoadOverlay &overlay,
                  const std::array<int, 3> &color_rgb, int thickness_px);

  void save_png(const fs::path &path) const;

  // North-up transform of the canvas grid.
  GeoTransform geotransform() const;

  // Canvas as float R, G, B bands (0..255).
  std::vector<Matrix2Df> to_bands() const;

  cv::Point2d world_to_pixel(double x, double y) const;

  const cv::Mat &image() const { return canvas_; }
  int width() const { return canvas_.cols; }
  int height() const { return canvas_.rows; }

private:
  void place(cv::Mat &bgr, const Extent &extent, const cv::Rect &dst,
             const cv::Rect &visible);

  Extent range_;
  double pixel_w_ = 1.0;
  double pixel_h_ = 1.0;
  cv::Mat canvas_;
};

// Converts a normalized tile into an 8-bit BGR image. PAN is stretched by
// its own min/max for display; PSRGB channels 0,1,2 map to R,G,B.
cv::Mat to_display_bgr(const image::NormalizedImage &img);

} // namespace geo_mosaic::render
