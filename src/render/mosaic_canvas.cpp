#include "geo_mosaic/render/mosaic_canvas.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/geo/georeference.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

namespace geo_mosaic::render {

namespace {

cv::Mat unit_to_u8(const Matrix2Df &ch) {
  cv::Mat f(static_cast<int>(ch.rows()), static_cast<int>(ch.cols()), CV_32F,
            const_cast<float *>(ch.data()));
  cv::Mat out;
  f.convertTo(out, CV_8U, 255.0, 0.0);
  return out;
}

cv::Scalar to_bgr(const std::array<int, 3> &rgb) {
  return cv::Scalar(rgb[2], rgb[1], rgb[0]);
}

} // namespace

cv::Mat to_display_bgr(const image::NormalizedImage &img) {
  if (img.channels.empty() || img.rows() <= 0 || img.cols() <= 0) {
    throw RenderError("cannot display an empty image");
  }

  if (img.kind == RasterKind::PAN) {
    const Matrix2Df &raw = img.channels.front();
    const float lo = raw.minCoeff();
    const float hi = raw.maxCoeff();
    Matrix2Df unit = (hi > lo) ? Matrix2Df(((raw.array() - lo) / (hi - lo)).matrix())
                               : Matrix2Df(Matrix2Df::Zero(raw.rows(), raw.cols()));
    cv::Mat gray = unit_to_u8(unit);
    cv::Mat bgr;
    cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
  }

  // PSRGB: missing channels stay black
  std::vector<cv::Mat> planes(3);
  cv::Mat zero = cv::Mat::zeros(img.rows(), img.cols(), CV_8U);
  for (int c = 0; c < 3; ++c) {
    planes[2 - c] = (c < static_cast<int>(img.channels.size()))
                        ? unit_to_u8(img.channels[c])
                        : zero;
  }
  cv::Mat bgr;
  cv::merge(planes, bgr);
  return bgr;
}

MosaicCanvas::MosaicCanvas(const pipeline::MosaicBounds &bounds, int width_px,
                           const std::array<int, 3> &background_rgb)
    : range_(pipeline::drawable_range(bounds)) {
  if (width_px < 1 || width_px > kMaxCanvasSide) {
    throw RenderError("canvas width must be in [1," +
                      std::to_string(kMaxCanvasSide) + "]");
  }
  const double span_x = range_.right - range_.left;
  const double span_y = range_.top - range_.bottom;
  if (!(span_x > 0.0) || !(span_y > 0.0)) {
    throw RenderError("mosaic bounds have zero area");
  }

  pixel_w_ = span_x / static_cast<double>(width_px);
  const double rows = std::round(span_y / pixel_w_);
  if (!(rows <= static_cast<double>(kMaxCanvasSide))) {
    throw RenderError("mosaic aspect ratio needs " + std::to_string(rows) +
                      " canvas rows at width " + std::to_string(width_px) +
                      " (max " + std::to_string(kMaxCanvasSide) + ")");
  }
  const int height_px = std::max(1, static_cast<int>(rows));
  pixel_h_ = span_y / static_cast<double>(height_px);

  try {
    canvas_ = cv::Mat(height_px, width_px, CV_8UC3, to_bgr(background_rgb));
  } catch (const cv::Exception &e) {
    throw RenderError(std::string("cannot allocate canvas: ") + e.what());
  }
}

cv::Point2d MosaicCanvas::world_to_pixel(double x, double y) const {
  return cv::Point2d((x - range_.left) / pixel_w_, (range_.top - y) / pixel_h_);
}

void MosaicCanvas::draw_tile(const image::NormalizedImage &img,
                             const Extent &extent) {
  const Extent box = geo::axis_aligned(extent);
  if (box.right < range_.left || box.left > range_.right ||
      box.top < range_.bottom || box.bottom > range_.top) {
    std::cerr << "[RENDER] Tile outside canvas, skipped" << std::endl;
    return;
  }
  const cv::Point2d tl = world_to_pixel(box.left, box.top);
  const cv::Point2d br = world_to_pixel(box.right, box.bottom);

  constexpr double kMaxPixelCoord = 4.0 * kMaxCanvasSide;
  if (!(std::fabs(tl.x) <= kMaxPixelCoord && std::fabs(tl.y) <= kMaxPixelCoord &&
        std::fabs(br.x) <= kMaxPixelCoord && std::fabs(br.y) <= kMaxPixelCoord)) {
    throw RenderError("tile extent is too large for the canvas");
  }

  const int x0 = static_cast<int>(std::floor(tl.x));
  const int y0 = static_cast<int>(std::floor(tl.y));
  const int dst_w = std::max(1, static_cast<int>(std::ceil(br.x)) - x0);
  const int dst_h = std::max(1, static_cast<int>(std::ceil(br.y)) - y0);

  const cv::Rect dst(x0, y0, dst_w, dst_h);
  const cv::Rect visible = dst & cv::Rect(0, 0, canvas_.cols, canvas_.rows);
  if (visible.area() <= 0) {
    std::cerr << "[RENDER] Tile outside canvas, skipped" << std::endl;
    return;
  }

  try {
    cv::Mat bgr = to_display_bgr(img);
    place(bgr, extent, dst, visible);
  } catch (const cv::Exception &e) {
    throw RenderError(std::string("cannot draw tile: ") + e.what());
  }
}

void MosaicCanvas::place(cv::Mat &bgr, const Extent &extent,
                         const cv::Rect &dst, const cv::Rect &visible) {
  // Row 0 of a south-up raster is its bottom edge; negative pixel width
  // mirrors columns.
  const bool flip_x = extent.left > extent.right;
  const bool flip_y = extent.bottom > extent.top;
  if (flip_x && flip_y) {
    cv::flip(bgr, bgr, -1);
  } else if (flip_x) {
    cv::flip(bgr, bgr, 1);
  } else if (flip_y) {
    cv::flip(bgr, bgr, 0);
  }

  const bool shrinking = dst.width < bgr.cols || dst.height < bgr.rows;
  cv::Mat resized;
  cv::resize(bgr, resized, dst.size(), 0, 0,
             shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);

  const cv::Rect src(visible.x - dst.x, visible.y - dst.y, visible.width,
                     visible.height);
  resized(src).copyTo(canvas_(visible));
}

void MosaicCanvas::draw_roads(const io::RoadOverlay &overlay,
                              const std::array<int, 3> &color_rgb,
                              int thickness_px) {
  // Vertices are drawn with 4 fractional bits for sub-pixel placement.
  constexpr int kShift = 4;
  constexpr double kScale = 1 << kShift;

  std::vector<std::vector<cv::Point>> lines;
  lines.reserve(overlay.polylines.size());
  for (const auto &poly : overlay.polylines) {
    std::vector<cv::Point> pts;
    pts.reserve(poly.size());
    for (const auto &p : poly) {
      const cv::Point2d px = world_to_pixel(p.x, p.y);
      pts.emplace_back(static_cast<int>(std::lround(px.x * kScale)),
                       static_cast<int>(std::lround(px.y * kScale)));
    }
    if (!pts.empty()) {
      lines.push_back(std::move(pts));
    }
  }
  if (lines.empty()) {
    return;
  }
  try {
    cv::polylines(canvas_, lines, false, to_bgr(color_rgb), thickness_px,
                  cv::LINE_AA, kShift);
  } catch (const cv::Exception &e) {
    throw RenderError(std::string("cannot draw roads: ") + e.what());
  }
}

void MosaicCanvas::save_png(const fs::path &path) const {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  bool ok = false;
  try {
    ok = cv::imwrite(path.string(), canvas_);
  } catch (const cv::Exception &e) {
    throw RenderError("cannot write " + path.string() + ": " + e.what());
  }
  if (!ok) {
    throw RenderError("cannot write " + path.string());
  }
}

GeoTransform MosaicCanvas::geotransform() const {
  return {range_.left, pixel_w_, 0.0, range_.top, 0.0, -pixel_h_};
}

std::vector<Matrix2Df> MosaicCanvas::to_bands() const {
  std::vector<cv::Mat> planes;
  cv::split(canvas_, planes);

  std::vector<Matrix2Df> bands;
  bands.reserve(3);
  for (int c = 2; c >= 0; --c) {
    Matrix2Df band(canvas_.rows, canvas_.cols);
    for (int y = 0; y < canvas_.rows; ++y) {
      const uint8_t *row = planes[c].ptr<uint8_t>(y);
      for (int x = 0; x < canvas_.cols; ++x) {
        band(y, x) = static_cast<float>(row[x]);
      }
    }
    bands.push_back(std::move(band));
  }
  return bands;
}

} // namespace geo_mosaic::render
