#include "geo_mosaic/render/mosaic_canvas.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/utils.hpp"
#include "geo_mosaic/geo/georeference.hpp"

#include <opencv2/imgcodecs.hpp>

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using geo_mosaic::Matrix2Df;
using geo_mosaic::image::NormalizedImage;
using geo_mosaic::pipeline::MosaicBounds;
using geo_mosaic::render::MosaicCanvas;

namespace {

MosaicBounds make_bounds(double x_min, double x_max, double y_min, double y_max) {
    MosaicBounds b;
    b.x_min = x_min;
    b.x_max = x_max;
    b.y_min = y_min;
    b.y_max = y_max;
    return b;
}

NormalizedImage solid_rgb(int rows, int cols, float r, float g, float b) {
    NormalizedImage img;
    img.kind = geo_mosaic::RasterKind::PSRGB;
    img.channels.push_back(Matrix2Df::Constant(rows, cols, r));
    img.channels.push_back(Matrix2Df::Constant(rows, cols, g));
    img.channels.push_back(Matrix2Df::Constant(rows, cols, b));
    return img;
}

} // namespace

TEST_CASE("canvas_size_follows_bounds_aspect") {
    MosaicCanvas canvas(make_bounds(0.0, 100.0, 0.0, 50.0), 100);

    REQUIRE(canvas.width() == 100);
    REQUIRE(canvas.height() == 50);

    auto gt = canvas.geotransform();
    REQUIRE(gt[0] == Catch::Approx(0.0));
    REQUIRE(gt[1] == Catch::Approx(1.0));
    REQUIRE(gt[3] == Catch::Approx(50.0));
    REQUIRE(gt[5] == Catch::Approx(-1.0));

    cv::Point2d tl = canvas.world_to_pixel(0.0, 50.0);
    cv::Point2d br = canvas.world_to_pixel(100.0, 0.0);
    REQUIRE(tl.x == Catch::Approx(0.0));
    REQUIRE(tl.y == Catch::Approx(0.0));
    REQUIRE(br.x == Catch::Approx(100.0));
    REQUIRE(br.y == Catch::Approx(50.0));
}

TEST_CASE("canvas_rejects_empty_and_degenerate_bounds") {
    REQUIRE_THROWS_AS(MosaicCanvas(MosaicBounds{}, 100), geo_mosaic::EmptyMosaicError);
    REQUIRE_THROWS_AS(MosaicCanvas(make_bounds(5.0, 5.0, 0.0, 10.0), 100), geo_mosaic::RenderError);
}

TEST_CASE("canvas_rejects_extreme_aspect_ratio") {
    // 2.4e9 rows at width 2400 would overflow int
    REQUIRE_THROWS_AS(MosaicCanvas(make_bounds(0.0, 1.0, 0.0, 1.0e6), 2400), geo_mosaic::RenderError);
    REQUIRE_THROWS_AS(MosaicCanvas(make_bounds(0.0, 1.0, 0.0, 1.0e5), 2400), geo_mosaic::RenderError);
    REQUIRE_THROWS_AS(MosaicCanvas(make_bounds(0.0, 1.0, 0.0, 1.0), geo_mosaic::render::kMaxCanvasSide + 1),
                      geo_mosaic::RenderError);
    REQUIRE_NOTHROW(MosaicCanvas(make_bounds(0.0, 1.0, 0.0, 8.0), 16));
}

TEST_CASE("canvas_starts_with_background") {
    MosaicCanvas canvas(make_bounds(0.0, 10.0, 0.0, 10.0), 20, {10, 20, 30});

    cv::Vec3b px = canvas.image().at<cv::Vec3b>(5, 5);
    REQUIRE(px[0] == 30);
    REQUIRE(px[1] == 20);
    REQUIRE(px[2] == 10);

    auto bands = canvas.to_bands();
    REQUIRE(bands.size() == 3);
    REQUIRE(bands[0](0, 0) == Catch::Approx(10.0f));
    REQUIRE(bands[2](19, 19) == Catch::Approx(30.0f));
}

TEST_CASE("draw_tile_fills_its_extent_only") {
    MosaicCanvas canvas(make_bounds(0.0, 100.0, 0.0, 50.0), 100);

    // Left half, full height
    canvas.draw_tile(solid_rgb(4, 4, 1.0f, 0.0f, 0.0f), {0.0, 50.0, 0.0, 50.0});

    cv::Vec3b inside = canvas.image().at<cv::Vec3b>(25, 10);
    cv::Vec3b outside = canvas.image().at<cv::Vec3b>(25, 90);
    REQUIRE(inside[2] == 255);
    REQUIRE(inside[1] == 0);
    REQUIRE(inside[0] == 0);
    REQUIRE(outside == cv::Vec3b(0, 0, 0));
}

TEST_CASE("draw_tile_south_up_is_flipped") {
    MosaicCanvas canvas(make_bounds(0.0, 10.0, 0.0, 10.0), 10);

    // Row 0 lies at the southern edge for a positive pixel height.
    geo_mosaic::GeoTransform gt{0.0, 10.0, 0.0, 0.0, 0.0, 5.0};
    geo_mosaic::Extent extent = geo_mosaic::geo::compute_extent(gt, 1, 2);
    NormalizedImage img;
    img.kind = geo_mosaic::RasterKind::PAN;
    Matrix2Df band(2, 1);
    band << 0.0f,
            1.0f;
    img.channels.push_back(band);

    canvas.draw_tile(img, extent);

    REQUIRE(canvas.image().at<cv::Vec3b>(0, 5)[1] == 255);
    REQUIRE(canvas.image().at<cv::Vec3b>(9, 5)[1] == 0);
}

TEST_CASE("draw_tile_outside_canvas_is_ignored") {
    MosaicCanvas canvas(make_bounds(0.0, 10.0, 0.0, 10.0), 10, {1, 2, 3});

    REQUIRE_NOTHROW(canvas.draw_tile(solid_rgb(2, 2, 1.0f, 1.0f, 1.0f), {100.0, 110.0, 100.0, 110.0}));
    REQUIRE(canvas.image().at<cv::Vec3b>(5, 5) == cv::Vec3b(3, 2, 1));
}

TEST_CASE("draw_roads_marks_polyline_pixels") {
    MosaicCanvas canvas(make_bounds(0.0, 100.0, 0.0, 50.0), 100);
    geo_mosaic::io::RoadOverlay overlay;
    overlay.polylines.push_back({{0.0, 25.0}, {100.0, 25.0}});

    canvas.draw_roads(overlay, {0, 255, 0}, 3);

    cv::Vec3b on_line = canvas.image().at<cv::Vec3b>(25, 50);
    REQUIRE(on_line[1] > 0);
    REQUIRE(on_line[2] == 0);
    REQUIRE(canvas.image().at<cv::Vec3b>(5, 50) == cv::Vec3b(0, 0, 0));
}

TEST_CASE("to_display_bgr_constant_pan_is_black") {
    NormalizedImage img;
    img.kind = geo_mosaic::RasterKind::PAN;
    img.channels.push_back(Matrix2Df::Constant(3, 3, 42.0f));

    cv::Mat bgr = geo_mosaic::render::to_display_bgr(img);

    REQUIRE(bgr.type() == CV_8UC3);
    REQUIRE(cv::countNonZero(bgr.reshape(1)) == 0);
    REQUIRE_THROWS_AS(geo_mosaic::render::to_display_bgr(NormalizedImage{}), geo_mosaic::RenderError);
}

TEST_CASE("save_png_writes_readable_image") {
    fs::path dir = fs::temp_directory_path() / ("geo_mosaic_canvas_" + geo_mosaic::core::get_run_id());
    MosaicCanvas canvas(make_bounds(0.0, 40.0, 0.0, 20.0), 40);

    canvas.save_png(dir / "out" / "mosaic.png");

    cv::Mat back = cv::imread((dir / "out" / "mosaic.png").string());
    REQUIRE(back.cols == 40);
    REQUIRE(back.rows == 20);

    fs::remove_all(dir);
}
