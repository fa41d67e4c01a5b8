#include "test_harness.h"

#include "CurveExtractor.hpp"
#include <opencv2/imgproc.hpp>
#include <set>
#include <vector>

using namespace CurveTrace;

static const double kPi = 3.14159265358979323846;

// y = 50 + 10 sin(2 pi x / 10) on the default 0..10 / 0..100 calibration
static double sine_curve(double x) {
    return 50.0 + 10.0 * std::sin(2.0 * kPi * x / 10.0);
}

// Draws a function onto a plot area whose top-left canvas pixel is `origin`
// and which spans `size` pixels for the default calibration.
static void draw_curve(cv::Mat& img, double (*f)(double), const cv::Point& origin, int size,
                       int fromPx, int toPx, const cv::Scalar& color, int thickness) {
    std::vector<cv::Point> pts;
    for (int px = fromPx; px <= toPx; px++) {
        double x = px * 10.0 / size;
        double py = (1.0 - f(x) / 100.0) * size;
        pts.emplace_back(origin.x + px, origin.y + static_cast<int>(std::lround(py)));
    }
    cv::polylines(img, std::vector<std::vector<cv::Point>>{pts}, false, color, thickness);
}

static double flat_curve(double) {
    return 20.0;
}

static cv::Mat sine_canvas() {
    cv::Mat canvas(1000, 1000, CV_8UC3, cv::Scalar(255, 255, 255));
    draw_curve(canvas, sine_curve, cv::Point(0, 0), 1000, 20, 980, cv::Scalar(0, 0, 255), 5);
    return canvas;
}

TEST_SUITE("curve extraction pipeline");

// --- Rectified canvas ---

TEST(sine_on_canvas_recovered) {
    CurveExtractor extractor;
    ExtractionResult result = extractor.extractFromCanvas(sine_canvas(), AxisCalibration());

    ASSERT(result.curves.size() == 1, "expected only the red curve, got " << result.curves.size());
    ASSERT(result.curves.count("red") == 1, "red curve missing");
    const CurveSeries& red = result.curves.at("red");
    ASSERT(red.label == "red", "unlabeled curve should use its color name");

    // One bin per canvas column: compare against the columns of the cleaned mask
    auto masks = ColorSegmenter::segment(sine_canvas(), extractor.config().colorSpecs);
    auto cleaned = ComponentFilter::filter(masks, extractor.config().tuning, extractor.config().filter);
    std::set<int> columns;
    std::vector<cv::Point> pixels;
    cv::findNonZero(cleaned.at("red"), pixels);
    for (const auto& p : pixels) columns.insert(p.x);

    // Each column holds a few vertically adjacent pixels, well inside the std gate
    ASSERT(red.points.size() == columns.size(),
           "expected one point per occupied column, got " << red.points.size() << " of " << columns.size());
    for (size_t i = 0; i < red.points.size(); i++) {
        int column = static_cast<int>(std::lround(red.points[i].x / 0.01));
        ASSERT(columns.count(column) == 1, "point " << i << " at x=" << red.points[i].x << " has no pixel column");
    }

    for (size_t i = 0; i < red.points.size(); i++) {
        const CurvePoint& p = red.points[i];
        ASSERT(!std::isnan(p.x) && !std::isnan(p.y), "NaN at point " << i);
        ASSERT_NEAR(p.y, sine_curve(p.x), 0.2, "sine value at x=" << p.x);
        if (i > 0) {
            ASSERT(p.x > red.points[i - 1].x, "x must be strictly increasing at " << i);
        }
    }
    PASS("sine_on_canvas_recovered");
}

TEST(specks_do_not_become_points) {
    cv::Mat canvas = sine_canvas();
    for (int px = 100; px < 900; px += 100) {
        cv::circle(canvas, cv::Point(px, 80), 3, cv::Scalar(0, 0, 255), cv::FILLED);
    }

    ExtractionResult result = CurveExtractor().extractFromCanvas(canvas, AxisCalibration());
    ASSERT(result.curves.count("red") == 1, "red curve missing");
    for (const auto& p : result.curves.at("red").points) {
        ASSERT(p.y < 70.0, "speck at y=92 leaked into the series at x=" << p.x);
    }
    PASS("specks_do_not_become_points");
}

TEST(two_colors_with_labels) {
    cv::Mat canvas = sine_canvas();
    draw_curve(canvas, flat_curve, cv::Point(0, 0), 1000, 100, 900, cv::Scalar(255, 0, 0), 5);

    ExtractionConfig config;
    config.labels["red"] = "25";
    CurveExtractor extractor(config);
    ExtractionResult result = extractor.extractFromCanvas(canvas, AxisCalibration());

    ASSERT(result.curves.size() == 2, "expected red and blue, got " << result.curves.size());
    ASSERT(result.curves.at("red").label == "25", "red should carry its label");
    ASSERT(result.curves.at("blue").label == "blue", "blue falls back to its color name");

    const auto& blue = result.curves.at("blue").points;
    ASSERT(!blue.empty(), "blue series empty");
    ASSERT(blue.front().x >= 0.95 && blue.back().x <= 9.05, "blue spans x 1..9");
    for (const auto& p : blue) {
        ASSERT_NEAR(p.y, 20.0, 0.3, "flat line at x=" << p.x);
    }
    PASS("two_colors_with_labels");
}

TEST(debug_images_kept_on_request) {
    ExtractionConfig config;
    config.keepDebugImages = true;
    ExtractionResult result = CurveExtractor(config).extractFromCanvas(sine_canvas(), AxisCalibration());

    ASSERT(!result.canvas.empty(), "canvas should be kept");
    ASSERT(result.cleanedMasks.count("red") == 1, "cleaned red mask should be kept");

    ExtractionResult plain = CurveExtractor().extractFromCanvas(sine_canvas(), AxisCalibration());
    ASSERT(plain.canvas.empty() && plain.cleanedMasks.empty(), "debug images are opt-in");
    PASS("debug_images_kept_on_request");
}

TEST(blank_canvas_has_no_curves) {
    cv::Mat canvas(1000, 1000, CV_8UC3, cv::Scalar(255, 255, 255));
    ExtractionResult result = CurveExtractor().extractFromCanvas(canvas, AxisCalibration());
    ASSERT(result.curves.empty(), "blank canvas should produce no curves");
    PASS("blank_canvas_has_no_curves");
}

TEST(progress_reaches_completion) {
    std::vector<double> reported;
    CurveExtractor().extractFromCanvas(sine_canvas(), AxisCalibration(),
        [&reported](double progress, const std::string&) { reported.push_back(progress); });

    ASSERT(!reported.empty(), "progress callback never called");
    ASSERT(reported.back() == 1.0, "last progress should be 1.0");
    for (size_t i = 1; i < reported.size(); i++) {
        ASSERT(reported[i] >= reported[i - 1], "progress must not go backwards");
    }
    PASS("progress_reaches_completion");
}

// --- Full photograph-style page ---

TEST(framed_page_end_to_end) {
    cv::Mat page(1200, 1200, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::rectangle(page, cv::Point(100, 100), cv::Point(1099, 1099), cv::Scalar(0, 0, 0), 3);
    draw_curve(page, sine_curve, cv::Point(100, 100), 1000, 50, 950, cv::Scalar(0, 0, 255), 5);

    ExtractionResult result = CurveExtractor().extract(page, AxisCalibration());
    ASSERT(result.curves.count("red") == 1, "red curve missing after rectification");
    ASSERT(result.gridSize >= 5 && result.gridSize <= 50, "grid size outside clamp range");

    const auto& points = result.curves.at("red").points;
    ASSERT(points.size() > 500, "expected most columns to survive, got " << points.size());
    for (const auto& p : points) {
        ASSERT_NEAR(p.y, sine_curve(p.x), 1.5, "rectified sine at x=" << p.x);
    }
    PASS("framed_page_end_to_end");
}

// --- Failure modes ---

TEST(calibration_checked_before_pixels) {
    AxisCalibration bad;
    bad.xMin = 5.0;
    bad.xMax = 5.0;
    CurveExtractor extractor;
    // An empty image would otherwise fail with invalid_argument during normalization
    ASSERT_THROWS(extractor.extract(cv::Mat(), bad), CalibrationError, "bad calibration should win over empty image");
    ASSERT_THROWS(extractor.extractFromFile("missing.png", bad), CalibrationError,
                  "bad calibration should win over a missing file");
    PASS("calibration_checked_before_pixels");
}

TEST(non_rectangular_boundary_fails) {
    cv::Mat page(800, 800, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<cv::Point> pentagon = {{400, 80}, {720, 320}, {600, 700}, {200, 700}, {80, 320}};
    cv::polylines(page, std::vector<std::vector<cv::Point>>{pentagon}, true, cv::Scalar(0, 0, 0), 3);

    ASSERT_THROWS(CurveExtractor().extract(page, AxisCalibration()), GridDetectionError,
                  "pentagon boundary should raise GridDetectionError");
    PASS("non_rectangular_boundary_fails");
}

TEST(invalid_tuning_rejected) {
    ExtractionConfig config;
    config.tuning.entry("green").smoothingWindow = 3;
    ASSERT_THROWS(CurveExtractor{config}, std::invalid_argument, "window <= poly order should throw");

    ExtractionConfig badBin;
    badBin.aggregation.binWidth = 0.0;
    ASSERT_THROWS(CurveExtractor{badBin}, std::invalid_argument, "zero bin width should throw");
    PASS("invalid_tuning_rejected");
}

TEST_MAIN()
