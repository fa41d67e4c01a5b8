#include "test_harness.h"

#include "ImageNormalizer.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

using namespace CurveTrace;

// White page with a black plot frame from (100,100) to (1099,1099).
static cv::Mat framed_page() {
    cv::Mat page(1200, 1200, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::rectangle(page, cv::Point(100, 100), cv::Point(1099, 1099), cv::Scalar(0, 0, 0), 3);
    return page;
}

static bool near_point(const cv::Point2f& a, const cv::Point2f& b, float tol) {
    return std::fabs(a.x - b.x) <= tol && std::fabs(a.y - b.y) <= tol;
}

TEST_SUITE("image normalizer");

// --- Corner ordering ---

TEST(order_corners_any_permutation) {
    std::vector<cv::Point2f> truth = {
        {100.0f, 120.0f},   // top-left
        {900.0f, 100.0f},   // top-right
        {920.0f, 880.0f},   // bottom-right
        {80.0f, 900.0f}     // bottom-left
    };

    std::vector<int> idx = {0, 1, 2, 3};
    int permutations = 0;
    do {
        std::vector<cv::Point2f> shuffled;
        for (int i : idx) shuffled.push_back(truth[i]);

        auto ordered = ImageNormalizer::orderCorners(shuffled);
        for (int k = 0; k < 4; k++) {
            ASSERT(ordered[k] == truth[k], "corner " << k << " mislabeled for permutation " << permutations);
        }
        permutations++;
    } while (std::next_permutation(idx.begin(), idx.end()));

    ASSERT(permutations == 24, "expected 24 permutations, got " << permutations);
    PASS("order_corners_any_permutation");
}

TEST(order_corners_rotated_square_any_permutation) {
    // Every corner ties with a neighbour on either x+y or y-x
    std::vector<cv::Point2f> truth = {
        {500.0f, 0.0f},     // top-left
        {1000.0f, 500.0f},  // top-right
        {500.0f, 1000.0f},  // bottom-right
        {0.0f, 500.0f}      // bottom-left
    };

    std::vector<int> idx = {0, 1, 2, 3};
    int permutations = 0;
    do {
        std::vector<cv::Point2f> shuffled;
        for (int i : idx) shuffled.push_back(truth[i]);

        auto ordered = ImageNormalizer::orderCorners(shuffled);
        for (int k = 0; k < 4; k++) {
            ASSERT(ordered[k] == truth[k], "rotated corner " << k << " mislabeled for permutation " << permutations
                   << ": got (" << ordered[k].x << "," << ordered[k].y << ")");
        }
        permutations++;
    } while (std::next_permutation(idx.begin(), idx.end()));

    ASSERT(permutations == 24, "expected 24 permutations, got " << permutations);
    PASS("order_corners_rotated_square_any_permutation");
}

TEST(order_corners_rejects_shared_vertex) {
    std::vector<cv::Point2f> collapsed = {
        {0.0f, 0.0f}, {0.0f, 0.0f}, {10.0f, 10.0f}, {10.0f, 10.0f}
    };
    ASSERT_THROWS(ImageNormalizer::orderCorners(collapsed), GridDetectionError,
                  "two roles on one vertex should throw");

    std::vector<cv::Point2f> collinear = {
        {0.0f, 0.0f}, {10.0f, 10.0f}, {20.0f, 20.0f}, {30.0f, 30.0f}
    };
    ASSERT_THROWS(ImageNormalizer::orderCorners(collinear), GridDetectionError,
                  "collinear corners should throw");
    PASS("order_corners_rejects_shared_vertex");
}

TEST(order_corners_requires_four_points) {
    std::vector<cv::Point2f> three = {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}};
    ASSERT_THROWS(ImageNormalizer::orderCorners(three), GridDetectionError, "3 corners should throw");
    PASS("order_corners_requires_four_points");
}

// --- Perspective transform ---

TEST(transform_maps_corners_to_canvas) {
    std::vector<cv::Point2f> corners = {
        {100.0f, 120.0f}, {900.0f, 100.0f}, {920.0f, 880.0f}, {80.0f, 900.0f}
    };
    cv::Mat transform = ImageNormalizer::computeTransform(corners, cv::Size(1000, 1000));
    ASSERT(transform.rows == 3 && transform.cols == 3, "transform should be 3x3");

    std::vector<cv::Point2f> mapped;
    cv::perspectiveTransform(corners, mapped, transform);

    std::vector<cv::Point2f> expected = {
        {0.0f, 0.0f}, {999.0f, 0.0f}, {999.0f, 999.0f}, {0.0f, 999.0f}
    };
    for (int k = 0; k < 4; k++) {
        ASSERT(near_point(mapped[k], expected[k], 1.0f),
               "corner " << k << " maps to (" << mapped[k].x << "," << mapped[k].y << ")");
    }
    PASS("transform_maps_corners_to_canvas");
}

TEST(transform_rejects_empty_canvas) {
    std::vector<cv::Point2f> corners = {
        {0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}, {0.0f, 10.0f}
    };
    ASSERT_THROWS(ImageNormalizer::computeTransform(corners, cv::Size(0, 0)), std::invalid_argument,
                  "zero canvas should throw");
    PASS("transform_rejects_empty_canvas");
}

// --- Grid detection ---

TEST(detect_frame_corners) {
    ImageNormalizer::NormalizerParams params;
    auto corners = ImageNormalizer::orderCorners(ImageNormalizer::detectGridCorners(framed_page(), params));

    std::vector<cv::Point2f> expected = {
        {100.0f, 100.0f}, {1099.0f, 100.0f}, {1099.0f, 1099.0f}, {100.0f, 1099.0f}
    };
    for (int k = 0; k < 4; k++) {
        ASSERT(near_point(corners[k], expected[k], 5.0f),
               "corner " << k << " at (" << corners[k].x << "," << corners[k].y << ")");
    }
    PASS("detect_frame_corners");
}

TEST(triangle_is_not_a_grid) {
    cv::Mat page(800, 800, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<cv::Point> triangle = {{400, 100}, {700, 650}, {100, 650}};
    cv::fillPoly(page, std::vector<std::vector<cv::Point>>{triangle}, cv::Scalar(0, 0, 0));

    ImageNormalizer::NormalizerParams params;
    ASSERT_THROWS(ImageNormalizer::detectGridCorners(page, params), GridDetectionError,
                  "triangle boundary should raise GridDetectionError");
    PASS("triangle_is_not_a_grid");
}

TEST(blank_page_has_no_contours) {
    cv::Mat page(400, 400, CV_8UC3, cv::Scalar(255, 255, 255));
    ImageNormalizer::NormalizerParams params;
    ASSERT_THROWS(ImageNormalizer::detectGridCorners(page, params), GridDetectionError,
                  "blank page should raise GridDetectionError");
    PASS("blank_page_has_no_contours");
}

// --- Full normalization ---

TEST(normalize_produces_square_canvas) {
    ImageNormalizer::NormalizerParams params;
    auto normalized = ImageNormalizer::normalize(framed_page(), params);

    ASSERT(normalized.canvas.rows == 1000 && normalized.canvas.cols == 1000, "canvas should be 1000x1000");
    ASSERT(normalized.canvas.channels() == 3, "canvas should stay BGR");
    ASSERT(normalized.corners.size() == 4, "four source corners expected");
    ASSERT(normalized.gridSize >= params.minGridSize && normalized.gridSize <= params.maxGridSize,
           "grid size " << normalized.gridSize << " outside clamp range");

    // The page interior is white and should stay white after warping
    cv::Vec3b center = normalized.canvas.at<cv::Vec3b>(500, 500);
    ASSERT(center[0] > 200 && center[1] > 200 && center[2] > 200, "canvas center should be white");
    PASS("normalize_produces_square_canvas");
}

TEST(normalize_accepts_grayscale_and_bgra) {
    ImageNormalizer::NormalizerParams params;
    cv::Mat gray, bgra;
    cv::cvtColor(framed_page(), gray, cv::COLOR_BGR2GRAY);
    cv::cvtColor(framed_page(), bgra, cv::COLOR_BGR2BGRA);

    ASSERT(ImageNormalizer::normalize(gray, params).canvas.channels() == 3, "gray input should yield BGR canvas");
    ASSERT(ImageNormalizer::normalize(bgra, params).canvas.channels() == 3, "BGRA input should yield BGR canvas");
    PASS("normalize_accepts_grayscale_and_bgra");
}

// --- Grid size estimate ---

TEST(grid_estimate_is_clamped) {
    cv::Mat canvas(1000, 1000, CV_8UC3, cv::Scalar(255, 255, 255));
    for (int p = 0; p < 1000; p += 100) {
        cv::line(canvas, cv::Point(p, 0), cv::Point(p, 999), cv::Scalar(160, 160, 160), 1);
        cv::line(canvas, cv::Point(0, p), cv::Point(999, p), cv::Scalar(160, 160, 160), 1);
    }

    ImageNormalizer::NormalizerParams params;
    int gridSize = ImageNormalizer::estimateGridSize(canvas, params);
    ASSERT(gridSize >= 5 && gridSize <= 50, "grid size " << gridSize << " outside [5, 50]");
    PASS("grid_estimate_is_clamped");
}

TEST(grid_estimate_defaults_on_tiny_canvas) {
    cv::Mat canvas(1, 1, CV_8UC3, cv::Scalar(255, 255, 255));
    ImageNormalizer::NormalizerParams params;
    ASSERT(ImageNormalizer::estimateGridSize(canvas, params) == params.defaultGridSize,
           "1x1 canvas should fall back to the default grid size");
    PASS("grid_estimate_defaults_on_tiny_canvas");
}

// --- Loading ---

TEST(load_missing_image_throws) {
    ASSERT_THROWS(ImageNormalizer::loadImage(std::string(TEST_OUTPUT_DIR) + "/does_not_exist.png"),
                  std::runtime_error, "missing file should throw runtime_error");
    ASSERT_THROWS(ImageNormalizer::loadImage(""), std::invalid_argument, "empty path should throw invalid_argument");
    PASS("load_missing_image_throws");
}

TEST(convert_rejects_two_channels) {
    cv::Mat twoChannel(10, 10, CV_8UC2, cv::Scalar(0, 0));
    ASSERT_THROWS(ImageNormalizer::convertToBGR(twoChannel), std::invalid_argument, "2-channel input should throw");
    ASSERT_THROWS(ImageNormalizer::convertToBGR(cv::Mat()), std::invalid_argument, "empty input should throw");
    PASS("convert_rejects_two_channels");
}

TEST_MAIN()
