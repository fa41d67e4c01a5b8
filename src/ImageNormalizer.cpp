#include "ImageNormalizer.hpp"
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

namespace CurveTrace {

namespace {

    // Linear interpolation between closest ranks
    double percentile(vector<float> values, double pct) {
        if (values.empty()) return 0.0;
        sort(values.begin(), values.end());
        double rank = pct / 100.0 * static_cast<double>(values.size() - 1);
        size_t lo = static_cast<size_t>(floor(rank));
        size_t hi = min(lo + 1, values.size() - 1);
        double frac = rank - static_cast<double>(lo);
        return values[lo] + (values[hi] - values[lo]) * frac;
    }

    double median(vector<double> values) {
        if (values.empty()) return 0.0;
        size_t mid = values.size() / 2;
        nth_element(values.begin(), values.begin() + mid, values.end());
        double upper = values[mid];
        if (values.size() % 2 == 1) return upper;
        double lower = *max_element(values.begin(), values.begin() + mid);
        return (lower + upper) / 2.0;
    }

    // Moves the zero-frequency term to the center (numpy fftshift semantics)
    Mat shiftSpectrum(const Mat& spectrum) {
        Mat rowsShifted(spectrum.size(), spectrum.type());
        int rows = spectrum.rows;
        int rowShift = rows / 2;
        spectrum.rowRange(0, rows - rowShift).copyTo(rowsShifted.rowRange(rowShift, rows));
        spectrum.rowRange(rows - rowShift, rows).copyTo(rowsShifted.rowRange(0, rowShift));

        Mat shifted(spectrum.size(), spectrum.type());
        int cols = spectrum.cols;
        int colShift = cols / 2;
        rowsShifted.colRange(0, cols - colShift).copyTo(shifted.colRange(colShift, cols));
        rowsShifted.colRange(cols - colShift, cols).copyTo(shifted.colRange(0, colShift));
        return shifted;
    }
}

Mat ImageNormalizer::loadImage(const string& path) {
    if (path.empty()) {
        throw invalid_argument("Image path cannot be empty");
    }

    cout << "[INFO] Loading image from: " << path << endl;
    Mat img = imread(path, IMREAD_COLOR);
    if (img.empty()) {
        cerr << "[ERROR] Could not load image from " << path << endl;
        throw runtime_error("Failed to load image: " + path);
    }

    if (img.rows < 100 || img.cols < 100) {
        throw runtime_error("Image too small (minimum 100x100 pixels required)");
    }

    cout << "[INFO] Image loaded successfully. Shape: " << img.rows << " x " << img.cols << endl;
    return img;
}

Mat ImageNormalizer::convertToBGR(const Mat& img) {
    if (img.empty()) {
        throw invalid_argument("Input image is empty");
    }

    Mat bgr;
    switch (img.channels()) {
        case 1:
            cvtColor(img, bgr, COLOR_GRAY2BGR);
            break;
        case 4:
            cvtColor(img, bgr, COLOR_BGRA2BGR);
            break;
        case 3:
            bgr = img;
            break;
        default:
            throw invalid_argument("Unsupported channel count: " + to_string(img.channels()));
    }
    return bgr;
}

Mat ImageNormalizer::convertToGrayscale(const Mat& img) {
    Mat gray;
    cvtColor(img, gray, COLOR_BGR2GRAY);
    return gray;
}

Mat ImageNormalizer::detectEdges(const Mat& grayImg, const NormalizerParams& params) {
    Mat edges;
    Canny(grayImg, edges, params.cannyLower, params.cannyUpper, params.cannyAperture);
    return edges;
}

vector<Point> ImageNormalizer::findLargestContour(const Mat& edgeImg) {
    vector<vector<Point>> contours;
    findContours(edgeImg, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    if (contours.empty()) {
        cerr << "[ERROR] No contours found in edge image" << endl;
        throw GridDetectionError("No contours found while searching for the plot boundary");
    }

    double maxArea = -1.0;
    int maxIdx = 0;
    for (size_t i = 0; i < contours.size(); i++) {
        double area = contourArea(contours[i]);
        if (area > maxArea) {
            maxArea = area;
            maxIdx = static_cast<int>(i);
        }
    }

    cout << "[INFO] Largest of " << contours.size() << " contours has area " << maxArea << endl;
    return contours[maxIdx];
}

vector<Point> ImageNormalizer::approximatePolygon(const vector<Point>& contour, double epsilonFactor) {
    double perimeter = arcLength(contour, true);
    vector<Point> approx;
    approxPolyDP(contour, approx, epsilonFactor * perimeter, true);
    return approx;
}

vector<Point2f> ImageNormalizer::detectGridCorners(const Mat& bgrImg, const NormalizerParams& params) {
    Mat gray = convertToGrayscale(bgrImg);
    Mat edges = detectEdges(gray, params);
    vector<Point> boundary = findLargestContour(edges);
    vector<Point> approx = approximatePolygon(boundary, params.polygonEpsilonFactor);

    if (approx.size() != 4) {
        cerr << "[ERROR] Plot boundary approximates to " << approx.size() << " vertices, expected 4" << endl;
        throw GridDetectionError("Failed to detect rectangular grid: expected 4 corners, found " +
                                 to_string(approx.size()));
    }

    vector<Point2f> corners;
    for (const Point& pt : approx) {
        corners.emplace_back(static_cast<float>(pt.x), static_cast<float>(pt.y));
    }
    return corners;
}

vector<Point2f> ImageNormalizer::orderCorners(const vector<Point2f>& corners) {
    if (corners.size() != 4) {
        throw GridDetectionError("Expected 4 corners, got " + to_string(corners.size()));
    }

    // Ties on a rotated frame are broken by y for the sum and by -x for the
    // difference, so the labels never depend on the input order
    auto sumCompare = [](const Point2f& a, const Point2f& b) {
        float sa = a.x + a.y, sb = b.x + b.y;
        if (sa != sb) return sa < sb;
        return a.y < b.y;
    };
    auto diffCompare = [](const Point2f& a, const Point2f& b) {
        float da = a.y - a.x, db = b.y - b.x;
        if (da != db) return da < db;
        return a.x > b.x;
    };

    vector<Point2f> ordered(4);
    ordered[0] = *min_element(corners.begin(), corners.end(), sumCompare);   // top-left
    ordered[1] = *min_element(corners.begin(), corners.end(), diffCompare);  // top-right
    ordered[2] = *max_element(corners.begin(), corners.end(), sumCompare);   // bottom-right
    ordered[3] = *max_element(corners.begin(), corners.end(), diffCompare);  // bottom-left

    for (int i = 0; i < 4; i++) {
        for (int j = i + 1; j < 4; j++) {
            if (ordered[i] == ordered[j]) {
                cerr << "[ERROR] Corner roles " << i << " and " << j << " resolve to the same vertex" << endl;
                throw GridDetectionError("Degenerate plot boundary: two corner roles share vertex (" +
                                         to_string(ordered[i].x) + ", " + to_string(ordered[i].y) + ")");
            }
        }
    }

    cout << "[INFO] Corners ordered: TL(" << ordered[0].x << "," << ordered[0].y << ") "
         << "TR(" << ordered[1].x << "," << ordered[1].y << ") "
         << "BR(" << ordered[2].x << "," << ordered[2].y << ") "
         << "BL(" << ordered[3].x << "," << ordered[3].y << ")" << endl;

    return ordered;
}

Mat ImageNormalizer::computeTransform(const vector<Point2f>& orderedCorners, const Size& canvasSize) {
    if (canvasSize.width <= 0 || canvasSize.height <= 0) {
        throw invalid_argument("Canvas size must be positive");
    }

    vector<Point2f> dstPts{
        Point2f(0.0f, 0.0f),
        Point2f(static_cast<float>(canvasSize.width - 1), 0.0f),
        Point2f(static_cast<float>(canvasSize.width - 1), static_cast<float>(canvasSize.height - 1)),
        Point2f(0.0f, static_cast<float>(canvasSize.height - 1))
    };

    return getPerspectiveTransform(orderedCorners, dstPts);
}

Mat ImageNormalizer::warpImage(const Mat& img, const Mat& transform, const Size& canvasSize) {
    if (img.empty()) {
        throw invalid_argument("Input image is empty");
    }

    cout << "[INFO] Warping image to " << canvasSize.width << "x" << canvasSize.height << " canvas" << endl;
    Mat warped;
    warpPerspective(img, warped, transform, canvasSize);
    return warped;
}

int ImageNormalizer::estimateGridSize(const Mat& canvas, const NormalizerParams& params) {
    Mat gray = canvas.channels() == 1 ? canvas : convertToGrayscale(canvas);

    Mat floatGray;
    gray.convertTo(floatGray, CV_32F);

    Mat complexSpectrum;
    dft(floatGray, complexSpectrum, DFT_COMPLEX_OUTPUT);

    vector<Mat> planes;
    split(complexSpectrum, planes);
    Mat magnitudeSpectrum;
    magnitude(planes[0], planes[1], magnitudeSpectrum);
    magnitudeSpectrum += Scalar::all(1);
    log(magnitudeSpectrum, magnitudeSpectrum);
    magnitudeSpectrum *= 20.0;
    magnitudeSpectrum = shiftSpectrum(magnitudeSpectrum);

    int crow = magnitudeSpectrum.rows / 2;
    int ccol = magnitudeSpectrum.cols / 2;
    int radius = min({params.spectrumCropRadius, crow, ccol});
    if (radius <= 0) {
        cout << "[WARN] Canvas too small for grid estimate. Defaulting to "
             << params.defaultGridSize << "x" << params.defaultGridSize << endl;
        return params.defaultGridSize;
    }
    Mat crop = magnitudeSpectrum(Rect(ccol - radius, crow - radius, 2 * radius, 2 * radius));

    vector<float> values;
    values.reserve(crop.total());
    for (int r = 0; r < crop.rows; r++) {
        const float* row = crop.ptr<float>(r);
        values.insert(values.end(), row, row + crop.cols);
    }
    double threshold = percentile(values, params.peakPercentile);

    vector<double> distances;
    for (int r = 0; r < crop.rows; r++) {
        const float* row = crop.ptr<float>(r);
        for (int c = 0; c < crop.cols; c++) {
            if (row[c] > threshold) {
                distances.push_back(hypot(static_cast<double>(r - radius), static_cast<double>(c - radius)));
            }
        }
    }

    if (distances.size() < 4) {
        cout << "[WARN] Unable to detect grid frequency reliably. Defaulting to "
             << params.defaultGridSize << "x" << params.defaultGridSize << endl;
        return params.defaultGridSize;
    }

    double dominantFreq = median(distances) / static_cast<double>(params.spectrumCropRadius);
    int gridSize = params.maxGridSize;
    if (dominantFreq > 0.0) {
        double inverse = 1.0 / dominantFreq;
        gridSize = inverse >= params.maxGridSize ? params.maxGridSize : static_cast<int>(inverse);
    }
    gridSize = clamp(gridSize, params.minGridSize, params.maxGridSize);

    cout << "[INFO] Estimated grid size: " << gridSize << "x" << gridSize << endl;
    return gridSize;
}

ImageNormalizer::NormalizedCanvas ImageNormalizer::normalize(const Mat& img, const NormalizerParams& params) {
    cout << "[INFO] ===== GRID NORMALIZATION =====" << endl;

    Mat bgr = convertToBGR(img);
    Size canvasSize(params.canvasSize, params.canvasSize);

    NormalizedCanvas result;
    result.corners = orderCorners(detectGridCorners(bgr, params));
    result.transform = computeTransform(result.corners, canvasSize);
    result.canvas = warpImage(bgr, result.transform, canvasSize);
    result.gridSize = estimateGridSize(result.canvas, params);

    return result;
}

} // namespace CurveTrace
