#include "CurveExtractor.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

using namespace cv;
using namespace std;

namespace CurveTrace {

namespace {
    void reportProgress(const ProgressCallback& callback, double progress, const string& stage) {
        if (callback) {
            callback(progress, stage);
        }
    }
}

CurveExtractor::CurveExtractor(ExtractionConfig config)
    : m_config(std::move(config)) {
    validateConfig(m_config);
}

void CurveExtractor::validateConfig(const ExtractionConfig& config) {
    if (config.normalizer.canvasSize < 100 || config.normalizer.canvasSize > 10000) {
        throw invalid_argument("Canvas size must be within [100, 10000]");
    }
    if (config.normalizer.minGridSize <= 0 || config.normalizer.minGridSize > config.normalizer.maxGridSize) {
        throw invalid_argument("Grid size bounds must satisfy 0 < min <= max");
    }
    if (config.filter.morphKernelSize < 1) {
        throw invalid_argument("Morphological kernel size must be at least 1");
    }
    if (config.filter.connectivity != 4 && config.filter.connectivity != 8) {
        throw invalid_argument("Connectivity must be 4 or 8");
    }
    if (config.aggregation.binWidth <= 0.0) {
        throw invalid_argument("Bin width must be positive");
    }
    if (config.aggregation.maxBinStdDev < 0.0 || config.aggregation.madMultiplier <= 0.0) {
        throw invalid_argument("Outlier thresholds must be positive");
    }
    if (config.colorSpecs.empty()) {
        throw invalid_argument("At least one color spec is required");
    }

    auto checkTuning = [&](const string& name, const BaseColorTuning& tuning) {
        if (tuning.minComponentArea < 0) {
            throw invalid_argument("Minimum component area for " + name + " must not be negative");
        }
        if (tuning.smoothingWindow <= config.aggregation.polyOrder) {
            throw invalid_argument("Smoothing window for " + name + " must exceed the polynomial order (" +
                                   to_string(config.aggregation.polyOrder) + ")");
        }
    };
    checkTuning("default", config.tuning.defaults);
    for (const auto& [baseColor, tuning] : config.tuning.overrides) {
        checkTuning(baseColor, tuning);
    }
}

ExtractionResult CurveExtractor::extract(const Mat& image,
                                         const AxisCalibration& calibration,
                                         const ProgressCallback& onProgress) const {
    cout << "[INFO] Starting curve extraction pipeline..." << endl;
    CoordinateMapper::validateCalibration(calibration);

    reportProgress(onProgress, 0.0, "Normalizing plot area");
    ImageNormalizer::NormalizedCanvas normalized = ImageNormalizer::normalize(image, m_config.normalizer);

    return processCanvas(normalized.canvas, calibration, normalized.gridSize, onProgress);
}

ExtractionResult CurveExtractor::extractFromFile(const string& path,
                                                 const AxisCalibration& calibration,
                                                 const ProgressCallback& onProgress) const {
    CoordinateMapper::validateCalibration(calibration);
    Mat image = ImageNormalizer::loadImage(path);
    return extract(image, calibration, onProgress);
}

ExtractionResult CurveExtractor::extractFromCanvas(const Mat& canvas,
                                                   const AxisCalibration& calibration,
                                                   const ProgressCallback& onProgress) const {
    cout << "[INFO] Starting curve extraction on a rectified canvas..." << endl;
    CoordinateMapper::validateCalibration(calibration);

    Mat bgr = ImageNormalizer::convertToBGR(canvas);
    int gridSize = ImageNormalizer::estimateGridSize(bgr, m_config.normalizer);
    return processCanvas(bgr, calibration, gridSize, onProgress);
}

ExtractionResult CurveExtractor::processCanvas(const Mat& canvas,
                                               const AxisCalibration& calibration,
                                               int gridSize,
                                               const ProgressCallback& onProgress) const {
    ExtractionResult result;
    result.calibration = calibration;
    result.gridSize = gridSize;

    reportProgress(onProgress, 0.3, "Segmenting colors");
    vector<ColorSegmenter::ColorMask> masks = ColorSegmenter::segment(canvas, m_config.colorSpecs);

    reportProgress(onProgress, 0.5, "Filtering noise components");
    map<string, Mat> cleaned = ComponentFilter::filter(masks, m_config.tuning, m_config.filter);

    reportProgress(onProgress, 0.7, "Mapping and aggregating curves");
    for (const auto& [baseColor, mask] : cleaned) {
        vector<CurvePoint> points = CoordinateMapper::mapMask(mask, calibration);
        int window = m_config.tuning.lookup(baseColor).smoothingWindow;

        CurveSeries series = CurveAggregator::aggregate(baseColor, points, window, m_config.aggregation);
        if (series.points.empty()) {
            cout << "[INFO] Every bin of " << baseColor << " was rejected, skipping" << endl;
            continue;
        }
        series.label = labelFor(baseColor);
        result.curves.emplace(baseColor, std::move(series));
    }

    if (m_config.keepDebugImages) {
        result.canvas = canvas.clone();
        result.cleanedMasks = cleaned;
    }

    reportProgress(onProgress, 1.0, "Curve extraction complete");
    cout << "[INFO] Extracted " << result.curves.size() << " curves" << endl;
    return result;
}

string CurveExtractor::labelFor(const string& baseColor) const {
    auto it = m_config.labels.find(baseColor);
    if (it == m_config.labels.end() || it->second.empty()) {
        return baseColor;
    }
    return it->second;
}

} // namespace CurveTrace
