#pragma once

#include "ColorSegmenter.hpp"
#include "ColorTable.hpp"
#include "ComponentFilter.hpp"
#include "CoordinateMapper.hpp"
#include "CurveAggregator.hpp"
#include "CurveTypes.hpp"
#include "ImageNormalizer.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace CurveTrace {

struct ExtractionConfig {
    ImageNormalizer::NormalizerParams normalizer;
    ComponentFilter::FilterParams filter;
    CurveAggregator::AggregationParams aggregation;

    std::vector<ColorSpec> colorSpecs = ColorTable::defaultColorSpecs();
    TuningTable tuning = ColorTable::defaultTuning();

    // Caller-supplied representation per base color; unlisted colors use their own name
    std::map<std::string, std::string> labels;

    // Keep the rectified canvas and cleaned masks in the result
    bool keepDebugImages = false;
};

// Called after each pipeline stage with progress in [0, 1].
using ProgressCallback = std::function<void(double progress, const std::string& stage)>;

class CurveExtractor {
public:
    explicit CurveExtractor(ExtractionConfig config = ExtractionConfig());

    const ExtractionConfig& config() const { return m_config; }

    // Throws std::invalid_argument on unusable tuning or parameters.
    static void validateConfig(const ExtractionConfig& config);

    // Normalize -> segment -> filter -> map -> aggregate. The calibration is
    // checked before any pixel is touched.
    ExtractionResult extract(const cv::Mat& image,
                             const AxisCalibration& calibration,
                             const ProgressCallback& onProgress = nullptr) const;

    ExtractionResult extractFromFile(const std::string& path,
                                     const AxisCalibration& calibration,
                                     const ProgressCallback& onProgress = nullptr) const;

    // Skips normalization; the canvas is taken as already rectified.
    ExtractionResult extractFromCanvas(const cv::Mat& canvas,
                                       const AxisCalibration& calibration,
                                       const ProgressCallback& onProgress = nullptr) const;

private:
    ExtractionResult processCanvas(const cv::Mat& canvas,
                                   const AxisCalibration& calibration,
                                   int gridSize,
                                   const ProgressCallback& onProgress) const;

    std::string labelFor(const std::string& baseColor) const;

    const ExtractionConfig m_config;
};

} // namespace CurveTrace
