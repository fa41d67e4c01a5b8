#pragma once

#include "CurveTypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace CurveTrace {

// Per-base-color filtering and smoothing constants.
struct BaseColorTuning {
    int minComponentArea = 1400;  // px on the rectified canvas
    int smoothingWindow  = 11;    // points, cubic local fit
};

struct TuningTable {
    BaseColorTuning defaults;
    std::map<std::string, BaseColorTuning> overrides;

    const BaseColorTuning& lookup(const std::string& baseColor) const;

    // Returns a writable entry for baseColor, seeded from the current lookup.
    BaseColorTuning& entry(const std::string& baseColor);
};

// Axis naming, calibration and export multipliers for a known graph type.
struct GraphPreset {
    std::string name;
    std::string xAxisName;
    std::string yAxisName;
    std::string thirdColumnName;
    AxisCalibration calibration;
    double xScale = 1.0;
    double yScale = 1.0;
    std::map<std::string, std::string> labels;  // base color -> representation
    std::string outputFilename;
};

class ColorTable {
public:
    static std::vector<ColorSpec> defaultColorSpecs();
    static TuningTable defaultTuning();

    // Distinct base colors in first-appearance order.
    static std::vector<std::string> baseColors(const std::vector<ColorSpec>& specs);

    // Specs whose name or base color is listed. An empty list keeps every spec.
    // Throws std::invalid_argument when nothing is selected.
    static std::vector<ColorSpec> selectColors(const std::vector<ColorSpec>& specs,
                                               const std::vector<std::string>& names);

    static std::vector<GraphPreset> graphPresets();
    static GraphPreset findPreset(const std::string& name);
};

} // namespace CurveTrace
