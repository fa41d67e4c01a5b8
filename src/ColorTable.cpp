#include "ColorTable.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace CurveTrace {

const BaseColorTuning& TuningTable::lookup(const string& baseColor) const {
    auto it = overrides.find(baseColor);
    if (it == overrides.end()) {
        return defaults;
    }
    return it->second;
}

BaseColorTuning& TuningTable::entry(const string& baseColor) {
    auto it = overrides.find(baseColor);
    if (it == overrides.end()) {
        it = overrides.emplace(baseColor, defaults).first;
    }
    return it->second;
}

vector<ColorSpec> ColorTable::defaultColorSpecs() {
    // Red wraps around the hue circle, so it needs two ranges
    return {
        {"red",     Scalar(0, 100, 100),   Scalar(10, 255, 255),  "red"},
        {"red2",    Scalar(170, 100, 100), Scalar(180, 255, 255), "red"},
        {"blue",    Scalar(90, 100, 100),  Scalar(130, 255, 255), "blue"},
        {"green",   Scalar(40, 100, 100),  Scalar(80, 255, 255),  "green"},
        {"yellow",  Scalar(15, 100, 100),  Scalar(40, 255, 255),  "yellow"},
        {"cyan",    Scalar(80, 100, 100),  Scalar(100, 255, 255), "cyan"},
        {"magenta", Scalar(140, 100, 100), Scalar(170, 255, 255), "magenta"},
        {"orange",  Scalar(5, 100, 100),   Scalar(20, 255, 255),  "orange"},
        {"purple",  Scalar(125, 100, 100), Scalar(145, 255, 255), "purple"}
    };
}

TuningTable ColorTable::defaultTuning() {
    TuningTable table;
    table.defaults = BaseColorTuning{1400, 11};

    // Thicker strokes on red and blue traces need wider smoothing windows
    table.overrides["red"]  = BaseColorTuning{1400, 20};
    table.overrides["blue"] = BaseColorTuning{1400, 17};
    return table;
}

vector<string> ColorTable::baseColors(const vector<ColorSpec>& specs) {
    vector<string> result;
    for (const auto& spec : specs) {
        if (find(result.begin(), result.end(), spec.baseColor) == result.end()) {
            result.push_back(spec.baseColor);
        }
    }
    return result;
}

vector<ColorSpec> ColorTable::selectColors(const vector<ColorSpec>& specs, const vector<string>& names) {
    if (names.empty()) {
        return specs;
    }

    vector<ColorSpec> selected;
    for (const auto& spec : specs) {
        bool listed = find_if(names.begin(), names.end(), [&](const string& name) {
            return name == spec.name || name == spec.baseColor;
        }) != names.end();
        if (listed) {
            selected.push_back(spec);
        }
    }

    for (const auto& name : names) {
        bool known = find_if(specs.begin(), specs.end(), [&](const ColorSpec& spec) {
            return name == spec.name || name == spec.baseColor;
        }) != specs.end();
        if (!known) {
            cout << "[WARN] Selected color '" << name << "' is not in the color table, ignoring" << endl;
        }
    }

    if (selected.empty()) {
        throw invalid_argument("None of the selected colors is in the color table");
    }
    cout << "[INFO] Extracting " << selected.size() << " of " << specs.size() << " color classes" << endl;
    return selected;
}

vector<GraphPreset> ColorTable::graphPresets() {
    vector<GraphPreset> presets;

    GraphPreset output;
    output.name = "output";
    output.xAxisName = "Vds";
    output.yAxisName = "Id";
    output.thirdColumnName = "Vgs";
    output.calibration = AxisCalibration{0.0, 3.0, 0.0, 2.75, ScaleType::Linear, ScaleType::Linear};
    output.xScale = 1.0;
    output.yScale = 10.0;
    output.labels = {{"red", "5"}, {"blue", "2"}, {"green", "4"}, {"yellow", "3"}};
    output.outputFilename = "output_characteristics";
    presets.push_back(output);

    GraphPreset transfer;
    transfer.name = "transfer";
    transfer.xAxisName = "Vgs";
    transfer.yAxisName = "Id";
    transfer.thirdColumnName = "Temperature";
    transfer.calibration = AxisCalibration{0.0, 5.0, 0.0, 2.75, ScaleType::Linear, ScaleType::Linear};
    transfer.xScale = 1.0;
    transfer.yScale = 10.0;
    transfer.labels = {{"red", "25"}, {"blue", "125"}};
    transfer.outputFilename = "transfer_characteristics";
    presets.push_back(transfer);

    GraphPreset capacitance;
    capacitance.name = "capacitance";
    capacitance.xAxisName = "vds";
    capacitance.yAxisName = "c";
    capacitance.thirdColumnName = "type";
    capacitance.calibration = AxisCalibration{0.0, 15.0, 0.0, 10.0, ScaleType::Linear, ScaleType::Linear};
    capacitance.xScale = 1.0;
    capacitance.yScale = 10.0;
    capacitance.labels = {{"red", "Coss"}, {"green", "Ciss"}, {"yellow", "Crss"}};
    capacitance.outputFilename = "capacitance_characteristics";
    presets.push_back(capacitance);

    GraphPreset resistance;
    resistance.name = "resistance";
    resistance.xAxisName = "Vgs";
    resistance.yAxisName = "Rds";
    resistance.thirdColumnName = "Temp";
    resistance.calibration = AxisCalibration{0.0, 5.0, 0.0, 8.0, ScaleType::Linear, ScaleType::Linear};
    resistance.xScale = 1.0;
    resistance.yScale = 10.0;
    resistance.labels = {{"red", "25"}, {"blue", "125"}};
    resistance.outputFilename = "Rds_on_vs_Vgs";
    presets.push_back(resistance);

    GraphPreset custom;
    custom.name = "custom";
    custom.xAxisName = "X";
    custom.yAxisName = "Y";
    custom.thirdColumnName = "Label";
    custom.calibration = AxisCalibration{0.0, 10.0, 0.0, 100.0, ScaleType::Linear, ScaleType::Linear};
    custom.outputFilename = "custom_output";
    presets.push_back(custom);

    return presets;
}

GraphPreset ColorTable::findPreset(const string& name) {
    for (const auto& preset : graphPresets()) {
        if (preset.name == name) {
            return preset;
        }
    }
    throw invalid_argument("Unknown graph preset: " + name);
}

} // namespace CurveTrace
