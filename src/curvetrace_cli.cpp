#include <CurveTraceAPI.h>
#include <ColorTable.hpp>
#include <iostream>
#include <string>
#include <fstream>
#include <cstring>
#include <map>
#include <vector>
#include <stdexcept>

using namespace std;

struct Arguments {
    string inputPath;
    string outputPath;
    bool valid = false;
    bool verbose = false;
    bool debug = false;
    bool survey = false;

    // Axis calibration (custom preset defaults)
    string preset = "custom";
    map<string, double> axisBounds;    // x_min/x_max/y_min/y_max given on the command line
    bool logX = false;
    bool logY = false;

    // Export naming and multipliers
    string xAxisName;
    string yAxisName;
    string thirdColumnName;
    double xScale = 0.0;               // 0 = take from preset
    double yScale = 0.0;

    // Tuning
    int canvasSize = 1000;
    double binWidth = 0.01;
    map<string, int> minAreas;         // "" = default for all colors
    map<string, int> smoothWindows;
    map<string, string> labels;
    vector<string> colors;             // empty = every configured color
};

// Splits "red=1200" into ("red", "1200"); a bare value applies to every color.
static pair<string, string> splitColorAssignment(const string& value) {
    size_t eq = value.find('=');
    if (eq == string::npos) {
        return {"", value};
    }
    return {value.substr(0, eq), value.substr(eq + 1)};
}

static vector<string> splitList(const string& value) {
    vector<string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == string::npos) comma = value.size();
        string item = value.substr(start, comma - start);
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }
    return items;
}

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
            args.inputPath = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && (i + 1 < argc)) {
            args.outputPath = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if (arg == "--survey") {
            args.survey = true;
        } else if ((arg == "-p" || arg == "--preset") && (i + 1 < argc)) {
            args.preset = argv[++i];
        } else if ((arg == "--x-min" || arg == "--x-max" || arg == "--y-min" || arg == "--y-max") && (i + 1 < argc)) {
            string key = arg.substr(2);
            key[1] = '_';
            args.axisBounds[key] = stod(argv[++i]);
        } else if (arg == "--log-x") {
            args.logX = true;
        } else if (arg == "--log-y") {
            args.logY = true;
        } else if ((arg == "--x-name") && (i + 1 < argc)) {
            args.xAxisName = argv[++i];
        } else if ((arg == "--y-name") && (i + 1 < argc)) {
            args.yAxisName = argv[++i];
        } else if ((arg == "--third-column") && (i + 1 < argc)) {
            args.thirdColumnName = argv[++i];
        } else if ((arg == "--x-scale") && (i + 1 < argc)) {
            args.xScale = stod(argv[++i]);
        } else if ((arg == "--y-scale") && (i + 1 < argc)) {
            args.yScale = stod(argv[++i]);
        } else if ((arg == "--canvas-size") && (i + 1 < argc)) {
            args.canvasSize = stoi(argv[++i]);
        } else if ((arg == "--bin-width") && (i + 1 < argc)) {
            args.binWidth = stod(argv[++i]);
        } else if ((arg == "--min-area") && (i + 1 < argc)) {
            auto [color, value] = splitColorAssignment(argv[++i]);
            args.minAreas[color] = stoi(value);
        } else if ((arg == "--smooth-window") && (i + 1 < argc)) {
            auto [color, value] = splitColorAssignment(argv[++i]);
            args.smoothWindows[color] = stoi(value);
        } else if ((arg == "--label") && (i + 1 < argc)) {
            auto [color, value] = splitColorAssignment(argv[++i]);
            if (color.empty()) {
                throw invalid_argument("--label expects <color>=<text>");
            }
            args.labels[color] = value;
        } else if ((arg == "--colors") && (i + 1 < argc)) {
            args.colors = splitList(argv[++i]);
            if (args.colors.empty()) {
                throw invalid_argument("--colors expects a comma-separated list, e.g. red,blue");
            }
        } else if (arg == "--help" || arg == "-h") {
            return args; // Will trigger usage display
        }
    }

    if (args.inputPath.empty()) {
        return args;
    }

    // Auto-generate output path if not provided
    if (args.outputPath.empty()) {
        size_t dotPos = args.inputPath.find_last_of('.');
        if (dotPos == string::npos) {
            args.outputPath = args.inputPath + ".csv";
        } else {
            args.outputPath = args.inputPath.substr(0, dotPos) + ".csv";
        }
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "CurveTrace CLI - Digitize datasheet characteristic curves into data series\n"
         << "Using libcurvetrace v" << curve_trace_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <graph_image> [-o <output_csv>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path\n"
         << "\n"
         << "Calibration:\n"
         << "  -p, --preset <name>  output | transfer | capacitance | resistance | custom (default: custom)\n"
         << "  --x-min <v> --x-max <v>  X value at the left and right plot edges\n"
         << "  --y-min <v> --y-max <v>  Y value at the bottom and top plot edges\n"
         << "  --log-x, --log-y  Logarithmic axis (bounds must be positive)\n"
         << "\n"
         << "Export:\n"
         << "  -o, --output  Output CSV file path (auto-generated if not specified)\n"
         << "  --x-name, --y-name, --third-column <text>  Column headers\n"
         << "  --x-scale, --y-scale <factor>  Multiply exported values\n"
         << "  --label <color>=<text>  What a curve represents, e.g. red=25\n"
         << "\n"
         << "Selection:\n"
         << "  --colors <list>  Only extract these colors, e.g. red,blue or red2 (default: all)\n"
         << "\n"
         << "Tuning:\n"
         << "  --min-area [<color>=]<px>  Minimum connected component area (default: 1400)\n"
         << "  --smooth-window [<color>=]<n>  Smoothing window (default: red 20, blue 17, others 11)\n"
         << "  --bin-width <v>  X bin width in axis units (default: 0.01)\n"
         << "  --canvas-size <px>  Rectified canvas side length (default: 1000)\n"
         << "\n"
         << "General:\n"
         << "  --survey      List the curve colors present in the image and exit\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Save the rectified canvas and cleaned masks to ./debug/\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i graph.png --x-max 10 --y-max 100\n"
         << "  " << progName << " -i idvd.png -p output --label red=5 --label blue=2\n"
         << "  " << progName << " -i graph.png --min-area red=900 --smooth-window 15\n"
         << "  " << progName << " -i graph.png --colors red,blue\n"
         << "  " << progName << " -i graph.png --survey\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage) {
    cout << "[PROGRESS] " << stage << ": " << (int)(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(CurveTraceStatus error_code, const char* error_message) {
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

static CurveTraceColorOverride* findOrAddOverride(CurveTraceParams& params, const string& color) {
    for (int i = 0; i < params.color_override_count; i++) {
        if (color == params.color_overrides[i].base_color) {
            return &params.color_overrides[i];
        }
    }
    if (params.color_override_count >= CURVE_TRACE_MAX_COLOR_OVERRIDES) {
        throw invalid_argument("Too many per-color overrides");
    }

    CurveTraceColorOverride* entry = &params.color_overrides[params.color_override_count++];
    strncpy(entry->base_color, color.c_str(), sizeof(entry->base_color) - 1);
    entry->base_color[sizeof(entry->base_color) - 1] = '\0';
    entry->min_component_area = params.default_min_component_area;
    entry->smoothing_window = params.default_smoothing_window;
    entry->label[0] = '\0';
    return entry;
}

static bool writeSeries(const CurveTraceResultSet& result, const string& outputPath,
                        const string& xName, const string& yName, const string& thirdName,
                        double xScale, double yScale) {
    ofstream out(outputPath);
    if (!out.good()) {
        cerr << "[ERROR] Cannot open output file: " << outputPath << endl;
        return false;
    }

    out << xName << "," << yName << "," << thirdName << "\n";
    for (int c = 0; c < result.curve_count; c++) {
        const CurveTraceCurve& curve = result.curves[c];
        for (int p = 0; p < curve.point_count; p++) {
            out << curve.points[p].x * xScale << ","
                << curve.points[p].y * yScale << ","
                << curve.label << "\n";
        }
    }
    return out.good();
}

static int runSurvey(const Arguments& args) {
    CurveTraceColorPresence* colors = nullptr;
    int32_t count = 0;
    CurveTraceStatus status = curve_trace_survey_colors(args.inputPath.c_str(), 500, &colors, &count, errorCallback);
    if (status != CURVE_TRACE_SUCCESS) {
        cerr << "[ERROR] Color survey failed: " << curve_trace_get_error_message(status) << endl;
        return 1;
    }

    cout << "[INFO] " << count << " colors detected" << endl;
    for (int i = 0; i < count; i++) {
        cout << "  " << colors[i].name << " (" << colors[i].base_color << ") "
             << colors[i].hex_color << " pixels=" << colors[i].pixel_count
             << " confidence=" << colors[i].confidence << endl;
    }
    curve_trace_free_colors(colors);
    return 0;
}

int main(int argc, char* argv[]) {
    Arguments args;
    CurveTrace::GraphPreset preset;
    try {
        args = parseArguments(argc, argv);
        if (args.valid) {
            preset = CurveTrace::ColorTable::findPreset(args.preset);
        }
    } catch (const exception& e) {
        cerr << "[ERROR] Invalid argument: " << e.what() << endl;
        return 1;
    }

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] CurveTrace CLI v" << curve_trace_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.outputPath << endl;
    }

    // Validate input file
    if (!curve_trace_is_valid_image_file(args.inputPath.c_str())) {
        cerr << "[ERROR] Input file is not a valid image or does not exist: " << args.inputPath << endl;
        return 1;
    }

    if (args.survey) {
        return runSurvey(args);
    }

    // Calibration: preset first, then explicit bounds
    CurveTraceCalibration calibration;
    calibration.x_min = preset.calibration.xMin;
    calibration.x_max = preset.calibration.xMax;
    calibration.y_min = preset.calibration.yMin;
    calibration.y_max = preset.calibration.yMax;
    calibration.x_scale_type = args.logX ? CURVE_TRACE_SCALE_LOG : CURVE_TRACE_SCALE_LINEAR;
    calibration.y_scale_type = args.logY ? CURVE_TRACE_SCALE_LOG : CURVE_TRACE_SCALE_LINEAR;
    for (const auto& [key, value] : args.axisBounds) {
        if (key == "x_min") calibration.x_min = value;
        else if (key == "x_max") calibration.x_max = value;
        else if (key == "y_min") calibration.y_min = value;
        else if (key == "y_max") calibration.y_max = value;
    }

    if (curve_trace_validate_calibration(&calibration) != CURVE_TRACE_SUCCESS) {
        cerr << "[ERROR] Invalid axis calibration. Maximum must exceed minimum, and log axes need a positive minimum." << endl;
        return 1;
    }

    // Get default parameters
    CurveTraceParams params;
    curve_trace_get_default_params(&params);
    params.canvas_size = args.canvasSize;
    params.bin_width = args.binWidth;

    try {
        if (args.minAreas.count("")) {
            params.default_min_component_area = args.minAreas.at("");
            for (int i = 0; i < params.color_override_count; i++) {
                params.color_overrides[i].min_component_area = params.default_min_component_area;
            }
        }
        if (args.smoothWindows.count("")) {
            params.default_smoothing_window = args.smoothWindows.at("");
            for (int i = 0; i < params.color_override_count; i++) {
                params.color_overrides[i].smoothing_window = params.default_smoothing_window;
            }
        }
        for (const auto& [color, area] : args.minAreas) {
            if (!color.empty()) findOrAddOverride(params, color)->min_component_area = area;
        }
        for (const auto& [color, window] : args.smoothWindows) {
            if (!color.empty()) findOrAddOverride(params, color)->smoothing_window = window;
        }

        // Preset labels, then explicit ones
        map<string, string> labels = preset.labels;
        for (const auto& [color, label] : args.labels) {
            labels[color] = label;
        }
        for (const auto& [color, label] : labels) {
            CurveTraceColorOverride* entry = findOrAddOverride(params, color);
            strncpy(entry->label, label.c_str(), sizeof(entry->label) - 1);
            entry->label[sizeof(entry->label) - 1] = '\0';
        }

        if (args.colors.size() > CURVE_TRACE_MAX_SELECTED_COLORS) {
            throw invalid_argument("At most " + to_string(CURVE_TRACE_MAX_SELECTED_COLORS) + " colors can be selected");
        }
        for (const string& color : args.colors) {
            if (color.size() >= CURVE_TRACE_NAME_LENGTH) {
                throw invalid_argument("Color name too long: " + color);
            }
            char* slot = params.selected_colors[params.selected_color_count++];
            strncpy(slot, color.c_str(), CURVE_TRACE_NAME_LENGTH - 1);
            slot[CURVE_TRACE_NAME_LENGTH - 1] = '\0';
        }
    } catch (const invalid_argument& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return 1;
    }

    // Enable debug output if requested
    if (args.debug) {
        params.enable_debug_output = true;
        cout << "[INFO] Debug mode enabled - images will be saved to " << params.debug_output_path << endl;
    }

    // Validate parameters
    CurveTraceStatus validation_result = curve_trace_validate_params(&params);
    if (validation_result != CURVE_TRACE_SUCCESS) {
        cerr << "[ERROR] Invalid parameters: " << curve_trace_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Preset: " << preset.name << endl;
        cout << "  X axis: " << calibration.x_min << " .. " << calibration.x_max
             << (args.logX ? " (log)" : " (linear)") << endl;
        cout << "  Y axis: " << calibration.y_min << " .. " << calibration.y_max
             << (args.logY ? " (log)" : " (linear)") << endl;
        cout << "  Canvas: " << params.canvas_size << "x" << params.canvas_size << "px" << endl;
        cout << "  Bin width: " << params.bin_width << endl;
        cout << "  Min component area: " << params.default_min_component_area << "px" << endl;
        cout << "  Smoothing window: " << params.default_smoothing_window << endl;
        if (params.selected_color_count > 0) {
            cout << "  Colors:";
            for (int i = 0; i < params.selected_color_count; i++) {
                cout << " " << params.selected_colors[i];
            }
            cout << endl;
        }
        for (int i = 0; i < params.color_override_count; i++) {
            const CurveTraceColorOverride& entry = params.color_overrides[i];
            cout << "    " << entry.base_color << ": area " << entry.min_component_area
                 << ", window " << entry.smoothing_window;
            if (entry.label[0] != '\0') {
                cout << ", label " << entry.label;
            }
            cout << endl;
        }

        double estimated_time = curve_trace_estimate_processing_time(args.inputPath.c_str());
        if (estimated_time > 0) {
            cout << "  Estimated time: " << estimated_time << "s" << endl;
        }
    }

    CurveTraceResultSet result = {nullptr, 0, 0};
    CurveTraceStatus status = curve_trace_extract_curves(
        args.inputPath.c_str(),
        &calibration,
        &params,
        &result,
        args.verbose ? progressCallback : nullptr,
        args.verbose ? errorCallback : nullptr
    );

    if (status != CURVE_TRACE_SUCCESS) {
        cerr << "[ERROR] Processing failed: " << curve_trace_get_error_message(status) << endl;
        return 1;
    }

    cout << "[INFO] Estimated grid size: " << result.grid_size << "x" << result.grid_size << endl;
    for (int c = 0; c < result.curve_count; c++) {
        cout << "[INFO] " << result.curves[c].base_color << " (" << result.curves[c].label << "): "
             << result.curves[c].point_count << " points" << endl;
    }

    string xName = args.xAxisName.empty() ? preset.xAxisName : args.xAxisName;
    string yName = args.yAxisName.empty() ? preset.yAxisName : args.yAxisName;
    string thirdName = args.thirdColumnName.empty() ? preset.thirdColumnName : args.thirdColumnName;
    double xScale = args.xScale != 0.0 ? args.xScale : preset.xScale;
    double yScale = args.yScale != 0.0 ? args.yScale : preset.yScale;

    bool written = writeSeries(result, args.outputPath, xName, yName, thirdName, xScale, yScale);
    curve_trace_free_result(&result);

    if (!written) {
        cerr << "[ERROR] Failed to write output file." << endl;
        return 1;
    }

    cout << "[SUCCESS] Extraction completed successfully!" << endl;
    cout << "[INFO] Output saved to: " << args.outputPath << endl;
    return 0;
}
