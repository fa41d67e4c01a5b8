#include "CurveTraceAPI.h"
#include "CurveExtractor.hpp"
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <new>

using namespace CurveTrace;

// Internal helper functions
namespace {

    void copyName(char* dst, size_t capacity, const std::string& src) {
        std::strncpy(dst, src.c_str(), capacity - 1);
        dst[capacity - 1] = '\0';
    }

    // Fixed-size fields coming from the caller are never read past their array
    std::string fixedString(const char* src, size_t capacity) {
        return std::string(src, strnlen(src, capacity));
    }

    bool isTerminated(const char* src, size_t capacity) {
        return std::memchr(src, '\0', capacity) != nullptr;
    }

    // Convert C parameters to C++ configuration
    ExtractionConfig convertParams(const CurveTraceParams* params) {
        ExtractionConfig config;
        if (!params) {
            return config;
        }

        config.normalizer.canvasSize = params->canvas_size;
        config.normalizer.cannyLower = params->canny_lower;
        config.normalizer.cannyUpper = params->canny_upper;
        config.normalizer.cannyAperture = params->canny_aperture;
        config.normalizer.polygonEpsilonFactor = params->polygon_epsilon_factor;

        config.filter.morphKernelSize = params->morph_kernel_size;

        config.aggregation.binWidth = params->bin_width;
        config.aggregation.maxBinStdDev = params->max_bin_std_dev;

        config.tuning.defaults.minComponentArea = params->default_min_component_area;
        config.tuning.defaults.smoothingWindow = params->default_smoothing_window;
        config.tuning.overrides.clear();

        for (int i = 0; i < params->color_override_count; i++) {
            const CurveTraceColorOverride& entry = params->color_overrides[i];
            std::string baseColor = fixedString(entry.base_color, sizeof(entry.base_color));

            BaseColorTuning& tuning = config.tuning.entry(baseColor);
            tuning.minComponentArea = entry.min_component_area;
            tuning.smoothingWindow = entry.smoothing_window;

            if (entry.label[0] != '\0') {
                config.labels[baseColor] = fixedString(entry.label, sizeof(entry.label));
            }
        }

        std::vector<std::string> selected;
        for (int i = 0; i < params->selected_color_count; i++) {
            selected.push_back(fixedString(params->selected_colors[i], sizeof(params->selected_colors[i])));
        }
        config.colorSpecs = ColorTable::selectColors(config.colorSpecs, selected);

        config.keepDebugImages = params->enable_debug_output;
        return config;
    }

    AxisCalibration convertCalibration(const CurveTraceCalibration* calibration) {
        AxisCalibration cpp_calibration;
        cpp_calibration.xMin = calibration->x_min;
        cpp_calibration.xMax = calibration->x_max;
        cpp_calibration.yMin = calibration->y_min;
        cpp_calibration.yMax = calibration->y_max;
        cpp_calibration.xScaleType = calibration->x_scale_type == CURVE_TRACE_SCALE_LOG ? ScaleType::Log : ScaleType::Linear;
        cpp_calibration.yScaleType = calibration->y_scale_type == CURVE_TRACE_SCALE_LOG ? ScaleType::Log : ScaleType::Linear;
        return cpp_calibration;
    }

    // Convert C++ result to C result set
    void convertResult(const ExtractionResult& cpp_result, CurveTraceResultSet* c_result) {
        c_result->grid_size = cpp_result.gridSize;
        c_result->curve_count = static_cast<int32_t>(cpp_result.curves.size());
        c_result->curves = nullptr;

        if (c_result->curve_count == 0) {
            return;
        }

        c_result->curves = static_cast<CurveTraceCurve*>(calloc(c_result->curve_count, sizeof(CurveTraceCurve)));
        if (!c_result->curves) {
            throw std::bad_alloc();
        }

        int i = 0;
        for (const auto& [baseColor, series] : cpp_result.curves) {
            CurveTraceCurve& curve = c_result->curves[i++];
            copyName(curve.base_color, sizeof(curve.base_color), baseColor);
            copyName(curve.label, sizeof(curve.label), series.label);
            curve.point_count = static_cast<int32_t>(series.points.size());
            curve.points = static_cast<CurveTracePoint*>(malloc(sizeof(CurveTracePoint) * curve.point_count));
            if (!curve.points) {
                throw std::bad_alloc();
            }

            for (int p = 0; p < curve.point_count; p++) {
                curve.points[p].x = series.points[p].x;
                curve.points[p].y = series.points[p].y;
            }
        }
    }

    // Debug images use the same numbered naming as the debug stack: 01_canvas.png, 02_mask_red.png, ...
    void saveDebugImages(const ExtractionResult& result, const std::string& outputPath) {
        std::error_code ec;
        std::filesystem::create_directories(outputPath, ec);
        if (ec) {
            std::cout << "[WARNING] Could not create debug directory " << outputPath << ": " << ec.message() << std::endl;
            return;
        }

        std::vector<std::pair<cv::Mat, std::string>> stack;
        stack.emplace_back(result.canvas, "canvas");
        for (const auto& [baseColor, mask] : result.cleanedMasks) {
            stack.emplace_back(mask, "mask_" + baseColor);
        }

        for (size_t i = 0; i < stack.size(); i++) {
            char indexStr[4];
            snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
            std::string fullPath = (std::filesystem::path(outputPath) / (std::string(indexStr) + "_" + stack[i].second + ".png")).string();

            if (cv::imwrite(fullPath, stack[i].first)) {
                std::cout << "[DEBUG] Saved: " << fullPath << std::endl;
            } else {
                std::cout << "[WARNING] Failed to save: " << fullPath << std::endl;
            }
        }
    }

    // Convert C++ exception to error code
    CurveTraceStatus reportFailure(CurveTraceStatus status, const std::exception& e, CurveTraceErrorCallback error_callback) {
        if (error_callback) {
            error_callback(status, e.what());
        }
        return status;
    }

    CurveTraceStatus classifyRuntimeError(const std::runtime_error& e) {
        std::string what = e.what();
        if (what.find("Failed to load image") != std::string::npos) {
            return CURVE_TRACE_ERROR_IMAGE_LOAD_FAILED;
        } else if (what.find("too small") != std::string::npos) {
            return CURVE_TRACE_ERROR_IMAGE_TOO_SMALL;
        }
        return CURVE_TRACE_ERROR_PROCESSING_FAILED;
    }

    // Progress reporting helper
    void reportProgress(CurveTraceProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }
}

// API Implementation

void curve_trace_get_default_params(CurveTraceParams* params) {
    if (!params) return;

    std::memset(params, 0, sizeof(CurveTraceParams));

    params->canvas_size = 1000;

    params->canny_lower = 50.0;
    params->canny_upper = 150.0;
    params->canny_aperture = 3;
    params->polygon_epsilon_factor = 0.02;

    params->morph_kernel_size = 3;
    params->default_min_component_area = 1400;

    params->bin_width = 0.01;
    params->max_bin_std_dev = 0.3;
    params->default_smoothing_window = 11;

    // Mirror the built-in tuning table
    TuningTable tuning = ColorTable::defaultTuning();
    params->color_override_count = 0;
    for (const auto& [baseColor, entry] : tuning.overrides) {
        if (params->color_override_count >= CURVE_TRACE_MAX_COLOR_OVERRIDES) break;
        CurveTraceColorOverride& slot = params->color_overrides[params->color_override_count++];
        copyName(slot.base_color, sizeof(slot.base_color), baseColor);
        slot.min_component_area = entry.minComponentArea;
        slot.smoothing_window = entry.smoothingWindow;
        slot.label[0] = '\0';
    }

    params->enable_debug_output = false;
    copyName(params->debug_output_path, sizeof(params->debug_output_path), "./debug/");
}

CurveTraceStatus curve_trace_validate_params(const CurveTraceParams* params) {
    if (!params) return CURVE_TRACE_ERROR_INVALID_PARAMETERS;

    if (params->canvas_size < 100 || params->canvas_size > 10000) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    // Canny edge detection parameters
    if (params->canny_lower < 0.0 || params->canny_lower > 500.0 ||
        params->canny_upper < 0.0 || params->canny_upper > 500.0 ||
        params->canny_lower >= params->canny_upper) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->canny_aperture < 3 || params->canny_aperture > 7 || params->canny_aperture % 2 == 0) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->polygon_epsilon_factor < 0.001 || params->polygon_epsilon_factor > 0.2) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->morph_kernel_size < 1 || params->morph_kernel_size > 15) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->default_min_component_area < 0 || params->default_min_component_area > 1000000) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->bin_width <= 0.0 || params->max_bin_std_dev < 0.0) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    // The local fit is cubic, so a window needs at least 4 points
    if (params->default_smoothing_window < 4 || params->default_smoothing_window > 501) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->color_override_count < 0 || params->color_override_count > CURVE_TRACE_MAX_COLOR_OVERRIDES) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    for (int i = 0; i < params->color_override_count; i++) {
        const CurveTraceColorOverride& entry = params->color_overrides[i];
        if (!isTerminated(entry.base_color, sizeof(entry.base_color)) ||
            !isTerminated(entry.label, sizeof(entry.label))) {
            return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
        }
        if (entry.base_color[0] == '\0' ||
            entry.min_component_area < 0 || entry.min_component_area > 1000000 ||
            entry.smoothing_window < 4 || entry.smoothing_window > 501) {
            return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
        }
    }

    if (params->selected_color_count < 0 || params->selected_color_count > CURVE_TRACE_MAX_SELECTED_COLORS) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    for (int i = 0; i < params->selected_color_count; i++) {
        const char* name = params->selected_colors[i];
        if (!isTerminated(name, sizeof(params->selected_colors[i])) || name[0] == '\0') {
            return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
        }
    }

    if (!isTerminated(params->debug_output_path, sizeof(params->debug_output_path))) {
        return CURVE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    return CURVE_TRACE_SUCCESS;
}

CurveTraceStatus curve_trace_validate_calibration(const CurveTraceCalibration* calibration) {
    if (!calibration) return CURVE_TRACE_ERROR_INVALID_CALIBRATION;

    try {
        CoordinateMapper::validateCalibration(convertCalibration(calibration));
    } catch (const CalibrationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return CURVE_TRACE_ERROR_INVALID_CALIBRATION;
    }
    return CURVE_TRACE_SUCCESS;
}

CurveTraceStatus curve_trace_extract_curves(
    const char* input_path,
    const CurveTraceCalibration* calibration,
    const CurveTraceParams* params,
    CurveTraceResultSet* result,
    CurveTraceProgressCallback progress_callback,
    CurveTraceErrorCallback error_callback
) {
    if (!input_path || !calibration || !result) {
        if (error_callback) {
            error_callback(CURVE_TRACE_ERROR_INVALID_INPUT, "Invalid input parameters");
        }
        return CURVE_TRACE_ERROR_INVALID_INPUT;
    }

    // Initialize result
    result->curves = nullptr;
    result->curve_count = 0;
    result->grid_size = 0;

    // Calibration is rejected before the image is even opened
    try {
        CoordinateMapper::validateCalibration(convertCalibration(calibration));
    } catch (const CalibrationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return reportFailure(CURVE_TRACE_ERROR_INVALID_CALIBRATION, e, error_callback);
    }

    // Check file exists
    std::ifstream file(input_path);
    if (!file.good()) {
        if (error_callback) {
            error_callback(CURVE_TRACE_ERROR_FILE_NOT_FOUND, "Input file not found or not readable");
        }
        return CURVE_TRACE_ERROR_FILE_NOT_FOUND;
    }

    // Validate parameters
    CurveTraceParams default_params;
    if (!params) {
        curve_trace_get_default_params(&default_params);
        params = &default_params;
    }

    CurveTraceStatus validation_result = curve_trace_validate_params(params);
    if (validation_result != CURVE_TRACE_SUCCESS) {
        if (error_callback) {
            error_callback(validation_result, "Invalid processing parameters");
        }
        return validation_result;
    }

    try {
        reportProgress(progress_callback, 0.0, "Loading image");

        CurveExtractor extractor(convertParams(params));
        ExtractionResult cpp_result = extractor.extractFromFile(
            input_path,
            convertCalibration(calibration),
            [progress_callback](double progress, const std::string& stage) {
                reportProgress(progress_callback, progress, stage.c_str());
            });

        if (params->enable_debug_output) {
            saveDebugImages(cpp_result, fixedString(params->debug_output_path, sizeof(params->debug_output_path)));
        }

        if (cpp_result.curves.empty()) {
            if (error_callback) {
                error_callback(CURVE_TRACE_ERROR_NO_CURVES, "No configured color produced a curve");
            }
            result->grid_size = cpp_result.gridSize;
            return CURVE_TRACE_ERROR_NO_CURVES;
        }

        convertResult(cpp_result, result);
        return CURVE_TRACE_SUCCESS;

    } catch (const GridDetectionError& e) {
        return reportFailure(CURVE_TRACE_ERROR_NO_GRID, e, error_callback);
    } catch (const CalibrationError& e) {
        return reportFailure(CURVE_TRACE_ERROR_INVALID_CALIBRATION, e, error_callback);
    } catch (const std::invalid_argument& e) {
        return reportFailure(CURVE_TRACE_ERROR_INVALID_PARAMETERS, e, error_callback);
    } catch (const std::bad_alloc& e) {
        curve_trace_free_result(result);
        return reportFailure(CURVE_TRACE_ERROR_PROCESSING_FAILED, e, error_callback);
    } catch (const std::runtime_error& e) {
        return reportFailure(classifyRuntimeError(e), e, error_callback);
    } catch (const std::exception& e) {
        return reportFailure(CURVE_TRACE_ERROR_PROCESSING_FAILED, e, error_callback);
    }
}

CurveTraceStatus curve_trace_survey_colors(
    const char* input_path,
    int32_t min_pixels,
    CurveTraceColorPresence** colors,
    int32_t* color_count,
    CurveTraceErrorCallback error_callback
) {
    if (!input_path || !colors || !color_count || min_pixels < 0) {
        if (error_callback) {
            error_callback(CURVE_TRACE_ERROR_INVALID_INPUT, "Invalid input parameters");
        }
        return CURVE_TRACE_ERROR_INVALID_INPUT;
    }

    *colors = nullptr;
    *color_count = 0;

    try {
        cv::Mat image = ImageNormalizer::loadImage(input_path);
        std::vector<ColorSegmenter::ColorPresence> detected =
            ColorSegmenter::surveyColors(image, ColorTable::defaultColorSpecs(), min_pixels);

        if (detected.empty()) {
            return CURVE_TRACE_SUCCESS;
        }

        *colors = static_cast<CurveTraceColorPresence*>(calloc(detected.size(), sizeof(CurveTraceColorPresence)));
        if (!*colors) {
            throw std::bad_alloc();
        }

        for (size_t i = 0; i < detected.size(); i++) {
            CurveTraceColorPresence& presence = (*colors)[i];
            copyName(presence.name, sizeof(presence.name), detected[i].name);
            copyName(presence.base_color, sizeof(presence.base_color), detected[i].baseColor);
            copyName(presence.hex_color, sizeof(presence.hex_color), detected[i].hexColor);
            presence.pixel_count = detected[i].pixelCount;
            presence.confidence = detected[i].confidence;
        }
        *color_count = static_cast<int32_t>(detected.size());
        return CURVE_TRACE_SUCCESS;

    } catch (const std::invalid_argument& e) {
        return reportFailure(CURVE_TRACE_ERROR_INVALID_INPUT, e, error_callback);
    } catch (const std::runtime_error& e) {
        return reportFailure(classifyRuntimeError(e), e, error_callback);
    } catch (const std::exception& e) {
        return reportFailure(CURVE_TRACE_ERROR_PROCESSING_FAILED, e, error_callback);
    }
}

void curve_trace_free_result(CurveTraceResultSet* result) {
    if (result && result->curves) {
        for (int i = 0; i < result->curve_count; i++) {
            free(result->curves[i].points);
        }
        free(result->curves);
        result->curves = nullptr;
        result->curve_count = 0;
    }
}

void curve_trace_free_colors(CurveTraceColorPresence* colors) {
    free(colors);
}

const char* curve_trace_get_error_message(CurveTraceStatus error_code) {
    switch (error_code) {
        case CURVE_TRACE_SUCCESS: return "Success";
        case CURVE_TRACE_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case CURVE_TRACE_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case CURVE_TRACE_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case CURVE_TRACE_ERROR_IMAGE_TOO_SMALL: return "Image too small - minimum 100x100 pixels required";
        case CURVE_TRACE_ERROR_NO_GRID: return "Could not detect the rectangular plot boundary - ensure the grid frame is visible";
        case CURVE_TRACE_ERROR_INVALID_CALIBRATION: return "Invalid axis calibration - maximum must exceed minimum (and be positive on log axes)";
        case CURVE_TRACE_ERROR_NO_CURVES: return "No curves found - check colors and minimum component area";
        case CURVE_TRACE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case CURVE_TRACE_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* curve_trace_get_version(void) {
    return "1.0.0";
}

bool curve_trace_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return false;
    }
}

double curve_trace_estimate_processing_time(const char* image_path) {
    if (!image_path) return -1.0;

    try {
        cv::Mat img = cv::imread(image_path);
        if (img.empty()) return -1.0;

        // Most of the time goes into the DFT and per-color passes over the fixed canvas
        int64_t pixels = static_cast<int64_t>(img.rows) * img.cols;
        double base_time = 0.5;
        double pixel_factor = static_cast<double>(pixels) / (1920.0 * 1080.0);

        return base_time * (1.0 + pixel_factor);

    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return -1.0;
    }
}
