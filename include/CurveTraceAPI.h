#ifndef CURVE_TRACE_API_H
#define CURVE_TRACE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define CURVE_TRACE_VERSION_MAJOR 1
#define CURVE_TRACE_VERSION_MINOR 0
#define CURVE_TRACE_VERSION_PATCH 0

#define CURVE_TRACE_MAX_COLOR_OVERRIDES 16
#define CURVE_TRACE_MAX_SELECTED_COLORS 16
#define CURVE_TRACE_NAME_LENGTH 32
#define CURVE_TRACE_LABEL_LENGTH 64

// Error codes
typedef enum {
    CURVE_TRACE_SUCCESS = 0,
    CURVE_TRACE_ERROR_INVALID_INPUT = -1,
    CURVE_TRACE_ERROR_FILE_NOT_FOUND = -2,
    CURVE_TRACE_ERROR_IMAGE_LOAD_FAILED = -3,
    CURVE_TRACE_ERROR_IMAGE_TOO_SMALL = -4,
    CURVE_TRACE_ERROR_NO_GRID = -5,
    CURVE_TRACE_ERROR_INVALID_CALIBRATION = -6,
    CURVE_TRACE_ERROR_NO_CURVES = -7,
    CURVE_TRACE_ERROR_INVALID_PARAMETERS = -8,
    CURVE_TRACE_ERROR_PROCESSING_FAILED = -9
} CurveTraceStatus;

typedef enum {
    CURVE_TRACE_SCALE_LINEAR = 0,
    CURVE_TRACE_SCALE_LOG = 1
} CurveTraceScaleType;

// Logical axis bounds of the plot area
typedef struct {
    double x_min;                   // value at the bottom-left corner
    double x_max;                   // value at the bottom-right corner
    double y_min;                   // value at the bottom-left corner
    double y_max;                   // value at the top-left corner
    int32_t x_scale_type;           // CurveTraceScaleType
    int32_t y_scale_type;           // CurveTraceScaleType
} CurveTraceCalibration;

// Per-base-color tuning; entries replace the defaults for that color
typedef struct {
    char base_color[CURVE_TRACE_NAME_LENGTH];
    int32_t min_component_area;     // Minimum connected component area in canvas pixels
    int32_t smoothing_window;       // Smoothing window length in points
    char label[CURVE_TRACE_LABEL_LENGTH];  // Representation of the curve (empty = color name)
} CurveTraceColorOverride;

// Processing parameters structure
typedef struct {
    int32_t canvas_size;            // Rectified canvas side length (default: 1000)

    // Boundary detection
    double canny_lower;             // Canny lower threshold (default: 50.0)
    double canny_upper;             // Canny upper threshold (default: 150.0)
    int32_t canny_aperture;         // Canny aperture size (default: 3)
    double polygon_epsilon_factor;  // Polygon approximation factor (default: 0.02)

    // Noise filtering
    int32_t morph_kernel_size;      // Opening kernel size (default: 3)
    int32_t default_min_component_area;  // Minimum component area (default: 1400)

    // Aggregation
    double bin_width;               // X bin width in logical units (default: 0.01)
    double max_bin_std_dev;         // Bins more dispersed than this are dropped (default: 0.3)
    int32_t default_smoothing_window;    // Smoothing window for colors without override (default: 11)

    // Per-color overrides (defaults: red window 20, blue window 17)
    CurveTraceColorOverride color_overrides[CURVE_TRACE_MAX_COLOR_OVERRIDES];
    int32_t color_override_count;

    // Colors to extract, by spec name ("red2") or base color ("red").
    // Empty selection extracts every configured color.
    char selected_colors[CURVE_TRACE_MAX_SELECTED_COLORS][CURVE_TRACE_NAME_LENGTH];
    int32_t selected_color_count;

    // Debug visualization
    bool enable_debug_output;       // Save canvas and cleaned masks (default: false)
    char debug_output_path[256];    // Directory for debug images (default: "./debug/")
} CurveTraceParams;

typedef struct {
    double x;
    double y;
} CurveTracePoint;

typedef struct {
    char base_color[CURVE_TRACE_NAME_LENGTH];
    char label[CURVE_TRACE_LABEL_LENGTH];
    CurveTracePoint* points;
    int32_t point_count;
} CurveTraceCurve;

typedef struct {
    CurveTraceCurve* curves;
    int32_t curve_count;
    int32_t grid_size;              // Diagnostic grid density estimate
} CurveTraceResultSet;

typedef struct {
    char name[CURVE_TRACE_NAME_LENGTH];
    char base_color[CURVE_TRACE_NAME_LENGTH];
    char hex_color[8];
    int32_t pixel_count;
    double confidence;
} CurveTraceColorPresence;

// Progress callback function type
typedef void (*CurveTraceProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*CurveTraceErrorCallback)(CurveTraceStatus error_code, const char* error_message);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void curve_trace_get_default_params(CurveTraceParams* params);

/**
 * Validate processing parameters. Every string field must be NUL-terminated
 * within its array.
 * @param params Pointer to parameters to validate
 * @return CURVE_TRACE_SUCCESS if valid, error code otherwise
 */
CurveTraceStatus curve_trace_validate_params(const CurveTraceParams* params);

/**
 * Validate axis calibration (max > min on both axes, positive bounds on log axes)
 * @param calibration Pointer to calibration to validate
 * @return CURVE_TRACE_SUCCESS if valid, CURVE_TRACE_ERROR_INVALID_CALIBRATION otherwise
 */
CurveTraceStatus curve_trace_validate_calibration(const CurveTraceCalibration* calibration);

/**
 * Extract every recognized curve from a graph image
 * @param input_path Path to input image file
 * @param calibration Axis bounds of the plot area
 * @param params Processing parameters (use curve_trace_get_default_params if NULL)
 * @param result Pointer to result set to fill (caller must free with curve_trace_free_result)
 * @param progress_callback Optional progress callback for UI updates
 * @param error_callback Optional error callback for detailed error reporting
 * @return CURVE_TRACE_SUCCESS if at least one curve was extracted, error code otherwise
 */
CurveTraceStatus curve_trace_extract_curves(
    const char* input_path,
    const CurveTraceCalibration* calibration,
    const CurveTraceParams* params,
    CurveTraceResultSet* result,
    CurveTraceProgressCallback progress_callback,
    CurveTraceErrorCallback error_callback
);

/**
 * Report which configured colors are present in an image
 * @param input_path Path to input image file
 * @param min_pixels Minimum pixel count for a color to be reported (typically 500)
 * @param colors Receives a malloc'd array (free with curve_trace_free_colors)
 * @param color_count Receives the array length
 * @param error_callback Optional error callback
 * @return CURVE_TRACE_SUCCESS if successful, error code otherwise
 */
CurveTraceStatus curve_trace_survey_colors(
    const char* input_path,
    int32_t min_pixels,
    CurveTraceColorPresence** colors,
    int32_t* color_count,
    CurveTraceErrorCallback error_callback
);

// Memory management functions

/**
 * Free result memory allocated by curve_trace_extract_curves
 * @param result Pointer to result set to free
 */
void curve_trace_free_result(CurveTraceResultSet* result);

/**
 * Free the array allocated by curve_trace_survey_colors
 * @param colors Array to free
 */
void curve_trace_free_colors(CurveTraceColorPresence* colors);

// Utility functions

/**
 * Get human-readable error message for error code
 * @param error_code Error code from CurveTraceStatus
 * @return Static string describing the error (do not free)
 */
const char* curve_trace_get_error_message(CurveTraceStatus error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* curve_trace_get_version(void);

/**
 * Check if input file appears to be a valid image
 * @param file_path Path to image file
 * @return true if file appears to be a valid image, false otherwise
 */
bool curve_trace_is_valid_image_file(const char* file_path);

/**
 * Get estimated processing time based on image size
 * @param image_path Path to image file
 * @return Estimated processing time in seconds, or -1.0 if image cannot be analyzed
 */
double curve_trace_estimate_processing_time(const char* image_path);

#ifdef __cplusplus
}
#endif

#endif // CURVE_TRACE_API_H
