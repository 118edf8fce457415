#ifndef LUNG_TRACE_API_H
#define LUNG_TRACE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define LUNG_TRACE_VERSION_MAJOR 1
#define LUNG_TRACE_VERSION_MINOR 0
#define LUNG_TRACE_VERSION_PATCH 0

// Error codes returned by every fallible call
typedef enum {
    LUNG_TRACE_SUCCESS = 0,
    LUNG_TRACE_ERROR_INVALID_INPUT = -1,
    LUNG_TRACE_ERROR_UNSUPPORTED_MODALITY = -2,
    LUNG_TRACE_ERROR_INVALID_WINDOW = -3,
    LUNG_TRACE_ERROR_INVALID_PARAMETERS = -4,
    LUNG_TRACE_ERROR_DECODE_FAILED = -5,
    LUNG_TRACE_ERROR_PROCESSING_FAILED = -6
} LungTraceResult;

// Sample type of the raw pixel buffer
typedef enum {
    LUNG_TRACE_PIXEL_INT16 = 0,
    LUNG_TRACE_PIXEL_UINT16 = 1,
    LUNG_TRACE_PIXEL_INT32 = 2
} LungTracePixelType;

// Processing parameters structure
typedef struct {
    double img_min;                 // Lower window bound in HU (default: -1000)
    double img_max;                 // Upper window bound in HU (default: 2000)

    int32_t smoothing_kernel_size;  // Gaussian kernel size, odd (default: 5)

    bool enable_filtering;          // Border/area filtering (default: true)
    double area_min;                // Minimum accepted contour area (default: 3000)
    double area_max;                // Maximum accepted contour area (default: 40000)

    bool enable_subsampling;        // Produce the sampled subset (default: false)
    double keep_probability;        // Per-contour keep probability (default: 0.7)
    uint32_t random_seed;           // Seed for subsampling, 0 = nondeterministic (default: 0)

    bool verbose_output;            // Console logging (default: false)
} LungTraceParams;

// Raw slice as decoded by the caller
typedef struct {
    const void* pixels;             // Row-major, rows * cols samples
    int32_t rows;
    int32_t cols;
    LungTracePixelType pixel_type;
    const char* modality;           // Must be "CT"
    bool has_rescale_slope;
    double rescale_slope;
    bool has_rescale_intercept;
    double rescale_intercept;
} LungTraceSlice;

// Point structure in [row, col] order
typedef struct {
    int32_t row;
    int32_t col;
} LungTracePoint;

// Contour data structure
typedef struct {
    char id[32];                    // "contour_<index>"
    LungTracePoint* points;
    int32_t point_count;
} LungTraceContour;

typedef struct {
    LungTraceContour* contours;
    int32_t contour_count;
} LungTraceContourList;

// Result of one segmentation call
typedef struct {
    LungTraceContourList all_contours;
    LungTraceContourList valid_contours;
    LungTraceContourList sampled_contours;  // Empty unless subsampling is enabled
    int32_t threshold;
} LungTraceContourSet;

// Error callback function type for detailed error reporting
typedef void (*LungTraceErrorCallback)(LungTraceResult error_code, const char* error_message);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void lung_trace_get_default_params(LungTraceParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return LUNG_TRACE_SUCCESS if valid, error code otherwise
 */
LungTraceResult lung_trace_validate_params(const LungTraceParams* params);

/**
 * Segment one CT slice into lung contour candidates
 * @param slice Raw slice (pixels are copied, caller keeps ownership)
 * @param params Processing parameters (use lung_trace_get_default_params if NULL)
 * @param result Contour set to fill (caller must free with lung_trace_free_contour_set)
 * @param error_callback Optional error callback for detailed error reporting
 * @return LUNG_TRACE_SUCCESS if successful, error code otherwise
 */
LungTraceResult lung_trace_segment_slice(
    const LungTraceSlice* slice,
    const LungTraceParams* params,
    LungTraceContourSet* result,
    LungTraceErrorCallback error_callback
);

// Memory management functions

/**
 * Free contour memory allocated by lung_trace_segment_slice
 * @param result Pointer to contour set to free
 */
void lung_trace_free_contour_set(LungTraceContourSet* result);

// Utility functions

/**
 * Get human-readable error message for error code
 * @param error_code Error code from LungTraceResult
 * @return Static string describing the error (do not free)
 */
const char* lung_trace_get_error_message(LungTraceResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* lung_trace_get_version(void);

#ifdef __cplusplus
}
#endif

#endif // LUNG_TRACE_API_H
