#include "LungTraceAPI.h"
#include "SliceProcessor.hpp"
#include <iostream>
#include <cstring>
#include <cstdlib>

using namespace LungTrace;

// Internal helper functions
namespace {

    // Convert C parameters to C++ parameters
    SliceProcessor::ProcessingParams convertParams(const LungTraceParams* params) {
        SliceProcessor::ProcessingParams cpp_params;
        if (params) {
            cpp_params.imgMin = params->img_min;
            cpp_params.imgMax = params->img_max;
            cpp_params.smoothingKernelSize = params->smoothing_kernel_size;

            cpp_params.enableFiltering = params->enable_filtering;
            cpp_params.areaMin = params->area_min;
            cpp_params.areaMax = params->area_max;

            cpp_params.enableSubsampling = params->enable_subsampling;
            cpp_params.keepProbability = params->keep_probability;

            cpp_params.verboseOutput = params->verbose_output;
        }
        return cpp_params;
    }

    int pixelTypeToCv(LungTracePixelType type) {
        switch (type) {
            case LUNG_TRACE_PIXEL_INT16: return CV_16SC1;
            case LUNG_TRACE_PIXEL_UINT16: return CV_16UC1;
            case LUNG_TRACE_PIXEL_INT32: return CV_32SC1;
        }
        return -1;
    }

    // Wraps the caller's buffer without copying; calibration makes the first copy
    ScanSlice convertSlice(const LungTraceSlice* slice) {
        ScanSlice cpp_slice;
        cpp_slice.modality = slice->modality ? slice->modality : "";
        cpp_slice.pixels = cv::Mat(slice->rows, slice->cols, pixelTypeToCv(slice->pixel_type),
                                   const_cast<void*>(slice->pixels));
        if (slice->has_rescale_slope) {
            cpp_slice.rescaleSlope = slice->rescale_slope;
        }
        if (slice->has_rescale_intercept) {
            cpp_slice.rescaleIntercept = slice->rescale_intercept;
        }
        return cpp_slice;
    }

    // Convert C++ contour collection to C contour list
    void convertContours(const ContourCollection& cpp_contours, LungTraceContourList* c_list) {
        c_list->contour_count = static_cast<int32_t>(cpp_contours.size());
        c_list->contours = nullptr;
        if (c_list->contour_count == 0) return;

        c_list->contours = static_cast<LungTraceContour*>(
            calloc(c_list->contour_count, sizeof(LungTraceContour)));

        int i = 0;
        for (const auto& [id, contour] : cpp_contours) {
            LungTraceContour& c_contour = c_list->contours[i++];
            strncpy(c_contour.id, id.c_str(), sizeof(c_contour.id) - 1);
            c_contour.point_count = static_cast<int32_t>(contour.size());

            if (c_contour.point_count > 0) {
                c_contour.points = static_cast<LungTracePoint*>(
                    malloc(sizeof(LungTracePoint) * c_contour.point_count));
                for (int k = 0; k < c_contour.point_count; k++) {
                    c_contour.points[k].row = contour[k].y;
                    c_contour.points[k].col = contour[k].x;
                }
            } else {
                c_contour.points = nullptr;
            }
        }
    }

    void freeContours(LungTraceContourList* c_list) {
        if (!c_list->contours) return;
        for (int i = 0; i < c_list->contour_count; i++) {
            free(c_list->contours[i].points);
        }
        free(c_list->contours);
        c_list->contours = nullptr;
        c_list->contour_count = 0;
    }

    LungTraceResult statusToResult(SegmentationStatus status) {
        switch (status) {
            case SegmentationStatus::Success: return LUNG_TRACE_SUCCESS;
            case SegmentationStatus::UnsupportedModality: return LUNG_TRACE_ERROR_UNSUPPORTED_MODALITY;
            case SegmentationStatus::InvalidWindow: return LUNG_TRACE_ERROR_INVALID_WINDOW;
            case SegmentationStatus::InvalidParameters: return LUNG_TRACE_ERROR_INVALID_PARAMETERS;
            case SegmentationStatus::DecodeFailed: return LUNG_TRACE_ERROR_DECODE_FAILED;
            case SegmentationStatus::ProcessingFailed: return LUNG_TRACE_ERROR_PROCESSING_FAILED;
        }
        return LUNG_TRACE_ERROR_PROCESSING_FAILED;
    }

    void reportError(LungTraceErrorCallback callback, LungTraceResult code, const char* message) {
        if (callback) {
            callback(code, message);
        }
    }
}

// API Implementation

void lung_trace_get_default_params(LungTraceParams* params) {
    if (!params) return;

    // Window covering lung parenchyma through bone
    params->img_min = -1000.0;
    params->img_max = 2000.0;

    params->smoothing_kernel_size = 5;

    // Lung-sized regions on a 512x512 slice
    params->enable_filtering = true;
    params->area_min = 3000.0;
    params->area_max = 40000.0;

    params->enable_subsampling = false;
    params->keep_probability = 0.7;
    params->random_seed = 0;

    params->verbose_output = false;
}

LungTraceResult lung_trace_validate_params(const LungTraceParams* params) {
    if (!params) return LUNG_TRACE_ERROR_INVALID_PARAMETERS;

    if (!(params->img_max > params->img_min)) {
        return LUNG_TRACE_ERROR_INVALID_WINDOW;
    }

    if (params->smoothing_kernel_size <= 0 || params->smoothing_kernel_size % 2 == 0) {
        return LUNG_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->area_min < 0.0 || params->area_max < params->area_min) {
        return LUNG_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->keep_probability < 0.0 || params->keep_probability > 1.0) {
        return LUNG_TRACE_ERROR_INVALID_PARAMETERS;
    }

    return LUNG_TRACE_SUCCESS;
}

LungTraceResult lung_trace_segment_slice(
    const LungTraceSlice* slice,
    const LungTraceParams* params,
    LungTraceContourSet* result,
    LungTraceErrorCallback error_callback
) {
    if (!slice || !result) {
        reportError(error_callback, LUNG_TRACE_ERROR_INVALID_INPUT, "Invalid input parameters");
        return LUNG_TRACE_ERROR_INVALID_INPUT;
    }

    // Initialize result
    std::memset(result, 0, sizeof(LungTraceContourSet));

    if (!slice->pixels || slice->rows <= 0 || slice->cols <= 0 || pixelTypeToCv(slice->pixel_type) < 0) {
        reportError(error_callback, LUNG_TRACE_ERROR_INVALID_INPUT, "Slice has no usable pixel buffer");
        return LUNG_TRACE_ERROR_INVALID_INPUT;
    }

    // Validate parameters
    LungTraceParams default_params;
    if (!params) {
        lung_trace_get_default_params(&default_params);
        params = &default_params;
    }

    LungTraceResult validation_result = lung_trace_validate_params(params);
    if (validation_result != LUNG_TRACE_SUCCESS) {
        reportError(error_callback, validation_result, lung_trace_get_error_message(validation_result));
        return validation_result;
    }

    SliceProcessor::ProcessingParams cpp_params = convertParams(params);
    std::mt19937 rng;
    if (params->random_seed != 0) {
        rng.seed(params->random_seed);
    } else {
        std::random_device entropy;
        rng.seed(entropy());
    }

    SegmentationOutcome outcome = SliceProcessor::segmentSlice(convertSlice(slice), cpp_params, rng);
    if (!outcome.ok()) {
        LungTraceResult code = statusToResult(outcome.status);
        reportError(error_callback, code, outcome.message.c_str());
        return code;
    }

    try {
        convertContours(outcome.result.allContours, &result->all_contours);
        convertContours(outcome.result.validContours, &result->valid_contours);
        convertContours(outcome.result.sampledContours, &result->sampled_contours);
        result->threshold = outcome.result.threshold;
    } catch (const std::exception& e) {
        lung_trace_free_contour_set(result);
        reportError(error_callback, LUNG_TRACE_ERROR_PROCESSING_FAILED, e.what());
        return LUNG_TRACE_ERROR_PROCESSING_FAILED;
    }

    return LUNG_TRACE_SUCCESS;
}

void lung_trace_free_contour_set(LungTraceContourSet* result) {
    if (!result) return;
    freeContours(&result->all_contours);
    freeContours(&result->valid_contours);
    freeContours(&result->sampled_contours);
    result->threshold = 0;
}

const char* lung_trace_get_error_message(LungTraceResult error_code) {
    switch (error_code) {
        case LUNG_TRACE_SUCCESS: return "Success";
        case LUNG_TRACE_ERROR_INVALID_INPUT: return "Invalid input - slice or result pointer missing";
        case LUNG_TRACE_ERROR_UNSUPPORTED_MODALITY: return "Unsupported modality - only CT slices are accepted";
        case LUNG_TRACE_ERROR_INVALID_WINDOW: return "Invalid window - img_max must be greater than img_min";
        case LUNG_TRACE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case LUNG_TRACE_ERROR_DECODE_FAILED: return "Slice could not be decoded into pixel data";
        case LUNG_TRACE_ERROR_PROCESSING_FAILED: return "Segmentation failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* lung_trace_get_version(void) {
    return "1.0.0";
}
