#include "SliceProcessor.hpp"
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>

using namespace cv;
using namespace std;

namespace LungTrace {

const char* statusName(SegmentationStatus status) {
    switch (status) {
        case SegmentationStatus::Success: return "Success";
        case SegmentationStatus::UnsupportedModality: return "UnsupportedModality";
        case SegmentationStatus::InvalidWindow: return "InvalidWindow";
        case SegmentationStatus::InvalidParameters: return "InvalidParameters";
        case SegmentationStatus::DecodeFailed: return "DecodeFailed";
        case SegmentationStatus::ProcessingFailed: return "ProcessingFailed";
    }
    return "Unknown";
}

void SliceProcessor::validateParams(const ProcessingParams& params) {
    if (!(params.imgMax > params.imgMin)) {
        throw InvalidWindowError(params.imgMin, params.imgMax);
    }
    if (params.smoothingKernelSize <= 0 || params.smoothingKernelSize % 2 == 0) {
        throw InvalidParametersError("Smoothing kernel size must be a positive odd number, got " +
                                     to_string(params.smoothingKernelSize));
    }
    if (params.smoothingSigma < 0.0) {
        throw InvalidParametersError("Smoothing sigma cannot be negative");
    }
    if (params.areaMin < 0.0 || params.areaMax < params.areaMin) {
        throw InvalidParametersError("Area range must satisfy 0 <= area_min <= area_max");
    }
    if (params.keepProbability < 0.0 || params.keepProbability > 1.0) {
        throw InvalidParametersError("Keep probability must lie in [0, 1]");
    }
    if (params.overlayThickness <= 0) {
        throw InvalidParametersError("Overlay thickness must be positive");
    }
}

namespace {

ScanSlice makeSlice(const Mat& raster, const string& source, const string& modality,
                    optional<double> rescaleSlope, optional<double> rescaleIntercept) {
    if (raster.empty()) {
        throw DecodeError("Failed to decode slice from " + source);
    }
    if (raster.channels() != 1) {
        throw DecodeError("Slice " + source + " has " + to_string(raster.channels()) +
                          " channels, expected a single-channel raster");
    }
    int depth = raster.depth();
    if (depth != CV_8U && depth != CV_16U && depth != CV_16S && depth != CV_32S) {
        throw DecodeError("Slice " + source + " does not hold integer samples");
    }

    ScanSlice slice;
    slice.pixels = raster;
    slice.modality = modality;
    slice.rescaleSlope = rescaleSlope;
    slice.rescaleIntercept = rescaleIntercept;
    return slice;
}

} // namespace

ScanSlice SliceProcessor::loadSlice(const string& path, const string& modality,
                                    optional<double> rescaleSlope, optional<double> rescaleIntercept) {
    if (path.empty()) {
        throw invalid_argument("Slice path cannot be empty");
    }

    Mat raster = imread(path, IMREAD_UNCHANGED);
    return makeSlice(raster, path, modality, rescaleSlope, rescaleIntercept);
}

ScanSlice SliceProcessor::decodeSlice(const vector<uchar>& bytes, const string& modality,
                                      optional<double> rescaleSlope, optional<double> rescaleIntercept) {
    if (bytes.empty()) {
        throw DecodeError("Slice byte stream is empty");
    }

    Mat raster = imdecode(bytes, IMREAD_UNCHANGED);
    return makeSlice(raster, "byte stream", modality, rescaleSlope, rescaleIntercept);
}

Mat SliceProcessor::calibrate(const ScanSlice& slice) {
    if (slice.modality != kModalityCT) {
        throw UnsupportedModalityError(slice.modality);
    }
    if (slice.pixels.empty()) {
        throw DecodeError("Slice has no pixel data");
    }
    if (slice.pixels.channels() != 1) {
        throw DecodeError("Slice pixel data must be single-channel, got " +
                          to_string(slice.pixels.channels()) + " channels");
    }

    const double slope = slice.rescaleSlope.value_or(1.0);
    const double intercept = slice.rescaleIntercept.value_or(0.0);

    Mat hu;
    slice.pixels.convertTo(hu, CV_64F, slope, intercept);
    return hu;
}

Mat SliceProcessor::applyWindow(const Mat& calibrated, double imgMin, double imgMax) {
    if (!(imgMax > imgMin)) {
        throw InvalidWindowError(imgMin, imgMax);
    }

    Mat values;
    if (calibrated.depth() == CV_64F) {
        values = calibrated;
    } else {
        calibrated.convertTo(values, CV_64F);
    }

    const double range = imgMax - imgMin;
    Mat windowed(values.size(), CV_8UC1);
    for (int y = 0; y < values.rows; y++) {
        const double* src = values.ptr<double>(y);
        uchar* dst = windowed.ptr<uchar>(y);
        for (int x = 0; x < values.cols; x++) {
            double v = std::min(std::max(src[x], imgMin), imgMax);
            // Truncate, do not round
            dst[x] = static_cast<uchar>((v - imgMin) / range * 255.0);
        }
    }
    return windowed;
}

Mat SliceProcessor::smooth(const Mat& normalized, int kernelSize, double sigma) {
    if (kernelSize <= 0 || kernelSize % 2 == 0) {
        throw InvalidParametersError("Smoothing kernel size must be a positive odd number, got " +
                                     to_string(kernelSize));
    }
    Mat blurred;
    GaussianBlur(normalized, blurred, Size(kernelSize, kernelSize), sigma, sigma, BORDER_REPLICATE);
    return blurred;
}

SliceProcessor::Histogram SliceProcessor::computeHistogram(const Mat& gray) {
    if (gray.type() != CV_8UC1) {
        throw invalid_argument("Histogram requires a single-channel 8-bit image");
    }

    int histSize = 256;
    float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};
    Mat hist;
    calcHist(&gray, 1, nullptr, Mat(), hist, 1, &histSize, ranges);

    Histogram histogram{};
    for (int i = 0; i < histSize; i++) {
        histogram[i] = static_cast<double>(hist.at<float>(i));
    }
    return histogram;
}

int SliceProcessor::computeOtsuThreshold(const Histogram& histogram) {
    double total = 0.0;
    double weightedSum = 0.0;
    for (int i = 0; i < 256; i++) {
        total += histogram[i];
        weightedSum += i * histogram[i];
    }
    if (total <= 0.0) {
        return 0;
    }

    // Class 0 holds {pixels <= t}, class 1 holds {pixels > t}
    double w0 = 0.0;
    double sum0 = 0.0;
    double bestVariance = -1.0;
    int bestThreshold = 0;

    for (int t = 0; t < 256; t++) {
        w0 += histogram[t];
        sum0 += t * histogram[t];
        double w1 = total - w0;
        if (w0 <= 0.0 || w1 <= 0.0) continue;

        double mu0 = sum0 / w0;
        double mu1 = (weightedSum - sum0) / w1;
        double p0 = w0 / total;
        double p1 = w1 / total;
        double variance = p0 * p1 * (mu0 - mu1) * (mu0 - mu1);

        // Strict comparison keeps the lowest threshold on ties
        if (variance > bestVariance) {
            bestVariance = variance;
            bestThreshold = t;
        }
    }
    return bestThreshold;
}

Mat SliceProcessor::binarize(const Mat& smoothed, int threshold) {
    Mat mask;
    // Dark pixels (air in the windowed scale) become foreground
    cv::threshold(smoothed, mask, threshold, 255, THRESH_BINARY_INV);
    return mask;
}

Mat SliceProcessor::binarizeOtsu(const Mat& smoothed, int* chosenThreshold) {
    int t = computeOtsuThreshold(computeHistogram(smoothed));
    if (chosenThreshold) {
        *chosenThreshold = t;
    }
    return binarize(smoothed, t);
}

string SliceProcessor::contourId(size_t index) {
    return "contour_" + to_string(index);
}

ContourCollection SliceProcessor::extractContours(const Mat& mask) {
    ContourCollection collection;
    if (mask.empty()) {
        return collection;
    }
    if (mask.type() != CV_8UC1) {
        throw invalid_argument("Contour extraction requires a single-channel 8-bit mask");
    }

    vector<vector<Point>> contours;
    findContours(mask, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    for (size_t i = 0; i < contours.size(); i++) {
        collection.emplace(contourId(i), std::move(contours[i]));
    }
    return collection;
}

bool SliceProcessor::touchesBorder(const Contour& contour, int height, int width) {
    for (const Point& pt : contour) {
        if (pt.x == 0 || pt.x == width - 1 || pt.y == 0 || pt.y == height - 1) {
            return true;
        }
    }
    return false;
}

double SliceProcessor::contourArea(const Contour& contour) {
    if (contour.empty()) return 0.0;
    return std::abs(cv::contourArea(contour, false));
}

ContourAttributes SliceProcessor::describeContour(const Contour& contour, int height, int width) {
    ContourAttributes attributes;
    attributes.touchesBorder = touchesBorder(contour, height, width);
    attributes.area = contourArea(contour);
    attributes.perimeter = contour.empty() ? 0.0 : arcLength(contour, true);
    return attributes;
}

ContourCollection SliceProcessor::filterContours(const ContourCollection& contours, int height, int width,
                                                 double areaMin, double areaMax, bool verbose) {
    ContourCollection accepted;
    int degenerate = 0, onBorder = 0, outOfRange = 0;

    for (const auto& [id, contour] : contours) {
        if (contour.empty() || arcLength(contour, true) <= 0.0) {
            degenerate++;
            continue;
        }
        if (touchesBorder(contour, height, width)) {
            onBorder++;
            continue;
        }
        double area = contourArea(contour);
        if (area < areaMin || area > areaMax) {
            outOfRange++;
            continue;
        }
        accepted.emplace(id, contour);
    }

    if (verbose) {
        cout << "[INFO] Contour filtering kept " << accepted.size() << " of " << contours.size()
             << " (degenerate: " << degenerate << ", border: " << onBorder
             << ", area out of [" << areaMin << ", " << areaMax << "]: " << outOfRange << ")" << endl;
    }
    return accepted;
}

ContourCollection SliceProcessor::sampleContours(const ContourCollection& contours, double keepProbability,
                                                 mt19937& rng) {
    if (keepProbability < 0.0 || keepProbability > 1.0) {
        throw InvalidParametersError("Keep probability must lie in [0, 1]");
    }

    bernoulli_distribution keep(keepProbability);
    ContourCollection sampled;
    for (const auto& [id, contour] : contours) {
        if (keep(rng)) {
            sampled.emplace(id, contour);
        }
    }
    return sampled;
}

Mat SliceProcessor::renderOverlay(const ContourCollection& contours, const Size& size, int thickness) {
    Mat canvas = Mat::zeros(size, CV_8UC3);

    vector<vector<Point>> outlines;
    outlines.reserve(contours.size());
    for (const auto& entry : contours) {
        outlines.push_back(entry.second);
    }
    if (!outlines.empty()) {
        drawContours(canvas, outlines, -1, Scalar(0, 0, 255), thickness);
    }
    return canvas;
}

vector<uchar> SliceProcessor::renderPreview(const Mat& normalized, bool rotate) {
    if (normalized.empty()) {
        throw invalid_argument("Cannot render preview of an empty image");
    }

    Mat display;
    if (rotate) {
        cv::rotate(normalized, display, ROTATE_90_COUNTERCLOCKWISE);
    } else {
        display = normalized;
    }

    vector<uchar> png;
    if (!imencode(".png", display, png)) {
        throw runtime_error("Failed to encode preview as PNG");
    }
    return png;
}

SegmentationResult SliceProcessor::processSlice(const ScanSlice& slice, const ProcessingParams& params,
                                                mt19937& rng) {
    validateParams(params);

    if (params.verboseOutput) {
        cout << "[INFO] Segmenting " << slice.pixels.cols << " x " << slice.pixels.rows
             << " slice (modality " << slice.modality << ")" << endl;
    }

    SegmentationResult result;
    DebugImageStack debugStack;

    // Stage 1-2: calibrate to HU and window to 8 bit
    Mat hu = calibrate(slice);
    if (params.verboseOutput && (!slice.rescaleSlope || !slice.rescaleIntercept)) {
        cout << "[INFO] Rescale slope/intercept missing, using defaults for the absent values" << endl;
    }
    result.normalized = applyWindow(hu, params.imgMin, params.imgMax);
    pushDebugImage(result.normalized, "windowed", params, debugStack);

    // Stage 3-4: smooth and threshold
    Mat smoothed = smooth(result.normalized, params.smoothingKernelSize, params.smoothingSigma);
    pushDebugImage(smoothed, "smoothed", params, debugStack);

    result.mask = binarizeOtsu(smoothed, &result.threshold);
    if (params.verboseOutput) {
        cout << "[INFO] Otsu threshold: " << result.threshold << endl;
    }
    pushDebugImage(result.mask, "mask", params, debugStack);

    // Stage 5: boundary extraction
    result.allContours = extractContours(result.mask);
    if (params.verboseOutput) {
        cout << "[INFO] Found " << result.allContours.size() << " outer contours" << endl;
    }

    // Stage 6-7: filtering and subsampling
    if (params.enableFiltering) {
        result.validContours = filterContours(result.allContours, result.mask.rows, result.mask.cols,
                                              params.areaMin, params.areaMax, params.verboseOutput);
    } else {
        result.validContours = result.allContours;
    }

    if (params.enableSubsampling) {
        result.sampledContours = sampleContours(result.validContours, params.keepProbability, rng);
        if (params.verboseOutput) {
            cout << "[INFO] Subsampling kept " << result.sampledContours.size() << " of "
                 << result.validContours.size() << " contours (p = " << params.keepProbability << ")" << endl;
        }
    }

    if (result.validContours.empty() && params.verboseOutput) {
        cout << "[WARN] No contours passed filtering" << endl;
    }

    if (params.renderOverlay || params.enableDebugOutput) {
        Mat overlay = renderOverlay(result.validContours, result.mask.size(), params.overlayThickness);
        pushDebugImage(overlay, "overlay", params, debugStack);
        if (params.renderOverlay) {
            result.overlay = overlay;
        }
    }

    if (params.renderPreview) {
        result.previewPng = renderPreview(result.normalized, params.rotatePreview);
    }

    flushDebugStack(params, debugStack);
    return result;
}

SegmentationResult SliceProcessor::processSlice(const ScanSlice& slice, const ProcessingParams& params) {
    random_device entropy;
    mt19937 rng(entropy());
    return processSlice(slice, params, rng);
}

SegmentationOutcome SliceProcessor::segmentSlice(const ScanSlice& slice, const ProcessingParams& params,
                                                 mt19937& rng) {
    SegmentationOutcome outcome;
    try {
        outcome.result = processSlice(slice, params, rng);
        return outcome;
    } catch (const UnsupportedModalityError& e) {
        outcome.status = SegmentationStatus::UnsupportedModality;
        outcome.message = e.what();
    } catch (const InvalidWindowError& e) {
        outcome.status = SegmentationStatus::InvalidWindow;
        outcome.message = e.what();
    } catch (const InvalidParametersError& e) {
        outcome.status = SegmentationStatus::InvalidParameters;
        outcome.message = e.what();
    } catch (const DecodeError& e) {
        outcome.status = SegmentationStatus::DecodeFailed;
        outcome.message = e.what();
    } catch (const exception& e) {
        outcome.status = SegmentationStatus::ProcessingFailed;
        outcome.message = e.what();
    }

    outcome.result = SegmentationResult();
    if (params.verboseOutput) {
        cerr << "[ERROR] Segmentation failed (" << statusName(outcome.status) << "): "
             << outcome.message << endl;
    }
    return outcome;
}

SegmentationOutcome SliceProcessor::segmentSlice(const ScanSlice& slice, const ProcessingParams& params) {
    random_device entropy;
    mt19937 rng(entropy());
    return segmentSlice(slice, params, rng);
}

// Debug visualization methods

void SliceProcessor::pushDebugImage(const Mat& image, const string& name, const ProcessingParams& params,
                                    DebugImageStack& stack) {
    if (!params.enableDebugOutput) return;

    stack.emplace_back(image.clone(), name);
}

void SliceProcessor::flushDebugStack(const ProcessingParams& params, DebugImageStack& stack) {
    if (!params.enableDebugOutput || stack.empty()) return;

    if (params.verboseOutput) {
        cout << "[DEBUG] Flushing " << stack.size() << " debug images..." << endl;
    }

    std::error_code ec;
    std::filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cout << "[WARN] Could not create debug directory " << params.debugOutputPath
             << ": " << ec.message() << endl;
    }

    for (size_t i = 0; i < stack.size(); i++) {
        const auto& [image, name] = stack[i];

        // Format: 01_name.png, 02_name.png, etc.
        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string fullPath = (std::filesystem::path(params.debugOutputPath) /
                           (string(indexStr) + "_" + name + ".png")).string();

        bool success = imwrite(fullPath, image);
        if (!success) {
            cout << "[WARN] Failed to save debug image: " << fullPath << endl;
        } else if (params.verboseOutput) {
            cout << "[DEBUG] Saved: " << fullPath << endl;
        }
    }

    stack.clear();
}

} // namespace LungTrace
