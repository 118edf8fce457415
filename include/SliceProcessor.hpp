#pragma once

#include "SegmentationTypes.hpp"
#include <opencv2/opencv.hpp>
#include <array>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace LungTrace {

class SliceProcessor {
public:
    struct ProcessingParams {
        // Display window in Hounsfield units, both bounds inclusive
        double imgMin = -1000.0;
        double imgMax = 2000.0;

        // Gaussian smoothing before thresholding (sigma 0 = derived from kernel size)
        int smoothingKernelSize = 5;
        double smoothingSigma = 0.0;

        // Contour filtering parameters
        bool enableFiltering = true;
        double areaMin = 3000.0;
        double areaMax = 40000.0;

        // Random subsampling of accepted contours
        bool enableSubsampling = false;
        double keepProbability = 0.7;

        // Optional visual artifacts
        bool renderOverlay = false;
        int overlayThickness = 2;
        bool renderPreview = false;
        bool rotatePreview = true;       // 90 degrees counter-clockwise for display

        // Debug visualization
        bool enableDebugOutput = false;
        bool verboseOutput = false;
        std::string debugOutputPath = "./debug/";
    };

    // Stage images collected during one call, numbered on flush
    using DebugImageStack = std::vector<std::pair<cv::Mat, std::string>>;

    using Histogram = std::array<double, 256>;

    static void validateParams(const ProcessingParams& params);

    // Decoding collaborators for single-channel integer rasters (16-bit PNG/TIFF);
    // both throw DecodeError on unreadable input
    static ScanSlice loadSlice(const std::string& path, const std::string& modality,
                               std::optional<double> rescaleSlope = std::nullopt,
                               std::optional<double> rescaleIntercept = std::nullopt);
    static ScanSlice decodeSlice(const std::vector<uchar>& bytes, const std::string& modality,
                                 std::optional<double> rescaleSlope = std::nullopt,
                                 std::optional<double> rescaleIntercept = std::nullopt);

    // Pipeline stages
    static cv::Mat calibrate(const ScanSlice& slice);
    static cv::Mat applyWindow(const cv::Mat& calibrated, double imgMin, double imgMax);
    static cv::Mat smooth(const cv::Mat& normalized, int kernelSize, double sigma = 0.0);
    static Histogram computeHistogram(const cv::Mat& gray);
    static int computeOtsuThreshold(const Histogram& histogram);
    static cv::Mat binarize(const cv::Mat& smoothed, int threshold);
    static cv::Mat binarizeOtsu(const cv::Mat& smoothed, int* chosenThreshold = nullptr);
    static ContourCollection extractContours(const cv::Mat& mask);

    // Contour geometry
    static bool touchesBorder(const Contour& contour, int height, int width);
    static double contourArea(const Contour& contour);
    static ContourAttributes describeContour(const Contour& contour, int height, int width);
    static ContourCollection filterContours(const ContourCollection& contours, int height, int width,
                                            double areaMin, double areaMax, bool verbose = false);
    static ContourCollection sampleContours(const ContourCollection& contours, double keepProbability,
                                            std::mt19937& rng);

    // Visual artifacts
    static cv::Mat renderOverlay(const ContourCollection& contours, const cv::Size& size,
                                 int thickness = 2);
    static std::vector<uchar> renderPreview(const cv::Mat& normalized, bool rotate = true);

    // Whole pipeline. processSlice throws the typed errors from SegmentationTypes.hpp,
    // segmentSlice reports them through the returned outcome instead.
    static SegmentationResult processSlice(const ScanSlice& slice, const ProcessingParams& params,
                                           std::mt19937& rng);
    static SegmentationResult processSlice(const ScanSlice& slice, const ProcessingParams& params);
    static SegmentationOutcome segmentSlice(const ScanSlice& slice, const ProcessingParams& params,
                                            std::mt19937& rng);
    static SegmentationOutcome segmentSlice(const ScanSlice& slice, const ProcessingParams& params);

    static std::string contourId(size_t index);

    // Debug stack methods
    static void pushDebugImage(const cv::Mat& image, const std::string& name, const ProcessingParams& params,
                               DebugImageStack& stack);
    static void flushDebugStack(const ProcessingParams& params, DebugImageStack& stack);
};

} // namespace LungTrace
