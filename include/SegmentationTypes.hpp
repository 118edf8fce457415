#pragma once

#include <opencv2/core.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace LungTrace {

// Modality tag accepted by the calibration stage
inline const std::string kModalityCT = "CT";

// Decoded single-slice scan as handed over by the decoding collaborator.
// Pixels are a single-channel signed or unsigned integer matrix.
struct ScanSlice {
    cv::Mat pixels;
    std::string modality;
    std::optional<double> rescaleSlope;      // Absent means 1.0
    std::optional<double> rescaleIntercept;  // Absent means 0.0
};

using Contour = std::vector<cv::Point>;

// Orders "contour_<index>" keys by index: a shorter decimal suffix sorts first,
// equal lengths compare character by character.
struct ContourIdOrder {
    bool operator()(const std::string& a, const std::string& b) const {
        if (a.size() != b.size()) return a.size() < b.size();
        return a < b;
    }
};

// Keyed by "contour_<index>", index being the discovery order in the mask.
// Iteration follows that order. Filtered copies keep the keys of the
// collection they were taken from.
using ContourCollection = std::map<std::string, Contour, ContourIdOrder>;

struct ContourAttributes {
    double area = 0.0;
    double perimeter = 0.0;
    bool touchesBorder = false;
};

struct SegmentationResult {
    cv::Mat normalized;                  // 8-bit windowed slice
    cv::Mat mask;                        // {0, 255} after thresholding
    int threshold = 0;                   // Otsu threshold on the smoothed slice
    ContourCollection allContours;
    ContourCollection validContours;
    ContourCollection sampledContours;   // Filled only when subsampling is enabled
    cv::Mat overlay;                     // Empty unless overlay rendering is enabled
    std::vector<uchar> previewPng;       // Empty unless preview rendering is enabled
};

enum class SegmentationStatus {
    Success = 0,
    UnsupportedModality,
    InvalidWindow,
    InvalidParameters,
    DecodeFailed,
    ProcessingFailed
};

struct SegmentationOutcome {
    SegmentationStatus status = SegmentationStatus::Success;
    std::string message;
    SegmentationResult result;

    bool ok() const { return status == SegmentationStatus::Success; }
};

class UnsupportedModalityError : public std::runtime_error {
public:
    explicit UnsupportedModalityError(const std::string& modality)
        : std::runtime_error("Only CT images are supported (got modality '" + modality + "')"),
          m_modality(modality) {}

    const std::string& modality() const { return m_modality; }

private:
    std::string m_modality;
};

class InvalidWindowError : public std::invalid_argument {
public:
    InvalidWindowError(double imgMin, double imgMax)
        : std::invalid_argument("Invalid window: img_max (" + std::to_string(imgMax) +
                                ") must be greater than img_min (" + std::to_string(imgMin) + ")") {}
};

class InvalidParametersError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raised by decoders when the input bytes do not hold a usable slice
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* statusName(SegmentationStatus status);

} // namespace LungTrace
