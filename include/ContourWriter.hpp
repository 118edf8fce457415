#pragma once

#include "SegmentationTypes.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace LungTrace {

// Serializes segmentation geometry as JSON:
// {"threshold": t, "all_contours": {"contour_0": [[row, col], ...], ...},
//  "valid_contours": {...}, "sampled_contours": {...}}
class ContourWriter {
public:
    static std::string toJSON(const SegmentationResult& result, bool includeSampled);
    static bool saveContoursAsJSON(const SegmentationResult& result, bool includeSampled,
                                   const std::string& outputPath);

private:
    static void writeCollection(cv::FileStorage& fs, const std::string& name,
                                const ContourCollection& contours);
};

} // namespace LungTrace
