#include "ContourWriter.hpp"
#include <iostream>
#include <fstream>

namespace LungTrace {

void ContourWriter::writeCollection(cv::FileStorage& fs, const std::string& name,
                                    const ContourCollection& contours) {
    fs << name << "{";
    for (const auto& [id, contour] : contours) {
        fs << id << "[";
        for (const auto& point : contour) {
            // Wire order is [row, col]
            fs << "[:" << point.y << point.x << "]";
        }
        fs << "]";
    }
    fs << "}";
}

std::string ContourWriter::toJSON(const SegmentationResult& result, bool includeSampled) {
    cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
    fs << "threshold" << result.threshold;
    writeCollection(fs, "all_contours", result.allContours);
    writeCollection(fs, "valid_contours", result.validContours);
    if (includeSampled) {
        writeCollection(fs, "sampled_contours", result.sampledContours);
    }
    return fs.releaseAndGetString();
}

bool ContourWriter::saveContoursAsJSON(const SegmentationResult& result, bool includeSampled,
                                       const std::string& outputPath) {
    try {
        std::string json = toJSON(result, includeSampled);

        std::ofstream out(outputPath, std::ios::binary);
        if (!out) {
            std::cerr << "[ERROR] Cannot open " << outputPath << " for writing." << std::endl;
            return false;
        }
        out << json;
        if (!out.good()) {
            std::cerr << "[ERROR] Failed to write contour JSON." << std::endl;
            return false;
        }
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] Exception while serializing contours: " << e.what() << std::endl;
        return false;
    }
}

} // namespace LungTrace
