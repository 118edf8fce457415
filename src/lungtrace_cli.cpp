#include "SliceProcessor.hpp"
#include "ContourWriter.hpp"
#include "LungTraceAPI.h"
#include <iostream>
#include <string>
#include <fstream>
#include <optional>
#include <random>

using namespace std;
using namespace LungTrace;

struct Arguments {
    string inputPath;
    string outputPath;
    bool valid = false;
    bool verbose = false;
    bool debug = false;

    // Slice metadata the raster format cannot carry
    string modality = kModalityCT;
    optional<double> slope;
    optional<double> intercept;

    // Window and filtering
    double imgMin = -1000.0;
    double imgMax = 2000.0;
    int kernelSize = 5;
    double areaMin = 3000.0;
    double areaMax = 40000.0;

    // Subsampling
    bool sample = false;
    double keepProbability = 0.7;
    optional<unsigned int> seed;

    bool noPreview = false;
};

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
        } else if ((arg == "--modality") && (i + 1 < argc)) {
            args.modality = argv[++i];
        } else if ((arg == "--slope") && (i + 1 < argc)) {
            args.slope = stod(argv[++i]);
        } else if ((arg == "--intercept") && (i + 1 < argc)) {
            args.intercept = stod(argv[++i]);
        } else if ((arg == "--img-min") && (i + 1 < argc)) {
            args.imgMin = stod(argv[++i]);
        } else if ((arg == "--img-max") && (i + 1 < argc)) {
            args.imgMax = stod(argv[++i]);
        } else if ((arg == "--kernel-size") && (i + 1 < argc)) {
            args.kernelSize = stoi(argv[++i]);
        } else if ((arg == "--area-min") && (i + 1 < argc)) {
            args.areaMin = stod(argv[++i]);
        } else if ((arg == "--area-max") && (i + 1 < argc)) {
            args.areaMax = stod(argv[++i]);
        } else if (arg == "-s" || arg == "--sample") {
            args.sample = true;
        } else if ((arg == "--keep-probability") && (i + 1 < argc)) {
            args.keepProbability = stod(argv[++i]);
            args.sample = true; // Auto-enable when probability is specified
        } else if ((arg == "--seed") && (i + 1 < argc)) {
            args.seed = static_cast<unsigned int>(stoul(argv[++i]));
        } else if (arg == "--no-preview") {
            args.noPreview = true;
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
            args.outputPath = args.inputPath + ".json";
        } else {
            args.outputPath = args.inputPath.substr(0, dotPos) + ".json";
        }
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "LungTrace CLI - Extract lung contour candidates from a CT slice\n"
         << "Using liblungtrace v" << lung_trace_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <slice_image> [-o <output_json>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Single-channel 16-bit slice (PNG or TIFF)\n"
         << "\n"
         << "Optional:\n"
         << "  -o, --output  Output JSON path (auto-generated if not specified)\n"
         << "  --modality <tag>       Modality of the slice (default: CT)\n"
         << "  --slope <value>        Rescale slope (default: 1)\n"
         << "  --intercept <value>    Rescale intercept (default: 0)\n"
         << "\n"
         << "Segmentation:\n"
         << "  --img-min <HU>         Lower window bound (default: -1000)\n"
         << "  --img-max <HU>         Upper window bound (default: 2000)\n"
         << "  --kernel-size <odd>    Gaussian smoothing kernel size (default: 5)\n"
         << "  --area-min <px>        Minimum contour area (default: 3000)\n"
         << "  --area-max <px>        Maximum contour area (default: 40000)\n"
         << "  -s, --sample           Also emit a randomly sampled subset of valid contours\n"
         << "  --keep-probability <p> Keep probability for sampling (default: 0.7, enables sampling)\n"
         << "  --seed <n>             Seed for sampling (default: random)\n"
         << "  --no-preview           Skip writing the preview and overlay PNGs\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Save intermediate stage images to ./debug/\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i slice.png --intercept -1024\n"
         << "  " << progName << " -i slice.tif -o lungs.json --area-min 2000\n"
         << "  " << progName << " -i slice.png -s --seed 42\n"
         << endl;
}

string siblingPath(const string& outputPath, const string& suffix) {
    size_t dotPos = outputPath.find_last_of('.');
    size_t slashPos = outputPath.find_last_of("/\\");
    if (dotPos == string::npos || (slashPos != string::npos && dotPos < slashPos)) {
        return outputPath + suffix;
    }
    return outputPath.substr(0, dotPos) + suffix;
}

int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parseArguments(argc, argv);
    } catch (const exception& e) {
        cerr << "[ERROR] Invalid argument value: " << e.what() << endl;
        return 1;
    }

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] LungTrace CLI v" << lung_trace_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.outputPath << endl;
    }

    SliceProcessor::ProcessingParams params;
    params.imgMin = args.imgMin;
    params.imgMax = args.imgMax;
    params.smoothingKernelSize = args.kernelSize;
    params.areaMin = args.areaMin;
    params.areaMax = args.areaMax;
    params.enableSubsampling = args.sample;
    params.keepProbability = args.keepProbability;
    params.renderOverlay = !args.noPreview;
    params.renderPreview = !args.noPreview;
    params.verboseOutput = args.verbose;
    params.enableDebugOutput = args.debug;

    if (args.debug) {
        cout << "[INFO] Debug mode enabled - images will be saved to " << params.debugOutputPath << endl;
    }

    ScanSlice slice;
    try {
        slice = SliceProcessor::loadSlice(args.inputPath, args.modality, args.slope, args.intercept);
    } catch (const DecodeError& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return 1;
    } catch (const invalid_argument& e) {
        cerr << "[ERROR] Invalid argument: " << e.what() << endl;
        return 1;
    }

    mt19937 rng;
    if (args.seed) {
        rng.seed(*args.seed);
    } else {
        random_device entropy;
        rng.seed(entropy());
    }

    SegmentationOutcome outcome = SliceProcessor::segmentSlice(slice, params, rng);
    if (!outcome.ok()) {
        cerr << "[ERROR] Processing failed (" << statusName(outcome.status) << "): "
             << outcome.message << endl;
        return 1;
    }

    const SegmentationResult& result = outcome.result;
    if (!ContourWriter::saveContoursAsJSON(result, params.enableSubsampling, args.outputPath)) {
        cerr << "[ERROR] Failed to save contour JSON." << endl;
        return 1;
    }

    if (!args.noPreview) {
        string previewPath = siblingPath(args.outputPath, "_preview.png");
        ofstream preview(previewPath, ios::binary);
        preview.write(reinterpret_cast<const char*>(result.previewPng.data()),
                      static_cast<streamsize>(result.previewPng.size()));
        if (!preview.good()) {
            cerr << "[ERROR] Failed to write preview: " << previewPath << endl;
            return 1;
        }

        string overlayPath = siblingPath(args.outputPath, "_overlay.png");
        if (!cv::imwrite(overlayPath, result.overlay)) {
            cerr << "[ERROR] Failed to write overlay: " << overlayPath << endl;
            return 1;
        }
    }

    cout << "[SUCCESS] " << result.validContours.size() << " of " << result.allContours.size()
         << " contours accepted" << endl;
    cout << "[INFO] Output saved to: " << args.outputPath << endl;
    return 0;
}
