#include "SliceProcessor.hpp"
#include "ContourWriter.hpp"
#include "specs_support.hpp"
#include <catch2/catch.hpp>
#include <filesystem>
#include <random>

using namespace LungTrace;
using namespace lungtrace_specs_support;

namespace lungtrace_pipeline_tests
{
    SCENARIO("The pipeline segments the lungs of a synthetic CT slice")
    {
        GIVEN("A phantom with two lungs, a small air pocket and an air region on the image edge")
        {
            auto slice = make_lung_phantom();
            auto params = SliceProcessor::ProcessingParams();
            auto rng = std::mt19937(7);

            WHEN("It is processed with the default configuration")
            {
                auto result = SliceProcessor::processSlice(slice, params, rng);

                THEN("All four dark regions are found and only the two lungs are accepted")
                {
                    CHECK(result.allContours.size() == 4);
                    REQUIRE(result.validContours.size() == 2);
                    for (const auto& [id, contour] : result.validContours)
                    {
                        REQUIRE(result.allContours.count(id) == 1);
                        auto area = SliceProcessor::contourArea(contour);
                        CHECK(area > 4000.0);
                        CHECK(area < 5200.0);
                        CHECK_FALSE(SliceProcessor::touchesBorder(contour, 256, 256));
                    }
                }

                THEN("The windowed preview and mask keep the slice geometry")
                {
                    CHECK(result.normalized.size() == slice.pixels.size());
                    CHECK(result.normalized.type() == CV_8UC1);
                    CHECK(result.mask.size() == slice.pixels.size());
                    CHECK(result.threshold > 12);
                    CHECK(result.threshold < 88);
                }

                THEN("No optional artifacts are produced")
                {
                    CHECK(result.sampledContours.empty());
                    CHECK(result.overlay.empty());
                    CHECK(result.previewPng.empty());
                }
            }

            WHEN("Filtering is disabled")
            {
                params.enableFiltering = false;
                auto result = SliceProcessor::processSlice(slice, params, rng);

                THEN("Every extracted contour is reported as valid")
                {
                    CHECK(result.validContours == result.allContours);
                }
            }

            WHEN("Subsampling, overlay and preview are enabled")
            {
                params.enableSubsampling = true;
                params.keepProbability = 1.0;
                params.renderOverlay = true;
                params.renderPreview = true;
                auto result = SliceProcessor::processSlice(slice, params, rng);

                THEN("The sample, the overlay and the PNG preview are filled in")
                {
                    CHECK(result.sampledContours == result.validContours);
                    CHECK(result.overlay.size() == slice.pixels.size());
                    CHECK(cv::countNonZero(result.overlay.reshape(1)) > 0);
                    REQUIRE_FALSE(result.previewPng.empty());
                    auto decoded = cv::imdecode(result.previewPng, cv::IMREAD_UNCHANGED);
                    CHECK(decoded.rows == 256);
                    CHECK(decoded.cols == 256);
                }
            }

            WHEN("The same slice is subsampled twice with the same seed")
            {
                params.enableSubsampling = true;
                auto rng_a = std::mt19937(2024);
                auto rng_b = std::mt19937(2024);
                auto a = SliceProcessor::processSlice(slice, params, rng_a);
                auto b = SliceProcessor::processSlice(slice, params, rng_b);

                THEN("The sampled subsets agree")
                {
                    CHECK(a.sampledContours == b.sampledContours);
                }
            }
        }

        GIVEN("The raw slice holds a centred square of air in soft tissue")
        {
            auto raw = cv::Mat(100, 100, CV_16SC1, cv::Scalar(0));
            raw(cv::Rect(10, 10, 80, 80)).setTo(cv::Scalar(-1000));
            auto slice = ScanSlice{ raw, "CT", std::nullopt, std::nullopt };

            WHEN("It is processed")
            {
                auto result = SliceProcessor::processSlice(slice, SliceProcessor::ProcessingParams());

                THEN("One contour close to the 80x80 square is accepted and listed in both outputs")
                {
                    REQUIRE(result.allContours.size() == 1);
                    REQUIRE(result.validContours.size() == 1);
                    CHECK(result.validContours.begin()->first == result.allContours.begin()->first);
                    auto area = SliceProcessor::contourArea(result.validContours.begin()->second);
                    CHECK(area == Approx(6400.0).margin(400.0));
                }
            }
        }

        GIVEN("A uniform slice")
        {
            auto raw = cv::Mat(64, 64, CV_16SC1, cv::Scalar(40));
            auto slice = ScanSlice{ raw, "CT", 1.0, 0.0 };

            THEN("Segmentation succeeds with no contours")
            {
                auto outcome = SliceProcessor::segmentSlice(slice, SliceProcessor::ProcessingParams());
                REQUIRE(outcome.ok());
                CHECK(outcome.result.allContours.empty());
                CHECK(outcome.result.validContours.empty());
            }
        }
    }

    SCENARIO("Pipeline failures are reported as typed outcomes")
    {
        auto slice = make_lung_phantom();
        auto params = SliceProcessor::ProcessingParams();

        GIVEN("A slice of another modality")
        {
            slice.modality = "MR";

            THEN("processSlice throws and segmentSlice reports UnsupportedModality")
            {
                CHECK_THROWS_AS(SliceProcessor::processSlice(slice, params), UnsupportedModalityError);
                auto outcome = SliceProcessor::segmentSlice(slice, params);
                CHECK_FALSE(outcome.ok());
                CHECK(outcome.status == SegmentationStatus::UnsupportedModality);
                CHECK(outcome.result.allContours.empty());
            }
        }

        GIVEN("An inverted window")
        {
            params.imgMin = 2000.0;
            params.imgMax = -1000.0;

            THEN("segmentSlice reports InvalidWindow")
            {
                CHECK(SliceProcessor::segmentSlice(slice, params).status == SegmentationStatus::InvalidWindow);
            }
        }

        GIVEN("An out-of-range keep probability")
        {
            params.keepProbability = -0.1;

            THEN("segmentSlice reports InvalidParameters")
            {
                CHECK(SliceProcessor::segmentSlice(slice, params).status == SegmentationStatus::InvalidParameters);
            }
        }

        GIVEN("A slice with no pixels")
        {
            slice.pixels = cv::Mat();

            THEN("segmentSlice reports DecodeFailed")
            {
                CHECK(SliceProcessor::segmentSlice(slice, params).status == SegmentationStatus::DecodeFailed);
            }
        }
    }

    SCENARIO("Slices are decoded from single-channel integer rasters")
    {
        GIVEN("A 16-bit PNG byte stream")
        {
            auto raw = cv::Mat(16, 24, CV_16UC1, cv::Scalar(1024));
            raw.at<ushort>(3, 5) = 4000;
            auto bytes = std::vector<uchar>();
            REQUIRE(cv::imencode(".png", raw, bytes));

            WHEN("It is decoded with calibration values")
            {
                auto slice = SliceProcessor::decodeSlice(bytes, "CT", 1.0, -1024.0);

                THEN("Pixels and metadata are carried over")
                {
                    REQUIRE(slice.pixels.type() == CV_16UC1);
                    CHECK(slice.pixels.at<ushort>(3, 5) == 4000);
                    CHECK(slice.modality == "CT");
                    CHECK(slice.rescaleIntercept.value() == -1024.0);
                    auto hu = SliceProcessor::calibrate(slice);
                    CHECK(hu.at<double>(0, 0) == 0.0);
                }
            }
        }

        GIVEN("A colour PNG byte stream")
        {
            auto rgb = cv::Mat(8, 8, CV_8UC3, cv::Scalar(10, 20, 30));
            auto bytes = std::vector<uchar>();
            REQUIRE(cv::imencode(".png", rgb, bytes));

            THEN("Decoding fails")
            {
                CHECK_THROWS_AS(SliceProcessor::decodeSlice(bytes, "CT"), DecodeError);
            }
        }

        GIVEN("Bytes that are not an image")
        {
            auto bytes = std::vector<uchar>{ 'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e' };

            THEN("Decoding fails")
            {
                CHECK_THROWS_AS(SliceProcessor::decodeSlice(bytes, "CT"), DecodeError);
                CHECK_THROWS_AS(SliceProcessor::decodeSlice(std::vector<uchar>(), "CT"), DecodeError);
            }
        }
    }

    SCENARIO("The preview is the windowed slice rotated counter-clockwise and encoded as PNG")
    {
        auto img = cv::Mat(40, 100, CV_8UC1, cv::Scalar(0));
        img.at<uchar>(0, 99) = 255;

        WHEN("It is rendered with rotation")
        {
            auto png = SliceProcessor::renderPreview(img, true);
            auto decoded = cv::imdecode(png, cv::IMREAD_UNCHANGED);

            THEN("The top-right pixel moves to the top-left and the axes swap")
            {
                REQUIRE(decoded.type() == CV_8UC1);
                CHECK(decoded.rows == 100);
                CHECK(decoded.cols == 40);
                CHECK(decoded.at<uchar>(0, 0) == 255);
            }
        }

        WHEN("It is rendered without rotation")
        {
            auto decoded = cv::imdecode(SliceProcessor::renderPreview(img, false), cv::IMREAD_UNCHANGED);

            THEN("It decodes back to the same image")
            {
                REQUIRE(decoded.size() == img.size());
                CHECK(cv::countNonZero(decoded != img) == 0);
            }
        }
    }

    SCENARIO("Contour geometry is serialized as JSON in [row, col] order")
    {
        auto result = SegmentationResult();
        result.threshold = 42;
        result.allContours["contour_0"] = Contour{ {10, 20}, {10, 70}, {60, 70} };
        result.allContours["contour_1"] = Contour{ {1, 1}, {1, 3}, {3, 3} };
        result.validContours["contour_0"] = result.allContours["contour_0"];

        WHEN("It is written without the sampled subset")
        {
            auto json = ContourWriter::toJSON(result, false);
            auto fs = cv::FileStorage(json, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);

            THEN("Each contour maps to its list of [row, col] pairs")
            {
                REQUIRE(fs.isOpened());
                CHECK(static_cast<int>(fs["threshold"]) == 42);
                CHECK(fs["all_contours"].size() == 2);
                CHECK(fs["sampled_contours"].empty());

                auto first = fs["valid_contours"]["contour_0"];
                REQUIRE(first.isSeq());
                REQUIRE(first.size() == 3);
                CHECK(static_cast<int>(first[0][0]) == 20);
                CHECK(static_cast<int>(first[0][1]) == 10);
                CHECK(static_cast<int>(first[2][0]) == 70);
                CHECK(static_cast<int>(first[2][1]) == 60);
            }
        }

        WHEN("It is written with the sampled subset")
        {
            auto json = ContourWriter::toJSON(result, true);
            auto fs = cv::FileStorage(json, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);

            THEN("The sampled map is present even when empty")
            {
                CHECK(fs["sampled_contours"].isMap());
                CHECK(fs["sampled_contours"].size() == 0);
            }
        }
    }

    SCENARIO("JSON contour maps keep discovery order past contour_9")
    {
        auto result = SegmentationResult();
        for (size_t i = 0; i < 12; i++)
            result.allContours[SliceProcessor::contourId(i)] = Contour{ {1, 1}, {1, 5}, {5, 5} };

        auto json = ContourWriter::toJSON(result, false);
        auto fs = cv::FileStorage(json, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
        REQUIRE(fs.isOpened());

        THEN("Keys appear as contour_0 ... contour_11")
        {
            auto all = fs["all_contours"];
            REQUIRE(all.size() == 12);
            size_t k = 0;
            for (auto it = all.begin(); it != all.end(); ++it)
                CHECK((*it).name() == SliceProcessor::contourId(k++));
        }
    }

    SCENARIO("Debug output writes the stage images of each call under fresh numbering")
    {
        auto dir = std::filesystem::temp_directory_path() / "lungtrace_debug_stages";
        std::filesystem::remove_all(dir);

        auto params = SliceProcessor::ProcessingParams();
        params.enableDebugOutput = true;
        params.debugOutputPath = dir.string();
        auto slice = make_lung_phantom();

        WHEN("The same parameters are used for two calls")
        {
            SliceProcessor::processSlice(slice, params);
            std::filesystem::remove_all(dir);
            SliceProcessor::processSlice(slice, params);

            THEN("The second call writes only its own four images starting at 01")
            {
                CHECK(std::filesystem::exists(dir / "01_windowed.png"));
                CHECK(std::filesystem::exists(dir / "02_smoothed.png"));
                CHECK(std::filesystem::exists(dir / "03_mask.png"));
                CHECK(std::filesystem::exists(dir / "04_overlay.png"));
                CHECK_FALSE(std::filesystem::exists(dir / "05_windowed.png"));
            }
        }

        GIVEN("A call that fails")
        {
            auto other = make_lung_phantom();
            other.modality = "MR";

            THEN("Nothing is written")
            {
                CHECK_FALSE(SliceProcessor::segmentSlice(other, params).ok());
                CHECK_FALSE(std::filesystem::exists(dir));
            }
        }

        std::filesystem::remove_all(dir);
    }
}
