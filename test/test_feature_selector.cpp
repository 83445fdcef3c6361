// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

#include "sbf_cloud/core/SbfError.hpp"
#include "sbf_cloud/features/FeatureSelector.hpp"

using sbf_cloud::PointMatrix;
using sbf_cloud::SbfDocument;
using sbf_cloud::SbfError;
using sbf_cloud::SbfErrorCode;
using sbf_cloud::features::FeatureMatrix;
using sbf_cloud::features::FeatureSelector;

namespace {

SbfDocument makeLidarDocument() {
    const PointMatrix points = {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {2.0, 0.0, 0.0}};
    return SbfDocument::fromArrays(points,
                                   {"Intensity", "gps_time", "number_of_returns", "Classification"},
                                   {{10.0f, 11.0f, 12.0f},
                                    {100.5f, 101.5f, 102.5f},
                                    {1.0f, 2.0f, 1.0f},
                                    {2.0f, 5.0f, 6.0f}});
}

std::string writeTempFile(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream ofs(path);
    ofs << contents;
    ofs.close();
    return path.string();
}

}  // namespace

TEST(FeatureSelectorTest, NormalizesKnownNames) {
    FeatureSelector selector;
    EXPECT_EQ("gps_time", selector.normalize("gpstime"));
    EXPECT_EQ("gps_time", selector.normalize("GpsTime"));
    EXPECT_EQ("number_of_returns", selector.normalize("NumberOfReturns"));
    EXPECT_EQ("return_number", selector.normalize("returnnumber"));
    EXPECT_EQ("scan_angle_rank", selector.normalize("ScanAngleRank"));
    EXPECT_EQ("point_source_id", selector.normalize("PointSourceId"));
    EXPECT_EQ("intensity", selector.normalize("Intensity"));
}

TEST(FeatureSelectorTest, ResolvesCaseInsensitively) {
    const SbfDocument document = makeLidarDocument();
    FeatureSelector selector;
    EXPECT_EQ("Intensity", selector.resolve(document, "intensity"));
    EXPECT_EQ("gps_time", selector.resolve(document, "GPSTIME"));
    EXPECT_EQ("Classification", selector.resolve(document, "classification"));
}

TEST(FeatureSelectorTest, PrefersExactMatch) {
    const PointMatrix points = {{0.0, 0.0, 0.0}};
    const SbfDocument document =
        SbfDocument::fromArrays(points, {"Intensity", "intensity"}, {{1.0f}, {2.0f}});
    FeatureSelector selector;
    EXPECT_EQ("intensity", selector.resolve(document, "INTENSITY"));
}

TEST(FeatureSelectorTest, SelectKeepsCallerOrder) {
    const SbfDocument document = makeLidarDocument();
    FeatureSelector selector;

    const FeatureMatrix matrix = selector.select(document, {"numberofreturns", "intensity", "gpstime"});
    ASSERT_EQ(3u, matrix.rows);
    ASSERT_EQ(3u, matrix.cols());
    EXPECT_EQ((std::vector<std::string>{"number_of_returns", "Intensity", "gps_time"}), matrix.names);
    EXPECT_FLOAT_EQ(2.0f, matrix.at(1, 0));
    EXPECT_FLOAT_EQ(11.0f, matrix.at(1, 1));
    EXPECT_FLOAT_EQ(102.5f, matrix.at(2, 2));
}

TEST(FeatureSelectorTest, UnknownNameFails) {
    const SbfDocument document = makeLidarDocument();
    FeatureSelector selector;
    try {
        selector.select(document, {"intensity", "scananglerank"});
        FAIL() << "expected FieldNotFound";
    } catch (const SbfError& e) {
        EXPECT_EQ(SbfErrorCode::FieldNotFound, e.code());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("scan_angle_rank"));
    }
}

TEST(FeatureSelectorTest, LabelsDefaultToClassification) {
    const SbfDocument document = makeLidarDocument();
    FeatureSelector selector;
    EXPECT_EQ((std::vector<float>{2.0f, 5.0f, 6.0f}), selector.labels(document));
    EXPECT_EQ((std::vector<float>{10.0f, 11.0f, 12.0f}), selector.labels(document, "intensity"));
}

TEST(FeatureSelectorTest, CustomNormalizationTable) {
    const SbfDocument document = makeLidarDocument();
    const std::map<std::string, std::string> table = {{"time", "gps_time"}};
    FeatureSelector selector(table);
    EXPECT_EQ("gps_time", selector.resolve(document, "Time"));
    EXPECT_EQ("gpstime", selector.normalize("GpsTime"));
}

TEST(FeatureSelectorTest, LoadsFeatureSourceNames) {
    const auto path = writeTempFile("sbf_feature_sources.txt",
                                    "las:Intensity las:GpsTime\n"
                                    "sbf:Linearity:r1.0\n");
    const auto names = FeatureSelector::loadFeatureSourceNames(path);
    EXPECT_EQ((std::vector<std::string>{"intensity", "gpstime", "linearity"}), names);
    std::filesystem::remove(path);
}

TEST(FeatureSelectorTest, FeatureSourceErrors) {
    try {
        FeatureSelector::loadFeatureSourceNames("/nonexistent/feature_sources.txt");
        FAIL() << "expected FileNotFound";
    } catch (const SbfError& e) {
        EXPECT_EQ(SbfErrorCode::FileNotFound, e.code());
    }

    const auto path = writeTempFile("sbf_feature_sources_bad.txt", "Intensity\n");
    EXPECT_THROW(FeatureSelector::loadFeatureSourceNames(path), std::invalid_argument);
    std::filesystem::remove(path);
}
