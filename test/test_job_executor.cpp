// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "sbf_cloud/core/SbfError.hpp"
#include "sbf_cloud/io/SbfIO.hpp"
#include "sbf_cloud/services/JobExecutor.hpp"

using namespace sbf_cloud;
using sbf_cloud::config::SbfJobConfig;
using sbf_cloud::services::JobSummary;
using sbf_cloud::services::applyEdits;
using sbf_cloud::services::runJob;
namespace fs = std::filesystem;

class JobExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("sbf_job_test_" +
                     std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        fs::create_directories(test_dir_);

        document_ = SbfDocument::fromArrays({{500010.0, 4000020.0, 5.0},
                                             {500011.0, 4000021.0, 6.0},
                                             {500012.0, 4000022.0, 7.0}},
                                            {"Intensity", "GpsTime", "Deviation"},
                                            {{1.0f, 2.0f, 3.0f}, {0.1f, 0.2f, 0.3f}, {9.0f, 9.0f, 9.0f}},
                                            {500000.0, 4000000.0, 0.0});
        input_ = (test_dir_ / "input.sbf").string();
        SbfIO::writeSbf(input_, document_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    fs::path test_dir_;
    std::string input_;
    SbfDocument document_;
};

TEST_F(JobExecutorTest, AppliesEditsInOrder) {
    SbfJobConfig config;
    config.drop_global_shift = true;
    config.remove_fields = {"Deviation"};
    config.rename_fields = {{"GpsTime", "gps_time"}, {"Intensity", "intensity"}};
    config.add_index = true;

    JobSummary summary;
    applyEdits(document_, config, summary);

    EXPECT_EQ((std::vector<std::string>{"intensity", "gps_time", "index"}), document_.fieldNames());
    EXPECT_EQ((Vec3{0.0, 0.0, 0.0}), document_.globalShift());
    EXPECT_EQ(3u, summary.point_count);
    EXPECT_EQ(1u, summary.removed_fields);
    EXPECT_EQ(2u, summary.renamed_fields);
    EXPECT_TRUE(summary.index_added);
    EXPECT_EQ((std::vector<std::string>{"Intensity", "GpsTime", "Deviation"}), summary.input_fields);
    EXPECT_EQ(document_.fieldNames(), summary.output_fields);
}

TEST_F(JobExecutorTest, RemoveAllRunsBeforeIndex) {
    SbfJobConfig config;
    config.remove_all_fields = true;
    config.add_index = true;
    config.index_field_name = "point_id";
    config.global_shift = Vec3{500000.0, 4000000.0, 5.0};

    JobSummary summary;
    applyEdits(document_, config, summary);

    EXPECT_EQ((std::vector<std::string>{"point_id"}), document_.fieldNames());
    EXPECT_EQ(3u, summary.removed_fields);
    EXPECT_EQ((Vec3{500000.0, 4000000.0, 5.0}), document_.globalShift());
}

TEST_F(JobExecutorTest, UnknownFieldThrows) {
    SbfJobConfig config;
    config.remove_fields = {"Missing"};

    JobSummary summary;
    EXPECT_THROW(applyEdits(document_, config, summary), SbfError);
}

TEST_F(JobExecutorTest, RunJobWritesBothOutputs) {
    SbfJobConfig config;
    config.input_file = input_;
    config.output_file = (test_dir_ / "output.sbf").string();
    config.hdf5_output_file = (test_dir_ / "output.h5").string();
    config.rename_fields = {{"GpsTime", "gps_time"}};

    JobSummary summary;
    std::string error;
    ASSERT_TRUE(runJob(config, summary, &error)) << error;
    EXPECT_EQ(config.output_file, summary.sbf_output);
    EXPECT_EQ(config.hdf5_output_file, summary.hdf5_output);
    EXPECT_TRUE(fs::exists(config.hdf5_output_file));

    const SbfDocument written = SbfIO::readSbf(config.output_file);
    EXPECT_EQ((std::vector<std::string>{"Intensity", "gps_time", "Deviation"}), written.fieldNames());
    EXPECT_NEAR(500011.0, written.points()[1][0], 1e-4);
}

TEST_F(JobExecutorTest, RunJobReportsCodecErrors) {
    SbfJobConfig config;
    config.input_file = input_;
    config.output_file = (test_dir_ / "output.sbf").string();
    config.rename_fields = {{"Intensity", "Deviation"}};

    JobSummary summary;
    std::string error;
    EXPECT_FALSE(runJob(config, summary, &error));
    EXPECT_NE(std::string::npos, error.find("DuplicateFieldName"));
    EXPECT_FALSE(fs::exists(config.output_file));
}

TEST_F(JobExecutorTest, RunJobReportsMissingInput) {
    SbfJobConfig config;
    config.input_file = (test_dir_ / "absent.sbf").string();
    config.output_file = (test_dir_ / "output.sbf").string();

    JobSummary summary;
    std::string error;
    EXPECT_FALSE(runJob(config, summary, &error));
    EXPECT_NE(std::string::npos, error.find("FileNotFound"));
}

TEST_F(JobExecutorTest, RunJobCollectsOutputFailures) {
    SbfJobConfig config;
    config.input_file = input_;
    config.output_file = (test_dir_ / "missing_dir" / "output.sbf").string();
    config.hdf5_output_file = (test_dir_ / "output.h5").string();

    JobSummary summary;
    std::string error;
    EXPECT_FALSE(runJob(config, summary, &error));
    EXPECT_NE(std::string::npos, error.find("IoFailure"));
    EXPECT_TRUE(summary.sbf_output.empty());
    EXPECT_EQ(config.hdf5_output_file, summary.hdf5_output);
}
