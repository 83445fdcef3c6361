// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "sbf_cloud/config/SbfJobConfig.hpp"

using sbf_cloud::Vec3;
using sbf_cloud::config::SbfJobConfig;
using sbf_cloud::config::loadSbfJobConfigFromYaml;

namespace {

std::string writeTempYaml(const std::string& contents) {
    auto temp_dir = std::filesystem::temp_directory_path();
    auto path = temp_dir / std::filesystem::path("sbf_job_config_test.yaml");
    std::ofstream ofs(path);
    ofs << contents;
    ofs.close();
    return path.string();
}

bool containsMessage(const std::vector<std::string>& errors, const std::string& fragment) {
    return std::any_of(errors.begin(), errors.end(), [&](const std::string& message) {
        return message.find(fragment) != std::string::npos;
    });
}

}  // namespace

TEST(SbfJobConfigTest, LoadsValuesFromYaml) {
    const std::string yaml = R"(
sbf_tool:
  ros__parameters:
    input_file: "/data/tile_12.sbf"
    output_file: "/data/tile_12_clean.sbf"
    global_shift: [500000.0, 4000000.0, 0.0]
    remove_all_fields: false
    remove_fields: ["Deviation", "Original cloud index"]
    rename_fields:
      GpsTime: gps_time
      Intensity: intensity
    add_index: true
    index_field_name: point_id
    hdf5_output_file: "/data/tile_12.h5"
)";

    const auto path = writeTempYaml(yaml);
    const SbfJobConfig config = loadSbfJobConfigFromYaml(path);

    EXPECT_EQ("/data/tile_12.sbf", config.input_file);
    EXPECT_EQ("/data/tile_12_clean.sbf", config.output_file);
    ASSERT_TRUE(config.global_shift.has_value());
    EXPECT_EQ((Vec3{500000.0, 4000000.0, 0.0}), *config.global_shift);
    EXPECT_FALSE(config.drop_global_shift);
    EXPECT_FALSE(config.remove_all_fields);
    EXPECT_EQ((std::vector<std::string>{"Deviation", "Original cloud index"}), config.remove_fields);
    ASSERT_EQ(2u, config.rename_fields.size());
    EXPECT_EQ("GpsTime", config.rename_fields[0].first);
    EXPECT_EQ("gps_time", config.rename_fields[0].second);
    EXPECT_EQ("Intensity", config.rename_fields[1].first);
    EXPECT_TRUE(config.add_index);
    EXPECT_EQ("point_id", config.index_field_name);
    EXPECT_EQ("/data/tile_12.h5", config.hdf5_output_file);

    std::filesystem::remove(path);
}

TEST(SbfJobConfigTest, AppliesDefaultsForMissingEntries) {
    const std::string yaml = R"(
input_file: "/data/in.sbf"
output_file: "/data/out.sbf"
)";

    const auto path = writeTempYaml(yaml);
    const SbfJobConfig config = loadSbfJobConfigFromYaml(path);

    EXPECT_EQ("/data/in.sbf", config.input_file);
    EXPECT_FALSE(config.global_shift.has_value());
    EXPECT_FALSE(config.drop_global_shift);
    EXPECT_FALSE(config.remove_all_fields);
    EXPECT_TRUE(config.remove_fields.empty());
    EXPECT_TRUE(config.rename_fields.empty());
    EXPECT_FALSE(config.add_index);
    EXPECT_EQ("index", config.index_field_name);
    EXPECT_TRUE(config.hdf5_output_file.empty());

    std::filesystem::remove(path);
}

TEST(SbfJobConfigTest, AcceptsBareRosParametersNode) {
    const std::string yaml = R"(
ros__parameters:
  input_file: "/data/in.sbf"
  drop_global_shift: true
  hdf5_output_file: "/data/out.h5"
)";

    const auto path = writeTempYaml(yaml);
    const SbfJobConfig config = loadSbfJobConfigFromYaml(path);
    EXPECT_EQ("/data/in.sbf", config.input_file);
    EXPECT_TRUE(config.drop_global_shift);
    EXPECT_EQ("/data/out.h5", config.hdf5_output_file);
    std::filesystem::remove(path);
}

TEST(SbfJobConfigTest, RejectsBadlyShapedValues) {
    auto path = writeTempYaml("global_shift: [1.0, 2.0]\n");
    EXPECT_THROW(loadSbfJobConfigFromYaml(path), YAML::Exception);

    path = writeTempYaml("global_shift: [1.0, two, 3.0]\n");
    EXPECT_THROW(loadSbfJobConfigFromYaml(path), YAML::Exception);

    path = writeTempYaml("rename_fields: [a, b]\n");
    EXPECT_THROW(loadSbfJobConfigFromYaml(path), YAML::Exception);

    path = writeTempYaml("add_index: maybe\n");
    EXPECT_THROW(loadSbfJobConfigFromYaml(path), YAML::Exception);

    std::filesystem::remove(path);
    EXPECT_THROW(loadSbfJobConfigFromYaml("/nonexistent/job.yaml"), YAML::Exception);
}

TEST(SbfJobConfigTest, ValidateReportsProblems) {
    SbfJobConfig config;
    config.global_shift = Vec3{1.0, 2.0, 3.0};
    config.drop_global_shift = true;
    config.add_index = true;
    config.index_field_name.clear();
    config.rename_fields.emplace_back("a", "");

    const auto errors = config.validate(false);
    EXPECT_TRUE(containsMessage(errors, "input_file is empty"));
    EXPECT_TRUE(containsMessage(errors, "output_file or hdf5_output_file"));
    EXPECT_TRUE(containsMessage(errors, "mutually exclusive"));
    EXPECT_TRUE(containsMessage(errors, "index_field_name"));
    EXPECT_TRUE(containsMessage(errors, "rename_fields entry 'a'"));
}

TEST(SbfJobConfigTest, ValidateChecksBothFilesOnDisk) {
    const auto dir = std::filesystem::temp_directory_path();
    const auto header = (dir / "sbf_job_config_only_header.sbf").string();
    {
        std::ofstream ofs(header);
        ofs << "[SBF]\nPoints = 0\n";
    }

    SbfJobConfig config;
    config.input_file = header;
    config.output_file = (dir / "out.sbf").string();
    std::filesystem::remove(header + ".data");

    auto errors = config.validate(true);
    EXPECT_TRUE(containsMessage(errors, "payload does not exist"));
    EXPECT_TRUE(config.validate(false).empty());

    config.input_file = (dir / "sbf_job_config_missing.sbf").string();
    errors = config.validate(true);
    EXPECT_TRUE(containsMessage(errors, "input_file does not exist"));

    std::filesystem::remove(header);
}
