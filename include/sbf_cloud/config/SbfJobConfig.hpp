// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CONFIG_SBF_JOB_CONFIG_HPP
#define SBF_CLOUD_CONFIG_SBF_JOB_CONFIG_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sbf_cloud/core/SbfTypes.hpp"

namespace sbf_cloud::config {

struct SbfJobConfig {
    std::string input_file;
    std::string output_file;
    std::optional<Vec3> global_shift;
    bool drop_global_shift = false;
    bool remove_all_fields = false;
    std::vector<std::string> remove_fields;
    // old name -> new name, applied in file order
    std::vector<std::pair<std::string, std::string>> rename_fields;
    bool add_index = false;
    std::string index_field_name = "index";
    std::string hdf5_output_file;

    std::vector<std::string> validate(bool check_filesystem = true) const;
};

// Throws YAML::Exception on unreadable files or badly typed values
SbfJobConfig loadSbfJobConfigFromYaml(const std::string& path);

}  // namespace sbf_cloud::config

#endif  // SBF_CLOUD_CONFIG_SBF_JOB_CONFIG_HPP
