// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/config/SbfJobConfig.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

#include "sbf_cloud/io/SbfIO.hpp"

namespace sbf_cloud::config {

namespace {

YAML::Node extractParameterNode(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return YAML::Node();
    }

    if (root["sbf_tool"]) {
        auto node = root["sbf_tool"];
        if (node["ros__parameters"]) {
            return node["ros__parameters"];
        }
        return node;
    }

    if (root["ros__parameters"]) {
        return root["ros__parameters"];
    }

    return root;
}

template <typename T>
T readOrDefault(const YAML::Node& node, const std::string& key, const T& default_value) {
    if (!node || !node[key]) {
        return default_value;
    }
    return node[key].as<T>();
}

std::optional<Vec3> readShift(const YAML::Node& node, const std::string& key) {
    if (!node || !node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    const YAML::Node values = node[key];
    if (!values.IsSequence() || values.size() != 3) {
        throw YAML::ParserException(values.Mark(), key + " must be a sequence of 3 numbers");
    }
    return Vec3{values[0].as<double>(), values[1].as<double>(), values[2].as<double>()};
}

std::vector<std::pair<std::string, std::string>> readRenames(const YAML::Node& node,
                                                             const std::string& key) {
    std::vector<std::pair<std::string, std::string>> renames;
    if (!node || !node[key] || node[key].IsNull()) {
        return renames;
    }
    const YAML::Node map = node[key];
    if (!map.IsMap()) {
        throw YAML::ParserException(map.Mark(), key + " must be a mapping of old: new names");
    }
    for (const auto& entry : map) {
        renames.emplace_back(entry.first.as<std::string>(), entry.second.as<std::string>());
    }
    return renames;
}

SbfJobConfig parseSbfJobConfig(const YAML::Node& params) {
    SbfJobConfig config;
    config.input_file = readOrDefault<std::string>(params, "input_file", "");
    config.output_file = readOrDefault<std::string>(params, "output_file", "");
    config.global_shift = readShift(params, "global_shift");
    config.drop_global_shift = readOrDefault<bool>(params, "drop_global_shift", false);
    config.remove_all_fields = readOrDefault<bool>(params, "remove_all_fields", false);
    config.remove_fields =
        readOrDefault<std::vector<std::string>>(params, "remove_fields", {});
    config.rename_fields = readRenames(params, "rename_fields");
    config.add_index = readOrDefault<bool>(params, "add_index", false);
    config.index_field_name =
        readOrDefault<std::string>(params, "index_field_name", config.index_field_name);
    config.hdf5_output_file = readOrDefault<std::string>(params, "hdf5_output_file", "");
    return config;
}

}  // namespace

SbfJobConfig loadSbfJobConfigFromYaml(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    YAML::Node params = extractParameterNode(root);
    return parseSbfJobConfig(params);
}

std::vector<std::string> SbfJobConfig::validate(bool check_filesystem) const {
    std::vector<std::string> errors;
    if (input_file.empty()) {
        errors.emplace_back("input_file is empty");
    } else if (check_filesystem && !std::filesystem::exists(input_file)) {
        errors.emplace_back("input_file does not exist: " + input_file);
    } else if (check_filesystem && !std::filesystem::exists(SbfIO::payloadPathFor(input_file))) {
        errors.emplace_back("payload does not exist: " + SbfIO::payloadPathFor(input_file));
    }

    if (output_file.empty() && hdf5_output_file.empty()) {
        errors.emplace_back("output_file or hdf5_output_file must be set");
    }
    if (global_shift && drop_global_shift) {
        errors.emplace_back("global_shift and drop_global_shift are mutually exclusive");
    }
    if (add_index && index_field_name.empty()) {
        errors.emplace_back("index_field_name must be set when add_index is true");
    }
    for (const auto& rename : rename_fields) {
        if (rename.second.empty()) {
            errors.emplace_back("rename_fields entry '" + rename.first + "' has an empty new name");
        }
    }
    return errors;
}

}  // namespace sbf_cloud::config
