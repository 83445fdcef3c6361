// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CONFIG_CLI_CONFIG_PARSER_HPP
#define SBF_CLOUD_CONFIG_CLI_CONFIG_PARSER_HPP

#include <string>
#include <vector>

namespace sbf_cloud::config {

enum class CliCommand {
    Info,
    Edit,
};

struct CliArguments {
    CliCommand command = CliCommand::Info;
    std::string path;
};

// args excludes argv[0]; throws std::invalid_argument
CliArguments parseCliArguments(const std::vector<std::string>& args);

std::string parseConfigPath(const std::vector<std::string>& args);

}  // namespace sbf_cloud::config

#endif  // SBF_CLOUD_CONFIG_CLI_CONFIG_PARSER_HPP
