// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/config/CliConfigParser.hpp"

#include <stdexcept>

namespace sbf_cloud::config {

CliArguments parseCliArguments(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("Missing command");
    }

    CliArguments parsed;
    const std::string& command = args.front();
    if (command == "info") {
        parsed.command = CliCommand::Info;
    } else if (command == "edit") {
        parsed.command = CliCommand::Edit;
    } else {
        throw std::invalid_argument("Unknown command: " + command);
    }

    parsed.path = parseConfigPath(std::vector<std::string>(args.begin() + 1, args.end()));
    return parsed;
}

std::string parseConfigPath(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw std::invalid_argument("Expected exactly one path argument");
    }
    if (args.front().empty()) {
        throw std::invalid_argument("Path argument must not be empty");
    }
    return args.front();
}

}  // namespace sbf_cloud::config
