// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/config/CliConfigParser.hpp"
#include "sbf_cloud/config/SbfJobConfig.hpp"
#include "sbf_cloud/io/SbfIO.hpp"
#include "sbf_cloud/report/ReportUtilities.hpp"
#include "sbf_cloud/services/JobExecutor.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

using sbf_cloud::config::CliArguments;
using sbf_cloud::config::CliCommand;
using sbf_cloud::config::SbfJobConfig;
using sbf_cloud::config::loadSbfJobConfigFromYaml;
using sbf_cloud::config::parseCliArguments;
using sbf_cloud::services::JobSummary;
using sbf_cloud::services::runJob;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  info <cloud.sbf>                          - Print points, fields and shifts\n";
    std::cout << "  edit <job.yaml>                           - Edit a cloud using YAML configuration\n";
}

int runInfo(const std::string& path) {
    try {
        const auto document = sbf_cloud::SbfIO::readSbf(path);
        std::cout << sbf_cloud::formatDocumentSummary(path, document) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Failed to read " << path << ": " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int runEdit(const std::string& config_path) {
    SbfJobConfig config;
    try {
        config = loadSbfJobConfigFromYaml(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        for (const auto& err : errors) {
            std::cerr << "Config error: " << err << "\n";
        }
        return 1;
    }

    JobSummary summary;
    std::string job_error;
    if (!runJob(config, summary, &job_error)) {
        std::cerr << "Edit failed: " << job_error << "\n";
        return 1;
    }

    std::cout << sbf_cloud::formatJobSummary(summary) << "\n";
    std::cout << "Processing completed!!\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        CliArguments args;
        try {
            args = parseCliArguments(std::vector<std::string>(argv + 1, argv + argc));
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            printUsage(argv[0]);
            return 1;
        }

        switch (args.command) {
            case CliCommand::Info:
                return runInfo(args.path);
            case CliCommand::Edit:
                return runEdit(args.path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 1;
}
