// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_SERVICES_JOB_EXECUTOR_HPP
#define SBF_CLOUD_SERVICES_JOB_EXECUTOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "sbf_cloud/config/SbfJobConfig.hpp"
#include "sbf_cloud/core/SbfDocument.hpp"

namespace sbf_cloud::services {

struct JobSummary {
    std::size_t point_count = 0;
    std::vector<std::string> input_fields;
    std::vector<std::string> output_fields;
    std::size_t removed_fields = 0;
    std::size_t renamed_fields = 0;
    bool index_added = false;
    Vec3 global_shift{0.0, 0.0, 0.0};
    std::string sbf_output;
    std::string hdf5_output;
};

/**
 * @brief Apply the edit steps of a job to a document
 *
 * Order: global shift, remove all, remove listed, rename, add index.
 * Throws SbfError; a failed step leaves the earlier steps applied.
 */
void applyEdits(SbfDocument& document, const config::SbfJobConfig& config, JobSummary& summary);

/**
 * @brief Read, edit and write one cloud as described by config
 * @return true if every requested output was written
 */
bool runJob(const config::SbfJobConfig& config,
            JobSummary& summary,
            std::string* error_message = nullptr);

}  // namespace sbf_cloud::services

#endif  // SBF_CLOUD_SERVICES_JOB_EXECUTOR_HPP
