// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_REPORT_REPORT_UTILITIES_HPP
#define SBF_CLOUD_REPORT_REPORT_UTILITIES_HPP

#include <string>

#include "sbf_cloud/core/SbfDocument.hpp"
#include "sbf_cloud/services/JobExecutor.hpp"

namespace sbf_cloud {

std::string formatDocumentSummary(const std::string& filename, const SbfDocument& document);

std::string formatJobSummary(const services::JobSummary& summary);

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_REPORT_REPORT_UTILITIES_HPP
