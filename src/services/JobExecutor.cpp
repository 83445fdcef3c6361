// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/services/JobExecutor.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "sbf_cloud/io/Hdf5Export.hpp"
#include "sbf_cloud/io/SbfIO.hpp"
#include "sbf_cloud/utils/ErrorAccumulator.hpp"

namespace sbf_cloud::services {

void applyEdits(SbfDocument& document, const config::SbfJobConfig& config, JobSummary& summary) {
    summary.point_count = document.pointCount();
    summary.input_fields = document.fieldNames();

    if (config.global_shift) {
        document.setGlobalShift(*config.global_shift);
    } else if (config.drop_global_shift) {
        document.dropGlobalShift();
    }

    if (config.remove_all_fields) {
        summary.removed_fields += document.fieldCount();
        document.removeAllScalarFields();
    }
    for (const auto& name : config.remove_fields) {
        document.removeScalarField(name);
        ++summary.removed_fields;
    }

    for (const auto& rename : config.rename_fields) {
        document.renameScalarField(rename.first, rename.second);
        ++summary.renamed_fields;
    }

    if (config.add_index) {
        document.addIndexField(config.index_field_name);
        summary.index_added = true;
    }

    summary.output_fields = document.fieldNames();
    summary.global_shift = document.globalShift();
}

bool runJob(const config::SbfJobConfig& config,
            JobSummary& summary,
            std::string* error_message) {
    auto t0 = std::chrono::high_resolution_clock::now();
    summary = JobSummary{};

    SbfDocument document;
    try {
        document = SbfIO::readSbf(config.input_file);
        applyEdits(document, config, summary);
    } catch (const std::exception& e) {
        if (error_message) {
            *error_message = e.what();
        }
        return false;
    }

    utils::ErrorAccumulator error_acc;
    if (!config.output_file.empty()) {
        try {
            SbfIO::writeSbf(config.output_file, document);
            summary.sbf_output = config.output_file;
        } catch (const std::exception& e) {
            error_acc.add(config.output_file, e.what());
        }
    }

    if (!config.hdf5_output_file.empty()) {
        Hdf5Export exporter;
        if (exporter.write(config.hdf5_output_file, document)) {
            summary.hdf5_output = config.hdf5_output_file;
        } else {
            error_acc.add(config.hdf5_output_file, exporter.getLastError());
        }
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][JobExecutor] total=" << ms << " ms" << std::endl;

    if (!error_acc.empty()) {
        if (error_message) {
            *error_message = error_acc.str();
        }
        return false;
    }
    return true;
}

}  // namespace sbf_cloud::services
