// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/report/ReportUtilities.hpp"

#include <iomanip>
#include <sstream>

namespace sbf_cloud {

namespace {

void writeShift(std::ostream& os, const Vec3& shift) {
    os << shift[0] << ", " << shift[1] << ", " << shift[2];
}

void writeNames(std::ostream& os, const std::vector<std::string>& names) {
    if (names.empty()) {
        os << "(none)";
        return;
    }
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            os << ", ";
        }
        os << names[i];
    }
}

}  // namespace

std::string formatDocumentSummary(const std::string& filename, const SbfDocument& document) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "SBF summary: " << filename << "\n";
    oss << "  Points       : " << document.pointCount() << "\n";
    oss << "  Global shift : ";
    writeShift(oss, document.globalShift());
    oss << "\n";
    oss << "  Local shift  : ";
    writeShift(oss, document.localShift());
    oss << "\n";
    oss << "  Fields (" << document.fieldCount() << ")  : ";
    writeNames(oss, document.fieldNames());
    return oss.str();
}

std::string formatJobSummary(const services::JobSummary& summary) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "Edit summary:\n";
    oss << "  Points        : " << summary.point_count << "\n";
    oss << "  Fields in     : ";
    writeNames(oss, summary.input_fields);
    oss << "\n";
    oss << "  Fields out    : ";
    writeNames(oss, summary.output_fields);
    oss << "\n";
    oss << "  Removed       : " << summary.removed_fields << "\n";
    oss << "  Renamed       : " << summary.renamed_fields << "\n";
    oss << "  Index added   : " << (summary.index_added ? "yes" : "no") << "\n";
    oss << "  Global shift  : ";
    writeShift(oss, summary.global_shift);
    if (!summary.sbf_output.empty()) {
        oss << "\n  SBF output    : " << summary.sbf_output;
    }
    if (!summary.hdf5_output.empty()) {
        oss << "\n  HDF5 output   : " << summary.hdf5_output;
    }
    return oss.str();
}

}  // namespace sbf_cloud
