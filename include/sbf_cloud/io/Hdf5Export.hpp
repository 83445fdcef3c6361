// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_IO_HDF5_EXPORT_HPP
#define SBF_CLOUD_IO_HDF5_EXPORT_HPP

#include <string>
#include <vector>

#include <hdf5.h>
#include <hdf5_hl.h>

#include "sbf_cloud/core/SbfDocument.hpp"

namespace sbf_cloud {

/*
 * Archive layout:
 *   /metadata                  format, version, creation_time (string attributes)
 *   /cloud/points              N x 3 double, true coordinates
 *   /cloud/local_shift         3 double
 *   /cloud/global_shift        3 double
 *   /cloud/scalar_fields       N x S float, attributes field_count and field_names
 */
class Hdf5Export {
public:
    static constexpr const char* kFormatName = "sbf";
    static constexpr const char* kFormatVersion = "1.0.0";

    Hdf5Export() = default;
    ~Hdf5Export() = default;

    /**
     * @brief Write a document to an HDF5 archive
     * @param filename Output HDF5 file path
     * @param document Document to export
     * @return true if successful, false otherwise
     */
    bool write(const std::string& filename, const SbfDocument& document);

    /**
     * @brief Check if file exists and is valid HDF5
     * @param filename File path to check
     * @return true if valid HDF5 file
     */
    bool isValidHDF5(const std::string& filename) const;

    std::string getLastError() const { return last_error_; }

private:
    std::string last_error_;

    bool writeMetadata(hid_t file_id);
    bool writeCloud(hid_t file_id, const SbfDocument& document);
    bool writeScalarFields(hid_t group_id, const SbfDocument& document);

    bool createGroup(hid_t file_id, const std::string& group_name);
    bool writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value);
    bool writeStringListAttribute(hid_t loc_id, const std::string& name,
                                  const std::vector<std::string>& values);
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_IO_HDF5_EXPORT_HPP
