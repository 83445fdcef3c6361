// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/io/Hdf5Export.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

#include "sbf_cloud/core/ShiftComposer.hpp"

namespace sbf_cloud {

namespace {

std::string currentUtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace

bool Hdf5Export::write(const std::string& filename, const SbfDocument& document) {
    auto t0 = std::chrono::high_resolution_clock::now();
    last_error_.clear();

    std::filesystem::path filepath(filename);
    if (!filepath.parent_path().empty() && !std::filesystem::exists(filepath.parent_path())) {
        last_error_ = "Directory does not exist: " + filepath.parent_path().string();
        return false;
    }

    hid_t file_id = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to create HDF5 file: " + filename;
        return false;
    }

    bool success = true;
    success = success && writeMetadata(file_id);
    success = success && writeCloud(file_id, document);

    H5Fclose(file_id);

    if (!success) {
        if (last_error_.empty()) {
            last_error_ = "Failed to write HDF5 file: " + filename;
        }
        std::error_code ec;
        std::filesystem::remove(filename, ec);
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][Hdf5Export] write file='" << filename << "' time=" << ms
              << " ms, points=" << document.pointCount()
              << ", fields=" << document.fieldCount() << std::endl;
    return success;
}

bool Hdf5Export::isValidHDF5(const std::string& filename) const {
    if (!std::filesystem::exists(filename)) {
        return false;
    }

    htri_t is_hdf5 = H5Fis_hdf5(filename.c_str());
    return is_hdf5 > 0;
}

bool Hdf5Export::writeMetadata(hid_t file_id) {
    if (!createGroup(file_id, "/metadata")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/metadata", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open group: /metadata";
        return false;
    }

    bool success = true;
    success = success && writeStringAttribute(group_id, "format", kFormatName);
    success = success && writeStringAttribute(group_id, "version", kFormatVersion);
    success = success && writeStringAttribute(group_id, "creation_time", currentUtcTimestamp());

    H5Gclose(group_id);
    if (!success) {
        last_error_ = "Failed to write metadata attributes";
    }
    return success;
}

bool Hdf5Export::writeCloud(hid_t file_id, const SbfDocument& document) {
    if (!createGroup(file_id, "/cloud")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/cloud", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open group: /cloud";
        return false;
    }

    const PointMatrix& points = document.points();
    std::vector<double> flat;
    flat.reserve(points.size() * kCoordinateColumns);
    for (const auto& point : points) {
        flat.insert(flat.end(), point.begin(), point.end());
    }

    hsize_t point_dims[2] = {static_cast<hsize_t>(points.size()), kCoordinateColumns};
    hsize_t shift_dims[1] = {kCoordinateColumns};
    const Vec3 local_shift = ShiftComposer::computeLocalShift(points, document.globalShift());

    bool success = true;
    success = success && H5LTmake_dataset_double(group_id, "points", 2, point_dims, flat.data()) >= 0;
    success = success && H5LTmake_dataset_double(group_id, "local_shift", 1, shift_dims,
                                                 local_shift.data()) >= 0;
    success = success && H5LTmake_dataset_double(group_id, "global_shift", 1, shift_dims,
                                                 document.globalShift().data()) >= 0;
    if (!success) {
        last_error_ = "Failed to write point datasets";
    }
    success = success && writeScalarFields(group_id, document);

    H5Gclose(group_id);
    return success;
}

bool Hdf5Export::writeScalarFields(hid_t group_id, const SbfDocument& document) {
    const ScalarFieldTable& fields = document.scalarFields();
    const std::size_t rows = document.pointCount();
    const std::size_t cols = fields.size();

    // row-major, same column order as the SBF payload
    std::vector<float> matrix(rows * cols);
    for (std::size_t c = 0; c < cols; ++c) {
        const auto& values = fields.at(c).values;
        for (std::size_t r = 0; r < rows; ++r) {
            matrix[r * cols + c] = values[r];
        }
    }

    hsize_t dims[2] = {static_cast<hsize_t>(rows), static_cast<hsize_t>(cols)};
    if (H5LTmake_dataset_float(group_id, "scalar_fields", 2, dims, matrix.data()) < 0) {
        last_error_ = "Failed to write dataset: scalar_fields";
        return false;
    }

    const unsigned int field_count = static_cast<unsigned int>(cols);
    if (H5LTset_attribute_uint(group_id, "scalar_fields", "field_count", &field_count, 1) < 0) {
        last_error_ = "Failed to write attribute: field_count";
        return false;
    }

    if (cols == 0) {
        return true;
    }

    hid_t dataset = H5Dopen2(group_id, "scalar_fields", H5P_DEFAULT);
    if (dataset < 0) {
        last_error_ = "Failed to open dataset: scalar_fields";
        return false;
    }
    bool success = writeStringListAttribute(dataset, "field_names", fields.names());
    H5Dclose(dataset);
    if (!success) {
        last_error_ = "Failed to write attribute: field_names";
    }
    return success;
}

bool Hdf5Export::createGroup(hid_t file_id, const std::string& group_name) {
    hid_t group_id = H5Gcreate2(file_id, group_name.c_str(),
                                H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to create group: " + group_name;
        return false;
    }
    H5Gclose(group_id);
    return true;
}

bool Hdf5Export::writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value) {
    hid_t datatype = H5Tcopy(H5T_C_S1);
    H5Tset_size(datatype, value.size() + 1);
    H5Tset_strpad(datatype, H5T_STR_NULLTERM);

    hid_t dataspace = H5Screate(H5S_SCALAR);
    hid_t attribute = H5Acreate2(loc_id, name.c_str(), datatype, dataspace,
                                 H5P_DEFAULT, H5P_DEFAULT);

    if (attribute < 0) {
        H5Sclose(dataspace);
        H5Tclose(datatype);
        return false;
    }

    herr_t status = H5Awrite(attribute, datatype, value.c_str());

    H5Aclose(attribute);
    H5Sclose(dataspace);
    H5Tclose(datatype);

    return status >= 0;
}

bool Hdf5Export::writeStringListAttribute(hid_t loc_id, const std::string& name,
                                          const std::vector<std::string>& values) {
    std::vector<const char*> pointers;
    pointers.reserve(values.size());
    for (const auto& value : values) {
        pointers.push_back(value.c_str());
    }

    hid_t datatype = H5Tcopy(H5T_C_S1);
    H5Tset_size(datatype, H5T_VARIABLE);
    H5Tset_cset(datatype, H5T_CSET_UTF8);

    hsize_t dims = values.size();
    hid_t dataspace = H5Screate_simple(1, &dims, NULL);
    hid_t attribute = H5Acreate2(loc_id, name.c_str(), datatype, dataspace,
                                 H5P_DEFAULT, H5P_DEFAULT);

    if (attribute < 0) {
        H5Sclose(dataspace);
        H5Tclose(datatype);
        return false;
    }

    herr_t status = H5Awrite(attribute, datatype, pointers.data());

    H5Aclose(attribute);
    H5Sclose(dataspace);
    H5Tclose(datatype);

    return status >= 0;
}

}  // namespace sbf_cloud
