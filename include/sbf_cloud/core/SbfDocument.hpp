// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CORE_SBF_DOCUMENT_HPP
#define SBF_CLOUD_CORE_SBF_DOCUMENT_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "sbf_cloud/core/SbfHeader.hpp"
#include "sbf_cloud/core/SbfTypes.hpp"
#include "sbf_cloud/core/ScalarFieldTable.hpp"

namespace sbf_cloud {

struct SerializedSbf {
    std::string header_text;
    std::vector<std::uint8_t> payload;
};

/**
 * @brief A point cloud in SBF form: true coordinates plus named scalar fields.
 *
 * Points are held as true (un-shifted) coordinates in double precision.
 * The header and payload are regenerated from the current contents on every
 * save, so Points / SFCount always match the data. Header keys of the form
 * SF<n>_<suffix> follow field n through renames and removals and are
 * renumbered on save.
 */
class SbfDocument {
public:
    SbfDocument();

    /**
     * @brief Build a document from in-memory arrays
     * @param points True coordinates, one row per point
     * @param field_names Scalar field names in column order
     * @param columns One column per name, each with points.size() values
     * @param global_shift Origin written to the header on save
     */
    static SbfDocument fromArrays(PointMatrix points,
                                  const std::vector<std::string>& field_names,
                                  std::vector<std::vector<float>> columns,
                                  const Vec3& global_shift = {0.0, 0.0, 0.0});

    static SbfDocument open(const std::string& header_text, const std::vector<std::uint8_t>& payload);

    // Decodes the payload one row at a time
    static SbfDocument open(std::istream& header, std::istream& payload);

    SerializedSbf save() const;
    void save(std::ostream& header_out, std::ostream& payload_out) const;

    std::size_t pointCount() const { return points_.size(); }
    std::size_t fieldCount() const { return fields_.size(); }
    const PointMatrix& points() const { return points_; }

    // Shift found in the payload this document was read from; zero otherwise
    const Vec3& localShift() const { return local_shift_; }
    const Vec3& globalShift() const { return header_.global_shift; }

    // True coordinates are unchanged, only the origin used on save moves
    void setGlobalShift(const Vec3& global_shift);
    void dropGlobalShift();

    std::vector<std::string> fieldNames() const { return fields_.names(); }
    bool hasField(const std::string& name) const { return fields_.contains(name); }
    std::size_t indexOf(const std::string& name) const { return fields_.indexOf(name); }
    const std::vector<float>& column(const std::string& name) const { return fields_.column(name); }
    const ScalarFieldTable& scalarFields() const { return fields_; }

    void addScalarField(const std::string& name, std::vector<float> values);
    void removeScalarField(const std::string& name);
    void renameScalarField(const std::string& name, const std::string& new_name);
    void removeAllScalarFields();

    // Appends a column holding 0..N-1
    void addIndexField(const std::string& name = "index");

    // Appends Nx, Ny, Nz
    void addNormals(const PointMatrix& normals);

private:
    SbfHeader buildHeader() const;
    void attachFieldEntries();

    SbfHeader header_;
    Vec3 local_shift_{0.0, 0.0, 0.0};
    PointMatrix points_;
    ScalarFieldTable fields_;
    // Field name -> SF<n>_ entries, keyed by suffix ("_Shift")
    std::map<std::string, std::vector<HeaderEntry>> field_entries_;
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_CORE_SBF_DOCUMENT_HPP
