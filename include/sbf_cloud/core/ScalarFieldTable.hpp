// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CORE_SCALAR_FIELD_TABLE_HPP
#define SBF_CLOUD_CORE_SCALAR_FIELD_TABLE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace sbf_cloud {

struct ScalarField {
    std::string name;
    std::vector<float> values;
};

// Ordered (name, column) list. Position in the list is the 0-based column
// index; header keys SF1..SFN are derived from it when serializing.
// Every mutation either succeeds completely or leaves the table untouched.
class ScalarFieldTable {
public:
    explicit ScalarFieldTable(std::size_t point_count = 0);

    std::size_t pointCount() const { return point_count_; }
    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    bool contains(const std::string& name) const;

    // Throws SbfError(FieldNotFound)
    std::size_t indexOf(const std::string& name) const;

    const ScalarField& at(std::size_t index) const { return fields_.at(index); }
    const std::vector<float>& column(const std::string& name) const;
    const std::vector<ScalarField>& fields() const { return fields_; }
    std::vector<std::string> names() const;

    void add(const std::string& name, std::vector<float> values);

    // Appends several columns as one step (e.g. Nx, Ny, Nz)
    void addGroup(std::vector<ScalarField> group);

    void remove(const std::string& name);
    void rename(const std::string& name, const std::string& new_name);
    void clear();

    // Throws SbfError(InvalidFieldName) for names the text header cannot carry
    static void validateName(const std::string& name);

private:
    void checkNewColumn(const std::string& name, std::size_t length) const;

    std::size_t point_count_;
    std::vector<ScalarField> fields_;
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_CORE_SCALAR_FIELD_TABLE_HPP
