// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/core/ScalarFieldTable.hpp"

#include <algorithm>
#include <cctype>

#include "sbf_cloud/core/SbfError.hpp"

namespace sbf_cloud {

ScalarFieldTable::ScalarFieldTable(std::size_t point_count) : point_count_(point_count) {}

bool ScalarFieldTable::contains(const std::string& name) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&](const ScalarField& field) { return field.name == name; });
}

std::size_t ScalarFieldTable::indexOf(const std::string& name) const {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) {
            return i;
        }
    }
    throw SbfError(SbfErrorCode::FieldNotFound, "no scalar field named '" + name + "'");
}

const std::vector<float>& ScalarFieldTable::column(const std::string& name) const {
    return fields_[indexOf(name)].values;
}

std::vector<std::string> ScalarFieldTable::names() const {
    std::vector<std::string> result;
    result.reserve(fields_.size());
    for (const auto& field : fields_) {
        result.push_back(field.name);
    }
    return result;
}

void ScalarFieldTable::validateName(const std::string& name) {
    if (name.empty()) {
        throw SbfError(SbfErrorCode::InvalidFieldName, "scalar field name is empty");
    }
    if (name.find_first_of("\r\n") != std::string::npos) {
        throw SbfError(SbfErrorCode::InvalidFieldName,
                       "scalar field name contains a line break");
    }
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    if (is_space(name.front()) || is_space(name.back())) {
        throw SbfError(SbfErrorCode::InvalidFieldName,
                       "scalar field name has surrounding whitespace: '" + name + "'");
    }
}

void ScalarFieldTable::checkNewColumn(const std::string& name, std::size_t length) const {
    validateName(name);
    if (contains(name)) {
        throw SbfError(SbfErrorCode::DuplicateFieldName,
                       "scalar field '" + name + "' already exists");
    }
    if (length != point_count_) {
        throw SbfError(SbfErrorCode::ColumnSizeMismatch,
                       "column '" + name + "' has " + std::to_string(length) +
                           " values for " + std::to_string(point_count_) + " points");
    }
}

void ScalarFieldTable::add(const std::string& name, std::vector<float> values) {
    checkNewColumn(name, values.size());
    fields_.push_back({name, std::move(values)});
}

void ScalarFieldTable::addGroup(std::vector<ScalarField> group) {
    for (std::size_t i = 0; i < group.size(); ++i) {
        checkNewColumn(group[i].name, group[i].values.size());
        for (std::size_t j = 0; j < i; ++j) {
            if (group[j].name == group[i].name) {
                throw SbfError(SbfErrorCode::DuplicateFieldName,
                               "scalar field '" + group[i].name + "' given twice");
            }
        }
    }
    fields_.reserve(fields_.size() + group.size());
    for (auto& field : group) {
        fields_.push_back(std::move(field));
    }
}

void ScalarFieldTable::remove(const std::string& name) {
    const std::size_t index = indexOf(name);
    fields_.erase(fields_.begin() + static_cast<std::ptrdiff_t>(index));
}

void ScalarFieldTable::rename(const std::string& name, const std::string& new_name) {
    const std::size_t index = indexOf(name);
    if (name == new_name) {
        return;
    }
    validateName(new_name);
    if (contains(new_name)) {
        throw SbfError(SbfErrorCode::DuplicateFieldName,
                       "cannot rename '" + name + "': '" + new_name + "' already exists");
    }
    fields_[index].name = new_name;
}

void ScalarFieldTable::clear() {
    fields_.clear();
}

}  // namespace sbf_cloud
