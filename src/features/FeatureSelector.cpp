// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/features/FeatureSelector.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "sbf_cloud/core/SbfError.hpp"

namespace sbf_cloud::features {

namespace {

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

}  // namespace

FeatureSelector::FeatureSelector() : normalization_(defaultNormalization()) {}

FeatureSelector::FeatureSelector(std::map<std::string, std::string> normalization)
    : normalization_(std::move(normalization)) {}

const std::map<std::string, std::string>& FeatureSelector::defaultNormalization() {
    static const std::map<std::string, std::string> table = {
        {"gpstime", "gps_time"},
        {"numberofreturns", "number_of_returns"},
        {"returnnumber", "return_number"},
        {"scananglerank", "scan_angle_rank"},
        {"pointsourceid", "point_source_id"},
    };
    return table;
}

std::string FeatureSelector::normalize(const std::string& requested) const {
    const std::string key = toLower(requested);
    const auto it = normalization_.find(key);
    return it != normalization_.end() ? it->second : key;
}

std::string FeatureSelector::resolve(const SbfDocument& document, const std::string& requested) const {
    const std::string wanted = normalize(requested);
    const auto names = document.fieldNames();

    // an exact match wins over a case-insensitive one
    for (const auto& name : names) {
        if (name == wanted) {
            return name;
        }
    }
    for (const auto& name : names) {
        if (toLower(name) == toLower(wanted)) {
            return name;
        }
    }
    throw SbfError(SbfErrorCode::FieldNotFound,
                   "no scalar field matches '" + requested + "' (normalized '" + wanted + "')");
}

FeatureMatrix FeatureSelector::select(const SbfDocument& document,
                                      const std::vector<std::string>& requested) const {
    FeatureMatrix matrix;
    matrix.rows = document.pointCount();

    std::vector<const std::vector<float>*> columns;
    columns.reserve(requested.size());
    for (const auto& name : requested) {
        matrix.names.push_back(resolve(document, name));
        columns.push_back(&document.column(matrix.names.back()));
    }

    matrix.values.resize(matrix.rows * columns.size());
    for (std::size_t c = 0; c < columns.size(); ++c) {
        const auto& column = *columns[c];
        for (std::size_t r = 0; r < matrix.rows; ++r) {
            matrix.values[r * columns.size() + c] = column[r];
        }
    }
    return matrix;
}

std::vector<float> FeatureSelector::labels(const SbfDocument& document, const std::string& name) const {
    return document.column(resolve(document, name));
}

std::vector<std::string> FeatureSelector::loadFeatureSourceNames(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw SbfError(SbfErrorCode::FileNotFound, "Cannot open feature sources: " + filename);
    }

    std::vector<std::string> names;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string token;
        while (iss >> token) {
            const auto colon = token.find(':');
            if (colon == std::string::npos || colon + 1 >= token.size()) {
                throw std::invalid_argument("feature source '" + token + "' has no ':<name>' part");
            }
            const auto end = token.find(':', colon + 1);
            names.push_back(toLower(token.substr(colon + 1, end == std::string::npos
                                                                ? std::string::npos
                                                                : end - colon - 1)));
        }
    }
    return names;
}

}  // namespace sbf_cloud::features
