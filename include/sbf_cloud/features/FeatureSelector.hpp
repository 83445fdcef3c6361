// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_FEATURES_FEATURE_SELECTOR_HPP
#define SBF_CLOUD_FEATURES_FEATURE_SELECTOR_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "sbf_cloud/core/SbfDocument.hpp"

namespace sbf_cloud::features {

// Row-major rows x names.size() matrix
struct FeatureMatrix {
    std::size_t rows = 0;
    std::vector<std::string> names;
    std::vector<float> values;

    std::size_t cols() const { return names.size(); }
    float at(std::size_t row, std::size_t col) const { return values[row * names.size() + col]; }
};

class FeatureSelector {
public:
    FeatureSelector();
    explicit FeatureSelector(std::map<std::string, std::string> normalization);

    // gpstime -> gps_time, numberofreturns -> number_of_returns, ...
    static const std::map<std::string, std::string>& defaultNormalization();

    // Lower-cases the name and applies the normalization table
    std::string normalize(const std::string& requested) const;

    // Exact field name in the document; throws SbfError(FieldNotFound)
    std::string resolve(const SbfDocument& document, const std::string& requested) const;

    // Columns in the caller's order
    FeatureMatrix select(const SbfDocument& document, const std::vector<std::string>& requested) const;

    std::vector<float> labels(const SbfDocument& document,
                              const std::string& name = "classification") const;

    // Reads "<source>:<name>" lines and returns the lower-cased names
    static std::vector<std::string> loadFeatureSourceNames(const std::string& filename);

private:
    std::map<std::string, std::string> normalization_;
};

}  // namespace sbf_cloud::features

#endif  // SBF_CLOUD_FEATURES_FEATURE_SELECTOR_HPP
