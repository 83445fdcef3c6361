// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CORE_SBF_ERROR_HPP
#define SBF_CLOUD_CORE_SBF_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sbf_cloud {

enum class SbfErrorCode {
    HeaderMalformed,
    GlobalShiftMalformed,
    PayloadTruncated,
    PayloadHeaderMismatch,
    PayloadMalformed,
    FieldNotFound,
    DuplicateFieldName,
    InvalidFieldName,
    ColumnSizeMismatch,
    FileNotFound,
    IoFailure
};

std::string errorCodeToString(SbfErrorCode code);

class SbfError : public std::runtime_error {
public:
    SbfError(SbfErrorCode code, const std::string& message);

    SbfErrorCode code() const noexcept { return code_; }

private:
    SbfErrorCode code_;
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_CORE_SBF_ERROR_HPP
