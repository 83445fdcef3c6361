// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/core/SbfError.hpp"

namespace sbf_cloud {

std::string errorCodeToString(SbfErrorCode code) {
    switch (code) {
        case SbfErrorCode::HeaderMalformed:
            return "HeaderMalformed";
        case SbfErrorCode::GlobalShiftMalformed:
            return "GlobalShiftMalformed";
        case SbfErrorCode::PayloadTruncated:
            return "PayloadTruncated";
        case SbfErrorCode::PayloadHeaderMismatch:
            return "PayloadHeaderMismatch";
        case SbfErrorCode::PayloadMalformed:
            return "PayloadMalformed";
        case SbfErrorCode::FieldNotFound:
            return "FieldNotFound";
        case SbfErrorCode::DuplicateFieldName:
            return "DuplicateFieldName";
        case SbfErrorCode::InvalidFieldName:
            return "InvalidFieldName";
        case SbfErrorCode::ColumnSizeMismatch:
            return "ColumnSizeMismatch";
        case SbfErrorCode::FileNotFound:
            return "FileNotFound";
        case SbfErrorCode::IoFailure:
        default:
            return "IoFailure";
    }
}

SbfError::SbfError(SbfErrorCode code, const std::string& message)
    : std::runtime_error(errorCodeToString(code) + ": " + message), code_(code) {}

}  // namespace sbf_cloud
