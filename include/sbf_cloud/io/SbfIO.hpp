// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_IO_SBF_IO_HPP
#define SBF_CLOUD_IO_SBF_IO_HPP

#include <string>

#include "sbf_cloud/core/SbfDocument.hpp"

namespace sbf_cloud {

// File-level access to a .sbf / .sbf.data pair
class SbfIO {
public:
    // "cloud.sbf" -> "cloud.sbf.data"
    static std::string payloadPathFor(const std::string& filename);

    // Throws SbfError(FileNotFound / IoFailure) plus any codec error
    static SbfDocument readSbf(const std::string& filename);

    // Nothing is left behind on failure
    static void writeSbf(const std::string& filename, const SbfDocument& document);

    // True when both the header and its payload exist
    static bool exists(const std::string& filename);

    // Copy / move the header together with its payload. destination may be a
    // directory. Returns the destination header path.
    static std::string copySbf(const std::string& filename, const std::string& destination);
    static std::string moveSbf(const std::string& filename, const std::string& destination);

private:
    static std::string resolveDestination(const std::string& filename, const std::string& destination);
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_IO_SBF_IO_HPP
